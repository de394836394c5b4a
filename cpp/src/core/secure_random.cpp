#include "fedrelay/secure_random.hpp"
#include "fedrelay/error.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <vector>

namespace fedrelay {

namespace {

void fill_random(unsigned char* buf, size_t len) {
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        unsigned long err = ERR_get_error();
        char msg[256] = {0};
        ERR_error_string_n(err, msg, sizeof(msg));
        throw FedRelayException(ErrorCode::RANDOM_SOURCE_FAILED,
                                std::string("RAND_bytes failed: ") + msg, "SecureRandom");
    }
}

} // namespace

uint64_t SecureRandom::next_u64() {
    unsigned char buf[8];
    fill_random(buf, sizeof(buf));
    uint64_t v = 0;
    for (unsigned char b : buf) {
        v = (v << 8) | b;
    }
    return v;
}

double SecureRandom::uniform_open() {
    // 53 random mantissa bits, shifted half a step off zero: (k + 0.5) / 2^53
    uint64_t k = next_u64() >> 11;
    return (static_cast<double>(k) + 0.5) * (1.0 / 9007199254740992.0);
}

std::string SecureRandom::hex_id(size_t n_bytes) {
    static const char digits[] = "0123456789abcdef";
    std::vector<unsigned char> buf(n_bytes);
    if (n_bytes > 0) {
        fill_random(buf.data(), buf.size());
    }
    std::string out;
    out.reserve(n_bytes * 2);
    for (unsigned char b : buf) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

SecureRandom& SecureRandom::instance() {
    static SecureRandom rng;
    return rng;
}

} // namespace fedrelay
