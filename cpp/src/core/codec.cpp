#include "fedrelay/codec.hpp"
#include "fedrelay/error.hpp"

#include <cstring>
#include <fstream>
#include <iterator>

namespace fedrelay {
namespace codec {

static_assert(sizeof(float) == kBytesPerWeight, "float32 wire format requires 4-byte float");

WeightVector decode_weights(const uint8_t* data, size_t len) {
    if (len == 0) {
        throw WireFormatError("Weight payload is empty", __func__);
    }
    if (len % kBytesPerWeight != 0) {
        throw WireFormatError("Weight payload length " + std::to_string(len) +
                              " is not a multiple of 4", __func__);
    }

    const size_t n = len / kBytesPerWeight;
    WeightVector weights(n);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t* p = data + i * kBytesPerWeight;
        uint32_t bits = static_cast<uint32_t>(p[0])
                      | (static_cast<uint32_t>(p[1]) << 8)
                      | (static_cast<uint32_t>(p[2]) << 16)
                      | (static_cast<uint32_t>(p[3]) << 24);
        std::memcpy(&weights[i], &bits, sizeof(float));
    }
    return weights;
}

WeightVector decode_weights(const Bytes& bytes) {
    return decode_weights(bytes.data(), bytes.size());
}

Bytes encode_weights(const WeightVector& weights) {
    Bytes out(weights.size() * kBytesPerWeight);
    for (size_t i = 0; i < weights.size(); ++i) {
        uint32_t bits;
        std::memcpy(&bits, &weights[i], sizeof(float));
        uint8_t* p = out.data() + i * kBytesPerWeight;
        p[0] = static_cast<uint8_t>(bits & 0xFF);
        p[1] = static_cast<uint8_t>((bits >> 8) & 0xFF);
        p[2] = static_cast<uint8_t>((bits >> 16) & 0xFF);
        p[3] = static_cast<uint8_t>((bits >> 24) & 0xFF);
    }
    return out;
}

WeightVector read_weights_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FedRelayException(ErrorCode::INVALID_PARAMETER, "Cannot open weights file: " + path,
                                __func__, "Train the model locally first");
    }
    Bytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return decode_weights(bytes);
}

void write_weights_file(const std::string& path, const WeightVector& weights) {
    Bytes bytes = encode_weights(weights);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        FEDRELAY_THROW(ErrorCode::INTERNAL_ERROR, "Cannot write weights file: " + path);
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        FEDRELAY_THROW(ErrorCode::INTERNAL_ERROR, "Short write to weights file: " + path);
    }
}

} // namespace codec
} // namespace fedrelay
