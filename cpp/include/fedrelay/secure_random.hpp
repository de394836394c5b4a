#pragma once

#include <cstdint>
#include <string>

namespace fedrelay {

/**
 * Source of uniform draws in the open interval (0,1).
 * Box-Muller takes a log of the first draw, so 0 must never be returned.
 */
class UniformSource {
public:
    virtual ~UniformSource() = default;
    virtual double uniform_open() = 0;
};

/**
 * Cryptographically secure uniform source backed by OpenSSL RAND_bytes.
 * Throws FedRelayException(RANDOM_SOURCE_FAILED) if the CSPRNG cannot
 * produce bytes; it never falls back to a general-purpose PRNG.
 */
class SecureRandom : public UniformSource {
public:
    double uniform_open() override;

    uint64_t next_u64();

    // n random bytes rendered as 2n lowercase hex characters
    std::string hex_id(size_t n_bytes = 4);

    static SecureRandom& instance();
};

} // namespace fedrelay
