/**
 * Weight payload wire format
 *
 * Flat array of little-endian IEEE-754 float32 values. No header, no length
 * prefix; byte length is always 4 x vector length.
 */

#pragma once

#include <string>

#include "fedrelay/types.hpp"

namespace fedrelay {
namespace codec {

constexpr size_t kBytesPerWeight = 4;

// Throws WireFormatError on an empty payload or a length that is not a multiple of 4.
WeightVector decode_weights(const uint8_t* data, size_t len);
WeightVector decode_weights(const Bytes& bytes);

Bytes encode_weights(const WeightVector& weights);

// File helpers for the CLI. Both throw FedRelayException on I/O failure.
WeightVector read_weights_file(const std::string& path);
void write_weights_file(const std::string& path, const WeightVector& weights);

} // namespace codec
} // namespace fedrelay
