/**
 * @file model_store.hpp
 * @brief Storage collaborator for the shared global model
 *
 * The engine never caches global state; every call re-fetches from here.
 * Implementations must make a successful put() visible all-or-nothing.
 */

#pragma once

#include <map>
#include <string>
#include <utility>

#include "fedrelay/types.hpp"

namespace fedrelay::store {

using Headers = std::map<std::string, std::string>;

enum class FetchStatus {
    Found,
    NotFound
};

struct FetchResult {
    FetchStatus status = FetchStatus::NotFound;
    Bytes bytes;
    int http_status = 0;   // transport-level status where the backend has one

    bool found() const { return status == FetchStatus::Found; }

    static FetchResult not_found(int http_status = 404) {
        FetchResult r;
        r.status = FetchStatus::NotFound;
        r.http_status = http_status;
        return r;
    }
    static FetchResult with_bytes(Bytes bytes, int http_status = 200) {
        FetchResult r;
        r.status = FetchStatus::Found;
        r.bytes = std::move(bytes);
        r.http_status = http_status;
        return r;
    }
};

struct PutResult {
    bool ok = false;
    int status = 0;
    std::string message;
    std::string location;   // token/URL of the written object

    static PutResult success(std::string location, int status = 200) {
        return PutResult{true, status, "", std::move(location)};
    }
    static PutResult failure(int status, std::string message) {
        return PutResult{false, status, std::move(message), ""};
    }
};

class ModelStore {
public:
    virtual ~ModelStore() = default;

    // NotFound for a missing object; transport failures throw StorageReadError.
    virtual FetchResult get(const std::string& key) = 0;

    // Non-success is reported in the result; implementations may also throw.
    virtual PutResult put(const std::string& key, const Bytes& bytes, const Headers& headers) = 0;

    // Human-readable backend description for logs.
    virtual std::string describe() const = 0;
};

/**
 * Storage key of a model's global state: whitespace runs become '-', any
 * character outside [A-Za-z0-9-] is dropped, then "/globalModel.bin" is
 * appended. Throws InvalidParameterError if nothing usable remains.
 */
std::string model_key(const std::string& model_name);

// Sanitized model name alone (the folder part of model_key).
std::string safe_model_name(const std::string& model_name);

} // namespace fedrelay::store
