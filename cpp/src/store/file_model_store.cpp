#include "fedrelay/store/file_model_store.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"
#include "fedrelay/secure_random.hpp"

#include <boost/json.hpp>

#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace fedrelay::store {

FileModelStore::FileModelStore(fs::path root) : root_(std::move(root)) {
    FEDRELAY_CHECK_ARGUMENT(!root_.empty(), "FileModelStore root must not be empty");
}

fs::path FileModelStore::resolve(const std::string& key) const {
    fs::path rel = fs::path(key).lexically_normal();
    if (key.empty() || rel.is_absolute() || rel.empty() || *rel.begin() == "..") {
        throw InvalidParameterError("Storage key escapes store root: '" + key + "'", "FileModelStore");
    }
    return root_ / rel;
}

FetchResult FileModelStore::get(const std::string& key) {
    const fs::path path = resolve(key);
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw StorageReadError("Cannot stat " + path.string() + ": " + ec.message(), "FileModelStore");
        }
        return FetchResult::not_found();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageReadError("Cannot open " + path.string(), "FileModelStore");
    }
    Bytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw StorageReadError("Read error on " + path.string(), "FileModelStore");
    }
    return FetchResult::with_bytes(std::move(bytes));
}

PutResult FileModelStore::put(const std::string& key, const Bytes& bytes, const Headers& headers) {
    const fs::path path = resolve(key);
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return PutResult::failure(500, "Cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    const std::string suffix = ".tmp-" + SecureRandom::instance().hex_id(4);
    fs::path tmp = path;
    tmp += suffix;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return PutResult::failure(500, "Cannot open " + tmp.string() + " for writing");
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return PutResult::failure(500, "Short write to " + tmp.string());
        }
    }

    // Sidecar first: a crash between the two renames leaves fresh headers on
    // the old object, never a new object without headers.
    boost::json::object meta;
    for (const auto& [name, value] : headers) {
        meta[name] = value;
    }
    fs::path meta_path = path;
    meta_path += ".meta.json";
    fs::path meta_tmp = meta_path;
    meta_tmp += suffix;
    {
        std::ofstream out(meta_tmp, std::ios::trunc);
        out << boost::json::serialize(meta);
        if (!out) {
            fs::remove(tmp, ec);
            fs::remove(meta_tmp, ec);
            return PutResult::failure(500, "Cannot write header sidecar " + meta_tmp.string());
        }
    }
    fs::rename(meta_tmp, meta_path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return PutResult::failure(500, "Cannot publish header sidecar: " + ec.message());
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tmp, ignore);
        return PutResult::failure(500, "Cannot publish " + path.string() + ": " + ec.message());
    }

    LOG_DEBUG("Wrote {} bytes to {}", bytes.size(), path.string());
    return PutResult::success(path.string(), 201);
}

Headers FileModelStore::headers(const std::string& key) const {
    fs::path meta_path = resolve(key);
    meta_path += ".meta.json";

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(meta_path);
    if (!in.is_open()) {
        return {};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    Headers out;
    boost::system::error_code ec;
    boost::json::value val = boost::json::parse(text, ec);
    if (ec || !val.is_object()) {
        LOG_WARN("Ignoring malformed header sidecar {}", meta_path.string());
        return out;
    }
    for (const auto& kv : val.as_object()) {
        if (kv.value().is_string()) {
            out[std::string(kv.key())] = std::string(kv.value().as_string().c_str());
        }
    }
    return out;
}

std::string FileModelStore::describe() const {
    return "file://" + root_.string();
}

} // namespace fedrelay::store
