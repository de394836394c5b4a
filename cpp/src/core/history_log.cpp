#include "fedrelay/history_log.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"
#include "fedrelay/store/model_store.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace fedrelay {

namespace {

std::string file_safe_timestamp(std::string ts) {
    std::replace(ts.begin(), ts.end(), ':', '-');
    return ts;
}

std::string model_dir_name(const std::string& model_name) {
    std::string safe = store::safe_model_name(model_name);
    if (safe.empty()) {
        throw HistoryLogError("Model name '" + model_name + "' has no usable characters");
    }
    return safe;
}

void pretty_print(std::ostream& os, const boost::json::value& jv, std::string& indent) {
    switch (jv.kind()) {
        case boost::json::kind::object: {
            const auto& obj = jv.get_object();
            if (obj.empty()) { os << "{}"; break; }
            os << "{\n";
            indent.append(2, ' ');
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                if (it != obj.begin()) os << ",\n";
                os << indent << boost::json::serialize(boost::json::string(it->key())) << ": ";
                pretty_print(os, it->value(), indent);
            }
            indent.resize(indent.size() - 2);
            os << "\n" << indent << "}";
            break;
        }
        case boost::json::kind::array: {
            const auto& arr = jv.get_array();
            if (arr.empty()) { os << "[]"; break; }
            os << "[\n";
            indent.append(2, ' ');
            for (auto it = arr.begin(); it != arr.end(); ++it) {
                if (it != arr.begin()) os << ",\n";
                os << indent;
                pretty_print(os, *it, indent);
            }
            indent.resize(indent.size() - 2);
            os << "\n" << indent << "]";
            break;
        }
        default:
            os << boost::json::serialize(jv);
            break;
    }
}

// Ordering key for backups: the ISO timestamp embedded in the file name.
std::string backup_sort_key(const fs::path& p) {
    const std::string stem = p.stem().string();
    const auto underscore = stem.find('_', std::string("global_model_r").size());
    return underscore == std::string::npos ? stem : stem.substr(underscore + 1);
}

} // namespace

std::string pretty_json(const boost::json::value& value) {
    std::ostringstream os;
    std::string indent;
    pretty_print(os, value, indent);
    return os.str();
}

// =============================================================================
// FileHistorySink
// =============================================================================

FileHistorySink::FileHistorySink(fs::path dir) : dir_(std::move(dir)) {}

void FileHistorySink::append(const AggregationRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    const fs::path model_dir = dir_ / model_dir_name(record.model_name);
    std::error_code ec;
    fs::create_directories(model_dir, ec);
    if (ec) {
        throw HistoryLogError("Cannot create " + model_dir.string() + ": " + ec.message(), "FileHistorySink");
    }

    const fs::path path = model_dir / (file_safe_timestamp(record.timestamp) + "_" + record.id + ".json");
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw HistoryLogError("Cannot open " + path.string(), "FileHistorySink");
    }
    out << pretty_json(record.to_json()) << "\n";
    if (!out) {
        throw HistoryLogError("Write failed for " + path.string(), "FileHistorySink");
    }
    LOG_INFO("Saved aggregation history to {}", path.string());
}

std::vector<fs::path> FileHistorySink::list(const std::string& model_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<fs::path> out;
    const fs::path model_dir = dir_ / store::safe_model_name(model_name);
    std::error_code ec;
    if (!fs::is_directory(model_dir, ec)) {
        return out;
    }
    for (const auto& entry : fs::directory_iterator(model_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

// =============================================================================
// BackupWriter
// =============================================================================

BackupWriter::BackupWriter(fs::path dir, size_t max_backups)
    : dir_(std::move(dir)), max_backups_(max_backups) {}

fs::path BackupWriter::write(const std::string& model_name, int64_t round, const Bytes& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    const fs::path models_dir = dir_ / model_dir_name(model_name) / "models";
    std::error_code ec;
    fs::create_directories(models_dir, ec);
    if (ec) {
        throw HistoryLogError("Cannot create " + models_dir.string() + ": " + ec.message(), "BackupWriter");
    }

    const std::string base = "global_model_r" + std::to_string(round) + "_" +
                             file_safe_timestamp(format_timestamp(Clock::now()));
    fs::path path = models_dir / (base + ".bin");
    for (int n = 1; fs::exists(path, ec); ++n) {
        path = models_dir / (base + "_" + std::to_string(n) + ".bin");
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw HistoryLogError("Cannot open " + path.string(), "BackupWriter");
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        throw HistoryLogError("Write failed for " + path.string(), "BackupWriter");
    }

    LOG_INFO("Saved backup of model to {}", path.string());
    prune(models_dir);
    return path;
}

std::vector<fs::path> BackupWriter::list(const std::string& model_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<fs::path> out;
    const fs::path models_dir = dir_ / store::safe_model_name(model_name) / "models";
    std::error_code ec;
    if (!fs::is_directory(models_dir, ec)) {
        return out;
    }
    for (const auto& entry : fs::directory_iterator(models_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".bin") {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return backup_sort_key(a) < backup_sort_key(b);
    });
    return out;
}

void BackupWriter::prune(const fs::path& models_dir) {
    if (max_backups_ == 0) return;

    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(models_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".bin") {
            files.push_back(entry.path());
        }
    }
    if (files.size() <= max_backups_) return;

    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return backup_sort_key(a) < backup_sort_key(b);
    });
    const size_t excess = files.size() - max_backups_;
    for (size_t i = 0; i < excess; ++i) {
        if (!fs::remove(files[i], ec) && ec) {
            LOG_WARN("Could not prune old backup {}: {}", files[i].string(), ec.message());
        } else {
            LOG_DEBUG("Pruned old backup {}", files[i].string());
        }
    }
}

} // namespace fedrelay
