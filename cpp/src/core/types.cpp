#include "fedrelay/types.hpp"
#include "fedrelay/error.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fedrelay {

void PrivacyParameters::validate() const {
    if (!std::isfinite(epsilon) || epsilon <= 0.0) {
        throw InvalidParameterError("epsilon must be > 0, got " + std::to_string(epsilon),
                                    "PrivacyParameters");
    }
    if (!(delta > 0.0 && delta < 1.0)) {
        throw InvalidParameterError("delta must be in (0,1), got " + std::to_string(delta),
                                    "PrivacyParameters");
    }
    if (!std::isfinite(l2_norm_clip) || l2_norm_clip <= 0.0) {
        throw InvalidParameterError("l2_norm_clip must be > 0, got " + std::to_string(l2_norm_clip),
                                    "PrivacyParameters");
    }
    if (!(sample_rate > 0.0 && sample_rate <= 1.0)) {
        throw InvalidParameterError("sample_rate must be in (0,1], got " + std::to_string(sample_rate),
                                    "PrivacyParameters");
    }
}

boost::json::object AggregationRecord::to_json() const {
    boost::json::object obj;
    obj["timestamp"] = timestamp;
    obj["id"] = id;
    obj["modelName"] = model_name;
    obj["numUpdates"] = num_updates;

    boost::json::array ids;
    for (const auto& cid : contributor_ids) {
        ids.push_back(boost::json::value(cid));
    }
    obj["contributorIds"] = std::move(ids);
    obj["round"] = round;
    obj["config"] = config;
    return obj;
}

std::string format_timestamp(Clock::time_point tp) {
    auto time_t = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

} // namespace fedrelay
