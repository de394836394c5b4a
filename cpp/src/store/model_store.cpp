#include "fedrelay/store/model_store.hpp"
#include "fedrelay/error.hpp"

#include <cctype>

namespace fedrelay::store {

std::string safe_model_name(const std::string& model_name) {
    std::string out;
    out.reserve(model_name.size());

    bool in_space = false;
    for (unsigned char c : model_name) {
        if (std::isspace(c)) {
            if (!in_space) out.push_back('-');
            in_space = true;
            continue;
        }
        in_space = false;
        if (std::isalnum(c) || c == '-') {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string model_key(const std::string& model_name) {
    std::string safe = safe_model_name(model_name);
    if (safe.empty()) {
        throw InvalidParameterError("Model name '" + model_name + "' has no usable characters",
                                    __func__, "Use letters, digits, hyphens or spaces");
    }
    return safe + "/globalModel.bin";
}

} // namespace fedrelay::store
