// src/core/config_base.cpp

#include "signal_ngin/core/config_base.hpp"
#include <iomanip>

namespace signal_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        nlohmann::json j = to_json();
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open " + filepath + " to save " + section_name(),
                                    "ConfigBase");
        }
        file << std::setw(4) << j << std::endl;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                "Error saving " + section_name() + ": " + e.what(),
                                "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open " + section_name() + " file: " + filepath,
                                "ConfigBase");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Error parsing " + filepath + ": " + e.what(), "ConfigBase");
    }
    return load_from_json(j);
}

Result<void> ConfigBase::load_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return invalid("expected a JSON object");
    }
    try {
        from_json(j);
    } catch (const std::exception& e) {
        return invalid(e.what());
    }
    return validate();
}

}  // namespace signal_ngin
