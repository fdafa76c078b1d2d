// include/signal_ngin/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {

/**
 * @brief Base class for one section of the signal_ngin configuration
 *
 * A section parses itself in from_json(), which may throw on malformed
 * input, and checks its own ranges in validate(). load_from_json() and
 * load_from_file() run both and report a failure as CONFIGURATION_ERROR
 * prefixed with the section name. Checks that span sections stay with
 * ConfigLoader.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load and validate the section from a JSON file
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR or CONFIGURATION_ERROR
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief from_json() followed by validate(); never throws
     */
    Result<void> load_from_json(const nlohmann::json& j);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Overwrite the fields present in j; absent fields keep their value
     * @throws std::invalid_argument or nlohmann::json::exception on bad input
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Range checks on the parsed section
     * @return CONFIGURATION_ERROR naming the first bad field
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }

    /**
     * @brief Key of the section in the application config, used in messages
     */
    virtual std::string section_name() const {
        return "config";
    }

protected:
    /**
     * @brief Assign j[key] to out when the key is present
     * @return Whether the key was present
     * @throws std::invalid_argument naming the key when the type does not fit
     */
    template <typename T>
    static bool read_field(const nlohmann::json& j, const std::string& key, T& out) {
        if (!j.contains(key)) {
            return false;
        }
        try {
            out = j.at(key).get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument(key + ": " + e.what());
        }
        return true;
    }

    Result<void> invalid(const std::string& message) const {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR, section_name() + ": " + message,
                                "ConfigBase");
    }
};

}  // namespace signal_ngin
