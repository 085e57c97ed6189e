/**
 * @file Settings.hpp
 * @brief Layered settings for the jsonsql command-line tool
 *
 * Precedence (later wins): defaults -> file -> environment -> overrides.
 *
 * Keys:
 * - top_level (bool, default true): wrap scalars in CAST(... as JSON)
 * - now (string): freeze the clock at "YYYY-MM-DD HH:MM:SS[.ffffff]" (UTC)
 * - input (string): path of the JSON input file
 *
 * Environment variables are <PREFIX>_<KEY> in upper case, e.g.
 * JSONSQL_TOP_LEVEL=false or JSONSQL_NOW="2024-05-01 00:00:00".
 */

#ifndef JSONSQL_SETTINGS_HPP
#define JSONSQL_SETTINGS_HPP

#include "jsonsql/Clock.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace jsonsql {

struct Settings {
    bool top_level = true;
    std::optional<std::string> now;
    std::optional<std::string> input;
};

/**
 * @brief Sources for load_settings()
 */
struct SettingsOptions {
    std::optional<std::string> file_path;
    std::string env_prefix = "JSONSQL";
    std::map<std::string, nlohmann::json> overrides; // final precedence
};

/**
 * @brief Load a settings file, format chosen by extension (.json or .toml)
 *
 * @throws FileNotFoundError if the file does not exist
 * @throws SettingsError on syntax errors or an unsupported extension
 */
nlohmann::json load_settings_file(const std::string& path);

/**
 * @brief Collect <prefix>_<KEY> environment variables for the known keys
 *
 * "true"/"false" (case-insensitive) become booleans, anything else a string.
 */
nlohmann::json collect_env_settings(const std::string& prefix);

/**
 * @brief Validate a flat settings object and convert it
 * @throws SettingsError on unknown keys or wrongly typed values
 */
Settings settings_from_json(const nlohmann::json& j);

/**
 * @brief Merge all sources and validate the result
 */
Settings load_settings(const SettingsOptions& opts);

/**
 * @brief FixedClock at settings.now if set, SystemClock otherwise
 * @throws SettingsError if now is not a valid datetime
 */
std::unique_ptr<Clock> make_clock(const Settings& settings);

} // namespace jsonsql

#endif // JSONSQL_SETTINGS_HPP
