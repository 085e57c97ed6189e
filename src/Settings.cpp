/**
 * @file Settings.cpp
 * @brief Settings loading (JSON via nlohmann::json, TOML via toml++)
 */

#include "jsonsql/Settings.hpp"
#include "jsonsql/Errors.hpp"
#include "jsonsql/Temporal.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace jsonsql {

namespace {

using nlohmann::json;

const char* const kKnownKeys[] = {"top_level", "now", "input"};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Convert one top-level TOML value; settings are strings or booleans
 */
json toml_setting_to_json(const std::string& key, const toml::node& node) {
    if (const auto* str = node.as_string()) {
        return json(str->get());
    }
    if (const auto* flag = node.as_boolean()) {
        return json(flag->get());
    }
    std::ostringstream oss;
    oss << "expected string or boolean, got " << node.type();
    throw SettingsError(key, oss.str());
}

json parse_env_value(const std::string& raw) {
    std::string lower = to_lower(raw);
    if (lower == "true") return true;
    if (lower == "false") return false;
    return raw;
}

std::optional<std::string> optional_string(const std::string& key, const json& v) {
    if (v.is_null()) return std::nullopt;
    if (!v.is_string()) {
        throw SettingsError(key, std::string("expected string, got ") + v.type_name());
    }
    return v.get<std::string>();
}

} // anonymous namespace

nlohmann::json load_settings_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = to_lower(fs::path(path).extension().string());

    if (ext == ".json") {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw FileNotFoundError(path);
        }
        try {
            return json::parse(file);
        } catch (const json::parse_error& e) {
            throw SettingsError(path, e.what());
        }
    }

    if (ext == ".toml") {
        toml::table table;
        try {
            table = toml::parse_file(path);
        } catch (const toml::parse_error& e) {
            std::ostringstream oss;
            oss << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
            throw SettingsError(path, oss.str());
        }

        json out = json::object();
        for (const auto& [key, val] : table) {
            std::string name(key.str());
            out[name] = toml_setting_to_json(name, val);
        }
        return out;
    }

    throw SettingsError(path, "unsupported settings file type '" + ext +
                              "' (expected .json or .toml)");
}

nlohmann::json collect_env_settings(const std::string& prefix) {
    json out = json::object();
    for (const char* key : kKnownKeys) {
        std::string name = to_upper(prefix.empty() ? std::string(key)
                                                   : prefix + "_" + key);
        if (const char* raw = std::getenv(name.c_str())) {
            out[key] = parse_env_value(raw);
        }
    }
    return out;
}

Settings settings_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw SettingsError("<root>", std::string("expected object, got ") + j.type_name());
    }

    Settings s;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& v = it.value();

        if (key == "top_level") {
            if (!v.is_boolean()) {
                throw SettingsError(key, std::string("expected boolean, got ") + v.type_name());
            }
            s.top_level = v.get<bool>();
        } else if (key == "now") {
            s.now = optional_string(key, v);
        } else if (key == "input") {
            s.input = optional_string(key, v);
        } else {
            throw SettingsError(key, "unknown setting");
        }
    }
    return s;
}

Settings load_settings(const SettingsOptions& opts) {
    json merged = json::object();

    // 1) file
    if (opts.file_path.has_value()) {
        json file = load_settings_file(*opts.file_path);
        if (!file.is_object()) {
            throw SettingsError(*opts.file_path, "top level must be a table/object");
        }
        merged.update(file);
    }

    // 2) env
    merged.update(collect_env_settings(opts.env_prefix));

    // 3) overrides
    for (const auto& [key, value] : opts.overrides) {
        merged[key] = value;
    }

    return settings_from_json(merged);
}

std::unique_ptr<Clock> make_clock(const Settings& settings) {
    if (!settings.now.has_value()) {
        return std::make_unique<SystemClock>();
    }
    auto dt = parse_datetime(*settings.now);
    if (!dt) {
        throw SettingsError("now", "expected 'YYYY-MM-DD HH:MM:SS[.ffffff]', got '" +
                                   *settings.now + "'");
    }
    return std::make_unique<FixedClock>(to_time_point(*dt));
}

} // namespace jsonsql
