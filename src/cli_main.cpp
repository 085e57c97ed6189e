#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include "jsonsql/Errors.hpp"
#include "jsonsql/Marshal.hpp"
#include "jsonsql/Parser.hpp"
#include "jsonsql/Settings.hpp"
#include "jsonsql/SqlValue.hpp"

using namespace jsonsql;

namespace {

std::string read_stream(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

std::string read_input_file(const std::string& path) {
    if (path == "-") return read_stream(std::cin);
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw FileNotFoundError(path);
    return read_stream(ifs);
}

// Strip the trailing newline that files and shells usually add; an
// all-whitespace input still counts as empty (SQL NULL).
std::string trim_input(std::string s) {
    auto end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return "";
    s.erase(end + 1);
    return s;
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("jsonsql", "Render JSON as a type-preserving MySQL SQL expression");
        options.positional_help("[JSON]");

        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for settings", cxxopts::value<std::string>()->default_value("JSONSQL"))
            ("f,file", "Read JSON from FILE ('-' for stdin)", cxxopts::value<std::string>())
            ("nested", "Render without the top-level CAST(... as JSON) wrapper")
            ("now", "Freeze the clock at 'YYYY-MM-DD HH:MM:SS[.ffffff]' (UTC)", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("json", "JSON document", cxxopts::value<std::string>());

        options.parse_positional({"json"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        SettingsOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.env_prefix = result["prefix"].as<std::string>();
        if (result.count("nested")) load.overrides["top_level"] = false;
        if (result.count("now")) load.overrides["now"] = result["now"].as<std::string>();
        if (result.count("file")) load.overrides["input"] = result["file"].as<std::string>();

        Settings settings = load_settings(load);
        auto clock = make_clock(settings);

        std::string input;
        if (result.count("json")) {
            input = result["json"].as<std::string>();
        } else if (settings.input.has_value()) {
            input = read_input_file(*settings.input);
        } else {
            input = read_stream(std::cin);
        }
        input = trim_input(std::move(input));

        if (settings.top_level) {
            SqlValue value = marshal_sql_value(input, *clock);
            std::cout << value.raw() << "\n";
        } else {
            Value root = parse_bytes_or_null(input);
            std::string sql;
            marshal_sql(root, false, sql, *clock);
            std::cout << sql << "\n";
        }
        return 0;

    } catch (const ParseError& pe) {
        std::cerr << "Error: " << pe.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
