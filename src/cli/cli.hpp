#pragma once

#include "securand/common.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace securand::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_LIBRARY_ERROR = 1;
constexpr int EXIT_USAGE = 2;

/**
 * Settings read from the optional JSON config file
 */
struct Settings {
    std::string log_level = "warn";
    bool log_to_file = false;
    std::string log_file = "securand.log";
    int string_length = constants::DEFAULT_LENGTH;
    std::string charset = constants::DEFAULT_CHARSET;
};

/**
 * Load settings from a JSON file; an empty path yields the defaults
 * @throws ConfigException if the file cannot be read or parsed
 */
Settings load_settings(const std::string& config_path);

/**
 * Strict integer parsing: the whole text must be consumed
 */
bool parse_int64(const std::string& text, int64_t& out);
bool parse_int(const std::string& text, int& out);
bool parse_size(const std::string& text, size_t& out);

/**
 * Run one command with already-loaded settings. Generated values go to out.
 * @return EXIT_OK, EXIT_LIBRARY_ERROR on a sampling error, EXIT_USAGE on bad arguments
 */
int run_command(const std::string& command, const std::vector<std::string>& args,
                const Settings& settings, std::ostream& out);

/**
 * Full command line without the program name: [--config FILE] <command> [args...]
 */
int run(std::vector<std::string> args, std::ostream& out);

} // namespace securand::cli
