#include "config.hpp"
#include "securand/error.hpp"
#include <fstream>

namespace securand::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path);
    }

    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw ConfigException(ErrorCode::ConfigParseFailed,
                              "failed to parse config file " + path + ": " + e.what());
    }

    if (!config.data_.is_object()) {
        throw ConfigException(ErrorCode::ConfigParseFailed, "config file is not a JSON object: " + path);
    }

    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConfigException(ErrorCode::ConfigParseFailed, std::string("failed to parse JSON: ") + e.what());
    }

    if (!config.data_.is_object()) {
        throw ConfigException(ErrorCode::ConfigParseFailed, "config is not a JSON object");
    }
    return config;
}

void Config::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigException(ErrorCode::ConfigLoadFailed, "failed to open file for writing: " + path);
    }

    file << data_.dump(2);
}

} // namespace securand::utils
