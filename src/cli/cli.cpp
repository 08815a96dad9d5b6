#include "cli.hpp"
#include "securand/common.hpp"
#include "securand/error.hpp"
#include "securand/random.hpp"
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include <charconv>
#include <filesystem>
#include <iostream>

namespace securand::cli {

using crypto::Random;

namespace {

void print_usage() {
    std::cerr <<
        "securand " SECURAND_VERSION_STRING "\n"
        "Usage: securand [--config FILE] <command> [args...]\n"
        "\n"
        "Commands:\n"
        "  number                                    one full-range 64-bit integer\n"
        "  range MIN MAX                             one integer in [MIN, MAX]\n"
        "  string [--charset NAME] [LENGTH [CHARSET]] random string\n"
        "  pick ITEM...                              one of the items\n"
        "  shuffle ITEM...                           the items in random order\n"
        "  bytes N                                   N random bytes, hex encoded\n"
        "\n"
        "Charset names: alphanumeric, digits, lowercase, uppercase, hex, urlsafe\n";
}

template<typename T>
bool parse_integer(const std::string& text, T& out) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

// Print the value of a successful result, or log its error
template<typename T, typename Print>
int report(const Result<T>& result, Print&& print) {
    if (result.is_err()) {
        SECURAND_LOG_ERROR("{}", result.error().to_string());
        return EXIT_LIBRARY_ERROR;
    }
    print(result.value());
    return EXIT_OK;
}

int run_string(std::vector<std::string> args, const Settings& settings, std::ostream& out) {
    std::string chars = settings.charset;
    if (args.size() >= 2 && args[0] == "--charset") {
        const char* named = charset::by_name(args[1]);
        if (named == nullptr) {
            std::cerr << "string: unknown charset name '" << args[1] << "'\n";
            return EXIT_USAGE;
        }
        chars = named;
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.size() > 2) {
        print_usage();
        return EXIT_USAGE;
    }

    int length = settings.string_length;
    if (!args.empty() && !parse_int(args[0], length)) {
        std::cerr << "string: LENGTH must be an integer\n";
        return EXIT_USAGE;
    }
    if (args.size() == 2) {
        chars = args[1];
    }
    return report(Random::string_with_charset(length, chars),
                  [&out](const std::string& s) { out << s << "\n"; });
}

} // namespace

Settings load_settings(const std::string& config_path) {
    utils::Config config;
    if (!config_path.empty()) {
        config = utils::Config::load_from_file(config_path);
    }

    Settings settings;
    settings.log_level = config.get_or<std::string>("log_level", settings.log_level);
    settings.log_to_file = config.get_or<bool>("log_to_file", settings.log_to_file);
    settings.log_file = config.get_or<std::string>("log_file", settings.log_file);
    settings.string_length = config.get_or<int>("string_length", settings.string_length);
    settings.charset = config.get_or<std::string>("charset", settings.charset);
    return settings;
}

bool parse_int64(const std::string& text, int64_t& out) {
    return parse_integer(text, out);
}

bool parse_int(const std::string& text, int& out) {
    return parse_integer(text, out);
}

bool parse_size(const std::string& text, size_t& out) {
    return parse_integer(text, out);
}

int run_command(const std::string& command, const std::vector<std::string>& args,
                const Settings& settings, std::ostream& out) {
    if (command == "number" && args.empty()) {
        return report(Random::number(), [&out](int64_t n) { out << n << "\n"; });
    }

    if (command == "range" && args.size() == 2) {
        int64_t min = 0;
        int64_t max = 0;
        if (!parse_int64(args[0], min) || !parse_int64(args[1], max)) {
            std::cerr << "range: MIN and MAX must be 64-bit integers\n";
            return EXIT_USAGE;
        }
        return report(Random::number_in_range(min, max), [&out](int64_t n) { out << n << "\n"; });
    }

    if (command == "string") {
        return run_string(args, settings, out);
    }

    if (command == "pick") {
        return report(Random::pick(args), [&out](const std::string& s) { out << s << "\n"; });
    }

    if (command == "shuffle") {
        std::vector<std::string> items = args;
        auto result = Random::shuffle(items);
        if (result.is_err()) {
            SECURAND_LOG_ERROR("{}", result.error().to_string());
            return EXIT_LIBRARY_ERROR;
        }
        for (size_t i = 0; i < items.size(); ++i) {
            out << (i == 0 ? "" : " ") << items[i];
        }
        out << "\n";
        return EXIT_OK;
    }

    if (command == "bytes" && args.size() == 1) {
        size_t size = 0;
        if (!parse_size(args[0], size)) {
            std::cerr << "bytes: N must be a non-negative integer\n";
            return EXIT_USAGE;
        }
        return report(Random::bytes(size),
                      [&out](const securand::bytes& b) { out << to_hex(b) << "\n"; });
    }

    print_usage();
    return EXIT_USAGE;
}

int run(std::vector<std::string> args, std::ostream& out) {
    std::string config_path;
    if (args.size() >= 2 && args[0] == "--config") {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        print_usage();
        return args.empty() ? EXIT_USAGE : EXIT_OK;
    }

    try {
        if (!config_path.empty() && !std::filesystem::exists(config_path)) {
            std::cerr << "Config file not found: " << config_path << "\n";
            return EXIT_USAGE;
        }

        Settings settings = load_settings(config_path);
        utils::Logger::init(settings.log_level, settings.log_to_file, settings.log_file);
        SECURAND_LOG_DEBUG("securand {} starting, command '{}'", SECURAND_VERSION_STRING, args[0]);

        const std::string command = args[0];
        args.erase(args.begin());
        return run_command(command, args, settings, out);
    } catch (const SecurandException& e) {
        std::cerr << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_LIBRARY_ERROR;
    }
}

} // namespace securand::cli
