#include "Config.h"

#include "Counter.h"
#include "Report.h"
#include "Util.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <spdlog/spdlog.h>

namespace wordcount {

using namespace std::string_view_literals;

namespace {

size_t ParseLimit(std::string_view value) {
    if (value.empty() || value.find_first_not_of("0123456789"sv) != std::string_view::npos) {
        throw std::runtime_error("limit must be a non-negative integer, got '" + std::string{value} + "'");
    }
    try {
        return std::stoul(std::string{value});
    } catch (const std::out_of_range&) {
        throw std::runtime_error("limit out of range: " + std::string{value});
    }
}

std::string ParseLogLevel(std::string_view value) {
    std::string name{value};
    // from_str maps every unknown name to off
    if (spdlog::level::from_str(name) == spdlog::level::off && name != "off") {
        throw std::runtime_error("Unknown log level: " + name);
    }
    return name;
}

// Shared by the config file and --key=value options
bool ApplySetting(CounterConfig& config, std::string_view key, std::string_view value) {
    if (key == "log_level"sv) {
        config.log_level = ParseLogLevel(value);
    } else if (key == "mode"sv) {
        config.mode = ParseCountMode(value);
    } else if (key == "sort"sv) {
        config.sort = ParseSortOrder(value);
    } else if (key == "limit"sv) {
        config.limit = ParseLimit(value);
    } else if (key == "decompress"sv) {
        config.decompress = ParseDecompress(value);
    } else if (key == "input"sv) {
        config.input = value.empty() ? "-" : std::string{value};
    } else {
        return false;
    }
    return true;
}

}  // namespace

Decompress ParseDecompress(std::string_view name) {
    if (InsensitiveStrEquals(name, "auto"sv)) {
        return Decompress::Auto;
    } else if (InsensitiveStrEquals(name, "always"sv)) {
        return Decompress::Always;
    } else if (InsensitiveStrEquals(name, "never"sv)) {
        return Decompress::Never;
    }
    throw std::runtime_error("Unknown decompress setting: " + std::string{name});
}

CounterConfig LoadConfigFromFile(const std::string& path) {
    CounterConfig config;

    auto fileData = ReadFile(path.c_str());
    auto lines = GetLines(fileData);

    size_t lineNumber = 0;
    for (auto line : lines) {
        ++lineNumber;
        line = Trim(line);
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eqPos = line.find('=');
        if (eqPos == std::string_view::npos) {
            throw std::runtime_error("Invalid config line " + std::to_string(lineNumber) + ": missing '='");
        }

        auto key = Trim(line.substr(0, eqPos));
        auto value = Trim(line.substr(eqPos + 1));

        if (!ApplySetting(config, key, value)) {
            spdlog::warn("Ignoring unknown config key '{}' on line {} of {}", key, lineNumber, path);
        }
    }

    return config;
}

void ApplyArguments(CounterConfig& config, const std::vector<std::string_view>& args) {
    for (auto arg : args) {
        if (arg.starts_with("--config="sv)) {
            config = LoadConfigFromFile(std::string{arg.substr(9)});
        }
    }

    bool haveInput = false;
    for (auto arg : args) {
        if (arg.starts_with("--config="sv)) {
            continue;
        } else if (arg == "--help"sv || arg == "-h"sv) {
            config.show_help = true;
        } else if (arg == "--gzip"sv) {
            config.decompress = Decompress::Always;
        } else if (arg.starts_with("--log-level="sv)) {
            config.log_level = ParseLogLevel(arg.substr(12));
        } else if (arg.starts_with("--") && arg.find('=') != std::string_view::npos) {
            auto eqPos = arg.find('=');
            auto key = arg.substr(2, eqPos - 2);
            // input is positional and log_level is spelled --log-level
            if (key == "input"sv || key == "log_level"sv || !ApplySetting(config, key, arg.substr(eqPos + 1))) {
                throw std::runtime_error("Unknown option: " + std::string{arg});
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::runtime_error("Unknown option: " + std::string{arg});
        } else {
            if (haveInput) {
                throw std::runtime_error("Only one input may be given, got extra '" + std::string{arg} + "'");
            }
            config.input = arg;
            haveInput = true;
        }
    }
}

bool ShouldDecompress(const CounterConfig& config) {
    switch (config.decompress) {
    case Decompress::Always:
        return true;
    case Decompress::Never:
        return false;
    case Decompress::Auto:
        return config.input != "-" && EndsWith(config.input, ".gz"sv);
    }
    return false;
}

}  // namespace wordcount
