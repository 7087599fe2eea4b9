#ifndef COUNTER_CONFIG_H
#define COUNTER_CONFIG_H

#include "Counter.h"
#include "Report.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace wordcount {

enum class Decompress {
    Auto,    // by .gz suffix
    Always,
    Never,
};

Decompress ParseDecompress(std::string_view name);

struct CounterConfig {
    std::string log_level = "warn";

    CountMode mode = DefaultCountMode;
    SortOrder sort = SortOrder::Count;
    size_t limit = 0;  // 0 = print every entry
    Decompress decompress = Decompress::Auto;

    std::string input = "-";  // "-" = stdin

    bool show_help = false;
};

CounterConfig LoadConfigFromFile(const std::string& path);

/**
 * @brief Applies command line arguments (without argv[0]) on top of config.
 *
 * A --config=<path> argument is loaded first, wherever it appears, so the
 * remaining options override the file.
 */
void ApplyArguments(CounterConfig& config, const std::vector<std::string_view>& args);

/**
 * @brief Whether the input should be read through gzip.
 */
bool ShouldDecompress(const CounterConfig& config);

}  // namespace wordcount

#endif
