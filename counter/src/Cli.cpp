#include "Cli.h"

#include "Config.h"
#include "Counter.h"
#include "Report.h"
#include "data/Gzip.h"
#include "data/LineReader.h"
#include "data/Reader.h"

#include <exception>
#include <istream>
#include <ostream>
#include <string_view>
#include <vector>
#include <spdlog/spdlog.h>

namespace wordcount {

namespace {

void PrintUsage(std::ostream& out) {
    out << "Usage: wordcount [options] [input]\n"
        << "\n"
        << "Counts characters, words or lines of UTF-8 text. Reads stdin when input is '-' or missing.\n"
        << "\n"
        << "  --config=<path>       read key = value settings from a file first\n"
        << "  --mode=<mode>         char, word (default) or line\n"
        << "  --sort=<order>        count (default) or unit\n"
        << "  --limit=<n>           print at most n entries, 0 for all\n"
        << "  --decompress=<when>   auto (by .gz suffix), always or never\n"
        << "  --gzip                same as --decompress=always\n"
        << "  --log-level=<level>   trace, debug, info, warn (default), err, critical or off\n"
        << "  --help                show this message\n";
}

template<data::Reader R>
FrequencyTable CountInput(R& reader, const CounterConfig& config) {
    if (ShouldDecompress(config)) {
        data::GzipReader<R> gzip(reader);
        data::LineReader<data::GzipReader<R>> lines(gzip);
        return Count(lines, config.mode);
    }
    data::LineReader<R> lines(reader);
    return Count(lines, config.mode);
}

FrequencyTable CountConfiguredInput(const CounterConfig& config, std::istream& in) {
    if (config.input == "-") {
        spdlog::info("Reading {} units from stdin", config.mode);
        data::StreamReader reader(in);
        return CountInput(reader, config);
    }

    spdlog::info("Reading {} units from {}", config.mode, config.input);
    data::FileReader reader(config.input.c_str());
    return CountInput(reader, config);
}

}  // namespace

int Run(const std::vector<std::string_view>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    CounterConfig config;
    try {
        ApplyArguments(config, args);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        PrintUsage(err);
        return ExitFailure;
    }

    if (config.show_help) {
        PrintUsage(out);
        return ExitSuccess;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::debug("mode={} sort={} limit={} input={}",
                  config.mode,
                  config.sort == SortOrder::Count ? "count" : "unit",
                  config.limit,
                  config.input);

    try {
        auto table = CountConfiguredInput(config, in);
        spdlog::info("{}", FormatSummary(config.mode, table));

        WriteReport(out, SortedEntries(table, config.sort, config.limit));
        out.flush();
        if (!out) {
            spdlog::error("failed to write report");
            return ExitFailure;
        }
    } catch (const InvalidEncodingError& e) {
        spdlog::error("{}: {}", config.input == "-" ? "<stdin>" : config.input, e.what());
        return ExitInvalidEncoding;
    } catch (const std::exception& e) {
        spdlog::error("fatal exception: {}", e.what());
        return ExitFailure;
    }

    return ExitSuccess;
}

}  // namespace wordcount
