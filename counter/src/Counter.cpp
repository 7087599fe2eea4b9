#include "Counter.h"

#include "Util.h"
#include "data/LineReader.h"
#include "data/Reader.h"
#include "text/Utf8.h"

#include <cstddef>
#include <istream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <spdlog/spdlog.h>

namespace wordcount {

using namespace std::string_view_literals;

CountMode ParseCountMode(std::string_view name) {
    if (InsensitiveStrEquals(name, "char"sv)) {
        return CountMode::Char;
    } else if (InsensitiveStrEquals(name, "word"sv)) {
        return CountMode::Word;
    } else if (InsensitiveStrEquals(name, "line"sv)) {
        return CountMode::Line;
    }
    throw std::runtime_error("Unknown count mode: " + std::string{name});
}

std::string_view CountModeName(CountMode mode) {
    switch (mode) {
    case CountMode::Char:
        return "char";
    case CountMode::Word:
        return "word";
    case CountMode::Line:
        return "line";
    }
    return "unknown";
}

InvalidEncodingError::InvalidEncodingError(size_t line, size_t offset)
    : std::runtime_error("invalid UTF-8 on line " + std::to_string(line) + " at byte " + std::to_string(offset)),
      line_(line),
      offset_(offset) {}

FrequencyCounter::FrequencyCounter(CountMode mode) : mode_(mode) {}

void FrequencyCounter::AddLine(std::string_view line, size_t lineNumber) {
    auto invalidAt = text::FindInvalidUtf8(line);
    if (invalidAt != std::string_view::npos) {
        throw InvalidEncodingError(lineNumber, invalidAt);
    }

    ++lines_;
    switch (mode_) {
    case CountMode::Char:
        AddChars(line);
        break;
    case CountMode::Word:
        AddWords(line);
        break;
    case CountMode::Line:
        ++table_[std::string{line}];
        ++units_;
        break;
    }
}

// AddChars and AddWords only see lines AddLine has validated
void FrequencyCounter::AddChars(std::string_view line) {
    size_t pos = 0;
    while (pos < line.size()) {
        size_t start = pos;
        text::DecodeUtf8(line, pos);
        ++table_[std::string{line.substr(start, pos - start)}];
        ++units_;
    }
}

void FrequencyCounter::AddWords(std::string_view line) {
    size_t pos = 0;
    size_t wordStart = std::string_view::npos;

    while (pos < line.size()) {
        size_t start = pos;
        auto codePoint = *text::DecodeUtf8(line, pos);

        if (text::IsWordCharacter(codePoint)) {
            if (wordStart == std::string_view::npos) {
                wordStart = start;
            }
        } else if (wordStart != std::string_view::npos) {
            ++table_[std::string{line.substr(wordStart, start - wordStart)}];
            ++units_;
            wordStart = std::string_view::npos;
        }
    }

    if (wordStart != std::string_view::npos) {
        ++table_[std::string{line.substr(wordStart)}];
        ++units_;
    }
}

FrequencyTable FrequencyCounter::Finish() {
    spdlog::debug("Counted {} {} units ({} distinct) over {} lines",
                  units_,
                  mode_,
                  table_.size(),
                  lines_);

    lines_ = 0;
    units_ = 0;
    return std::exchange(table_, FrequencyTable{});
}

FrequencyTable Count(std::istream& input, CountMode mode) {
    data::StreamReader reader(input);
    data::LineReader<data::StreamReader> lines(reader);
    return Count(lines, mode);
}

size_t TotalUnits(const FrequencyTable& table) {
    return std::accumulate(
        table.begin(), table.end(), size_t{0}, [](size_t sum, const auto& entry) { return sum + entry.second; });
}

}  // namespace wordcount
