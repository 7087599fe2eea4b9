#ifndef COUNTER_COUNTER_H
#define COUNTER_COUNTER_H

#include <concepts>
#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace wordcount {

enum class CountMode {
    Char,  // Unicode scalar values
    Word,  // runs of word characters, as matched by \w+
    Line,  // whole lines, terminator stripped
};

constexpr CountMode DefaultCountMode = CountMode::Word;

/**
 * @brief Parses "char", "word" or "line" (any case). Throws std::runtime_error otherwise.
 */
CountMode ParseCountMode(std::string_view name);

std::string_view CountModeName(CountMode mode);

using FrequencyTable = std::unordered_map<std::string, size_t>;

/**
 * @brief Thrown when a line of input is not valid UTF-8. No partial result is
 * ever produced alongside it.
 */
class InvalidEncodingError : public std::runtime_error {
public:
    InvalidEncodingError(size_t line, size_t offset);

    /** 1-based line number of the offending line. */
    size_t Line() const { return line_; }

    /** Byte offset of the first invalid sequence within that line. */
    size_t Offset() const { return offset_; }

private:
    size_t line_;
    size_t offset_;
};

template<typename T>
concept LineSource = requires(T source, std::string& line) {
    { source.Next(line) } -> std::same_as<bool>;
    { source.LineNumber() } -> std::convertible_to<size_t>;
};

/**
 * @brief Accumulates the units of one line at a time into a FrequencyTable.
 */
class FrequencyCounter {
public:
    explicit FrequencyCounter(CountMode mode);

    /**
     * @brief Counts the units of a single line (without its terminator).
     *
     * @param line Text of the line
     * @param lineNumber Reported in InvalidEncodingError if the line is not valid UTF-8
     */
    void AddLine(std::string_view line, size_t lineNumber);

    /**
     * @brief Hands the accumulated table to the caller. The counter is empty afterwards.
     */
    FrequencyTable Finish();

private:
    void AddChars(std::string_view line);
    void AddWords(std::string_view line);

    CountMode mode_;
    FrequencyTable table_;
    size_t lines_ = 0;
    size_t units_ = 0;
};

/**
 * @brief Counts the units selected by mode in every line of lines.
 *
 * @throws InvalidEncodingError if any line is not valid UTF-8
 */
template<LineSource L>
FrequencyTable Count(L& lines, CountMode mode = DefaultCountMode) {
    FrequencyCounter counter(mode);
    std::string line;
    while (lines.Next(line)) {
        counter.AddLine(line, lines.LineNumber());
    }
    return counter.Finish();
}

/**
 * @brief Counts the units selected by mode in the lines of a stream. Lines end
 * at "\n" or "\r\n".
 *
 * @throws InvalidEncodingError if any line is not valid UTF-8
 */
FrequencyTable Count(std::istream& input, CountMode mode = DefaultCountMode);

/**
 * @brief Sum of all counts in table.
 */
size_t TotalUnits(const FrequencyTable& table);

}  // namespace wordcount


template<>
struct fmt::formatter<wordcount::CountMode> : fmt::formatter<std::string_view> {
    auto format(wordcount::CountMode mode, format_context& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(wordcount::CountModeName(mode), ctx);
    }
};

#endif
