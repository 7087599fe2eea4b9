#ifndef COMMON_DATA_LINEREADER_H
#define COMMON_DATA_LINEREADER_H

#include "data/Reader.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace wordcount::data {

constexpr size_t LineReaderChunkSize = 16384;

/**
 * @brief Splits the bytes of a Reader into lines.
 *
 * Lines end at "\n" or "\r\n" and are returned without the terminator. A "\r"
 * that is not followed by "\n" stays part of the line. A terminator at the very
 * end of the input does not start another (empty) line.
 */
template<Reader R>
class LineReader {
public:
    explicit LineReader(R& r, size_t chunkSize = LineReaderChunkSize)
        : underlying_(r), buffer_(std::max<size_t>(chunkSize, 1)) {}

    /**
     * @brief Reads the next line into line, replacing its contents.
     * @return false once the input is exhausted.
     */
    bool Next(std::string& line) {
        line.clear();

        while (true) {
            if (pos_ == size_) {
                if (eof_) {
                    break;
                }
                size_ = underlying_.ReadSome(buffer_.data(), buffer_.size());
                pos_ = 0;
                if (size_ == 0) {
                    eof_ = true;
                    break;
                }
            }

            const char* begin = buffer_.data() + pos_;
            const char* end = buffer_.data() + size_;
            const char* newline = std::find(begin, end, '\n');

            line.append(begin, newline);

            if (newline != end) {
                pos_ = static_cast<size_t>(newline - buffer_.data()) + 1;
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                ++lineNumber_;
                return true;
            }
            pos_ = size_;
        }

        // Last line without a terminator
        if (!line.empty()) {
            ++lineNumber_;
            return true;
        }
        return false;
    }

    /**
     * @brief 1-based number of the line most recently returned by Next, 0 before the first.
     */
    size_t LineNumber() const { return lineNumber_; }

private:
    R& underlying_;
    std::vector<char> buffer_;
    size_t pos_ = 0;
    size_t size_ = 0;
    size_t lineNumber_ = 0;
    bool eof_ = false;
};

}  // namespace wordcount::data

#endif
