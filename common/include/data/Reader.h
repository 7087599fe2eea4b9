#ifndef COMMON_DATA_READER_H
#define COMMON_DATA_READER_H

#include <concepts>
#include <cstddef>
#include <cstdio>
#include <istream>
#include <span>

namespace wordcount::data {

template<typename T>
concept Reader = requires(T reader, void* data, size_t size) {
    // Read up to 'size' bytes into data, returns how many were read (0 at end of input)
    { reader.ReadSome(data, size) } -> std::same_as<size_t>;
};

class FileReader {
public:
    explicit FileReader(const char* filename);
    FileReader(FILE* f, bool takeOwnership = false);
    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;
    FileReader(FileReader&& other) noexcept;
    FileReader& operator=(FileReader&& other) noexcept;

    size_t ReadSome(void* data, size_t size);

    void Close();

private:
    FILE* file_;
    bool owned_;
};

class BufferReader {
public:
    BufferReader(std::span<const char> d);

    size_t ReadSome(void* out, size_t size);
    size_t Remaining() const;

private:
    std::span<const char> data_;
    size_t position_ = 0;
};

/**
 * @brief Adapts a borrowed std::istream to the Reader concept.
 */
class StreamReader {
public:
    explicit StreamReader(std::istream& in);

    size_t ReadSome(void* out, size_t size);

private:
    std::istream& in_;
};

}  // namespace wordcount::data

#endif
