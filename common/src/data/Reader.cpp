#include "data/Reader.h"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <istream>
#include <span>
#include <stdexcept>
#include <string>

namespace wordcount::data {

FileReader::FileReader(const char* filename) : file_(fopen(filename, "rb")), owned_(true) {
    if (file_ == nullptr) {
        throw std::runtime_error("Failed to open file: " + std::string{filename});
    }
}

FileReader::FileReader(FILE* f, bool takeOwnership) : file_(f), owned_(takeOwnership) {}

FileReader::~FileReader() {
    if (owned_) {
        Close();
    }
}

FileReader::FileReader(FileReader&& other) noexcept : file_(other.file_), owned_(other.owned_) {
    other.file_ = nullptr;
    other.owned_ = false;
}

FileReader& FileReader::operator=(FileReader&& other) noexcept {
    if (this != &other) {
        if (owned_ && file_) {
            fclose(file_);
        }
        file_ = other.file_;
        owned_ = other.owned_;
        other.file_ = nullptr;
        other.owned_ = false;
    }
    return *this;
}

size_t FileReader::ReadSome(void* data, size_t size) {
    if (file_ == nullptr) {
        return 0;
    }
    size_t n = fread(data, 1, size, file_);
    if (n < size && ferror(file_)) {
        throw std::runtime_error("Failed to read file");
    }
    return n;
}

void FileReader::Close() {
    if (file_ != nullptr) {
        fclose(file_);
        file_ = nullptr;
    }
}

BufferReader::BufferReader(std::span<const char> d) : data_(d) {}

size_t BufferReader::ReadSome(void* out, size_t size) {
    size_t n = std::min(size, Remaining());
    if (n > 0) {
        memcpy(out, data_.data() + position_, n);
        position_ += n;
    }
    return n;
}

size_t BufferReader::Remaining() const {
    return data_.size() - position_;
}

StreamReader::StreamReader(std::istream& in) : in_(in) {}

size_t StreamReader::ReadSome(void* out, size_t size) {
    if (in_.bad()) {
        throw std::runtime_error("Failed to read input stream");
    }
    // Read through the streambuf: the final short read must not set failbit
    // on a stream that may have exceptions enabled
    auto* buf = in_.rdbuf();
    if (buf == nullptr || !in_.good()) {
        return 0;
    }
    return static_cast<size_t>(buf->sgetn(static_cast<char*>(out), static_cast<std::streamsize>(size)));
}

}  // namespace wordcount::data
