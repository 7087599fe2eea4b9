#ifndef COMMON_DATA_GZIP_H
#define COMMON_DATA_GZIP_H

#include "data/Reader.h"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>
#include <zconf.h>
#include <zlib.h>

namespace wordcount::data {

constexpr size_t GzipChunkSize = 16384;

/**
 * @brief Inflates a gzip stream read from an underlying Reader.
 *
 * Concatenated gzip members are decoded back to back, as gunzip does. Corrupt
 * data and input that ends inside a member both throw std::runtime_error.
 */
template<Reader R>
class GzipReader {
public:
    explicit GzipReader(R& r) : underlying_(r), inBuffer_(GzipChunkSize) {
        strm_.zalloc = Z_NULL;
        strm_.zfree = Z_NULL;
        strm_.opaque = Z_NULL;
        strm_.avail_in = 0;
        strm_.next_in = Z_NULL;

        if (inflateInit2(&strm_, 31) != Z_OK) {  // 15 + 16 for gzip format
            throw std::runtime_error("Failed to initialize zlib");
        }
    }

    ~GzipReader() { inflateEnd(&strm_); }

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    size_t ReadSome(void* out, size_t size) {
        auto chunk = static_cast<uInt>(std::min<size_t>(size, std::numeric_limits<uInt>::max()));
        if (chunk == 0) {
            return 0;
        }

        strm_.next_out = static_cast<Bytef*>(out);
        strm_.avail_out = chunk;

        while (strm_.avail_out == chunk) {
            if (strm_.avail_in == 0) {
                if (inputDone_) {
                    if (inMember_) {
                        throw std::runtime_error("Truncated gzip stream");
                    }
                    return 0;
                }

                auto bytesRead = underlying_.ReadSome(inBuffer_.data(), inBuffer_.size());
                if (bytesRead == 0) {
                    inputDone_ = true;
                    continue;
                }
                strm_.avail_in = static_cast<uInt>(bytesRead);
                strm_.next_in = reinterpret_cast<Bytef*>(inBuffer_.data());
            }

            if (!inMember_) {
                if (inflateReset(&strm_) != Z_OK) {
                    throw std::runtime_error("Failed to reset zlib stream");
                }
                inMember_ = true;
            }

            int ret = inflate(&strm_, Z_NO_FLUSH);
            if (ret == Z_STREAM_END) {
                inMember_ = false;
            } else if (ret != Z_OK) {
                throw std::runtime_error("Zlib decompression error");
            }
        }

        return chunk - strm_.avail_out;
    }

private:
    R& underlying_;

    z_stream strm_{};
    std::vector<char> inBuffer_;
    bool inMember_ = false;
    bool inputDone_ = false;
};

}  // namespace wordcount::data

#endif
