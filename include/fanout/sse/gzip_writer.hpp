#pragma once

/// @file gzip_writer.hpp
/// @brief Streaming gzip filter in front of a byte_writer

#include <fanout/sse/writer.hpp>
#include <fanout/log/logger.hpp>

#include <zlib.h>

#include <array>
#include <stdexcept>
#include <string_view>

namespace fanout::sse {

/// Compresses everything written to it into a single gzip member and
/// forwards the compressed bytes to the wrapped writer.
///
/// Nothing is guaranteed to reach the wrapped writer until flush(), which
/// performs a zlib sync flush: everything written so far becomes decodable
/// by the client without closing the stream.
template<byte_writer Writer>
class gzip_writer {
public:
    explicit gzip_writer(Writer& out, int level = Z_DEFAULT_COMPRESSION)
        : out_(out) {
        // windowBits 15 + 16 selects the gzip wrapper instead of raw zlib
        int rc = deflateInit2(&stream_, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
        if (rc != Z_OK) {
            throw std::runtime_error("deflateInit2 failed");
        }
    }

    ~gzip_writer() {
        deflateEnd(&stream_);
    }

    gzip_writer(const gzip_writer&) = delete;
    gzip_writer& operator=(const gzip_writer&) = delete;

    /// Feed uncompressed bytes
    bool write(const char* data, size_t size) {
        if (finished_) {
            return false;
        }
        return pump(data, size, Z_NO_FLUSH);
    }

    /// Sync-flush pending output to the wrapped writer
    bool flush() {
        if (finished_) {
            return false;
        }
        return pump(nullptr, 0, Z_SYNC_FLUSH);
    }

    /// Write the gzip trailer; the writer accepts nothing afterwards
    bool finish() {
        if (finished_) {
            return true;
        }
        finished_ = true;
        return pump(nullptr, 0, Z_FINISH);
    }

    bool is_finished() const noexcept { return finished_; }

private:
    bool pump(const char* data, size_t size, int flush_mode) {
        stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
        stream_.avail_in = static_cast<uInt>(size);

        do {
            stream_.next_out = reinterpret_cast<Bytef*>(buffer_.data());
            stream_.avail_out = static_cast<uInt>(buffer_.size());

            int rc = deflate(&stream_, flush_mode);
            if (rc == Z_STREAM_ERROR) {
                FANOUT_LOG_ERROR("gzip deflate failed: {}", stream_.msg ? stream_.msg : "stream error");
                return false;
            }

            size_t produced = buffer_.size() - stream_.avail_out;
            if (produced > 0 &&
                !write_all(out_, std::string_view(buffer_.data(), produced))) {
                return false;
            }
            // A full output buffer means deflate may still hold pending bytes
        } while (stream_.avail_out == 0);

        return stream_.avail_in == 0;
    }

    Writer& out_;
    z_stream stream_{};
    std::array<char, 16384> buffer_{};
    bool finished_ = false;
};

} // namespace fanout::sse
