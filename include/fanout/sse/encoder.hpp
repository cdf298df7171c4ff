#pragma once

/// @file encoder.hpp
/// @brief Writes events to a destination in SSE wire format

#include <fanout/sse/event.hpp>
#include <fanout/sse/gzip_writer.hpp>
#include <fanout/sse/writer.hpp>

#include <memory>
#include <string>

namespace fanout::sse {

/// SSE encoder bound to one destination.
///
/// Each encode() call writes one complete event. With compression enabled
/// the bytes go through a gzip stream that is flushed at the end of every
/// call, so the client can decode each event as soon as it arrives.
/// A failed write is reported and never retried.
template<byte_writer Writer>
class encoder {
public:
    encoder(Writer& out, bool compress)
        : out_(out) {
        if (compress) {
            gzip_ = std::make_unique<gzip_writer<Writer>>(out_);
        }
    }

    encoder(const encoder&) = delete;
    encoder& operator=(const encoder&) = delete;

    /// @return false if the destination rejected the bytes
    [[nodiscard]] bool encode(const event& evt) {
        scratch_.clear();
        append_event(scratch_, evt);

        if (!gzip_) {
            return write_all(out_, scratch_);
        }
        return gzip_->write(scratch_.data(), scratch_.size()) && gzip_->flush();
    }

    /// Write bytes that are already in wire form (a proxied body, say)
    /// through the same, possibly compressed, path as events
    [[nodiscard]] bool write_raw(std::string_view bytes) {
        if (!gzip_) {
            return write_all(out_, bytes);
        }
        return gzip_->write(bytes.data(), bytes.size()) && gzip_->flush();
    }

    /// Terminate the gzip member, if any. Safe to call more than once.
    bool finish() {
        return gzip_ ? gzip_->finish() : true;
    }

    bool compressed() const noexcept { return gzip_ != nullptr; }

private:
    Writer& out_;
    std::unique_ptr<gzip_writer<Writer>> gzip_;
    std::string scratch_;
};

} // namespace fanout::sse
