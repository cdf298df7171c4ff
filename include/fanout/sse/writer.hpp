#pragma once

#include <concepts>
#include <cstddef>
#include <string_view>

namespace fanout::sse {

/// Destination for encoded bytes: anything with a generic byte write.
/// write() returns false once the destination is unusable (peer gone).
template<typename W>
concept byte_writer = requires(W& w, const char* data, size_t size) {
    { w.write(data, size) } -> std::convertible_to<bool>;
};

/// A byte_writer that also offers a cheaper string path
template<typename W>
concept string_writer = byte_writer<W> && requires(W& w, std::string_view str) {
    { w.write_string(str) } -> std::convertible_to<bool>;
};

/// Write a string through the best path the writer exposes
template<byte_writer W>
bool write_all(W& w, std::string_view str) {
    if (str.empty()) {
        return true;
    }
    if constexpr (string_writer<W>) {
        return static_cast<bool>(w.write_string(str));
    } else {
        return static_cast<bool>(w.write(str.data(), str.size()));
    }
}

} // namespace fanout::sse
