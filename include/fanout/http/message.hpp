#pragma once

/// @file message.hpp
/// @brief Request and response heads as seen by the SSE handlers
///
/// The embedding server parses requests and owns the sockets; the handlers
/// only read a few request headers and produce (or rewrite) a response head.

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fanout::http {

/// Statuses the handlers produce themselves; proxied responses keep theirs
enum class status : uint16_t {
    ok = 200,
    bad_gateway = 502,
};

inline constexpr std::string_view status_reason(status s) noexcept {
    switch (s) {
        case status::ok: return "OK";
        case status::bad_gateway: return "Bad Gateway";
    }
    return "Unknown";
}

/// ASCII case-insensitive equality, for header names
inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// Case-insensitive substring test, for list-valued headers such as Accept-Encoding
inline bool header_contains_token(std::string_view value, std::string_view token) {
    auto it = std::search(value.begin(), value.end(), token.begin(), token.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    return it != value.end();
}

/// Header fields in insertion order. Names compare case-insensitively; a
/// name appears at most once.
class headers {
public:
    /// Set a field, replacing any value under the same name
    void set(std::string_view name, std::string_view value) {
        if (auto* field = find(name)) {
            field->second = value;
        } else {
            fields_.emplace_back(std::string(name), std::string(value));
        }
    }

    /// Field value, or empty if absent
    std::string_view get(std::string_view name) const {
        if (const auto* field = find(name)) {
            return field->second;
        }
        return {};
    }

    bool contains(std::string_view name) const {
        return find(name) != nullptr;
    }

    void remove(std::string_view name) {
        std::erase_if(fields_, [name](const field_type& f) { return iequals(f.first, name); });
    }

    std::optional<size_t> content_length() const {
        auto val = get("Content-Length");
        size_t len = 0;
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), len);
        if (val.empty() || ec != std::errc{} || ptr != val.data() + val.size()) {
            return std::nullopt;
        }
        return len;
    }

    /// "Name: value\r\n" per field
    std::string serialize() const {
        std::string result;
        for (const auto& [name, value] : fields_) {
            result.append(name).append(": ").append(value).append("\r\n");
        }
        return result;
    }

private:
    using field_type = std::pair<std::string, std::string>;

    field_type* find(std::string_view name) {
        auto it = std::find_if(fields_.begin(), fields_.end(),
                               [name](const field_type& f) { return iequals(f.first, name); });
        return it == fields_.end() ? nullptr : &*it;
    }

    const field_type* find(std::string_view name) const {
        return const_cast<headers*>(this)->find(name);
    }

    std::vector<field_type> fields_;
};

/// Incoming request, as handed over by the embedding server
class request {
public:
    request() = default;

    explicit request(std::string_view path)
        : path_(path) {}

    std::string_view path() const noexcept { return path_; }

    void set_header(std::string_view name, std::string_view value) {
        headers_.set(name, value);
    }

    std::string_view header(std::string_view name) const {
        return headers_.get(name);
    }

    /// Replay cursor supplied by a reconnecting EventSource
    std::string_view last_event_id() const { return headers_.get("Last-Event-ID"); }

    /// Whether the client accepts gzip content coding
    bool accepts_gzip() const {
        return header_contains_token(headers_.get("Accept-Encoding"), "gzip");
    }

private:
    std::string path_ = "/";
    headers headers_;
};

/// Outgoing or proxied response: status, head fields and a complete body
class response {
public:
    response() = default;

    explicit response(status s) : status_(static_cast<uint16_t>(s)) {}

    /// Complete response with Content-Type and Content-Length filled in
    response(status s, std::string_view body, std::string_view content_type = "text/plain")
        : status_(static_cast<uint16_t>(s))
        , body_(body) {
        headers_.set("Content-Type", content_type);
        headers_.set("Content-Length", std::to_string(body_.size()));
    }

    status get_status() const noexcept { return static_cast<status>(status_); }
    uint16_t status_code() const noexcept { return status_; }

    const headers& get_headers() const noexcept { return headers_; }
    headers& get_headers() noexcept { return headers_; }

    void set_header(std::string_view name, std::string_view value) {
        headers_.set(name, value);
    }

    std::string_view header(std::string_view name) const {
        return headers_.get(name);
    }

    std::string_view body() const noexcept { return body_; }

    /// Status line and head fields, terminated by the blank line
    std::string serialize_head() const {
        std::string result = "HTTP/1.1 ";
        result += std::to_string(status_);
        result += ' ';
        result += status_reason(get_status());
        result += "\r\n";
        result += headers_.serialize();
        result += "\r\n";
        return result;
    }

private:
    uint16_t status_ = 200;
    headers headers_;
    std::string body_;
};

} // namespace fanout::http
