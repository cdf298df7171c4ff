#pragma once

/// @file event.hpp
/// @brief Event model and SSE wire serialization
///
/// An event is either a publication (optional id, optional event name,
/// mandatory data) or a comment, a single meta line used for heartbeats.

#include <cstdint>
#include <string>
#include <string_view>

namespace fanout::sse {

/// MIME type for SSE
inline constexpr std::string_view SSE_CONTENT_TYPE = "text/event-stream; charset=utf-8";

/// Discriminant of the event variants
enum class event_kind : uint8_t {
    publication,  ///< id/event/data record terminated by a blank line
    comment       ///< single ':'-prefixed line, no record boundary
};

/// SSE event
struct event {
    event_kind kind = event_kind::publication;
    std::string id;    ///< Event ID (publication only, empty = omitted)
    std::string type;  ///< Event name (publication only, empty = omitted)
    std::string data;  ///< Payload, or the comment text for comments

    /// Create a simple event with just data
    static event message(std::string_view data) {
        return event{event_kind::publication, "", "", std::string(data)};
    }

    /// Create a named event
    static event typed(std::string_view type, std::string_view data) {
        return event{event_kind::publication, "", std::string(type), std::string(data)};
    }

    /// Create an event with ID
    static event with_id(std::string_view id, std::string_view data) {
        return event{event_kind::publication, std::string(id), "", std::string(data)};
    }

    /// Create a full event
    static event full(std::string_view id, std::string_view type, std::string_view data) {
        return event{event_kind::publication, std::string(id), std::string(type), std::string(data)};
    }

    /// Create a comment (heartbeat) line
    static event comment(std::string_view value) {
        return event{event_kind::comment, "", "", std::string(value)};
    }

    bool is_comment() const noexcept { return kind == event_kind::comment; }
};

/// Append the wire form of an event to out.
///
/// Publications always carry at least one data line. Data is split on '\n'
/// and a trailing newline produces a trailing empty "data: " line, so the
/// client reassembles exactly the original payload.
inline void append_event(std::string& out, const event& evt) {
    if (evt.kind == event_kind::comment) {
        out += ':';
        out += evt.data;
        out += '\n';
        return;
    }

    if (!evt.id.empty()) {
        out += "id: ";
        out += evt.id;
        out += '\n';
    }

    if (!evt.type.empty()) {
        out += "event: ";
        out += evt.type;
        out += '\n';
    }

    std::string_view data = evt.data;
    size_t start = 0;
    while (true) {
        auto end = data.find('\n', start);
        out += "data: ";
        if (end == std::string_view::npos) {
            out += data.substr(start);
            out += '\n';
            break;
        }
        out += data.substr(start, end - start);
        out += '\n';
        start = end + 1;
    }

    // End of record
    out += '\n';
}

/// Serialize an SSE event to wire format
inline std::string serialize_event(const event& evt) {
    std::string out;
    out.reserve(evt.id.size() + evt.type.size() + evt.data.size() + 32);
    append_event(out, evt);
    return out;
}

} // namespace fanout::sse
