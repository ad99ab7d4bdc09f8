#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "spanwire/core/types.hpp"

namespace spanwire::core {
    enum class SpanKind : u8 {
        Unset = 0,
        Client,
        Server,
        Producer,
        Consumer,
    };

    // Upper-case wire name, nullptr for Unset or an out-of-range value.
    [[nodiscard]] constexpr const char* span_kind_name(SpanKind kind) noexcept {
        switch (kind) {
        case SpanKind::Client: return "CLIENT";
        case SpanKind::Server: return "SERVER";
        case SpanKind::Producer: return "PRODUCER";
        case SpanKind::Consumer: return "CONSUMER";
        case SpanKind::Unset: break;
        }
        return nullptr;
    }

    struct Endpoint {
        std::optional<std::string> service_name;
        std::optional<std::string> ipv4;
        std::optional<std::string> ipv6;
        std::optional<u16> port;

        friend bool operator==(const Endpoint&, const Endpoint&) = default;
    };

    struct Annotation {
        TimestampMicros timestamp{0};
        std::string value;

        friend bool operator==(const Annotation&, const Annotation&) = default;
    };

    // Ordered so that every traversal of the same span sees the same sequence.
    using Tags = std::map<std::string, std::string>;

    struct Span {
        std::string trace_id;                     // 16 or 32 lower-hex chars
        std::optional<std::string> parent_id;     // 16 lower-hex chars
        std::string id;                           // 16 lower-hex chars
        SpanKind kind{SpanKind::Unset};
        std::optional<std::string> name;
        std::optional<TimestampMicros> timestamp;
        std::optional<DurationMicros> duration;
        std::optional<Endpoint> local_endpoint;
        std::optional<Endpoint> remote_endpoint;
        std::vector<Annotation> annotations;      // time order, kept as given
        Tags tags;
        std::optional<bool> debug;
        std::optional<bool> shared;

        friend bool operator==(const Span&, const Span&) = default;
    };

    [[nodiscard]] inline bool flag_set(const std::optional<bool>& f) noexcept {
        return f.has_value() && *f;
    }
} // namespace spanwire::core
