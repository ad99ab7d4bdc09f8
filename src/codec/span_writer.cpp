#include "spanwire/codec/span_writer.hpp"

#include <string_view>

#include "spanwire/codec/annotation_writer.hpp"
#include "spanwire/codec/endpoint_writer.hpp"
#include "spanwire/codec/json_escape.hpp"

namespace spanwire::codec {
    namespace {
        [[nodiscard]] std::string_view kind_name(spanwire::core::SpanKind kind) noexcept {
            const char* name = spanwire::core::span_kind_name(kind);
            return name != nullptr ? std::string_view(name) : std::string_view();
        }

        // Unset and out-of-range kinds are both omitted.
        [[nodiscard]] bool has_kind(const spanwire::core::Span& s) noexcept {
            return spanwire::core::span_kind_name(s.kind) != nullptr;
        }
    } // namespace

    u64 span_size_in_bytes(const spanwire::core::Span& s) noexcept {
        u64 size = 13; // {"traceId":""
        size += s.trace_id.size();
        if (s.parent_id.has_value()) {
            size += 14; // ,"parentId":""
            size += s.parent_id->size();
        }
        size += 8; // ,"id":""
        size += s.id.size();
        if (has_kind(s)) {
            size += 10; // ,"kind":""
            size += kind_name(s.kind).size();
        }
        if (s.name.has_value()) {
            size += 10; // ,"name":""
            size += json_escaped_size_in_bytes(*s.name);
        }
        if (s.timestamp.has_value()) {
            size += 13; // ,"timestamp":
            size += ascii_size_in_bytes(*s.timestamp);
        }
        if (s.duration.has_value()) {
            size += 12; // ,"duration":
            size += ascii_size_in_bytes(*s.duration);
        }
        if (s.local_endpoint.has_value()) {
            size += 17; // ,"localEndpoint":
            size += endpoint_size_in_bytes(*s.local_endpoint);
        }
        if (s.remote_endpoint.has_value()) {
            size += 18; // ,"remoteEndpoint":
            size += endpoint_size_in_bytes(*s.remote_endpoint);
        }
        if (!s.annotations.empty()) {
            size += 17; // ,"annotations":[]
            size += s.annotations.size() - 1; // commas between elements
            for (const spanwire::core::Annotation& a : s.annotations) {
                size += annotation_size_in_bytes(a);
            }
        }
        if (!s.tags.empty()) {
            size += 10; // ,"tags":{}
            size += s.tags.size() - 1; // commas between entries
            for (const auto& [key, value] : s.tags) {
                size += 5; // "":""
                size += json_escaped_size_in_bytes(key);
                size += json_escaped_size_in_bytes(value);
            }
        }
        if (spanwire::core::flag_set(s.debug)) {
            size += 13; // ,"debug":true
        }
        if (spanwire::core::flag_set(s.shared)) {
            size += 14; // ,"shared":true
        }
        return ++size; // }
    }

    void span_write(const spanwire::core::Span& s, Buffer& b) noexcept {
        b.write_ascii("{\"traceId\":\"").write_ascii(s.trace_id).write_byte('"');
        if (s.parent_id.has_value()) {
            b.write_ascii(",\"parentId\":\"").write_ascii(*s.parent_id).write_byte('"');
        }
        b.write_ascii(",\"id\":\"").write_ascii(s.id).write_byte('"');
        if (has_kind(s)) {
            b.write_ascii(",\"kind\":\"").write_ascii(kind_name(s.kind)).write_byte('"');
        }
        if (s.name.has_value()) {
            b.write_ascii(",\"name\":\"");
            json_escape(*s.name, b);
            b.write_byte('"');
        }
        if (s.timestamp.has_value()) {
            b.write_ascii(",\"timestamp\":").write_decimal(*s.timestamp);
        }
        if (s.duration.has_value()) {
            b.write_ascii(",\"duration\":").write_decimal(*s.duration);
        }
        if (s.local_endpoint.has_value()) {
            b.write_ascii(",\"localEndpoint\":");
            endpoint_write(*s.local_endpoint, b);
        }
        if (s.remote_endpoint.has_value()) {
            b.write_ascii(",\"remoteEndpoint\":");
            endpoint_write(*s.remote_endpoint, b);
        }
        if (!s.annotations.empty()) {
            b.write_ascii(",\"annotations\":[");
            bool first = true;
            for (const spanwire::core::Annotation& a : s.annotations) {
                if (!first) b.write_byte(',');
                annotation_write(a, b);
                first = false;
            }
            b.write_byte(']');
        }
        if (!s.tags.empty()) {
            b.write_ascii(",\"tags\":{");
            bool first = true;
            for (const auto& [key, value] : s.tags) {
                if (!first) b.write_byte(',');
                b.write_byte('"');
                json_escape(key, b);
                b.write_ascii("\":\"");
                json_escape(value, b);
                b.write_byte('"');
                first = false;
            }
            b.write_byte('}');
        }
        if (spanwire::core::flag_set(s.debug)) {
            b.write_ascii(",\"debug\":true");
        }
        if (spanwire::core::flag_set(s.shared)) {
            b.write_ascii(",\"shared\":true");
        }
        b.write_byte('}');
    }

    u32 span_write(const spanwire::core::Span& s, BufferMut out) noexcept {
        Buffer b(out);
        span_write(s, b);
        if (b.overflowed()) {
            return 0;
        }
        return b.pos();
    }
} // namespace spanwire::codec
