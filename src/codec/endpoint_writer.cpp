#include "spanwire/codec/endpoint_writer.hpp"

#include "spanwire/codec/json_escape.hpp"

namespace spanwire::codec {
    u64 endpoint_size_in_bytes(const spanwire::core::Endpoint& e) noexcept {
        u64 size = 1; // {
        bool counted_field = false;
        if (e.service_name.has_value()) {
            size += 16; // "serviceName":""
            size += json_escaped_size_in_bytes(*e.service_name);
            counted_field = true;
        }
        if (e.ipv4.has_value()) {
            if (counted_field) ++size; // ,
            size += 9; // "ipv4":""
            size += e.ipv4->size();
            counted_field = true;
        }
        if (e.ipv6.has_value()) {
            if (counted_field) ++size; // ,
            size += 9; // "ipv6":""
            size += e.ipv6->size();
            counted_field = true;
        }
        if (e.port.has_value()) {
            if (counted_field) ++size; // ,
            size += 7; // "port":
            size += ascii_size_in_bytes(*e.port);
        }
        return ++size; // }
    }

    void endpoint_write(const spanwire::core::Endpoint& e, Buffer& b) noexcept {
        b.write_byte('{');
        bool wrote_field = false;
        if (e.service_name.has_value()) {
            b.write_ascii("\"serviceName\":\"");
            json_escape(*e.service_name, b);
            b.write_byte('"');
            wrote_field = true;
        }
        if (e.ipv4.has_value()) {
            if (wrote_field) b.write_byte(',');
            b.write_ascii("\"ipv4\":\"").write_ascii(*e.ipv4).write_byte('"');
            wrote_field = true;
        }
        if (e.ipv6.has_value()) {
            if (wrote_field) b.write_byte(',');
            b.write_ascii("\"ipv6\":\"").write_ascii(*e.ipv6).write_byte('"');
            wrote_field = true;
        }
        if (e.port.has_value()) {
            if (wrote_field) b.write_byte(',');
            b.write_ascii("\"port\":").write_decimal(*e.port);
        }
        b.write_byte('}');
    }
} // namespace spanwire::codec
