#pragma once

#include "spanwire/codec/buffer.hpp"
#include "spanwire/core/models.hpp"

namespace spanwire::codec {
    // {"serviceName":"..","ipv4":"..","ipv6":"..","port":N}, absent members
    // omitted. An endpoint with nothing set is {}.
    [[nodiscard]] u64 endpoint_size_in_bytes(const spanwire::core::Endpoint& e) noexcept;

    void endpoint_write(const spanwire::core::Endpoint& e, Buffer& b) noexcept;

} // namespace spanwire::codec
