#pragma once

#include <string>
#include <string_view>

#include "spanwire/codec/buffer.hpp"

namespace spanwire::codec {
    // Bytes s occupies once escaped for a JSON string body (quotes excluded).
    //
    // Escaped: '"' and '\\', the short forms \b \f \n \r \t, every other byte
    // below 0x20 as a six byte unicode escape (lower-case hex), and the line/paragraph
    // separators U+2028/U+2029 as six byte sequences. Anything else, including
    // multi-byte and malformed UTF-8, passes through unchanged.
    [[nodiscard]] u64 json_escaped_size_in_bytes(std::string_view s) noexcept;

    // Writes exactly json_escaped_size_in_bytes(s) bytes into b.
    void json_escape(std::string_view s, Buffer& b) noexcept;

    // Owning variant for callers outside the encode path.
    [[nodiscard]] std::string json_escape(std::string_view s);

} // namespace spanwire::codec
