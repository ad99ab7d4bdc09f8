#pragma once

#include <cstdio>

#include "spanwire/codec/buffer.hpp"
#include "spanwire/core/errors.hpp"

namespace spanwire::cli {
    // Writes bytes and a trailing newline to an open stream, then flushes.
    // Failures are Cli/Io with errno in aux.
    spanwire::core::Status output_write_stream(std::FILE* stream, spanwire::codec::BufferView bytes) noexcept;

    // Creates or truncates path and writes bytes as is.
    spanwire::core::Status output_write_file(const char* path, spanwire::codec::BufferView bytes) noexcept;
} // namespace spanwire::cli
