#pragma once

#include <cstddef>

#include <fmt/format.h>

namespace sjson
{

inline constexpr std::size_t output_buffer_inline_size = 512U;

//! growable byte sink every encoding routine appends to
using output_buffer
        = fmt::basic_memory_buffer<char, output_buffer_inline_size>;

} // namespace sjson
