#pragma once

#include <cstdint>

#include <type_traits>

#include <sjson/utils/enum_bitset.hpp>

namespace sjson
{

/**
 * @brief Flags controlling a single encode call.
 */
enum class option : std::uint32_t
{
    none = 0,
    //! Append a line feed to the encoded document.
    append_newline = 0b0001,
    //! Encode sjson::uuid values as their canonical string.
    serialize_uuid = 0b0010,
    //! Emit object members ordered by their key bytes.
    sort_keys = 0b0100,
    //! Reject integers whose magnitude exceeds 2^53 - 1.
    strict_integer = 0b1000,
};

auto allow_enum_bitset(option &&) -> std::true_type;
using option_set = enum_bitset<option>;

} // namespace sjson
