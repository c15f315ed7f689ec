#pragma once

#include <cstddef>

#include <span>

#include <sjson/options.hpp>
#include <sjson/output_buffer.hpp>
#include <sjson/uuid.hpp>
#include <sjson/value.hpp>

namespace sjson
{

//! the quoted canonical form as it appears in JSON text
inline constexpr std::size_t encoded_uuid_size = canonical_uuid_size + 2U;

/**
 * @brief Decides whether @p v is encoded as a uuid.
 *
 * Only a foreign value whose stored type is exactly sjson::uuid matches, and
 * only if option::serialize_uuid is set.
 *
 * @return the uuid or nullptr if it doesn't match
 */
auto recognize_uuid(value const &v, option_set options) noexcept
        -> uuid const *;

/**
 * @brief Appends the quoted canonical form of @p id to @p out.
 *
 * Always appends exactly encoded_uuid_size bytes.
 */
void encode_uuid(output_buffer &out, uuid const &id);

namespace detail
{

/**
 * @brief Writes the 36 character 8-4-4-4-12 form of the given 128-bit
 * magnitude.
 */
void format_canonical_uuid(std::span<char, canonical_uuid_size> out,
                           uint128 const &magnitude) noexcept;

} // namespace detail

} // namespace sjson
