#pragma once

#include <cstddef>
#include <cstdint>

#include <algorithm>
#include <array>
#include <random>
#include <span>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <uuid.h>

#include <sjson/disappointment.hpp>
#include <sjson/utils/misc.hpp>

namespace sjson
{

using uuid = uuids::uuid;

using uint128 = boost::multiprecision::uint128_t;
using big_integer = boost::multiprecision::cpp_int;

inline constexpr std::size_t uuid_size = 16U;
//! 8-4-4-4-12 hex digits and four separators
inline constexpr std::size_t canonical_uuid_size = 36U;

namespace detail
{

template <typename CharT>
inline constexpr CharT guid_encoding_lut[18] = {};

template <>
inline constexpr char guid_encoding_lut<char>[18] = "0123456789abcdef-";

} // namespace detail

/**
 * @brief The RFC 4122 field decomposition of a uuid.
 *
 * The node occupies the lower 48 bits of its member.
 */
struct uuid_fields
{
    std::uint32_t time_low;
    std::uint16_t time_mid;
    std::uint16_t time_hi_version;
    std::uint8_t clock_seq_hi_variant;
    std::uint8_t clock_seq_low;
    std::uint64_t node;

    friend constexpr auto operator==(uuid_fields const &,
                                     uuid_fields const &) noexcept -> bool
            = default;
};

inline constexpr std::uint64_t uuid_node_max = 0xffff'ffff'ffffULL;

/**
 * @brief Parses the hexadecimal text form of a uuid.
 *
 * Accepts the canonical hyphenated form, 32 plain hex digits, a form wrapped
 * in curly braces and a form prefixed with `urn:uuid:`. Hex digits may be
 * upper or lower case.
 */
auto uuid_from_string(std::string_view text) noexcept -> result<uuid>;
//! 16 bytes in network (big-endian) order
auto uuid_from_bytes(std::span<std::byte const> bytes) noexcept
        -> result<uuid>;
//! 16 bytes with time_low, time_mid and time_hi_version in little-endian order
auto uuid_from_bytes_le(std::span<std::byte const> bytes) noexcept
        -> result<uuid>;
auto uuid_from_fields(uuid_fields const &fields) noexcept -> result<uuid>;
auto uuid_from_integer(uint128 const &value) noexcept -> uuid;
/**
 * @brief Constructs a uuid from an unbounded integer.
 *
 * @return json_errc::range_error if @p value lies outside [0, 2^128 - 1]
 */
auto uuid_from_integer(big_integer const &value) -> result<uuid>;

template <utils::unsigned_integer T>
auto uuid_from_integer(T value) noexcept -> uuid
{
    return uuid_from_integer(uint128{value});
}
//! @return json_errc::range_error if @p value is negative
template <utils::signed_integer T>
auto uuid_from_integer(T value) noexcept -> result<uuid>
{
    if (value < 0)
    {
        return json_errc::range_error;
    }
    return uuid_from_integer(
            uint128{static_cast<std::make_unsigned_t<T>>(value)});
}

//! the big-endian interpretation of the 16 uuid bytes
auto to_integer(uuid const &id) noexcept -> uint128;
auto to_fields(uuid const &id) noexcept -> uuid_fields;
auto to_bytes_le(uuid const &id) noexcept -> std::array<std::byte, uuid_size>;

//! the 36 character lowercase 8-4-4-4-12 form without quotes
auto canonical_string(uuid const &id) -> std::string;

extern uuid const namespace_dns;
extern uuid const namespace_url;
extern uuid const namespace_oid;
extern uuid const namespace_x500;

//! 100ns intervals between 1582-10-15 and 1970-01-01
inline constexpr std::uint64_t gregorian_epoch_offset
        = 0x01B2'1DD2'1381'4000ULL;

//! the current time as 100ns intervals since 1582-10-15 00:00 UTC
auto uuid_timestamp_now() noexcept -> std::uint64_t;

/**
 * @brief Constructs a time based (version 1) uuid.
 *
 * Only the lower 60 bits of @p timestamp, the lower 14 bits of
 * @p clockSequence and the lower 48 bits of @p node are used.
 */
auto uuid_v1(std::uint64_t timestamp,
             std::uint16_t clockSequence,
             std::uint64_t node) noexcept -> uuid;

/**
 * @brief Generates a time based (version 1) uuid for the current time.
 *
 * Clock sequence and node are drawn from @p rng. The node has the multicast
 * bit set, so it never collides with an IEEE 802 address (RFC 4122 4.5).
 */
template <typename UniformRandomBitGenerator>
auto uuid_v1(UniformRandomBitGenerator &rng) -> uuid
{
    std::uniform_int_distribution<std::uint64_t> distribution;
    auto const bits = distribution(rng);
    auto const clockSequence = static_cast<std::uint16_t>(bits >> 48);
    auto const node = (bits & uuid_node_max) | 0x0100'0000'0000ULL;
    return uuid_v1(uuid_timestamp_now(), clockSequence, node);
}

/**
 * @brief Generates a name based (version 3, MD5) uuid.
 */
auto uuid_v3(uuid const &nameSpace, std::string_view name) -> uuid;

/**
 * @brief Generates a random (version 4) uuid from the given engine.
 */
template <typename UniformRandomBitGenerator>
auto uuid_v4(UniformRandomBitGenerator &rng) -> uuid
{
    uuids::basic_uuid_random_generator<UniformRandomBitGenerator> generator(
            rng);
    return generator();
}

/**
 * @brief Generates a name based (version 5, SHA-1) uuid.
 */
auto uuid_v5(uuid const &nameSpace, std::string_view name) -> uuid;

} // namespace sjson

template <>
struct fmt::formatter<sjson::uuid>
{
    constexpr auto parse(format_parse_context &ctx) noexcept
    {
        return ctx.begin();
    }
    template <typename FormatContext>
    auto format(sjson::uuid const &id, FormatContext &ctx) const
    {
        auto const text = sjson::canonical_string(id);
        return std::copy(text.begin(), text.end(), ctx.out());
    }
};
