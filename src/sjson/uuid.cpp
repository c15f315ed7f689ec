#include <sjson/uuid.hpp>

#include <algorithm>
#include <chrono>
#include <ranges>
#include <ratio>

#include <boost/uuid/name_generator_md5.hpp>
#include <boost/uuid/uuid.hpp>

namespace sjson
{

namespace
{

using uuid_data = std::array<std::uint8_t, uuid_size>;

constexpr auto is_urn_prefix(std::string_view text) noexcept -> bool
{
    using namespace std::string_view_literals;
    constexpr auto urnPrefix = "urn:uuid:"sv;

    if (text.size() < urnPrefix.size())
    {
        return false;
    }
    return std::ranges::equal(text.substr(0U, urnPrefix.size()), urnPrefix,
                              [](char lhs, char rhs)
                              {
                                  if (lhs >= 'A' && lhs <= 'Z')
                                  {
                                      lhs = static_cast<char>(lhs - 'A' + 'a');
                                  }
                                  return lhs == rhs;
                              });
}

auto to_data(std::span<std::byte const> bytes) noexcept -> uuid_data
{
    uuid_data data{};
    std::ranges::transform(bytes, data.begin(), [](std::byte b)
                           { return std::to_integer<std::uint8_t>(b); });
    return data;
}

template <typename T>
void store_be(std::uint8_t *out, T value, std::size_t width) noexcept
{
    for (std::size_t i = width; i > 0U; --i)
    {
        out[i - 1U] = static_cast<std::uint8_t>(value & 0xffU);
        value >>= 8;
    }
}

template <typename T>
auto load_be(std::span<std::byte const, uuid_size> bytes,
             std::size_t offset,
             std::size_t width) noexcept -> T
{
    T value{};
    for (std::size_t i = offset; i < offset + width; ++i)
    {
        value = static_cast<T>((value << 8) | std::to_integer<T>(bytes[i]));
    }
    return value;
}

} // namespace

auto uuid_from_string(std::string_view text) noexcept -> result<uuid>
{
    if (is_urn_prefix(text))
    {
        text.remove_prefix(std::string_view{"urn:uuid:"}.size());
    }

    // hyphens are skipped and a single pair of braces is accepted
    auto parsed = uuid::from_string(text);
    if (!parsed.has_value())
    {
        return json_errc::invalid_uuid_string;
    }
    return *parsed;
}

auto uuid_from_bytes(std::span<std::byte const> bytes) noexcept
        -> result<uuid>
{
    if (bytes.size() != uuid_size)
    {
        return json_errc::invalid_uuid_size;
    }
    return uuid{to_data(bytes)};
}

auto uuid_from_bytes_le(std::span<std::byte const> bytes) noexcept
        -> result<uuid>
{
    if (bytes.size() != uuid_size)
    {
        return json_errc::invalid_uuid_size;
    }
    auto data = to_data(bytes);
    std::ranges::reverse(data.begin(), data.begin() + 4);
    std::ranges::reverse(data.begin() + 4, data.begin() + 6);
    std::ranges::reverse(data.begin() + 6, data.begin() + 8);
    return uuid{data};
}

auto uuid_from_fields(uuid_fields const &fields) noexcept -> result<uuid>
{
    if (fields.node > uuid_node_max)
    {
        return json_errc::range_error;
    }

    uuid_data data{};
    store_be(data.data(), fields.time_low, 4U);
    store_be(data.data() + 4, fields.time_mid, 2U);
    store_be(data.data() + 6, fields.time_hi_version, 2U);
    data[8] = fields.clock_seq_hi_variant;
    data[9] = fields.clock_seq_low;
    store_be(data.data() + 10, fields.node, 6U);
    return uuid{data};
}

auto uuid_from_integer(uint128 const &value) noexcept -> uuid
{
    uuid_data data{};
    uint128 remaining = value;
    for (auto it = data.rbegin(); it != data.rend(); ++it)
    {
        uint128 const low = remaining & 0xffU;
        *it = low.convert_to<std::uint8_t>();
        remaining >>= 8;
    }
    return uuid{data};
}

auto uuid_from_integer(big_integer const &value) -> result<uuid>
{
    static big_integer const limit = big_integer{1} << 128;

    if (value.sign() < 0 || value >= limit)
    {
        return json_errc::range_error;
    }

    uuid_data data{};
    big_integer remaining = value;
    for (auto it = data.rbegin(); it != data.rend(); ++it)
    {
        big_integer const low = remaining & 0xffU;
        *it = low.convert_to<std::uint8_t>();
        remaining >>= 8;
    }
    return uuid{data};
}

auto to_integer(uuid const &id) noexcept -> uint128
{
    uint128 magnitude{0U};
    for (std::byte const b : id.as_bytes())
    {
        magnitude <<= 8;
        magnitude |= std::to_integer<unsigned>(b);
    }
    return magnitude;
}

auto to_fields(uuid const &id) noexcept -> uuid_fields
{
    auto const bytes = id.as_bytes();
    return {
            .time_low = load_be<std::uint32_t>(bytes, 0U, 4U),
            .time_mid = load_be<std::uint16_t>(bytes, 4U, 2U),
            .time_hi_version = load_be<std::uint16_t>(bytes, 6U, 2U),
            .clock_seq_hi_variant = std::to_integer<std::uint8_t>(bytes[8]),
            .clock_seq_low = std::to_integer<std::uint8_t>(bytes[9]),
            .node = load_be<std::uint64_t>(bytes, 10U, 6U),
    };
}

auto to_bytes_le(uuid const &id) noexcept -> std::array<std::byte, uuid_size>
{
    std::array<std::byte, uuid_size> bytes{};
    std::ranges::copy(id.as_bytes(), bytes.begin());
    std::ranges::reverse(bytes.begin(), bytes.begin() + 4);
    std::ranges::reverse(bytes.begin() + 4, bytes.begin() + 6);
    std::ranges::reverse(bytes.begin() + 6, bytes.begin() + 8);
    return bytes;
}

// RFC 4122 Appendix C
uuid const namespace_dns{uuid_data{0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11,
                                   0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4,
                                   0x30, 0xc8}};
uuid const namespace_url{uuid_data{0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11,
                                   0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4,
                                   0x30, 0xc8}};
uuid const namespace_oid{uuid_data{0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11,
                                   0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4,
                                   0x30, 0xc8}};
uuid const namespace_x500{uuid_data{0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11,
                                    0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4,
                                    0x30, 0xc8}};

auto uuid_timestamp_now() noexcept -> std::uint64_t
{
    using ticks
            = std::chrono::duration<std::uint64_t, std::ratio<1, 10'000'000>>;
    auto const sinceUnixEpoch = std::chrono::duration_cast<ticks>(
            std::chrono::system_clock::now().time_since_epoch());
    return gregorian_epoch_offset + sinceUnixEpoch.count();
}

auto uuid_v1(std::uint64_t timestamp,
             std::uint16_t clockSequence,
             std::uint64_t node) noexcept -> uuid
{
    uuid_data data{};
    store_be(data.data(), static_cast<std::uint32_t>(timestamp), 4U);
    store_be(data.data() + 4, static_cast<std::uint16_t>(timestamp >> 32), 2U);
    store_be(data.data() + 6,
             static_cast<std::uint16_t>(((timestamp >> 48) & 0x0fffU) | 0x1000U),
             2U);
    data[8] = static_cast<std::uint8_t>(((clockSequence >> 8) & 0x3fU) | 0x80U);
    data[9] = static_cast<std::uint8_t>(clockSequence & 0xffU);
    store_be(data.data() + 10, node & uuid_node_max, 6U);
    return uuid{data};
}

auto uuid_v3(uuid const &nameSpace, std::string_view name) -> uuid
{
    boost::uuids::uuid md5Namespace{};
    std::ranges::transform(nameSpace.as_bytes(), md5Namespace.begin(),
                           [](std::byte b)
                           { return std::to_integer<std::uint8_t>(b); });

    boost::uuids::name_generator_md5 const generator(md5Namespace);
    auto const id = generator(name.data(), name.size());

    uuid_data data{};
    std::ranges::copy(id, data.begin());
    return uuid{data};
}

auto uuid_v5(uuid const &nameSpace, std::string_view name) -> uuid
{
    uuids::uuid_name_generator generator(nameSpace);
    return generator(name);
}

} // namespace sjson
