#include <sjson/uuid.codec.hpp>

#include <cstdint>

#include <array>
#include <string>

namespace sjson
{

auto recognize_uuid(value const &v, option_set options) noexcept
        -> uuid const *
{
    if (!options.test(option::serialize_uuid))
    {
        return nullptr;
    }
    auto const *object = v.get_if<foreign>();
    if (object == nullptr)
    {
        return nullptr;
    }
    // any_cast only succeeds for the exact type, derived types yield nullptr
    return object->get_if<uuid>();
}

void encode_uuid(output_buffer &out, uuid const &id)
{
    std::array<char, encoded_uuid_size> text;
    text.front() = '"';
    text.back() = '"';
    detail::format_canonical_uuid(
            std::span<char, canonical_uuid_size>(text.data() + 1,
                                                 canonical_uuid_size),
            to_integer(id));
    out.append(text.data(), text.data() + text.size());
}

auto canonical_string(uuid const &id) -> std::string
{
    std::string text(canonical_uuid_size, '\0');
    detail::format_canonical_uuid(
            std::span<char, canonical_uuid_size>(text.data(),
                                                 canonical_uuid_size),
            to_integer(id));
    return text;
}

void detail::format_canonical_uuid(std::span<char, canonical_uuid_size> out,
                                   uint128 const &magnitude) noexcept
{
    constexpr auto &lut = guid_encoding_lut<char>;
    constexpr std::size_t separatorIdx = 16U;
    constexpr unsigned nibblesPerWord = 16U;

    std::array<std::uint64_t, 2> const words{
            uint128{magnitude >> 64}.convert_to<std::uint64_t>(),
            uint128{magnitude & ~std::uint64_t{}}.convert_to<std::uint64_t>(),
    };

    auto it = out.begin();
    for (unsigned nibble = 0U; nibble < 2U * nibblesPerWord; ++nibble)
    {
        if (nibble == 8U || nibble == 12U || nibble == 16U || nibble == 20U)
        {
            *it++ = lut[separatorIdx];
        }
        auto const word = words[nibble / nibblesPerWord];
        auto const shift = (nibblesPerWord - 1U - nibble % nibblesPerWord) * 4U;
        *it++ = lut[(word >> shift) & 0xfU];
    }
}

} // namespace sjson
