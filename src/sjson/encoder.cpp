#include <sjson/encoder.hpp>

#include <cmath>
#include <cstdint>

#include <algorithm>
#include <iterator>
#include <new>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include <sjson/platform/platform.hpp>
#include <sjson/uuid.codec.hpp>

#include "detail/utf.hpp"

namespace sjson
{

namespace
{

constexpr char hex_digits[] = "0123456789abcdef";

// 2^53 - 1, the largest integer every IEEE 754 double consumer reads exactly
constexpr std::uint64_t strict_integer_max = (std::uint64_t{1} << 53) - 1U;

void append_literal(output_buffer &out, std::string_view literal)
{
    out.append(literal.data(), literal.data() + literal.size());
}

void append_escape(output_buffer &out, unsigned char unit)
{
    using namespace std::string_view_literals;
    switch (unit)
    {
    case '"':
        append_literal(out, R"(\")"sv);
        break;
    case '\\':
        append_literal(out, R"(\\)"sv);
        break;
    case '\b':
        append_literal(out, R"(\b)"sv);
        break;
    case '\f':
        append_literal(out, R"(\f)"sv);
        break;
    case '\n':
        append_literal(out, R"(\n)"sv);
        break;
    case '\r':
        append_literal(out, R"(\r)"sv);
        break;
    case '\t':
        append_literal(out, R"(\t)"sv);
        break;
    default:
    {
        char const escaped[] = {'\\', 'u', '0', '0', hex_digits[unit >> 4],
                                hex_digits[unit & 0xfU]};
        out.append(std::begin(escaped), std::end(escaped));
        break;
    }
    }
}

} // namespace

encoder::encoder(option_set options) noexcept
    : mOptions(options)
    , mBuffer()
    , mUnsupportedType()
{
}

auto encoder::encode(value const &root) noexcept -> result<void>
{
    auto const mark = mBuffer.size();
    mUnsupportedType.clear();
    try
    {
        result<void> rx = encode_value(root, 0U);
        if (rx.has_failure())
        {
            mBuffer.resize(mark);
            return rx;
        }
        if (mOptions.test(option::append_newline))
        {
            mBuffer.push_back('\n');
        }
        return oc::success();
    }
    catch (std::bad_alloc const &)
    {
        mBuffer.resize(mark);
        return errc::not_enough_memory;
    }
}

auto encoder::release() -> std::string
{
    std::string text(mBuffer.data(), mBuffer.size());
    mBuffer.clear();
    return text;
}

void encoder::clear() noexcept
{
    mBuffer.clear();
    mUnsupportedType.clear();
}

auto encoder::describe_failure(system_error::error const &e) const
        -> std::string
{
    if (e == json_errc::unsupported_type && !mUnsupportedType.empty())
    {
        return fmt::format(FMT_STRING("{}: {}"), e.message().c_str(),
                           mUnsupportedType);
    }
    return std::string(e.message().c_str());
}

auto encoder::encode_value(value const &v, unsigned depth) -> result<void>
{
    return std::visit(
            [this, &v, depth](auto const &item) -> result<void>
            {
                using item_type = std::remove_cvref_t<decltype(item)>;
                if constexpr (std::is_same_v<item_type, foreign>)
                {
                    return encode_foreign(v);
                }
                else
                {
                    return encode_item(item, depth);
                }
            },
            v.storage());
}

auto encoder::encode_item(std::nullptr_t, unsigned) -> result<void>
{
    using namespace std::string_view_literals;
    append_literal(mBuffer, "null"sv);
    return oc::success();
}

auto encoder::encode_item(bool b, unsigned) -> result<void>
{
    using namespace std::string_view_literals;
    append_literal(mBuffer, b ? "true"sv : "false"sv);
    return oc::success();
}

auto encoder::encode_item(std::int64_t i, unsigned) -> result<void>
{
    if (mOptions.test(option::strict_integer))
    {
        auto const magnitude
                = i < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(i)
                        : static_cast<std::uint64_t>(i);
        if (magnitude > strict_integer_max)
        {
            return json_errc::integer_out_of_range;
        }
    }
    fmt::format_to(std::back_inserter(mBuffer), FMT_STRING("{}"), i);
    return oc::success();
}

auto encoder::encode_item(std::uint64_t u, unsigned) -> result<void>
{
    if (mOptions.test(option::strict_integer) && u > strict_integer_max)
    {
        return json_errc::integer_out_of_range;
    }
    fmt::format_to(std::back_inserter(mBuffer), FMT_STRING("{}"), u);
    return oc::success();
}

auto encoder::encode_item(double d, unsigned) -> result<void>
{
    using namespace std::string_view_literals;
    if (!std::isfinite(d))
    {
        append_literal(mBuffer, "null"sv);
        return oc::success();
    }

    auto const mark = mBuffer.size();
    // shortest round trip representation
    fmt::format_to(std::back_inserter(mBuffer), FMT_STRING("{}"), d);

    auto const written = std::string_view(mBuffer.data() + mark,
                                          mBuffer.size() - mark);
    if (written.find_first_of(".e"sv) == std::string_view::npos)
    {
        append_literal(mBuffer, ".0"sv);
    }
    return oc::success();
}

auto encoder::encode_item(std::string const &s, unsigned) -> result<void>
{
    return encode_string(s);
}

auto encoder::encode_item(value::array const &a, unsigned depth)
        -> result<void>
{
    if (depth >= max_nesting_depth)
    {
        return json_errc::recursion_limit;
    }

    mBuffer.push_back('[');
    bool first = true;
    for (auto const &element : a)
    {
        if (!first)
        {
            mBuffer.push_back(',');
        }
        first = false;
        SJSON_TRY(encode_value(element, depth + 1U));
    }
    mBuffer.push_back(']');
    return oc::success();
}

auto encoder::encode_item(value::object const &o, unsigned depth)
        -> result<void>
{
    if (depth >= max_nesting_depth)
    {
        return json_errc::recursion_limit;
    }

    std::vector<value::object::value_type const *> members;
    members.reserve(o.size());
    for (auto const &member : o)
    {
        members.push_back(&member);
    }
    if (mOptions.test(option::sort_keys))
    {
        std::ranges::stable_sort(members, {},
                                 [](auto const *member) -> std::string_view
                                 { return member->first; });
    }

    mBuffer.push_back('{');
    bool first = true;
    for (auto const *member : members)
    {
        if (!first)
        {
            mBuffer.push_back(',');
        }
        first = false;
        SJSON_TRY(encode_string(member->first));
        mBuffer.push_back(':');
        SJSON_TRY(encode_value(member->second, depth + 1U));
    }
    mBuffer.push_back('}');
    return oc::success();
}

auto encoder::encode_foreign(value const &v) -> result<void>
{
    if (auto const *id = recognize_uuid(v, mOptions); id != nullptr)
    {
        encode_uuid(mBuffer, *id);
        return oc::success();
    }

    // a wrong type and a disabled option are reported alike
    mUnsupportedType = detail::type_name(v.get_if<foreign>()->type());
    return json_errc::unsupported_type;
}

auto encoder::encode_string(std::string_view s) -> result<void>
{
    if (utf::find_invalid(s) != std::string_view::npos)
    {
        return json_errc::invalid_utf8;
    }

    mBuffer.push_back('"');
    std::size_t runStart = 0U;
    for (std::size_t i = 0U; i < s.size(); ++i)
    {
        auto const unit = static_cast<unsigned char>(s[i]);
        if (unit >= 0x20U && unit != '"' && unit != '\\')
        {
            continue;
        }
        mBuffer.append(s.data() + runStart, s.data() + i);
        append_escape(mBuffer, unit);
        runStart = i + 1U;
    }
    mBuffer.append(s.data() + runStart, s.data() + s.size());
    mBuffer.push_back('"');
    return oc::success();
}

auto dumps(value const &root, option_set options) -> result<std::string>
{
    encoder enc(options);
    SJSON_TRY(enc.encode(root));
    return enc.release();
}

} // namespace sjson
