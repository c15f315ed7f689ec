#pragma once

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>

#include <sjson/disappointment.hpp>
#include <sjson/options.hpp>
#include <sjson/output_buffer.hpp>
#include <sjson/value.hpp>

namespace sjson
{

//! containers nested deeper than this are rejected with recursion_limit
inline constexpr unsigned max_nesting_depth = 254U;

/**
 * @brief Writes compact JSON documents into an owned buffer.
 *
 * A failed encode() leaves the buffer exactly as it was before the call.
 */
class encoder
{
public:
    explicit encoder(option_set options = option::none) noexcept;

    /**
     * @brief Appends the JSON text of @p root.
     *
     * Foreign values are only accepted if an enabled option recognizes their
     * exact type, otherwise json_errc::unsupported_type is returned and the
     * type's name is retained, see unsupported_type_name().
     */
    auto encode(value const &root) noexcept -> result<void>;

    [[nodiscard]] auto view() const noexcept -> std::string_view
    {
        return {mBuffer.data(), mBuffer.size()};
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return mBuffer.size();
    }
    //! moves the encoded text out and empties the buffer
    auto release() -> std::string;
    void clear() noexcept;

    [[nodiscard]] auto options() const noexcept -> option_set
    {
        return mOptions;
    }

    //! the name of the type which failed the last encode() call, if any
    [[nodiscard]] auto unsupported_type_name() const noexcept
            -> std::string_view
    {
        return mUnsupportedType;
    }

    /**
     * @brief Renders a message for an error returned by encode().
     */
    [[nodiscard]] auto describe_failure(system_error::error const &e) const
            -> std::string;

private:
    auto encode_value(value const &v, unsigned depth) -> result<void>;

    auto encode_item(std::nullptr_t, unsigned) -> result<void>;
    auto encode_item(bool b, unsigned) -> result<void>;
    auto encode_item(std::int64_t i, unsigned) -> result<void>;
    auto encode_item(std::uint64_t u, unsigned) -> result<void>;
    auto encode_item(double d, unsigned) -> result<void>;
    auto encode_item(std::string const &s, unsigned) -> result<void>;
    auto encode_item(value::array const &a, unsigned depth) -> result<void>;
    auto encode_item(value::object const &o, unsigned depth) -> result<void>;
    auto encode_foreign(value const &v) -> result<void>;

    auto encode_string(std::string_view s) -> result<void>;

    option_set mOptions;
    output_buffer mBuffer;
    std::string mUnsupportedType;
};

/**
 * @brief Encodes @p root as a standalone document.
 */
auto dumps(value const &root, option_set options = option::none)
        -> result<std::string>;

} // namespace sjson
