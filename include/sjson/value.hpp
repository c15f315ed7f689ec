#pragma once

#include <cstddef>
#include <cstdint>

#include <any>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include <sjson/utils/misc.hpp>

namespace sjson
{

/**
 * @brief A host object which is not one of the built-in JSON kinds.
 *
 * The object is stored by its exact static type. Encoders decide by
 * comparing type() against the types they know, a derived type is never
 * treated as its base.
 */
class foreign
{
public:
    template <typename T>
        requires(!std::same_as<std::remove_cvref_t<T>, foreign>)
    explicit foreign(T &&object)
        : mObject(std::forward<T>(object))
    {
    }

    [[nodiscard]] auto type() const noexcept -> std::type_info const &
    {
        return mObject.type();
    }

    //! nullptr unless the stored object is exactly of type T
    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> T const *
    {
        return std::any_cast<T>(&mObject);
    }

private:
    std::any mObject;
};

class value;

namespace detail
{
template <typename T, typename U = std::remove_cvref_t<T>>
concept value_native
        = utils::any_of<U, value, foreign, std::nullptr_t, bool>
          || utils::integer<U> || utils::character<U>
          || std::floating_point<U>
          || std::convertible_to<T, std::string_view>
          || std::same_as<U, std::vector<value>>
          || std::same_as<U, std::vector<std::pair<std::string, value>>>;
} // namespace detail

/**
 * @brief A dynamically typed document tree.
 */
class value
{
public:
    using array = std::vector<value>;
    //! members in insertion order
    using object = std::vector<std::pair<std::string, value>>;

    using storage_type = std::variant<std::nullptr_t,
                                      bool,
                                      std::int64_t,
                                      std::uint64_t,
                                      double,
                                      std::string,
                                      array,
                                      object,
                                      foreign>;

    value() noexcept
        : mStorage(nullptr)
    {
    }
    value(std::nullptr_t) noexcept
        : mStorage(nullptr)
    {
    }
    value(bool b) noexcept
        : mStorage(b)
    {
    }
    template <utils::signed_integer T>
    value(T i) noexcept
        : mStorage(static_cast<std::int64_t>(i))
    {
    }
    template <utils::unsigned_integer T>
    value(T u) noexcept
        : mStorage(static_cast<std::uint64_t>(u))
    {
    }
    //! characters are neither numbers nor strings
    template <utils::character T>
    value(T) = delete;
    template <std::floating_point T>
    value(T d) noexcept
        : mStorage(static_cast<double>(d))
    {
    }
    value(std::string s) noexcept
        : mStorage(std::move(s))
    {
    }
    value(std::string_view s)
        : mStorage(std::string(s))
    {
    }
    value(char const *s)
        : mStorage(std::string(s))
    {
    }
    value(array a) noexcept
        : mStorage(std::move(a))
    {
    }
    value(object o) noexcept
        : mStorage(std::move(o))
    {
    }
    value(foreign f) noexcept
        : mStorage(std::move(f))
    {
    }
    //! stores any other type as a foreign object of its exact type
    template <typename T>
        requires(!detail::value_native<T>)
    value(T &&object)
        : mStorage(foreign(std::forward<T>(object)))
    {
    }

    [[nodiscard]] auto storage() const noexcept -> storage_type const &
    {
        return mStorage;
    }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> T const *
    {
        return std::get_if<T>(&mStorage);
    }

    [[nodiscard]] auto is_null() const noexcept -> bool
    {
        return std::holds_alternative<std::nullptr_t>(mStorage);
    }

private:
    storage_type mStorage;
};

} // namespace sjson
