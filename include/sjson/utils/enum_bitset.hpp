// Copyright 2016-2017 Henrik Steffen Gaßmann
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// Limitations under the License.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <type_traits>

namespace sjson
{

template <typename E>
auto allow_enum_bitset(E &&) -> std::false_type;

template <typename E>
constexpr bool enum_bitsets_allowed
        = std::is_enum_v<E>
          && decltype(allow_enum_bitset(std::declval<E>()))::value;

/**
 * Immutable set of flags of an opted in enum type.
 * @tparam E enum that is wrapped
 */
template <typename E>
class enum_bitset
{
public:
    static_assert(enum_bitsets_allowed<E>);

    using enum_type = E;
    using underlying_type = std::underlying_type_t<enum_type>;

    constexpr enum_bitset() noexcept = default;
    constexpr enum_bitset(enum_type value) noexcept
        : mValue(static_cast<underlying_type>(value))
    {
    }
    constexpr explicit enum_bitset(underlying_type value) noexcept
        : mValue(value)
    {
    }

    constexpr explicit operator bool() const noexcept
    {
        return mValue != underlying_type{};
    }

    [[nodiscard]] constexpr auto value() const noexcept -> underlying_type
    {
        return mValue;
    }

    constexpr auto operator==(enum_bitset const &) const noexcept -> bool
            = default;

    /**
     * @brief true if all flags of @p flags are contained in this set.
     */
    [[nodiscard]] constexpr auto test(enum_bitset flags) const noexcept -> bool
    {
        return (mValue & flags.mValue) == flags.mValue;
    }

    constexpr auto operator&(enum_bitset rhs) const noexcept -> enum_bitset
    {
        return enum_bitset{static_cast<underlying_type>(mValue & rhs.mValue)};
    }
    constexpr auto operator&=(enum_bitset rhs) noexcept -> enum_bitset &
    {
        mValue &= rhs.mValue;
        return *this;
    }

    constexpr auto operator|(enum_bitset rhs) const noexcept -> enum_bitset
    {
        return enum_bitset{static_cast<underlying_type>(mValue | rhs.mValue)};
    }
    constexpr auto operator|=(enum_bitset rhs) noexcept -> enum_bitset &
    {
        mValue |= rhs.mValue;
        return *this;
    }

    constexpr auto operator~() const noexcept -> enum_bitset
    {
        return enum_bitset{static_cast<underlying_type>(~mValue)};
    }

private:
    underlying_type mValue{};
};

template <class E, std::enable_if_t<enum_bitsets_allowed<E>, int> = 0>
constexpr auto operator|(E lhs, E rhs) noexcept -> enum_bitset<E>
{
    return enum_bitset<E>{lhs} | enum_bitset<E>{rhs};
}
template <class E, std::enable_if_t<enum_bitsets_allowed<E>, int> = 0>
constexpr auto operator|(E lhs, enum_bitset<E> rhs) noexcept -> enum_bitset<E>
{
    return rhs | lhs;
}

template <class E, std::enable_if_t<enum_bitsets_allowed<E>, int> = 0>
constexpr auto operator&(E lhs, E rhs) noexcept -> enum_bitset<E>
{
    return enum_bitset<E>{lhs} & enum_bitset<E>{rhs};
}
template <class E, std::enable_if_t<enum_bitsets_allowed<E>, int> = 0>
constexpr auto operator&(E lhs, enum_bitset<E> rhs) noexcept -> enum_bitset<E>
{
    return rhs & lhs;
}

} // namespace sjson
