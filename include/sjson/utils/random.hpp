#pragma once

#include <cstdint>

#include <limits>

namespace sjson::utils
{
// adapted from http://xoroshiro.di.unimi.it/splitmix64.c
class splitmix64
{
public:
    using result_type = std::uint64_t;

    splitmix64() = delete;
    constexpr explicit splitmix64(std::uint64_t init) noexcept
        : s(init)
    {
    }

    constexpr auto operator()() noexcept -> result_type
    {
        std::uint64_t z = (s += 0x9E3779B97F4A7C15ull);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
        return z ^ (z >> 31);
    }

    static constexpr auto min() noexcept -> result_type
    {
        return std::numeric_limits<result_type>::min();
    }
    static constexpr auto max() noexcept -> result_type
    {
        return std::numeric_limits<result_type>::max();
    }

private:
    std::uint64_t s;
};

// adapted from http://xoroshiro.di.unimi.it/xoroshiro128plus.c
class xoroshiro128plus
{
public:
    using result_type = std::uint64_t;

    xoroshiro128plus() = delete;
    constexpr explicit xoroshiro128plus(std::uint64_t init) noexcept
        : s{}
    {
        // as advised by http://xoroshiro.di.unimi.it/xoroshiro128plus.c
        splitmix64 spreader(init);
        s[0] = spreader();
        s[1] = spreader();
    }
    constexpr xoroshiro128plus(std::uint64_t s1, std::uint64_t s2) noexcept
        : s{s1, s2}
    {
    }

    //! seeds from two draws of a 32-bit source like std::random_device
    template <typename SeedSource>
    static auto seeded_from(SeedSource &source) -> xoroshiro128plus
    {
        std::uint64_t const hi = source();
        std::uint64_t const lo = source();
        return xoroshiro128plus((hi << 32) ^ lo);
    }

    constexpr auto operator()() noexcept -> result_type
    {
        std::uint64_t const s0 = s[0];
        std::uint64_t s1 = s[1];
        std::uint64_t const result = s0 + s1;

        s1 ^= s0;
        s[0] = rotl(s0, 55) ^ s1 ^ (s1 << 14); // a, b
        s[1] = rotl(s1, 36);                   // c

        return result;
    }

    static constexpr auto min() noexcept -> result_type
    {
        return std::numeric_limits<result_type>::min();
    }
    static constexpr auto max() noexcept -> result_type
    {
        return std::numeric_limits<result_type>::max();
    }

private:
    static constexpr auto rotl(std::uint64_t const x, int k) noexcept
            -> std::uint64_t
    {
        return (x << k) | (x >> (64 - k));
    }

    std::uint64_t s[2];
};
} // namespace sjson::utils
