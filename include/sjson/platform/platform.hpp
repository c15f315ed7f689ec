#pragma once

#ifdef __GNUC__
#include <cxxabi.h>
#endif

#include <cstdlib>

#include <memory>
#include <string>
#include <string_view>
#include <typeinfo>

#include <fmt/format.h>

namespace sjson::detail
{
struct type_info_fmt
{
    std::type_info const &value;
};

/**
 * @brief Renders the human readable (demangled where the platform supports
 * it) name of a type.
 */
inline auto type_name(std::type_info const &type) -> std::string;
} // namespace sjson::detail

namespace fmt
{

template <>
struct formatter<sjson::detail::type_info_fmt>
{
    constexpr auto parse(format_parse_context &ctx) noexcept
    {
        return ctx.begin();
    }
    template <typename FormatContext>
    auto format(sjson::detail::type_info_fmt const &type,
                FormatContext &ctx) const
    {
#ifdef __GNUC__
        auto demangledResource = demangle(type.value);
        char const *demangledName = demangledResource
                                          ? demangledResource.get()
                                          : type.value.name();
#else
        auto demangledName = type.value.name();
#endif

        auto out = ctx.out();
        if (std::string_view demangledNameView{demangledName};
            !demangledNameView.empty())
        {
            out = fmt::format_to(out, FMT_STRING("{}"), demangledNameView);
        }
        else
        {
            out = fmt::format_to(out, FMT_STRING("<unknown type>"));
        }

        return out;
    }

#ifdef __GNUC__
private:
    struct free_demangled
    {
        void operator()(char *resource) const noexcept
        {
            // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,cppcoreguidelines-owning-memory)
            ::free(resource);
        }
    };

    static auto demangle(std::type_info const &typeInfo)
            -> std::unique_ptr<char, free_demangled>
    {
        int status = 0;
        return std::unique_ptr<char, free_demangled>{abi::__cxa_demangle(
                typeInfo.name(), nullptr, nullptr, &status)};
    }
#endif
};

} // namespace fmt

inline auto sjson::detail::type_name(std::type_info const &type) -> std::string
{
    return fmt::format(FMT_STRING("{}"), type_info_fmt{type});
}
