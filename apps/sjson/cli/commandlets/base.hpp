#pragma once

#include <concepts>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include <sjson/encoder.hpp>
#include <sjson/options.hpp>
#include <sjson/value.hpp>

#include "sjson/cli/error.hpp"

// fmt 9.0.0
#if FMT_VERSION >= 9'00'00
template <>
struct fmt::formatter<lyra::parser> : fmt::ostream_formatter
{
};
template <>
struct fmt::formatter<lyra::group> : fmt::ostream_formatter
{
};
#endif

namespace sjson::cli
{

struct encode_options
{
public:
    bool serializeUuid{false};
    bool sortKeys{false};
    bool appendNewline{false};
    bool strictInteger{false};

    template <typename Parser>
    explicit encode_options(Parser &cmd)
    {
        using namespace std::string_literals;

        cmd.add_argument(lyra::opt(serializeUuid)["--serialize-uuid"].help(
                "Encode uuids as their canonical string. Without it uuids "
                "are rejected as unsupported type."s));
        cmd.add_argument(lyra::opt(sortKeys)["--sort-keys"].help(
                "Emit object members ordered by key."s));
        cmd.add_argument(lyra::opt(appendNewline)["--append-newline"].help(
                "Terminate the document with a line feed."s));
        cmd.add_argument(lyra::opt(strictInteger)["--strict-integer"].help(
                "Reject integers outside of the 53-bit range."s));
    }

    [[nodiscard]] auto to_option_set() const noexcept -> option_set;

    /**
     * @brief Encodes the document and writes it to stdout.
     *
     * Encode failures are printed to stderr and reported as
     * cli_errc::exit_error.
     *
     * @param implied options which are enabled regardless of the cli flags
     */
    auto print(value const &document, option_set implied = option::none) const
            -> result<void>;
};

// clang-format off
template <typename T>
concept commandlet
    = std::constructible_from<T, lyra::cli &, encode_options &>
    && requires(T &&t, lyra::group const &g)
    {
        { T::name } -> std::convertible_to<std::string_view>;
        { t.exec(g) } -> std::same_as<result<void>>;
    };
// clang-format on

template <typename T>
struct commandlet_base
{
protected:
    lyra::command cmd;

    commandlet_base()
        : cmd(std::string(T::name),
              [self = static_cast<T *>(this)](lyra::group const &g)
              {
                  if (result<void> rx = self->exec(g); rx.has_failure())
                  {
                      if (rx.assume_error() != cli_errc::exit_error)
                      {
                          fmt::print(stderr,
                                     "Command execution failed: {}\n{}\n",
                                     rx.assume_error().message().c_str(), g);
                      }

                      cli_code{cli_errc::exit_error}.throw_exception();
                  }
              })
    {
    }
};

} // namespace sjson::cli
