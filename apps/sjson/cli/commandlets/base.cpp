#include "sjson/cli/commandlets/base.hpp"

#include <cstdio>

namespace sjson::cli
{

auto encode_options::to_option_set() const noexcept -> option_set
{
    option_set options{};
    if (serializeUuid)
    {
        options |= option::serialize_uuid;
    }
    if (sortKeys)
    {
        options |= option::sort_keys;
    }
    if (appendNewline)
    {
        options |= option::append_newline;
    }
    if (strictInteger)
    {
        options |= option::strict_integer;
    }
    return options;
}

auto encode_options::print(value const &document, option_set implied) const
        -> result<void>
{
    encoder enc(to_option_set() | implied);
    if (result<void> rx = enc.encode(document); rx.has_failure())
    {
        fmt::print(stderr, "Command execution failed: {}\n",
                   enc.describe_failure(rx.assume_error()));
        return cli_errc::exit_error;
    }

    fmt::print("{}", enc.view());
    if (!enc.options().test(option::append_newline))
    {
        fmt::print("\n");
    }
    return oc::success();
}

} // namespace sjson::cli
