#include "sjson/cli/commandlets/uuid.hpp"

#include <cstdio>

#include <fmt/core.h>

#include <sjson/uuid.hpp>

namespace sjson::cli
{

static_assert(commandlet<encode_uuids>);

auto encode_uuids::exec(lyra::group const &) const -> result<void>
{
    value::array ids;
    ids.reserve(mTexts.size());

    for (auto const &text : mTexts)
    {
        auto parsed = uuid_from_string(text);
        if (parsed.has_failure())
        {
            fmt::print(stderr, "Command execution failed: {}: \"{}\"\n",
                       parsed.assume_error().message().c_str(), text);
            return cli_errc::exit_error;
        }
        ids.emplace_back(parsed.assume_value());
    }

    return mEncodeOptions.print(value(std::move(ids)));
}

} // namespace sjson::cli
