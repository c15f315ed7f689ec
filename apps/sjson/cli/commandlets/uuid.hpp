#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <lyra/lyra.hpp>

#include "sjson/cli/commandlets/base.hpp"
#include "sjson/cli/error.hpp"

namespace sjson::cli
{

class encode_uuids : public commandlet_base<encode_uuids>
{
    encode_options &mEncodeOptions;
    std::vector<std::string> mTexts;

public:
    encode_uuids(lyra::cli &parser, encode_options &encodeOptions)
        : commandlet_base<encode_uuids>()
        , mEncodeOptions(encodeOptions)
        , mTexts()
    {
        cmd.help("parse uuid texts and print them as a JSON array");

        cmd.add_argument(lyra::literal("--"));
        cmd.add_argument(lyra::arg(mTexts, "uuid").required());

        parser |= cmd;
    }
    static constexpr std::string_view name = "uuid";

    auto exec(lyra::group const &) const -> result<void>;
};

} // namespace sjson::cli
