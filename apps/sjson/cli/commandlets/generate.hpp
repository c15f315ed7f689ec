#pragma once

#include <string>
#include <string_view>

#include <lyra/lyra.hpp>

#include <sjson/value.hpp>

#include "sjson/cli/commandlets/base.hpp"
#include "sjson/cli/error.hpp"

namespace sjson::cli
{

inline constexpr unsigned max_generate_count = 1'000'000U;

struct generate_parameters
{
    unsigned count{1U};
    //! 0 selects 5 for name based and 4 for random uuids
    unsigned version{0U};
    std::string nameSpace;
    std::string name;
};

/**
 * @brief Generates the uuids described by @p params.
 *
 * A name or a name space selects a single name based uuid, otherwise
 * params.count time based or random uuids are generated.
 *
 * @return cli_errc::count_too_large if params.count exceeds
 *         max_generate_count
 */
auto generate_uuids(generate_parameters const &params)
        -> result<value::array>;

class generate : public commandlet_base<generate>
{
    encode_options &mEncodeOptions;
    generate_parameters mParameters;

public:
    generate(lyra::cli &parser, encode_options &encodeOptions)
        : commandlet_base<generate>()
        , mEncodeOptions(encodeOptions)
        , mParameters()
    {
        cmd.help("generate uuids and print them as a JSON array, uuid "
                 "serialization is always enabled");
        cmd.add_argument(
                lyra::opt(mParameters.count, "n")["-n"]["--count"].help(
                        "The number of random uuids to generate."));
        cmd.add_argument(
                lyra::opt(mParameters.version, "v")["--uuid-version"].help(
                        "1 or 4 for random uuids, 3 or 5 for name based "
                        "uuids."));
        cmd.add_argument(
                lyra::opt(mParameters.nameSpace, "ns")["--namespace"].help(
                        "Generate a name based uuid in one of the dns, url, "
                        "oid or x500 name spaces. Defaults to dns if --name "
                        "is given."));
        cmd.add_argument(lyra::opt(mParameters.name, "name")["--name"].help(
                "The name of the name based uuid."));

        parser |= cmd;
    }
    static constexpr std::string_view name = "generate";

    auto exec(lyra::group const &) const -> result<void>;
};

} // namespace sjson::cli
