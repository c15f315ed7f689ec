#include "sjson/cli/commandlets/generate.hpp"

#include <random>

#include <sjson/utils/random.hpp>
#include <sjson/uuid.hpp>

namespace sjson::cli
{

static_assert(commandlet<generate>);

namespace
{

auto lookup_namespace(std::string_view name) noexcept -> uuid const *
{
    using namespace std::string_view_literals;
    if (name.empty() || name == "dns"sv)
    {
        return &namespace_dns;
    }
    if (name == "url"sv)
    {
        return &namespace_url;
    }
    if (name == "oid"sv)
    {
        return &namespace_oid;
    }
    if (name == "x500"sv)
    {
        return &namespace_x500;
    }
    return nullptr;
}

auto name_based_uuid(generate_parameters const &params) -> result<uuid>
{
    auto const *nameSpace = lookup_namespace(params.nameSpace);
    if (nameSpace == nullptr)
    {
        return cli_errc::unknown_namespace;
    }
    switch (params.version)
    {
    case 0U:
    case 5U:
        return uuid_v5(*nameSpace, params.name);
    case 3U:
        return uuid_v3(*nameSpace, params.name);
    default:
        return cli_errc::unsupported_uuid_version;
    }
}

} // namespace

auto generate_uuids(generate_parameters const &params)
        -> result<value::array>
{
    value::array ids;

    if (!params.name.empty() || !params.nameSpace.empty())
    {
        SJSON_TRY(auto &&id, name_based_uuid(params));
        ids.emplace_back(id);
        return ids;
    }

    if (params.count > max_generate_count)
    {
        return cli_errc::count_too_large;
    }
    if (params.version != 0U && params.version != 1U && params.version != 4U)
    {
        return cli_errc::unsupported_uuid_version;
    }

    std::random_device seeder;
    auto rng = utils::xoroshiro128plus::seeded_from(seeder);

    ids.reserve(params.count);
    for (unsigned i = 0U; i < params.count; ++i)
    {
        ids.emplace_back(params.version == 1U ? uuid_v1(rng) : uuid_v4(rng));
    }
    return ids;
}

auto generate::exec(lyra::group const &) const -> result<void>
{
    SJSON_TRY(auto &&ids, generate_uuids(mParameters));

    return mEncodeOptions.print(value(std::move(ids)), option::serialize_uuid);
}

} // namespace sjson::cli
