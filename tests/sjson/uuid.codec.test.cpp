#include <sjson/uuid.codec.hpp>

#include <string>
#include <string_view>

#include <fmt/format.h>

#include <sjson/encoder.hpp>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace sjson_tests
{

using namespace std::string_view_literals;

namespace
{

struct derived_uuid : sjson::uuid
{
};

// an independent rendition of the canonical form based on the field split
auto reference_encoding(sjson::uuid const &id) -> std::string
{
    auto const f = sjson::to_fields(id);
    return fmt::format("\"{:08x}-{:04x}-{:04x}-{:02x}{:02x}-{:012x}\"",
                       f.time_low, f.time_mid, f.time_hi_version,
                       f.clock_seq_hi_variant, f.clock_seq_low, f.node);
}

auto encode(sjson::uuid const &id) -> std::string
{
    sjson::output_buffer out;
    sjson::encode_uuid(out, id);
    return fmt::to_string(out);
}

} // namespace

BOOST_AUTO_TEST_SUITE(uuid_codec)

BOOST_AUTO_TEST_CASE(recognize_requires_option)
{
    sjson::value const v = sjson::namespace_url;

    BOOST_TEST((sjson::recognize_uuid(v, sjson::option::none) == nullptr));
    BOOST_TEST((sjson::recognize_uuid(v, sjson::option::sort_keys) == nullptr));

    auto const *id = sjson::recognize_uuid(v, sjson::option::serialize_uuid);
    BOOST_TEST_REQUIRE((id != nullptr));
    BOOST_TEST(*id == sjson::namespace_url);
}

BOOST_AUTO_TEST_CASE(recognize_rejects_derived_type)
{
    sjson::value const v = derived_uuid{};
    BOOST_TEST((sjson::recognize_uuid(v, sjson::option::serialize_uuid)
                == nullptr));
}

BOOST_AUTO_TEST_CASE(recognize_rejects_builtin_kinds)
{
    using sjson::option;
    sjson::value const text{"6ba7b811-9dad-11d1-80b4-00c04fd430c8"};
    sjson::value const null{};
    sjson::value const number{42};

    BOOST_TEST((sjson::recognize_uuid(text, option::serialize_uuid)
                == nullptr));
    BOOST_TEST((sjson::recognize_uuid(null, option::serialize_uuid)
                == nullptr));
    BOOST_TEST((sjson::recognize_uuid(number, option::serialize_uuid)
                == nullptr));
}

BOOST_AUTO_TEST_CASE(encode_emits_38_bytes)
{
    sjson::output_buffer out;
    sjson::encode_uuid(out, sjson::namespace_dns);
    BOOST_TEST(out.size() == sjson::encoded_uuid_size);
    BOOST_TEST(fmt::to_string(out)
               == "\"6ba7b810-9dad-11d1-80b4-00c04fd430c8\""sv);
}

BOOST_AUTO_TEST_CASE(encode_appends)
{
    sjson::output_buffer out;
    out.push_back('[');
    sjson::encode_uuid(out, sjson::namespace_oid);
    out.push_back(',');
    sjson::encode_uuid(out, sjson::namespace_x500);
    out.push_back(']');
    BOOST_TEST(fmt::to_string(out)
               == R"(["6ba7b812-9dad-11d1-80b4-00c04fd430c8",)"
                  R"("6ba7b814-9dad-11d1-80b4-00c04fd430c8"])"sv);
}

BOOST_AUTO_TEST_CASE(encode_nil)
{
    BOOST_TEST(encode(sjson::uuid{})
               == "\"00000000-0000-0000-0000-000000000000\""sv);
}

BOOST_AUTO_TEST_CASE(encode_max)
{
    sjson::uint128 const all = ~sjson::uint128{0U};
    auto const max = sjson::uuid_from_integer(all);
    BOOST_TEST(encode(max) == "\"ffffffff-ffff-ffff-ffff-ffffffffffff\""sv);
}

BOOST_AUTO_TEST_CASE(encode_keeps_leading_zeroes)
{
    auto const id = sjson::uuid_from_integer(
            sjson::uint128{"0x00345678123456781234567812345678"});
    BOOST_TEST(encode(id) == "\"00345678-1234-5678-1234-567812345678\""sv);

    auto const tiny = sjson::uuid_from_integer(sjson::uint128{1U});
    BOOST_TEST(encode(tiny) == "\"00000000-0000-0000-0000-000000000001\""sv);
}

BOOST_AUTO_TEST_CASE(encode_matches_independent_formatting)
{
    test_rng rng;
    for (int i = 0; i < 1024; ++i)
    {
        auto const id = sjson::uuid_v4(rng);
        auto const encoded = encode(id);
        BOOST_TEST_REQUIRE(encoded.size() == sjson::encoded_uuid_size);
        BOOST_TEST(encoded == reference_encoding(id));
        BOOST_TEST(encoded == "\"" + uuids::to_string(id) + "\"");
    }
}

BOOST_AUTO_TEST_CASE(encode_is_deterministic)
{
    test_rng rng;
    auto const id = sjson::uuid_v4(rng);
    BOOST_TEST(encode(id) == encode(id));
}

BOOST_AUTO_TEST_CASE(canonical_string_matches_encoding)
{
    test_rng rng;
    auto const id = sjson::uuid_v4(rng);
    BOOST_TEST("\"" + sjson::canonical_string(id) + "\"" == encode(id));
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace sjson_tests
