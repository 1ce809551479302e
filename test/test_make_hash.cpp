#include "hash/make_hash.hpp"
#include "value.hpp"

#include <gtest/gtest.h>
#include <limits.h>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace phash;
using phash::hash::hash_options;

// Known digests shared with other implementations of the same tag scheme.
constexpr const char *NONE_HASH = "1729486cc7e56a6383542b1ec73125ccb26093651a5da05e04657ac416a74b8f";
constexpr const char *DICT_HASH = "016368a8223b04f533191286bf0a59262db10bcd53a1f80549feb63f9b7f5252";

value
datetime(const int year, const int month, const int day, const int hour, const int minute,
         const int second, const uint32_t microseconds, std::optional<int32_t> utc_offset = std::nullopt)
{
  value v;
  EXPECT_EQ(make_datetime(v, year, month, day, hour, minute, second, microseconds, utc_offset), 0);
  return v;
}

class MakeHashTest: public ::testing::Test {
  protected:
  std::string
  hash_of(const value &v, const hash_options &options = {})
  {
    std::string hex;
    EXPECT_EQ(hash::make_hash(hex, v, options), 0);
    return hex;
  }
};

TEST_F(MakeHashTest, ScalarKnownAnswers)
{
  EXPECT_EQ(hash_of(make_none()), NONE_HASH);
  EXPECT_EQ(hash_of(make_str("1")), "12de1ce9dedee6a1a592852bb0f5b5e61234bb597c5655e86d9a5425e2c3a179");
  EXPECT_EQ(hash_of(make_int(1)), "d8cffbe8ffe33b22c5801736accf706528a2e4d4e1a0d914a538d5aae244cfda");
  EXPECT_EQ(hash_of(make_float(1.0)), "1d0f1a46ffdc8a21e16bc10def17557a7b41cde473ee242a69d9e00a0d1b85e1");
  EXPECT_EQ(hash_of(make_bool(true)), "31ad5fa163a0c478d966c7f7568f3248f0c58d294372b2e8f7cb0560d8c8b12f");
  EXPECT_EQ(hash_of(make_complex(1.5, -2)), "8a7a11da86a130c6573582d4adea89975552287aed8d04b89e09684d21641d87");
}

TEST_F(MakeHashTest, ContainerKnownAnswers)
{
  EXPECT_EQ(hash_of(make_list({})), "f2ce9493ade032d30426dde7a1ece1a48adfb0e7babaf3b7cdca7a1402129d1a");
  EXPECT_EQ(hash_of(make_list({make_int(1), make_int(2), make_int(3)})),
            "b6b13d50e3bee7e58371af2b303f629edf32d1be2f7717c9d14193b4b8b23e04");
  EXPECT_EQ(hash_of(make_set({make_int(1), make_int(2), make_int(3)})),
            "a11cff8e62b57e1aefb7de908bd50096816b66796eb7e11ad78edeaf2629f89c");
  EXPECT_EQ(hash_of(make_dict({{"b", make_int(1)}, {"a", make_int(2)}})), DICT_HASH);
  EXPECT_EQ(hash_of(make_odict({{"b", make_int(1)}, {"a", make_int(2)}})),
            "c92879f299724eefb1eeb787a542a183340423d3ebb69b8c22a52b844f1ab9ec");
}

TEST_F(MakeHashTest, NestedKnownAnswer)
{
  const value v = make_dict({
      {"a", make_list({make_int(1), make_float(2.5), make_none()})},
      {"b", make_dict({{"c", make_bool(true)}})},
      {"d", make_str("x")},
  });
  EXPECT_EQ(hash_of(v), "c5571e2f8b2b8f35971a99a3167d0639991517fd1222b53f3368c12ebe495429");

  uuid_bytes zero{};
  const value mixed = make_list({
      make_odict({{"x", make_float(1.5)}}),
      make_set({make_int(3)}),
      make_bytes({'a', 'b'}),
      make_str("h\xc3\xa9llo"),
      make_int(-42),
      make_complex(0, 1),
      make_uuid(zero),
  });
  EXPECT_EQ(hash_of(mixed), "f07ae9921211cf00fbf5b05ff53b976202431abb55ac46425448461e2cf4c3e8");
}

TEST_F(MakeHashTest, Determinism)
{
  const value v = make_dict({{"k", make_set({make_str("a"), make_float(0.25)})}});
  EXPECT_EQ(hash_of(v), hash_of(v));
}

// hash({"b": 1, "a": 2}) == hash({"a": 2, "b": 1})
TEST_F(MakeHashTest, UnorderedMappingIgnoresKeyOrder)
{
  EXPECT_EQ(hash_of(make_dict({{"b", make_int(1)}, {"a", make_int(2)}})),
            hash_of(make_dict({{"a", make_int(2)}, {"b", make_int(1)}})));
}

// hash([1, 2, 3]) != hash([3, 2, 1])
TEST_F(MakeHashTest, SequenceIsOrderSensitive)
{
  EXPECT_NE(hash_of(make_list({make_int(1), make_int(2), make_int(3)})),
            hash_of(make_list({make_int(3), make_int(2), make_int(1)})));
}

// hash({1, 2, 3}) == hash({3, 1, 2})
TEST_F(MakeHashTest, SetIgnoresElementOrder)
{
  EXPECT_EQ(hash_of(make_set({make_int(1), make_int(2), make_int(3)})),
            hash_of(make_set({make_int(3), make_int(1), make_int(2)})));
}

TEST_F(MakeHashTest, SetCollapsesEqualElements)
{
  EXPECT_EQ(hash_of(make_set({make_int(1), make_int(1), make_int(2)})),
            hash_of(make_set({make_int(2), make_int(1)})));
}

TEST_F(MakeHashTest, OrderedMappingIsOrderSensitive)
{
  const value ba = make_odict({{"b", make_int(1)}, {"a", make_int(2)}});
  const value ab = make_odict({{"a", make_int(2)}, {"b", make_int(1)}});
  EXPECT_NE(hash_of(ba), hash_of(ab));

  // An ordered mapping is never confused with the unordered mapping of the same entries.
  EXPECT_NE(hash_of(ba), DICT_HASH);
}

TEST_F(MakeHashTest, OrderedMappingAsUnordered)
{
  hash_options options;
  options.treat_ordered_map_as_unordered = true;

  const value ba = make_odict({{"b", make_int(1)}, {"a", make_int(2)}});
  const value ab = make_odict({{"a", make_int(2)}, {"b", make_int(1)}});
  EXPECT_EQ(hash_of(ba, options), DICT_HASH);
  EXPECT_EQ(hash_of(ab, options), DICT_HASH);
}

TEST_F(MakeHashTest, RepeatedKeysKeepLastValue)
{
  EXPECT_EQ(hash_of(make_dict({{"a", make_int(1)}, {"a", make_int(2)}, {"b", make_int(1)}})), DICT_HASH);
}

// hash("1") != hash(1) != hash(1.0) != hash(true)
TEST_F(MakeHashTest, TypeTagSeparation)
{
  const std::vector<std::string> hashes = {
      hash_of(make_str("1")),
      hash_of(make_int(1)),
      hash_of(make_float(1.0)),
      hash_of(make_bool(true)),
      hash_of(make_list({make_int(1)})),
      hash_of(make_set({make_int(1)})),
  };

  for (size_t i = 0; i < hashes.size(); i++)
    for (size_t j = i + 1; j < hashes.size(); j++)
      EXPECT_NE(hashes[i], hashes[j]) << i << " vs " << j;
}

TEST_F(MakeHashTest, BytesHashLikeText)
{
  EXPECT_EQ(hash_of(make_bytes({'1'})), hash_of(make_str("1")));
  EXPECT_EQ(hash_of(make_bytes({'h', 0xc3, 0xa9})), hash_of(make_str("h\xc3\xa9")));
}

TEST_F(MakeHashTest, FloatPrecisionRounding)
{
  hash_options six;
  six.float_precision = 6;
  hash_options twelve;
  twelve.float_precision = 12;

  EXPECT_EQ(hash_of(make_float(1.0000000001), six), hash_of(make_float(1.0), six));
  EXPECT_NE(hash_of(make_float(1.0000000001), twelve), hash_of(make_float(1.0), twelve));

  // Representation noise disappears at the default precision.
  EXPECT_EQ(hash_of(make_float(0.1 + 0.2)), hash_of(make_float(0.3)));
}

TEST_F(MakeHashTest, ComplexUsesFloatPrecision)
{
  hash_options six;
  six.float_precision = 6;
  EXPECT_EQ(hash_of(make_complex(1.0000000001, 2), six), hash_of(make_complex(1, 2.0000000001), six));
  EXPECT_NE(hash_of(make_complex(1, 2)), hash_of(make_complex(2, 1)));
}

TEST_F(MakeHashTest, Timestamps)
{
  const std::string naive = hash_of(datetime(2020, 1, 2, 3, 4, 5, 678900));
  EXPECT_EQ(naive, "2a42d5acc7230b46f66f2811aa34393d8a112a3756756935efc1e94f4f606bbe");

  // The same instant expressed in another zone.
  EXPECT_EQ(hash_of(datetime(2020, 1, 2, 5, 4, 5, 678900, 7200)), naive);
  EXPECT_EQ(hash_of(datetime(2020, 1, 2, 3, 4, 5, 678900, 0)), naive);
  EXPECT_NE(hash_of(datetime(2020, 1, 2, 3, 4, 5, 678900, 3600)), naive);

  EXPECT_EQ(hash_of(datetime(1969, 12, 31, 23, 59, 59, 500000)),
            "a01879a0df7fcfbaf64e4674ebf9a0ce4e7b6cf3f5b8ad036d0b8e4f227ace0a");
}

TEST_F(MakeHashTest, DatetimeFieldsAreRangeChecked)
{
  value v = make_none();
  EXPECT_EQ(make_datetime(v, 2020, 13, 1), -1);
  EXPECT_EQ(make_datetime(v, 2021, 2, 29), -1);
  EXPECT_EQ(make_datetime(v, 2020, 1, 0), -1);
  EXPECT_EQ(make_datetime(v, 2020, 1, 1, 24, 0, 0), -1);
  EXPECT_EQ(make_datetime(v, 2020, 1, 1, 0, -1, 0), -1);
  EXPECT_EQ(make_datetime(v, 2020, 1, 1, 0, 0, 60), -1);
  EXPECT_EQ(make_datetime(v, 2020, 1, 1, 0, 0, 0, 1000000), -1);
  EXPECT_EQ(make_datetime(v, 2020, 1, 1, 0, 0, 0, 0, 86400), -1);
  EXPECT_EQ(make_datetime(v, INT_MAX, 1, 1), -1);
  EXPECT_EQ(make_datetime(v, 0, 1, 1), -1);
  EXPECT_TRUE(std::holds_alternative<none_t>(v.data));

  ASSERT_EQ(make_datetime(v, 9999, 12, 31, 23, 59, 59, 999999, -86399), 0);
  EXPECT_TRUE(std::holds_alternative<timestamp>(v.data));
}

TEST_F(MakeHashTest, Uuid)
{
  uuid_bytes id;
  ASSERT_EQ(parse_uuid(id, "12345678-1234-5678-1234-567812345678"), 0);
  EXPECT_EQ(hash_of(make_uuid(id)), "2b3b884c3bfd03875667883b3fad6368b4b714d0ec3957c071510fba46b5bb7e");
}

TEST_F(MakeHashTest, CollectedDigestsBracketContainers)
{
  std::vector<hash::h32> digests;
  ASSERT_EQ(hash::collect_digests(digests, make_list({make_int(1), make_list({})})), 0);

  // list( 1 list( ) )
  ASSERT_EQ(digests.size(), 5u);
  EXPECT_EQ(digests[2], digests[0]);
  EXPECT_EQ(digests[3], digests[4]);
}

TEST_F(MakeHashTest, UnhashableType)
{
  std::string hex = "untouched";
  EXPECT_EQ(hash::make_hash(hex, make_opaque("socket")), hash::UNHASHABLE_TYPE);
  EXPECT_EQ(hex, "untouched");

  // The failure propagates out of containers.
  const value nested = make_dict({{"a", make_list({make_int(1), make_opaque("socket")})}});
  EXPECT_EQ(hash::make_hash(hex, nested), hash::UNHASHABLE_TYPE);
  EXPECT_EQ(hash::make_hash(hex, make_set({make_opaque("socket")})), hash::UNHASHABLE_TYPE);
  EXPECT_EQ(hex, "untouched");
}

TEST_F(MakeHashTest, InvalidPrecision)
{
  hash_options options;
  options.float_precision = 0;

  std::string hex;
  EXPECT_EQ(hash::make_hash(hex, make_float(1.0), options), hash::INVALID_OPTIONS);
}

TEST_F(MakeHashTest, PrecisionUpperBound)
{
  hash_options options;
  options.float_precision = hash::MAX_FLOAT_PRECISION;
  EXPECT_NE(hash_of(make_float(1.5), options), hash_of(make_float(2.5), options));

  // Reals never collapse into one digest when they cannot be rendered.
  options.float_precision = INT_MAX;
  std::string hex = "untouched";
  EXPECT_EQ(hash::make_hash(hex, make_float(1.5), options), hash::INVALID_OPTIONS);
  EXPECT_EQ(hash::make_hash(hex, make_complex(1.5, 2.5), options), hash::INVALID_OPTIONS);
  EXPECT_EQ(hex, "untouched");
}

TEST_F(MakeHashTest, ErrorStrings)
{
  EXPECT_STREQ(hash::error_to_string(hash::UNHASHABLE_TYPE), "unhashable type");
  EXPECT_STREQ(hash::error_to_string(hash::IO_FAILURE), "io failure");
  EXPECT_STREQ(hash::error_to_string(42), "unknown error");
}

} // namespace
