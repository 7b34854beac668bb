// SPDX-License-Identifier: MIT
#include <boost/test/unit_test.hpp>

#include <idlkit/crypto/base58.hpp>
#include <idlkit/crypto/hex.hpp>
#include <idlkit/crypto/sha256.hpp>
#include <idlkit/exception/exception.hpp>
#include <idlkit/io/json.hpp>
#include <idlkit/string.hpp>
#include <idlkit/utf8.hpp>
#include <idlkit/variant_object.hpp>

#include <limits>

using namespace idlkit;

BOOST_AUTO_TEST_SUITE(variant_tests)

//=============================================================================
// variant / variant_object
//=============================================================================

BOOST_AUTO_TEST_CASE(test_object_keeps_insertion_order) {
   variant v = mutable_variant_object("zeta", 1)("alpha", 2)("mid", 3);
   std::vector<std::string> keys;
   for (const auto& e : v.get_object())
      keys.push_back(e.key());
   BOOST_REQUIRE_EQUAL(keys.size(), 3u);
   BOOST_CHECK_EQUAL(keys[0], "zeta");
   BOOST_CHECK_EQUAL(keys[1], "alpha");
   BOOST_CHECK_EQUAL(keys[2], "mid");
}

BOOST_AUTO_TEST_CASE(test_set_replaces_existing_key) {
   mutable_variant_object obj("a", 1);
   obj.set("a", "two");
   BOOST_CHECK_EQUAL(obj.size(), 1u);
   BOOST_CHECK_EQUAL(obj["a"].get_string(), "two");
}

BOOST_AUTO_TEST_CASE(test_numeric_casts) {
   variant neg(int64_t(-5));
   BOOST_CHECK_EQUAL(neg.as_int64(), -5);
   BOOST_CHECK_THROW(neg.as_uint64(), bad_cast_exception);

   variant big(std::numeric_limits<uint64_t>::max());
   BOOST_CHECK_THROW(big.as_int64(), bad_cast_exception);

   BOOST_CHECK_EQUAL(variant("42").as_uint64(), 42u);
   BOOST_CHECK_THROW(variant("forty").as_uint64(), bad_cast_exception);
   BOOST_CHECK_THROW(variant().get_object(), bad_cast_exception);
}

BOOST_AUTO_TEST_CASE(test_missing_key_throws) {
   variant v = mutable_variant_object("a", 1);
   BOOST_CHECK_THROW(v["b"], key_not_found_exception);
   BOOST_CHECK(v.get_object().contains("a"));
}

BOOST_AUTO_TEST_CASE(test_signed_and_unsigned_compare_equal) {
   BOOST_CHECK(variant(int64_t(7)) == variant(uint64_t(7)));
   BOOST_CHECK(variant(int64_t(-7)) != variant(uint64_t(7)));
}

//=============================================================================
// json
//=============================================================================

BOOST_AUTO_TEST_CASE(test_json_numbers) {
   auto v = json::from_string(R"({"a": 1, "b": -2, "c": 1.5, "d": 340282366920938463463374607431768211455})");
   BOOST_CHECK(v["a"].is_uint64());
   BOOST_CHECK(v["b"].is_int64());
   BOOST_CHECK(v["c"].is_double());
   BOOST_CHECK(v["d"].is_string());
   BOOST_CHECK_EQUAL(v["d"].get_string(), "340282366920938463463374607431768211455");
}

BOOST_AUTO_TEST_CASE(test_json_to_string) {
   variant v = mutable_variant_object("name", "a\"b")("list", variants{variant(1), variant(true), variant()});
   BOOST_CHECK_EQUAL(json::to_string(v), R"({"name":"a\"b","list":[1,true,null]})");
   BOOST_CHECK(json::from_string(json::to_pretty_string(v)) == v);
}

BOOST_AUTO_TEST_CASE(test_json_unicode_escape) {
   auto v = json::from_string(R"("\u00e9\ud83d\ude00")");
   BOOST_CHECK_EQUAL(v.get_string(), "\xc3\xa9\xf0\x9f\x98\x80");
}

BOOST_AUTO_TEST_CASE(test_json_parse_errors) {
   BOOST_CHECK_THROW(json::from_string("{\"a\": }"), parse_error_exception);
   BOOST_CHECK_THROW(json::from_string("[1, 2"), parse_error_exception);
   BOOST_CHECK_THROW(json::from_string("{} x"), parse_error_exception);
   BOOST_CHECK(!json::is_valid("nul"));
   BOOST_CHECK(json::is_valid("null"));
}

BOOST_AUTO_TEST_CASE(test_json_missing_file) {
   BOOST_CHECK_THROW(json::from_file("/nonexistent/idl.json"), file_not_found_exception);
}

//=============================================================================
// string helpers
//=============================================================================

BOOST_AUTO_TEST_CASE(test_snake_case) {
   BOOST_CHECK_EQUAL(to_snake_case("initialize"), "initialize");
   BOOST_CHECK_EQUAL(to_snake_case("updateConfig"), "update_config");
   BOOST_CHECK_EQUAL(to_snake_case("NFTMetadataUpdate"), "nft_metadata_update");
   BOOST_CHECK_EQUAL(to_snake_case("mintV1"), "mint_v1");
   BOOST_CHECK_EQUAL(to_snake_case("already_snake"), "already_snake");
}

BOOST_AUTO_TEST_CASE(test_split_and_trim) {
   auto parts = split("u8, Pubkey", ',');
   BOOST_REQUIRE_EQUAL(parts.size(), 2u);
   BOOST_CHECK_EQUAL(trim(parts[1]), "Pubkey");
   BOOST_CHECK_EQUAL(split("a:b:c", ':', 2).back(), "b:c");
   BOOST_CHECK_EQUAL(to_lower("PubKey"), "pubkey");
}

BOOST_AUTO_TEST_CASE(test_utf8_validation) {
   BOOST_CHECK(is_utf8("plain"));
   BOOST_CHECK(is_utf8("\xc3\xa9"));
   BOOST_CHECK_EQUAL(*find_invalid_utf8("ab\xff"), 2u);
   // overlong '/'
   BOOST_CHECK(!is_utf8("\xc0\xaf"));
   // surrogate
   BOOST_CHECK(!is_utf8("\xed\xa0\x80"));
   // truncated
   BOOST_CHECK(!is_utf8("\xe2\x82"));
}

//=============================================================================
// crypto helpers
//=============================================================================

BOOST_AUTO_TEST_CASE(test_sha256) {
   BOOST_CHECK_EQUAL(sha256::hash("abc").str(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

BOOST_AUTO_TEST_CASE(test_hex) {
   std::vector<uint8_t> bytes{0x00, 0xab, 0xff};
   BOOST_CHECK_EQUAL(to_hex(bytes), "00abff");
   BOOST_CHECK_EQUAL(to_hex(bytes, true), "0x00abff");
   BOOST_CHECK(from_hex("0x00abff") == bytes);
   BOOST_CHECK_THROW(from_hex("zz"), parse_error_exception);
}

BOOST_AUTO_TEST_CASE(test_base58) {
   std::vector<uint8_t> zeros(32, 0);
   BOOST_CHECK_EQUAL(to_base58(zeros), "11111111111111111111111111111111");
   BOOST_CHECK(from_base58("11111111111111111111111111111111") == zeros);
   BOOST_CHECK_THROW(from_base58("0OIl"), parse_error_exception);
}

BOOST_AUTO_TEST_SUITE_END()
