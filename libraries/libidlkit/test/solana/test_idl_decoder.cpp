// SPDX-License-Identifier: MIT
#include <boost/test/unit_test.hpp>

#include <idlkit/io/json.hpp>
#include <idlkit/log/logger_config.hpp>
#include <idlkit/solana/idl_decoder.hpp>
#include <idlkit/solana/idl_exceptions.hpp>
#include <idlkit/solana/idl_format.hpp>
#include <idlkit/solana/solana_borsh.hpp>
#include <idlkit/variant_object.hpp>

#include <limits>
#include <thread>

#include <fmt/format.h>

using namespace idlkit;
using namespace idlkit::solana;
using namespace idlkit::solana::idl;

namespace {

schema_ptr prim(primitive_type p) {
   return schema_node::make_primitive(p);
}

/** Compiles every type of an IDL `types` array. */
struct compiled_types {
   explicit compiled_types(std::string_view types_json) {
      prog = parse_idl(json::from_string(fmt::format(R"({{"types": {}}})", types_json)));
      schema_compiler compiler(prog.symbols);
      types = compiler.compile_all();
   }

   decode_result decode(std::string_view name, const std::vector<uint8_t>& data) const {
      decode_context ctx;
      ctx.types = &types;
      return idl::decode(*types.at(std::string(name)), data, false, ctx);
   }

   program  prog;
   type_map types;
};

}  // namespace

BOOST_AUTO_TEST_SUITE(idl_decoder_tests)

//=============================================================================
// Primitives
//=============================================================================

BOOST_AUTO_TEST_CASE(test_worked_example) {
   auto schema = schema_node::make_struct("State", {{"admin", prim(primitive_type::pubkey)}, {"count", prim(primitive_type::u64)}});
   std::vector<uint8_t> data(32, 0);
   data.insert(data.end(), {42, 0, 0, 0, 0, 0, 0, 0});

   auto result = decode(*schema, data);
   BOOST_CHECK_EQUAL(result.end_offset, 40u);
   BOOST_CHECK_EQUAL(result.value["admin"].get<std::string>(), "11111111111111111111111111111111");
   BOOST_CHECK_EQUAL(result.value["count"].get<uint64_t>(), 42u);
   BOOST_CHECK_EQUAL(json::to_string(format_value(result.value)),
                     R"({"admin":"11111111111111111111111111111111","count":"42"})");
}

BOOST_AUTO_TEST_CASE(test_wide_integers_are_exact) {
   borsh::encoder enc;
   enc.write_u64(std::numeric_limits<uint64_t>::max());
   enc.write_i64(std::numeric_limits<int64_t>::min());
   enc.write_u128(std::numeric_limits<uint128>::max());
   enc.write_i128(-(int128(1) << 127));
   enc.write_u256(uint256(1) << 200);
   enc.write_i256(int256(-1));
   auto data = enc.finish();

   auto schema = schema_node::make_tuple({prim(primitive_type::u64), prim(primitive_type::i64),
                                          prim(primitive_type::u128), prim(primitive_type::i128),
                                          prim(primitive_type::u256), prim(primitive_type::i256)});
   auto result = decode(*schema, data);
   BOOST_CHECK_EQUAL(result.end_offset, data.size());

   const auto& v = result.value.children;
   BOOST_CHECK_EQUAL(v[0].to_decimal_string(), "18446744073709551615");
   BOOST_CHECK_EQUAL(v[1].to_decimal_string(), "-9223372036854775808");
   BOOST_CHECK_EQUAL(v[2].to_decimal_string(), "340282366920938463463374607431768211455");
   BOOST_CHECK_EQUAL(v[3].to_decimal_string(), "-170141183460469231731687303715884105728");
   BOOST_CHECK_EQUAL(v[4].to_decimal_string(),
                     "1606938044258990275541962092341162602522202993782792835301376");
   BOOST_CHECK_EQUAL(v[5].to_decimal_string(), "-1");

   auto formatted = format_value(result.value);
   BOOST_CHECK_EQUAL(formatted.get_array()[2].get_string(), "340282366920938463463374607431768211455");
}

BOOST_AUTO_TEST_CASE(test_narrow_integers_and_floats) {
   borsh::encoder enc;
   enc.write_u8(200);
   enc.write_i8(-3);
   enc.write_u32(70000);
   enc.write_i32(-70000);
   enc.write_f32(1.5f);
   enc.write_f64(-2.25);
   enc.write_bool(true);
   auto data = enc.finish();

   auto schema = schema_node::make_tuple({prim(primitive_type::u8), prim(primitive_type::i8),
                                          prim(primitive_type::u32), prim(primitive_type::i32),
                                          prim(primitive_type::f32), prim(primitive_type::f64),
                                          prim(primitive_type::bool_t)});
   auto value = decode(*schema, data).value;
   BOOST_CHECK_EQUAL(value.children[0].get<uint64_t>(), 200u);
   BOOST_CHECK_EQUAL(value.children[1].get<int64_t>(), -3);
   BOOST_CHECK_EQUAL(value.children[4].get<float>(), 1.5f);
   BOOST_CHECK(value.children[6].get<bool>());
   BOOST_CHECK_THROW(value.children[6].get<uint64_t>(), bad_cast_exception);
   BOOST_CHECK_THROW(value.children[4].to_decimal_string(), bad_cast_exception);

   BOOST_CHECK_EQUAL(json::to_string(format_value(value)), "[200,-3,70000,-70000,1.5,-2.25,true]");
}

BOOST_AUTO_TEST_CASE(test_invalid_bool) {
   std::vector<uint8_t> data{2};
   try {
      decode(*prim(primitive_type::bool_t), data);
      BOOST_FAIL("expected invalid_bool_exception");
   } catch (const invalid_bool_exception& e) {
      BOOST_CHECK_EQUAL(e.offset(), 0u);
      BOOST_CHECK_EQUAL(e.byte(), 2);
   }
}

//=============================================================================
// Containers
//=============================================================================

BOOST_AUTO_TEST_CASE(test_option) {
   auto schema = schema_node::make_option(prim(primitive_type::u32));

   std::vector<uint8_t> none{0};
   auto absent = decode(*schema, none);
   BOOST_CHECK(absent.value.is_null());
   BOOST_CHECK_EQUAL(absent.end_offset, 1u);
   BOOST_CHECK(format_value(absent.value).is_null());

   std::vector<uint8_t> some{1, 5, 0, 0, 0};
   auto present = decode(*schema, some);
   BOOST_CHECK_EQUAL(present.end_offset, 5u);
   BOOST_CHECK_EQUAL(format_value(present.value).as_uint64(), 5u);

   std::vector<uint8_t> bad{2, 5, 0, 0, 0};
   BOOST_CHECK_THROW(decode(*schema, bad), invalid_option_tag_exception);
}

BOOST_AUTO_TEST_CASE(test_vectors_and_arrays) {
   auto vec_u16 = schema_node::make_vector(prim(primitive_type::u16));
   std::vector<uint8_t> data{2, 0, 0, 0, 1, 0, 2, 0};
   auto result = decode(*vec_u16, data);
   BOOST_CHECK_EQUAL(result.value.size(), 2u);
   BOOST_CHECK_EQUAL(json::to_string(format_value(result.value)), "[1,2]");

   auto arr = schema_node::make_array(prim(primitive_type::u8), 3);
   std::vector<uint8_t> arr_data{7, 8, 9};
   auto arr_result = decode(*arr, arr_data);
   BOOST_CHECK(arr_result.value.kind == schema_kind::fixed_array);
   BOOST_CHECK_EQUAL(json::to_string(format_value(arr_result.value)), "[7,8,9]");
}

BOOST_AUTO_TEST_CASE(test_byte_vectors_decode_as_bytes) {
   std::vector<uint8_t> data{3, 0, 0, 0, 0xde, 0xad, 0xbe};
   auto vec = decode(*schema_node::make_vector(prim(primitive_type::u8)), data).value;
   BOOST_CHECK(vec.kind == schema_kind::bytes);
   BOOST_CHECK((vec.get<std::vector<uint8_t>>() == std::vector<uint8_t>{0xde, 0xad, 0xbe}));

   std::vector<uint8_t> small{2, 1, 2};
   auto sv = decode(*schema_node::make_small_vec(1, prim(primitive_type::u8)), small).value;
   BOOST_CHECK(sv.kind == schema_kind::bytes);
   BOOST_CHECK_EQUAL(json::to_string(format_value(sv)), "[1,2]");
}

BOOST_AUTO_TEST_CASE(test_small_vec_prefix_widths) {
   auto sv16 = schema_node::make_small_vec(2, prim(primitive_type::u32));
   std::vector<uint8_t> data{1, 0, 9, 0, 0, 0};
   auto result = decode(*sv16, data);
   BOOST_CHECK_EQUAL(result.end_offset, 6u);
   BOOST_CHECK_EQUAL(result.value.children[0].get<uint64_t>(), 9u);
}

BOOST_AUTO_TEST_CASE(test_string_and_bytes) {
   borsh::encoder enc;
   enc.write_string("hi");
   enc.write_bytes({0xff, 0x00});
   auto data = enc.finish();
   auto schema = schema_node::make_tuple({prim(primitive_type::string), prim(primitive_type::bytes)});
   BOOST_CHECK_EQUAL(json::to_string(format_value(decode(*schema, data).value)), R"(["hi",[255,0]])");

   // bytes are not validated as UTF-8, strings are
   std::vector<uint8_t> bad{1, 0, 0, 0, 0xff};
   BOOST_CHECK_NO_THROW(decode(*prim(primitive_type::bytes), bad));
   BOOST_CHECK_THROW(decode(*prim(primitive_type::string), bad), invalid_utf8_exception);
}

BOOST_AUTO_TEST_CASE(test_remaining_bytes) {
   auto schema = schema_node::make_struct("Tail", {{"tag", prim(primitive_type::u8)},
                                                   {"rest", schema_node::make_remaining_bytes()}});
   std::vector<uint8_t> data{1, 2, 3, 4};
   auto result = decode(*schema, data);
   BOOST_CHECK_EQUAL(result.end_offset, 4u);
   BOOST_CHECK_EQUAL(json::to_string(format_value(result.value)), R"({"tag":1,"rest":[2,3,4]})");
}

BOOST_AUTO_TEST_CASE(test_struct_preserves_field_order) {
   auto schema = schema_node::make_struct("S", {{"zeta", prim(primitive_type::u8)},
                                                {"alpha", prim(primitive_type::u8)},
                                                {"mid", prim(primitive_type::u8)}});
   std::vector<uint8_t> data{1, 2, 3};
   BOOST_CHECK_EQUAL(json::to_string(format_value(decode(*schema, data).value)), R"({"zeta":1,"alpha":2,"mid":3})");
}

//=============================================================================
// Enums
//=============================================================================

BOOST_AUTO_TEST_CASE(test_enum_variants) {
   compiled_types t(R"([{"name": "Action", "type": {"kind": "enum", "variants": [
      {"name": "Idle"},
      {"name": "Pair", "fields": ["u8", "u16"]},
      {"name": "Move", "fields": [{"name": "x", "type": "i8"}, {"name": "y", "type": "i8"}]}
   ]}}])");

   auto idle = t.decode("Action", {0});
   BOOST_CHECK_EQUAL(idle.value.variant_name, "Idle");
   BOOST_CHECK_EQUAL(json::to_string(format_value(idle.value)), R"({"name":"Idle"})");

   auto pair = t.decode("Action", {1, 7, 8, 0});
   BOOST_CHECK_EQUAL(pair.value.variant_index, 1u);
   BOOST_CHECK_EQUAL(pair.end_offset, 4u);
   BOOST_CHECK_EQUAL(json::to_string(format_value(pair.value)), R"({"name":"Pair","value":[7,8]})");

   auto mv = t.decode("Action", {2, 0xff, 3});
   BOOST_CHECK_EQUAL(mv.value["x"].get<int64_t>(), -1);
   BOOST_CHECK_EQUAL(json::to_string(format_value(mv.value)), R"({"name":"Move","value":{"x":-1,"y":3}})");
}

BOOST_AUTO_TEST_CASE(test_enum_discriminant_out_of_range) {
   compiled_types t(R"([{"name": "E", "type": {"kind": "enum", "variants": [{"name": "A"}, {"name": "B"}]}}])");
   try {
      t.decode("E", {2});
      BOOST_FAIL("expected invalid_discriminant_exception");
   } catch (const invalid_discriminant_exception& e) {
      BOOST_CHECK_EQUAL(e.value(), 2u);
      BOOST_CHECK_EQUAL(e.variant_count(), 2u);
      BOOST_CHECK_EQUAL(e.offset(), 0u);
   }
}

BOOST_AUTO_TEST_CASE(test_wide_enum_discriminant) {
   auto schema = schema_node::make_enum("W", {{"A", variant_shape::unit, {}}, {"B", variant_shape::unit, {}}}, 2);
   std::vector<uint8_t> data{1, 0};
   auto result = decode(*schema, data);
   BOOST_CHECK_EQUAL(result.value.variant_name, "B");
   BOOST_CHECK_EQUAL(result.end_offset, 2u);

   std::vector<uint8_t> bad{0, 1};
   BOOST_CHECK_THROW(decode(*schema, bad), invalid_discriminant_exception);
}

//=============================================================================
// Recursion
//=============================================================================

BOOST_AUTO_TEST_CASE(test_recursive_decode) {
   compiled_types t(R"([{"name": "Tree", "type": {"kind": "struct", "fields": [
      {"name": "value", "type": "u8"},
      {"name": "children", "type": {"vec": {"defined": "Tree"}}}
   ]}}])");

   // Tree{1, [Tree{2, []}, Tree{3, []}]}
   std::vector<uint8_t> data{1, 2, 0, 0, 0, 2, 0, 0, 0, 0, 3, 0, 0, 0, 0};
   auto result = t.decode("Tree", data);
   BOOST_CHECK_EQUAL(result.end_offset, data.size());
   BOOST_CHECK_EQUAL(json::to_string(format_value(result.value)),
                     R"({"value":1,"children":[{"value":2,"children":[]},{"value":3,"children":[]}]})");
   // resolved values keep their field name
   BOOST_CHECK_EQUAL(result.value["children"].children[1]["value"].get<uint64_t>(), 3u);
}

BOOST_AUTO_TEST_CASE(test_defined_without_types) {
   auto schema = schema_node::make_option(schema_node::make_defined("Tree"));
   std::vector<uint8_t> data{1, 0};
   BOOST_CHECK_THROW(decode(*schema, data), unknown_type_name_exception);
}

BOOST_AUTO_TEST_CASE(test_depth_limit) {
   compiled_types t(R"([{"name": "Chain", "type": {"kind": "struct", "fields": [
      {"name": "next", "type": {"option": {"defined": "Chain"}}}
   ]}}])");

   // every Some re-enters Chain once
   auto links = [](size_t n) {
      std::vector<uint8_t> data(n, 1);
      data.push_back(0);
      return data;
   };

   decode_context ctx;
   ctx.types             = &t.types;
   ctx.options.max_depth = 20;
   BOOST_CHECK_NO_THROW(decode(*t.types.at("Chain"), links(20), false, ctx));
   try {
      decode(*t.types.at("Chain"), links(21), false, ctx);
      BOOST_FAIL("expected depth_limit_exceeded_exception");
   } catch (const depth_limit_exceeded_exception& e) {
      BOOST_CHECK_EQUAL(e.offset(), 21u);
   }
}

BOOST_AUTO_TEST_CASE(test_long_recursive_list) {
   compiled_types t(R"([{"name": "Node", "type": {"kind": "struct", "fields": [
      {"name": "v", "type": "u8"},
      {"name": "next", "type": {"option": {"defined": "Node"}}}
   ]}}])");

   // 400 nodes, each an inner struct and an option level
   std::vector<uint8_t> data;
   for (size_t i = 0; i < 400; ++i) {
      data.push_back(static_cast<uint8_t>(i));
      data.push_back(i + 1 < 400 ? 1 : 0);
   }

   decode_context ctx;
   ctx.types   = &t.types;
   auto result = decode(*t.types.at("Node"), data, false, ctx);
   BOOST_CHECK_EQUAL(result.end_offset, data.size());

   size_t            count = 0;
   const value_node* cur   = &result.value;
   while (cur) {
      ++count;
      const auto& next = cur->children.at(1);
      cur              = next.children.empty() ? nullptr : &next.children.front();
   }
   BOOST_CHECK_EQUAL(count, 400u);
}

BOOST_AUTO_TEST_CASE(test_zero_size_elements) {
   auto empty = schema_node::make_struct("Empty", {});

   // a wire count over zero-size elements could claim any number of them
   auto holder = schema_node::make_struct("Holder", {{"items", schema_node::make_vector(empty)}});
   try {
      decode(*holder, std::vector<uint8_t>{0, 0, 0, 4});
      BOOST_FAIL("expected zero_size_elements_exception");
   } catch (const zero_size_elements_exception& e) {
      BOOST_CHECK_EQUAL(e.offset(), 0u);
      BOOST_CHECK_EQUAL(e.count(), 0x04000000u);
      BOOST_CHECK_EQUAL(e.path(), "items");
   }

   auto none = decode(*holder, std::vector<uint8_t>{0, 0, 0, 0});
   BOOST_CHECK(none.value.children.at(0).children.empty());
   BOOST_CHECK_EQUAL(none.end_offset, 4u);

   auto small = schema_node::make_small_vec(1, empty);
   BOOST_CHECK_THROW(decode(*small, std::vector<uint8_t>{3}), zero_size_elements_exception);

   // a fixed array is bounded by its declared length
   auto fixed  = schema_node::make_array(empty, 3);
   auto result = decode(*fixed, std::vector<uint8_t>{});
   BOOST_CHECK_EQUAL(result.value.children.size(), 3u);
   BOOST_CHECK_EQUAL(result.end_offset, 0u);
}

//=============================================================================
// Truncation and error paths
//=============================================================================

BOOST_AUTO_TEST_CASE(test_truncated_struct) {
   auto schema = schema_node::make_struct("S", {{"a", prim(primitive_type::u32)}, {"b", prim(primitive_type::u64)}});
   std::vector<uint8_t> data{1, 0, 0, 0, 2, 0};
   try {
      decode(*schema, data);
      BOOST_FAIL("expected truncated_buffer_exception");
   } catch (const truncated_buffer_exception& e) {
      BOOST_CHECK_EQUAL(e.offset(), 4u);
      BOOST_CHECK_EQUAL(e.bytes_needed(), 8u);
      BOOST_CHECK_EQUAL(e.path(), "b");

      // a stored copy rethrows as the concrete type
      auto copy = e.dynamic_copy_exception();
      BOOST_CHECK_THROW(copy->dynamic_rethrow_exception(), truncated_buffer_exception);
   }
}

BOOST_AUTO_TEST_CASE(test_huge_length_fails_before_allocating) {
   auto schema = schema_node::make_vector(prim(primitive_type::u64));
   std::vector<uint8_t> data{0xff, 0xff, 0xff, 0xff, 1, 2};
   try {
      decode(*schema, data);
      BOOST_FAIL("expected truncated_buffer_exception");
   } catch (const truncated_buffer_exception& e) {
      BOOST_CHECK_EQUAL(e.offset(), 0u);
      BOOST_CHECK_EQUAL(e.bytes_available(), 2u);
   }
}

BOOST_AUTO_TEST_CASE(test_error_paths) {
   compiled_types t(R"([
      {"name": "Book", "type": {"kind": "struct", "fields": [
         {"name": "positions", "type": {"vec": {"defined": "Position"}}}
      ]}},
      {"name": "Position", "type": {"kind": "struct", "fields": [
         {"name": "side", "type": {"defined": "Side"}}
      ]}},
      {"name": "Side", "type": {"kind": "enum", "variants": [
         {"name": "Bid", "fields": [{"name": "price", "type": "u64"}]},
         {"name": "Ask", "fields": [{"name": "price", "type": "u64"}]}
      ]}}
   ])");

   // two positions, the second one truncated inside its price
   std::vector<uint8_t> data{2, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0, 1, 5, 0};
   try {
      t.decode("Book", data);
      BOOST_FAIL("expected truncated_buffer_exception");
   } catch (const truncated_buffer_exception& e) {
      BOOST_CHECK_EQUAL(e.path(), "positions[1].side::Ask.price");
      BOOST_CHECK_EQUAL(e.offset(), 14u);
      BOOST_CHECK(e.to_detail_string().find("positions[1].side::Ask.price") != std::string::npos);
   }
}

//=============================================================================
// Offsets and concurrency
//=============================================================================

BOOST_AUTO_TEST_CASE(test_skip_discriminator_and_offsets) {
   auto schema = schema_node::make_struct("C", {{"count", prim(primitive_type::u16)}});
   std::vector<uint8_t> data{9, 9, 9, 9, 9, 9, 9, 9, 4, 0, 0xaa};

   auto result = decode(*schema, data, true);
   BOOST_CHECK_EQUAL(result.value["count"].get<uint64_t>(), 4u);
   // trailing bytes are left alone
   BOOST_CHECK_EQUAL(result.end_offset, 10u);

   decode_context ctx;
   ctx.options.account_discriminator_width = 1;
   std::vector<uint8_t> short_disc{0xee, 7, 0};
   BOOST_CHECK_EQUAL(decode(*schema, short_disc, true, ctx).value["count"].get<uint64_t>(), 7u);

   std::vector<uint8_t> offset_data{0, 0, 5, 0};
   auto at = decode(*schema, offset_data, false, {}, 2);
   BOOST_CHECK_EQUAL(at.end_offset, 4u);
   BOOST_CHECK_EQUAL(at.value["count"].get<uint64_t>(), 5u);

   std::vector<uint8_t> too_short{1, 2, 3};
   BOOST_CHECK_THROW(decode(*schema, too_short, true), truncated_buffer_exception);
}

BOOST_AUTO_TEST_CASE(test_concurrent_decodes) {
   compiled_types t(R"([{"name": "Row", "type": {"kind": "struct", "fields": [
      {"name": "id", "type": "u64"},
      {"name": "tags", "type": {"vec": "string"}}
   ]}}])");

   borsh::encoder enc;
   enc.write_u64(77);
   enc.write_vec(std::vector<std::string>{"a", "bc", "def"});
   auto data = enc.finish();

   auto expected = t.decode("Row", data).value;

   std::vector<std::thread> threads;
   std::vector<int>         matches(8, 0);
   for (size_t i = 0; i < matches.size(); ++i) {
      threads.emplace_back([&, i]() {
         set_thread_name("decode-" + std::to_string(i));
         int ok = 1;
         for (int n = 0; n < 200; ++n)
            ok &= t.decode("Row", data).value == expected ? 1 : 0;
         matches[i] = ok;
      });
   }
   for (auto& th : threads)
      th.join();
   for (int m : matches)
      BOOST_CHECK_EQUAL(m, 1);
}

BOOST_AUTO_TEST_CASE(test_decode_options_from_variant) {
   auto options = json::from_string(R"({"account_discriminator_width": 4, "max_depth": 16})").as<decode_options>();
   BOOST_CHECK_EQUAL(options.account_discriminator_width, 4);
   BOOST_CHECK_EQUAL(options.max_depth, 16u);
}

BOOST_AUTO_TEST_SUITE_END()
