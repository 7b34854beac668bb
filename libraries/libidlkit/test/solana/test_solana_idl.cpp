// SPDX-License-Identifier: MIT
#include <boost/test/unit_test.hpp>

#include <idlkit/crypto/sha256.hpp>
#include <idlkit/io/json.hpp>
#include <idlkit/solana/idl_exceptions.hpp>
#include <idlkit/solana/solana_idl.hpp>

using namespace idlkit;
using namespace idlkit::solana::idl;

namespace {

program parse(std::string_view text) {
   return parse_idl(json::from_string(text));
}

std::vector<uint8_t> sha_prefix(std::string_view preimage) {
   auto h = sha256::hash(preimage);
   return {h.data(), h.data() + 8};
}

}  // namespace

BOOST_AUTO_TEST_SUITE(solana_idl_tests)

//=============================================================================
// Type expressions
//=============================================================================

BOOST_AUTO_TEST_CASE(test_primitive_keywords) {
   BOOST_CHECK(primitive_type_from_string("bool") == primitive_type::bool_t);
   BOOST_CHECK(primitive_type_from_string("publicKey") == primitive_type::pubkey);
   BOOST_CHECK(primitive_type_from_string("pubkey") == primitive_type::pubkey);
   BOOST_CHECK(primitive_type_from_string("i256") == primitive_type::i256);
   BOOST_CHECK(!primitive_type_from_string("bool_t").has_value());
   BOOST_CHECK(!primitive_type_from_string("Position").has_value());
   BOOST_CHECK_EQUAL(primitive_type_to_string(primitive_type::bool_t), "bool");
}

BOOST_AUTO_TEST_CASE(test_type_expression_forms) {
   auto t = idl_type::from_variant(json::from_string(R"({"vec": {"option": {"defined": "Position"}}})"));
   BOOST_CHECK_EQUAL(t.to_string(), "Vec<Option<Position>>");
   BOOST_REQUIRE(t.is_vec());
   BOOST_CHECK(t.element->is_option());

   t = idl_type::from_variant(json::from_string(R"({"defined": {"name": "Order", "generics": []}})"));
   BOOST_CHECK(t.is_defined());
   BOOST_CHECK_EQUAL(t.get_defined_name(), "Order");

   t = idl_type::from_variant(json::from_string(R"({"array": ["u8", 32]})"));
   BOOST_CHECK(t.is_array());
   BOOST_CHECK_EQUAL(*t.array_len, 32u);

   t = idl_type::from_variant(json::from_string(R"({"tuple": ["u8", "string"]})"));
   BOOST_CHECK(t.is_tuple());
   BOOST_CHECK_EQUAL(t.to_string(), "(u8, string)");

   t = idl_type::from_variant(json::from_string(R"("Position")"));
   BOOST_CHECK(t.is_defined());
}

BOOST_AUTO_TEST_CASE(test_bracket_array_shorthand) {
   auto t = idl_type::from_string("[u64; 4]");
   BOOST_REQUIRE(t.is_array());
   BOOST_CHECK_EQUAL(*t.array_len, 4u);
   BOOST_CHECK(t.element->get_primitive() == primitive_type::u64);

   auto nested = idl_type::from_string("[[u8; 2]; 3]");
   BOOST_CHECK_EQUAL(nested.to_string(), "[[u8; 2]; 3]");

   BOOST_CHECK_THROW(idl_type::from_string("[u8]"), malformed_type_expression_exception);
   BOOST_CHECK_THROW(idl_type::from_string("[u8; x]"), malformed_type_expression_exception);
}

BOOST_AUTO_TEST_CASE(test_small_vec) {
   auto t = idl_type::from_variant(json::from_string(R"({"defined": "SmallVec<u8, PubKey>"})"));
   BOOST_REQUIRE(t.is_small_vec());
   BOOST_CHECK_EQUAL(t.length_width, 1);
   BOOST_CHECK(t.element->get_primitive() == primitive_type::pubkey);

   t = idl_type::from_string("SmallVec<u16,u32>");
   BOOST_CHECK_EQUAL(t.length_width, 2);
   BOOST_CHECK_EQUAL(t.to_string(), "SmallVec<u16, u32>");

   BOOST_CHECK_THROW(idl_type::from_string("SmallVec<u32, u8>"), malformed_type_expression_exception);
}

BOOST_AUTO_TEST_CASE(test_remaining_bytes_keywords) {
   BOOST_CHECK(idl_type::from_string("bytes_remaining").is_remaining_bytes());
   BOOST_CHECK(idl_type::from_string("rest").is_remaining_bytes());
}

BOOST_AUTO_TEST_CASE(test_malformed_type_expressions) {
   BOOST_CHECK_THROW(idl_type::from_variant(json::from_string("42")), malformed_type_expression_exception);
   BOOST_CHECK_THROW(idl_type::from_variant(json::from_string(R"({"vec": "u8", "option": "u8"})")),
                     malformed_type_expression_exception);
   BOOST_CHECK_THROW(idl_type::from_variant(json::from_string(R"({"map": "u8"})")),
                     malformed_type_expression_exception);
   BOOST_CHECK_THROW(idl_type::from_variant(json::from_string(R"({"array": ["u8", -1]})")),
                     malformed_type_expression_exception);
   BOOST_CHECK_THROW(idl_type::from_variant(json::from_string(R"({"array": ["u8", {"generic": "N"}]})")),
                     malformed_type_expression_exception);
   BOOST_CHECK_THROW(idl_type::from_string("u64").get_defined_name(), bad_cast_exception);
}

//=============================================================================
// Declarations
//=============================================================================

BOOST_AUTO_TEST_CASE(test_parse_program) {
   auto prog = parse(R"({
      "address": "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA",
      "metadata": {"name": "counter", "version": "0.1.0"},
      "docs": ["A counter"],
      "instructions": [{
         "name": "initialize",
         "accounts": [{"name": "counter", "writable": true}, {"name": "payer", "isMut": true, "isSigner": true}],
         "args": [{"name": "start", "type": "u64"}]
      }],
      "accounts": [{"name": "Counter"}],
      "types": [
         {"name": "Counter", "type": {"kind": "struct", "fields": [{"name": "count", "type": "u64"}]}},
         {"name": "Side", "type": {"kind": "enum", "variants": [{"name": "Bid"}, {"name": "Ask"}]}}
      ]
   })");

   BOOST_CHECK_EQUAL(prog.name, "counter");
   BOOST_CHECK_EQUAL(prog.version, "0.1.0");
   BOOST_CHECK_EQUAL(*prog.address, "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
   BOOST_CHECK_EQUAL(*prog.docs, "A counter");
   BOOST_CHECK_EQUAL(prog.symbols.size(), 2u);
   BOOST_CHECK(prog.symbols.get("Side").is_enum());
   BOOST_CHECK(prog.find_type("Counter")->is_struct());

   const auto* init = prog.find_instruction("initialize");
   BOOST_REQUIRE(init != nullptr);
   BOOST_REQUIRE_EQUAL(init->accounts.size(), 2u);
   BOOST_CHECK(init->accounts[0].is_mut);
   BOOST_CHECK(!init->accounts[0].is_signer);
   BOOST_CHECK(init->accounts[1].is_signer);
   BOOST_CHECK_EQUAL(init->args.size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_implicit_discriminators) {
   auto prog = parse(R"({
      "instructions": [{"name": "updateConfig", "accounts": [], "args": []}],
      "accounts": [{"name": "Config"}],
      "types": [{"name": "Config", "type": {"kind": "struct", "fields": []}}]
   })");
   BOOST_CHECK(prog.instructions[0].discriminator == sha_prefix("global:update_config"));
   BOOST_CHECK(prog.accounts[0].discriminator == sha_prefix("account:Config"));
   BOOST_CHECK_EQUAL(prog.account_discriminator_width, 8);
   BOOST_CHECK_EQUAL(prog.instruction_discriminator_width, 8);
}

BOOST_AUTO_TEST_CASE(test_explicit_discriminators) {
   auto prog = parse(R"({
      "instructions": [
         {"name": "a", "discriminant": {"type": "u8", "value": 3}, "args": []},
         {"name": "b", "discriminant": {"type": "u8", "value": 4}, "args": []}
      ],
      "accounts": [{"name": "X", "discriminator": [1, 2]}],
      "types": [{"name": "X", "type": {"kind": "struct", "fields": []}}]
   })");
   BOOST_CHECK(prog.instructions[0].discriminator == std::vector<uint8_t>{3});
   BOOST_CHECK_EQUAL(prog.instruction_discriminator_width, 1);
   BOOST_CHECK((prog.accounts[0].discriminator == std::vector<uint8_t>{1, 2}));
   BOOST_CHECK_EQUAL(prog.account_discriminator_width, 2);

   auto wide = parse(R"({"instructions": [{"name": "a", "discriminant": {"type": "u64", "value": 258}, "args": []}]})");
   BOOST_CHECK((wide.instructions[0].discriminator == std::vector<uint8_t>{2, 1, 0, 0, 0, 0, 0, 0}));
}

BOOST_AUTO_TEST_CASE(test_mixed_discriminator_widths) {
   BOOST_CHECK_THROW(parse(R"({
      "instructions": [
         {"name": "a", "discriminant": {"type": "u8", "value": 3}, "args": []},
         {"name": "b", "args": []}
      ]
   })"),
                     malformed_declaration_exception);
   BOOST_CHECK_THROW(parse(R"({"accounts": [{"name": "X", "discriminator": []}]})"),
                     malformed_declaration_exception);
   BOOST_CHECK_THROW(parse(R"({"accounts": [{"name": "X", "discriminator": [1, 256]}]})"),
                     malformed_declaration_exception);
}

BOOST_AUTO_TEST_CASE(test_enum_variant_shapes) {
   auto prog = parse(R"({"types": [{"name": "Event", "type": {"kind": "enum", "variants": [
      {"name": "None"},
      {"name": "Pair", "fields": ["u8", {"vec": "u16"}]},
      {"name": "Move", "fields": [{"name": "from", "type": "u32"}, {"name": "to", "type": "u32"}]}
   ]}}]})");
   const auto& variants = *prog.symbols.get("Event").enum_variants;
   BOOST_REQUIRE_EQUAL(variants.size(), 3u);
   BOOST_CHECK(variants[0].shape == variant_shape::unit);
   BOOST_CHECK(variants[1].shape == variant_shape::tuple);
   BOOST_CHECK_EQUAL(variants[1].tuple_fields.size(), 2u);
   BOOST_CHECK(variants[2].shape == variant_shape::named);
   BOOST_CHECK_EQUAL(variants[2].fields[1].name, "to");
}

BOOST_AUTO_TEST_CASE(test_mixed_variant_fields) {
   BOOST_CHECK_THROW(parse(R"({"types": [{"name": "E", "type": {"kind": "enum", "variants": [
      {"name": "V", "fields": ["u8", {"name": "x", "type": "u8"}]}
   ]}}]})"),
                     malformed_declaration_exception);
}

BOOST_AUTO_TEST_CASE(test_malformed_declarations) {
   BOOST_CHECK_THROW(parse(R"([])"), malformed_declaration_exception);
   BOOST_CHECK_THROW(parse(R"({"types": [{"type": {"kind": "struct"}}]})"), malformed_declaration_exception);
   BOOST_CHECK_THROW(parse(R"({"types": [{"name": "T", "type": {"kind": "union"}}]})"),
                     malformed_declaration_exception);
   BOOST_CHECK_THROW(parse(R"({"types": [{"name": "T", "type": {"kind": "enum"}}]})"),
                     malformed_declaration_exception);
   BOOST_CHECK_THROW(parse(R"({"types": {"name": "T"}})"), malformed_declaration_exception);
   BOOST_CHECK_THROW(parse(R"({"instructions": [{"name": "a", "accounts": [{"isMut": true}]}]})"),
                     malformed_declaration_exception);

   // repeated names would collide in the decoded object
   BOOST_CHECK_THROW(parse(R"({"types": [{"name": "Dup", "type": {"kind": "struct", "fields": [
                        {"name": "a", "type": "u8"}, {"name": "a", "type": "u8"}]}}]})"),
                     malformed_declaration_exception);
   BOOST_CHECK_THROW(parse(R"({"types": [{"name": "E", "type": {"kind": "enum", "variants": [
                        {"name": "A"}, {"name": "A"}]}}]})"),
                     malformed_declaration_exception);
   BOOST_CHECK_THROW(parse(R"({"types": [{"name": "E", "type": {"kind": "enum", "variants": [
                        {"name": "V", "fields": [{"name": "x", "type": "u8"}, {"name": "x", "type": "u16"}]}]}}]})"),
                     malformed_declaration_exception);
   BOOST_CHECK_THROW(parse(R"({"instructions": [{"name": "a", "args": [
                        {"name": "n", "type": "u8"}, {"name": "n", "type": "u8"}]}]})"),
                     malformed_declaration_exception);
}

BOOST_AUTO_TEST_CASE(test_struct_without_fields_is_empty) {
   auto prog = parse(R"({"types": [{"name": "Unit", "type": {"kind": "struct"}}]})");
   BOOST_CHECK(prog.symbols.get("Unit").struct_fields->empty());
}

BOOST_AUTO_TEST_CASE(test_duplicate_names) {
   BOOST_CHECK_THROW(parse(R"({"types": [
      {"name": "T", "type": {"kind": "struct", "fields": []}},
      {"name": "T", "type": {"kind": "struct", "fields": []}}
   ]})"),
                     duplicate_type_name_exception);
   BOOST_CHECK_THROW(parse(R"({"accounts": [{"name": "A"}, {"name": "A"}]})"), duplicate_type_name_exception);
}

BOOST_AUTO_TEST_CASE(test_legacy_inline_account_layout) {
   auto prog = parse(R"({
      "accounts": [
         {"name": "Vault", "type": {"kind": "struct", "fields": [{"name": "amount", "type": "u64"}]}},
         {"name": "Pool", "type": {"kind": "struct", "fields": [{"name": "inline", "type": "u8"}]}}
      ],
      "types": [{"name": "Pool", "type": {"kind": "struct", "fields": [{"name": "declared", "type": "u16"}]}}]
   })");
   BOOST_CHECK(prog.symbols.contains("Vault"));
   BOOST_CHECK(prog.accounts[0].inline_type.has_value());
   // the types entry wins over the inline layout
   BOOST_CHECK_EQUAL(prog.symbols.get("Pool").struct_fields->front().name, "declared");
   BOOST_CHECK_EQUAL(prog.types.size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_symbol_table) {
   symbol_table symbols;
   type_def def;
   def.name          = "A";
   def.struct_fields = std::vector<field>{};
   symbols.add(def);
   BOOST_CHECK(symbols.contains("A"));
   BOOST_CHECK(symbols.find("B") == nullptr);
   BOOST_CHECK_THROW(symbols.get("B"), unknown_type_name_exception);
   BOOST_CHECK_THROW(symbols.add(def), duplicate_type_name_exception);
}

BOOST_AUTO_TEST_CASE(test_discriminator_helpers) {
   auto instr = compute_instruction_discriminator("mintV1");
   BOOST_CHECK(std::vector<uint8_t>(instr.begin(), instr.end()) == sha_prefix("global:mint_v1"));
   auto acct = compute_account_discriminator("Vault");
   BOOST_CHECK(std::vector<uint8_t>(acct.begin(), acct.end()) == sha_prefix("account:Vault"));
}

BOOST_AUTO_TEST_SUITE_END()
