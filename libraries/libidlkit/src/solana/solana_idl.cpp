// SPDX-License-Identifier: MIT
#include <idlkit/solana/solana_idl.hpp>
#include <idlkit/solana/solana_borsh.hpp>
#include <idlkit/solana/idl_exceptions.hpp>

#include <algorithm>
#include <charconv>
#include <set>

#include <fmt/ranges.h>

#include <idlkit/io/json.hpp>
#include <idlkit/log/logger.hpp>
#include <idlkit/string.hpp>
#include <idlkit/variant_object.hpp>

namespace idlkit::solana::idl {

//=============================================================================
// primitive_type string conversion
//=============================================================================

std::optional<primitive_type> primitive_type_from_string(std::string_view s) {
   // Handle special cases where IDL string differs from enum name
   if (s == "bool")
      return primitive_type::bool_t;
   if (s == "publicKey")
      return primitive_type::pubkey;
   if (s == "bool_t")
      return std::nullopt;

   // Try direct magic_enum lookup (works for u8, u16, i32, string, bytes, pubkey, etc.)
   return magic_enum::enum_cast<primitive_type>(s);
}

std::string_view primitive_type_to_string(primitive_type t) {
   // Handle special cases where we want different output than the enum name
   if (t == primitive_type::bool_t)
      return "bool";
   return magic_enum::enum_name(t);
}

//=============================================================================
// idl_type implementation
//=============================================================================

idl_type idl_type::make_primitive(primitive_type p) {
   idl_type result;
   result.kind = type_kind::primitive;
   result.primitive = p;
   return result;
}

idl_type idl_type::make_defined(std::string name) {
   idl_type result;
   result.kind = type_kind::defined;
   result.defined_name = std::move(name);
   return result;
}

idl_type idl_type::make_option(idl_type inner) {
   idl_type result;
   result.kind = type_kind::option;
   result.element = std::make_shared<idl_type>(std::move(inner));
   return result;
}

idl_type idl_type::make_vec(idl_type element) {
   idl_type result;
   result.kind = type_kind::vec;
   result.element = std::make_shared<idl_type>(std::move(element));
   return result;
}

idl_type idl_type::make_array(idl_type element, size_t len) {
   idl_type result;
   result.kind = type_kind::array;
   result.element = std::make_shared<idl_type>(std::move(element));
   result.array_len = len;
   return result;
}

idl_type idl_type::make_tuple(std::vector<idl_type> elements) {
   idl_type result;
   result.kind = type_kind::tuple;
   result.tuple_elements = std::move(elements);
   return result;
}

idl_type idl_type::make_small_vec(uint8_t length_width, idl_type element) {
   IDLKIT_ASSERT(length_width == 1 || length_width == 2, invalid_arg_exception,
                 "SmallVec length prefix must be 1 or 2 bytes, got {}", length_width);
   idl_type result;
   result.kind = type_kind::small_vec;
   result.length_width = length_width;
   result.element = std::make_shared<idl_type>(std::move(element));
   return result;
}

idl_type idl_type::make_remaining_bytes() {
   idl_type result;
   result.kind = type_kind::remaining_bytes;
   return result;
}

primitive_type idl_type::get_primitive() const {
   IDLKIT_ASSERT(is_primitive() && primitive.has_value(), bad_cast_exception, "Type {} is not a primitive",
                 to_string());
   return *primitive;
}

const std::string& idl_type::get_defined_name() const {
   IDLKIT_ASSERT(is_defined() && defined_name.has_value(), bad_cast_exception, "Type {} is not a defined type",
                 to_string());
   return *defined_name;
}

std::string idl_type::to_string() const {
   switch (kind) {
      case type_kind::primitive:
         return primitive ? std::string(primitive_type_to_string(*primitive)) : "<unset>";
      case type_kind::defined:
         return *defined_name;
      case type_kind::option:
         return "Option<" + element->to_string() + ">";
      case type_kind::vec:
         return "Vec<" + element->to_string() + ">";
      case type_kind::array:
         return "[" + element->to_string() + "; " + std::to_string(*array_len) + "]";
      case type_kind::small_vec:
         return fmt::format("SmallVec<u{}, {}>", length_width * 8, element->to_string());
      case type_kind::remaining_bytes:
         return "bytes_remaining";
      case type_kind::tuple: {
         std::string result = "(";
         bool first = true;
         for (const auto& elem : *tuple_elements) {
            if (!first)
               result += ", ";
            result += elem.to_string();
            first = false;
         }
         result += ")";
         return result;
      }
   }

   return std::string(magic_enum::enum_name(kind));
}

namespace {

size_t parse_array_length(const idlkit::variant& v, std::string_view context) {
   if (v.is_int64() || v.is_uint64()) {
      IDLKIT_ASSERT(!v.is_int64() || v.as_int64() >= 0, malformed_type_expression_exception,
                    "Array length in {} must not be negative", context);
      return static_cast<size_t>(v.as_uint64());
   }
   // Anchor 0.30 allows a generic const length ({"generic": "N"}), which cannot be laid out
   IDLKIT_THROW_EXCEPTION(malformed_type_expression_exception, "Array length in {} must be an integer, got {}",
                          context, v.get_type_name());
}

idl_type parse_small_vec(std::string_view s) {
   // s looks like "SmallVec<u8,Pubkey>" or "SmallVec<u16, u8>"
   std::string_view inner = s.substr(9, s.size() - 10);
   auto parts = split(inner, ',');
   IDLKIT_ASSERT(parts.size() == 2, malformed_type_expression_exception,
                 "SmallVec '{}' must have a length type and an element type", s);

   auto len_s = trim(parts[0]);
   uint8_t width = 0;
   if (len_s == "u8")
      width = 1;
   else if (len_s == "u16")
      width = 2;
   else
      IDLKIT_THROW_EXCEPTION(malformed_type_expression_exception, "Unsupported SmallVec length type '{}' in '{}'",
                             len_s, s);

   auto elem_s = std::string(trim(parts[1]));
   IDLKIT_ASSERT(!elem_s.empty(), malformed_type_expression_exception, "SmallVec '{}' has an empty element type", s);
   auto lowered = to_lower(elem_s);
   if (lowered == "pubkey" || lowered == "publickey")
      return idl_type::make_small_vec(width, idl_type::make_primitive(primitive_type::pubkey));
   return idl_type::make_small_vec(width, idl_type::from_string(elem_s));
}

idl_type parse_bracket_array(std::string_view s) {
   // "[T; N]"; the last ';' separates the length so nested arrays work
   std::string_view inner = s.substr(1, s.size() - 2);
   auto semi = inner.rfind(';');
   IDLKIT_ASSERT(semi != std::string_view::npos, malformed_type_expression_exception,
                 "Array shorthand '{}' is missing its length", s);
   auto elem_s = trim(inner.substr(0, semi));
   auto len_s  = trim(inner.substr(semi + 1));
   size_t len = 0;
   auto [ptr, ec] = std::from_chars(len_s.data(), len_s.data() + len_s.size(), len);
   IDLKIT_ASSERT(ec == std::errc() && ptr == len_s.data() + len_s.size() && !len_s.empty(),
                 malformed_type_expression_exception, "Array shorthand '{}' has an invalid length '{}'", s, len_s);
   IDLKIT_ASSERT(!elem_s.empty(), malformed_type_expression_exception, "Array shorthand '{}' has no element type", s);
   return idl_type::make_array(idl_type::from_string(elem_s), len);
}

bool is_small_vec_name(std::string_view s) {
   return s.size() > 10 && s.substr(0, 9) == "SmallVec<" && s.back() == '>';
}

}  // namespace

idl_type idl_type::from_string(std::string_view s) {
   IDLKIT_ASSERT(!s.empty(), malformed_type_expression_exception, "Empty type name");

   if (s.front() == '[' && s.back() == ']')
      return parse_bracket_array(s);
   if (s == "bytes_remaining" || s == "rest")
      return make_remaining_bytes();
   if (auto prim = primitive_type_from_string(s))
      return make_primitive(*prim);
   if (is_small_vec_name(s))
      return parse_small_vec(s);

   // If not a known primitive, treat as defined type
   return make_defined(std::string(s));
}

idl_type idl_type::from_variant(const idlkit::variant& v) {
   if (v.is_string()) {
      // Simple type like "u64", "string", "pubkey"
      return from_string(v.get_string());
   }

   IDLKIT_ASSERT(v.is_object(), malformed_type_expression_exception,
                 "Type expression must be a string or an object, got {}", v.get_type_name());
   const auto& obj = v.get_object();
   IDLKIT_ASSERT(obj.size() == 1, malformed_type_expression_exception,
                 "Type expression object must have exactly one key, got {}", obj.size());

   // Check for defined type
   if (obj.contains("defined")) {
      const auto& def = obj["defined"];
      std::string name;
      if (def.is_string()) {
         name = def.get_string();
      } else if (def.is_object() && def.get_object().contains("name") && def["name"].is_string()) {
         // Anchor 0.30+: {"defined": {"name": "Foo", "generics": [...]}}
         name = def["name"].get_string();
      } else {
         IDLKIT_THROW_EXCEPTION(malformed_type_expression_exception,
                                "'defined' must name a type, got {}", def.get_type_name());
      }
      IDLKIT_ASSERT(!name.empty(), malformed_type_expression_exception, "'defined' names an empty type");
      if (is_small_vec_name(name))
         return parse_small_vec(name);
      return make_defined(std::move(name));
   }
   // Check for Option<T>
   if (obj.contains("option")) {
      return make_option(from_variant(obj["option"]));
   }
   // Check for Vec<T>
   if (obj.contains("vec")) {
      return make_vec(from_variant(obj["vec"]));
   }
   // Check for array [T; N]
   if (obj.contains("array")) {
      const auto& arr = obj["array"];
      IDLKIT_ASSERT(arr.is_array() && arr.size() == 2, malformed_type_expression_exception,
                    "Array type must have element type and length");
      return make_array(from_variant(arr.get_array()[0]), parse_array_length(arr.get_array()[1], "array type"));
   }
   // Check for tuple
   if (obj.contains("tuple")) {
      const auto& tuple = obj["tuple"];
      IDLKIT_ASSERT(tuple.is_array(), malformed_type_expression_exception, "Tuple type must be an array");
      std::vector<idl_type> types;
      types.reserve(tuple.size());
      for (const auto& t : tuple.get_array()) {
         types.push_back(from_variant(t));
      }
      return make_tuple(std::move(types));
   }

   IDLKIT_THROW_EXCEPTION(malformed_type_expression_exception, "Unsupported type expression '{}'",
                          obj.begin()->key());
}

//=============================================================================
// symbol_table implementation
//=============================================================================

void symbol_table::add(type_def def) {
   IDLKIT_ASSERT(!_index.contains(def.name), duplicate_type_name_exception, "Type '{}' is declared more than once",
                 def.name);
   _index.emplace(def.name, _defs.size());
   _defs.push_back(std::move(def));
}

const type_def* symbol_table::find(std::string_view name) const {
   auto itr = _index.find(name);
   if (itr == _index.end())
      return nullptr;
   return &_defs[itr->second];
}

const type_def& symbol_table::get(std::string_view name) const {
   const auto* def = find(name);
   IDLKIT_ASSERT(def != nullptr, unknown_type_name_exception, "Type '{}' is not declared", name);
   return *def;
}

//=============================================================================
// program implementation
//=============================================================================

const instruction* program::find_instruction(std::string_view name) const {
   for (const auto& instr : instructions) {
      if (instr.name == name)
         return &instr;
   }
   return nullptr;
}

const account* program::find_account(std::string_view name) const {
   for (const auto& acct : accounts) {
      if (acct.name == name)
         return &acct;
   }
   return nullptr;
}

const type_def* program::find_type(std::string_view name) const {
   for (const auto& t : types) {
      if (t.name == name)
         return &t;
   }
   return nullptr;
}

//=============================================================================
// Parsing functions
//=============================================================================

namespace {

const idlkit::variant_object& as_object(const idlkit::variant& v, std::string_view what) {
   IDLKIT_ASSERT(v.is_object(), malformed_declaration_exception, "{} must be an object, got {}", what,
                 v.get_type_name());
   return v.get_object();
}

std::string required_string(const idlkit::variant_object& obj, std::string_view key, std::string_view what) {
   auto itr = obj.find(key);
   IDLKIT_ASSERT(itr != obj.end() && itr->value().is_string(), malformed_declaration_exception,
                 "{} must have a string '{}'", what, key);
   return itr->value().get_string();
}

/** The array under key, nullptr when absent or null. */
const idlkit::variants* optional_array(const idlkit::variant_object& obj, std::string_view key,
                                       std::string_view what) {
   auto itr = obj.find(key);
   if (itr == obj.end() || itr->value().is_null())
      return nullptr;
   IDLKIT_ASSERT(itr->value().is_array(), malformed_declaration_exception, "'{}' of {} must be an array", key, what);
   return &itr->value().get_array();
}

std::optional<std::string> parse_docs(const idlkit::variant_object& obj) {
   const auto* docs_arr = optional_array(obj, "docs", "docs");
   if (!docs_arr || docs_arr->empty())
      return std::nullopt;
   std::string docs;
   for (const auto& d : *docs_arr) {
      if (!docs.empty())
         docs += "\n";
      docs += d.as_string();
   }
   return docs;
}

field parse_field(const idlkit::variant& v, std::string_view owner) {
   const auto& obj = as_object(v, fmt::format("Field of '{}'", owner));
   field f;
   f.name = required_string(obj, "name", fmt::format("Field of '{}'", owner));
   IDLKIT_ASSERT(obj.contains("type"), malformed_declaration_exception, "Field '{}.{}' has no type", owner, f.name);
   try {
      f.type = idl_type::from_variant(obj["type"]);
   } IDLKIT_CAPTURE_AND_RETHROW("while parsing field '{}.{}'", owner, f.name)
   return f;
}

// Field and variant names key the formatted object, so each must be unique within its owner
void check_unique_name(std::set<std::string>& seen, const std::string& name, std::string_view what,
                       std::string_view owner) {
   IDLKIT_ASSERT(seen.insert(name).second, malformed_declaration_exception, "{} '{}' is declared twice in '{}'",
                 what, name, owner);
}

std::vector<field> parse_fields(const idlkit::variant_object& obj, std::string_view owner) {
   std::vector<field> fields;
   if (const auto* arr = optional_array(obj, "fields", fmt::format("'{}'", owner))) {
      fields.reserve(arr->size());
      std::set<std::string> seen;
      for (const auto& f : *arr) {
         fields.push_back(parse_field(f, owner));
         check_unique_name(seen, fields.back().name, "Field", owner);
      }
   }
   return fields;
}

/** A named field is an object carrying both `name` and `type`; anything else is a type expression. */
bool is_named_field(const idlkit::variant& v) {
   return v.is_object() && v.get_object().contains("name") && v.get_object().contains("type");
}

enum_variant parse_enum_variant(const idlkit::variant& v, std::string_view owner) {
   const auto& obj = as_object(v, fmt::format("Variant of '{}'", owner));
   enum_variant variant;
   variant.name = required_string(obj, "name", fmt::format("Variant of '{}'", owner));

   const auto* fields = optional_array(obj, "fields", fmt::format("variant '{}::{}'", owner, variant.name));
   if (!fields)
      return variant;

   size_t named = std::count_if(fields->begin(), fields->end(), is_named_field);
   IDLKIT_ASSERT(named == 0 || named == fields->size(), malformed_declaration_exception,
                 "Variant '{}::{}' mixes named and unnamed fields", owner, variant.name);

   auto context = fmt::format("{}::{}", owner, variant.name);
   if (named > 0) {
      variant.shape = variant_shape::named;
      std::set<std::string> seen;
      for (const auto& f : *fields) {
         variant.fields.push_back(parse_field(f, context));
         check_unique_name(seen, variant.fields.back().name, "Field", context);
      }
   } else {
      variant.shape = variant_shape::tuple;
      for (const auto& f : *fields) {
         try {
            variant.tuple_fields.push_back(idl_type::from_variant(f));
         } IDLKIT_CAPTURE_AND_RETHROW("while parsing variant '{}'", context)
      }
   }
   return variant;
}

/** `{"kind": "struct"|"enum", ...}` under the `type` key of obj. */
type_def parse_type_body(std::string name, const idlkit::variant_object& obj) {
   type_def def;
   def.name = std::move(name);

   auto itr = obj.find("type");
   IDLKIT_ASSERT(itr != obj.end(), malformed_declaration_exception, "Type '{}' has no 'type' body", def.name);
   const auto& type_obj = as_object(itr->value(), fmt::format("Body of type '{}'", def.name));
   std::string kind = required_string(type_obj, "kind", fmt::format("Body of type '{}'", def.name));

   if (kind == "struct") {
      def.struct_fields = parse_fields(type_obj, def.name);
   } else if (kind == "enum") {
      const auto* variants = optional_array(type_obj, "variants", fmt::format("enum '{}'", def.name));
      IDLKIT_ASSERT(variants != nullptr, malformed_declaration_exception, "Enum '{}' has no 'variants'", def.name);
      std::vector<enum_variant> result;
      result.reserve(variants->size());
      std::set<std::string> seen;
      for (const auto& var : *variants) {
         result.push_back(parse_enum_variant(var, def.name));
         check_unique_name(seen, result.back().name, "Variant", def.name);
      }
      def.enum_variants = std::move(result);
   } else {
      IDLKIT_THROW_EXCEPTION(malformed_declaration_exception, "Type '{}' has unsupported kind '{}'", def.name, kind);
   }

   return def;
}

type_def parse_type_def(const idlkit::variant& v) {
   const auto& obj = as_object(v, "Type declaration");
   return parse_type_body(required_string(obj, "name", "Type declaration"), obj);
}

/**
 * Explicit discriminator: a byte array (its length is the width) or {"type": "u8"|"u64", "value": N}
 * stored little-endian.
 */
std::vector<uint8_t> parse_discriminator(const idlkit::variant& v, std::string_view owner) {
   std::vector<uint8_t> result;
   if (v.is_array()) {
      const auto& arr = v.get_array();
      IDLKIT_ASSERT(!arr.empty() && arr.size() <= 8, malformed_declaration_exception,
                    "Discriminator of '{}' must be 1 to 8 bytes, got {}", owner, arr.size());
      result.reserve(arr.size());
      for (const auto& b : arr) {
         IDLKIT_ASSERT((b.is_uint64() || (b.is_int64() && b.as_int64() >= 0)) && b.as_uint64() <= 0xff,
                       malformed_declaration_exception,
                       "Discriminator of '{}' must contain bytes", owner);
         result.push_back(static_cast<uint8_t>(b.as_uint64()));
      }
      return result;
   }

   const auto& obj = as_object(v, fmt::format("Discriminator of '{}'", owner));
   std::string type = required_string(obj, "type", fmt::format("Discriminator of '{}'", owner));
   size_t width = 0;
   if (type == "u8")
      width = 1;
   else if (type == "u64")
      width = 8;
   else
      IDLKIT_THROW_EXCEPTION(malformed_declaration_exception, "Unknown discriminator type '{}' for '{}'", type, owner);

   auto value_itr = obj.find("value");
   IDLKIT_ASSERT(value_itr != obj.end() && (value_itr->value().is_uint64() ||
                                            (value_itr->value().is_int64() && value_itr->value().as_int64() >= 0)),
                 malformed_declaration_exception, "Discriminator value of '{}' must be an unsigned integer", owner);
   uint64_t value = value_itr->value().as_uint64();
   for (size_t i = 0; i < width; ++i)
      result.push_back(static_cast<uint8_t>(value >> (8 * i)));
   return result;
}

std::optional<std::vector<uint8_t>> find_discriminator(const idlkit::variant_object& obj, std::string_view owner) {
   for (const char* key : {"discriminant", "discriminator"}) {
      auto itr = obj.find(key);
      if (itr != obj.end() && !itr->value().is_null())
         return parse_discriminator(itr->value(), owner);
   }
   return std::nullopt;
}

/** Every discriminator must be one width; defaults to 8 when there are none. */
uint8_t common_width(const std::set<size_t>& widths, std::string_view what) {
   IDLKIT_ASSERT(widths.size() <= 1, malformed_declaration_exception, "{} discriminators have mixed widths: {}",
                 what, fmt::join(widths, ", "));
   return widths.empty() ? 8 : static_cast<uint8_t>(*widths.begin());
}

instruction_account parse_instruction_account(const idlkit::variant& v, std::string_view owner) {
   const auto& obj = as_object(v, fmt::format("Account of instruction '{}'", owner));
   instruction_account acct;
   acct.name = required_string(obj, "name", fmt::format("Account of instruction '{}'", owner));

   auto flag = [&](std::string_view legacy, std::string_view current) {
      for (auto key : {legacy, current}) {
         auto itr = obj.find(key);
         if (itr != obj.end() && !itr->value().is_null())
            return itr->value().as_bool();
      }
      return false;
   };

   // Handle both old format (isMut/isSigner) and new Anchor 0.30+ format (writable/signer)
   acct.is_mut      = flag("isMut", "writable");
   acct.is_signer   = flag("isSigner", "signer");
   acct.is_optional = flag("isOptional", "optional");
   return acct;
}

instruction parse_instruction(const idlkit::variant& v) {
   const auto& obj = as_object(v, "Instruction");
   instruction instr;
   instr.name = required_string(obj, "name", "Instruction");

   if (auto disc = find_discriminator(obj, instr.name)) {
      instr.discriminator = std::move(*disc);
   } else {
      auto computed = compute_instruction_discriminator(instr.name);
      instr.discriminator.assign(computed.begin(), computed.end());
   }

   if (const auto* args = optional_array(obj, "args", fmt::format("instruction '{}'", instr.name))) {
      std::set<std::string> seen;
      for (const auto& arg : *args) {
         instr.args.push_back(parse_field(arg, instr.name));
         check_unique_name(seen, instr.args.back().name, "Argument", instr.name);
      }
   }

   if (const auto* accts = optional_array(obj, "accounts", fmt::format("instruction '{}'", instr.name))) {
      for (const auto& acct : *accts)
         instr.accounts.push_back(parse_instruction_account(acct, instr.name));
   }

   instr.docs = parse_docs(obj);
   return instr;
}

account parse_account(const idlkit::variant& v) {
   const auto& obj = as_object(v, "Account");
   account acct;
   acct.name = required_string(obj, "name", "Account");

   if (auto disc = find_discriminator(obj, acct.name)) {
      acct.discriminator = std::move(*disc);
   } else {
      auto computed = compute_account_discriminator(acct.name);
      acct.discriminator.assign(computed.begin(), computed.end());
   }

   // Only legacy accounts carry an inline layout
   if (obj.contains("type"))
      acct.inline_type = parse_type_body(acct.name, obj);

   return acct;
}

/** Top-level string, falling back to the same key under `metadata`. */
std::optional<std::string> metadata_string(const idlkit::variant_object& root, std::string_view key) {
   auto itr = root.find(key);
   if (itr != root.end() && itr->value().is_string())
      return itr->value().get_string();
   auto meta = root.find("metadata");
   if (meta != root.end() && meta->value().is_object()) {
      const auto& mobj = meta->value().get_object();
      auto mitr = mobj.find(key);
      if (mitr != mobj.end() && mitr->value().is_string())
         return mitr->value().get_string();
   }
   return std::nullopt;
}

}  // namespace

program parse_idl(const idlkit::variant& json) {
   program prog;
   const auto& obj = as_object(json, "IDL root");

   prog.name    = metadata_string(obj, "name").value_or("");
   prog.version = metadata_string(obj, "version").value_or("");
   prog.address = metadata_string(obj, "address");
   prog.docs    = parse_docs(obj);

   // Parse types
   if (const auto* types = optional_array(obj, "types", "IDL root")) {
      for (const auto& t : *types) {
         auto def = parse_type_def(t);
         prog.symbols.add(def);
         prog.types.push_back(std::move(def));
      }
   }

   // Parse accounts
   std::set<size_t> account_widths;
   if (const auto* accounts = optional_array(obj, "accounts", "IDL root")) {
      for (const auto& a : *accounts) {
         auto acct = parse_account(a);
         IDLKIT_ASSERT(prog.find_account(acct.name) == nullptr, duplicate_type_name_exception,
                       "Account '{}' is declared more than once", acct.name);
         account_widths.insert(acct.discriminator.size());
         if (acct.inline_type) {
            // Don't overwrite a proper type definition
            if (prog.symbols.contains(acct.name))
               idlkit_dlog(logger::get("idl_parser"), "Account '{}' layout comes from its 'types' entry", acct.name);
            else
               prog.symbols.add(*acct.inline_type);
         }
         prog.accounts.push_back(std::move(acct));
      }
   }
   prog.account_discriminator_width = common_width(account_widths, "Account");

   // Parse instructions
   std::set<size_t> instruction_widths;
   if (const auto* instructions = optional_array(obj, "instructions", "IDL root")) {
      for (const auto& i : *instructions) {
         auto instr = parse_instruction(i);
         instruction_widths.insert(instr.discriminator.size());
         prog.instructions.push_back(std::move(instr));
      }
   }
   prog.instruction_discriminator_width = common_width(instruction_widths, "Instruction");

   idlkit_dlog(logger::get("idl_parser"), "Parsed IDL '{}': {} types, {} accounts, {} instructions", prog.name,
               prog.symbols.size(), prog.accounts.size(), prog.instructions.size());
   return prog;
}

program parse_idl_file(const std::filesystem::path& path) {
   auto json = idlkit::json::from_file(path);
   try {
      return parse_idl(json);
   } IDLKIT_CAPTURE_AND_RETHROW("while parsing IDL file '{}'", path.string())
}

//=============================================================================
// Discriminator computation
//=============================================================================

std::array<uint8_t, 8> compute_instruction_discriminator(std::string_view name) {
   return borsh::compute_discriminator("global", to_snake_case(name));
}

std::array<uint8_t, 8> compute_account_discriminator(std::string_view name) {
   return borsh::compute_discriminator("account", name);
}

}  // namespace idlkit::solana::idl
