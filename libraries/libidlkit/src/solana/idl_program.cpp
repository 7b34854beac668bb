// SPDX-License-Identifier: MIT
#include <idlkit/solana/idl_program.hpp>
#include <idlkit/solana/idl_exceptions.hpp>
#include <idlkit/solana/idl_format.hpp>

#include <algorithm>
#include <set>

#include <fmt/format.h>

#include <idlkit/crypto/hex.hpp>
#include <idlkit/log/logger.hpp>
#include <idlkit/string.hpp>
#include <idlkit/variant_object.hpp>

namespace idlkit::solana::idl {

namespace {

// Truncates or zero-pads to the configured width
std::vector<uint8_t> fit_discriminator(std::vector<uint8_t> disc, uint8_t width) {
   disc.resize(width, 0);
   return disc;
}

bool starts_with(std::span<const uint8_t> data, const std::vector<uint8_t>& prefix) {
   return data.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), data.begin());
}

void check_unique(std::set<std::vector<uint8_t>>& seen, const std::vector<uint8_t>& disc, std::string_view what,
                  const std::string& name) {
   IDLKIT_ASSERT(seen.insert(disc).second, malformed_declaration_exception,
                 "{} '{}' shares discriminator {} with another {}", what, name,
                 idlkit::to_hex(disc), to_lower(std::string(what)));
}

}  // namespace

//=============================================================================
// Result rendering
//=============================================================================

void to_variant(const parsed_account& a, idlkit::variant& v) {
   v = mutable_variant_object("name", a.name)("schema", format_schema(*a.schema))("value", format_value(a.value));
}

void to_variant(const parsed_instruction& i, idlkit::variant& v) {
   idlkit::variants keys;
   keys.reserve(i.accounts.size());
   for (const auto& k : i.accounts)
      keys.emplace_back(mutable_variant_object("name", k.name)("pubkey", k.key.to_base58()));
   v = mutable_variant_object("name", i.name)("schema", format_schema(*i.schema))("value", format_value(i.value))(
      "accounts", std::move(keys));
}

//=============================================================================
// Compilation
//=============================================================================

program_schema program_schema::compile(const idlkit::variant& idl, const compile_options& options) {
   return compile(parse_idl(idl), options);
}

program_schema program_schema::compile_file(const std::filesystem::path& path, const compile_options& options) {
   auto prog = parse_idl_file(path);
   try {
      return compile(prog, options);
   } IDLKIT_CAPTURE_AND_RETHROW("while compiling IDL file '{}'", path.string())
}

program_schema program_schema::compile(const program& prog, const compile_options& options) {
   auto log = logger::get("idl_program");

   program_schema result;
   result._name    = prog.name;
   result._version = prog.version;
   result._address = prog.address;
   result._account_discriminator_width =
      options.account_discriminator_width.value_or(prog.account_discriminator_width);
   result._instruction_discriminator_width =
      options.instruction_discriminator_width.value_or(prog.instruction_discriminator_width);
   IDLKIT_ASSERT(result._account_discriminator_width > 0 && result._instruction_discriminator_width > 0,
                 invalid_arg_exception, "Discriminator widths must be positive");

   schema_compiler compiler(prog.symbols, options);
   result._types = compiler.compile_all();

   std::set<std::vector<uint8_t>> seen;
   for (const auto& acct : prog.accounts) {
      try {
         account_schema a;
         a.name          = acct.name;
         a.discriminator = fit_discriminator(acct.discriminator, result._account_discriminator_width);
         check_unique(seen, a.discriminator, "Account", a.name);
         a.schema = compiler.compile_named(acct.name);
         result._accounts.push_back(std::move(a));
      } catch (const compile_exception& e) {
         if (options.strict)
            throw;
         idlkit_wlog(log, "Skipping account '{}': {}", acct.name, e.top_message());
      }
   }

   seen.clear();
   for (const auto& instr : prog.instructions) {
      try {
         instruction_schema i;
         i.name          = instr.name;
         i.discriminator = fit_discriminator(instr.discriminator, result._instruction_discriminator_width);
         check_unique(seen, i.discriminator, "Instruction", i.name);
         i.accounts.reserve(instr.accounts.size());
         for (const auto& a : instr.accounts)
            i.accounts.push_back(a.name);
         try {
            i.args = instr.args.empty() ? schema_node::make_empty(instr.name)
                                        : compiler.compile_fields(instr.name, instr.args);
         } IDLKIT_CAPTURE_AND_RETHROW("while compiling instruction '{}'", instr.name)
         result._instructions.push_back(std::move(i));
      } catch (const compile_exception& e) {
         if (options.strict)
            throw;
         idlkit_wlog(log, "Skipping instruction '{}': {}", instr.name, e.top_message());
      }
   }

   // types pulled in while compiling accounts and instructions
   result._types = compiler.compiled();

   idlkit_dlog(log, "Compiled program '{}': {} types, {} accounts, {} instructions", result._name,
               result._types.size(), result._accounts.size(), result._instructions.size());
   return result;
}

//=============================================================================
// Lookup
//=============================================================================

const account_schema* program_schema::find_account(std::string_view name) const {
   auto itr = std::find_if(_accounts.begin(), _accounts.end(), [&](const auto& a) { return a.name == name; });
   return itr == _accounts.end() ? nullptr : &*itr;
}

const instruction_schema* program_schema::find_instruction(std::string_view name) const {
   auto itr = std::find_if(_instructions.begin(), _instructions.end(), [&](const auto& i) { return i.name == name; });
   return itr == _instructions.end() ? nullptr : &*itr;
}

const schema_node* program_schema::find_type(std::string_view name) const {
   auto itr = _types.find(name);
   return itr == _types.end() ? nullptr : itr->second.get();
}

const account_schema* program_schema::find_account_by_discriminator(std::span<const uint8_t> data) const {
   auto itr = std::find_if(_accounts.begin(), _accounts.end(),
                           [&](const auto& a) { return starts_with(data, a.discriminator); });
   return itr == _accounts.end() ? nullptr : &*itr;
}

const instruction_schema* program_schema::find_instruction_by_discriminator(std::span<const uint8_t> data) const {
   auto itr = std::find_if(_instructions.begin(), _instructions.end(),
                           [&](const auto& i) { return starts_with(data, i.discriminator); });
   return itr == _instructions.end() ? nullptr : &*itr;
}

//=============================================================================
// Decoding
//=============================================================================

decode_context program_schema::make_context(const decode_options& options) const {
   decode_context ctx;
   ctx.types   = &_types;
   ctx.options = options;
   ctx.options.account_discriminator_width = _account_discriminator_width;
   return ctx;
}

parsed_account program_schema::decode_account(std::span<const uint8_t> data, const decode_options& options) const {
   if (data.size() < _account_discriminator_width)
      throw truncated_buffer_exception(0, _account_discriminator_width, data.size());

   const auto* acct = find_account_by_discriminator(data);
   if (acct == nullptr) {
      auto disc = idlkit::to_hex(reinterpret_cast<const char*>(data.data()), _account_discriminator_width);
      idlkit_dlog(logger::get("idl_program"), "No account of '{}' matches discriminator {}", _name, disc);
      IDLKIT_THROW_EXCEPTION(unknown_discriminator_exception, "No account matches discriminator {}", disc);
   }

   auto decoded = decode(*acct->schema, data, true, make_context(options));
   return parsed_account{acct->name, acct->schema, std::move(decoded.value)};
}

parsed_account program_schema::decode_account(std::string_view account_name, std::span<const uint8_t> data,
                                              const decode_options& options) const {
   const auto* acct = find_account(account_name);
   IDLKIT_ASSERT(acct != nullptr, key_not_found_exception, "Program '{}' has no account '{}'", _name, account_name);
   auto decoded = decode(*acct->schema, data, true, make_context(options));
   return parsed_account{acct->name, acct->schema, std::move(decoded.value)};
}

parsed_instruction program_schema::decode_instruction(std::span<const uint8_t> data,
                                                      std::span<const pubkey> account_keys,
                                                      const decode_options& options) const {
   if (data.size() < _instruction_discriminator_width)
      throw truncated_buffer_exception(0, _instruction_discriminator_width, data.size());

   const auto* instr = find_instruction_by_discriminator(data);
   if (instr == nullptr) {
      auto disc = idlkit::to_hex(reinterpret_cast<const char*>(data.data()), _instruction_discriminator_width);
      idlkit_dlog(logger::get("idl_program"), "No instruction of '{}' matches discriminator {}", _name, disc);
      IDLKIT_THROW_EXCEPTION(unknown_discriminator_exception, "No instruction matches discriminator {}", disc);
   }

   auto decoded = decode(*instr->args, data, false, make_context(options), _instruction_discriminator_width);

   parsed_instruction result{instr->name, instr->args, std::move(decoded.value), {}};
   result.accounts.reserve(account_keys.size());
   for (size_t i = 0; i < account_keys.size(); ++i) {
      auto name = i < instr->accounts.size() ? instr->accounts[i] : fmt::format("Account {}", i + 1);
      result.accounts.push_back(named_account_key{std::move(name), account_keys[i]});
   }
   return result;
}

decode_result program_schema::decode_type(std::string_view type_name, std::span<const uint8_t> data,
                                          const decode_options& options) const {
   const auto* node = find_type(type_name);
   IDLKIT_ASSERT(node != nullptr, unknown_type_name_exception, "Type '{}' is not compiled", type_name);
   return decode(*node, data, false, make_context(options));
}

}  // namespace idlkit::solana::idl
