// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/solana/idl_decoder.hpp>
#include <idlkit/solana/idl_schema.hpp>
#include <idlkit/solana/idl_value.hpp>
#include <idlkit/solana/solana_types.hpp>

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace idlkit::solana::idl {

/**
 * @brief Compiled layout of an account type
 */
struct account_schema {
   std::string name;
   std::vector<uint8_t> discriminator;
   schema_ptr schema;
};

/**
 * @brief Compiled argument layout of an instruction
 */
struct instruction_schema {
   std::string name;
   std::vector<uint8_t> discriminator;

   // Account names in the order their keys appear in the transaction
   std::vector<std::string> accounts;

   // Struct of the arguments, or an empty node when the instruction takes none
   schema_ptr args;
};

struct parsed_account {
   std::string name;
   schema_ptr schema;
   value_node value;
};

struct named_account_key {
   std::string name;
   pubkey key;
};

struct parsed_instruction {
   std::string name;
   schema_ptr schema;
   value_node value;
   std::vector<named_account_key> accounts;
};

/** `{"name", "schema", "value"}` */
void to_variant(const parsed_account& a, idlkit::variant& v);

/** `{"name", "schema", "value", "accounts": [{"name", "pubkey"}]}` */
void to_variant(const parsed_instruction& i, idlkit::variant& v);

/**
 * @brief Every compiled layout of one program
 *
 * Built once per IDL, then immutable: any number of threads may decode against one instance.
 *
 * @code
 * auto schema = program_schema::compile_file("counter.json");
 * auto parsed = schema.decode_account(account_data);
 * ilog("{}", json::to_string(variant(parsed)));
 * @endcode
 */
class program_schema {
public:
   program_schema() = default;

   /**
    * @brief Parse and compile an IDL document
    * @throws compile_exception (and derived)
    */
   static program_schema compile(const idlkit::variant& idl, const compile_options& options = {});
   static program_schema compile(const program& prog, const compile_options& options = {});
   static program_schema compile_file(const std::filesystem::path& path, const compile_options& options = {});

   const std::string& name() const { return _name; }
   const std::string& version() const { return _version; }
   const std::optional<std::string>& address() const { return _address; }

   uint8_t account_discriminator_width() const { return _account_discriminator_width; }
   uint8_t instruction_discriminator_width() const { return _instruction_discriminator_width; }

   const type_map& types() const { return _types; }
   const std::vector<account_schema>& accounts() const { return _accounts; }
   const std::vector<instruction_schema>& instructions() const { return _instructions; }

   const account_schema* find_account(std::string_view name) const;
   const instruction_schema* find_instruction(std::string_view name) const;
   const schema_node* find_type(std::string_view name) const;

   /**
    * @brief Account whose discriminator starts the data, nullptr if none
    */
   const account_schema* find_account_by_discriminator(std::span<const uint8_t> data) const;

   /**
    * @brief Instruction whose discriminator starts the data, nullptr if none
    */
   const instruction_schema* find_instruction_by_discriminator(std::span<const uint8_t> data) const;

   /**
    * @brief Identify and decode account data
    * @throws truncated_buffer_exception when the data is shorter than a discriminator,
    *         unknown_discriminator_exception when no account type matches
    */
   parsed_account decode_account(std::span<const uint8_t> data, const decode_options& options = {}) const;

   /**
    * @brief Decode account data as the named account type, skipping its discriminator
    * @throws key_not_found_exception for an unknown account name
    */
   parsed_account decode_account(std::string_view account_name, std::span<const uint8_t> data,
                                 const decode_options& options = {}) const;

   /**
    * @brief Identify and decode instruction data
    *
    * account_keys are paired with the instruction's account names by position; keys beyond the
    * declared accounts are named `Account N` (1-based).
    */
   parsed_instruction decode_instruction(std::span<const uint8_t> data, std::span<const pubkey> account_keys = {},
                                         const decode_options& options = {}) const;

   /**
    * @brief Decode bytes as a named type, without a discriminator
    */
   decode_result decode_type(std::string_view type_name, std::span<const uint8_t> data,
                             const decode_options& options = {}) const;

private:
   friend class schema_codec;

   decode_context make_context(const decode_options& options) const;

   std::string _name;
   std::string _version;
   std::optional<std::string> _address;
   uint8_t _account_discriminator_width = 8;
   uint8_t _instruction_discriminator_width = 8;
   type_map _types;
   std::vector<account_schema> _accounts;
   std::vector<instruction_schema> _instructions;
};

}  // namespace idlkit::solana::idl
