// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/exception/exception.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace idlkit::solana::idl {

//=============================================================================
// Compile errors: raised while building the symbol table or compiling schemas
//=============================================================================

IDLKIT_DECLARE_EXCEPTION(compile_exception, 3100000, "IDL compile exception");

IDLKIT_DECLARE_DERIVED_EXCEPTION(duplicate_type_name_exception, compile_exception, 3100001,
                                 "Type name declared more than once");
IDLKIT_DECLARE_DERIVED_EXCEPTION(malformed_declaration_exception, compile_exception, 3100002,
                                 "Malformed IDL declaration");
IDLKIT_DECLARE_DERIVED_EXCEPTION(unknown_type_name_exception, compile_exception, 3100003,
                                 "Reference to an undeclared type");
IDLKIT_DECLARE_DERIVED_EXCEPTION(unresolvable_recursion_exception, compile_exception, 3100004,
                                 "Recursive type without an indirection boundary");
IDLKIT_DECLARE_DERIVED_EXCEPTION(malformed_type_expression_exception, compile_exception, 3100005,
                                 "Malformed type expression");

//=============================================================================
// Lookup errors
//=============================================================================

IDLKIT_DECLARE_EXCEPTION(unknown_discriminator_exception, 3300001, "No account or instruction matches discriminator");

//=============================================================================
// Decode errors: raised while walking a schema against a byte buffer
//=============================================================================

/**
 * @brief Base of all decode failures
 *
 * Carries the absolute buffer offset at which the failing read started and the schema path of
 * the value being decoded (for example `positions[3].price`). The path is built from the inside
 * out while the exception unwinds through the decoder.
 */
class decode_exception : public idlkit::exception {
public:
   enum code_enum { code_value = 3200000 };

   decode_exception(std::string message, size_t offset, int64_t code = code_value,
                    std::string name_value = "decode_exception", std::string what_value = "Decode exception")
      : idlkit::exception(std::move(message), code, std::move(name_value), std::move(what_value))
      , _offset(offset) {}

   size_t             offset() const { return _offset; }
   const std::string& path() const { return _path; }

   /**
    * @brief Prepend a path segment
    *
    * Name segments are joined with a dot; a path starting with an index (`[3]`) or a variant
    * (`::Bid`) attaches directly to the segment in front of it.
    */
   void prepend_path(std::string_view segment);

   std::string to_detail_string() const override;

   std::shared_ptr<idlkit::exception> dynamic_copy_exception() const override {
      return std::make_shared<decode_exception>(*this);
   }
   [[noreturn]] void dynamic_rethrow_exception() const override { throw *this; }

private:
   size_t      _offset;
   std::string _path;
};

class truncated_buffer_exception : public decode_exception {
public:
   enum code_enum { code_value = 3200001 };

   truncated_buffer_exception(size_t offset, size_t bytes_needed, size_t bytes_available);
   size_t bytes_needed() const { return _bytes_needed; }
   size_t bytes_available() const { return _bytes_available; }

   std::shared_ptr<idlkit::exception> dynamic_copy_exception() const override {
      return std::make_shared<truncated_buffer_exception>(*this);
   }
   [[noreturn]] void dynamic_rethrow_exception() const override { throw *this; }

private:
   size_t _bytes_needed    = 0;
   size_t _bytes_available = 0;
};

class invalid_utf8_exception : public decode_exception {
public:
   enum code_enum { code_value = 3200002 };

   explicit invalid_utf8_exception(size_t offset);

   std::shared_ptr<idlkit::exception> dynamic_copy_exception() const override {
      return std::make_shared<invalid_utf8_exception>(*this);
   }
   [[noreturn]] void dynamic_rethrow_exception() const override { throw *this; }
};

class invalid_option_tag_exception : public decode_exception {
public:
   enum code_enum { code_value = 3200003 };

   invalid_option_tag_exception(size_t offset, uint8_t tag);
   uint8_t tag() const { return _tag; }

   std::shared_ptr<idlkit::exception> dynamic_copy_exception() const override {
      return std::make_shared<invalid_option_tag_exception>(*this);
   }
   [[noreturn]] void dynamic_rethrow_exception() const override { throw *this; }

private:
   uint8_t _tag = 0;
};

class invalid_discriminant_exception : public decode_exception {
public:
   enum code_enum { code_value = 3200004 };

   invalid_discriminant_exception(size_t offset, uint64_t value, size_t variant_count);
   uint64_t value() const { return _value; }
   size_t   variant_count() const { return _variant_count; }

   std::shared_ptr<idlkit::exception> dynamic_copy_exception() const override {
      return std::make_shared<invalid_discriminant_exception>(*this);
   }
   [[noreturn]] void dynamic_rethrow_exception() const override { throw *this; }

private:
   uint64_t _value         = 0;
   size_t   _variant_count = 0;
};

class invalid_bool_exception : public decode_exception {
public:
   enum code_enum { code_value = 3200005 };

   invalid_bool_exception(size_t offset, uint8_t byte);
   uint8_t byte() const { return _byte; }

   std::shared_ptr<idlkit::exception> dynamic_copy_exception() const override {
      return std::make_shared<invalid_bool_exception>(*this);
   }
   [[noreturn]] void dynamic_rethrow_exception() const override { throw *this; }

private:
   uint8_t _byte = 0;
};

class depth_limit_exceeded_exception : public decode_exception {
public:
   enum code_enum { code_value = 3200006 };

   depth_limit_exceeded_exception(size_t offset, size_t max_depth);

   std::shared_ptr<idlkit::exception> dynamic_copy_exception() const override {
      return std::make_shared<depth_limit_exceeded_exception>(*this);
   }
   [[noreturn]] void dynamic_rethrow_exception() const override { throw *this; }
};

/**
 * @brief A length prefix counts elements that occupy no bytes
 *
 * Nothing in the buffer bounds such a count, so any non-zero count is rejected.
 */
class zero_size_elements_exception : public decode_exception {
public:
   enum code_enum { code_value = 3200007 };

   zero_size_elements_exception(size_t offset, uint64_t count);
   uint64_t count() const { return _count; }

   std::shared_ptr<idlkit::exception> dynamic_copy_exception() const override {
      return std::make_shared<zero_size_elements_exception>(*this);
   }
   [[noreturn]] void dynamic_rethrow_exception() const override { throw *this; }

private:
   uint64_t _count = 0;
};

}  // namespace idlkit::solana::idl
