// SPDX-License-Identifier: MIT
#pragma once

/**
 *  @file exception.hpp
 *  @brief Defines the idlkit exception base class and the macros used to declare and throw exceptions.
 */
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include <boost/preprocessor/stringize.hpp>
#include <fmt/format.h>

#include <idlkit/utility.hpp>

namespace idlkit {

namespace exception_code {
   /** Error codes are numbered by family; derived libraries pick codes outside these ranges. */
   enum code_enum : int64_t {
      unspecified_exception_code = 0,
      file_not_found_code        = 3,
      parse_error_code           = 4,
      invalid_arg_code           = 5,
      key_not_found_code         = 6,
      bad_cast_code              = 7,
      out_of_range_code          = 8,
      assert_code                = 10,
      std_exception_code         = 13,
   };
} // namespace exception_code

/**
 *  @brief Root of the idlkit exception hierarchy.
 *
 *  An exception carries a numeric code, the name of its concrete type, a static description
 *  (what()) and an ordered log of messages. The first message is the one supplied at the throw
 *  site; further messages are appended as the exception unwinds through layers that add context.
 */
class exception : public std::exception {
public:
   enum code_enum { code_value = exception_code::unspecified_exception_code };

   exception(int64_t code = exception_code::unspecified_exception_code, std::string name_value = "exception",
             std::string what_value = "unspecified");
   exception(std::string message, int64_t code, std::string name_value, std::string what_value);

   exception(const exception&)            = default;
   exception(exception&&)                 = default;
   exception& operator=(const exception&) = default;
   exception& operator=(exception&&)      = default;
   ~exception() override;

   const char* name() const noexcept { return _name.c_str(); }
   int64_t     code() const noexcept { return _code; }
   const char* what() const noexcept override { return _what.c_str(); }

   /** The messages recorded for this exception, throw site first. */
   const std::vector<std::string>& get_log() const { return _log; }
   void append_log(std::string message);

   /** The throw-site message, or what() when none was recorded. */
   std::string top_message() const;

   /** `name: top message` */
   std::string to_string() const;

   /** Name, code, description and every recorded message, one per line. */
   virtual std::string to_detail_string() const;

   /**
    *  Returns a copy of the most derived exception type, so it can be stored and rethrown later
    *  with its concrete type intact.
    */
   virtual std::shared_ptr<exception> dynamic_copy_exception() const;

   /** Throws this exception as its most derived type. */
   [[noreturn]] virtual void dynamic_rethrow_exception() const;

protected:
   int64_t                  _code;
   std::string              _name;
   std::string              _what;
   std::vector<std::string> _log;
};

} // namespace idlkit

/**
 *  Declares TYPE deriving from BASE with the error CODE and static description WHAT. The
 *  declared type is constructible from a message string and keeps its type across
 *  dynamic_copy_exception() and dynamic_rethrow_exception().
 */
#define IDLKIT_DECLARE_DERIVED_EXCEPTION(TYPE, BASE, CODE, WHAT)                                             \
   class TYPE : public BASE {                                                                               \
   public:                                                                                                  \
      enum code_enum { code_value = CODE };                                                                 \
      explicit TYPE(std::string message = {})                                                               \
         : BASE(std::move(message), CODE, BOOST_PP_STRINGIZE(TYPE), WHAT) {}                                \
      TYPE(std::string message, int64_t code, std::string name_value, std::string what_value)               \
         : BASE(std::move(message), code, std::move(name_value), std::move(what_value)) {}                  \
      std::shared_ptr<idlkit::exception> dynamic_copy_exception() const override {                          \
         return std::make_shared<TYPE>(*this);                                                              \
      }                                                                                                     \
      [[noreturn]] void dynamic_rethrow_exception() const override { throw *this; }                         \
   };

#define IDLKIT_DECLARE_EXCEPTION(TYPE, CODE, WHAT) IDLKIT_DECLARE_DERIVED_EXCEPTION(TYPE, idlkit::exception, CODE, WHAT)

namespace idlkit {
   IDLKIT_DECLARE_EXCEPTION(file_not_found_exception, exception_code::file_not_found_code, "File Not Found");
   IDLKIT_DECLARE_EXCEPTION(parse_error_exception, exception_code::parse_error_code, "Parse Error");
   IDLKIT_DECLARE_EXCEPTION(invalid_arg_exception, exception_code::invalid_arg_code, "Invalid Argument");
   IDLKIT_DECLARE_EXCEPTION(key_not_found_exception, exception_code::key_not_found_code, "Key Not Found");
   IDLKIT_DECLARE_EXCEPTION(bad_cast_exception, exception_code::bad_cast_code, "Bad Cast");
   IDLKIT_DECLARE_EXCEPTION(out_of_range_exception, exception_code::out_of_range_code, "Out of Range");
   IDLKIT_DECLARE_EXCEPTION(assert_exception, exception_code::assert_code, "Assert Exception");
   IDLKIT_DECLARE_EXCEPTION(std_exception_wrapper, exception_code::std_exception_code, "std::exception");
} // namespace idlkit

/**
 *  @brief Throws EXCEPTION with a message built from the fmt FORMAT and its arguments.
 */
#define IDLKIT_THROW_EXCEPTION(EXCEPTION, FORMAT, ...)                                                       \
   throw EXCEPTION(IDLKIT_FMT(FORMAT, ##__VA_ARGS__))

/**
 *  @brief Throws EXCEPTION when TEST is false.
 */
#define IDLKIT_ASSERT(TEST, EXCEPTION, FORMAT, ...)                                                          \
   IDLKIT_MULTILINE_MACRO_BEGIN                                                                              \
   if (!(TEST)) [[unlikely]]                                                                                 \
      IDLKIT_THROW_EXCEPTION(EXCEPTION, FORMAT, ##__VA_ARGS__);                                             \
   IDLKIT_MULTILINE_MACRO_END

/**
 *  @brief Closes a try block: appends a context message to any idlkit::exception and rethrows it;
 *  a std::exception is rethrown as std_exception_wrapper carrying the same context.
 */
#define IDLKIT_CAPTURE_AND_RETHROW(FORMAT, ...)                                                              \
   catch (idlkit::exception & er) {                                                                          \
      er.append_log(IDLKIT_FMT(FORMAT, ##__VA_ARGS__));                                                      \
      throw;                                                                                                 \
   }                                                                                                         \
   catch (const std::exception& e) {                                                                         \
      idlkit::std_exception_wrapper sew(e.what());                                                           \
      sew.append_log(IDLKIT_FMT(FORMAT, ##__VA_ARGS__));                                                     \
      throw sew;                                                                                             \
   }
