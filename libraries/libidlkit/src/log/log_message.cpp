// SPDX-License-Identifier: MIT
#include <idlkit/log/log_message.hpp>
#include <idlkit/variant.hpp>
#include <idlkit/exception/exception.hpp>

namespace idlkit {

   std::string log_level::to_string()const {
      switch( value ) {
         case all:   return "all";
         case debug: return "debug";
         case info:  return "info";
         case warn:  return "warn";
         case error: return "error";
         case off:   return "off";
      }
      return "off";
   }

   void from_variant( const variant& v, log_level& ll ) {
      const auto& s = v.get_string();
      if( s == "all" )        ll = log_level::all;
      else if( s == "debug" ) ll = log_level::debug;
      else if( s == "info" )  ll = log_level::info;
      else if( s == "warn" )  ll = log_level::warn;
      else if( s == "error" ) ll = log_level::error;
      else if( s == "off" )   ll = log_level::off;
      else IDLKIT_THROW_EXCEPTION( bad_cast_exception, "Invalid log level '{}'", s );
   }

} // namespace idlkit
