// SPDX-License-Identifier: MIT
#pragma once
/**
 * @file log_message.hpp
 * @brief Defines the log level used to filter log messages.
 */
#include <idlkit/utility.hpp>

#include <string>

namespace idlkit
{
   class variant;

   /**
    * Named scope for log_level enumeration.
    */
   class log_level
   {
      public:
         /**
          * @brief Define's the various log levels for reporting.
          *
          * Each log level includes all higher levels such that
          * Debug includes Error, but Error does not include Debug.
          */
         enum values
         {
             all,
             debug,
             info,
             warn,
             error,
             off
         };
         log_level( values v = off ):value(v){}
         explicit log_level( int v ):value( static_cast<values>(v)){}
         operator int()const { return value; }
         std::string to_string()const;
         values value;
   };

   /** Accepts the level names all, debug, info, warn, error and off. */
   void from_variant( const variant& e, log_level& ll );

} // namespace idlkit
