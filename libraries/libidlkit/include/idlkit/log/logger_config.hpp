// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/log/logger.hpp>
#include <idlkit/variant.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace idlkit {
   struct sink_config {
       sink_config(const std::string& name = "", const std::string& type = "", variant args = variant())
          : name(name), type(type), args(std::move(args)), enabled(true) {}
       std::string name;
       std::string type;
       variant args;
       bool enabled;
   };

   namespace sink {
      struct level_color {
          level_color ( std::string l = "trace", std::string c = "yellow")
                  : level(std::move(l)), color(std::move(c)) {}

          std::string  level;
          std::string  color;
      };

      struct stderr_color_sink_config {
          std::vector<level_color>      level_colors;
      };

      struct stdout_color_sink_config {
         std::vector<level_color>      level_colors;
      };

      struct daily_file_sink_config {
         std::string    base_filename;
         int32_t        rotation_hour = 0;
         int32_t        rotation_minute = 0;
         bool           truncate = false;
         uint32_t       max_files = 0;
      };

      struct rotating_file_sink_config {
         std::string    base_filename;
         uint32_t       max_size = 10; // MB
         uint32_t       max_files = 10;
      };
   } // namespace sink

   struct logger_config {
      explicit logger_config(std::string name = {}):name(std::move(name)){}
      std::string                      name;
      std::optional<log_level>         level;
      /// if not set, then the default logger's enabled is used.
      std::optional<bool>              enabled;
      std::vector<std::string>         sinks;
   };

   /**
    *  @code
    *  {
    *    "sinks": [ { "name": "stderr", "type": "stderr_color_sink",
    *                 "args": { "level_colors": [ { "level": "debug", "color": "green" } ] } } ],
    *    "loggers": [ { "name": "default", "level": "info", "sinks": [ "stderr" ] },
    *                 { "name": "idl_compiler", "level": "debug", "sinks": [ "stderr" ] } ]
    *  }
    *  @endcode
    */
   struct logging_config {
      static logging_config default_config();
      std::vector<sink_config>     sinks;
      std::vector<logger_config>   loggers;
   };

   void from_variant( const variant& v, sink_config& c );
   void from_variant( const variant& v, logger_config& c );
   void from_variant( const variant& v, logging_config& c );
   namespace sink {
      void from_variant( const variant& v, level_color& c );
      void from_variant( const variant& v, stderr_color_sink_config& c );
      void from_variant( const variant& v, stdout_color_sink_config& c );
      void from_variant( const variant& v, daily_file_sink_config& c );
      void from_variant( const variant& v, rotating_file_sink_config& c );
   }

   struct log_config {
      static logger get_logger( const std::string& name );

      /** Replaces every sink and logger. @throws invalid_arg_exception on an unknown sink type */
      static void configure_logging( const logging_config& l );

   private:
      static log_config& get();

      friend class logger;

      std::mutex                                                             log_mutex;
      std::unordered_map<std::string, std::shared_ptr<spdlog::sinks::sink>>  sink_map;
      std::unordered_map<std::string, logger>                                logger_map;
   };

   void configure_logging( const std::filesystem::path& log_config );
   void configure_logging( const logging_config& l );

   void set_thread_name( const std::string& name );
   const std::string& get_thread_name();
}
