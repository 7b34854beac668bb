// SPDX-License-Identifier: MIT
#include <idlkit/log/logger_config.hpp>
#include <idlkit/io/json.hpp>
#include <idlkit/variant_object.hpp>
#include <idlkit/exception/exception.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <pthread.h>

#include <string>
#include <unordered_map>

namespace idlkit {

   namespace {
      template <typename T>
      void read_optional_member( const variant_object& o, std::string_view key, T& out ) {
         auto itr = o.find( key );
         if( itr != o.end() && !itr->value().is_null() )
            from_variant( itr->value(), out );
      }
   }

   void from_variant( const variant& v, sink_config& c ) {
      const auto& o = v.get_object();
      c.name = o["name"].as_string();
      c.type = o["type"].as_string();
      read_optional_member( o, "args", c.args );
      read_optional_member( o, "enabled", c.enabled );
   }

   void from_variant( const variant& v, logger_config& c ) {
      const auto& o = v.get_object();
      c.name = o["name"].as_string();
      read_optional_member( o, "level", c.level );
      read_optional_member( o, "enabled", c.enabled );
      read_optional_member( o, "sinks", c.sinks );
   }

   void from_variant( const variant& v, logging_config& c ) {
      const auto& o = v.get_object();
      read_optional_member( o, "sinks", c.sinks );
      read_optional_member( o, "loggers", c.loggers );
   }

   namespace sink {
      void from_variant( const variant& v, level_color& c ) {
         const auto& o = v.get_object();
         c.level = o["level"].as_string();
         c.color = o["color"].as_string();
      }
      void from_variant( const variant& v, stderr_color_sink_config& c ) {
         if( v.is_null() ) return;
         read_optional_member( v.get_object(), "level_colors", c.level_colors );
      }
      void from_variant( const variant& v, stdout_color_sink_config& c ) {
         if( v.is_null() ) return;
         read_optional_member( v.get_object(), "level_colors", c.level_colors );
      }
      void from_variant( const variant& v, daily_file_sink_config& c ) {
         const auto& o = v.get_object();
         c.base_filename = o["base_filename"].as_string();
         read_optional_member( o, "rotation_hour", c.rotation_hour );
         read_optional_member( o, "rotation_minute", c.rotation_minute );
         read_optional_member( o, "truncate", c.truncate );
         read_optional_member( o, "max_files", c.max_files );
      }
      void from_variant( const variant& v, rotating_file_sink_config& c ) {
         const auto& o = v.get_object();
         c.base_filename = o["base_filename"].as_string();
         read_optional_member( o, "max_size", c.max_size );
         read_optional_member( o, "max_files", c.max_files );
      }
   }

   log_config& log_config::get() {
      // allocate dynamically which will leak on exit but allow loggers to be used until the very end of execution
      static log_config* the = new log_config;
      return *the;
   }

   logger log_config::get_logger( const std::string& name ) {
      std::lock_guard g( log_config::get().log_mutex );
      auto& loggers = log_config::get().logger_map;
      auto itr = loggers.find( name );
      if( itr != loggers.end() )
         return itr->second;
      auto def = loggers.find( DEFAULT_LOGGER );
      if( def != loggers.end() ) {
         loggers.emplace( name, def->second );
         return def->second;
      }
      return loggers.emplace( name, logger( name ) ).first->second;
   }


   void configure_logging( const std::filesystem::path& lc ) {
      configure_logging( json::from_file<logging_config>(lc) );
   }
   void configure_logging( const logging_config& cfg ) {
      log_config::configure_logging( cfg );
   }

   void log_config::configure_logging( const logging_config& cfg ) {
      std::lock_guard g( log_config::get().log_mutex );
      log_config::get().logger_map.clear();
      log_config::get().sink_map.clear();

      auto& default_entry = log_config::get().logger_map.emplace( DEFAULT_LOGGER, logger( DEFAULT_LOGGER ) ).first->second;
      logger::default_logger() = default_entry;
      logger& default_logger = logger::default_logger();

      for( const auto& sc : cfg.sinks ) {
         if( !sc.enabled )
            continue;
         auto config_colors = [](auto& sink, const std::vector<sink::level_color>& colors) {
            for (auto& it : colors) {
               if (it.color == "yellow")
                  sink->set_color(spdlog::level::from_str(it.level), sink->yellow);
               else if (it.color == "red")
                  sink->set_color(spdlog::level::from_str(it.level), sink->red);
               else if (it.color == "green")
                  sink->set_color(spdlog::level::from_str(it.level), sink->green);
               else
                  sink->set_color(spdlog::level::from_str(it.level), sink->reset);
            }
         };
         if (sc.type == "stderr_color_sink") {
            auto config = sc.args.as<sink::stderr_color_sink_config>();
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            config_colors(sink, config.level_colors);
            log_config::get().sink_map[sc.name] = sink;
         } else if (sc.type == "stdout_color_sink") {
            auto config = sc.args.as<sink::stdout_color_sink_config>();
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            config_colors(sink, config.level_colors);
            log_config::get().sink_map[sc.name] = sink;
         } else if (sc.type == "daily_file_sink") {
            auto config = sc.args.as<sink::daily_file_sink_config>();
            auto sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                    config.base_filename, config.rotation_hour, config.rotation_minute, config.truncate, config.max_files);
            log_config::get().sink_map[sc.name] = sink;
         } else if (sc.type == "rotating_file_sink") {
            auto config = sc.args.as<sink::rotating_file_sink_config>();
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.base_filename, static_cast<size_t>(config.max_size)*1024*1024, config.max_files);
            log_config::get().sink_map[sc.name] = sink;
         } else {
            IDLKIT_THROW_EXCEPTION( invalid_arg_exception, "Unknown sink type '{}' for sink '{}'", sc.type, sc.name );
         }
      }

      for (bool first_pass = true; ; first_pass = false) { // process default first
         for( const auto& lc : cfg.loggers ) {
            if (first_pass && lc.name != DEFAULT_LOGGER)
               continue;
            if (!first_pass && lc.name == DEFAULT_LOGGER)
               continue;

            auto& loggers = log_config::get().logger_map;
            auto itr = loggers.find( lc.name );
            if( itr == loggers.end() )
               itr = loggers.emplace( lc.name, logger( lc.name ) ).first;
            logger lgr = itr->second;

            if( lc.enabled ) {
               lgr.set_enabled( *lc.enabled );
            } else {
               lgr.set_enabled( default_logger.is_enabled() );
            }
            if( lc.level ) {
               lgr.set_log_level( *lc.level );
            } else {
               lgr.set_log_level( default_logger.get_log_level() );
            }

            for( const auto& s : lc.sinks ) {
               auto sink_it = log_config::get().sink_map.find(s);
               IDLKIT_ASSERT( sink_it != log_config::get().sink_map.end(), invalid_arg_exception,
                              "Logger '{}' refers to unknown sink '{}'", lc.name, s );
               lgr.add_sink(sink_it->second);
            }
            if (!lc.sinks.empty())
               lgr.update_agent_logger(
                  std::make_unique<spdlog::logger>(lc.name, lgr.get_sinks().begin(), lgr.get_sinks().end()));
         }
         if (!first_pass)
            break;
      }
   }

   logging_config logging_config::default_config() {
      logging_config cfg;
      logger_config dlc;
      dlc.name = DEFAULT_LOGGER;
      dlc.level = log_level::info;
      cfg.loggers.push_back( dlc );
      return cfg;
   }

   static thread_local std::string thread_name;

   void set_thread_name( const std::string& name ) {
      thread_name = name;
#if defined(__linux__) || defined(__FreeBSD__)
      pthread_setname_np( pthread_self(), name.substr(0, 15).c_str() );
#elif defined(__APPLE__)
      pthread_setname_np( name.c_str() );
#endif
   }
   const std::string& get_thread_name() {
      if(thread_name.empty()) {
#if defined(__linux__)
         char buf[16] = {};
         if( pthread_getname_np( pthread_self(), buf, sizeof(buf) ) == 0 )
            thread_name = buf;
#endif
         if( thread_name.empty() )
            thread_name = "unknown";
      }
      return thread_name;
   }
}
