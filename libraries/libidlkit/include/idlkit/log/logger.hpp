// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/log/log_message.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace spdlog::sinks {
class sink;
}

namespace idlkit
{
   inline constexpr const char* DEFAULT_LOGGER = "default";

   /**
    @code
      void my_class::func() {
         idlkit_dlog( my_class_logger, "Format four: {} five: {}", 4, 5 );
      }
    @endcode

    A logger is a cheap handle; copies share the underlying state, so a level or sink change made
    through one copy is seen by all of them.
    */
   class logger
   {
      public:
         static logger& default_logger();

         /** The logger registered under name; an unconfigured name shares the default logger. */
         static logger get( const std::string& name = DEFAULT_LOGGER );

         logger();
         explicit logger( const std::string& name );
         logger( const logger& c );
         logger( logger&& c ) noexcept;
         ~logger();
         logger& operator=(const logger&);
         logger& operator=(logger&&) noexcept;

         logger&    set_log_level( log_level e );
         log_level  get_log_level()const;

         std::unique_ptr<spdlog::logger>& get_agent_logger()const;
         void update_agent_logger(std::unique_ptr<spdlog::logger>&& al);

         void set_enabled( bool e );
         bool is_enabled( log_level e )const;
         bool is_enabled()const;

      private:
         friend struct log_config;
         void add_sink(const std::shared_ptr<spdlog::sinks::sink>& s);
         std::vector<std::shared_ptr<spdlog::sinks::sink>>& get_sinks() const;

         class impl;
         std::shared_ptr<impl> my;
   };

} // namespace idlkit

#define idlkit_tlog( LOGGER, FORMAT, ... ) \
  IDLKIT_MULTILINE_MACRO_BEGIN \
   if( (LOGGER).is_enabled( idlkit::log_level::all ) ) \
      SPDLOG_LOGGER_TRACE((LOGGER).get_agent_logger(), IDLKIT_FMT( FORMAT, ##__VA_ARGS__ )); \
  IDLKIT_MULTILINE_MACRO_END

#define idlkit_dlog( LOGGER, FORMAT, ... ) \
  IDLKIT_MULTILINE_MACRO_BEGIN \
   if( (LOGGER).is_enabled( idlkit::log_level::debug ) ) \
      SPDLOG_LOGGER_DEBUG((LOGGER).get_agent_logger(), IDLKIT_FMT( FORMAT, ##__VA_ARGS__ )); \
  IDLKIT_MULTILINE_MACRO_END

#define idlkit_ilog( LOGGER, FORMAT, ... ) \
  IDLKIT_MULTILINE_MACRO_BEGIN \
   if( (LOGGER).is_enabled( idlkit::log_level::info ) ) \
      SPDLOG_LOGGER_INFO((LOGGER).get_agent_logger(), IDLKIT_FMT( FORMAT, ##__VA_ARGS__ )); \
  IDLKIT_MULTILINE_MACRO_END

#define idlkit_wlog( LOGGER, FORMAT, ... ) \
  IDLKIT_MULTILINE_MACRO_BEGIN \
   if( (LOGGER).is_enabled( idlkit::log_level::warn ) ) \
      SPDLOG_LOGGER_WARN((LOGGER).get_agent_logger(), IDLKIT_FMT( FORMAT, ##__VA_ARGS__ )); \
  IDLKIT_MULTILINE_MACRO_END

#define idlkit_elog( LOGGER, FORMAT, ... ) \
  IDLKIT_MULTILINE_MACRO_BEGIN \
   if( (LOGGER).is_enabled( idlkit::log_level::error ) ) \
      SPDLOG_LOGGER_ERROR((LOGGER).get_agent_logger(), IDLKIT_FMT( FORMAT, ##__VA_ARGS__ )); \
  IDLKIT_MULTILINE_MACRO_END

#define tlog( FORMAT, ... ) \
   idlkit_tlog( idlkit::logger::default_logger(), FORMAT, ##__VA_ARGS__)

#define dlog( FORMAT, ... ) \
   idlkit_dlog( idlkit::logger::default_logger(), FORMAT, ##__VA_ARGS__)

#define ilog( FORMAT, ... ) \
   idlkit_ilog( idlkit::logger::default_logger(), FORMAT, ##__VA_ARGS__)

#define wlog( FORMAT, ... ) \
   idlkit_wlog( idlkit::logger::default_logger(), FORMAT, ##__VA_ARGS__)

#define elog( FORMAT, ... ) \
   idlkit_elog( idlkit::logger::default_logger(), FORMAT, ##__VA_ARGS__)
