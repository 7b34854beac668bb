// SPDX-License-Identifier: MIT
#include <idlkit/log/logger.hpp>
#include <idlkit/log/logger_config.hpp>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace idlkit {

   inline static logger the_default_logger;

   constexpr const char* DEFAULT_PATTERN = "%^%-5l %Y-%m-%dT%T.%f %-9!k %20!s:%-5# %-20!! ] %v%$";

   class thread_name_formatter_flag : public spdlog::custom_flag_formatter {
      public:
         void format(const spdlog::details::log_msg&, const std::tm&, spdlog::memory_buf_t& dest) override {
            const std::string& some_txt = get_thread_name();
            spdlog::details::scoped_padder p(some_txt.size(), padinfo_, dest);
            spdlog::details::fmt_helper::append_string_view(some_txt, dest);
         }

         std::unique_ptr<custom_flag_formatter> clone() const override {
            return spdlog::details::make_unique<thread_name_formatter_flag>();
         }
   };

   namespace {
      std::unique_ptr<spdlog::pattern_formatter> make_formatter() {
         auto formatter = std::make_unique<spdlog::pattern_formatter>(spdlog::pattern_time_type::utc);
         formatter->add_flag<thread_name_formatter_flag>('k').set_pattern(DEFAULT_PATTERN);
         return formatter;
      }
   }

   class logger::impl {
      public:
         explicit impl( const std::string& name = {} ) {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            sink->set_color(spdlog::level::debug, sink->green);
            sink->set_color(spdlog::level::info, sink->reset);
            sink->set_color(spdlog::level::warn, sink->yellow);
            sink->set_color(spdlog::level::err, sink->red);
            _agent_logger = std::make_unique<spdlog::logger>( name, sink );
            _agent_logger->set_formatter(make_formatter());
            _agent_logger->set_level(spdlog::level::info);
         }

         bool             _enabled = true;
         log_level        _level = log_level::info;
         std::unique_ptr<spdlog::logger> _agent_logger;
         std::vector<std::shared_ptr<spdlog::sinks::sink>> _sinks;
   };

    logger::logger()
    :my( std::make_shared<impl>() ){}

    logger::logger( const std::string& name )
    :my( std::make_shared<impl>( name ) ){}

    logger::logger( const logger& l ) = default;
    logger::logger( logger&& l ) noexcept = default;
    logger::~logger() = default;
    logger& logger::operator=( const logger& l ) = default;
    logger& logger::operator=( logger&& l ) noexcept = default;

    void logger::set_enabled( bool e ) {
       my->_enabled = e;
    }
    bool logger::is_enabled()const {
       return my->_enabled;
    }
    bool logger::is_enabled( log_level e )const {
       return my->_enabled && e >= my->_level;
    }

    logger logger::get( const std::string& s ) {
       return log_config::get_logger( s );
    }

    logger& logger::default_logger() {
       return the_default_logger;
    }

    log_level logger::get_log_level()const { return my->_level; }
    logger& logger::set_log_level(log_level ll) {
       my->_level = ll;
       switch (ll.value) {
       case log_level::all:
          my->_agent_logger->set_level(spdlog::level::trace);
          break;
       case log_level::debug:
          my->_agent_logger->set_level(spdlog::level::debug);
          break;
       case log_level::info:
          my->_agent_logger->set_level(spdlog::level::info);
          break;
       case log_level::warn:
          my->_agent_logger->set_level(spdlog::level::warn);
          break;
       case log_level::error:
          my->_agent_logger->set_level(spdlog::level::err);
          break;
       case log_level::off:
          my->_agent_logger->set_level(spdlog::level::off);
          break;
       }
       return *this;
    }

    std::unique_ptr<spdlog::logger>& logger::get_agent_logger() const { return my->_agent_logger; }

    void logger::update_agent_logger(std::unique_ptr<spdlog::logger>&& al) {
       my->_agent_logger = std::move(al);
       my->_agent_logger->set_formatter(make_formatter());
       set_log_level(my->_level);
    }

    void logger::add_sink(const std::shared_ptr<spdlog::sinks::sink>& s) {
       my->_sinks.push_back(s);
    }

    std::vector<std::shared_ptr<spdlog::sinks::sink> >& logger::get_sinks() const {
       return my->_sinks;
    }

   [[maybe_unused]] static const bool do_default_config = (configure_logging( logging_config::default_config() ), true);

} // namespace idlkit
