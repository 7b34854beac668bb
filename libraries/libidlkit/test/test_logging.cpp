// SPDX-License-Identifier: MIT
#include <boost/test/unit_test.hpp>

#include <idlkit/exception/exception.hpp>
#include <idlkit/io/json.hpp>
#include <idlkit/log/logger_config.hpp>

#include <filesystem>

using namespace idlkit;

namespace {

const char* logging_json = R"({
   "sinks": [ { "name": "stderr", "type": "stderr_color_sink",
                "args": { "level_colors": [ { "level": "debug", "color": "green" } ] } } ],
   "loggers": [ { "name": "default", "level": "info", "sinks": [ "stderr" ] },
                { "name": "idl_compiler", "level": "warn", "sinks": [ "stderr" ] } ]
})";

struct restore_default_logging {
   ~restore_default_logging() { configure_logging(logging_config::default_config()); }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(logging_tests)

BOOST_AUTO_TEST_CASE(test_parse_logging_config) {
   auto cfg = json::from_string(logging_json).as<logging_config>();
   BOOST_REQUIRE_EQUAL(cfg.sinks.size(), 1u);
   BOOST_CHECK_EQUAL(cfg.sinks[0].type, "stderr_color_sink");
   BOOST_CHECK(cfg.sinks[0].enabled);
   BOOST_REQUIRE_EQUAL(cfg.loggers.size(), 2u);
   BOOST_CHECK_EQUAL(cfg.loggers[1].name, "idl_compiler");
   BOOST_REQUIRE(cfg.loggers[1].level.has_value());
   BOOST_CHECK(cfg.loggers[1].level->value == log_level::warn);
   BOOST_CHECK_EQUAL(cfg.loggers[1].sinks.size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_configure_levels) {
   restore_default_logging restore;
   configure_logging(json::from_string(logging_json).as<logging_config>());

   auto compiler_log = logger::get("idl_compiler");
   BOOST_CHECK(compiler_log.get_log_level().value == log_level::warn);
   BOOST_CHECK(!compiler_log.is_enabled(log_level::debug));
   BOOST_CHECK(compiler_log.is_enabled(log_level::error));

   auto other = logger::get("some_unconfigured_logger");
   BOOST_CHECK(other.get_log_level().value == logger::get().get_log_level().value);
   BOOST_CHECK(other.get_log_level().value == log_level::info);
}

BOOST_AUTO_TEST_CASE(test_unknown_sink_type) {
   restore_default_logging restore;
   auto cfg = json::from_string(R"({"sinks": [{"name": "x", "type": "syslog_sink"}]})").as<logging_config>();
   BOOST_CHECK_THROW(configure_logging(cfg), invalid_arg_exception);
}

BOOST_AUTO_TEST_CASE(test_unknown_sink_reference) {
   restore_default_logging restore;
   auto cfg = json::from_string(R"({"loggers": [{"name": "default", "sinks": ["missing"]}]})").as<logging_config>();
   BOOST_CHECK_THROW(configure_logging(cfg), invalid_arg_exception);
}

BOOST_AUTO_TEST_CASE(test_configure_from_file) {
   restore_default_logging restore;
   auto path = std::filesystem::temp_directory_path() / "idlkit_test_logging.json";
   json::save_to_file(json::from_string(logging_json), path);
   configure_logging(path);
   std::filesystem::remove(path);

   BOOST_CHECK(logger::get("idl_compiler").get_log_level().value == log_level::warn);
   BOOST_CHECK_EQUAL(logger::get("idl_compiler").get_log_level().to_string(), "warn");
   BOOST_CHECK_THROW(configure_logging(path), file_not_found_exception);
}

BOOST_AUTO_TEST_CASE(test_bad_level_name) {
   BOOST_CHECK_THROW(json::from_string(R"({"name": "x", "level": "loud"})").as<logger_config>(), bad_cast_exception);
}

BOOST_AUTO_TEST_SUITE_END()
