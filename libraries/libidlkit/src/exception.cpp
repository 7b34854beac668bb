// SPDX-License-Identifier: MIT
#include <idlkit/exception/exception.hpp>

namespace idlkit {

exception::exception(int64_t code, std::string name_value, std::string what_value)
   : _code(code)
   , _name(std::move(name_value))
   , _what(std::move(what_value)) {}

exception::exception(std::string message, int64_t code, std::string name_value, std::string what_value)
   : _code(code)
   , _name(std::move(name_value))
   , _what(std::move(what_value)) {
   if (!message.empty())
      _log.push_back(std::move(message));
}

exception::~exception() = default;

void exception::append_log(std::string message) {
   _log.push_back(std::move(message));
}

std::string exception::top_message() const {
   if (_log.empty())
      return _what;
   return _log.front();
}

std::string exception::to_string() const {
   return fmt::format("{}: {}", _name, top_message());
}

std::string exception::to_detail_string() const {
   std::string result = fmt::format("{} {} {}", _code, _name, _what);
   for (const auto& line : _log) {
      result += "\n    ";
      result += line;
   }
   return result;
}

std::shared_ptr<exception> exception::dynamic_copy_exception() const {
   return std::make_shared<exception>(*this);
}

void exception::dynamic_rethrow_exception() const {
   throw *this;
}

} // namespace idlkit
