// SPDX-License-Identifier: MIT
#include <idlkit/solana/idl_exceptions.hpp>

namespace idlkit::solana::idl {

void decode_exception::prepend_path(std::string_view segment) {
   if (_path.empty() || _path.front() == '[' || _path.front() == ':')
      _path.insert(0, segment);
   else
      _path.insert(0, std::string(segment) + ".");
}

std::string decode_exception::to_detail_string() const {
   auto result = idlkit::exception::to_detail_string();
   if (!_path.empty())
      result += fmt::format("\n    at path '{}'", _path);
   return result;
}

truncated_buffer_exception::truncated_buffer_exception(size_t offset, size_t bytes_needed, size_t bytes_available)
   : decode_exception(fmt::format("Buffer too short at offset {}: need {} bytes, {} available", offset, bytes_needed,
                                  bytes_available),
                      offset, code_value, "truncated_buffer_exception", "Buffer too short")
   , _bytes_needed(bytes_needed)
   , _bytes_available(bytes_available) {}

invalid_utf8_exception::invalid_utf8_exception(size_t offset)
   : decode_exception(fmt::format("Invalid UTF-8 sequence at offset {}", offset), offset, code_value,
                      "invalid_utf8_exception", "Invalid UTF-8 string") {}

invalid_option_tag_exception::invalid_option_tag_exception(size_t offset, uint8_t tag)
   : decode_exception(fmt::format("Invalid option tag {} at offset {}", tag, offset), offset, code_value,
                      "invalid_option_tag_exception", "Invalid option tag")
   , _tag(tag) {}

invalid_discriminant_exception::invalid_discriminant_exception(size_t offset, uint64_t value, size_t variant_count)
   : decode_exception(
        fmt::format("Enum discriminant {} at offset {} is out of range for {} variants", value, offset, variant_count),
        offset, code_value, "invalid_discriminant_exception", "Invalid enum discriminant")
   , _value(value)
   , _variant_count(variant_count) {}

invalid_bool_exception::invalid_bool_exception(size_t offset, uint8_t byte)
   : decode_exception(fmt::format("Invalid bool byte {} at offset {}", byte, offset), offset, code_value,
                      "invalid_bool_exception", "Invalid bool byte")
   , _byte(byte) {}

depth_limit_exceeded_exception::depth_limit_exceeded_exception(size_t offset, size_t max_depth)
   : decode_exception(fmt::format("Nesting deeper than {} levels at offset {}", max_depth, offset), offset, code_value,
                      "depth_limit_exceeded_exception", "Nesting depth limit exceeded") {}

zero_size_elements_exception::zero_size_elements_exception(size_t offset, uint64_t count)
   : decode_exception(fmt::format("Length {} at offset {} counts zero-size elements", count, offset), offset,
                      code_value, "zero_size_elements_exception", "Collection of zero-size elements")
   , _count(count) {}

}  // namespace idlkit::solana::idl
