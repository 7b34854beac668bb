// SPDX-License-Identifier: MIT
#pragma once
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace idlkit {
    uint8_t     from_hex(char c);
    std::string to_hex(const char* d, uint32_t s, bool add_prefix = false);

    template <typename Container>
       requires std::contiguous_iterator<typename Container::const_iterator>
    std::string to_hex(const Container& data, bool add_prefix = false) {
       return to_hex(reinterpret_cast<const char*>(data.data()), static_cast<uint32_t>(data.size()), add_prefix);
    }

    /**
     *  Decodes hex text, with or without a 0x prefix. An odd digit count is read as if it had a
     *  leading zero.
     *  @throws parse_error_exception on a non-hex character
     */
    std::vector<uint8_t> from_hex(std::string_view hex, bool trim_prefix = true);

    std::string_view trim_hex_prefix(std::string_view hex);

} // namespace idlkit
