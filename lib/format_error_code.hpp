/* MIT License
 *
 * Copyright (c) 2025 Andrew D Smith
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef LIB_FORMAT_ERROR_CODE_HPP_
#define LIB_FORMAT_ERROR_CODE_HPP_

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

/// @brief Violations of the binary layouts read by the server: BGZF block
/// headers, the BAM header and the BAI index
enum class format_error_code : std::uint8_t {
  // clang-format off
  ok =                          0,
  unexpected_end_of_stream =    1,
  invalid_block_magic =         2,
  invalid_extra_length =        3,
  invalid_subfield_identifier = 4,
  invalid_subfield_length =     5,
  invalid_block_size =          6,
  invalid_bam_magic =           7,
  invalid_header_field =        8,
  invalid_index_magic =         9,
  invalid_index_field =        10,
  // clang-format on
};

template <>
struct std::is_error_code_enum<format_error_code> : public std::true_type {};

struct format_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "format_error_code";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "unexpected end of stream"s;
    case 2: return "invalid gzip magic in block header"s;
    case 3: return "extra field length is not 6"s;
    case 4: return "invalid extra subfield identifier"s;
    case 5: return "extra subfield length is not 2"s;
    case 6: return "block size smaller than its header"s;
    case 7: return "invalid BAM magic"s;
    case 8: return "negative length in BAM header"s;
    case 9: return "invalid BAI magic"s;
    case 10: return "negative count in BAI index"s;
    }
    std::unreachable();
  }
  // clang-format on
};

[[nodiscard]] inline auto
get_format_error_category() -> const std::error_category & {
  static const auto category = format_error_category{};
  return category;
}

inline auto
make_error_code(format_error_code e) -> std::error_code {
  return std::error_code(std::to_underlying(e), get_format_error_category());
}

#endif  // LIB_FORMAT_ERROR_CODE_HPP_
