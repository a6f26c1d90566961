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

#ifndef LIB_HTSGET_ERROR_CODE_HPP_
#define LIB_HTSGET_ERROR_CODE_HPP_

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

/// @brief Errors reported to htsget clients; each maps to an error kind
/// and HTTP status in the response
enum class htsget_error_code : std::uint8_t {
  // clang-format off
  ok =                             0,
  not_found =                      1,
  unsupported_media_type =         2,
  unsupported_format =             3,
  invalid_input =                  4,
  invalid_range =                  5,
  method_not_allowed =             6,
  index_construction_unsupported = 7,
  unknown_error =                  8,
  // clang-format on
};

template <>
struct std::is_error_code_enum<htsget_error_code> : public std::true_type {};

struct htsget_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "htsget_error_code";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "the resource requested was not found"s;
    case 2: return "the requested media type is unsupported"s;
    case 3: return "the requested format is unsupported"s;
    case 4: return "invalid input"s;
    case 5: return "invalid range"s;
    case 6: return "method not allowed"s;
    case 7: return "index construction unsupported"s;
    case 8: return "unknown error"s;
    }
    std::unreachable();
  }
  // clang-format on
};

[[nodiscard]] inline auto
get_htsget_error_category() -> const std::error_category & {
  static const auto category = htsget_error_category{};
  return category;
}

inline auto
make_error_code(htsget_error_code e) -> std::error_code {
  return std::error_code(std::to_underlying(e), get_htsget_error_category());
}

#endif  // LIB_HTSGET_ERROR_CODE_HPP_
