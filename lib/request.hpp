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

#ifndef LIB_REQUEST_HPP_
#define LIB_REQUEST_HPP_

#include <format>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace htsget {

typedef std::map<std::string, std::vector<std::string>> query_params;

/// An htsget request as seen by route handlers: the decoded path segments
/// of the target, its query parameters and the Accept header
struct request {
  std::vector<std::string> path;
  query_params query;
  std::optional<std::string> accept;

  /// First value of a query parameter, if it was given
  [[nodiscard]] auto
  get_param(const std::string &key) const -> std::optional<std::string>;

  [[nodiscard]] auto
  summary() const -> std::string;

  /// Split a request target into path segments and query parameters. The
  /// path must start with '/'. Segments and query keys and values are
  /// percent-decoded, and '+' in the query means a space. Empty values
  /// are kept; a query field without '=' is invalid.
  [[nodiscard]] static auto
  parse_target(const std::string_view target, std::error_code &ec) -> request;
};

/// Decode '%XX' escapes; with 'plus_is_space', '+' decodes to ' '
[[nodiscard]] auto
percent_decode(const std::string_view s, const bool plus_is_space,
               std::error_code &ec) -> std::string;

[[nodiscard]] auto
parse_query(const std::string_view query,
            std::error_code &ec) -> query_params;

}  // namespace htsget

template <>
struct std::formatter<htsget::request> : std::formatter<std::string> {
  auto
  format(const htsget::request &r, std::format_context &ctx) const {
    return std::formatter<std::string>::format(r.summary(), ctx);
  }
};

#endif  // LIB_REQUEST_HPP_
