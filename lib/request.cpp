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

#include "request.hpp"

#include "htsget_error_code.hpp"

#include <charconv>  // for std::from_chars
#include <cstdint>
#include <format>
#include <iterator>  // for std::size, std::cend
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>  // for std::move
#include <vector>

namespace htsget {

[[nodiscard]] auto
request::get_param(const std::string &key) const -> std::optional<std::string> {
  const auto itr = query.find(key);
  if (itr == std::cend(query) || itr->second.empty())
    return std::nullopt;
  return itr->second.front();
}

[[nodiscard]] auto
request::summary() const -> std::string {
  std::string path_str;
  for (const auto &segment : path)
    path_str += std::format("/{}", segment);
  std::string query_str;
  for (const auto &[key, values] : query)
    for (const auto &value : values)
      query_str += std::format("{}{}={}", query_str.empty() ? "?" : "&", key,
                               value);
  return std::format("{}{} accept={}", path_str.empty() ? "/" : path_str,
                     query_str, accept.value_or("none"));
}

[[nodiscard]] auto
percent_decode(const std::string_view s, const bool plus_is_space,
               std::error_code &ec) -> std::string {
  std::string decoded;
  decoded.reserve(std::size(s));
  for (std::size_t i = 0; i < std::size(s); ++i) {
    if (s[i] == '%') {
      if (i + 2 >= std::size(s)) {
        ec = htsget_error_code::invalid_input;
        return {};
      }
      std::uint8_t value{};
      const auto first = s.data() + i + 1;
      const auto [ptr, from_ec] = std::from_chars(first, first + 2, value, 16);
      if (from_ec != std::errc{} || ptr != first + 2) {
        ec = htsget_error_code::invalid_input;
        return {};
      }
      decoded += static_cast<char>(value);
      i += 2;
    }
    else if (plus_is_space && s[i] == '+')
      decoded += ' ';
    else
      decoded += s[i];
  }
  return decoded;
}

[[nodiscard]] auto
parse_query(const std::string_view query,
            std::error_code &ec) -> query_params {
  query_params params;
  for (const auto field : std::views::split(query, '&')) {
    const std::string_view kv(std::ranges::begin(field),
                              std::ranges::end(field));
    if (kv.empty())
      continue;
    const auto eq = kv.find('=');
    if (eq == std::string_view::npos) {
      ec = htsget_error_code::invalid_input;
      return {};
    }
    auto key = percent_decode(kv.substr(0, eq), true, ec);
    if (ec)
      return {};
    auto value = percent_decode(kv.substr(eq + 1), true, ec);
    if (ec)
      return {};
    params[std::move(key)].push_back(std::move(value));
  }
  return params;
}

[[nodiscard]] auto
request::parse_target(const std::string_view target,
                      std::error_code &ec) -> request {
  if (target.empty() || target.front() != '/') {
    ec = htsget_error_code::invalid_input;
    return {};
  }
  const auto query_start = target.find('?');
  const auto path_part = target.substr(1, query_start == std::string_view::npos
                                            ? std::string_view::npos
                                            : query_start - 1);
  request req;
  if (!path_part.empty()) {
    for (const auto segment : std::views::split(path_part, '/')) {
      const std::string_view s(std::ranges::begin(segment),
                               std::ranges::end(segment));
      req.path.push_back(percent_decode(s, false, ec));
      if (ec)
        return {};
    }
  }
  if (query_start != std::string_view::npos) {
    req.query = parse_query(target.substr(query_start + 1), ec);
    if (ec)
      return {};
  }
  return req;
}

}  // namespace htsget
