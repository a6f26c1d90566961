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

#include "content_negotiation.hpp"

#include "htsget_error_code.hpp"
#include "htsget_version.hpp"

#include <algorithm>  // for std::ranges::transform, std::ranges::count
#include <cctype>     // for std::tolower
#include <charconv>   // for std::from_chars
#include <cstdint>
#include <iterator>  // for std::size, std::begin
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace htsget {

[[nodiscard]] static auto
parse_version_number(const std::string_view s) -> std::optional<std::uint32_t> {
  std::uint32_t value{};
  const auto last = s.data() + std::size(s);
  const auto [ptr, ec] = std::from_chars(s.data(), last, value);
  if (s.empty() || ec != std::errc{} || ptr != last)
    return std::nullopt;
  return value;
}

[[nodiscard]] auto
parse_htsget_media_type(const std::string_view subtype)
  -> std::optional<htsget_version> {
  using std::literals::string_view_literals::operator""sv;
  static constexpr auto prefix = "vnd.ga4gh.htsget.v"sv;
  static constexpr auto suffix = "+json"sv;
  if (!subtype.starts_with(prefix) || !subtype.ends_with(suffix) ||
      std::size(subtype) < std::size(prefix) + std::size(suffix))
    return std::nullopt;
  auto version = subtype.substr(std::size(prefix), std::size(subtype) -
                                                     std::size(prefix) -
                                                     std::size(suffix));
  if (std::ranges::count(version, '.') != 2)
    return std::nullopt;

  const auto dot1 = version.find('.');
  const auto dot2 = version.find('.', dot1 + 1);
  const auto major = parse_version_number(version.substr(0, dot1));
  const auto minor =
    parse_version_number(version.substr(dot1 + 1, dot2 - dot1 - 1));
  const auto patch = parse_version_number(version.substr(dot2 + 1));
  if (!major || !minor || !patch)
    return std::nullopt;
  return htsget_version{*major, *minor, *patch};
}

auto
check_accept(const std::optional<std::string_view> accept,
             std::error_code &ec) -> void {
  using std::literals::string_view_literals::operator""sv;
  static constexpr auto application = "application/"sv;
  if (!accept)
    return;
  if (!accept->starts_with(application)) {
    ec = htsget_error_code::unsupported_media_type;
    return;
  }
  std::string subtype{accept->substr(std::size(application))};
  std::ranges::transform(subtype, std::begin(subtype), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (subtype == "json")
    return;

  const auto requested = parse_htsget_media_type(subtype);
  if (!requested || *requested < supported_htsget_version ||
      requested->major > supported_htsget_version.major)
    ec = htsget_error_code::unsupported_media_type;
}

}  // namespace htsget
