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

#include "ticket.hpp"

#include "htsget_error_code.hpp"

#include <boost/json.hpp>

#include <algorithm>  // for std::min
#include <cctype>     // for std::isalnum
#include <cstdint>
#include <format>
#include <iterator>  // for std::back_inserter
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace htsget {

auto
tag_invoke(boost::json::value_from_tag, boost::json::value &jv,
           const url_spec &u) -> void {
  auto &obj = jv.emplace_object();
  obj["url"] = u.url;
  if (u.url_class)
    obj["class"] = *u.url_class;
}

[[nodiscard]] auto
tag_invoke(boost::json::try_value_to_tag<url_spec>,
           const boost::json::value &jv) -> boost::system::result<url_spec> {
  const auto *obj = jv.if_object();
  if (obj == nullptr)
    return boost::json::error::not_object;
  const auto *url = obj->if_contains("url");
  if (url == nullptr || !url->is_string())
    return boost::json::error::not_string;
  url_spec u{std::string(url->get_string()), std::nullopt};
  if (const auto *url_class = obj->if_contains("class")) {
    if (!url_class->is_string())
      return boost::json::error::not_string;
    u.url_class = std::string(url_class->get_string());
  }
  return u;
}

[[nodiscard]] auto
ticket::serialize() const -> std::string {
  return boost::json::serialize(boost::json::value_from(ticket_response{*this}));
}

[[nodiscard]] auto
ticket::parse(const std::string_view payload, std::error_code &ec) -> ticket {
  boost::system::error_code json_ec;
  const auto jv = boost::json::parse(payload, json_ec);
  if (json_ec) {
    ec = htsget_error_code::invalid_input;
    return {};
  }
  const auto parsed = boost::json::try_value_to<ticket_response>(jv);
  if (!parsed) {
    ec = htsget_error_code::invalid_input;
    return {};
  }
  return parsed->htsget;
}

[[nodiscard]] static auto
percent_encode_path(const std::string_view path) -> std::string {
  static constexpr auto unreserved = "-._~/";
  std::string encoded;
  for (const unsigned char c : path) {
    if (std::isalnum(c) || std::string_view(unreserved).contains(c))
      encoded += static_cast<char>(c);
    else
      std::format_to(std::back_inserter(encoded), "%{:02X}", c);
  }
  return encoded;
}

[[nodiscard]] auto
block_url(const std::string_view base_url, const std::string_view resource_id,
          const std::uint64_t start, const std::uint64_t end) -> std::string {
  return std::format("{}/block/{}?start={}&end={}", base_url,
                     percent_encode_path(resource_id), start, end);
}

[[nodiscard]] auto
block_urls(const std::string_view base_url, const std::string_view resource_id,
           const std::uint64_t start, const std::uint64_t end,
           const std::uint64_t block_size,
           const std::optional<std::string> &url_class)
  -> std::vector<url_spec> {
  std::vector<url_spec> urls;
  if (block_size == 0)
    return urls;
  for (auto offset = start; offset < end;) {
    const auto next = offset + std::min(block_size, end - offset);
    urls.emplace_back(block_url(base_url, resource_id, offset, next),
                      url_class);
    offset = next;
  }
  return urls;
}

}  // namespace htsget
