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

#ifndef LIB_TICKET_HPP_
#define LIB_TICKET_HPP_

#include <boost/describe.hpp>
#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace htsget {

struct url_spec {
  static constexpr auto header_class = "header";
  static constexpr auto body_class = "body";

  std::string url;
  std::optional<std::string> url_class;

  [[nodiscard]] auto
  operator==(const url_spec &) const -> bool = default;
};

/// Instructions for a client to fetch the data of one record: the format
/// and the ordered list of URLs whose concatenated content is the data
struct ticket {
  std::string format;
  std::vector<url_spec> urls;

  [[nodiscard]] auto
  operator==(const ticket &) const -> bool = default;

  /// {"htsget": {"format": FORMAT, "urls": [...]}}; the same ticket always
  /// serializes to the same bytes
  [[nodiscard]] auto
  serialize() const -> std::string;

  [[nodiscard]] static auto
  parse(const std::string_view payload, std::error_code &ec) -> ticket;
};
BOOST_DESCRIBE_STRUCT(ticket, (), (format, urls))

struct ticket_response {
  ticket htsget;
};
BOOST_DESCRIBE_STRUCT(ticket_response, (), (htsget))

// "class" is reserved in C++, so url_spec has its own conversions
auto
tag_invoke(boost::json::value_from_tag, boost::json::value &jv,
           const url_spec &u) -> void;

[[nodiscard]] auto
tag_invoke(boost::json::try_value_to_tag<url_spec>,
           const boost::json::value &jv) -> boost::system::result<url_spec>;

/// URL of the bytes [start, end) of a resource served by the block route
[[nodiscard]] auto
block_url(const std::string_view base_url, const std::string_view resource_id,
          const std::uint64_t start, const std::uint64_t end) -> std::string;

/// Block URLs covering [start, end) in pieces of at most 'block_size' bytes
[[nodiscard]] auto
block_urls(const std::string_view base_url, const std::string_view resource_id,
           const std::uint64_t start, const std::uint64_t end,
           const std::uint64_t block_size,
           const std::optional<std::string> &url_class)
  -> std::vector<url_spec>;

}  // namespace htsget

#endif  // LIB_TICKET_HPP_
