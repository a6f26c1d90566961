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

#include "block_handler.hpp"

#include "data_store.hpp"
#include "htsget_error_code.hpp"
#include "logger.hpp"
#include "request.hpp"
#include "resource.hpp"
#include "response.hpp"

#include <charconv>  // for std::from_chars
#include <cstdint>
#include <iterator>  // for std::size
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace htsget {

[[nodiscard]] static auto
parse_offset(const std::string &s, std::error_code &ec) -> std::uint64_t {
  std::uint64_t value{};
  const auto last = s.data() + std::size(s);
  const auto [ptr, from_ec] = std::from_chars(s.data(), last, value);
  if (s.empty() || from_ec != std::errc{} || ptr != last)
    ec = htsget_error_code::invalid_input;
  return value;
}

[[nodiscard]] auto
block_handler::get_range(const request &req, const std::uint64_t file_size,
                         std::error_code &ec) const
  -> std::pair<std::uint64_t, std::uint64_t> {
  const auto start_param = req.get_param("start");
  const auto end_param = req.get_param("end");
  if (!start_param && !end_param) {
    if (file_size > block_size) {
      ec = htsget_error_code::invalid_range;
      return {};
    }
    return {0, file_size};
  }
  if (!start_param || !end_param) {
    ec = htsget_error_code::invalid_input;
    return {};
  }

  const auto start = parse_offset(*start_param, ec);
  if (ec)
    return {};
  const auto end = parse_offset(*end_param, ec);
  if (ec)
    return {};
  if (start >= end || end > file_size || end - start > block_size) {
    ec = htsget_error_code::invalid_range;
    return {};
  }
  return {start, end};
}

auto
block_handler::handle(const std::vector<std::string> &sub_route,
                      const request &req, response &resp) -> void {
  std::error_code ec;
  const auto data = store->lookup(sub_route, ec);
  if (ec) {
    resp.set_error(ec);
    return;
  }

  const auto file_size = data->size(ec);
  if (ec) {
    resp.set_error(ec);
    return;
  }

  const auto [start, end] = get_range(req, file_size, ec);
  if (ec) {
    resp.set_error(ec);
    return;
  }

  auto in = data->open_range(start, end, ec);
  if (ec) {
    logger::instance().error("Failed to open {} [{}, {}): {}", data->id(),
                             start, end, ec);
    resp.set_error(ec);
    return;
  }

  resp.status = 200;
  resp.content_type = response::block_content_type;
  resp.source = body_source{std::move(in), end - start};
}

}  // namespace htsget
