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

#include "api_handler.hpp"

#include "data_store.hpp"
#include "format_error_code.hpp"
#include "header_boundary.hpp"
#include "htsget_error_code.hpp"
#include "logger.hpp"
#include "request.hpp"
#include "resource.hpp"
#include "response.hpp"
#include "ticket.hpp"

#include <algorithm>  // for std::ranges::transform, std::ranges::find
#include <cctype>     // for std::toupper
#include <cstdint>
#include <iterator>  // for std::begin, std::make_move_iterator
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>  // for std::move
#include <vector>

namespace htsget {

api_handler::api_handler(std::shared_ptr<data_store> store,
                         std::string base_url,
                         const std::uint64_t block_size) :
  store{std::move(store)}, base_url{std::move(base_url)},
  block_size{block_size} {}

auto
api_handler::handle(const std::vector<std::string> &sub_route,
                    const request &req, response &resp) -> void {
  std::error_code ec;
  auto payload = get_ticket(sub_route, req.get_param("format"), ec);
  if (ec) {
    resp.set_error(ec);
    return;
  }
  resp.status = 200;
  resp.content_type = response::ticket_content_type;
  resp.body = std::move(payload);
}

[[nodiscard]] auto
api_handler::get_ticket(const std::vector<std::string> &record_id,
                        const std::optional<std::string> &format_param,
                        std::error_code &ec) -> std::string {
  auto &lgr = logger::instance();

  std::string format{format_param.value_or(std::string(default_format()))};
  std::ranges::transform(format, std::begin(format), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  const auto accepted = accepted_formats();
  if (std::ranges::find(accepted, std::string_view(format)) ==
      std::cend(accepted)) {
    ec = htsget_error_code::unsupported_format;
    return {};
  }

  if (record_id.empty()) {
    ec = htsget_error_code::not_found;
    return {};
  }

  const auto [data, index] =
    store->resolve(record_id, format, std::string(index_format()), ec);
  if (ec)
    return {};

  const auto key = data->id();
  if (auto cached = cache.get(key)) {
    lgr.debug("Ticket cache hit: {}", key);
    return std::move(*cached);
  }
  lgr.debug("Ticket cache miss: {}", key);

  if (!data->exists()) {
    ec = htsget_error_code::not_found;
    return {};
  }

  bool has_index = index->exists();
  if (!has_index) {
    store->create_index(*data, *index, ec);
    if (ec == htsget_error_code::index_construction_unsupported) {
      lgr.info("No index for {}: {}", key, ec);
      ec.clear();
    }
    else if (ec) {
      lgr.error("Failed to create index {}: {}", index->id(), ec);
      return {};
    }
    else {
      store->add_resource(index);
      has_index = true;
    }
  }

  auto urls = make_urls(format, *data, has_index ? index.get() : nullptr, ec);
  if (ec) {
    lgr.error("Failed to make ticket for {}: {}", key, ec);
    return {};
  }

  const ticket t{format, std::move(urls)};
  return cache.insert(key, t.serialize());
}

[[nodiscard]] auto
api_handler::make_urls([[maybe_unused]] const std::string &format,
                       const resource &data,
                       [[maybe_unused]] const resource *index,
                       std::error_code &ec) const -> std::vector<url_spec> {
  const auto file_size = data.size(ec);
  if (ec)
    return {};
  return block_urls(base_url, data.id(), 0, file_size, block_size,
                    std::nullopt);
}

[[nodiscard]] auto
reads_handler::make_urls(const std::string &format, const resource &data,
                         const resource *index,
                         std::error_code &ec) const -> std::vector<url_spec> {
  if (format != "BAM")
    return api_handler::make_urls(format, data, index, ec);

  const auto file_size = data.size(ec);
  if (ec)
    return {};
  const auto header_size = bam_header_size(data, index, ec);
  if (ec)
    return {};
  if (header_size > file_size) {
    ec = format_error_code::unexpected_end_of_stream;
    return {};
  }

  auto urls = block_urls(base_url, data.id(), 0, header_size, block_size,
                         url_spec::header_class);
  auto body = block_urls(base_url, data.id(), header_size, file_size,
                         block_size, url_spec::body_class);
  urls.insert(std::cend(urls), std::make_move_iterator(std::begin(body)),
              std::make_move_iterator(std::end(body)));
  return urls;
}

}  // namespace htsget
