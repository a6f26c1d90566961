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

#ifndef LIB_API_HANDLER_HPP_
#define LIB_API_HANDLER_HPP_

#include "route_handler.hpp"
#include "ticket.hpp"
#include "ticket_cache.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace htsget {

class data_store;
class resource;
struct request;
struct response;

/// Ticket endpoint for one data type. The sub-route is the record ID, and
/// the 'format' query parameter selects among the accepted formats.
/// Tickets are cached by data resource for the life of the handler.
class api_handler : public route_handler {
public:
  api_handler(std::shared_ptr<data_store> store, std::string base_url,
              const std::uint64_t block_size);

  auto
  handle(const std::vector<std::string> &sub_route, const request &req,
         response &resp) -> void override;

  /// Serialized ticket for a record, from the cache when present
  [[nodiscard]] auto
  get_ticket(const std::vector<std::string> &record_id,
             const std::optional<std::string> &format_param,
             std::error_code &ec) -> std::string;

  [[nodiscard]] auto
  get_cache() const -> const ticket_cache & {
    return cache;
  }

  [[nodiscard]] virtual auto
  default_format() const -> std::string_view = 0;

  [[nodiscard]] virtual auto
  index_format() const -> std::string_view = 0;

  [[nodiscard]] virtual auto
  accepted_formats() const -> std::span<const std::string_view> = 0;

protected:
  /// URLs of a ticket; the default covers the whole data file without
  /// URL classes
  [[nodiscard]] virtual auto
  make_urls(const std::string &format, const resource &data,
            const resource *index,
            std::error_code &ec) const -> std::vector<url_spec>;

  std::shared_ptr<data_store> store;
  std::string base_url;
  std::uint64_t block_size{};

private:
  ticket_cache cache;
};

class reads_handler : public api_handler {
public:
  static constexpr std::array<std::string_view, 2> formats{"BAM", "CRAM"};

  using api_handler::api_handler;

  [[nodiscard]] auto
  default_format() const -> std::string_view override {
    return "BAM";
  }

  [[nodiscard]] auto
  index_format() const -> std::string_view override {
    return "BAI";
  }

  [[nodiscard]] auto
  accepted_formats() const -> std::span<const std::string_view> override {
    return formats;
  }

protected:
  /// For BAM: a header URL ending at the header boundary, then body URLs
  [[nodiscard]] auto
  make_urls(const std::string &format, const resource &data,
            const resource *index,
            std::error_code &ec) const -> std::vector<url_spec> override;
};

class variants_handler : public api_handler {
public:
  static constexpr std::array<std::string_view, 2> formats{"VCF", "BCF"};

  using api_handler::api_handler;

  [[nodiscard]] auto
  default_format() const -> std::string_view override {
    return "VCF";
  }

  [[nodiscard]] auto
  index_format() const -> std::string_view override {
    return "TBI";
  }

  [[nodiscard]] auto
  accepted_formats() const -> std::span<const std::string_view> override {
    return formats;
  }
};

}  // namespace htsget

#endif  // LIB_API_HANDLER_HPP_
