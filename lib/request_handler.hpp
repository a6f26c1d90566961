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

#ifndef LIB_REQUEST_HANDLER_HPP_
#define LIB_REQUEST_HANDLER_HPP_

#include "router.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>  // for std::move

namespace htsget {

class data_store;
struct response;

/// Handles all incoming requests: checks the method and the Accept
/// header, then dispatches on the route of the target
struct request_handler {
  request_handler(const request_handler &) = delete;
  request_handler &
  operator=(const request_handler &) = delete;

  explicit request_handler(router rtr) : rtr{std::move(rtr)} {}

  /// Routes /reads, /variants and /block over one data store
  request_handler(const std::shared_ptr<data_store> &store,
                  const std::string &base_url, const std::uint64_t block_size);

  auto
  handle_request(const std::string_view method, const std::string_view target,
                 const std::optional<std::string_view> accept,
                 response &resp) const -> void;

  router rtr;
};

/// The router used by the server: reads and variants ticket endpoints and
/// the block endpoint that their tickets point to
[[nodiscard]] auto
make_default_router(const std::shared_ptr<data_store> &store,
                    const std::string &base_url,
                    const std::uint64_t block_size) -> router;

}  // namespace htsget

#endif  // LIB_REQUEST_HANDLER_HPP_
