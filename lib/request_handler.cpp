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

#include "request_handler.hpp"

#include "api_handler.hpp"
#include "block_handler.hpp"
#include "content_negotiation.hpp"
#include "htsget_error_code.hpp"
#include "logger.hpp"
#include "request.hpp"
#include "response.hpp"
#include "route_handler.hpp"
#include "router.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace htsget {

[[nodiscard]] auto
make_default_router(const std::shared_ptr<data_store> &store,
                    const std::string &base_url,
                    const std::uint64_t block_size) -> router {
  router rtr;
  rtr.add_route({"reads"},
                std::make_shared<reads_handler>(store, base_url, block_size));
  rtr.add_route({"variants"}, std::make_shared<variants_handler>(
                                store, base_url, block_size));
  rtr.add_route({"block"}, std::make_shared<block_handler>(store, block_size));
  return rtr;
}

request_handler::request_handler(const std::shared_ptr<data_store> &store,
                                 const std::string &base_url,
                                 const std::uint64_t block_size) :
  rtr{make_default_router(store, base_url, block_size)} {}

auto
request_handler::handle_request(const std::string_view method,
                                const std::string_view target,
                                const std::optional<std::string_view> accept,
                                response &resp) const -> void {
  auto &lgr = logger::instance();
  std::error_code ec;

  if (method != "GET") {
    lgr.warning("Method not allowed: {} {}", method, target);
    resp.set_error(htsget_error_code::method_not_allowed);
    return;
  }

  check_accept(accept, ec);
  if (ec) {
    lgr.warning("Rejected Accept header {}: {}", accept.value_or(""), ec);
    resp.set_error(ec);
    return;
  }

  auto req = request::parse_target(target, ec);
  if (ec) {
    lgr.warning("Malformed target {}: {}", target, ec);
    resp.set_error(ec);
    return;
  }
  if (accept)
    req.accept = std::string(*accept);

  const auto [handler, sub_route] = rtr.resolve(req.path, ec);
  if (ec) {
    lgr.warning("No route for {}: {}", target, ec);
    resp.set_error(ec);
    return;
  }
  lgr.debug("Request: {}", req);

  try {
    handler->handle(sub_route, req, resp);
  }
  catch (const std::exception &e) {
    lgr.error("Error handling {}: {}", target, e.what());
    resp.set_error(classify_error(htsget_error_code::unknown_error), e.what());
  }
  if (!resp.ok())
    lgr.warning("Responding {} to {}: {}", resp.status, target, resp.body);
}

}  // namespace htsget
