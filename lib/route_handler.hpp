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

#ifndef LIB_ROUTE_HANDLER_HPP_
#define LIB_ROUTE_HANDLER_HPP_

#include <string>
#include <vector>

namespace htsget {

struct request;
struct response;

/// Produces a response for requests that the router sends to it; the
/// sub-route holds the path segments remaining below the handler's route.
/// Errors are reported by the handler through response::set_error.
class route_handler {
public:
  route_handler() = default;
  route_handler(const route_handler &) = delete;
  route_handler &
  operator=(const route_handler &) = delete;
  virtual ~route_handler() = default;

  virtual auto
  handle(const std::vector<std::string> &sub_route, const request &req,
         response &resp) -> void = 0;
};

}  // namespace htsget

#endif  // LIB_ROUTE_HANDLER_HPP_
