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

#ifndef LIB_BLOCK_HANDLER_HPP_
#define LIB_BLOCK_HANDLER_HPP_

#include "route_handler.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <utility>  // for std::pair
#include <vector>

namespace htsget {

class data_store;
struct request;
struct response;

/// Serves the bytes [start, end) of a file below the store's root; the
/// sub-route is the path of the file
class block_handler : public route_handler {
public:
  block_handler(std::shared_ptr<data_store> store,
                const std::uint64_t block_size) :
    store{std::move(store)}, block_size{block_size} {}

  auto
  handle(const std::vector<std::string> &sub_route, const request &req,
         response &resp) -> void override;

  /// Range to serve from a file of 'file_size' bytes. Without 'start' and
  /// 'end' the range is the whole file.
  [[nodiscard]] auto
  get_range(const request &req, const std::uint64_t file_size,
            std::error_code &ec) const
    -> std::pair<std::uint64_t, std::uint64_t>;

private:
  std::shared_ptr<data_store> store;
  std::uint64_t block_size{};
};

}  // namespace htsget

#endif  // LIB_BLOCK_HANDLER_HPP_
