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

#include "router.hpp"

#include "htsget_error_code.hpp"
#include "route_handler.hpp"

#include <iterator>  // for std::cbegin, std::cend
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace htsget {

auto
router::add_route(const std::vector<std::string> &route,
                  std::shared_ptr<route_handler> handler) -> void {
  node *current = &root;
  for (const auto &segment : route) {
    // descending through a leaf makes it an inner node
    current->handler.reset();
    auto &child = current->children[segment];
    if (child == nullptr)
      child = std::make_unique<node>();
    current = child.get();
  }
  current->children.clear();
  current->handler = std::move(handler);
}

[[nodiscard]] auto
router::resolve(const std::vector<std::string> &path, std::error_code &ec) const
  -> std::pair<std::shared_ptr<route_handler>, std::vector<std::string>> {
  const node *current = &root;
  auto segment = std::cbegin(path);
  while (!current->is_leaf()) {
    if (segment == std::cend(path)) {
      ec = htsget_error_code::not_found;
      return {};
    }
    const auto child = current->children.find(*segment);
    if (child == std::cend(current->children)) {
      ec = htsget_error_code::not_found;
      return {};
    }
    current = child->second.get();
    ++segment;
  }
  return {current->handler, {segment, std::cend(path)}};
}

}  // namespace htsget
