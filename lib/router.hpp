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

#ifndef LIB_ROUTER_HPP_
#define LIB_ROUTER_HPP_

#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <utility>  // for std::pair
#include <vector>

namespace htsget {

class route_handler;

/// Trie over path segments. Each node is either inner, mapping segments to
/// child nodes, or a leaf bound to a handler. Built before the server
/// starts and read-only afterwards.
class router {
public:
  /// Bind 'handler' at 'route'; replaces any handler or subtree already at
  /// that route, and turns leaves on the way into inner nodes
  auto
  add_route(const std::vector<std::string> &route,
            std::shared_ptr<route_handler> handler) -> void;

  /// The handler of the leaf reached along 'path', with the segments of
  /// 'path' below that leaf; not_found if no leaf is reached
  [[nodiscard]] auto
  resolve(const std::vector<std::string> &path, std::error_code &ec) const
    -> std::pair<std::shared_ptr<route_handler>, std::vector<std::string>>;

private:
  struct node {
    std::shared_ptr<route_handler> handler;  // non-null only at a leaf
    std::map<std::string, std::unique_ptr<node>> children;

    [[nodiscard]] auto
    is_leaf() const -> bool {
      return handler != nullptr;
    }
  };

  node root;
};

}  // namespace htsget

#endif  // LIB_ROUTER_HPP_
