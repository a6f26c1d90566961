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

#include "ticket_cache.hpp"

#include <cstddef>
#include <iterator>  // for std::cend, std::size
#include <mutex>     // for std::scoped_lock
#include <optional>
#include <string>
#include <utility>  // for std::move

namespace htsget {

[[nodiscard]] auto
ticket_cache::get(const std::string &key) const -> std::optional<std::string> {
  std::scoped_lock lock{mtx};
  const auto itr = tickets.find(key);
  if (itr == std::cend(tickets))
    return std::nullopt;
  return itr->second;
}

[[nodiscard]] auto
ticket_cache::insert(const std::string &key,
                     std::string payload) -> std::string {
  std::scoped_lock lock{mtx};
  // does nothing if the key is present
  const auto itr = tickets.try_emplace(key, std::move(payload)).first;
  return itr->second;
}

[[nodiscard]] auto
ticket_cache::size() const -> std::size_t {
  std::scoped_lock lock{mtx};
  return std::size(tickets);
}

}  // namespace htsget
