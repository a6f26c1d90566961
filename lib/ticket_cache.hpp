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

#ifndef LIB_TICKET_CACHE_HPP_
#define LIB_TICKET_CACHE_HPP_

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace htsget {

/// Serialized tickets by data resource id. Each key is written at most
/// once: the first stored ticket stays for the life of the cache.
struct ticket_cache {
  ticket_cache() = default;

  // clang-format off
  ticket_cache(const ticket_cache &) = delete;
  ticket_cache &operator=(const ticket_cache &) = delete;
  ticket_cache(ticket_cache &&) noexcept = delete;
  ticket_cache &operator=(ticket_cache &&) noexcept = delete;
  // clang-format on

  [[nodiscard]] auto
  get(const std::string &key) const -> std::optional<std::string>;

  /// Store 'payload' unless the key already has a value; returns the value
  /// held for the key afterwards
  [[nodiscard]] auto
  insert(const std::string &key, std::string payload) -> std::string;

  [[nodiscard]] auto
  size() const -> std::size_t;

  mutable std::mutex mtx;
  std::unordered_map<std::string, std::string> tickets;
};

}  // namespace htsget

#endif  // LIB_TICKET_CACHE_HPP_
