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

#ifndef LIB_RESOURCE_HPP_
#define LIB_RESOURCE_HPP_

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <system_error>

namespace htsget {

/// @brief Handle to a byte-addressable stream owned by a data store
class resource {
public:
  resource() = default;
  resource(const resource &) = delete;
  auto
  operator=(const resource &) -> resource & = delete;
  virtual ~resource() = default;

  /// Identity of the resource within its store; two resources with the same
  /// id refer to the same bytes. Also the path used in block URLs.
  [[nodiscard]] virtual auto
  id() const -> std::string = 0;

  [[nodiscard]] virtual auto
  exists() const -> bool = 0;

  [[nodiscard]] virtual auto
  size(std::error_code &ec) const -> std::uint64_t = 0;

  /// Open for reading; with 'decompress' the stream yields the inflated
  /// bytes of a gzip or BGZF file
  [[nodiscard]] virtual auto
  open(const bool decompress,
       std::error_code &ec) const -> std::unique_ptr<std::istream> = 0;

  /// Raw (compressed) stream positioned at 'start', checked to hold the
  /// bytes up to 'end'
  [[nodiscard]] virtual auto
  open_range(const std::uint64_t start, const std::uint64_t end,
             std::error_code &ec) const -> std::unique_ptr<std::istream>;
};

}  // namespace htsget

#endif  // LIB_RESOURCE_HPP_
