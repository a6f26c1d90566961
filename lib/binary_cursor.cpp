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

#include "binary_cursor.hpp"

#include "format_error_code.hpp"

#include <algorithm>  // for std::min
#include <cstddef>
#include <cstdint>
#include <ios>  // for std::streamsize
#include <string>
#include <system_error>

namespace htsget {

auto
binary_cursor::read_raw(char *dst, const std::size_t n,
                        std::error_code &ec) -> void {
  in.read(dst, static_cast<std::streamsize>(n));
  const auto n_read = in.gcount();
  n_consumed += static_cast<std::uint64_t>(n_read);
  if (static_cast<std::size_t>(n_read) != n)
    ec = format_error_code::unexpected_end_of_stream;
}

[[nodiscard]] auto
binary_cursor::read_string(const std::size_t n,
                           std::error_code &ec) -> std::string {
  std::string s(n, '\0');
  read_raw(s.data(), n, ec);
  if (ec)
    return {};
  return s;
}

auto
binary_cursor::skip(const std::uint64_t n, std::error_code &ec) -> void {
  // ADS: ignore() in pieces so the count always fits in a streamsize
  static constexpr std::uint64_t max_skip = 1ul << 30;
  auto remaining = n;
  while (remaining > 0) {
    const auto n_skip = std::min(remaining, max_skip);
    in.ignore(static_cast<std::streamsize>(n_skip));
    const auto n_skipped = static_cast<std::uint64_t>(in.gcount());
    n_consumed += n_skipped;
    if (n_skipped != n_skip) {
      ec = format_error_code::unexpected_end_of_stream;
      return;
    }
    remaining -= n_skip;
  }
}

}  // namespace htsget
