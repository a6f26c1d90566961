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

#include "resource.hpp"

#include "format_error_code.hpp"
#include "htsget_error_code.hpp"

#include <cstdint>
#include <ios>  // for std::streamoff
#include <istream>
#include <memory>
#include <system_error>

namespace htsget {

[[nodiscard]] auto
resource::open_range(const std::uint64_t start, const std::uint64_t end,
                     std::error_code &ec) const
  -> std::unique_ptr<std::istream> {
  if (end < start) {
    ec = htsget_error_code::invalid_range;
    return nullptr;
  }
  const auto total = size(ec);
  if (ec)
    return nullptr;
  if (end > total) {
    ec = format_error_code::unexpected_end_of_stream;
    return nullptr;
  }
  auto in = open(false, ec);
  if (ec)
    return nullptr;
  if (!in->seekg(static_cast<std::streamoff>(start))) {
    ec = format_error_code::unexpected_end_of_stream;
    return nullptr;
  }
  return in;
}

}  // namespace htsget
