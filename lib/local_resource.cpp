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

#include "local_resource.hpp"

#include "zlib_adapter.hpp"

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <system_error>

namespace htsget {

[[nodiscard]] auto
local_resource::exists() const -> bool {
  std::error_code ignored_error;
  return std::filesystem::is_regular_file(get_path(), ignored_error);
}

[[nodiscard]] auto
local_resource::size(std::error_code &ec) const -> std::uint64_t {
  const auto sz = std::filesystem::file_size(get_path(), ec);
  if (ec)
    return 0;
  return sz;
}

[[nodiscard]] auto
local_resource::open(const bool decompress, std::error_code &ec) const
  -> std::unique_ptr<std::istream> {
  const auto path = get_path().string();
  if (decompress) {
    auto in = std::make_unique<gz_istream>(path, ec);
    if (ec)
      return nullptr;
    return in;
  }
  errno = 0;
  auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!*in) {
    ec = errno != 0 ? std::make_error_code(std::errc(errno))
                    : std::make_error_code(std::errc::io_error);
    return nullptr;
  }
  return in;
}

}  // namespace htsget
