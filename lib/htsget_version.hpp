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

#ifndef LIB_HTSGET_VERSION_HPP_
#define LIB_HTSGET_VERSION_HPP_

#include <compare>
#include <cstdint>
#include <format>
#include <string>

namespace htsget {

struct htsget_version {
  std::uint32_t major{};
  std::uint32_t minor{};
  std::uint32_t patch{};

  [[nodiscard]] auto
  operator<=>(const htsget_version &) const = default;
};

static constexpr htsget_version supported_htsget_version{1, 1, 0};

}  // namespace htsget

template <>
struct std::formatter<htsget::htsget_version> : std::formatter<std::string> {
  auto
  format(const htsget::htsget_version &v, std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{}.{}.{}", v.major, v.minor, v.patch);
  }
};

#endif  // LIB_HTSGET_VERSION_HPP_
