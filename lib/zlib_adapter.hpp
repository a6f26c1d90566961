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

#ifndef LIB_ZLIB_ADAPTER_HPP_
#define LIB_ZLIB_ADAPTER_HPP_

#include <zlib.h>

#include <array>
#include <cstdint>  // for std::uint8_t
#include <istream>
#include <streambuf>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

// clang-format off
// ADS: from zlib/zlib.h
// #define Z_OK            0
// #define Z_STREAM_END    1
// #define Z_NEED_DICT     2
// #define Z_ERRNO        (-1)
// #define Z_STREAM_ERROR (-2)
// #define Z_DATA_ERROR   (-3)
// #define Z_MEM_ERROR    (-4)
// #define Z_BUF_ERROR    (-5)
// #define Z_VERSION_ERROR (-6)
// clang-format on
enum class zlib_adapter_error_code : std::uint8_t {
  ok = 0,
  z_stream_end = 1,
  z_need_dict = 2,
  z_errno = 3,
  z_stream_error = 4,
  z_data_error = 5,
  z_mem_error = 6,
  z_buf_error = 7,
  z_version_error = 8,
  unexpected_return_code = 9,
};

template <>
struct std::is_error_code_enum<zlib_adapter_error_code>
  : public std::true_type {};

struct zlib_adapter_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "zlib_adapter_error_code";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "Z_STREAM_END"s;
    case 2: return "Z_NEED_DICT"s;
    case 3: return "Z_ERRNO"s;
    case 4: return "Z_STREAM_ERROR"s;
    case 5: return "Z_DATA_ERROR"s;
    case 6: return "Z_MEM_ERROR"s;
    case 7: return "Z_BUF_ERROR"s;
    case 8: return "Z_VERSION_ERROR"s;
    case 9: return "unexpected return code from zlib"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(zlib_adapter_error_code e) -> std::error_code {
  static auto category = zlib_adapter_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

namespace htsget {

/// @brief Stream buffer yielding the decompressed bytes of a gzip file.
/// Concatenated gzip members, like the blocks of a BGZF file, are read as a
/// single stream.
class gz_streambuf : public std::streambuf {
public:
  gz_streambuf(const gz_streambuf &) = delete;
  auto
  operator=(const gz_streambuf &) -> gz_streambuf & = delete;

  gz_streambuf(const std::string &filename, std::error_code &ec);
  ~gz_streambuf() override;

  [[nodiscard]] auto
  get_status() const -> std::error_code {
    return status;
  }

protected:
  auto
  underflow() -> int_type override;

private:
  static constexpr std::int32_t buf_size = 4 * 128 * 1024;
  gzFile in{};
  std::error_code status{};
  std::array<char, buf_size> buf{};
};

/// @brief Input stream over a gz_streambuf
class gz_istream : public std::istream {
public:
  gz_istream(const std::string &filename, std::error_code &ec) :
    std::istream{nullptr}, sbuf{filename, ec} {
    rdbuf(&sbuf);
    if (ec)
      setstate(std::ios::badbit);
  }

  [[nodiscard]] auto
  get_status() const -> std::error_code {
    return sbuf.get_status();
  }

private:
  gz_streambuf sbuf;
};

}  // namespace htsget

#endif  // LIB_ZLIB_ADAPTER_HPP_
