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

#include "zlib_adapter.hpp"

#include <zlib.h>

#include <cerrno>  // for errno
#include <string>
#include <system_error>

namespace htsget {

gz_streambuf::gz_streambuf(const std::string &filename, std::error_code &ec) {
  errno = 0;
  in = gzopen(filename.data(), "rb");
  if (in == nullptr) {
    // ADS: errno is zero when zlib failed to allocate its state
    ec = errno != 0 ? std::make_error_code(std::errc(errno))
                    : std::error_code{zlib_adapter_error_code::z_mem_error};
    status = ec;
    return;
  }
  // leave get area empty so the first read calls underflow
  setg(buf.data(), buf.data(), buf.data());
}

gz_streambuf::~gz_streambuf() {
  if (in) {
    gzclose(in);
    in = nullptr;
  }
}

auto
gz_streambuf::underflow() -> int_type {
  if (gptr() < egptr())
    return traits_type::to_int_type(*gptr());
  if (in == nullptr || status)
    return traits_type::eof();

  const int n_bytes = gzread(in, buf.data(), buf_size);
  if (n_bytes < 0) {
    int errnum{};
    gzerror(in, &errnum);
    status = errnum == Z_DATA_ERROR
               ? zlib_adapter_error_code::z_data_error
               : zlib_adapter_error_code::unexpected_return_code;
    return traits_type::eof();
  }
  if (n_bytes == 0)
    return traits_type::eof();

  setg(buf.data(), buf.data(), buf.data() + n_bytes);
  return traits_type::to_int_type(*gptr());
}

}  // namespace htsget
