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

#include "logger.hpp"

#include <unistd.h>  // for gethostname, getpid

#include <cerrno>
#include <charconv>  // for std::to_chars
#include <cstring>   // for std::memcpy
#include <memory>    // for std::shared_ptr
#include <string>
#include <string_view>
#include <system_error>

namespace htsget {

logger::logger(const std::shared_ptr<std::ostream> &log_file,
               const std::string &appname, log_level_t min_log_level) :
  log_file{log_file}, min_log_level{min_log_level} {
  if (log_file == nullptr || !log_file->good()) {
    status = std::make_error_code(std::errc::bad_file_descriptor);
    return;
  }
  buf.fill(' ');
  if (const auto ec = set_attributes(appname))
    status = ec;
}

[[nodiscard]] auto
logger::set_attributes(const std::string_view appname) -> std::error_code {
  static constexpr std::uint32_t max_hostname_size{256};
  // hostname, appname and pid must leave room for the message
  static constexpr std::uint32_t max_prefix_size{buf_size / 2};

  std::string hostname;
  hostname.resize(max_hostname_size);
  if (gethostname(hostname.data(), max_hostname_size))  // unistd.h
    return std::make_error_code(std::errc(errno));
  hostname.resize(hostname.find('\0'));

  if (date_time_fmt_size + std::size(hostname) + std::size(appname) >
      max_prefix_size)
    return std::make_error_code(std::errc::value_too_large);

  // NOLINTBEGIN(*-pointer-arithmetic)

  // the time fields are written for each line; attributes follow them
  cursor = buf.data() + date_time_fmt_size;
  *cursor++ = delim;

  std::memcpy(cursor, hostname.data(), std::size(hostname));
  cursor += std::size(hostname);
  *cursor++ = delim;

  std::memcpy(cursor, appname.data(), std::size(appname));
  cursor += std::size(appname);
  *cursor++ = delim;

  const auto process_id = getpid();  // unistd.h
  const auto tcr = std::to_chars(cursor, buf.data() + buf_size, process_id);
  if (tcr.ec != std::errc{})
    return std::make_error_code(tcr.ec);
  cursor = tcr.ptr;
  *cursor++ = delim;

  // NOLINTEND(*-pointer-arithmetic)

  return {};
}

}  // namespace htsget
