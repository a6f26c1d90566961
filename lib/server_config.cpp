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

#include "server_config.hpp"

#include "logger.hpp"

#include <boost/describe.hpp>
#include <boost/json.hpp>

#include <filesystem>
#include <format>
#include <string>
#include <system_error>

#include <unistd.h>  // for access, R_OK, X_OK

namespace htsget {

[[nodiscard]] auto
server_config::get_base_url() const -> std::string {
  if (!base_url.empty())
    return base_url;
  return std::format("http://{}:{}", hostname, port);
}

[[nodiscard]] auto
server_config::tostring() const -> std::string {
  return boost::json::serialize(boost::json::value_from(*this));
}

[[nodiscard]] auto
server_config::validate(std::error_code &ec) const -> bool {
  if (hostname.empty()) {
    ec = server_config_error_code::invalid_hostname;
    return false;
  }
  if (port == 0) {
    ec = server_config_error_code::invalid_port;
    return false;
  }
  if (block_size == 0) {
    ec = server_config_error_code::invalid_block_size;
    return false;
  }
  if (n_threads == 0 || n_threads > n_threads_max) {
    ec = server_config_error_code::invalid_n_threads;
    return false;
  }

  const auto is_dir = std::filesystem::is_directory(root_directory, ec);
  if (ec)
    return false;
  if (!is_dir) {
    ec = server_config_error_code::invalid_root_directory;
    return false;
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (access(root_directory.data(), R_OK | X_OK) != 0) {
    ec = server_config_error_code::root_directory_not_accessible;
    return false;
  }
  return true;
}

}  // namespace htsget
