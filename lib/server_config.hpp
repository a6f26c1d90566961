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

#ifndef LIB_SERVER_CONFIG_HPP_
#define LIB_SERVER_CONFIG_HPP_

#include "logger.hpp"  // IWYU pragma: keep

#include <boost/describe.hpp>

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

namespace htsget {

struct server_config {
  static constexpr auto hostname_default = "localhost";
  static constexpr std::uint16_t port_default{80};
  static constexpr std::uint64_t block_size_default{1ull << 30};
  static constexpr std::uint32_t n_threads_default{4};
  static constexpr std::uint32_t n_threads_max{1024};
  static constexpr auto log_level_default{log_level_t::info};

  std::string root_directory;
  std::string hostname;
  std::uint16_t port{};
  std::uint64_t block_size{};
  std::string base_url;
  std::uint32_t n_threads{};
  std::string log_file;
  log_level_t log_level{};
  bool error_on_interrupt{};

  /// The configured base URL, or one made from the hostname and port
  [[nodiscard]] auto
  get_base_url() const -> std::string;

  [[nodiscard]] auto
  tostring() const -> std::string;

  /// Validate that the instance variables are set properly; do this before
  /// starting a server with this configuration.
  [[nodiscard]] auto
  validate(std::error_code &ec) const -> bool;
};

// clang-format off
BOOST_DESCRIBE_STRUCT(server_config, (), (
  root_directory,
  hostname,
  port,
  block_size,
  base_url,
  n_threads,
  log_file,
  log_level,
  error_on_interrupt
)
)
// clang-format on

}  // namespace htsget

/// @brief Enum for error codes related to server configuration
enum class server_config_error_code : std::uint8_t {
  ok = 0,
  invalid_hostname = 1,
  invalid_port = 2,
  invalid_block_size = 3,
  invalid_n_threads = 4,
  invalid_root_directory = 5,
  root_directory_not_accessible = 6,
};

template <>
struct std::is_error_code_enum<server_config_error_code>
  : public std::true_type {};

struct server_config_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "server_config";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "invalid hostname"s;
    case 2: return "invalid port"s;
    case 3: return "invalid block size"s;
    case 4: return "invalid number of threads"s;
    case 5: return "root directory is not a directory"s;
    case 6: return "root directory is not readable and searchable"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(server_config_error_code e) -> std::error_code {
  static auto category = server_config_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_SERVER_CONFIG_HPP_
