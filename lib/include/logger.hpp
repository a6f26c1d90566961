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

#ifndef LIB_INCLUDE_LOGGER_HPP_
#define LIB_INCLUDE_LOGGER_HPP_

#include <boost/describe.hpp>  // for BOOST_DESCRIBE_ENUM
#include <boost/system.hpp>

#if not defined(__APPLE__) && not defined(__MACH__)
#include <sys/syscall.h>
#include <unistd.h>  // gettid
#ifndef SYS_gettid
#error "SYS_gettid unavailable on this system"
#endif
#else
#include <pthread.h>  // pthread_threadid_np
#endif

#include <algorithm>  // for std::min
#include <array>
#include <cassert>
#include <charconv>  // for std::to_chars
#include <chrono>
#include <cstdint>  // std::uint32_t
#include <cstring>  // std::memcpy
#include <format>
#include <iostream>
#include <iterator>  // for size, distance
#include <memory>
#include <mutex>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>  // std::to_underlying

template <>
struct std::formatter<std::error_code> : std::formatter<std::string> {
  auto
  format(const std::error_code &e, std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{}", e.message());
  }
};

template <>
struct std::formatter<boost::system::error_code> : std::formatter<std::string> {
  auto
  format(const boost::system::error_code &e, std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{}", e.message());
  }
};

namespace htsget {

/*
  Each line of the log:
  - date (YYYY-MM-DD)
  - time (HH:MM:SS)
  - hostname
  - appname
  - process id
  - thread id
  - log level
  - message
*/

enum class log_level_t : std::uint8_t {
  debug,
  info,
  warning,
  error,
  critical,
};

// clang-format off
BOOST_DESCRIBE_ENUM(
  log_level_t,
  debug,
  info,
  warning,
  error,
  critical
)
// clang-format on

using std::literals::string_view_literals::operator""sv;

static constexpr auto log_level_names = std::array{
  // clang-format off
  "debug"sv,
  "info"sv,
  "warning"sv,
  "error"sv,
  "critical"sv,
  // clang-format on
};

[[nodiscard]] constexpr auto
to_name(const log_level_t l) -> std::string_view {
  return log_level_names[std::to_underlying(l)];
}

inline auto
operator<<(std::ostream &o, const log_level_t &l) -> std::ostream & {
  return o << to_name(l);
}

inline auto
operator>>(std::istream &in, log_level_t &l) -> std::istream & {
  std::string tmp;
  if (!(in >> tmp))
    return in;
  for (const auto [idx, name] : std::views::enumerate(log_level_names))
    if (tmp == name) {
      l = static_cast<log_level_t>(idx);
      return in;
    }
  in.setstate(std::ios::failbit);
  return in;
}

[[nodiscard]] inline auto
shared_from_cout() -> std::shared_ptr<std::ostream> {
  return std::make_shared<std::ostream>(std::cout.rdbuf());
}

class logger {
private:
  static constexpr auto date_time_fmt_expanded = "YYYY-MM-DD HH:MM:SS"sv;
  static constexpr std::uint32_t date_time_fmt_size =
    std::size(date_time_fmt_expanded);
  static constexpr auto delim = ' ';
  static constexpr auto tag = std::array{
    // clang-format off
    "DEBUG"sv,
    "INFO"sv,
    "WARNING"sv,
    "ERROR"sv,
    "CRITICAL"sv,
    // clang-format on
  };

public:
  static constexpr log_level_t default_level{log_level_t::info};

  static auto
  instance(const std::shared_ptr<std::ostream> &log_file_ptr = nullptr,
           const std::string &appname = "",
           log_level_t min_log_level = default_level) -> logger & {
    static logger lgr(log_file_ptr, appname, min_log_level);
    assert(lgr.log_file != nullptr || log_file_ptr != nullptr);
    return lgr;
  }

  logger(const std::shared_ptr<std::ostream> &log_file,
         const std::string &appname,
         log_level_t min_log_level = default_level);

  [[nodiscard]] auto
  get_status() const -> std::error_code {
    return status;
  }

  auto
  set_level(const log_level_t lvl) noexcept -> void {
    min_log_level = lvl;
  }

  operator bool() const { return status ? false : true; }

  template <log_level_t the_level, typename... Args>
  auto
  log(const std::string_view fmt_str, Args &&...args) -> void {
    if (the_level < min_log_level)
      return;
    const auto msg = std::vformat(fmt_str, std::make_format_args(args...));
    const auto thread_id = get_thread_id();
    std::lock_guard lck{mtx};
    format_time();
    const auto end_pos = fill_buffer<the_level>(thread_id, msg);
    log_file->write(buf.data(), std::distance(buf.data(), end_pos));
    log_file->flush();
  }

  template <typename... Args>
  auto
  debug(const std::string_view fmt_str, Args &&...args) -> void {
    log<log_level_t::debug>(fmt_str, args...);
  }
  template <typename... Args>
  auto
  info(const std::string_view fmt_str, Args &&...args) -> void {
    log<log_level_t::info>(fmt_str, args...);
  }
  template <typename... Args>
  auto
  warning(const std::string_view fmt_str, Args &&...args) -> void {
    log<log_level_t::warning>(fmt_str, args...);
  }
  template <typename... Args>
  auto
  error(const std::string_view fmt_str, Args &&...args) -> void {
    log<log_level_t::error>(fmt_str, args...);
  }
  template <typename... Args>
  auto
  critical(const std::string_view fmt_str, Args &&...args) -> void {
    log<log_level_t::critical>(fmt_str, args...);
  }

private:
  auto
  set_attributes(const std::string_view appname) -> std::error_code;

  static constexpr std::uint32_t buf_size{1024};  // max log line
  std::array<char, buf_size> buf{};
  std::shared_ptr<std::ostream> log_file{nullptr};
  std::mutex mtx{};
  char *cursor{};
  log_level_t min_log_level{};
  std::error_code status{};

  logger(const logger &) = delete;
  auto
  operator=(const logger &) -> logger & = delete;

  [[nodiscard]] static auto
  get_thread_id() -> std::uint64_t {
    std::uint64_t thread_id{};
#if not defined(__APPLE__) && not defined(__MACH__)
    thread_id = static_cast<std::uint64_t>(syscall(SYS_gettid));
#else
    pthread_threadid_np(nullptr, &thread_id);
#endif
    return thread_id;
  }

  // ADS: messages longer than the buffer are truncated to fit
  template <log_level_t the_level>
  [[nodiscard]] auto
  fill_buffer(const std::uint64_t thread_id,
              const std::string_view msg) -> char * {
    static constexpr auto lvl = tag[std::to_underlying(the_level)];
    char *const buf_end = buf.data() + buf_size - 1;  // room for newline
    auto itr = std::to_chars(cursor, buf_end, thread_id).ptr;
    *itr++ = delim;
    std::memcpy(itr, lvl.data(), std::size(lvl));
    itr += std::size(lvl);
    *itr++ = delim;
    const auto n_avail = static_cast<std::size_t>(std::distance(itr, buf_end));
    const auto n_msg = std::min(std::size(msg), n_avail);
    std::memcpy(itr, msg.data(), n_msg);
    itr += n_msg;
    *itr++ = '\n';
    return itr;
  }

  auto
  format_time() -> void {
    const auto now{std::chrono::system_clock::now()};
    const std::chrono::year_month_day ymd{
      std::chrono::floor<std::chrono::days>(now)};
    const std::chrono::hh_mm_ss hms{
      std::chrono::floor<std::chrono::seconds>(now) -
      std::chrono::floor<std::chrono::days>(now)};
    std::format_to(buf.data(), "{:%F}{}{:%T}", ymd, delim, hms);
  }
};  // class logger

template <log_level_t lvl>
auto
log_args(std::ranges::input_range auto &&key_value_pairs) {
  logger &lgr = logger::instance();
  for (auto &&[k, v] : key_value_pairs)
    lgr.log<lvl>("{}: {}", k, v);
}

}  // namespace htsget

template <>
struct std::formatter<htsget::log_level_t> : std::formatter<std::string> {
  auto
  format(const htsget::log_level_t &l, std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{}", htsget::to_name(l));
  }
};

#endif  // LIB_INCLUDE_LOGGER_HPP_
