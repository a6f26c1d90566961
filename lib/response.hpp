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

#ifndef LIB_RESPONSE_HPP_
#define LIB_RESPONSE_HPP_

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace htsget {

/// HTTP status and name reported to clients for an error
struct error_kind {
  std::uint16_t status{};
  std::string_view name;

  [[nodiscard]] auto
  operator==(const error_kind &) const -> bool = default;
};

/// Error kind for any error code: codes of htsget_error_code map to their
/// own kind, every format_error_code is a FormatError, and everything else
/// is an UnknownError
[[nodiscard]] auto
classify_error(const std::error_code &ec) -> error_kind;

/// Body of an error response:
/// {"htsget": {"error": KIND, "message": MESSAGE}}
[[nodiscard]] auto
error_body(const std::string_view kind,
           const std::string_view message) -> std::string;

/// Response body read from a stream while it is written, for data too
/// large to hold in memory; 'in' is positioned at the first byte and holds
/// at least 'size' bytes
struct body_source {
  std::unique_ptr<std::istream> in;
  std::uint64_t size{};
};

struct response {
  /// Media type of tickets, for the supported protocol version
  static const std::string ticket_content_type;
  static constexpr auto error_content_type = "application/json";
  static constexpr auto block_content_type = "application/octet-stream";

  std::uint16_t status{200};
  std::string content_type;
  std::string body;
  std::optional<body_source> source;  // replaces 'body' when set

  [[nodiscard]] auto
  ok() const -> bool {
    return status == 200;
  }

  auto
  set_error(const std::error_code &ec) -> void;

  auto
  set_error(const error_kind &kind, const std::string_view message) -> void;
};

}  // namespace htsget

#endif  // LIB_RESPONSE_HPP_
