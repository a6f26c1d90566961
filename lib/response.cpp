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

#include "response.hpp"

#include "format_error_code.hpp"
#include "htsget_error_code.hpp"
#include "htsget_version.hpp"

#include <boost/json.hpp>

#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>  // for std::unreachable

namespace htsget {

// clang-format off
static constexpr error_kind not_found_kind{404, "NotFound"};
static constexpr error_kind unsupported_media_type_kind{415, "UnsupportedMediaType"};
static constexpr error_kind unsupported_format_kind{400, "UnsupportedFormat"};
static constexpr error_kind invalid_input_kind{400, "InvalidInput"};
static constexpr error_kind invalid_range_kind{400, "InvalidRange"};
static constexpr error_kind method_not_allowed_kind{405, "MethodNotAllowed"};
static constexpr error_kind format_error_kind{500, "FormatError"};
static constexpr error_kind unknown_error_kind{500, "UnknownError"};
// clang-format on

const std::string response::ticket_content_type =
  std::format("application/vnd.ga4gh.htsget.v{}+json; charset=utf-8",
              supported_htsget_version);

[[nodiscard]] auto
classify_error(const std::error_code &ec) -> error_kind {
  if (ec.category() == get_format_error_category())
    return format_error_kind;
  if (ec.category() != get_htsget_error_category())
    return unknown_error_kind;
  // clang-format off
  switch (static_cast<htsget_error_code>(ec.value())) {
  case htsget_error_code::not_found: return not_found_kind;
  case htsget_error_code::unsupported_media_type: return unsupported_media_type_kind;
  case htsget_error_code::unsupported_format: return unsupported_format_kind;
  case htsget_error_code::invalid_input: return invalid_input_kind;
  case htsget_error_code::invalid_range: return invalid_range_kind;
  case htsget_error_code::method_not_allowed: return method_not_allowed_kind;
  case htsget_error_code::ok:
  case htsget_error_code::index_construction_unsupported:
  case htsget_error_code::unknown_error: return unknown_error_kind;
  }
  // clang-format on
  std::unreachable();
}

[[nodiscard]] auto
error_body(const std::string_view kind,
           const std::string_view message) -> std::string {
  boost::json::object error;
  error["error"] = kind;
  error["message"] = message;
  boost::json::object body;
  body["htsget"] = std::move(error);
  return boost::json::serialize(body);
}

auto
response::set_error(const error_kind &kind,
                    const std::string_view message) -> void {
  status = kind.status;
  content_type = error_content_type;
  source.reset();
  body = error_body(kind.name, message);
}

auto
response::set_error(const std::error_code &ec) -> void {
  set_error(classify_error(ec), ec.message());
}

}  // namespace htsget
