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

#ifndef LIB_CONTENT_NEGOTIATION_HPP_
#define LIB_CONTENT_NEGOTIATION_HPP_

#include "htsget_version.hpp"

#include <optional>
#include <string_view>
#include <system_error>

namespace htsget {

/// Version requested by a media type 'vnd.ga4gh.htsget.vX.Y.Z+json',
/// given without the 'application/' prefix and lower-cased
[[nodiscard]] auto
parse_htsget_media_type(const std::string_view subtype)
  -> std::optional<htsget_version>;

/// Check the Accept header of a request; sets unsupported_media_type when
/// the server cannot produce a response the client accepts. A missing
/// header accepts anything.
auto
check_accept(const std::optional<std::string_view> accept,
             std::error_code &ec) -> void;

}  // namespace htsget

#endif  // LIB_CONTENT_NEGOTIATION_HPP_
