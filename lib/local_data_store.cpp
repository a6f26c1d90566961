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

#include "local_data_store.hpp"

#include "htsget_error_code.hpp"
#include "local_resource.hpp"
#include "logger.hpp"

#include <algorithm>  // for std::ranges::transform
#include <cctype>     // for std::tolower
#include <filesystem>
#include <format>
#include <iterator>  // for std::begin
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace htsget {

[[nodiscard]] static inline auto
to_lower(std::string s) -> std::string {
  std::ranges::transform(s, std::begin(s), [](const unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

[[nodiscard]] auto
local_data_store::join_segments(const std::vector<std::string> &segments,
                                std::error_code &ec) -> std::string {
  if (segments.empty()) {
    ec = htsget_error_code::not_found;
    return {};
  }
  std::string joined;
  for (const auto &segment : segments) {
    if (segment.empty() || segment == "." || segment == ".." ||
        segment.find('/') != std::string::npos) {
      ec = htsget_error_code::not_found;
      return {};
    }
    if (!joined.empty())
      joined += '/';
    joined += segment;
  }
  return joined;
}

[[nodiscard]] auto
local_data_store::resolve(const std::vector<std::string> &record_id,
                          const std::string &data_format,
                          const std::string &index_format,
                          std::error_code &ec) const
  -> std::pair<std::shared_ptr<resource>, std::shared_ptr<resource>> {
  const auto base = join_segments(record_id, ec);
  if (ec)
    return {};
  const auto data_path = std::format("{}.{}", base, to_lower(data_format));
  const auto index_path =
    std::format("{}.{}", data_path, to_lower(index_format));
  return {
    std::make_shared<local_resource>(root, data_path),
    std::make_shared<local_resource>(root, index_path),
  };
}

[[nodiscard]] auto
local_data_store::lookup(const std::vector<std::string> &path,
                         std::error_code &ec) const
  -> std::shared_ptr<resource> {
  const auto relative_path = join_segments(path, ec);
  if (ec)
    return nullptr;
  auto r = std::make_shared<local_resource>(root, relative_path);
  if (!r->exists()) {
    ec = htsget_error_code::not_found;
    return nullptr;
  }
  return r;
}

auto
local_data_store::create_index([[maybe_unused]] const resource &data,
                               [[maybe_unused]] const resource &index,
                               std::error_code &ec) -> void {
  ec = htsget_error_code::index_construction_unsupported;
}

auto
local_data_store::add_resource(const std::shared_ptr<resource> &r) -> void {
  // files below the root are found by path; nothing to register
  logger::instance().debug("Resource available: {}", r->id());
}

}  // namespace htsget
