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

#ifndef LIB_LOCAL_RESOURCE_HPP_
#define LIB_LOCAL_RESOURCE_HPP_

#include "resource.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>  // for std::move

namespace htsget {

/// @brief A file below the root directory of a local_data_store
class local_resource : public resource {
public:
  local_resource(std::filesystem::path root, std::string relative_path) :
    root{std::move(root)}, relative_path{std::move(relative_path)} {}

  [[nodiscard]] auto
  id() const -> std::string override {
    return relative_path;
  }

  [[nodiscard]] auto
  exists() const -> bool override;

  [[nodiscard]] auto
  size(std::error_code &ec) const -> std::uint64_t override;

  [[nodiscard]] auto
  open(const bool decompress,
       std::error_code &ec) const -> std::unique_ptr<std::istream> override;

  [[nodiscard]] auto
  get_path() const -> std::filesystem::path {
    return root / relative_path;
  }

private:
  std::filesystem::path root;
  std::string relative_path;  // '/'-separated, no '.' or '..'
};

}  // namespace htsget

#endif  // LIB_LOCAL_RESOURCE_HPP_
