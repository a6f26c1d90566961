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

#ifndef LIB_LOCAL_DATA_STORE_HPP_
#define LIB_LOCAL_DATA_STORE_HPP_

#include "data_store.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace htsget {

class resource;

/// Data store over a directory: record ID 'a/b' with format BAM is the file
/// 'a/b.bam' below the root, and its BAI index is 'a/b.bam.bai'
class local_data_store : public data_store {
public:
  explicit local_data_store(std::filesystem::path root) :
    root{std::move(root)} {}

  [[nodiscard]] auto
  resolve(const std::vector<std::string> &record_id,
          const std::string &data_format, const std::string &index_format,
          std::error_code &ec) const
    -> std::pair<std::shared_ptr<resource>, std::shared_ptr<resource>> override;

  [[nodiscard]] auto
  lookup(const std::vector<std::string> &path,
         std::error_code &ec) const -> std::shared_ptr<resource> override;

  /// Index construction is left to external tools; always sets
  /// htsget_error_code::index_construction_unsupported
  auto
  create_index(const resource &data, const resource &index,
               std::error_code &ec) -> void override;

  auto
  add_resource(const std::shared_ptr<resource> &r) -> void override;

  [[nodiscard]] auto
  get_root() const -> const std::filesystem::path & {
    return root;
  }

  /// Join segments with '/', rejecting empty, '.' and '..' segments
  [[nodiscard]] static auto
  join_segments(const std::vector<std::string> &segments,
                std::error_code &ec) -> std::string;

private:
  std::filesystem::path root;
};

}  // namespace htsget

#endif  // LIB_LOCAL_DATA_STORE_HPP_
