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

#ifndef LIB_DATA_STORE_HPP_
#define LIB_DATA_STORE_HPP_

#include <memory>
#include <string>
#include <system_error>
#include <utility>  // for std::pair
#include <vector>

namespace htsget {

class resource;

/// Source of data and index resources for record IDs, and of raw
/// resources for block requests
class data_store {
public:
  data_store() = default;
  data_store(const data_store &) = delete;
  data_store &
  operator=(const data_store &) = delete;
  virtual ~data_store() = default;

  /// The data resource for a record ID in the given format, and its index
  /// resource. Either may not exist; an invalid record ID is not_found.
  [[nodiscard]] virtual auto
  resolve(const std::vector<std::string> &record_id,
          const std::string &data_format, const std::string &index_format,
          std::error_code &ec) const
    -> std::pair<std::shared_ptr<resource>, std::shared_ptr<resource>> = 0;

  /// Existing resource at a path below the store's root
  [[nodiscard]] virtual auto
  lookup(const std::vector<std::string> &path,
         std::error_code &ec) const -> std::shared_ptr<resource> = 0;

  /// Build the index for 'data' at the location of 'index'
  virtual auto
  create_index(const resource &data, const resource &index,
               std::error_code &ec) -> void = 0;

  /// Make a newly created resource known to the store
  virtual auto
  add_resource(const std::shared_ptr<resource> &r) -> void = 0;
};

}  // namespace htsget

#endif  // LIB_DATA_STORE_HPP_
