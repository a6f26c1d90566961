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

#include "bam_index.hpp"

#include "binary_cursor.hpp"
#include "format_error_code.hpp"

#include <cstdint>
#include <istream>
#include <iterator>  // for std::size
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace htsget {

[[nodiscard]] static auto
read_count(binary_cursor &cursor, std::error_code &ec) -> std::uint32_t {
  const auto n = cursor.read_i32(ec);
  if (ec)
    return 0;
  if (n < 0) {
    ec = format_error_code::invalid_index_field;
    return 0;
  }
  return static_cast<std::uint32_t>(n);
}

[[nodiscard]] static auto
read_bin(binary_cursor &cursor, std::error_code &ec) -> bam_index_bin {
  bam_index_bin bin;
  bin.bin_id = cursor.read_u32(ec);
  if (ec)
    return {};
  const auto n_chunk = read_count(cursor, ec);
  if (ec)
    return {};
  for (std::uint32_t i = 0; i < n_chunk; ++i) {
    bam_index_chunk chunk;
    chunk.begin = cursor.read_u64(ec);
    chunk.end = cursor.read_u64(ec);
    if (ec)
      return {};
    bin.chunks.push_back(chunk);
  }
  return bin;
}

[[nodiscard]] static auto
read_reference(binary_cursor &cursor,
               std::error_code &ec) -> bam_reference_index {
  bam_reference_index ref;
  const auto n_bin = read_count(cursor, ec);
  if (ec)
    return {};
  for (std::uint32_t i = 0; i < n_bin; ++i) {
    ref.bins.push_back(read_bin(cursor, ec));
    if (ec)
      return {};
  }
  const auto n_intv = read_count(cursor, ec);
  if (ec)
    return {};
  for (std::uint32_t i = 0; i < n_intv; ++i) {
    ref.intervals.push_back(cursor.read_u64(ec));
    if (ec)
      return {};
  }
  return ref;
}

[[nodiscard]] auto
bam_index::read(std::istream &in, std::error_code &ec) -> bam_index {
  binary_cursor cursor(in, byte_order::little);

  const auto magic_found =
    cursor.read_string(std::size(std::string_view(magic)), ec);
  if (ec)
    return {};
  if (magic_found != magic) {
    ec = format_error_code::invalid_index_magic;
    return {};
  }

  const auto n_ref = read_count(cursor, ec);
  if (ec)
    return {};

  bam_index index;
  for (std::uint32_t i = 0; i < n_ref; ++i) {
    index.references.push_back(read_reference(cursor, ec));
    if (ec)
      return {};
  }

  // n_no_coor is optional and ends the file when present
  if (!cursor.at_end()) {
    index.n_no_coor = cursor.read_u64(ec);
    if (ec)
      return {};
  }
  return index;
}

[[nodiscard]] auto
bam_index::min_file_offset() const -> std::optional<std::uint64_t> {
  std::optional<std::uint64_t> min_offset;
  for (const auto &ref : references)
    for (const auto ioffset : ref.intervals) {
      if (ioffset == 0)
        continue;
      const auto offset = file_offset(ioffset);
      if (!min_offset || offset < *min_offset)
        min_offset = offset;
    }
  return min_offset;
}

[[nodiscard]] auto
bam_index::n_intervals() const -> std::uint64_t {
  std::uint64_t n{};
  for (const auto &ref : references)
    n += std::size(ref.intervals);
  return n;
}

}  // namespace htsget
