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

#ifndef LIB_BAM_INDEX_HPP_
#define LIB_BAM_INDEX_HPP_

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace htsget {

/// BGZF virtual offsets hold the compressed offset of a block in the high
/// 48 bits and the offset within the uncompressed block in the low 16
static constexpr std::uint32_t virtual_offset_shift{16};

[[nodiscard]] constexpr auto
make_virtual_offset(const std::uint64_t block_offset,
                    const std::uint16_t within_block) -> std::uint64_t {
  return (block_offset << virtual_offset_shift) | within_block;
}

[[nodiscard]] constexpr auto
file_offset(const std::uint64_t virtual_offset) -> std::uint64_t {
  return virtual_offset >> virtual_offset_shift;
}

struct bam_index_chunk {
  std::uint64_t begin{};  // virtual offset
  std::uint64_t end{};    // virtual offset
};

struct bam_index_bin {
  std::uint32_t bin_id{};
  std::vector<bam_index_chunk> chunks;
};

struct bam_reference_index {
  std::vector<bam_index_bin> bins;
  /// linear index: virtual offsets of the first record in each 16kbp window
  std::vector<std::uint64_t> intervals;
};

/// @brief Parsed BAI file (SAM/BAM spec section 5.2)
struct bam_index {
  static constexpr auto magic = "BAI\1";

  std::vector<bam_reference_index> references;
  std::optional<std::uint64_t> n_no_coor;

  [[nodiscard]] static auto
  read(std::istream &in, std::error_code &ec) -> bam_index;

  /// Smallest compressed file offset recorded in any linear index; empty if
  /// no reference has an interval. Zero entries mark windows without
  /// records and are skipped.
  [[nodiscard]] auto
  min_file_offset() const -> std::optional<std::uint64_t>;

  [[nodiscard]] auto
  n_intervals() const -> std::uint64_t;
};

}  // namespace htsget

#endif  // LIB_BAM_INDEX_HPP_
