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

#ifndef LIB_HEADER_BOUNDARY_HPP_
#define LIB_HEADER_BOUNDARY_HPP_

/*
  The header boundary B of a BAM file is the offset such that bytes [0, B)
  followed by the BGZF end-of-file marker form a BAM file with the header
  and no records. B is taken from the smallest linear index offset when a
  BAI is available. Otherwise the header is measured in the decompressed
  stream, and the BGZF block headers of the raw stream are walked until
  the blocks account for that many uncompressed bytes.

  The block walk returns the sum of BSIZE over the blocks plus one, which
  is the offset of the next block only when the header fits in one block;
  the index and scan results agree only for such single-block headers.
*/

#include <cstdint>
#include <istream>
#include <optional>
#include <system_error>

namespace htsget {

class resource;

struct bgzf_block_header {
  static constexpr std::uint8_t gzip_id1{31};
  static constexpr std::uint8_t gzip_id2{139};
  static constexpr std::uint16_t extra_length{6};
  static constexpr std::uint8_t subfield_id1{'B'};
  static constexpr std::uint8_t subfield_id2{'C'};
  static constexpr std::uint16_t subfield_length{2};
  // bytes of a block that are neither extra field nor compressed data
  static constexpr std::uint16_t fixed_size{19};
};

/// Bytes of the BAM header counted by reading the decompressed stream:
/// magic, l_text, the text, and for each reference l_name, the name and
/// l_ref
[[nodiscard]] auto
uncompressed_header_size(std::istream &decompressed,
                         std::error_code &ec) -> std::uint64_t;

/// Walk the BGZF block headers of the raw stream, without inflating, until
/// the blocks hold at least 'uncompressed_size' bytes
[[nodiscard]] auto
compressed_header_size(std::istream &raw, const std::uint64_t uncompressed_size,
                       std::error_code &ec) -> std::uint64_t;

/// Smallest file offset in the BAI linear indexes; empty if the index
/// records no intervals
[[nodiscard]] auto
header_size_from_index(const resource &index,
                       std::error_code &ec) -> std::optional<std::uint64_t>;

/// Header boundary found by scanning the BAM file itself
[[nodiscard]] auto
header_size_from_blocks(const resource &bam,
                        std::error_code &ec) -> std::uint64_t;

/// Header boundary of a BAM file, from its BAI if one is given and exists
[[nodiscard]] auto
bam_header_size(const resource &bam, const resource *bai,
                std::error_code &ec) -> std::uint64_t;

}  // namespace htsget

#endif  // LIB_HEADER_BOUNDARY_HPP_
