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

#include "header_boundary.hpp"

#include "bam_index.hpp"
#include "binary_cursor.hpp"
#include "format_error_code.hpp"
#include "logger.hpp"
#include "resource.hpp"

#include <cstdint>
#include <istream>
#include <iterator>  // for std::size
#include <optional>
#include <string_view>
#include <system_error>

namespace htsget {

[[nodiscard]] auto
uncompressed_header_size(std::istream &decompressed,
                         std::error_code &ec) -> std::uint64_t {
  using std::literals::string_view_literals::operator""sv;
  static constexpr auto bam_magic = "BAM\1"sv;
  static constexpr std::uint64_t l_ref_size{4};

  binary_cursor cursor(decompressed, byte_order::little);

  const auto magic = cursor.read_string(std::size(bam_magic), ec);
  if (ec)
    return 0;
  if (magic != bam_magic) {
    ec = format_error_code::invalid_bam_magic;
    return 0;
  }

  const auto l_text = cursor.read_i32(ec);
  if (ec)
    return 0;
  if (l_text < 0) {
    ec = format_error_code::invalid_header_field;
    return 0;
  }
  cursor.skip(static_cast<std::uint64_t>(l_text), ec);
  if (ec)
    return 0;

  const auto n_ref = cursor.read_i32(ec);
  if (ec)
    return 0;
  if (n_ref < 0) {
    ec = format_error_code::invalid_header_field;
    return 0;
  }

  // magic + l_text + text
  std::uint64_t header_size =
    std::size(bam_magic) + 4 + static_cast<std::uint64_t>(l_text);
  for (std::int32_t i = 0; i < n_ref; ++i) {
    const auto l_name = cursor.read_i32(ec);
    if (ec)
      return 0;
    if (l_name < 0) {
      ec = format_error_code::invalid_header_field;
      return 0;
    }
    cursor.skip(static_cast<std::uint64_t>(l_name) + l_ref_size, ec);
    if (ec)
      return 0;
    header_size += 8 + static_cast<std::uint64_t>(l_name);
  }
  return header_size;
}

[[nodiscard]] auto
compressed_header_size(std::istream &raw, const std::uint64_t uncompressed_size,
                       std::error_code &ec) -> std::uint64_t {
  using hdr = bgzf_block_header;
  static constexpr std::uint64_t mtime_size{4};
  static constexpr std::uint64_t xfl_os_size{2};
  static constexpr std::uint64_t crc32_size{4};

  binary_cursor cursor(raw, byte_order::little);

  std::uint64_t header_size{};
  std::uint64_t n_decoded{};
  while (n_decoded < uncompressed_size) {
    const auto id1 = cursor.read_u8(ec);
    const auto id2 = cursor.read_u8(ec);
    [[maybe_unused]] const auto cm = cursor.read_u8(ec);
    [[maybe_unused]] const auto flg = cursor.read_u8(ec);
    if (ec)
      return 0;
    if (id1 != hdr::gzip_id1 || id2 != hdr::gzip_id2) {
      ec = format_error_code::invalid_block_magic;
      return 0;
    }

    cursor.skip(mtime_size + xfl_os_size, ec);
    const auto xlen = cursor.read_u16(ec);
    if (ec)
      return 0;
    if (xlen != hdr::extra_length) {
      ec = format_error_code::invalid_extra_length;
      return 0;
    }

    const auto si1 = cursor.read_u8(ec);
    const auto si2 = cursor.read_u8(ec);
    if (ec)
      return 0;
    if (si1 != hdr::subfield_id1 || si2 != hdr::subfield_id2) {
      ec = format_error_code::invalid_subfield_identifier;
      return 0;
    }

    const auto slen = cursor.read_u16(ec);
    if (ec)
      return 0;
    if (slen != hdr::subfield_length) {
      ec = format_error_code::invalid_subfield_length;
      return 0;
    }

    // BSIZE is the total block size minus one
    const auto bsize = cursor.read_u16(ec);
    if (ec)
      return 0;
    if (bsize < xlen + hdr::fixed_size) {
      ec = format_error_code::invalid_block_size;
      return 0;
    }
    header_size += bsize;

    cursor.skip(bsize - xlen - hdr::fixed_size, ec);  // CDATA
    cursor.skip(crc32_size, ec);
    n_decoded += cursor.read_u32(ec);  // ISIZE
    if (ec)
      return 0;
  }
  return header_size + 1;
}

[[nodiscard]] auto
header_size_from_index(const resource &index,
                       std::error_code &ec) -> std::optional<std::uint64_t> {
  const auto in = index.open(false, ec);
  if (ec)
    return std::nullopt;
  const auto bai = bam_index::read(*in, ec);
  if (ec)
    return std::nullopt;
  return bai.min_file_offset();
}

[[nodiscard]] auto
header_size_from_blocks(const resource &bam,
                        std::error_code &ec) -> std::uint64_t {
  std::uint64_t uncompressed_size{};
  {
    const auto decompressed = bam.open(true, ec);
    if (ec)
      return 0;
    uncompressed_size = uncompressed_header_size(*decompressed, ec);
    if (ec)
      return 0;
  }
  const auto raw = bam.open(false, ec);
  if (ec)
    return 0;
  return compressed_header_size(*raw, uncompressed_size, ec);
}

[[nodiscard]] auto
bam_header_size(const resource &bam, const resource *bai,
                std::error_code &ec) -> std::uint64_t {
  auto &lgr = logger::instance();
  if (bai != nullptr && bai->exists()) {
    const auto from_index = header_size_from_index(*bai, ec);
    if (ec)
      return 0;
    if (from_index) {
      lgr.debug("Header size of {} from index {}: {}", bam.id(), bai->id(),
                *from_index);
      return *from_index;
    }
    lgr.debug("Index {} has no intervals; scanning {}", bai->id(), bam.id());
  }
  const auto from_blocks = header_size_from_blocks(bam, ec);
  if (ec)
    return 0;
  lgr.debug("Header size of {} from blocks: {}", bam.id(), from_blocks);
  return from_blocks;
}

}  // namespace htsget
