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

#include <header_boundary.hpp>

#include <bam_index.hpp>
#include <format_error_code.hpp>
#include <local_resource.hpp>
#include <logger.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>

using namespace htsget;  // NOLINT

// A BGZF block header followed by 'bsize - 25' bytes of payload, a CRC32 and
// ISIZE; the payload is not valid deflate data, which only pass 1 would read
[[nodiscard]] static auto
raw_block(const std::uint16_t bsize, const std::uint32_t isize,
          const std::uint16_t xlen = 6, const char si1 = 'B',
          const char si2 = 'C', const std::uint16_t slen = 2,
          const std::uint8_t id1 = 31) -> std::string {
  std::string b;
  put_u8(b, id1);
  put_u8(b, 139);
  put_u8(b, 8);
  put_u8(b, 4);
  put_u32(b, 0);
  put_u8(b, 0);
  put_u8(b, 255);
  put_u16(b, xlen);
  put_u8(b, static_cast<std::uint8_t>(si1));
  put_u8(b, static_cast<std::uint8_t>(si2));
  put_u16(b, slen);
  put_u16(b, bsize);
  if (bsize >= 25)
    b += std::string(bsize - 25u, 'x');
  put_u32(b, 0);  // CRC32
  put_u32(b, isize);
  return b;
}

class header_boundary_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    root = generate_unique_dir_name();
    header_block = make_bgzf_block(make_bam_header(
      "@HD\tVN:1.6\tSO:coordinate\n", {{"chr1", 248956422}, {"chr2", 1000}}));
    body_block = make_bgzf_block(std::string(200, 'r'));
    write_file((root / "sample.bam").string(),
               header_block + body_block + bgzf_eof_block());
  }

  auto
  TearDown() -> void override {
    std::error_code ec;
    remove_directories(root.string(), ec);
  }

  std::filesystem::path root;
  std::string header_block;
  std::string body_block;
};

TEST(header_boundary_test, uncompressed_size_of_empty_header) {
  std::istringstream in(make_bam_header("", {}));
  std::error_code ec;
  EXPECT_EQ(uncompressed_header_size(in, ec), 8u);
  EXPECT_FALSE(ec);
}

TEST(header_boundary_test, uncompressed_size_counts_text_and_references) {
  const std::string text{"@HD\tVN:1.6\n"};
  std::istringstream in(
    make_bam_header(text, {{"chr1", 1000}, {"chr22", 500}}));
  std::error_code ec;
  // l_name counts the terminating NUL
  EXPECT_EQ(uncompressed_header_size(in, ec), 8u + 11u + (8u + 5u) + (8u + 6u));
  EXPECT_FALSE(ec);
}

TEST(header_boundary_test, uncompressed_size_rejects_bad_magic) {
  std::istringstream in(std::string{"BAI\1\0\0\0\0\0\0\0\0", 12});
  std::error_code ec;
  [[maybe_unused]] const auto sz = uncompressed_header_size(in, ec);
  EXPECT_EQ(ec, format_error_code::invalid_bam_magic);
}

TEST(header_boundary_test, uncompressed_size_rejects_truncated_header) {
  auto header = make_bam_header("@HD\tVN:1.6\n", {{"chr1", 1000}});
  header.resize(std::size(header) - 6);
  std::istringstream in(header);
  std::error_code ec;
  [[maybe_unused]] const auto sz = uncompressed_header_size(in, ec);
  EXPECT_EQ(ec, format_error_code::unexpected_end_of_stream);
}

TEST(header_boundary_test, single_block_returns_bsize_plus_one) {
  static constexpr std::uint16_t bsize = 40;
  std::istringstream in(raw_block(bsize, 8));
  std::error_code ec;
  EXPECT_EQ(compressed_header_size(in, 8, ec), bsize + 1u);
  EXPECT_FALSE(ec);
}

TEST(header_boundary_test, blocks_summed_until_header_is_covered) {
  // the header ends inside the second block; the third is not read
  std::istringstream in(raw_block(40, 6) + raw_block(50, 6) +
                        std::string("garbage"));
  std::error_code ec;
  EXPECT_EQ(compressed_header_size(in, 10, ec), 40u + 50u + 1u);
  EXPECT_FALSE(ec);
}

TEST(header_boundary_test, extra_length_other_than_six_fails) {
  std::istringstream in(raw_block(40, 8, 8));
  std::error_code ec;
  const auto sz = compressed_header_size(in, 8, ec);
  EXPECT_EQ(ec, format_error_code::invalid_extra_length);
  EXPECT_EQ(sz, 0u);
}

TEST(header_boundary_test, bad_gzip_magic_fails) {
  std::istringstream in(raw_block(40, 8, 6, 'B', 'C', 2, 0x1e));
  std::error_code ec;
  [[maybe_unused]] const auto sz = compressed_header_size(in, 8, ec);
  EXPECT_EQ(ec, format_error_code::invalid_block_magic);
}

TEST(header_boundary_test, bad_subfield_identifier_fails) {
  std::istringstream in(raw_block(40, 8, 6, 'B', 'D'));
  std::error_code ec;
  [[maybe_unused]] const auto sz = compressed_header_size(in, 8, ec);
  EXPECT_EQ(ec, format_error_code::invalid_subfield_identifier);
}

TEST(header_boundary_test, bad_subfield_length_fails) {
  std::istringstream in(raw_block(40, 8, 6, 'B', 'C', 4));
  std::error_code ec;
  [[maybe_unused]] const auto sz = compressed_header_size(in, 8, ec);
  EXPECT_EQ(ec, format_error_code::invalid_subfield_length);
}

TEST(header_boundary_test, block_size_too_small_fails) {
  std::istringstream in(raw_block(20, 8));
  std::error_code ec;
  [[maybe_unused]] const auto sz = compressed_header_size(in, 8, ec);
  EXPECT_EQ(ec, format_error_code::invalid_block_size);
}

TEST(header_boundary_test, running_out_of_blocks_fails) {
  std::istringstream in(raw_block(40, 4));
  std::error_code ec;
  [[maybe_unused]] const auto sz = compressed_header_size(in, 8, ec);
  EXPECT_EQ(ec, format_error_code::unexpected_end_of_stream);
}

TEST_F(header_boundary_mock, index_path_uses_smallest_interval) {
  write_file((root / "sample.bam.bai").string(),
             make_bai({
               {make_virtual_offset(500, 0)},
               {make_virtual_offset(200, 7), make_virtual_offset(800, 0)},
             }));
  const local_resource bam(root, "sample.bam");
  const local_resource bai(root, "sample.bam.bai");
  std::error_code ec;
  EXPECT_EQ(bam_header_size(bam, &bai, ec), 200u);
  EXPECT_FALSE(ec);
}

TEST_F(header_boundary_mock, scan_path_ends_at_header_block) {
  const local_resource bam(root, "sample.bam");
  std::error_code ec;
  EXPECT_EQ(bam_header_size(bam, nullptr, ec), std::size(header_block));
  EXPECT_FALSE(ec);
}

TEST_F(header_boundary_mock, index_and_scan_paths_agree) {
  const auto body_offset = std::size(header_block);
  write_file((root / "sample.bam.bai").string(),
             make_bai({{make_virtual_offset(body_offset, 0)}}));
  const local_resource bam(root, "sample.bam");
  const local_resource bai(root, "sample.bam.bai");
  std::error_code ec;
  const auto from_index = bam_header_size(bam, &bai, ec);
  EXPECT_FALSE(ec);
  const auto from_blocks = header_size_from_blocks(bam, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(from_index, from_blocks);
}

TEST_F(header_boundary_mock, index_without_intervals_falls_back_to_scan) {
  write_file((root / "sample.bam.bai").string(), make_bai({{}, {}}));
  const local_resource bam(root, "sample.bam");
  const local_resource bai(root, "sample.bam.bai");
  std::error_code ec;
  EXPECT_EQ(bam_header_size(bam, &bai, ec), std::size(header_block));
  EXPECT_FALSE(ec);
}

TEST_F(header_boundary_mock, missing_index_falls_back_to_scan) {
  const local_resource bam(root, "sample.bam");
  const local_resource bai(root, "sample.bam.bai");
  std::error_code ec;
  EXPECT_EQ(bam_header_size(bam, &bai, ec), std::size(header_block));
  EXPECT_FALSE(ec);
}

TEST_F(header_boundary_mock, corrupt_index_fails) {
  write_file((root / "sample.bam.bai").string(), "not an index");
  const local_resource bam(root, "sample.bam");
  const local_resource bai(root, "sample.bam.bai");
  std::error_code ec;
  [[maybe_unused]] const auto sz = bam_header_size(bam, &bai, ec);
  EXPECT_EQ(ec, format_error_code::invalid_index_magic);
}
