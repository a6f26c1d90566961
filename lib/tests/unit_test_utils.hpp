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

#ifndef LIB_TESTS_UNIT_TEST_UTILS_HPP_
#define LIB_TESTS_UNIT_TEST_UTILS_HPP_

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace htsget {
struct response;
}  // namespace htsget

[[nodiscard]] auto
generate_unique_dir_name() -> std::string;

auto
remove_directories(const std::string &dirname, std::error_code &error) -> void;

auto
write_file(const std::string &filename, const std::string_view bytes) -> void;

// little-endian appenders
auto
put_u8(std::string &s, const std::uint8_t v) -> void;
auto
put_u16(std::string &s, const std::uint16_t v) -> void;
auto
put_u32(std::string &s, const std::uint32_t v) -> void;
auto
put_u64(std::string &s, const std::uint64_t v) -> void;

/// One BGZF block holding 'data' compressed with raw deflate
[[nodiscard]] auto
make_bgzf_block(const std::string_view data) -> std::string;

/// The empty block that ends every BGZF file
[[nodiscard]] auto
bgzf_eof_block() -> std::string;

/// Uncompressed BAM header: magic, text and references
[[nodiscard]] auto
make_bam_header(const std::string_view text,
                const std::vector<std::pair<std::string, std::int32_t>> &refs)
  -> std::string;

/// BAI with no bins; one linear index of virtual offsets per reference
[[nodiscard]] auto
make_bai(const std::vector<std::vector<std::uint64_t>> &intervals)
  -> std::string;

/// Bytes a response would send: its body, or everything its body source
/// yields
[[nodiscard]] auto
response_bytes(htsget::response &resp) -> std::string;

#endif  // LIB_TESTS_UNIT_TEST_UTILS_HPP_
