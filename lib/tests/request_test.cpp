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

#include <request.hpp>

#include <htsget_error_code.hpp>

#include <gtest/gtest.h>

#include <string>
#include <system_error>
#include <vector>

using namespace htsget;  // NOLINT

TEST(request_test, parse_path_segments) {
  std::error_code ec;
  const auto req = request::parse_target("/reads/giab/NA12878", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(req.path, (std::vector<std::string>{"reads", "giab", "NA12878"}));
  EXPECT_TRUE(req.query.empty());
}

TEST(request_test, parse_root_target) {
  std::error_code ec;
  const auto req = request::parse_target("/", ec);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(req.path.empty());
}

TEST(request_test, segments_are_percent_decoded) {
  std::error_code ec;
  const auto req = request::parse_target("/block/a%20b/c%2Fd.bam", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(req.path, (std::vector<std::string>{"block", "a b", "c/d.bam"}));
}

TEST(request_test, query_values_are_listed_by_key) {
  std::error_code ec;
  const auto req = request::parse_target(
    "/variants/x?format=vcf&class=&fields=QNAME&fields=FLAG+X", ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(req.get_param("format"), "vcf");
  EXPECT_EQ(req.get_param("class"), "");
  EXPECT_EQ(req.query.at("fields"),
            (std::vector<std::string>{"QNAME", "FLAG X"}));
  EXPECT_FALSE(req.get_param("start").has_value());
}

TEST(request_test, field_without_equals_is_invalid) {
  std::error_code ec;
  [[maybe_unused]] const auto req =
    request::parse_target("/reads/x?format", ec);
  EXPECT_EQ(ec, htsget_error_code::invalid_input);
}

TEST(request_test, target_must_start_with_slash) {
  std::error_code ec;
  [[maybe_unused]] const auto req = request::parse_target("reads/x", ec);
  EXPECT_EQ(ec, htsget_error_code::invalid_input);
}

TEST(request_test, bad_percent_escape_is_invalid) {
  std::error_code ec;
  [[maybe_unused]] const auto a = percent_decode("abc%4", false, ec);
  EXPECT_EQ(ec, htsget_error_code::invalid_input);
  ec.clear();
  [[maybe_unused]] const auto b = percent_decode("%zz", false, ec);
  EXPECT_EQ(ec, htsget_error_code::invalid_input);
}

TEST(request_test, plus_decodes_to_space_only_in_query) {
  std::error_code ec;
  EXPECT_EQ(percent_decode("a+b", true, ec), "a b");
  EXPECT_EQ(percent_decode("a+b", false, ec), "a+b");
  EXPECT_FALSE(ec);
}
