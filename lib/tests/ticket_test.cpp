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

#include <ticket.hpp>

#include <htsget_error_code.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <system_error>
#include <vector>

using namespace htsget;  // NOLINT

TEST(ticket_test, serialize_in_fixed_key_order) {
  const ticket t{
    "BAM",
    {
      {"http://localhost:80/block/a.bam?start=0&end=10", "header"},
      {"http://localhost:80/block/a.bam?start=10&end=20", "body"},
    },
  };
  EXPECT_EQ(t.serialize(),
            R"({"htsget":{"format":"BAM","urls":[)"
            R"({"url":"http://localhost:80/block/a.bam?start=0&end=10","class":"header"},)"
            R"({"url":"http://localhost:80/block/a.bam?start=10&end=20","class":"body"}]}})");
}

TEST(ticket_test, url_without_class_omits_class) {
  const ticket t{"VCF", {{"http://h/block/v.vcf?start=0&end=5", std::nullopt}}};
  EXPECT_EQ(t.serialize(), R"({"htsget":{"format":"VCF","urls":[)"
                           R"({"url":"http://h/block/v.vcf?start=0&end=5"}]}})");
}

TEST(ticket_test, parse_serialized_ticket) {
  const ticket t{
    "BAM",
    {
      {"http://x/block/r.bam?start=0&end=99", "header"},
      {"http://x/block/r.bam?start=99&end=120", "body"},
      {"http://x/block/r.bam?start=120&end=121", std::nullopt},
    },
  };
  std::error_code ec;
  const auto parsed = ticket::parse(t.serialize(), ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(parsed, t);
}

TEST(ticket_test, parse_malformed_ticket_fails) {
  std::error_code ec;
  [[maybe_unused]] const auto a = ticket::parse("{\"htsget\":", ec);
  EXPECT_EQ(ec, htsget_error_code::invalid_input);
  ec.clear();
  [[maybe_unused]] const auto b =
    ticket::parse(R"({"htsget":{"format":"BAM","urls":[{"class":"body"}]}})",
                  ec);
  EXPECT_EQ(ec, htsget_error_code::invalid_input);
}

TEST(ticket_test, block_url_form) {
  EXPECT_EQ(block_url("http://example.org:8080", "dir/sample 1.bam", 5, 17),
            "http://example.org:8080/block/dir/sample%201.bam?start=5&end=17");
}

TEST(ticket_test, block_urls_split_by_block_size) {
  const auto urls = block_urls("http://h", "f.vcf", 0, 25, 10, std::nullopt);
  ASSERT_EQ(std::size(urls), 3u);
  EXPECT_EQ(urls[0].url, "http://h/block/f.vcf?start=0&end=10");
  EXPECT_EQ(urls[1].url, "http://h/block/f.vcf?start=10&end=20");
  EXPECT_EQ(urls[2].url, "http://h/block/f.vcf?start=20&end=25");
  EXPECT_FALSE(urls[2].url_class.has_value());
}

TEST(ticket_test, empty_range_has_no_urls) {
  EXPECT_TRUE(block_urls("http://h", "f.bam", 7, 7, 10, "body").empty());
}
