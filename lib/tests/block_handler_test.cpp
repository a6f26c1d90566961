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

#include <block_handler.hpp>

#include <htsget_error_code.hpp>
#include <local_data_store.hpp>
#include <logger.hpp>
#include <request.hpp>
#include <response.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace htsget;  // NOLINT

class block_handler_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    root = generate_unique_dir_name();
    write_file((root / "data" / "file.bin").string(), contents);
    store = std::make_shared<local_data_store>(root);
  }

  auto
  TearDown() -> void override {
    std::error_code ec;
    remove_directories(root.string(), ec);
  }

  [[nodiscard]] auto
  get(const std::string_view target,
      const std::uint64_t block_size = 16) const -> response {
    block_handler handler(store, block_size);
    std::error_code ec;
    const auto req = request::parse_target(target, ec);
    EXPECT_FALSE(ec);
    // the router consumes the 'block' segment
    const std::vector<std::string> sub_route(std::cbegin(req.path) + 1,
                                             std::cend(req.path));
    response resp;
    handler.handle(sub_route, req, resp);
    return resp;
  }

  [[nodiscard]] static auto
  error_of(const htsget_error_code e) -> std::uint16_t {
    return classify_error(e).status;
  }

  std::filesystem::path root;
  std::string contents{"0123456789abcdefghij"};
  std::shared_ptr<data_store> store;
};

TEST_F(block_handler_mock, serve_range) {
  auto resp = get("/block/data/file.bin?start=3&end=9");
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.content_type, "application/octet-stream");
  ASSERT_TRUE(resp.source.has_value());
  EXPECT_EQ(resp.source->size, 6u);
  EXPECT_TRUE(resp.body.empty());
  EXPECT_EQ(response_bytes(resp), "345678");
}

TEST_F(block_handler_mock, serve_range_ending_at_file_end) {
  auto resp = get("/block/data/file.bin?start=10&end=20");
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(response_bytes(resp), "abcdefghij");
}

TEST_F(block_handler_mock, whole_file_when_it_fits) {
  auto resp = get("/block/data/file.bin", 64);
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(response_bytes(resp), contents);
}

TEST_F(block_handler_mock, whole_file_larger_than_block_is_invalid_range) {
  const auto resp = get("/block/data/file.bin", 16);
  EXPECT_EQ(resp.status, error_of(htsget_error_code::invalid_range));
  EXPECT_NE(resp.body.find("InvalidRange"), std::string::npos);
}

TEST_F(block_handler_mock, bad_ranges) {
  for (const auto target : {
         "/block/data/file.bin?start=5&end=5",
         "/block/data/file.bin?start=9&end=3",
         "/block/data/file.bin?start=10&end=21",
         "/block/data/file.bin?start=0&end=17",
       }) {
    const auto resp = get(target);
    EXPECT_EQ(resp.status, 400) << target;
    EXPECT_NE(resp.body.find("InvalidRange"), std::string::npos) << target;
  }
}

TEST_F(block_handler_mock, bad_bounds_are_invalid_input) {
  for (const auto target : {
         "/block/data/file.bin?start=5",
         "/block/data/file.bin?start=x&end=5",
         "/block/data/file.bin?start=-1&end=5",
       }) {
    const auto resp = get(target);
    EXPECT_EQ(resp.status, 400) << target;
    EXPECT_NE(resp.body.find("InvalidInput"), std::string::npos) << target;
  }
}

TEST_F(block_handler_mock, error_response_has_no_body_source) {
  const auto resp = get("/block/data/file.bin?start=0&end=40");
  EXPECT_EQ(resp.status, 400);
  EXPECT_FALSE(resp.source.has_value());
}

TEST_F(block_handler_mock, missing_file_not_found) {
  EXPECT_EQ(get("/block/data/other.bin?start=0&end=1").status, 404);
  EXPECT_EQ(get("/block").status, 404);
  EXPECT_EQ(get("/block/../file.bin?start=0&end=1").status, 404);
}
