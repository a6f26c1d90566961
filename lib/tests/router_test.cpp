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

#include <router.hpp>

#include <htsget_error_code.hpp>
#include <request.hpp>
#include <response.hpp>
#include <route_handler.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <system_error>
#include <utility>  // for std::move
#include <vector>

using namespace htsget;  // NOLINT

class named_handler : public route_handler {
public:
  explicit named_handler(std::string name) : name{std::move(name)} {}

  auto
  handle([[maybe_unused]] const std::vector<std::string> &sub_route,
         [[maybe_unused]] const request &req, response &resp) -> void override {
    resp.body = name;
  }

  std::string name;
};

class router_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    rtr.add_route({"reads"}, reads);
    rtr.add_route({"variants"}, variants);
    rtr.add_route({"api", "v1", "block"}, block);
  }

  router rtr;
  std::shared_ptr<route_handler> reads{
    std::make_shared<named_handler>("reads")};
  std::shared_ptr<route_handler> variants{
    std::make_shared<named_handler>("variants")};
  std::shared_ptr<route_handler> block{
    std::make_shared<named_handler>("block")};
};

TEST_F(router_mock, registered_path_resolves_with_empty_remainder) {
  std::error_code ec;
  const auto [handler, remaining] = rtr.resolve({"reads"}, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(handler, reads);
  EXPECT_TRUE(remaining.empty());

  const auto [nested, nested_remaining] =
    rtr.resolve({"api", "v1", "block"}, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(nested, block);
  EXPECT_TRUE(nested_remaining.empty());
}

TEST_F(router_mock, extra_segments_are_returned) {
  std::error_code ec;
  const auto [handler, remaining] =
    rtr.resolve({"variants", "cohort", "chr20"}, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(handler, variants);
  EXPECT_EQ(remaining, (std::vector<std::string>{"cohort", "chr20"}));
}

TEST_F(router_mock, unregistered_path_not_found) {
  std::error_code ec;
  const auto [handler, remaining] = rtr.resolve({"sequences", "x"}, ec);
  EXPECT_EQ(ec, htsget_error_code::not_found);
  EXPECT_EQ(handler, nullptr);
}

TEST_F(router_mock, walk_ending_on_inner_node_not_found) {
  std::error_code ec;
  [[maybe_unused]] const auto r = rtr.resolve({"api", "v1"}, ec);
  EXPECT_EQ(ec, htsget_error_code::not_found);
}

TEST_F(router_mock, empty_path_not_found) {
  std::error_code ec;
  [[maybe_unused]] const auto r = rtr.resolve({}, ec);
  EXPECT_EQ(ec, htsget_error_code::not_found);
}

TEST_F(router_mock, registering_again_replaces_handler) {
  const auto replacement = std::make_shared<named_handler>("new reads");
  rtr.add_route({"reads"}, replacement);
  std::error_code ec;
  const auto [handler, remaining] = rtr.resolve({"reads", "id"}, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(handler, replacement);
}

TEST_F(router_mock, descending_through_leaf_makes_inner_node) {
  const auto special = std::make_shared<named_handler>("special");
  rtr.add_route({"reads", "special"}, special);
  std::error_code ec;
  const auto [handler, remaining] = rtr.resolve({"reads", "special", "x"}, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(handler, special);
  EXPECT_EQ(remaining, std::vector<std::string>{"x"});

  [[maybe_unused]] const auto r = rtr.resolve({"reads", "other"}, ec);
  EXPECT_EQ(ec, htsget_error_code::not_found);
}
