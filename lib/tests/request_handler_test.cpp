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

#include <request_handler.hpp>

#include <local_data_store.hpp>
#include <logger.hpp>
#include <response.hpp>
#include <route_handler.hpp>
#include <router.hpp>
#include <ticket.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using namespace htsget;  // NOLINT

struct throwing_handler : public route_handler {
  auto
  handle([[maybe_unused]] const std::vector<std::string> &sub_route,
         [[maybe_unused]] const request &req,
         [[maybe_unused]] response &resp) -> void override {
    throw std::runtime_error("disk on fire");
  }
};

class request_handler_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    root = generate_unique_dir_name();
    write_file((root / "giab" / "sample.cram").string(), "CRAM-DATA");
    store = std::make_shared<local_data_store>(root);
  }

  auto
  TearDown() -> void override {
    std::error_code ec;
    remove_directories(root.string(), ec);
  }

  [[nodiscard]] auto
  call(const std::string_view method, const std::string_view target,
       const std::optional<std::string_view> accept = std::nullopt) const
    -> response {
    const request_handler handler(store, "http://localhost:8080", 1024);
    response resp;
    handler.handle_request(method, target, accept, resp);
    return resp;
  }

  std::filesystem::path root;
  std::shared_ptr<data_store> store;
};

TEST_F(request_handler_mock, reads_ticket) {
  const auto resp = call("GET", "/reads/giab/sample?format=CRAM");
  EXPECT_EQ(resp.status, 200);
  std::error_code ec;
  const auto t = ticket::parse(resp.body, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(t.format, "CRAM");
  ASSERT_EQ(std::size(t.urls), 1u);
  EXPECT_EQ(t.urls.front().url,
            "http://localhost:8080/block/giab/sample.cram?start=0&end=9");
}

TEST_F(request_handler_mock, ticket_url_serves_the_bytes) {
  auto resp = call("GET", "/block/giab/sample.cram?start=0&end=9");
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(response_bytes(resp), "CRAM-DATA");
}

TEST_F(request_handler_mock, method_not_allowed) {
  const auto resp = call("POST", "/reads/giab/sample?format=CRAM");
  EXPECT_EQ(resp.status, 405);
}

TEST_F(request_handler_mock, accept_header_checked_before_routing) {
  EXPECT_EQ(call("GET", "/nowhere", "text/plain").status, 415);
  EXPECT_EQ(call("GET", "/nowhere", "application/json").status, 404);
  EXPECT_EQ(
    call("GET", "/reads/giab/sample?format=CRAM",
         "application/vnd.ga4gh.htsget.v1.1.0+json")
      .status,
    200);
  EXPECT_EQ(
    call("GET", "/reads/giab/sample?format=CRAM",
         "application/vnd.ga4gh.htsget.v0.9.0+json")
      .status,
    415);
}

TEST_F(request_handler_mock, unknown_route_not_found) {
  const auto resp = call("GET", "/reads");
  EXPECT_EQ(resp.status, 404);
  EXPECT_EQ(resp.content_type, response::error_content_type);
  EXPECT_EQ(call("GET", "/sequences/x").status, 404);
}

TEST_F(request_handler_mock, malformed_target_is_invalid_input) {
  EXPECT_EQ(call("GET", "/reads/giab/sample?format=%zz").status, 400);
}

TEST_F(request_handler_mock, handler_exception_becomes_unknown_error) {
  router rtr;
  rtr.add_route({"boom"}, std::make_shared<throwing_handler>());
  const request_handler handler(std::move(rtr));
  response resp;
  handler.handle_request("GET", "/boom", std::nullopt, resp);
  EXPECT_EQ(resp.status, 500);
  EXPECT_NE(resp.body.find("UnknownError"), std::string::npos);
  EXPECT_NE(resp.body.find("disk on fire"), std::string::npos);
}
