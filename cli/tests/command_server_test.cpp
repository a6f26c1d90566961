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

#include <command_server.hpp>

#include "unit_test_utils.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdlib>  // for EXIT_SUCCESS, EXIT_FAILURE
#include <filesystem>
#include <string>
#include <system_error>

TEST(command_server_test, help_succeeds) {
  const auto argv = std::array{"htsget-server", "--help"};
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result =
    command_server_main(argc, const_cast<char **>(std::data(argv)));
  EXPECT_EQ(result, EXIT_SUCCESS);
}

TEST(command_server_test, version_succeeds) {
  const auto argv = std::array{"htsget-server", "--version"};
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result =
    command_server_main(argc, const_cast<char **>(std::data(argv)));
  EXPECT_EQ(result, EXIT_SUCCESS);
}

TEST(command_server_test, unknown_option_fails) {
  const auto argv = std::array{"htsget-server", "--no-such-option"};
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result =
    command_server_main(argc, const_cast<char **>(std::data(argv)));
  EXPECT_EQ(result, EXIT_FAILURE);
}

TEST(command_server_test, missing_root_directory_fails) {
  const auto root = generate_unique_dir_name();
  const auto argv = std::array{
    "htsget-server", "-v", "error", "-d", root.data(), "-p", "8080",
  };
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result =
    command_server_main(argc, const_cast<char **>(std::data(argv)));
  EXPECT_EQ(result, EXIT_FAILURE);
}

TEST(command_server_test, missing_config_file_fails) {
  const auto argv = std::array{
    "htsget-server",
    "-c",
    "no_such_htsget_server.conf",
  };
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result =
    command_server_main(argc, const_cast<char **>(std::data(argv)));
  EXPECT_EQ(result, EXIT_FAILURE);
}

TEST(command_server_test, invalid_config_file_values_fail) {
  const auto dir = generate_unique_dir_name();
  const auto config_file = dir + "/htsget-server.conf";
  write_file(config_file, std::string("root-directory = ") + dir +
                            "\nport = 8080\nn-threads = 0\nlog-level = error\n");
  const auto argv = std::array{"htsget-server", "-c", config_file.data()};
  const int argc = sizeof(argv) / sizeof(argv[0]);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  const int result =
    command_server_main(argc, const_cast<char **>(std::data(argv)));
  EXPECT_EQ(result, EXIT_FAILURE);

  std::error_code ec;
  remove_directories(dir, ec);
  EXPECT_FALSE(ec);
}
