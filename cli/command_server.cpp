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

#include "command_server.hpp"

static constexpr auto about = "serve genomic data over the htsget protocol";

static constexpr auto description = R"(
An htsget server answers ticket requests for reads and variants with
URLs from which clients fetch the data, and serves the byte ranges
named in those URLs. Record IDs are paths below the root directory
without the file extension: reads/NA12878 with format BAM is the file
NA12878.bam in the subdirectory reads, and its index is NA12878.bam.bai.
The base URL is the prefix of every URL in a ticket; it must be how
clients reach this server. Options can also be given in a config file
with one 'name = value' line per option.)";

static constexpr auto examples = R"(
Examples:

htsget-server -d /data/genomes -s 0.0.0.0 -p 8080 -u http://example.org:8080)";

#include "arguments.hpp"
#include "local_data_store.hpp"
#include "logger.hpp"
#include "server.hpp"
#include "server_config.hpp"

#include <config.h>  // for VERSION

#include <boost/describe.hpp>
#include <boost/mp11/algorithm.hpp>  // for boost::mp11::mp_for_each
#include <boost/program_options.hpp>

#include <csignal>  // for SIGINT
#include <cstdint>
#include <cstdlib>  // for EXIT_FAILURE, EXIT_SUCCESS
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>  // std::make_shared
#include <print>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

namespace htsget {

struct server_argset : argset_base<server_argset> {
  server_config cfg;

  auto
  log_options_impl() const {
    std::vector<std::tuple<std::string, std::string>> key_value_pairs;
    using members =
      boost::describe::describe_members<server_config,
                                        boost::describe::mod_public>;
    boost::mp11::mp_for_each<members>([&](const auto d) {
      key_value_pairs.emplace_back(d.name, std::format("{}", cfg.*d.pointer));
    });
    key_value_pairs.emplace_back("effective base_url", cfg.get_base_url());
    log_args<log_level_t::info>(key_value_pairs);
  }

  [[nodiscard]] auto
  set_cli_only_opts_impl() -> boost::program_options::options_description {
    namespace po = boost::program_options;
    using po::value;
    po::options_description opts("Command line only");
    opts.add_options()
      // clang-format off
      ("help,h", "print this message and exit")
      ("version", "print the version and exit")
      ("config-file,c", value(&config_file)->default_value("", "none"),
       "read options from this config file")
      // clang-format on
      ;
    return opts;
  }

  [[nodiscard]] auto
  set_common_opts_impl() -> boost::program_options::options_description {
    namespace po = boost::program_options;
    using po::value;
    std::error_code ec;
    const auto current_dir = std::filesystem::current_path(ec).string();
    po::options_description opts("Command line or config file");
    opts.add_options()
      // clang-format off
      ("root-directory,d",
       value(&cfg.root_directory)->default_value(current_dir, "current dir"),
       "directory of the data served")
      ("hostname,s",
       value(&cfg.hostname)->default_value(server_config::hostname_default),
       "server hostname or address to bind")
      ("port,p", value(&cfg.port)->default_value(server_config::port_default),
       "server port")
      ("block-size",
       value(&cfg.block_size)->default_value(server_config::block_size_default),
       "maximum bytes in one ticket URL or block response")
      ("base-url,u", value(&cfg.base_url)->default_value("", "http://hostname:port"),
       "prefix of URLs in tickets")
      ("n-threads,t",
       value(&cfg.n_threads)->default_value(server_config::n_threads_default),
       "number of threads")
      ("log-level,v",
       value(&cfg.log_level)->default_value(server_config::log_level_default),
       "{debug, info, warning, error, critical}")
      ("log-file,l", value(&cfg.log_file)->default_value("", "screen"),
       "log file name")
      ("error-on-interrupt", po::bool_switch(&cfg.error_on_interrupt),
       "exit with status 130 when interrupted")
      // clang-format on
      ;
    return opts;
  }
};

}  // namespace htsget

[[nodiscard]] auto
run_server(const htsget::server_config &cfg) -> int {
  static constexpr auto interrupted_status = 128 + SIGINT;

  auto &lgr = htsget::logger::instance();

  std::error_code ec;
  auto store = std::make_shared<htsget::local_data_store>(
    std::filesystem::canonical(cfg.root_directory, ec));
  if (ec) {
    lgr.error("Failed to get canonical directory for {}: {}",
              cfg.root_directory, ec);
    return EXIT_FAILURE;
  }

  try {
    htsget::server s(cfg.hostname, std::to_string(cfg.port), cfg.n_threads,
                     store, cfg.get_base_url(), cfg.block_size, lgr, ec);
    if (ec) {
      lgr.error("Failure initializing server: {}", ec);
      return EXIT_FAILURE;
    }
    lgr.info("Serving {} on {}:{}", store->get_root().string(), cfg.hostname,
             s.get_port());
    s.run();
    if (s.get_signal() == SIGINT && cfg.error_on_interrupt)
      return interrupted_status;
  }
  catch (const std::exception &e) {
    lgr.critical("Server stopped on error: {}", e.what());
    return EXIT_FAILURE;
  }
  lgr.info("Server stopped");
  return EXIT_SUCCESS;
}

auto
command_server_main(int argc,
                    char *argv[])  // NOLINT(cppcoreguidelines-avoid-c-arrays)
  -> int {
  static constexpr auto command = "htsget-server";
  static const auto usage = std::format("Usage: {} [options]\n", command);
  static const auto about_msg = std::format("{}: {}", command, about);
  static const auto description_msg =
    std::format("{}\n{}", description, examples);

  using htsget::logger;

  htsget::server_argset args;
  const auto ec = args.parse(argc, argv, usage, about_msg, description_msg);
  if (ec == argument_error_code::help_requested)
    return EXIT_SUCCESS;
  if (ec == argument_error_code::version_requested) {
    std::println("{} {}", command, VERSION);
    return EXIT_SUCCESS;
  }
  if (ec)
    return EXIT_FAILURE;

  std::shared_ptr<std::ostream> log_file =
    args.cfg.log_file.empty()
      ? std::make_shared<std::ostream>(std::cout.rdbuf())
      : std::make_shared<std::ofstream>(args.cfg.log_file, std::ios::app);

  auto &lgr = logger::instance(log_file, command, args.cfg.log_level);
  if (!lgr) {
    std::println("Failure initializing logging: {}.", lgr.get_status());
    return EXIT_FAILURE;
  }
  lgr.set_level(args.cfg.log_level);

  args.log_options();

  std::error_code validate_ec;
  if (!args.cfg.validate(validate_ec)) {
    lgr.error("Invalid configuration for root directory {}: {}",
              args.cfg.root_directory, validate_ec);
    return EXIT_FAILURE;
  }

  return run_server(args.cfg);
}
