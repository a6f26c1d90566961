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

#include "server.hpp"

#include "connection.hpp"
#include "logger.hpp"
#include "request_handler.hpp"

#include <boost/asio.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/system.hpp>  // for boost::system::error_code

#include <csignal>
#include <cstdint>
#include <cstring>  // for strsignal
#include <exception>
#include <memory>  // std::make_shared<>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace htsget {

server::server(const std::string &address, const std::string &port,
               const std::uint32_t n_threads,
               const std::shared_ptr<data_store> &store,
               const std::string &base_url, const std::uint64_t block_size,
               logger &lgr, std::error_code &ec) :
  // io_context ioc uses default constructor
  n_threads{n_threads},
#if defined(SIGQUIT)
  signals(ioc, SIGINT, SIGTERM, SIGQUIT),
#else
  signals(ioc, SIGINT, SIGTERM),
#endif
  acceptor(ioc), handler(store, base_url, block_size), lgr{lgr} {
  do_await_stop();  // start waiting for signals

  boost::asio::ip::tcp::resolver resolver(ioc);
  boost::system::error_code boost_ec;
  const auto resolved = resolver.resolve(address, port, boost_ec);
  if (boost_ec || resolved.empty()) {
    ec = boost_ec ? std::error_code(boost_ec)
                  : std::make_error_code(std::errc::address_not_available);
    lgr.error("{} {}:{}", ec, address, port);
    return;
  }

  const boost::asio::ip::tcp::endpoint endpoint = *resolved.begin();
  const auto endpoint_str = boost::lexical_cast<std::string>(endpoint);
  lgr.info("Resolved endpoint {}", endpoint_str);

  // open acceptor...
  (void)acceptor.open(endpoint.protocol(), boost_ec);
  if (boost_ec) {
    ec = boost_ec;
    lgr.error("Error opening endpoint {}: {}", endpoint_str, ec);
    return;
  }

  // ...with option to reuse the address (SO_REUSEADDR)
  (void)acceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true),
                            boost_ec);
  if (boost_ec) {
    ec = boost_ec;
    lgr.error("Error setting SO_REUSEADDR: {}", ec);
    return;
  }

  (void)acceptor.bind(endpoint, boost_ec);
  if (boost_ec) {
    ec = boost_ec;
    lgr.error("Error binding endpoint {}: {}", endpoint_str, ec);
    return;
  }

  (void)acceptor.listen(boost::asio::socket_base::max_listen_connections,
                        boost_ec);
  if (boost_ec) {
    ec = boost_ec;
    lgr.error("Error listening on endpoint {}: {}", endpoint_str, ec);
    return;
  }
  do_accept();
}

auto
server::run() -> void {
  /* From the docs (v1.86.0): "Multiple threads may call the run()
     function to set up a pool of threads from which the io_context
     may execute handlers. All threads that are waiting in the pool
     are equivalent and the io_context may choose any one of them to
     invoke a handler."
  */
  std::mutex error_mtx;
  std::exception_ptr error;
  {
    std::vector<std::jthread> threads;
    for (std::uint32_t i = 0; i < n_threads; ++i)
      threads.emplace_back([this, &error_mtx, &error] {  // NOLINT
        try {
          ioc.run();
        }
        catch (const std::exception &e) {
          lgr.critical("Server thread failed: {}", e.what());
          {
            std::scoped_lock lock{error_mtx};
            if (!error)
              error = std::current_exception();
          }
          ioc.stop();
        }
      });
  }  // threads joined here
  boost::system::error_code close_ec;
  (void)acceptor.close(close_ec);
  if (error)
    std::rethrow_exception(error);
}

auto
server::stop() -> void {
  boost::asio::post(ioc, [this] {
    boost::system::error_code close_ec;
    (void)acceptor.close(close_ec);
    ioc.stop();
  });
}

[[nodiscard]] auto
server::get_port() const -> std::uint16_t {
  boost::system::error_code endpoint_ec;
  const auto endpoint = acceptor.local_endpoint(endpoint_ec);
  return endpoint_ec ? 0 : endpoint.port();
}

auto
server::do_accept() -> void {
  acceptor.async_accept(
    boost::asio::make_strand(ioc),  // ADS: make a strand with the io_context
    [this](const boost::system::error_code ec,
           boost::asio::ip::tcp::socket socket) {
      // quit if server already stopped
      if (!acceptor.is_open())
        return;
      if (!ec) {
        // accepted socket moved into connection which is started
        std::make_shared<connection>(std::move(socket), handler, lgr,
                                     connection_id++)
          ->start();
      }
      else
        lgr.warning("Error accepting connection: {}", ec);
      do_accept();  // keep listening for more connections
    });
}

auto
server::do_await_stop() -> void {
  // capture brings 'this' into search for names
  signals.async_wait(
    [this](const boost::system::error_code ec, const int signo) {
      if (ec)  // cancelled
        return;
      lgr.warning("Received signal {} ({})", strsignal(signo), ec);
      signal_received = signo;
      // stop server by cancelling all outstanding async ops; when all
      // have finished, the call to io_context::run() will finish
      boost::system::error_code close_ec;
      (void)acceptor.close(close_ec);
      ioc.stop();
    });
}

}  // namespace htsget
