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

#ifndef LIB_CONNECTION_HPP_
#define LIB_CONNECTION_HPP_

#include "logger.hpp"

#include <boost/asio.hpp>  // for tcp
#include <boost/beast.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <utility>  // for std::move

namespace htsget {

struct request_handler;

/// One accepted socket: reads a single HTTP request, writes the response
/// and closes. Owned by the completion handlers of its pending operations.
/// A response with a body source is written in chunks, each read from the
/// source just before it is sent.
struct connection : public std::enable_shared_from_this<connection> {
  connection(const connection &) = delete;
  connection &
  operator=(const connection &) = delete;

  explicit connection(boost::asio::ip::tcp::socket socket,
                      const request_handler &handler, logger &lgr,
                      const std::uint32_t conn_id) :
    stream{std::move(socket)}, handler{handler}, lgr{lgr}, conn_id{conn_id} {}

  auto
  start() -> void;

  auto
  stop() -> void;  // shutdown the socket

  auto
  read_request() -> void;

  auto
  handle_request() -> void;

  auto
  respond() -> void;

  auto
  respond_streamed() -> void;

  auto
  write_chunk() -> void;

  static constexpr std::chrono::seconds timeout{30};
  static constexpr std::size_t chunk_size{64 * 1024};

  boost::beast::tcp_stream stream;
  boost::beast::flat_buffer buf;
  boost::beast::http::request<boost::beast::http::string_body> req;
  boost::beast::http::response<boost::beast::http::string_body> res;
  // for streamed responses
  std::optional<boost::beast::http::response<boost::beast::http::buffer_body>>
    streamed_res;
  std::optional<
    boost::beast::http::response_serializer<boost::beast::http::buffer_body>>
    serializer;
  std::unique_ptr<std::istream> source;
  std::uint64_t remaining{};
  std::array<char, chunk_size> chunk{};
  const request_handler &handler;
  logger &lgr;
  std::uint32_t conn_id{};  // identifier for this connection
};

}  // namespace htsget

#endif  // LIB_CONNECTION_HPP_
