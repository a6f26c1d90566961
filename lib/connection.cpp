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

#include "connection.hpp"

#include "htsget_error_code.hpp"
#include "request_handler.hpp"
#include "response.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/system.hpp>

#include <algorithm>  // for std::min
#include <cstddef>
#include <cstdint>
#include <exception>
#include <ios>  // for std::streamsize
#include <optional>
#include <string>
#include <string_view>
#include <utility>  // for std::move

namespace htsget {

namespace http = boost::beast::http;

auto
connection::start() -> void {
  boost::system::error_code endpoint_ec;
  const auto endpoint = stream.socket().remote_endpoint(endpoint_ec);
  if (!endpoint_ec)
    lgr.info("Connection id: {}. Request endpoint: {}", conn_id,
             boost::lexical_cast<std::string>(endpoint));
  read_request();
}

auto
connection::stop() -> void {
  lgr.debug("{} Initiating connection shutdown.", conn_id);
  boost::system::error_code shutdown_ec;  // for non-throwing
  (void)stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both,
                                 shutdown_ec);
  if (shutdown_ec && shutdown_ec != boost::beast::errc::not_connected)
    lgr.warning("{} Shutdown error: {}", conn_id, shutdown_ec);
  boost::system::error_code close_ec;
  (void)stream.socket().close(close_ec);
  if (close_ec)
    lgr.warning("{} Socket close error: {}", conn_id, close_ec);
}

auto
connection::read_request() -> void {
  req = {};
  stream.expires_after(timeout);
  // as long as lambda is alive, connection instance is too
  auto self(shared_from_this());
  http::async_read(
    stream, buf, req,
    [this, self](const boost::system::error_code ec,
                 [[maybe_unused]] const std::size_t bytes_transferred) {
      if (ec) {
        if (ec != http::error::end_of_stream)
          lgr.warning("{} Failed to read request: {}", conn_id, ec);
        stop();
        return;
      }
      handle_request();
      respond();
    });
}

auto
connection::handle_request() -> void {
  response resp;
  std::optional<std::string_view> accept;
  if (const auto itr = req.find(http::field::accept); itr != req.end())
    accept = itr->value();
  const std::string_view method = req.method_string();
  const std::string_view target = req.target();
  lgr.info("{} {} {}", conn_id, method, target);
  try {
    handler.handle_request(method, target, accept, resp);
  }
  catch (const std::exception &e) {
    lgr.error("{} Error handling request: {}", conn_id, e.what());
    resp.set_error(classify_error(htsget_error_code::unknown_error),
                   e.what());
  }

  if (resp.source) {
    source = std::move(resp.source->in);
    remaining = resp.source->size;
    auto &r = streamed_res.emplace();
    r.version(req.version());
    r.result(resp.status);
    r.set(http::field::server, "htsget-server");
    r.set(http::field::content_type, resp.content_type);
    r.keep_alive(false);
    r.content_length(remaining);
    r.body().data = nullptr;
    r.body().more = true;
    serializer.emplace(r);
    return;
  }

  res = {};
  res.version(req.version());
  res.result(resp.status);
  res.set(http::field::server, "htsget-server");
  res.set(http::field::content_type, resp.content_type);
  res.keep_alive(false);
  res.body() = std::move(resp.body);
  res.prepare_payload();
}

auto
connection::respond() -> void {
  if (serializer) {
    respond_streamed();
    return;
  }
  stream.expires_after(timeout);
  auto self(shared_from_this());
  http::async_write(
    stream, res,
    [this, self](const boost::system::error_code ec,
                 const std::size_t bytes_transferred) {
      if (ec)
        lgr.warning("{} Error sending response: {}", conn_id, ec);
      else
        lgr.info("{} Responded with {} ({}B)", conn_id, res.result_int(),
                 bytes_transferred);
      stop();
    });
}

auto
connection::respond_streamed() -> void {
  stream.expires_after(timeout);
  auto self(shared_from_this());
  http::async_write_header(
    stream, *serializer,
    [this, self](const boost::system::error_code ec,
                 [[maybe_unused]] const std::size_t bytes_transferred) {
      if (ec) {
        lgr.warning("{} Error sending response header: {}", conn_id, ec);
        stop();
        return;
      }
      write_chunk();
    });
}

auto
connection::write_chunk() -> void {
  const auto n_bytes = std::min<std::uint64_t>(remaining, chunk_size);
  source->read(chunk.data(), static_cast<std::streamsize>(n_bytes));
  if (static_cast<std::uint64_t>(source->gcount()) != n_bytes) {
    // header already sent; the client sees a short body
    lgr.error("{} Short read with {}B left to send", conn_id, remaining);
    stop();
    return;
  }
  remaining -= n_bytes;

  auto &body = streamed_res->body();
  body.data = chunk.data();
  body.size = n_bytes;
  body.more = remaining > 0;

  stream.expires_after(timeout);
  auto self(shared_from_this());
  http::async_write(
    stream, *serializer,
    [this, self](boost::system::error_code ec,
                 [[maybe_unused]] const std::size_t bytes_transferred) {
      // the serializer consumed the chunk and waits for the next one
      if (ec == http::error::need_buffer)
        ec = {};
      if (ec) {
        lgr.warning("{} Error sending response body: {}", conn_id, ec);
        stop();
        return;
      }
      if (remaining > 0) {
        write_chunk();
        return;
      }
      lgr.info("{} Responded with {} ({}B body)", conn_id,
               streamed_res->result_int(),
               std::string(streamed_res->at(http::field::content_length)));
      stop();
    });
}

}  // namespace htsget
