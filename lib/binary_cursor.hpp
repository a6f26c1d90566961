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

#ifndef LIB_BINARY_CURSOR_HPP_
#define LIB_BINARY_CURSOR_HPP_

#include <array>
#include <concepts>  // for std::unsigned_integral
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <system_error>

namespace htsget {

enum class byte_order : std::uint8_t {
  little,
  big,
};

/// @brief Sequential reader of fixed-width values from a byte stream. Every
/// read consumes bytes; a short read sets the error code and the value
/// returned is zero.
class binary_cursor {
public:
  explicit binary_cursor(std::istream &in,
                         const byte_order order = byte_order::little) :
    in{in}, order{order} {}

  [[nodiscard]] auto
  read_u8(std::error_code &ec) -> std::uint8_t {
    return read_uint<std::uint8_t>(ec);
  }

  [[nodiscard]] auto
  read_u16(std::error_code &ec) -> std::uint16_t {
    return read_uint<std::uint16_t>(ec);
  }

  [[nodiscard]] auto
  read_u32(std::error_code &ec) -> std::uint32_t {
    return read_uint<std::uint32_t>(ec);
  }

  [[nodiscard]] auto
  read_i32(std::error_code &ec) -> std::int32_t {
    return static_cast<std::int32_t>(read_uint<std::uint32_t>(ec));
  }

  [[nodiscard]] auto
  read_u64(std::error_code &ec) -> std::uint64_t {
    return read_uint<std::uint64_t>(ec);
  }

  /// Read exactly n bytes as a string
  [[nodiscard]] auto
  read_string(const std::size_t n, std::error_code &ec) -> std::string;

  /// Consume n bytes without keeping them
  auto
  skip(const std::uint64_t n, std::error_code &ec) -> void;

  /// Number of bytes consumed so far
  [[nodiscard]] auto
  position() const noexcept -> std::uint64_t {
    return n_consumed;
  }

  [[nodiscard]] auto
  at_end() -> bool {
    return in.peek() == std::istream::traits_type::eof();
  }

private:
  auto
  read_raw(char *dst, const std::size_t n, std::error_code &ec) -> void;

  template <std::unsigned_integral T>
  [[nodiscard]] auto
  read_uint(std::error_code &ec) -> T {
    static constexpr auto bits_per_byte = 8u;
    std::array<std::uint8_t, sizeof(T)> bytes{};
    // NOLINTNEXTLINE(*-reinterpret-cast)
    read_raw(reinterpret_cast<char *>(bytes.data()), sizeof(T), ec);
    if (ec)
      return {};
    std::uint64_t value{};
    if (order == byte_order::little)
      for (auto i = sizeof(T); i > 0; --i)
        value = (value << bits_per_byte) | bytes[i - 1];
    else
      for (const auto b : bytes)
        value = (value << bits_per_byte) | b;
    return static_cast<T>(value);
  }

  std::istream &in;
  byte_order order{};
  std::uint64_t n_consumed{};
};

}  // namespace htsget

#endif  // LIB_BINARY_CURSOR_HPP_
