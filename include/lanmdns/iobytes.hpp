/**
 * lanmdns - Multicast DNS service discovery engine
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301 USA
 */

#pragma once
#include "exceptions.hpp"
#include "formatterhelper.hpp"
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic,cppcoreguidelines-pro-avoid-magic-numbers)

namespace lanmdns {
class io_bytes_reader;
class io_bytes_writer;

static constexpr uint32_t BYTE_MASK = 0x0FF;

/**
 * @short View over binary wire data.
 *
 * It always references an external buffer, normally a received datagram or a
 * io_bytes_managed, and does NOT own it.
 *
 * All network data is big endian. Reading or writing past the end throws a
 * protocol_exception, so a truncated datagram never reads garbage.
 */
class io_bytes {
public:
  uint8_t *start = nullptr;
  uint8_t *end = nullptr;
  uint8_t *position = nullptr;

  io_bytes() {}
  ~io_bytes() = default;

  io_bytes(uint8_t *start, size_t size)
      : start(start), end(start + size), position(start) {}
  io_bytes(const io_bytes &other) = default;
  io_bytes &operator=(const io_bytes &other) = default;

  void check_enough(size_t nbytes) const {
    if (position + nbytes > end)
      throw protocol_exception("Try to access end of buffer at {}, size {}",
                               (position - start) + nbytes, size());
  }
  void skip(size_t nbytes) {
    check_enough(nbytes);
    position += nbytes;
  }
  void seek(size_t pos) {
    if (start + pos > end)
      throw protocol_exception("Invalid buffer position {}, size {}", pos,
                               size());
    position = start + pos;
  }
  size_t size() const { return end - start; }
  size_t pos() const { return position - start; }
  size_t remaining() const { return end - position; }

  // Space separated hex bytes, from start to end. For logs.
  std::string to_hex() const {
    std::string ret;
    ret.reserve(size() * 3);
    for (auto *data = start; data < end; ++data) {
      ret += FMT::format("{:02X} ", *data & BYTE_MASK);
    }
    return ret;
  }
};

class io_bytes_writer : public io_bytes {
public:
  io_bytes_writer(const io_bytes &other) : io_bytes(other) {}
  io_bytes_writer(uint8_t *data, size_t size) : io_bytes(data, size) {}

  void write_uint8(uint8_t n) {
    check_enough(1);
    *position++ = (n & BYTE_MASK);
  }
  void write_uint16(uint16_t n) {
    check_enough(2);
    *position++ = (n >> 8) & BYTE_MASK;
    *position++ = (n & BYTE_MASK);
  }
  void write_uint32(uint32_t n) {
    check_enough(4);
    *position++ = (n >> 24) & BYTE_MASK;
    *position++ = (n >> 16) & BYTE_MASK;
    *position++ = (n >> 8) & BYTE_MASK;
    *position++ = (n & BYTE_MASK);
  }
  void write_bytes(const uint8_t *data, size_t count) {
    check_enough(count);
    memcpy(position, data, count);
    position += count;
  }
  void write_string(std::string_view view) {
    write_bytes(reinterpret_cast<const uint8_t *>(view.data()), view.size());
  }
  // Overwrites a big endian uint16 already written at pos.
  void patch_uint16(size_t pos, uint16_t n) {
    if (start + pos + 2 > position)
      throw protocol_exception("Can not patch at {}, written {}", pos,
                               this->pos());
    start[pos] = (n >> 8) & BYTE_MASK;
    start[pos + 1] = (n & BYTE_MASK);
  }
};

class io_bytes_reader : public io_bytes {
public:
  io_bytes_reader(const io_bytes &other) : io_bytes(other) {}
  // Reads what was written so far
  io_bytes_reader(const io_bytes_writer &other) {
    start = other.start;
    end = other.position;
    position = other.start;
  }
  io_bytes_reader(const io_bytes_reader &other) = default;
  io_bytes_reader(uint8_t *data, size_t size) : io_bytes(data, size) {}
  ~io_bytes_reader() = default;

  io_bytes_reader &operator=(const io_bytes_reader &other) = default;

  uint32_t read_uint32() {
    check_enough(4);
    auto data = position;
    position += 4;
    return ((uint32_t)data[0] << 24) + ((uint32_t)data[1] << 16) +
           ((uint32_t)data[2] << 8) + ((uint32_t)data[3]);
  }

  uint16_t read_uint16() {
    check_enough(2);
    auto data = position;
    position += 2;
    return ((uint16_t)data[0] << 8) + ((uint16_t)data[1]);
  }

  uint8_t read_uint8() {
    check_enough(1);
    auto data = position;
    position += 1;
    return data[0];
  }

  std::vector<uint8_t> read_bytes(size_t count) {
    check_enough(count);
    std::vector<uint8_t> ret(position, position + count);
    position += count;
    return ret;
  }

  // The returned view points inside the buffer.
  std::string_view read_string(size_t count) {
    check_enough(count);
    std::string_view ret(reinterpret_cast<char *>(position), count);
    position += count;
    return ret;
  }
};

class io_bytes_managed : public io_bytes {
public:
  std::vector<uint8_t> data;

  io_bytes_managed(size_t size) : data(size) {
    start = data.data();
    end = data.data() + size;
    position = start;
  }
  io_bytes_managed(std::vector<uint8_t> &&from) : data(std::move(from)) {
    start = data.data();
    end = data.data() + data.size();
    position = start;
  }
  io_bytes_managed(const io_bytes_managed &) = delete;
  io_bytes_managed &operator=(const io_bytes_managed &other) = delete;

  io_bytes_managed(io_bytes_managed &&other) noexcept
      : data(std::move(other.data)) {
    start = other.start;
    end = other.end;
    position = other.position;
  }
  io_bytes_managed &operator=(io_bytes_managed &&other) noexcept {
    data = std::move(other.data);
    start = other.start;
    end = other.end;
    position = other.position;
    return *this;
  }
  ~io_bytes_managed() = default;
};

} // namespace lanmdns

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic,cppcoreguidelines-pro-avoid-magic-numbers)

template <> struct FMT::formatter<lanmdns::io_bytes_reader> {
  constexpr auto parse(FMT::format_parse_context &ctx) { return ctx.begin(); }
  auto format(const lanmdns::io_bytes_reader &data,
              FMT::format_context &ctx) const {
    return FMT::format_to(ctx.out(), "[io_bytes_reader at {}, {}B left]",
                          data.pos(), data.remaining());
  }
};
