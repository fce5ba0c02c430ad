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

#include "formatterhelper.hpp"
#include <array>
#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>

namespace lanmdns {
/**
 * @short An IPv4 or IPv6 socket address, as a plain copyable value.
 *
 * Messages keep the sender address after the receive buffer is gone, and
 * responses carry their destination, so this owns its storage.
 */
class network_address_t {
  sockaddr_storage addr{};
  socklen_t len = 0;

public:
  network_address_t() = default;
  network_address_t(const sockaddr *addr, socklen_t len);

  // Throws network_exception(EINVAL) when ip is not a numeric address
  static network_address_t from_string(const std::string &ip, int port);
  // First non loopback address of a running interface, preferring IPv4.
  // Throws lanmdns::exception if there is none.
  static network_address_t find_local_address();

  int port() const;
  void set_port(int port);
  std::string ip() const;
  std::string to_string() const;

  const sockaddr *get_sockaddr() const {
    return reinterpret_cast<const sockaddr *>(&addr);
  }
  socklen_t get_socklen() const { return len; }
  int get_aifamily() const { return addr.ss_family; }
  bool is_valid() const { return len != 0; }
  bool is_ipv6() const { return addr.ss_family == AF_INET6; }

  std::array<uint8_t, 4> get_ipv4() const;
  std::array<uint8_t, 16> get_ipv6() const;
  // IPv6 scope, to pick the interface for link local multicast
  uint32_t get_scope_id() const;

  bool operator==(const network_address_t &other) const;
  bool operator!=(const network_address_t &other) const {
    return !(*this == other);
  }
};
} // namespace lanmdns

TO_STRING_FORMATTER(lanmdns::network_address_t);
