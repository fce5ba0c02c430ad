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

#include <arpa/inet.h>
#include <cstring>
#include <ifaddrs.h>
#include <lanmdns/exceptions.hpp>
#include <lanmdns/logger.hpp>
#include <lanmdns/networkaddress.hpp>
#include <net/if.h>

namespace lanmdns {

network_address_t::network_address_t(const sockaddr *from, socklen_t fromlen) {
  if (!from || fromlen > sizeof(addr)) {
    return;
  }
  memcpy(&addr, from, fromlen);
  len = fromlen;
}

network_address_t network_address_t::from_string(const std::string &ip,
                                                 int port) {
  network_address_t ret;
  sockaddr_in *in = reinterpret_cast<sockaddr_in *>(&ret.addr);
  if (inet_pton(AF_INET, ip.c_str(), &in->sin_addr) == 1) {
    in->sin_family = AF_INET;
    in->sin_port = htons(port);
    ret.len = sizeof(sockaddr_in);
    return ret;
  }
  sockaddr_in6 *in6 = reinterpret_cast<sockaddr_in6 *>(&ret.addr);
  if (inet_pton(AF_INET6, ip.c_str(), &in6->sin6_addr) == 1) {
    in6->sin6_family = AF_INET6;
    in6->sin6_port = htons(port);
    ret.len = sizeof(sockaddr_in6);
    return ret;
  }
  ERROR("Invalid IP address: {}", ip);
  throw network_exception(EINVAL);
}

network_address_t network_address_t::find_local_address() {
  ifaddrs *ifaddr = nullptr;
  if (getifaddrs(&ifaddr) < 0) {
    throw network_exception(errno);
  }
  network_address_t found_ipv6;
  network_address_t found;
  for (auto *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || !(ifa->ifa_flags & IFF_UP) ||
        (ifa->ifa_flags & IFF_LOOPBACK)) {
      continue;
    }
    auto family = ifa->ifa_addr->sa_family;
    if (family == AF_INET) {
      found = network_address_t(ifa->ifa_addr, sizeof(sockaddr_in));
      DEBUG("Local address at {}: {}", ifa->ifa_name, found.ip());
      break;
    }
    if (family == AF_INET6 && !found_ipv6.is_valid()) {
      found_ipv6 = network_address_t(ifa->ifa_addr, sizeof(sockaddr_in6));
    }
  }
  freeifaddrs(ifaddr);

  if (!found.is_valid()) {
    found = found_ipv6;
  }
  if (!found.is_valid()) {
    throw exception("No usable network interface found");
  }
  found.set_port(0);
  return found;
}

int network_address_t::port() const {
  if (!is_valid()) {
    ERROR("This network address do not point to any address.");
    return 0;
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in *>(&addr)->sin_port);
  }
  return ntohs(reinterpret_cast<const sockaddr_in6 *>(&addr)->sin6_port);
}

void network_address_t::set_port(int port) {
  if (!is_valid()) {
    ERROR("This network address do not point to any address.");
    return;
  }
  if (addr.ss_family == AF_INET) {
    reinterpret_cast<sockaddr_in *>(&addr)->sin_port = htons(port);
  } else {
    reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_port = htons(port);
  }
}

std::string network_address_t::ip() const {
  if (!is_valid()) {
    return "null";
  }
  std::array<char, INET6_ADDRSTRLEN> name{};
  if (addr.ss_family == AF_INET) {
    inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in *>(&addr)->sin_addr,
              name.data(), name.size());
    return name.data();
  }
  inet_ntop(AF_INET6,
            &reinterpret_cast<const sockaddr_in6 *>(&addr)->sin6_addr,
            name.data(), name.size());
  return name.data();
}

std::string network_address_t::to_string() const {
  if (!is_valid()) {
    return "null";
  }
  if (is_ipv6()) {
    return FMT::format("[{}]:{}", ip(), port());
  }
  return FMT::format("{}:{}", ip(), port());
}

std::array<uint8_t, 4> network_address_t::get_ipv4() const {
  std::array<uint8_t, 4> ret{};
  if (addr.ss_family == AF_INET) {
    memcpy(ret.data(),
           &reinterpret_cast<const sockaddr_in *>(&addr)->sin_addr.s_addr,
           ret.size());
  }
  return ret;
}

std::array<uint8_t, 16> network_address_t::get_ipv6() const {
  std::array<uint8_t, 16> ret{};
  if (addr.ss_family == AF_INET6) {
    memcpy(ret.data(),
           reinterpret_cast<const sockaddr_in6 *>(&addr)->sin6_addr.s6_addr,
           ret.size());
  }
  return ret;
}

uint32_t network_address_t::get_scope_id() const {
  if (addr.ss_family != AF_INET6) {
    return 0;
  }
  return reinterpret_cast<const sockaddr_in6 *>(&addr)->sin6_scope_id;
}

bool network_address_t::operator==(const network_address_t &other) const {
  if (addr.ss_family != other.addr.ss_family) {
    return false;
  }
  if (!is_valid()) {
    return !other.is_valid();
  }
  if (addr.ss_family == AF_INET) {
    return get_ipv4() == other.get_ipv4() && port() == other.port();
  }
  return get_ipv6() == other.get_ipv6() && port() == other.port();
}

} // namespace lanmdns
