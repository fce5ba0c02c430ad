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
#include <array>
#include <cstring>
#include <lanmdns/dns.hpp>
#include <lanmdns/exceptions.hpp>
#include <lanmdns/logger.hpp>
#include <lanmdns/transport.hpp>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lanmdns {

static constexpr int MULTICAST_TTL = 255;
static constexpr std::chrono::milliseconds RECEIVE_POLL_INTERVAL{250};

template <typename T>
static void set_option(int fd, int level, int option, const T &value,
                       const char *option_name) {
  if (setsockopt(fd, level, option, &value, sizeof(value)) != 0) {
    auto error = errno;
    ERROR("setsockopt({}) failed: {}", option_name, strerror(error));
    throw network_exception(error);
  }
}

multicast_socket_t::multicast_socket_t(const network_address_t &address)
    : interface_address(address) {
  if (interface_address.is_ipv6()) {
    group = network_address_t::from_string(dns_constants::MDNS_GROUP_IPV6,
                                           dns_constants::MDNS_PORT);
  } else {
    group = network_address_t::from_string(dns_constants::MDNS_GROUP,
                                           dns_constants::MDNS_PORT);
  }
}

multicast_socket_t::~multicast_socket_t() {
  close();
  while (!wait_receiver_stopped(std::chrono::milliseconds(1000))) {
    WARNING("Still waiting for the receive thread to stop");
  }
}

void multicast_socket_t::open(on_packet_t on_packet_, on_error_t on_error_) {
  std::lock_guard<std::mutex> lock(fd_mutex);
  if (fd >= 0) {
    throw exception("Multicast socket already open");
  }
  on_packet = std::move(on_packet_);
  on_error = std::move(on_error_);

  fd = socket(interface_address.get_aifamily(), SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    auto error = errno;
    ERROR("Error creating socket: {}", strerror(error));
    throw network_exception(error);
  }

  try {
    int reuse = 1;
    set_option(fd, SOL_SOCKET, SO_REUSEADDR, reuse, "SO_REUSEADDR");
    set_option(fd, SOL_SOCKET, SO_REUSEPORT, reuse, "SO_REUSEPORT");
    if (interface_address.is_ipv6()) {
      setup_ipv6();
    } else {
      setup_ipv4();
    }
    listener = poller.add_fd_in(fd, [this](int) { data_ready(); });
  } catch (const std::exception &) {
    ::close(fd);
    fd = -1;
    throw;
  }

  {
    std::lock_guard<std::mutex> receiver_lock(receiver_mutex);
    receiving = true;
  }
  running = true;
  receiver = std::thread([this] { receive_loop(); });
  INFO("Multicast socket open at {}, group {}", interface_address.ip(),
       group.to_string());
}

void multicast_socket_t::setup_ipv4() {
  sockaddr_in bind_address{};
  bind_address.sin_family = AF_INET;
  bind_address.sin_addr.s_addr = htonl(INADDR_ANY);
  bind_address.sin_port = htons(dns_constants::MDNS_PORT);
  if (bind(fd, reinterpret_cast<sockaddr *>(&bind_address),
           sizeof(bind_address)) != 0) {
    auto error = errno;
    ERROR("Error binding to port {}: {}", dns_constants::MDNS_PORT,
          strerror(error));
    throw network_exception(error);
  }

  auto interface = interface_address.get_ipv4();
  in_addr interface_addr{};
  memcpy(&interface_addr.s_addr, interface.data(), interface.size());

  ip_mreq req{};
  req.imr_multiaddr.s_addr = inet_addr(dns_constants::MDNS_GROUP);
  req.imr_interface = interface_addr;
  set_option(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, req, "IP_ADD_MEMBERSHIP");

  uint8_t ttl = MULTICAST_TTL;
  set_option(fd, IPPROTO_IP, IP_MULTICAST_TTL, ttl, "IP_MULTICAST_TTL");
  uint8_t loopback = 1;
  set_option(fd, IPPROTO_IP, IP_MULTICAST_LOOP, loopback, "IP_MULTICAST_LOOP");
  if (interface_addr.s_addr != htonl(INADDR_ANY)) {
    set_option(fd, IPPROTO_IP, IP_MULTICAST_IF, interface_addr,
               "IP_MULTICAST_IF");
  }
}

void multicast_socket_t::setup_ipv6() {
  sockaddr_in6 bind_address{};
  bind_address.sin6_family = AF_INET6;
  bind_address.sin6_addr = in6addr_any;
  bind_address.sin6_port = htons(dns_constants::MDNS_PORT);

  int v6only = 1;
  set_option(fd, IPPROTO_IPV6, IPV6_V6ONLY, v6only, "IPV6_V6ONLY");
  if (bind(fd, reinterpret_cast<sockaddr *>(&bind_address),
           sizeof(bind_address)) != 0) {
    auto error = errno;
    ERROR("Error binding to port {}: {}", dns_constants::MDNS_PORT,
          strerror(error));
    throw network_exception(error);
  }

  unsigned int ifindex = interface_address.get_scope_id();
  ipv6_mreq req{};
  inet_pton(AF_INET6, dns_constants::MDNS_GROUP_IPV6, &req.ipv6mr_multiaddr);
  req.ipv6mr_interface = ifindex;
  set_option(fd, IPPROTO_IPV6, IPV6_JOIN_GROUP, req, "IPV6_JOIN_GROUP");

  int hops = MULTICAST_TTL;
  set_option(fd, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, hops,
             "IPV6_MULTICAST_HOPS");
  unsigned int loopback = 1;
  set_option(fd, IPPROTO_IPV6, IPV6_MULTICAST_LOOP, loopback,
             "IPV6_MULTICAST_LOOP");
  if (ifindex != 0) {
    set_option(fd, IPPROTO_IPV6, IPV6_MULTICAST_IF, ifindex,
               "IPV6_MULTICAST_IF");
  }
}

void multicast_socket_t::leave_group() {
  std::lock_guard<std::mutex> lock(fd_mutex);
  if (fd < 0) {
    throw network_exception(EBADF);
  }
  if (interface_address.is_ipv6()) {
    ipv6_mreq req{};
    inet_pton(AF_INET6, dns_constants::MDNS_GROUP_IPV6, &req.ipv6mr_multiaddr);
    req.ipv6mr_interface = interface_address.get_scope_id();
    set_option(fd, IPPROTO_IPV6, IPV6_LEAVE_GROUP, req, "IPV6_LEAVE_GROUP");
  } else {
    auto interface = interface_address.get_ipv4();
    ip_mreq req{};
    req.imr_multiaddr.s_addr = inet_addr(dns_constants::MDNS_GROUP);
    memcpy(&req.imr_interface.s_addr, interface.data(), interface.size());
    set_option(fd, IPPROTO_IP, IP_DROP_MEMBERSHIP, req, "IP_DROP_MEMBERSHIP");
  }
}

void multicast_socket_t::receive_loop() {
  DEBUG("Receive thread started");
  while (running) {
    poller.wait(RECEIVE_POLL_INTERVAL);
  }
  DEBUG("Receive thread stopped");
  std::lock_guard<std::mutex> lock(receiver_mutex);
  receiving = false;
  receiver_stopped.notify_all();
}

void multicast_socket_t::data_ready() {
  std::array<uint8_t, dns_constants::MAX_MSG_ABSOLUTE> raw{};
  sockaddr_storage cliaddr{};
  socklen_t len = sizeof(cliaddr);
  auto n = recvfrom(fd, raw.data(), raw.size(), MSG_DONTWAIT,
                    reinterpret_cast<sockaddr *>(&cliaddr), &len);

  if (n < 0) {
    auto error = errno;
    if (error == EAGAIN || error == EWOULDBLOCK || error == EINTR) {
      return;
    }
    if (!running) {
      return; // closing
    }
    ERROR("Error reading from multicast socket: {}", strerror(error));
    running = false;
    listener.stop();
    on_error(error);
    return;
  }
  if (n == 0) {
    return;
  }

  network_address_t from{reinterpret_cast<sockaddr *>(&cliaddr), len};
  io_bytes_reader packet(raw.data(), n);
  on_packet(packet, from);
}

bool multicast_socket_t::is_open() const {
  std::lock_guard<std::mutex> lock(fd_mutex);
  return running && fd >= 0;
}

void multicast_socket_t::close() {
  std::lock_guard<std::mutex> lock(fd_mutex);
  if (fd < 0) {
    return;
  }
  running = false;
  listener.stop();
  // Wakes up any blocked read
  ::shutdown(fd, SHUT_RDWR);
}

bool multicast_socket_t::wait_receiver_stopped(
    std::chrono::milliseconds timeout) {
  {
    std::unique_lock<std::mutex> lock(receiver_mutex);
    if (!receiver_stopped.wait_for(lock, timeout,
                                   [this] { return !receiving; })) {
      return false;
    }
  }
  release();
  return true;
}

void multicast_socket_t::release() {
  if (receiver.joinable() &&
      receiver.get_id() != std::this_thread::get_id()) {
    receiver.join();
  }
  std::lock_guard<std::mutex> lock(fd_mutex);
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void multicast_socket_t::send_to(const io_bytes &data,
                                 const network_address_t &to) {
  std::lock_guard<std::mutex> lock(fd_mutex);
  if (fd < 0) {
    throw network_exception(EBADF);
  }
  auto res = ::sendto(fd, data.start, data.size(), 0, to.get_sockaddr(),
                      to.get_socklen());
  if (res < 0) {
    throw network_exception(errno);
  }
}

} // namespace lanmdns
