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
#include "iobytes.hpp"
#include "networkaddress.hpp"
#include "poller.hpp"
#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace lanmdns {
/**
 * @short The multicast channel as seen by the engine.
 *
 * open() starts delivering datagrams to on_packet from a receive thread of
 * the transport. A read error that makes the channel unusable is reported
 * once through on_error, and no more packets are delivered.
 */
class transport_t {
public:
  using on_packet_t =
      std::function<void(io_bytes_reader &, const network_address_t &)>;
  using on_error_t = std::function<void(int)>;

  virtual ~transport_t() = default;

  // Throws network_exception
  virtual void open(on_packet_t on_packet, on_error_t on_error) = 0;
  // Throws network_exception
  virtual void leave_group() = 0;
  // Stops receiving. The receive thread may still be finishing.
  virtual void close() = 0;
  virtual bool wait_receiver_stopped(std::chrono::milliseconds timeout) = 0;
  virtual bool is_open() const = 0;
  // Throws network_exception
  virtual void send_to(const io_bytes &data, const network_address_t &to) = 0;
  virtual network_address_t get_group_address() const = 0;
};

using transport_factory_t = std::function<std::unique_ptr<transport_t>()>;

/**
 * UDP socket on port 5353 joined to the mDNS group of the interface address
 * family: 224.0.0.251 or ff02::fb.
 */
class multicast_socket_t : public transport_t {
  NON_COPYABLE_NOR_MOVABLE(multicast_socket_t)

  network_address_t interface_address;
  network_address_t group;
  // Guards fd against the senders. The receive thread only reads it while
  // running, and it is joined before fd is released.
  mutable std::mutex fd_mutex;
  int fd = -1;
  poller_t poller;
  poller_t::listener_t listener;
  on_packet_t on_packet;
  on_error_t on_error;

  std::atomic<bool> running{false};
  std::mutex receiver_mutex;
  std::condition_variable receiver_stopped;
  bool receiving = false;
  std::thread receiver;

  void setup_ipv4();
  void setup_ipv6();
  void data_ready();
  void receive_loop();
  void release();

public:
  explicit multicast_socket_t(const network_address_t &interface_address);
  ~multicast_socket_t() override;

  void open(on_packet_t on_packet, on_error_t on_error) override;
  void leave_group() override;
  void close() override;
  bool wait_receiver_stopped(std::chrono::milliseconds timeout) override;
  bool is_open() const override;
  void send_to(const io_bytes &data, const network_address_t &to) override;
  network_address_t get_group_address() const override { return group; }
};
} // namespace lanmdns
