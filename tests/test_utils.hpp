/**
 * lanmdns - Multicast DNS service discovery engine
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <lanmdns/dns.hpp>
#include <lanmdns/engine.hpp>
#include <lanmdns/iobytes.hpp>
#include <lanmdns/networkaddress.hpp>
#include <lanmdns/transport.hpp>
#include <memory>
#include <mutex>
#include <vector>

lanmdns::io_bytes_managed hex_to_bin(const std::string &str);

struct sent_packet_t {
  std::vector<uint8_t> data;
  lanmdns::network_address_t to;

  lanmdns::incoming_message_t parse() const;
};

/**
 * @short The network the fake transports are connected to
 *
 * Records all sent packets, and allows to inject packets and failures into
 * the currently open transport.
 */
class fake_transport_t;

class fake_network_t : public std::enable_shared_from_this<fake_network_t> {
  friend class fake_transport_t;

  std::mutex mutex;
  std::condition_variable changed;
  std::vector<sent_packet_t> sent;
  int opens = 0;
  int send_error = 0;
  fake_transport_t *current = nullptr;
  lanmdns::transport_t::on_packet_t on_packet;
  lanmdns::transport_t::on_error_t on_error;

public:
  lanmdns::transport_factory_t factory();

  // As received from the network at the current transport
  void inject(const lanmdns::outgoing_message_t &msg,
              const lanmdns::network_address_t &from);
  void inject(lanmdns::io_bytes_reader &packet,
              const lanmdns::network_address_t &from);
  // The receiver fails with that errno
  void fail(int errno_);
  // Next sends fail with that errno. 0 to stop failing.
  void fail_sends(int errno_);

  std::vector<sent_packet_t> get_sent();
  void clear_sent();
  int get_opens();
  // Waits until the sent packets satisfy the check
  bool wait_for(std::function<bool(const std::vector<sent_packet_t> &)> check,
                std::chrono::milliseconds timeout);
};

class fake_transport_t : public lanmdns::transport_t {
  std::shared_ptr<fake_network_t> network;
  std::atomic<bool> open_{false};

public:
  explicit fake_transport_t(std::shared_ptr<fake_network_t> network)
      : network(std::move(network)) {}
  ~fake_transport_t() override;

  void open(on_packet_t on_packet, on_error_t on_error) override;
  void leave_group() override {}
  void close() override;
  bool wait_receiver_stopped(std::chrono::milliseconds timeout) override {
    return true;
  }
  bool is_open() const override { return open_; }
  void send_to(const lanmdns::io_bytes &data,
               const lanmdns::network_address_t &to) override;
  lanmdns::network_address_t get_group_address() const override;
};

// Counts of the records of that type and name at all sent responses
int count_sent_records(const std::vector<sent_packet_t> &sent,
                       lanmdns::record_type_e type, const std::string &name,
                       bool goodbye = false);

// Protocol timings shortened to milliseconds
lanmdns::engine_config_t fast_config(const std::string &name);

// Polls the check until true or timeout
bool wait_until(const std::function<bool()> &check,
                std::chrono::milliseconds timeout);
