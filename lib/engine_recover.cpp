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

#include <cstring>
#include <lanmdns/engine.hpp>
#include <lanmdns/exceptions.hpp>
#include <lanmdns/logger.hpp>

namespace lanmdns {

void mdns_engine_t::open_multicast_socket() {
  std::shared_ptr<transport_t> next = transport_factory();
  next->open(
      [this](io_bytes_reader &data, const network_address_t &from) {
        data_ready(data, from);
      },
      [this](int errno_) { transport_error(errno_); });

  std::lock_guard<std::mutex> lock(transport_mutex);
  transport = std::move(next);
}

void mdns_engine_t::close_multicast_socket() {
  std::shared_ptr<transport_t> current;
  {
    std::lock_guard<std::mutex> lock(transport_mutex);
    current = transport;
  }
  if (!current) {
    return;
  }

  try {
    current->leave_group();
  } catch (const network_exception &e) {
    DEBUG("Could not leave the multicast group: {}", e.what());
  }
  current->close();
  while (!current->wait_receiver_stopped(std::chrono::milliseconds(1000))) {
    DEBUG("Waiting for the receiver to stop");
  }

  std::lock_guard<std::mutex> lock(transport_mutex);
  if (transport == current) {
    transport.reset();
  }
}

void mdns_engine_t::transport_error(int errno_) {
  ERROR("Multicast channel failed: {} ({}). Recovering.", strerror(errno_),
        errno_);
  recover();
}

void mdns_engine_t::send_goodbye(const dns_entity_t &entity) {
  outgoing_message_t header(dns_constants::FLAGS_QR_RESPONSE |
                                dns_constants::FLAGS_AA,
                            true, config.max_message_size);
  for (auto &out : build_messages(header, {}, entity.get_records(0))) {
    send(out);
  }
}

/**
 * Rebuilds the channel after a fatal error.
 *
 * Only one recovery runs at a time: the host going to canceling is the
 * flag. Runs at its own thread, as it waits for the scheduler and the
 * receiver thread, and any of them may have called it.
 */
void mdns_engine_t::recover() {
  auto &host_state = local_host->state;
  if (host_state.is_closing() || host_state.is_closed() ||
      host_state.is_canceling() || host_state.is_canceled()) {
    DEBUG("Not recovering {}, already {}", config.name, host_state.get_state());
    return;
  }

  std::lock_guard<std::mutex> lock(recover_mutex);
  if (closing || !host_state.cancel()) {
    return;
  }
  INFO("Recovering {}", config.name);

  if (recovery_thread.joinable()) {
    if (recovery_thread.get_id() == std::this_thread::get_id()) {
      recovery_thread.detach();
    } else {
      recovery_thread.join();
    }
  }
  recovery_thread = std::thread([this]() { run_recovery(); });
}

// The recovery thread may need recover_mutex to finish, so it is joined out
// of it.
void mdns_engine_t::join_recovery() {
  std::thread finishing;
  {
    std::lock_guard<std::mutex> lock(recover_mutex);
    if (recovery_thread.joinable() &&
        recovery_thread.get_id() != std::this_thread::get_id()) {
      finishing = std::move(recovery_thread);
    }
  }
  if (finishing.joinable()) {
    finishing.join();
  }
}

void mdns_engine_t::run_recovery() {
  try {
    scheduler.purge_timer();

    auto snapshot = get_services();
    // The canceler started here takes the host too, it is already canceling
    cancel_services(snapshot);
    if (!local_host->state.wait_for_canceled(config.close_timeout)) {
      WARNING("Timeout waiting for {} to be canceled", config.name);
    }

    scheduler.purge_state_timer();
    close_multicast_socket();

    std::lock_guard<std::mutex> lock(recover_mutex);
    if (closing) {
      INFO("{} is closing. Not recovering.", config.name);
      return;
    }
    if (!local_host->state.is_canceled()) {
      ERROR("Could not recover, we are down!");
      return;
    }

    for (auto &info : snapshot) {
      info->state.recover();
    }
    // Registered while recovering. Their tasks were purged.
    for (auto &info : get_services()) {
      info->state.recover();
    }
    local_host->state.recover();

    try {
      open_multicast_socket();
    } catch (const network_exception &e) {
      ERROR("Could not open the multicast channel again: {}. We are down!",
            e.what());
      local_host->state.cancel();
      return;
    }

    start(snapshot);
    INFO("Recovered {} with {} services", config.name, snapshot.size());
  } catch (const std::exception &e) {
    ERROR("Error recovering {}: {}", config.name, e.what());
  }
}

void mdns_engine_t::close() {
  {
    std::lock_guard<std::mutex> lock(recover_mutex);
    closing = true;
  }
  // No new recovery from here on
  join_recovery();

  if (!local_host->state.close()) {
    if (local_host->state.is_canceling() || local_host->state.is_canceled()) {
      // Recovery failed. Whatever is left just stops.
      DEBUG("Closing {}, that is down", config.name);
      scheduler.dispose();
      listener_executor.shutdown();
      close_multicast_socket();
    }
    return;
  }
  INFO("Closing {}", config.name);

  scheduler.cancel_timer();
  unregister_all_services();
  send_goodbye(*local_host);
  scheduler.cancel_state_timer();

  listener_executor.shutdown();
  close_multicast_socket();
  scheduler.dispose();

  local_host->state.advance(nullptr);
  INFO("Closed {}", config.name);
}

} // namespace lanmdns
