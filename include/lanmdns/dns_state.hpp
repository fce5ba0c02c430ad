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
#include "utils.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace lanmdns {
class dns_task_t;
using task_id_t = uint64_t;

enum dns_state_e {
  PROBING_1,
  PROBING_2,
  PROBING_3,
  ANNOUNCING_1,
  ANNOUNCING_2,
  ANNOUNCED,
  CANCELING_1,
  CANCELING_2,
  CANCELING_3,
  CANCELED,
  CLOSING,
  CLOSED,
};

// Next state along the transition graph. Terminal states stay.
dns_state_e dns_state_next(dns_state_e state);
bool is_probing_state(dns_state_e state);
bool is_announcing_state(dns_state_e state);
bool is_canceling_state(dns_state_e state);

/**
 * @short Lifecycle of one advertised name, a host or a service.
 *
 * Tasks drive it forward. A task is the authoritative driver of a state when
 * it is associated to the entity under that state; only it can advance it.
 * This way a probe queued before a conflict revert can not push the new
 * probing round forward.
 *
 * cancel() and close() only request the termination. The canceler task does
 * the real work and callers synchronize with wait_for_canceled().
 */
class dns_state_machine_t {
  NON_COPYABLE_NOR_MOVABLE(dns_state_machine_t)

  std::string name;
  mutable std::mutex mutex;
  std::condition_variable state_changed;
  dns_state_e state = PROBING_1;
  std::map<task_id_t, dns_state_e> associations;

  void set_state(dns_state_e next);
  bool is_terminal_bound() const;

public:
  explicit dns_state_machine_t(std::string name) : name(std::move(name)) {}

  dns_state_e get_state() const;
  const std::string &get_name() const { return name; }

  // A null task drives only when no task is associated to the current state
  bool advance(const dns_task_t *task);
  bool revert();
  bool cancel();
  bool close();
  void recover();

  bool associate(const dns_task_t *task, dns_state_e state);
  void disassociate(const dns_task_t *task);
  bool is_associated(const dns_task_t *task, dns_state_e state) const;

  bool wait_for_announced(std::chrono::milliseconds timeout);
  bool wait_for_canceled(std::chrono::milliseconds timeout);

  bool is_probing() const;
  bool is_announcing() const;
  bool is_announced() const;
  bool is_canceling() const;
  bool is_canceled() const;
  bool is_closing() const;
  bool is_closed() const;

  std::string to_string() const;
};
} // namespace lanmdns

ENUM_FORMATTER_BEGIN(lanmdns::dns_state_e);
ENUM_FORMATTER_ELEMENT(lanmdns::PROBING_1, "probing 1");
ENUM_FORMATTER_ELEMENT(lanmdns::PROBING_2, "probing 2");
ENUM_FORMATTER_ELEMENT(lanmdns::PROBING_3, "probing 3");
ENUM_FORMATTER_ELEMENT(lanmdns::ANNOUNCING_1, "announcing 1");
ENUM_FORMATTER_ELEMENT(lanmdns::ANNOUNCING_2, "announcing 2");
ENUM_FORMATTER_ELEMENT(lanmdns::ANNOUNCED, "announced");
ENUM_FORMATTER_ELEMENT(lanmdns::CANCELING_1, "canceling 1");
ENUM_FORMATTER_ELEMENT(lanmdns::CANCELING_2, "canceling 2");
ENUM_FORMATTER_ELEMENT(lanmdns::CANCELING_3, "canceling 3");
ENUM_FORMATTER_ELEMENT(lanmdns::CANCELED, "canceled");
ENUM_FORMATTER_ELEMENT(lanmdns::CLOSING, "closing");
ENUM_FORMATTER_ELEMENT(lanmdns::CLOSED, "closed");
ENUM_FORMATTER_END();

TO_STRING_FORMATTER(lanmdns::dns_state_machine_t);
