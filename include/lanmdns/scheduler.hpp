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
#include "dns_state.hpp"
#include "formatterhelper.hpp"
#include "utils.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lanmdns {

/**
 * Unit of work for the scheduler. A periodic task keeps running until it
 * calls cancel() on itself.
 */
class dns_task_t : public std::enable_shared_from_this<dns_task_t> {
  static std::atomic<task_id_t> next_id;
  const task_id_t id;
  std::atomic<bool> canceled{false};

public:
  dns_task_t() : id(next_id++) {}
  virtual ~dns_task_t() = default;

  task_id_t get_id() const { return id; }
  virtual std::string get_name() const = 0;
  virtual void run() = 0;
  // Returns false if it was already canceled
  virtual bool cancel();
  bool is_canceled() const { return canceled; }
};

enum task_group_e { QUERY_TASKS = 0, STATE_TASKS = 1 };

/**
 * @short One timer thread running the tasks of one engine, one at a time.
 *
 * Tasks belong to a group: one shot query tasks (responders, resolvers) or
 * the state tasks (probers, announcers, renewers, cancelers). Each group can
 * be purged of the pending tasks, or canceled for good.
 */
class task_scheduler_t {
  NON_COPYABLE_NOR_MOVABLE(task_scheduler_t)

  struct timer_event_t {
    std::chrono::steady_clock::time_point when;
    std::chrono::milliseconds period;
    int id;
    task_group_e group;
    // Increased at each purge; stale events are not rescheduled
    int generation;
    std::shared_ptr<dns_task_t> task;
  };
  struct group_status_t {
    bool canceled = false;
    int generation = 0;
  };

  std::string name;
  mutable std::mutex mutex;
  std::condition_variable wakeup;
  std::vector<timer_event_t> timer_events; // sorted by when
  std::array<group_status_t, 2> groups;
  int max_timer_id = 1;
  bool disposed = false;
  std::thread thread;

  void insert_event(timer_event_t &&event);
  std::vector<std::shared_ptr<dns_task_t>> drop_group(task_group_e group);
  void run_loop();

public:
  explicit task_scheduler_t(std::string name);
  ~task_scheduler_t();

  // Returns false if the group is canceled or the scheduler disposed
  bool schedule(task_group_e group, std::shared_ptr<dns_task_t> task,
                std::chrono::milliseconds delay,
                std::chrono::milliseconds period = std::chrono::milliseconds(0));

  void cancel_timer() { cancel_group(QUERY_TASKS); }
  void cancel_state_timer() { cancel_group(STATE_TASKS); }
  void purge_timer() { purge_group(QUERY_TASKS); }
  void purge_state_timer() { purge_group(STATE_TASKS); }
  void cancel_group(task_group_e group);
  void purge_group(task_group_e group);

  void dispose();
  bool is_disposed() const;
  bool is_timer_thread() const;
  size_t pending(task_group_e group) const;
};
} // namespace lanmdns

ENUM_FORMATTER_BEGIN(lanmdns::task_group_e);
ENUM_FORMATTER_ELEMENT(lanmdns::QUERY_TASKS, "query");
ENUM_FORMATTER_ELEMENT(lanmdns::STATE_TASKS, "state");
ENUM_FORMATTER_END();
