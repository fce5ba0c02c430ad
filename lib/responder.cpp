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

#include <algorithm>
#include <lanmdns/engine.hpp>
#include <lanmdns/logger.hpp>
#include <lanmdns/tasks.hpp>

namespace lanmdns {

responder_t::responder_t(mdns_engine_t &engine, incoming_message_t in_,
                         const network_address_t &from)
    : engine(engine), in(std::move(in_)), from(from),
      unicast(from.port() != dns_constants::MDNS_PORT) {}

void responder_t::start() {
  auto &config = engine.get_config();
  auto delay = engine.get_random().between(config.response_min_wait,
                                           config.response_max_wait) -
               in.elapsed_since_arrival();
  delay = std::max(delay, std::chrono::milliseconds(0));
  DEBUG("Responding to {} in {}ms", from.to_string(), delay.count());
  engine.get_scheduler().schedule(QUERY_TASKS, shared_from_this(), delay);
}

std::string responder_t::get_name() const {
  return FMT::format("responder({}, {})", engine.get_name(), from.to_string());
}

// The sender payload, or the typical size. Never more than an mDNS message.
static size_t response_max_size(const incoming_message_t &in,
                                size_t default_size) {
  static constexpr size_t MIN_EDNS_PAYLOAD = 512;
  if (in.sender_udp_payload == 0) {
    return default_size;
  }
  return std::clamp(in.sender_udp_payload, MIN_EDNS_PAYLOAD,
                    dns_constants::MAX_MSG_ABSOLUTE);
}

void responder_t::run() {
  try {
    std::vector<question_t> questions;
    std::unordered_set<question_t> seen_questions;
    std::unordered_set<record_t> answers;

    for (auto &question : in.questions) {
      if (unicast && seen_questions.insert(question).second) {
        questions.push_back(question);
      }
      engine.add_answers(question, answers);
    }

    if (answers.empty()) {
      DEBUG("Nothing to answer to {}", from.to_string());
      return;
    }

    outgoing_message_t header(
        dns_constants::FLAGS_QR_RESPONSE | dns_constants::FLAGS_AA, !unicast,
        response_max_size(in, engine.get_config().max_message_size));
    header.id = in.id;
    if (unicast) {
      header.destination = from;
    }

    std::vector<record_t> answer_list(answers.begin(), answers.end());
    for (auto &out : build_messages(header, questions, answer_list)) {
      DEBUG("Response: {}", out);
      engine.send(out);
    }
  } catch (const std::exception &e) {
    ERROR("{}: could not answer: {}", get_name(), e.what());
  }
}

} // namespace lanmdns
