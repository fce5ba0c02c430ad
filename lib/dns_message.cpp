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

#include <lanmdns/dns.hpp>
#include <lanmdns/logger.hpp>

namespace lanmdns {

incoming_message_t incoming_message_t::parse(io_bytes_reader &reader) {
  incoming_message_t msg;
  msg.received = std::chrono::steady_clock::now();

  msg.id = reader.read_uint16();
  msg.flags = reader.read_uint16();
  auto nquestions = reader.read_uint16();
  auto nanswers = reader.read_uint16();
  auto nauthorities = reader.read_uint16();
  auto nadditionals = reader.read_uint16();

  for (int i = 0; i < nquestions; i++) {
    msg.questions.push_back(question_t::read(reader));
  }
  for (int i = 0; i < nanswers; i++) {
    msg.answers.push_back(record_t::read(reader));
  }
  for (int i = 0; i < nauthorities; i++) {
    msg.authorities.push_back(record_t::read(reader));
  }
  for (int i = 0; i < nadditionals; i++) {
    auto record = record_t::read(reader);
    if (record.type == TYPE_OPT) {
      msg.sender_udp_payload = record.dns_class;
      continue;
    }
    msg.answers.push_back(std::move(record));
  }
  if (reader.remaining() > 0) {
    DEBUG("{} trailing bytes after DNS message", reader.remaining());
  }
  return msg;
}

std::chrono::milliseconds incoming_message_t::elapsed_since_arrival() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - received);
}

template <typename T>
static std::string list_to_string(const std::vector<T> &items) {
  std::string ret = "[";
  for (auto &item : items) {
    if (&item != &items.front())
      ret += ", ";
    ret += item.to_string();
  }
  return ret + "]";
}

std::string incoming_message_t::to_string() const {
  return FMT::format("[{} id={} questions={} answers={} authorities={}]",
                     is_query() ? "query" : "response", id,
                     list_to_string(questions), list_to_string(answers),
                     list_to_string(authorities));
}

bool outgoing_message_t::add_question(const question_t &question) {
  auto size = question.size();
  if (current_size + size > max_size) {
    return false;
  }
  questions.push_back(question);
  current_size += size;
  return true;
}

bool outgoing_message_t::add_answer(const record_t &record) {
  auto size = record.size();
  if (current_size + size > max_size) {
    return false;
  }
  answers.push_back(record);
  current_size += size;
  return true;
}

bool outgoing_message_t::add_authority(const record_t &record) {
  auto size = record.size();
  if (current_size + size > max_size) {
    return false;
  }
  authorities.push_back(record);
  current_size += size;
  return true;
}

outgoing_message_t outgoing_message_t::fresh() const {
  outgoing_message_t ret(flags, multicast, max_size);
  ret.id = id;
  ret.destination = destination;
  return ret;
}

io_bytes_managed outgoing_message_t::serialize() const {
  io_bytes_managed data(current_size);
  io_bytes_writer writer(data);

  writer.write_uint16(id);
  writer.write_uint16(flags);
  writer.write_uint16(questions.size());
  writer.write_uint16(answers.size());
  writer.write_uint16(authorities.size());
  writer.write_uint16(0);

  for (auto &question : questions) {
    question.write(writer);
  }
  for (auto &record : answers) {
    record.write(writer);
  }
  for (auto &record : authorities) {
    record.write(writer);
  }
  if (writer.pos() != current_size) {
    throw exception("Serialized {}B, but accounted for {}B", writer.pos(),
                    current_size);
  }
  return data;
}

std::string outgoing_message_t::to_string() const {
  return FMT::format(
      "[{} id={} {}B to {} questions={} answers={} authorities={}]",
      (flags & dns_constants::FLAGS_QR_MASK) ? "response" : "query", id,
      current_size,
      destination.has_value() ? destination->to_string() : "multicast",
      list_to_string(questions), list_to_string(answers),
      list_to_string(authorities));
}

template <typename T, typename Add>
static void pack_items(std::vector<outgoing_message_t> &messages,
                       outgoing_message_t &current, const std::vector<T> &items,
                       Add add) {
  for (auto &item : items) {
    if (add(current, item)) {
      continue;
    }
    if (!current.is_empty()) {
      messages.push_back(std::move(current));
      current = messages.back().fresh();
      if (add(current, item)) {
        continue;
      }
    }
    WARNING("{} does not fit in a {}B message. Dropped.", item,
            current.max_size);
  }
}

std::vector<outgoing_message_t>
build_messages(const outgoing_message_t &header,
               const std::vector<question_t> &questions,
               const std::vector<record_t> &answers) {
  std::vector<outgoing_message_t> messages;
  auto current = header.fresh();

  pack_items(messages, current, questions,
             [](outgoing_message_t &out, const question_t &question) {
               return out.add_question(question);
             });
  pack_items(messages, current, answers,
             [](outgoing_message_t &out, const record_t &record) {
               return out.add_answer(record);
             });

  if (!current.is_empty()) {
    messages.push_back(std::move(current));
  }
  return messages;
}

} // namespace lanmdns
