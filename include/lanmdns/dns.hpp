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
#include "iobytes.hpp"
#include "networkaddress.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lanmdns {

namespace dns_constants {
constexpr int MDNS_PORT = 5353;
constexpr const char *MDNS_GROUP = "224.0.0.251";
constexpr const char *MDNS_GROUP_IPV6 = "ff02::fb";

constexpr uint16_t FLAGS_QR_MASK = 0x8000;
constexpr uint16_t FLAGS_QR_QUERY = 0x0000;
constexpr uint16_t FLAGS_QR_RESPONSE = 0x8000;
constexpr uint16_t FLAGS_AA = 0x0400;

// Top bit of the class field: unicast response wanted for questions, cache
// flush for records.
constexpr uint16_t CLASS_UNIQUE = 0x8000;
constexpr uint16_t CLASS_MASK = 0x7FFF;
constexpr uint16_t CLASS_IN = 1;
constexpr uint16_t CLASS_ANY = 255;

constexpr size_t HEADER_SIZE = 12;
constexpr size_t MAX_MSG_TYPICAL = 1460;
constexpr size_t MAX_MSG_ABSOLUTE = 8972;
constexpr size_t MAX_LABEL_SIZE = 63;
constexpr size_t MAX_NAME_SIZE = 255;

constexpr uint32_t DNS_TTL = 60 * 60;

constexpr std::chrono::milliseconds PROBE_WAIT{250};
constexpr std::chrono::milliseconds PROBE_CONFLICT_INTERVAL{1000};
constexpr std::chrono::milliseconds PROBE_THROTTLE_INTERVAL{5000};
constexpr int PROBE_THROTTLE_COUNT = 10;
constexpr std::chrono::milliseconds ANNOUNCE_WAIT{1000};
constexpr std::chrono::milliseconds RESPONSE_MIN_WAIT{20};
constexpr std::chrono::milliseconds RESPONSE_MAX_WAIT{115};
constexpr std::chrono::milliseconds QUERY_WAIT{225};
constexpr std::chrono::milliseconds CLOSE_TIMEOUT{5000};
} // namespace dns_constants

enum record_type_e : uint16_t {
  TYPE_A = 1,
  TYPE_PTR = 12,
  TYPE_TXT = 16,
  TYPE_AAAA = 28,
  TYPE_SRV = 33,
  TYPE_OPT = 41,
  TYPE_NSEC = 47,
  TYPE_ANY = 255,
};

struct record_a_t {
  std::array<uint8_t, 4> address{};
  bool operator==(const record_a_t &) const = default;
};
struct record_aaaa_t {
  std::array<uint8_t, 16> address{};
  bool operator==(const record_aaaa_t &) const = default;
};
struct record_ptr_t {
  std::string alias;
  bool operator==(const record_ptr_t &) const = default;
};
struct record_srv_t {
  uint16_t priority = 0;
  uint16_t weight = 0;
  uint16_t port = 0;
  std::string target;
  bool operator==(const record_srv_t &) const = default;
};
struct record_txt_t {
  std::vector<std::string> strings;
  bool operator==(const record_txt_t &) const = default;
};
// Any type we do not need to understand. Kept as is.
struct record_raw_t {
  std::vector<uint8_t> data;
  bool operator==(const record_raw_t &) const = default;
};

using record_data_t = std::variant<record_raw_t, record_a_t, record_aaaa_t,
                                   record_ptr_t, record_srv_t, record_txt_t>;

class record_t;

struct question_t {
  std::string name;
  record_type_e type = TYPE_ANY;
  uint16_t dns_class = dns_constants::CLASS_IN;
  bool unicast = false;

  question_t() {}
  question_t(std::string name, record_type_e type, bool unicast = false)
      : name(std::move(name)), type(type), unicast(unicast) {}

  // Type and class match (ANY matches all) and names are equal ignoring case
  bool is_answered_by(const record_t &record) const;
  size_t size() const;
  void write(io_bytes_writer &writer) const;
  static question_t read(io_bytes_reader &reader);

  bool operator==(const question_t &other) const;
  std::string to_string() const;
};

class record_t {
public:
  std::string name;
  record_type_e type = TYPE_A;
  uint16_t dns_class = dns_constants::CLASS_IN;
  bool unique = false;
  uint32_t ttl = dns_constants::DNS_TTL;
  record_data_t data;

  record_t() {}
  record_t(std::string name, record_type_e type, bool unique, uint32_t ttl,
           record_data_t data);

  static record_t make_a(const std::string &name,
                         const std::array<uint8_t, 4> &address, uint32_t ttl);
  static record_t make_aaaa(const std::string &name,
                            const std::array<uint8_t, 16> &address,
                            uint32_t ttl);
  static record_t make_ptr(const std::string &name, const std::string &alias,
                           uint32_t ttl);
  static record_t make_srv(const std::string &name, uint16_t priority,
                           uint16_t weight, uint16_t port,
                           const std::string &target, uint32_t ttl);
  static record_t make_txt(const std::string &name,
                           const std::vector<std::string> &strings,
                           uint32_t ttl);

  bool is_address() const { return type == TYPE_A || type == TYPE_AAAA; }
  // Same data but maybe different TTL. Used to detect conflicts.
  bool same_data(const record_t &other) const;
  size_t data_size() const;
  size_t size() const;
  size_t hash() const;
  void write(io_bytes_writer &writer) const;
  static record_t read(io_bytes_reader &reader);
  // Lower case name
  std::string key() const;

  // Identity: name (ignore case), type, class and data. Not the TTL.
  bool operator==(const record_t &other) const;
  bool operator!=(const record_t &other) const { return !(*this == other); }
  std::string to_string() const;
};

// DNS name encoding. Names are dotted strings ending in '.'. Writes without
// compression, reads following compression pointers.
size_t name_size(const std::string &name);
void write_name(io_bytes_writer &writer, const std::string &name);
std::string read_name(io_bytes_reader &reader);
// Appends the final dot if missing
std::string fqdn(const std::string &name);

// Address records moved after all the rest. Stable on both sides.
std::vector<record_t> address_records_last(std::vector<record_t> records);

class incoming_message_t {
public:
  uint16_t id = 0;
  uint16_t flags = 0;
  std::vector<question_t> questions;
  // Answer, authority and additional sections, in wire order
  std::vector<record_t> answers;
  std::vector<record_t> authorities;
  std::chrono::steady_clock::time_point received;
  // From the EDNS0 OPT record, 0 if none.
  size_t sender_udp_payload = 0;

  // Throws protocol_exception on malformed data
  static incoming_message_t parse(io_bytes_reader &reader);

  bool is_query() const {
    return (flags & dns_constants::FLAGS_QR_MASK) ==
           dns_constants::FLAGS_QR_QUERY;
  }
  bool is_response() const { return !is_query(); }
  std::chrono::milliseconds elapsed_since_arrival() const;
  std::string to_string() const;
};

class outgoing_message_t {
  size_t current_size = dns_constants::HEADER_SIZE;

public:
  uint16_t id = 0;
  uint16_t flags = 0;
  bool multicast = true;
  size_t max_size = dns_constants::MAX_MSG_TYPICAL;
  std::optional<network_address_t> destination;
  std::vector<question_t> questions;
  std::vector<record_t> answers;
  std::vector<record_t> authorities;

  outgoing_message_t(uint16_t flags, bool multicast = true,
                     size_t max_size = dns_constants::MAX_MSG_TYPICAL)
      : flags(flags), multicast(multicast), max_size(max_size) {}

  // All return false, and add nothing, if it would not fit in max_size
  bool add_question(const question_t &question);
  bool add_answer(const record_t &record);
  bool add_authority(const record_t &record);

  // Same header and destination, no content
  outgoing_message_t fresh() const;
  bool is_empty() const {
    return questions.empty() && answers.empty() && authorities.empty();
  }
  size_t size() const { return current_size; }
  io_bytes_managed serialize() const;
  std::string to_string() const;
};

/**
 * Packs questions and then answers into as many messages as needed, each
 * one under the ceiling of the header message. An item that can not fit even
 * in an empty message is dropped and logged.
 */
std::vector<outgoing_message_t>
build_messages(const outgoing_message_t &header,
               const std::vector<question_t> &questions,
               const std::vector<record_t> &answers);

} // namespace lanmdns

template <> struct std::hash<lanmdns::record_t> {
  size_t operator()(const lanmdns::record_t &record) const {
    return record.hash();
  }
};

template <> struct std::hash<lanmdns::question_t> {
  size_t operator()(const lanmdns::question_t &question) const;
};

ENUM_FORMATTER_BEGIN(lanmdns::record_type_e);
ENUM_FORMATTER_ELEMENT(lanmdns::TYPE_A, "A");
ENUM_FORMATTER_ELEMENT(lanmdns::TYPE_PTR, "PTR");
ENUM_FORMATTER_ELEMENT(lanmdns::TYPE_TXT, "TXT");
ENUM_FORMATTER_ELEMENT(lanmdns::TYPE_AAAA, "AAAA");
ENUM_FORMATTER_ELEMENT(lanmdns::TYPE_SRV, "SRV");
ENUM_FORMATTER_ELEMENT(lanmdns::TYPE_OPT, "OPT");
ENUM_FORMATTER_ELEMENT(lanmdns::TYPE_NSEC, "NSEC");
ENUM_FORMATTER_ELEMENT(lanmdns::TYPE_ANY, "ANY");
ENUM_FORMATTER_END();

TO_STRING_FORMATTER(lanmdns::question_t);
TO_STRING_FORMATTER(lanmdns::record_t);
TO_STRING_FORMATTER(lanmdns::incoming_message_t);
TO_STRING_FORMATTER(lanmdns::outgoing_message_t);
