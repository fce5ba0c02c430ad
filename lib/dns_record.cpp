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
#include <lanmdns/dns.hpp>
#include <lanmdns/logger.hpp>
#include <lanmdns/utils.hpp>

namespace lanmdns {

static constexpr uint8_t LABEL_POINTER = 0xC0;
static constexpr int MAX_POINTER_JUMPS = 64;

std::string fqdn(const std::string &name) {
  if (name.empty() || name.back() != '.') {
    return name + '.';
  }
  return name;
}

static std::vector<std::string_view> split_labels(const std::string &name) {
  std::vector<std::string_view> labels;
  std::string_view rest(name);
  while (!rest.empty()) {
    auto dot = rest.find('.');
    auto label = rest.substr(0, dot);
    if (label.empty()) {
      if (dot == std::string_view::npos || dot == rest.size() - 1) {
        break; // final dot, or root
      }
      throw protocol_exception("Empty label in name: {}", name);
    }
    if (label.size() > dns_constants::MAX_LABEL_SIZE) {
      throw protocol_exception("Label too long ({}B) in name: {}",
                               label.size(), name);
    }
    labels.push_back(label);
    if (dot == std::string_view::npos) {
      break;
    }
    rest = rest.substr(dot + 1);
  }
  return labels;
}

size_t name_size(const std::string &name) {
  size_t size = 1; // root label
  for (auto &label : split_labels(name)) {
    size += label.size() + 1;
  }
  return size;
}

void write_name(io_bytes_writer &writer, const std::string &name) {
  for (auto &label : split_labels(name)) {
    writer.write_uint8(label.size());
    writer.write_string(label);
  }
  writer.write_uint8(0);
}

std::string read_name(io_bytes_reader &reader) {
  std::string name;
  // Pointers are followed on a copy; the caller reader stops after the first one
  io_bytes_reader *current = &reader;
  io_bytes_reader jumped(reader);
  int jumps = 0;

  while (true) {
    uint8_t nchars = current->read_uint8();
    if ((nchars & LABEL_POINTER) == LABEL_POINTER) {
      size_t offset = ((nchars & ~LABEL_POINTER) << 8) | current->read_uint8();
      if (++jumps > MAX_POINTER_JUMPS) {
        throw protocol_exception("Name compression loop at offset {}", offset);
      }
      jumped = *current;
      jumped.seek(offset);
      current = &jumped;
      continue;
    }
    if (nchars & LABEL_POINTER) {
      throw protocol_exception("Unsupported label type {:02X}", nchars);
    }
    if (nchars == 0) {
      break;
    }
    name += current->read_string(nchars);
    name += '.';
    if (name.size() > dns_constants::MAX_NAME_SIZE) {
      throw protocol_exception("Name too long: {}...", name.substr(0, 32));
    }
  }
  if (name.empty()) {
    return ".";
  }
  return name;
}

/// Record payloads

namespace {
struct record_kind_t {
  record_type_e type;
  size_t (*data_size)(const record_data_t &);
  void (*write)(io_bytes_writer &, const record_data_t &);
  record_data_t (*read)(io_bytes_reader &, size_t);
  std::string (*to_string)(const record_data_t &);
};

size_t raw_size(const record_data_t &data) {
  return std::get<record_raw_t>(data).data.size();
}
void raw_write(io_bytes_writer &writer, const record_data_t &data) {
  auto &raw = std::get<record_raw_t>(data).data;
  writer.write_bytes(raw.data(), raw.size());
}
record_data_t raw_read(io_bytes_reader &reader, size_t length) {
  return record_raw_t{reader.read_bytes(length)};
}
std::string raw_to_string(const record_data_t &data) {
  return FMT::format("<{} bytes>", raw_size(data));
}

size_t a_size(const record_data_t &) { return 4; }
void a_write(io_bytes_writer &writer, const record_data_t &data) {
  auto &address = std::get<record_a_t>(data).address;
  writer.write_bytes(address.data(), address.size());
}
record_data_t a_read(io_bytes_reader &reader, size_t length) {
  if (length != 4) {
    return raw_read(reader, length);
  }
  record_a_t ret;
  auto bytes = reader.read_bytes(4);
  std::copy(bytes.begin(), bytes.end(), ret.address.begin());
  return ret;
}
std::string a_to_string(const record_data_t &data) {
  auto &address = std::get<record_a_t>(data).address;
  return FMT::format("{}.{}.{}.{}", address[0], address[1], address[2],
                     address[3]);
}

size_t aaaa_size(const record_data_t &) { return 16; }
void aaaa_write(io_bytes_writer &writer, const record_data_t &data) {
  auto &address = std::get<record_aaaa_t>(data).address;
  writer.write_bytes(address.data(), address.size());
}
record_data_t aaaa_read(io_bytes_reader &reader, size_t length) {
  if (length != 16) {
    return raw_read(reader, length);
  }
  record_aaaa_t ret;
  auto bytes = reader.read_bytes(16);
  std::copy(bytes.begin(), bytes.end(), ret.address.begin());
  return ret;
}
std::string aaaa_to_string(const record_data_t &data) {
  auto &address = std::get<record_aaaa_t>(data).address;
  std::string ret;
  for (size_t i = 0; i < address.size(); i += 2) {
    if (i != 0)
      ret += ':';
    ret += FMT::format("{:x}", (address[i] << 8) | address[i + 1]);
  }
  return ret;
}

size_t ptr_size(const record_data_t &data) {
  return name_size(std::get<record_ptr_t>(data).alias);
}
void ptr_write(io_bytes_writer &writer, const record_data_t &data) {
  write_name(writer, std::get<record_ptr_t>(data).alias);
}
record_data_t ptr_read(io_bytes_reader &reader, size_t) {
  return record_ptr_t{read_name(reader)};
}
std::string ptr_to_string(const record_data_t &data) {
  return std::get<record_ptr_t>(data).alias;
}

size_t srv_size(const record_data_t &data) {
  return 6 + name_size(std::get<record_srv_t>(data).target);
}
void srv_write(io_bytes_writer &writer, const record_data_t &data) {
  auto &srv = std::get<record_srv_t>(data);
  writer.write_uint16(srv.priority);
  writer.write_uint16(srv.weight);
  writer.write_uint16(srv.port);
  write_name(writer, srv.target);
}
record_data_t srv_read(io_bytes_reader &reader, size_t) {
  record_srv_t srv;
  srv.priority = reader.read_uint16();
  srv.weight = reader.read_uint16();
  srv.port = reader.read_uint16();
  srv.target = read_name(reader);
  return srv;
}
std::string srv_to_string(const record_data_t &data) {
  auto &srv = std::get<record_srv_t>(data);
  return FMT::format("{} {} {}:{}", srv.priority, srv.weight, srv.target,
                     srv.port);
}

// An empty TXT is a single empty string
size_t txt_size(const record_data_t &data) {
  auto &strings = std::get<record_txt_t>(data).strings;
  size_t size = 0;
  for (auto &str : strings) {
    size += str.size() + 1;
  }
  return std::max(size, size_t(1));
}
void txt_write(io_bytes_writer &writer, const record_data_t &data) {
  auto &strings = std::get<record_txt_t>(data).strings;
  if (strings.empty()) {
    writer.write_uint8(0);
    return;
  }
  for (auto &str : strings) {
    writer.write_uint8(str.size());
    writer.write_string(str);
  }
}
record_data_t txt_read(io_bytes_reader &reader, size_t length) {
  record_txt_t txt;
  auto end = reader.pos() + length;
  while (reader.pos() < end) {
    auto size = reader.read_uint8();
    if (reader.pos() + size > end) {
      throw protocol_exception("TXT string overflows record by {}B",
                               reader.pos() + size - end);
    }
    if (size > 0) {
      txt.strings.emplace_back(reader.read_string(size));
    }
  }
  return txt;
}
std::string txt_to_string(const record_data_t &data) {
  std::string ret;
  for (auto &str : std::get<record_txt_t>(data).strings) {
    if (!ret.empty())
      ret += ' ';
    ret += FMT::format("\"{}\"", str);
  }
  return ret;
}

const std::array<record_kind_t, 6> RECORD_KINDS = {{
    {TYPE_OPT, raw_size, raw_write, raw_read, raw_to_string},
    {TYPE_A, a_size, a_write, a_read, a_to_string},
    {TYPE_AAAA, aaaa_size, aaaa_write, aaaa_read, aaaa_to_string},
    {TYPE_PTR, ptr_size, ptr_write, ptr_read, ptr_to_string},
    {TYPE_SRV, srv_size, srv_write, srv_read, srv_to_string},
    {TYPE_TXT, txt_size, txt_write, txt_read, txt_to_string},
}};

// Write side goes by payload kind, read side by wire type
const record_kind_t &kind_for_data(const record_data_t &data) {
  return RECORD_KINDS[data.index()];
}

const record_kind_t &kind_for_type(record_type_e type) {
  for (auto &kind : RECORD_KINDS) {
    if (kind.type == type) {
      return kind;
    }
  }
  return RECORD_KINDS[0];
}
} // namespace

/// record_t

record_t::record_t(std::string name_, record_type_e type_, bool unique_,
                   uint32_t ttl_, record_data_t data_)
    : name(fqdn(name_)), type(type_), unique(unique_), ttl(ttl_),
      data(std::move(data_)) {}

record_t record_t::make_a(const std::string &name,
                          const std::array<uint8_t, 4> &address,
                          uint32_t ttl) {
  return record_t(name, TYPE_A, true, ttl, record_a_t{address});
}

record_t record_t::make_aaaa(const std::string &name,
                             const std::array<uint8_t, 16> &address,
                             uint32_t ttl) {
  return record_t(name, TYPE_AAAA, true, ttl, record_aaaa_t{address});
}

record_t record_t::make_ptr(const std::string &name, const std::string &alias,
                            uint32_t ttl) {
  return record_t(name, TYPE_PTR, false, ttl, record_ptr_t{fqdn(alias)});
}

record_t record_t::make_srv(const std::string &name, uint16_t priority,
                            uint16_t weight, uint16_t port,
                            const std::string &target, uint32_t ttl) {
  return record_t(name, TYPE_SRV, true, ttl,
                  record_srv_t{priority, weight, port, fqdn(target)});
}

record_t record_t::make_txt(const std::string &name,
                            const std::vector<std::string> &strings,
                            uint32_t ttl) {
  for (auto &str : strings) {
    if (str.size() > 255) {
      throw exception("TXT string too long ({}B): {}...", str.size(),
                      str.substr(0, 32));
    }
  }
  return record_t(name, TYPE_TXT, true, ttl, record_txt_t{strings});
}

bool record_t::same_data(const record_t &other) const {
  return data == other.data;
}

size_t record_t::data_size() const { return kind_for_data(data).data_size(data); }

size_t record_t::size() const {
  // name + type + class + ttl + rdlength + rdata
  return name_size(name) + 10 + data_size();
}

size_t record_t::hash() const {
  auto h = std::hash<std::string>()(key());
  h = h * 31 + type;
  h = h * 31 + dns_class;
  h = h * 31 + std::hash<std::string>()(kind_for_data(data).to_string(data));
  return h;
}

void record_t::write(io_bytes_writer &writer) const {
  write_name(writer, name);
  writer.write_uint16(type);
  writer.write_uint16(dns_class | (unique ? dns_constants::CLASS_UNIQUE : 0));
  writer.write_uint32(ttl);
  auto &kind = kind_for_data(data);
  writer.write_uint16(kind.data_size(data));
  kind.write(writer, data);
}

record_t record_t::read(io_bytes_reader &reader) {
  record_t record;
  record.name = read_name(reader);
  record.type = record_type_e(reader.read_uint16());
  auto dns_class = reader.read_uint16();
  if (record.type == TYPE_OPT) {
    // Class is the sender UDP payload size here
    record.dns_class = dns_class;
  } else {
    record.dns_class = dns_class & dns_constants::CLASS_MASK;
    record.unique = dns_class & dns_constants::CLASS_UNIQUE;
  }
  record.ttl = reader.read_uint32();
  auto length = reader.read_uint16();
  reader.check_enough(length);

  auto end = reader.pos() + length;
  record.data = kind_for_type(record.type).read(reader, length);
  // Compressed names may make the rdata shorter than its read size
  if (reader.pos() > end) {
    throw protocol_exception("Record {} data overflows by {}B", record.name,
                             reader.pos() - end);
  }
  reader.seek(end);
  return record;
}

std::string record_t::key() const { return to_lower(name); }

bool record_t::operator==(const record_t &other) const {
  return type == other.type && dns_class == other.dns_class &&
         equal_ignore_case(name, other.name) && data == other.data;
}

std::string record_t::to_string() const {
  return FMT::format("{} {}{} ttl={} {}", name, type, unique ? " unique" : "",
                     ttl, kind_for_data(data).to_string(data));
}

/// question_t

bool question_t::is_answered_by(const record_t &record) const {
  if (dns_class != dns_constants::CLASS_ANY &&
      record.dns_class != dns_constants::CLASS_ANY &&
      dns_class != record.dns_class) {
    return false;
  }
  if (type != TYPE_ANY && type != record.type) {
    return false;
  }
  return equal_ignore_case(name, record.name);
}

size_t question_t::size() const { return name_size(name) + 4; }

void question_t::write(io_bytes_writer &writer) const {
  write_name(writer, name);
  writer.write_uint16(type);
  writer.write_uint16(dns_class | (unicast ? dns_constants::CLASS_UNIQUE : 0));
}

question_t question_t::read(io_bytes_reader &reader) {
  question_t question;
  question.name = read_name(reader);
  question.type = record_type_e(reader.read_uint16());
  auto dns_class = reader.read_uint16();
  question.dns_class = dns_class & dns_constants::CLASS_MASK;
  question.unicast = dns_class & dns_constants::CLASS_UNIQUE;
  return question;
}

bool question_t::operator==(const question_t &other) const {
  return type == other.type && dns_class == other.dns_class &&
         equal_ignore_case(name, other.name);
}

std::string question_t::to_string() const {
  return FMT::format("{} {}{}", name, type, unicast ? " QU" : "");
}

std::vector<record_t> address_records_last(std::vector<record_t> records) {
  std::stable_partition(records.begin(), records.end(),
                        [](const record_t &record) {
                          return !record.is_address();
                        });
  return records;
}

} // namespace lanmdns

size_t std::hash<lanmdns::question_t>::operator()(
    const lanmdns::question_t &question) const {
  return std::hash<std::string>()(lanmdns::to_lower(question.name)) * 31 +
         question.type;
}
