/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <iostream>
#include <string>
#include <type_traits>
#include <vector>

namespace LatticeMint {

/**
 * Header-only binary serialization used by ledger snapshots.
 * Fixed-width fields are written in host byte order; snapshots are not meant
 * to move between machines of different endianness.
 */
namespace BinarySerial {

// Upper bound on any length prefix read back from a stream
inline constexpr uint32_t MAX_STRING_LENGTH = 1024 * 1024;
inline constexpr uint32_t MAX_ELEMENT_COUNT = 16 * 1024 * 1024;

class Writer {
public:
  explicit Writer(std::ostream &stream) : m_stream(stream) {}

  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream.write(reinterpret_cast<const char *>(&value), sizeof(T));
    return m_stream.good();
  }

  bool writeBool(bool value) { return write(static_cast<uint8_t>(value ? 1 : 0)); }

  bool writeString(const std::string &str) {
    if (str.size() > MAX_STRING_LENGTH) {
      SNAPSHOT_ERROR("String too long to serialize: " +
                     std::to_string(str.size()) + " bytes");
      return false;
    }
    if (!write(static_cast<uint32_t>(str.size()))) {
      return false;
    }
    if (!str.empty()) {
      m_stream.write(str.data(), static_cast<std::streamsize>(str.size()));
    }
    return m_stream.good();
  }

  bool writeCount(size_t count) {
    if (count > MAX_ELEMENT_COUNT) {
      SNAPSHOT_ERROR("Element count too large to serialize: " +
                     std::to_string(count));
      return false;
    }
    return write(static_cast<uint32_t>(count));
  }

  template <typename T> bool writeSerializable(const T &obj) {
    return obj.serialize(m_stream);
  }

  bool good() const { return m_stream.good(); }

  void flush() { m_stream.flush(); }

private:
  std::ostream &m_stream;
};

class Reader {
public:
  explicit Reader(std::istream &stream) : m_stream(stream) {}

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream.read(reinterpret_cast<char *>(&value), sizeof(T));
    return m_stream.good() &&
           m_stream.gcount() == static_cast<std::streamsize>(sizeof(T));
  }

  bool readBool(bool &value) {
    uint8_t raw = 0;
    if (!read(raw) || raw > 1) {
      return false;
    }
    value = raw == 1;
    return true;
  }

  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }

    if (length == 0) {
      str.clear();
      return true;
    }

    if (length > MAX_STRING_LENGTH) {
      SNAPSHOT_ERROR("String length too large: " + std::to_string(length) +
                     " bytes");
      return false;
    }

    str.resize(length);
    m_stream.read(str.data(), length);
    return m_stream.good() &&
           m_stream.gcount() == static_cast<std::streamsize>(length);
  }

  bool readCount(size_t &count) {
    uint32_t raw = 0;
    if (!read(raw)) {
      return false;
    }
    if (raw > MAX_ELEMENT_COUNT) {
      SNAPSHOT_ERROR("Element count too large: " + std::to_string(raw));
      return false;
    }
    count = raw;
    return true;
  }

  template <typename T> bool readSerializable(T &obj) {
    return obj.deserialize(m_stream);
  }

  bool good() const { return m_stream.good(); }

private:
  std::istream &m_stream;
};

} // namespace BinarySerial

/**
 * Interface for objects that persist themselves into a snapshot stream
 */
class ISerializable {
public:
  virtual ~ISerializable() = default;
  virtual bool serialize(std::ostream &stream) const = 0;
  virtual bool deserialize(std::istream &stream) = 0;
};

#define DECLARE_SERIALIZABLE()                                                 \
  bool serialize(std::ostream &stream) const override;                         \
  bool deserialize(std::istream &stream) override;

#define SERIALIZE_PRIMITIVE(writer, member)                                    \
  if (!writer.write(member))                                                   \
    return false;

#define DESERIALIZE_PRIMITIVE(reader, member)                                  \
  if (!reader.read(member))                                                    \
    return false;

#define SERIALIZE_STRING(writer, member)                                       \
  if (!writer.writeString(member))                                             \
    return false;

#define DESERIALIZE_STRING(reader, member)                                     \
  if (!reader.readString(member))                                              \
    return false;

} // namespace LatticeMint

#endif // BINARY_SERIALIZER_HPP
