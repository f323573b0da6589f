#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace dt {
namespace tx {

/**
 * Append-only writer for the transaction wire format: little-endian integers,
 * raw byte runs and compact-u16 ("shortvec") lengths.
 */
class WireWriter {
public:
  void addU8(uint8_t value);
  void addU32(uint32_t value);
  void addU64(uint64_t value);
  void addBytes(const std::string &bytes);
  // 7 bits per byte, high bit set on every byte but the last
  void addShortVec(uint16_t length);

  size_t size() const { return buffer_.size(); }
  const std::string &data() const { return buffer_; }
  std::string release() { return std::move(buffer_); }

private:
  std::string buffer_;
};

} // namespace tx
} // namespace dt
