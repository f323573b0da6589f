#include "WireWriter.h"

namespace dt {
namespace tx {

void WireWriter::addU8(uint8_t value) { buffer_.push_back(static_cast<char>(value)); }

void WireWriter::addU32(uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    addU8(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void WireWriter::addU64(uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    addU8(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void WireWriter::addBytes(const std::string &bytes) { buffer_.append(bytes); }

void WireWriter::addShortVec(uint16_t length) {
  uint32_t rest = length;
  while (rest >= 0x80) {
    addU8(static_cast<uint8_t>((rest & 0x7f) | 0x80));
    rest >>= 7;
  }
  addU8(static_cast<uint8_t>(rest));
}

} // namespace tx
} // namespace dt
