#include "engine/canonical_encoding.hpp"

#include <array>
#include <limits>
#include <stdexcept>

namespace sid::engine {

auto CanonicalWriter::write_u8(std::uint8_t value) -> void {
  out_.push_back(value);
}

auto CanonicalWriter::write_bool(bool value) -> void {
  write_u8(value ? 1 : 0);
}

auto CanonicalWriter::write_u32(std::uint32_t value) -> void {
  std::array<std::uint8_t, 4> bytes{
      static_cast<std::uint8_t>((value >> 24) & 0xFFu),
      static_cast<std::uint8_t>((value >> 16) & 0xFFu),
      static_cast<std::uint8_t>((value >> 8) & 0xFFu),
      static_cast<std::uint8_t>(value & 0xFFu)};
  out_.insert(out_.end(), bytes.begin(), bytes.end());
}

auto CanonicalWriter::write_u64(std::uint64_t value) -> void {
  write_u32(static_cast<std::uint32_t>(value >> 32));
  write_u32(static_cast<std::uint32_t>(value & 0xFFFFFFFFu));
}

auto CanonicalWriter::write_string(std::string_view value) -> void {
  if (value.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw std::length_error("canonical encoding string too large");
  }
  write_u32(static_cast<std::uint32_t>(value.size()));
  out_.insert(out_.end(), value.begin(), value.end());
}

auto CanonicalWriter::write_bytes(const std::uint8_t* data, std::size_t size) -> void {
  out_.insert(out_.end(), data, data + size);
}

auto to_hex(const std::uint8_t* data, std::size_t size) -> std::string {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    hex.push_back(kDigits[data[i] >> 4]);
    hex.push_back(kDigits[data[i] & 0x0F]);
  }
  return hex;
}

}  // namespace sid::engine
