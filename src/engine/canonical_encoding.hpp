#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sid::engine {

/// Ordered, cycle-free byte encoding of a schema graph.
struct CanonicalForm {
  std::vector<std::uint8_t> bytes;

  auto view() const -> std::string_view {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
  }
};

/// Fixed-width big-endian integers and u32-length-prefixed strings.
class CanonicalWriter {
 public:
  explicit CanonicalWriter(std::vector<std::uint8_t>& out) : out_(out) {}

  auto write_u8(std::uint8_t value) -> void;
  auto write_bool(bool value) -> void;
  auto write_u32(std::uint32_t value) -> void;
  auto write_u64(std::uint64_t value) -> void;
  auto write_string(std::string_view value) -> void;
  auto write_bytes(const std::uint8_t* data, std::size_t size) -> void;

 private:
  std::vector<std::uint8_t>& out_;
};

auto to_hex(const std::uint8_t* data, std::size_t size) -> std::string;

}  // namespace sid::engine
