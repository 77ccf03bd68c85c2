#include "engine/identifier.hpp"

#include <cctype>
#include <charconv>

namespace sid::engine {

auto Identifier::to_string() const -> std::string {
  return std::format("v{}:{}", algorithm_version, digest);
}

auto Identifier::parse(std::string_view str) -> Expected<Identifier> {
  if (str.empty()) {
    return tl::unexpected(make_error(ErrorCode::InvalidIdentifier, "identifier string cannot be empty"));
  }
  if (!str.starts_with('v') && !str.starts_with('V')) {
    return tl::unexpected(make_error(ErrorCode::InvalidIdentifier,
                                     std::format("missing version prefix in '{}'", str)));
  }
  const auto input = str;
  str.remove_prefix(1);

  Identifier id;
  const char* ptr = str.data();
  const char* end = str.data() + str.size();
  auto res = std::from_chars(ptr, end, id.algorithm_version);
  if (res.ec != std::errc{} || id.algorithm_version == 0) {
    return tl::unexpected(make_error(ErrorCode::InvalidIdentifier,
                                     std::format("invalid algorithm version in '{}'", input)));
  }
  ptr = res.ptr;

  if (ptr == end || *ptr != ':') {
    return tl::unexpected(make_error(ErrorCode::InvalidIdentifier,
                                     std::format("expected ':' after version in '{}'", input)));
  }
  ptr++;

  if (ptr == end) {
    return tl::unexpected(make_error(ErrorCode::InvalidIdentifier,
                                     std::format("empty digest in '{}'", input)));
  }
  id.digest.reserve(static_cast<std::size_t>(end - ptr));
  for (; ptr != end; ++ptr) {
    const auto c = static_cast<unsigned char>(*ptr);
    if (!std::isxdigit(c)) {
      return tl::unexpected(make_error(ErrorCode::InvalidIdentifier,
                                       std::format("non-hex digest character in '{}'", input)));
    }
    id.digest.push_back(static_cast<char>(std::tolower(c)));
  }
  return id;
}

auto compare_identifiers(const Identifier& lhs, const Identifier& rhs) -> IdentifierMatch {
  if (lhs.algorithm_version != rhs.algorithm_version) {
    return IdentifierMatch::Incomparable;
  }
  return lhs.digest == rhs.digest ? IdentifierMatch::Equal : IdentifierMatch::Different;
}

}  // namespace sid::engine
