#include <ansiviz/escaping.h>

#include <ansiviz/string_utils.h>

#include <algorithm>
#include <cctype>

namespace ansiviz {

namespace {
constexpr const char kDigitPrefix[] = "id_";

// Bytes of multi-byte UTF-8 sequences are kept so non-ASCII names stay
// distinct.
bool IsIdentifierCharacter(unsigned char character) {
  return character >= 0x80 || std::isalnum(character) != 0 ||
         character == '_' || character == '-';
}

} // namespace

std::string SanitizeId(const std::string &value) {
  const auto trimmed = Trim(value);
  std::string sanitized;
  sanitized.reserve(trimmed.size());
  for (const auto character : trimmed) {
    const auto replacement =
        IsIdentifierCharacter(static_cast<unsigned char>(character))
            ? character
            : '_';
    if (replacement == '_' && !sanitized.empty() && sanitized.back() == '_') {
      continue;
    }
    sanitized.push_back(replacement);
  }
  if (!sanitized.empty() &&
      std::isdigit(static_cast<unsigned char>(sanitized.front())) != 0) {
    sanitized.insert(0, kDigitPrefix);
  }
  return sanitized;
}

std::string EscapeLabel(const std::string &value) {
  std::string escaped = value;
  std::replace(escaped.begin(), escaped.end(), '"', '\'');
  return escaped;
}

} // namespace ansiviz
