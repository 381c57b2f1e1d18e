#pragma once

#include <string>

namespace ansiviz {

// Mermaid node identifier for an arbitrary name. Stable: equal inputs always
// map to equal identifiers, which edges rely on.
std::string SanitizeId(const std::string &value);

// Text safe to embed inside a double-quoted Mermaid label.
std::string EscapeLabel(const std::string &value);

} // namespace ansiviz
