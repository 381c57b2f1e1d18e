#pragma once

#include <string>

namespace ansiviz {

std::string Trim(std::string value);
std::string ToLower(std::string value);

} // namespace ansiviz
