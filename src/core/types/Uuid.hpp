#pragma once

#include <string>

namespace signfleet::core {

/*
  Node and host identifiers are random RFC 4122 version 4 UUIDs in their
  canonical 36 character text form.
*/

std::string generateUuid();

bool isUuid(const std::string& text);

} // namespace signfleet::core
