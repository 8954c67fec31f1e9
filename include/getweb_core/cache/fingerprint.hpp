#pragma once

#include <string>
#include <vector>

namespace getweb_core {

// Lowercase hex SHA-256 of the parts joined with the ASCII unit separator (0x1F).
// Throws std::runtime_error if the digest cannot be computed.
std::string fingerprint(const std::vector<std::string>& parts);

}  // namespace getweb_core
