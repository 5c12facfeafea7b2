#pragma once

#include <string>

namespace healbox::deps {

// Lowercase hex SHA-256 of the input bytes.
std::string Sha256Hex(const std::string& input);

}  // namespace healbox::deps
