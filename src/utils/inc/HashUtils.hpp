#pragma once

#include <string>

namespace HashUtils {

// Lowercase hex SHA-256 digest of data
std::string sha256_hex(const std::string& data);

}
