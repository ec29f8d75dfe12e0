#include "CompressionType.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

const char* compression_to_string(CompressionType type) {
    switch (type) {
        case CompressionType::AUTO:  return "AUTO";
        case CompressionType::NONE:  return "NONE";
        case CompressionType::GZIP:  return "GZIP";
        case CompressionType::BZIP2: return "BZIP2";
        default: return "UNKNOWN";
    }
}

CompressionType string_to_compression(const std::string& str) {
    std::string s = StringUtils::to_upper(str);
    if (s == "AUTO")  return CompressionType::AUTO;
    if (s == "NONE")  return CompressionType::NONE;
    if (s == "GZIP" || s == "GZ")  return CompressionType::GZIP;
    if (s == "BZIP2" || s == "BZ2") return CompressionType::BZIP2;
    throw std::invalid_argument("Unknown compression type: " + str);
}

CompressionType resolve_compression(CompressionType type, const std::string& location) {
    if (type != CompressionType::AUTO) {
        return type;
    }

    // Ignore any query string when looking at the suffix
    std::string path = location.substr(0, location.find_first_of("?#"));
    path = StringUtils::to_lower(path);
    if (StringUtils::ends_with(path, ".bz2")) return CompressionType::BZIP2;
    if (StringUtils::ends_with(path, ".gz"))  return CompressionType::GZIP;
    return CompressionType::NONE;
}
