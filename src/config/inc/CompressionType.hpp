#pragma once

#include <string>

enum class CompressionType {
    AUTO,
    NONE,
    GZIP,
    BZIP2
};

const char* compression_to_string(CompressionType type);

CompressionType string_to_compression(const std::string& str);

// AUTO becomes BZIP2 for "*.bz2", GZIP for "*.gz", otherwise NONE
CompressionType resolve_compression(CompressionType type, const std::string& location);
