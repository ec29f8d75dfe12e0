#pragma once

#include <cstdint>

// Receives page boundaries as decompressed byte offsets relative to the
// first byte ever fed to the parser.
class IPageObserver {
public:
    virtual ~IPageObserver() = default;

    // Offset of the '<' of the opening <page> tag
    virtual void on_page_start(uint64_t offset) = 0;

    // Offset just past the closing </page> tag
    virtual void on_page_end(uint64_t offset) = 0;
};
