#pragma once

#include "PageObserver.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>

struct ResumePoint {
    uint64_t compressed_offset = 0;   // absolute offset in the source
    uint64_t skip_pages = 0;          // completed pages that begin at or after it
};

// Maps parser progress onto offsets a fresh decompressor can restart from.
// Restart points are the ends of compressed streams; pages after the chosen
// one that were already handled are counted so a resumed run can skip them.
// Offsets fed in are relative to the segment that started at segment_base.
class ResumeTracker : public IPageObserver {
public:
    ResumeTracker(uint64_t segment_base, bool byte_addressable);

    void on_page_start(uint64_t offset) override;
    void on_page_end(uint64_t offset) override;

    // A compressed stream ended: restarting at `compressed` yields the
    // decompressed bytes from `decompressed` onwards
    void add_boundary(uint64_t compressed, uint64_t decompressed);

    ResumePoint resume_point() const;

    uint64_t completed_pages() const noexcept { return completed_; }
    size_t pending_boundaries() const noexcept { return pending_.size(); }

private:
    struct Boundary {
        uint64_t compressed = 0;
        uint64_t decompressed = 0;
        uint64_t completed_before = 0;
        bool resolved = false;
    };

    uint64_t segment_base_;
    bool byte_addressable_;
    uint64_t completed_ = 0;
    uint64_t last_page_end_ = 0;
    Boundary safe_;
    std::deque<Boundary> pending_;
};
