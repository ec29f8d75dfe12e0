#include "ResumeTracker.hpp"

ResumeTracker::ResumeTracker(uint64_t segment_base, bool byte_addressable)
    : segment_base_(segment_base), byte_addressable_(byte_addressable) {
    safe_.resolved = true;
}

void ResumeTracker::add_boundary(uint64_t compressed, uint64_t decompressed) {
    if (byte_addressable_) {
        return;
    }
    Boundary b;
    b.compressed = compressed;
    b.decompressed = decompressed;
    pending_.push_back(b);
}

void ResumeTracker::on_page_start(uint64_t offset) {
    // Pages never nest, so every page begun before a boundary has ended
    for (auto& b : pending_) {
        if (b.decompressed > offset) {
            break;
        }
        if (!b.resolved) {
            b.completed_before = completed_;
            b.resolved = true;
        }
    }
}

void ResumeTracker::on_page_end(uint64_t offset) {
    ++completed_;
    last_page_end_ = offset;

    while (!pending_.empty() && pending_.front().decompressed <= offset) {
        Boundary b = pending_.front();
        pending_.pop_front();
        if (!b.resolved) {
            // The page just finished straddles the boundary
            b.completed_before = completed_;
            b.resolved = true;
        }
        safe_ = b;
    }
}

ResumePoint ResumeTracker::resume_point() const {
    ResumePoint point;
    if (byte_addressable_) {
        point.compressed_offset = segment_base_ + last_page_end_;
        return point;
    }
    point.compressed_offset = segment_base_ + safe_.compressed;
    point.skip_pages = completed_ - safe_.completed_before;
    return point;
}
