#pragma once

#include "Checkpoint.hpp"
#include "CheckpointStore.hpp"
#include "IngestState.hpp"
#include "PageParser.hpp"
#include "RangeStream.hpp"
#include "ResumeTracker.hpp"
#include "RunConfig.hpp"
#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>

struct IngestResult {
    IngestState state = IngestState::Init;
    bool resumed = false;
    bool skipped = false;        // stage already complete for this configuration
    bool interrupted = false;    // stopped on request after a checkpoint
    uint64_t pages_written = 0;  // records appended by this run
    uint64_t pages_total = 0;    // cumulative, including earlier runs
    uint64_t output_bytes = 0;   // cumulative output file size
    uint64_t bytes_fetched = 0;  // compressed bytes transferred by this run
    uint64_t parse_errors = 0;
    int retries = 0;
};

// Drives one ingest run: decides between a fresh start and a resume, then
// streams source -> decompressor -> parser -> output with periodic
// checkpoints. Not reentrant; one instance per work directory.
class IngestCoordinator {
public:
    using FetcherFactory = std::function<std::unique_ptr<RangeFetcher>()>;

    explicit IngestCoordinator(RunConfig config);
    IngestCoordinator(RunConfig config, FetcherFactory fetcher_factory, RangeStream::Sleeper sleeper = nullptr);

    // Throws TransportError, DecompressError, CheckpointError or ConfigError
    IngestResult run();

    // Safe to call from a signal handler
    void request_stop() noexcept { stop_requested_.store(true); }

    IngestState state() const noexcept { return state_; }

private:
    struct RunContext {
        Checkpoint progress;
        CheckpointStore* store = nullptr;
        ResumeTracker* tracker = nullptr;
        IngestResult* result = nullptr;
    };

    SourceIdentity probe_source() const;
    void truncate_uncommitted(uint64_t committed_bytes) const;
    void open_output(bool append);

    // Returns false when a stop was requested
    bool drain(PageParser& parser, RunContext& ctx);
    void write_record(const PageRecord& record, RunContext& ctx);
    void write_checkpoint(RunContext& ctx);

    RunConfig config_;
    FetcherFactory fetcher_factory_;
    RangeStream::Sleeper sleeper_;
    IngestState state_ = IngestState::Init;
    std::atomic<bool> stop_requested_{false};
    std::ofstream out_;
};
