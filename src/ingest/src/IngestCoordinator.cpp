#include "IngestCoordinator.hpp"
#include "Decompressor.hpp"
#include "IngestErrors.hpp"
#include "LogUtils.hpp"
#include "PageFilter.hpp"
#include "RangeSourceFactory.hpp"
#include "StageState.hpp"
#include "StringUtils.hpp"
#include "TimestampUtils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace {

constexpr const char* STAGE_NAME = "stream_parse";

std::optional<uint64_t> file_size_of(const std::string& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

} // namespace

IngestCoordinator::IngestCoordinator(RunConfig config)
    : IngestCoordinator(std::move(config), nullptr) {}

IngestCoordinator::IngestCoordinator(RunConfig config, FetcherFactory fetcher_factory, RangeStream::Sleeper sleeper)
    : config_(std::move(config)),
      fetcher_factory_(std::move(fetcher_factory)),
      sleeper_(std::move(sleeper)) {
    if (!fetcher_factory_) {
        fetcher_factory_ = [this] {
            return RangeSourceFactory::create_fetcher(config_.source_url, config_.http_timeout);
        };
    }
}

SourceIdentity IngestCoordinator::probe_source() const {
    return fetcher_factory_()->probe();
}

void IngestCoordinator::truncate_uncommitted(uint64_t committed_bytes) const {
    const auto size = file_size_of(config_.output_path());
    if (!size || *size <= committed_bytes) {
        return;
    }
    std::error_code ec;
    fs::resize_file(config_.output_path(), committed_bytes, ec);
    if (ec) {
        LogUtils::warn("Cannot truncate {} to {} bytes: {}", config_.output_path(), committed_bytes, ec.message());
        return;
    }
    LogUtils::info("Dropped {} of output written after the last checkpoint",
                   StringUtils::human_bytes(*size - committed_bytes));
}

void IngestCoordinator::open_output(bool append) {
    std::error_code ec;
    fs::create_directories(config_.resolved_output_dir(), ec);
    if (ec) {
        throw IngestError("Cannot create output directory " + config_.resolved_output_dir() + ": " + ec.message());
    }

    out_.close();
    out_.clear();
    out_.open(config_.output_path(), std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!out_) {
        throw IngestError("Failed to open output file: " + config_.output_path());
    }
}

IngestResult IngestCoordinator::run() {
    IngestResult result;
    state_ = IngestState::Init;
    stop_requested_.store(false);

    config_.validate();
    const CompressionType compression = resolve_compression(config_.compression, config_.source_url);

    CheckpointStore store(config_);
    StageStateStore stage(config_.state_path());

    if (!config_.force_restart && stage.should_skip(store.config_hash())) {
        LogUtils::info("Stage {} already completed with this configuration; nothing to do", STAGE_NAME);
        if (const auto previous = store.load()) {
            result.pages_total = previous->pages_processed;
            result.output_bytes = previous->output_bytes_written;
        }
        result.skipped = true;
        result.state = state_ = IngestState::Done;
        return result;
    }

    std::optional<Checkpoint> checkpoint;
    bool valid = false;
    if (!config_.force_restart) {
        checkpoint = store.load();
        if (checkpoint) {
            valid = store.is_valid(*checkpoint, [this] { return probe_source(); });
        }
        if (valid && config_.truncate_uncommitted_output) {
            truncate_uncommitted(checkpoint->output_bytes_written);
        }
    }

    const StartDecision decision = decide_start(config_.force_restart, checkpoint, valid,
                                                file_size_of(config_.output_path()));
    state_ = decision.state;
    LogUtils::info("{}: {}", ingest_state_to_string(state_), decision.reason);

    RunContext ctx;
    ctx.store = &store;
    ctx.result = &result;

    if (state_ == IngestState::Fresh) {
        stage.clear();
        open_output(false);

        ctx.progress.source_url = config_.source_url;
        ctx.progress.output_file = config_.output_path();
        if (config_.validate_source_unchanged) {
            try {
                ctx.progress.source_etag = probe_source().fingerprint;
            } catch (const TransportError& e) {
                LogUtils::warn("Could not fingerprint source, resume validation disabled for this run: {}", e.what());
            }
        }
    } else {
        ctx.progress = *checkpoint;
        open_output(true);
        result.resumed = true;
        LogUtils::info("Resuming at compressed byte {} skipping {} pages; {} records, {} already written",
                       ctx.progress.compressed_bytes_read, ctx.progress.resume_skip_pages,
                       ctx.progress.pages_processed, StringUtils::human_bytes(ctx.progress.output_bytes_written));
    }

    const uint64_t start_offset = state_ == IngestState::Resume ? ctx.progress.compressed_bytes_read : 0;
    const uint64_t skip_pages = state_ == IngestState::Resume ? ctx.progress.resume_skip_pages : 0;

    RangeStream stream(fetcher_factory_(), start_offset, config_.http_chunk_size,
                       RangeSourceFactory::retry_policy(config_), sleeper_);
    auto decompressor = Decompressor::create(compression);
    ResumeTracker tracker(start_offset, decompressor->byte_addressable());
    ctx.tracker = &tracker;

    PageParserOptions options;
    options.fragment = start_offset > 0;
    options.skip_pages = skip_pages;
    PageParser parser(PageFilter::from_config(config_), options, &tracker);

    state_ = IngestState::Running;
    LogUtils::info("{}: {} ({})", ingest_state_to_string(state_), config_.source_url,
                   compression_to_string(compression));
    store.mark_checkpointed(ctx.progress.pages_processed, ctx.progress.output_bytes_written,
                            CheckpointStore::Clock::now());

    std::string raw;
    DecompressedChunk chunk;
    uint64_t decompressed_total = 0;
    bool stopped = false;

    while (!stopped && stream.next(raw)) {
        decompressor->feed(raw);
        while (decompressor->next(chunk)) {
            parser.feed(chunk.data);
            decompressed_total += chunk.data.size();
            if (!drain(parser, ctx)) {
                stopped = true;
                break;
            }
            // Registered only once every page before it has been seen
            if (chunk.stream_end) {
                tracker.add_boundary(chunk.compressed_offset, decompressed_total);
            }
        }
    }

    result.bytes_fetched = stream.position() - start_offset;
    result.retries = stream.retries();

    if (stopped) {
        write_checkpoint(ctx);
        result.interrupted = true;
        result.parse_errors = parser.parse_errors();
        result.pages_total = ctx.progress.pages_processed;
        result.output_bytes = ctx.progress.output_bytes_written;
        result.state = state_;
        LogUtils::warn("Stopped on request after {} records; progress saved", result.pages_written);
        return result;
    }

    decompressor->finish();
    parser.finish();
    drain(parser, ctx);

    write_checkpoint(ctx);
    out_.close();

    state_ = IngestState::Done;

    StageState completed;
    completed.stage_name = STAGE_NAME;
    completed.input_hash = store.config_hash();
    completed.completed = true;
    completed.completed_at = TimestampUtils::now_iso8601_utc();
    completed.output_files = {config_.output_path()};
    stage.persist(completed);

    result.state = state_;
    result.parse_errors = parser.parse_errors();
    result.pages_total = ctx.progress.pages_processed;
    result.output_bytes = ctx.progress.output_bytes_written;

    LogUtils::info("{}: {} records written this run, {} total, {} output, {} fetched, {} parse errors",
                   ingest_state_to_string(state_), result.pages_written, result.pages_total,
                   StringUtils::human_bytes(result.output_bytes), StringUtils::human_bytes(result.bytes_fetched),
                   result.parse_errors);
    return result;
}

bool IngestCoordinator::drain(PageParser& parser, RunContext& ctx) {
    PageRecord record;
    while (parser.next(record)) {
        write_record(record, ctx);

        if (ctx.store->should_checkpoint(ctx.progress.pages_processed, ctx.progress.output_bytes_written,
                                         CheckpointStore::Clock::now())) {
            write_checkpoint(ctx);
        }
        if (stop_requested_.load()) {
            return false;
        }
    }
    return !stop_requested_.load();
}

void IngestCoordinator::write_record(const PageRecord& record, RunContext& ctx) {
    std::string line = record.to_json_line();
    line.push_back('\n');
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!out_) {
        throw IngestError("Failed writing to " + config_.output_path());
    }

    ctx.progress.pages_processed += 1;
    ctx.progress.output_bytes_written += line.size();
    ctx.progress.last_page_id = record.id;
    ctx.progress.last_page_title = record.title;
    ctx.result->pages_written += 1;
}

void IngestCoordinator::write_checkpoint(RunContext& ctx) {
    // The recorded size must match the file on disk
    out_.flush();
    if (!out_) {
        throw IngestError("Failed flushing " + config_.output_path());
    }

    const ResumePoint point = ctx.tracker->resume_point();
    ctx.progress.compressed_bytes_read = point.compressed_offset;
    ctx.progress.resume_skip_pages = point.skip_pages;
    ctx.progress.last_checkpoint_time = TimestampUtils::now_iso8601_utc();
    ctx.store->save(ctx.progress);
    ctx.store->mark_checkpointed(ctx.progress.pages_processed, ctx.progress.output_bytes_written,
                                 CheckpointStore::Clock::now());
}
