#pragma once

#include <stdexcept>
#include <string>

// Base of every error raised by the ingest pipeline
class IngestError : public std::runtime_error {
public:
    explicit IngestError(const std::string& msg) : std::runtime_error(msg) {}
};

// Source access failure: retries exhausted, or a permanent rejection.
class TransportError : public IngestError {
public:
    explicit TransportError(const std::string& msg, bool retryable = false, long status_code = 0)
        : IngestError(msg), retryable_(retryable), status_code_(status_code) {}

    bool retryable() const noexcept { return retryable_; }

    // HTTP status of the failed response, 0 when there was none
    long status_code() const noexcept { return status_code_; }

private:
    bool retryable_;
    long status_code_;
};

// Progress could not be durably persisted
class CheckpointError : public IngestError {
public:
    explicit CheckpointError(const std::string& msg) : IngestError(msg) {}
};

// Malformed XML; absorbed inside the parser, never escapes a run
class ParseError : public IngestError {
public:
    explicit ParseError(const std::string& msg) : IngestError(msg) {}
};

class DecompressError : public IngestError {
public:
    explicit DecompressError(const std::string& msg) : IngestError(msg) {}
};

class ConfigError : public IngestError {
public:
    explicit ConfigError(const std::string& msg) : IngestError(msg) {}
};
