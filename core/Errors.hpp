#pragma once

#include <stdexcept>
#include <string>

namespace fleetsense {

// Base for every failure raised inside the pipeline.
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed or out-of-range sample. The sample is rejected, the batch continues.
class InputError : public PipelineError {
public:
    explicit InputError(const std::string& message) : PipelineError(message) {}
};

// A rule needed the previous sample of a vehicle and none exists yet.
class StateGapError : public PipelineError {
public:
    explicit StateGapError(const std::string& message) : PipelineError(message) {}
};

// Degenerate derived record (zero-duration trip, NaN feature).
class ComputationError : public PipelineError {
public:
    explicit ComputationError(const std::string& message) : PipelineError(message) {}
};

// Store read/write failure. Retried with backoff by batch drivers.
class StorageError : public PipelineError {
public:
    explicit StorageError(const std::string& message) : PipelineError(message) {}
};

// Unreadable configuration file or a value that does not parse.
class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& message) : PipelineError(message) {}
};

} // namespace fleetsense
