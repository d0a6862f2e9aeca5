#pragma once

#include <stdexcept>
#include <string>

// Invalid request input (empty narrative, bad URL, non-finite macro values)
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& msg) : std::runtime_error(msg) {}
};

// An upstream fetch exhausted its retries
class DataUnavailableError : public std::runtime_error {
public:
    explicit DataUnavailableError(const std::string& msg) : std::runtime_error(msg) {}
};

// Exact enumeration ran past the request deadline
class OptimizationTimeoutError : public std::runtime_error {
public:
    explicit OptimizationTimeoutError(const std::string& msg) : std::runtime_error(msg) {}
};

// The request was cancelled by the caller or by shutdown
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& msg) : std::runtime_error(msg) {}
};

class InternalError : public std::runtime_error {
public:
    explicit InternalError(const std::string& msg) : std::runtime_error(msg) {}
};
