#pragma once

#include <stdexcept>
#include <string>

namespace stockade::sandbox {

// Raised by a ContainerEngine when the engine refuses a request or the
// transport fails. status() is the HTTP status, or 0 for transport faults.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message, int status = 0, bool timed_out = false)
        : std::runtime_error(message)
        , status_(status)
        , timed_out_(timed_out) {}

    int status() const { return status_; }
    bool IsNotFound() const { return status_ == 404; }
    bool IsTimeout() const { return timed_out_; }

private:
    int status_ = 0;
    bool timed_out_ = false;
};

// An operation that needs a running container was called before start().
class NotRunningError : public std::logic_error {
public:
    explicit NotRunningError(const std::string& message)
        : std::logic_error(message) {}
};

}  // namespace stockade::sandbox
