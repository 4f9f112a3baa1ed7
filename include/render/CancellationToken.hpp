#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace render {

class StageTimeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Deadline handed to a pipeline stage. Stage code calls checkpoint() between units of work.
class CancellationToken {
public:
    CancellationToken(std::string stage, std::chrono::milliseconds timeout);

    bool expired() const;
    std::chrono::milliseconds remaining() const;

    // Throws StageTimeout once the deadline has passed.
    void checkpoint() const;

    const std::string& stage() const { return stage_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::string stage_;
    std::chrono::milliseconds timeout_;
    std::chrono::steady_clock::time_point deadline_;
};

} // namespace render
