#include "render/CancellationToken.hpp"

#include <utility>

namespace render {

CancellationToken::CancellationToken(std::string stage, std::chrono::milliseconds timeout)
    : stage_(std::move(stage)),
      timeout_(timeout),
      deadline_(std::chrono::steady_clock::now() + timeout) {}

bool CancellationToken::expired() const {
    return std::chrono::steady_clock::now() > deadline_;
}

std::chrono::milliseconds CancellationToken::remaining() const {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

void CancellationToken::checkpoint() const {
    if (expired()) {
        throw StageTimeout("stage " + stage_ + " timed out after " + std::to_string(timeout_.count()) + "ms");
    }
}

} // namespace render
