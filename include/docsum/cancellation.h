#pragma once

#include <atomic>
#include <memory>
#include <string>

namespace docsum {

// Shared cancellation flag. Copies observe the same state; a child token is
// cancelled when either it or any ancestor is cancelled.
class CancellationToken {
public:
    CancellationToken();

    void cancel() const;
    bool is_cancelled() const;

    // Throws CancelledError when cancelled.
    void throw_if_cancelled(const std::string& what = "operation cancelled") const;

    // New token linked to this one. Cancelling the child leaves the parent untouched.
    CancellationToken child() const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<const State> parent;
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

} // namespace docsum
