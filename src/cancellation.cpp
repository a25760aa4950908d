#include "docsum/cancellation.h"
#include "docsum/errors.h"

namespace docsum {

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : state_(std::move(state)) {}

void CancellationToken::cancel() const {
    state_->cancelled.store(true);
}

bool CancellationToken::is_cancelled() const {
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load()) {
            return true;
        }
    }
    return false;
}

void CancellationToken::throw_if_cancelled(const std::string& what) const {
    if (is_cancelled()) {
        throw CancelledError(what);
    }
}

CancellationToken CancellationToken::child() const {
    auto state = std::make_shared<State>();
    state->parent = state_;
    return CancellationToken(std::move(state));
}

} // namespace docsum
