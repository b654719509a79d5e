#include <grader/core/context.hpp>

#include <grader/exceptions.hpp>
#include <grader/logging.hpp>
#include <grader/runner/runner.hpp>

namespace grader {

void Context::skip() const {
    LOG_TRACE("skip() called from {:?}", runnable_->get_full_title());
    throw PendingSignal{};
}

void Context::abort_run() const {
    if (runner_ == nullptr) {
        LOG_WARN("abort_run() called outside of a runner; ignoring");
        return;
    }

    runner_->abort();
}

} // namespace grader
