#pragma once
#include <atomic>
#include <memory>
#include "core/Errors.h"

/**
 * @brief Cooperative cancellation flag.
 *
 * A child token also reports cancelled when its parent is, so the Executor
 * can cancel a single timed-out attempt without cancelling the whole job.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<const CancellationToken> parent) : parent(std::move(parent)) {}

    void cancel() { flag.store(true); }

    bool cancelled() const {
        return flag.load() || (parent && parent->cancelled());
    }

    /** @throws JobCancelled */
    void throwIfCancelled() const {
        if (cancelled()) throw JobCancelled();
    }

private:
    std::atomic<bool> flag{false};
    std::shared_ptr<const CancellationToken> parent;
};

/** Polls an optional token. Tools receive nullptr when run outside a job. */
inline void checkCancelled(const CancellationToken* token) {
    if (token) token->throwIfCancelled();
}
