/**
 * @file cancellationtoken.h
 * @brief Shared cancellation flag for asynchronous continuations.
 */

#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <memory>

/**
 * @brief Copyable handle to a shared cancellation flag.
 *
 * Every copy observes the same flag. A component creates one token per unit
 * of work (a polling session, an upload task) and captures a copy in every
 * callback it hands to an asynchronous client. The callback checks
 * isCancelled() before touching the component, so replies that arrive after
 * the work was stopped are dropped without side effects.
 *
 * @par Example usage:
 * @code
 * token_.cancel();
 * token_ = CancellationToken();
 * client_->fetchStatus(jobId_,
 *     [this, token = token_](const JobStatus &status) {
 *         if (token.isCancelled()) {
 *             return;
 *         }
 *         onStatusReceived(status);
 *     }, ...);
 * @endcode
 */
class CancellationToken
{
public:
    CancellationToken()
        : cancelled_(std::make_shared<bool>(false))
    {
    }

    /**
     * @brief Marks this token and every copy of it as cancelled.
     */
    void cancel() { *cancelled_ = true; }

    /**
     * @brief Returns whether cancel() was called on any copy.
     */
    [[nodiscard]] bool isCancelled() const { return *cancelled_; }

private:
    std::shared_ptr<bool> cancelled_;
};

#endif // CANCELLATIONTOKEN_H
