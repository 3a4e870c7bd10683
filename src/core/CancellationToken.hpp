/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag shared between a job and its owner
 */

#pragma once

#include "qreport_export.hpp"
#include <atomic>

namespace qreport {

/**
 * @brief Cooperative cancellation flag
 *
 * The owner calls cancel(); workers poll at unit boundaries (between
 * formats, between photos). Work already started is allowed to finish.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void cancel() { cancelled_.store(true); }

    bool is_cancelled() const { return cancelled_.load(); }

    /**
     * @brief Throw ExportCancelledError if cancellation was requested
     */
    void throw_if_cancelled() const {
        if (is_cancelled()) {
            throw ExportCancelledError();
        }
    }

    /**
     * @brief Null-tolerant check used by callers holding an optional token
     */
    static void check(const CancellationToken* token) {
        if (token) {
            token->throw_if_cancelled();
        }
    }

private:
    std::atomic<bool> cancelled_;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
};

} // namespace qreport
