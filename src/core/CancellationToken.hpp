#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace mcpkit {

/**
 * @brief Raised when an operation observes a cancelled token
 */
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& message = "Operation cancelled")
        : std::runtime_error(message) {}
};

/**
 * @brief Read-only view of a cancellation flag
 *
 * Copies share the same flag. A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const noexcept;

    /**
     * @brief Throw OperationCancelled if cancellation was requested
     */
    void throw_if_cancelled() const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<const std::atomic<bool>> state_;
};

/**
 * @brief Owner of a cancellation flag; hands out tokens observing it
 */
class CancellationSource {
public:
    CancellationSource();

    void cancel() noexcept;
    bool is_cancelled() const noexcept;
    CancellationToken token() const;

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace mcpkit
