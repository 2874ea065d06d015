#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace mcpkit {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads JSON messages line-by-line from the input stream, skipping blank
 * lines. Writes one JSON message per line to the output stream with flush.
 * Writes are serialized so concurrent responses never interleave.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<JsonRpcMessage> read_message(const CancellationToken& token) override;
    void write_message(const JsonRpcMessage& message, const CancellationToken& token) override;
    bool is_connected() const override;
    void close() override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
    std::atomic<bool> connected_{true};
};

} // namespace mcpkit
