#include "MockTransport.hpp"

namespace mcpkit {

std::optional<JsonRpcMessage> MockTransport::read_message(const CancellationToken& token) {
    token.throw_if_cancelled();

    std::optional<std::string> line;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_ || inputs_.empty()) {
            open_ = false;
            return std::nullopt;  // EOF
        }
        line = inputs_.front();
        inputs_.pop();
    }

    if (!line) {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        throw TransportError::closed("Simulated stream failure");
    }

    try {
        return parse_message(*line);
    } catch (const ProtocolError& e) {
        throw TransportError(e.what(), e.code(), e.id());
    }
}

void MockTransport::write_message(const JsonRpcMessage& message, const CancellationToken& /*token*/) {
    json j;
    to_json(j, message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw TransportError::closed("Transport is closed");
    }
    responses_.push(std::move(j));
}

bool MockTransport::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void MockTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    closed_ = true;
}

void MockTransport::push_request(const json& request) {
    push_line(request.dump());
}

void MockTransport::push_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    inputs_.push(line);
}

void MockTransport::push_stream_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    inputs_.push(std::nullopt);
}

json MockTransport::pop_response() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (responses_.empty()) {
        return json();
    }

    json response = responses_.front();
    responses_.pop();
    return response;
}

bool MockTransport::has_responses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !responses_.empty();
}

size_t MockTransport::response_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_.size();
}

bool MockTransport::was_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace mcpkit
