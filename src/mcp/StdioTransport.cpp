#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace mcpkit {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<JsonRpcMessage> StdioTransport::read_message(const CancellationToken& token) {
    std::string line;

    while (true) {
        token.throw_if_cancelled();

        if (!std::getline(in_, line)) {
            connected_ = false;
            if (in_.eof()) {
                spdlog::debug("Reached end of input stream");
                return std::nullopt;
            }
            spdlog::error("Error reading from input stream");
            throw TransportError::closed("Error reading from input stream");
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (is_blank(line)) {
            continue;
        }
        break;
    }

    spdlog::debug("Read message: {}", line);

    try {
        return parse_message(line);
    } catch (const ProtocolError& e) {
        spdlog::error("Malformed message: {}", e.what());
        throw TransportError(e.what(), e.code(), e.id());
    }
}

void StdioTransport::write_message(const JsonRpcMessage& message, const CancellationToken& token) {
    token.throw_if_cancelled();

    std::string serialized = serialize_message(message);

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!out_.good()) {
        connected_ = false;
        throw TransportError::closed("Output stream is closed");
    }

    out_ << serialized << '\n';
    out_.flush();

    if (!out_.good()) {
        connected_ = false;
        spdlog::error("Error writing to output stream");
        throw TransportError::closed("Error writing to output stream");
    }
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_connected() const {
    return connected_;
}

void StdioTransport::close() {
    if (connected_.exchange(false)) {
        spdlog::debug("StdioTransport closed");
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_.flush();
}

} // namespace mcpkit
