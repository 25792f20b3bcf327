#pragma once

#include "tutorgate/gateway/core.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace tutorgate {
namespace gateway {

/**
 * Lazy token sequence for one generation session. Not restartable.
 *
 * next() yields the next token, std::nullopt at end of sequence, or an
 * error (request_timeout when nothing arrived within the timeout).
 * close() releases the session; further next() calls return end.
 */
class TokenStream {
public:
    virtual ~TokenStream() = default;

    virtual caf::expected<std::optional<std::string>> next(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
};

class GenerationService {
public:
    virtual ~GenerationService() = default;

    virtual caf::expected<std::unique_ptr<TokenStream>> generate(const std::string& prompt,
                                                                 GenerationMode mode) = 0;
};

// Terminal record of one streaming session
struct StreamOutcome {
    std::string session_id;
    std::string correlation_id;
    StreamState state = StreamState::opened;
    int64_t tokens_delivered = 0;
    int64_t bytes_delivered = 0;
    int64_t estimated_tokens = 0;   // words * 1.3 over the delivered text
    ErrorCode error_code = ErrorCode::none;
    std::string error_message;
    std::string diagnostic_tail;    // last bytes delivered, kept for failure logs
    std::chrono::milliseconds elapsed{0};
    TraceContext trace;
};

// Transport-side receiver of a token stream
class TokenSink {
public:
    virtual ~TokenSink() = default;

    virtual caf::expected<void> write_token(const std::string& session_id, const std::string& token) = 0;

    // false once the client went away
    virtual bool connected() const = 0;

    // Called exactly once with the terminal state
    virtual void finish(const StreamOutcome& outcome) = 0;
};

} // namespace gateway
} // namespace tutorgate
