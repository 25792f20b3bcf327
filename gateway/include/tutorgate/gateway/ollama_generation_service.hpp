#pragma once

#include "tutorgate/gateway/generation_service.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace tutorgate {
namespace gateway {

struct OllamaConfig {
    std::string base_url = "http://127.0.0.1:11434";
    std::string model = "mistral";
    std::chrono::milliseconds connect_timeout{5000};
    size_t max_buffered_tokens = 256;  // the transfer pauses once this many tokens are unread
};

/**
 * Generation service over Ollama's streaming `/api/generate` endpoint.
 *
 * Each generate() call starts one HTTP transfer on its own thread; the
 * NDJSON body is split into tokens and handed to the caller through a
 * bounded buffer, so a slow reader throttles the transfer instead of
 * growing memory. Closing the stream aborts the transfer.
 */
class OllamaGenerationService : public GenerationService {
public:
    OllamaGenerationService(OllamaConfig config, std::shared_ptr<Observability> observability);

    caf::expected<std::unique_ptr<TokenStream>> generate(const std::string& prompt,
                                                         GenerationMode mode) override;

    // Request body sent for one prompt
    std::string build_request_body(const std::string& prompt, GenerationMode mode) const;

    static std::string system_prompt(GenerationMode mode);

private:
    OllamaConfig config_;
    std::shared_ptr<Observability> observability_;
};

} // namespace gateway
} // namespace tutorgate
