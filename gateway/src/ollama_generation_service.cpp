#include "tutorgate/gateway/ollama_generation_service.hpp"
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/result_converter.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <caf/error.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace tutorgate {
namespace gateway {

using json = nlohmann::json;

namespace {

std::once_flag curl_init_once;

// State shared between the transfer thread and the reader
struct TransferState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> tokens;
    size_t capacity = 256;
    std::string line_buffer;
    bool finished = false;
    bool saw_done = false;
    caf::error error;
    std::atomic<bool> closed{false};
};

// Handles one NDJSON line; returns false when the transfer should stop
bool consume_line(TransferState& state, const std::string& line) {
    if (line.empty()) {
        return true;
    }
    json chunk = json::parse(line, nullptr, false);
    if (chunk.is_discarded() || !chunk.is_object()) {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.error = caf::make_error(caf::sec::runtime_error, "malformed generation chunk");
        return false;
    }
    if (chunk.contains("error")) {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.error = caf::make_error(caf::sec::runtime_error,
                                      "generation service error: " + chunk["error"].dump());
        return false;
    }

    std::string token;
    if (chunk.contains("response") && chunk["response"].is_string()) {
        token = chunk["response"].get<std::string>();
    }
    bool done = chunk.contains("done") && chunk["done"].is_boolean() && chunk["done"].get<bool>();

    std::unique_lock<std::mutex> lock(state.mutex);
    if (!token.empty()) {
        state.cv.wait(lock, [&state]() {
            return state.tokens.size() < state.capacity || state.closed.load();
        });
        if (state.closed.load()) {
            return false;
        }
        state.tokens.push_back(std::move(token));
        state.cv.notify_all();
    }
    if (done) {
        state.saw_done = true;
    }
    return true;
}

size_t write_callback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    const size_t total = size * nmemb;
    if (state->closed.load()) {
        return 0;
    }
    state->line_buffer.append(data, total);
    size_t start = 0;
    size_t newline;
    while ((newline = state->line_buffer.find('\n', start)) != std::string::npos) {
        std::string line = state->line_buffer.substr(start, newline - start);
        start = newline + 1;
        if (!consume_line(*state, line)) {
            return 0;
        }
    }
    state->line_buffer.erase(0, start);
    return total;
}

int progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(userp);
    return state->closed.load() ? 1 : 0;
}

class OllamaTokenStream : public TokenStream {
public:
    OllamaTokenStream(std::string url, std::string body, OllamaConfig config)
        : state_(std::make_shared<TransferState>()) {
        state_->capacity = config.max_buffered_tokens > 0 ? config.max_buffered_tokens : 1;
        auto state = state_;
        transfer_ = std::thread([state, url = std::move(url), body = std::move(body), config]() {
            run_transfer(*state, url, body, config);
        });
    }

    ~OllamaTokenStream() override { close(); }

    caf::expected<std::optional<std::string>> next(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        bool ready = state_->cv.wait_for(lock, timeout, [this]() {
            return !state_->tokens.empty() || state_->finished || state_->closed.load();
        });
        if (!state_->tokens.empty()) {
            std::string token = std::move(state_->tokens.front());
            state_->tokens.pop_front();
            state_->cv.notify_all();
            return std::optional<std::string>(std::move(token));
        }
        if (state_->closed.load()) {
            return std::optional<std::string>();
        }
        if (!ready) {
            return caf::make_error(caf::sec::request_timeout, "no token within read timeout");
        }
        if (state_->error) {
            return state_->error;
        }
        return std::optional<std::string>();
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->closed.store(true);
        }
        state_->cv.notify_all();
        if (transfer_.joinable()) {
            transfer_.join();
        }
    }

private:
    static void run_transfer(TransferState& state, const std::string& url,
                             const std::string& body, const OllamaConfig& config) {
        caf::error failure;
        CURL* curl = curl_easy_init();
        if (!curl) {
            failure = caf::make_error(caf::sec::runtime_error, "failed to initialize CURL");
        } else {
            struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.connect_timeout.count()));
            curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);

            CURLcode res = curl_easy_perform(curl);
            if (res != CURLE_OK && !state.closed.load()) {
                if (res == CURLE_HTTP_RETURNED_ERROR) {
                    long status = 0;
                    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
                    failure = caf::make_error(caf::sec::unexpected_response,
                                              "generation service answered HTTP " + std::to_string(status));
                } else if (res == CURLE_OPERATION_TIMEDOUT || res == CURLE_COULDNT_CONNECT) {
                    failure = caf::make_error(caf::sec::cannot_connect_to_node,
                                              std::string("generation service unreachable: ") +
                                                  curl_easy_strerror(res));
                } else {
                    failure = caf::make_error(caf::sec::runtime_error,
                                              std::string("generation request failed: ") +
                                                  curl_easy_strerror(res));
                }
            }
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);
        }

        {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (!state.line_buffer.empty() && !state.error && !state.closed.load()) {
                // Final line without a trailing newline
                std::string tail;
                tail.swap(state.line_buffer);
                json chunk = json::parse(tail, nullptr, false);
                if (chunk.is_object() && chunk.contains("response") && chunk["response"].is_string()) {
                    std::string token = chunk["response"].get<std::string>();
                    if (!token.empty()) {
                        state.tokens.push_back(std::move(token));
                    }
                }
            }
            if (!state.error && failure) {
                state.error = std::move(failure);
            }
            if (!state.error && !state.saw_done && !state.closed.load()) {
                state.error = caf::make_error(caf::sec::runtime_error,
                                              "generation stream ended before completion");
            }
            state.finished = true;
        }
        state.cv.notify_all();
    }

    std::shared_ptr<TransferState> state_;
    std::thread transfer_;
};

} // namespace

OllamaGenerationService::OllamaGenerationService(OllamaConfig config,
                                                 std::shared_ptr<Observability> observability)
    : config_(std::move(config)),
      observability_(std::move(observability)) {
    std::call_once(curl_init_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string OllamaGenerationService::system_prompt(GenerationMode mode) {
    switch (mode) {
        case GenerationMode::guided:
            return "You are a patient coding mentor. Explain concepts step by step, show a short "
                   "example, and end with a question that checks understanding.";
        case GenerationMode::debug_practice:
            return "You are a coding mentor running a debugging exercise. Present code that contains "
                   "a realistic bug and guide the learner toward finding it without revealing the fix.";
        case GenerationMode::perfect:
            return "You are an expert programmer. Answer with a complete, correct and idiomatic "
                   "solution followed by a brief explanation.";
    }
    return "";
}

std::string OllamaGenerationService::build_request_body(const std::string& prompt, GenerationMode mode) const {
    json body = {
        {"model", config_.model},
        {"system", system_prompt(mode)},
        {"prompt", prompt},
        {"stream", true}
    };
    return body.dump();
}

caf::expected<std::unique_ptr<TokenStream>> OllamaGenerationService::generate(const std::string& prompt,
                                                                               GenerationMode mode) {
    if (prompt.empty()) {
        return caf::make_error(caf::sec::invalid_argument, "empty prompt");
    }
    std::string url = config_.base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += "/api/generate";

    observability_->log_debug("Starting generation", "", "", {
        {"model", config_.model},
        {"mode", ResultConverter::mode_to_string(mode)},
        {"prompt_chars", std::to_string(prompt.size())}
    });
    return std::unique_ptr<TokenStream>(
        new OllamaTokenStream(std::move(url), build_request_body(prompt, mode), config_));
}

} // namespace gateway
} // namespace tutorgate
