#pragma once

#include "tutorgate/gateway/core.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace tutorgate {
namespace gateway {

struct ConversationMessage {
    std::string client_id;
    std::string session_id;
    std::string correlation_id;
    std::string role;      // "user" | "assistant"
    std::string content;
    std::string mode;
    std::string state;     // terminal stream state for assistant messages
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
};

struct ExecutionEvent {
    std::string request_id;
    std::string client_id;
    std::string language;
    std::string status;
    int exit_code = 0;
    int64_t elapsed_ms = 0;
    bool stdout_truncated = false;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
};

// Persistence Layer seam
class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    virtual caf::expected<void> save_message(const ConversationMessage& message) = 0;
    virtual caf::expected<void> record_execution(const ExecutionEvent& event) = 0;

    // Most recent messages of a client, oldest first
    virtual caf::expected<std::vector<ConversationMessage>> recent_messages(const std::string& client_id,
                                                                           size_t limit) = 0;
};

/**
 * SQLite-backed history. One connection guarded by a mutex; every
 * statement is prepared with bound parameters.
 */
class SqliteHistoryStore : public HistoryStore {
public:
    // ":memory:" opens a private in-memory database
    static caf::expected<std::unique_ptr<SqliteHistoryStore>> open(const std::string& path);

    ~SqliteHistoryStore() override;

    SqliteHistoryStore(const SqliteHistoryStore&) = delete;
    SqliteHistoryStore& operator=(const SqliteHistoryStore&) = delete;

    caf::expected<void> save_message(const ConversationMessage& message) override;
    caf::expected<void> record_execution(const ExecutionEvent& event) override;
    caf::expected<std::vector<ConversationMessage>> recent_messages(const std::string& client_id,
                                                                   size_t limit) override;

    caf::expected<int64_t> execution_count(const std::string& client_id);

private:
    explicit SqliteHistoryStore(sqlite3* db);

    caf::expected<void> migrate();

    std::mutex mutex_;
    sqlite3* db_ = nullptr;
};

} // namespace gateway
} // namespace tutorgate
