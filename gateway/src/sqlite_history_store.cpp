#include "tutorgate/gateway/history_store.hpp"
#include <sqlite3.h>
#include <caf/error.hpp>
#include <algorithm>

namespace tutorgate {
namespace gateway {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS conversation_messages (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    client_id TEXT NOT NULL,
    session_id TEXT,
    correlation_id TEXT,
    role TEXT NOT NULL,
    content TEXT NOT NULL,
    mode TEXT,
    state TEXT,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_conversation_client ON conversation_messages (client_id, id);
CREATE TABLE IF NOT EXISTS execution_events (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    request_id TEXT NOT NULL,
    client_id TEXT NOT NULL,
    language TEXT NOT NULL,
    status TEXT NOT NULL,
    exit_code INTEGER NOT NULL,
    elapsed_ms INTEGER NOT NULL,
    stdout_truncated INTEGER NOT NULL,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_execution_client ON execution_events (client_id);
)sql";

// Finalizes the statement on every exit path
struct StatementGuard {
    sqlite3_stmt* stmt_ = nullptr;
    explicit StatementGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementGuard() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;
};

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

caf::error db_error(sqlite3* db, const std::string& what) {
    return caf::make_error(caf::sec::runtime_error, what + ": " + sqlite3_errmsg(db));
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

caf::expected<std::unique_ptr<SqliteHistoryStore>> SqliteHistoryStore::open(const std::string& path) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        return caf::make_error(caf::sec::runtime_error, "failed to open history database " + path + ": " + message);
    }
    sqlite3_busy_timeout(db, 1000);

    std::unique_ptr<SqliteHistoryStore> store(new SqliteHistoryStore(db));
    auto migrated = store->migrate();
    if (!migrated) {
        return std::move(migrated.error());
    }
    return store;
}

SqliteHistoryStore::SqliteHistoryStore(sqlite3* db) : db_(db) {}

SqliteHistoryStore::~SqliteHistoryStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

caf::expected<void> SqliteHistoryStore::migrate() {
    std::lock_guard<std::mutex> lock(mutex_);
    char* err = nullptr;
    int rc = sqlite3_exec(db_, kSchema, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        return caf::make_error(caf::sec::runtime_error, "history schema migration failed: " + message);
    }
    return caf::unit;
}

caf::expected<void> SqliteHistoryStore::save_message(const ConversationMessage& message) {
    static const char* sql =
        "INSERT INTO conversation_messages "
        "(client_id, session_id, correlation_id, role, content, mode, state, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error(db_, "failed to prepare message insert");
    }
    StatementGuard guard(stmt);

    bind_text(stmt, 1, message.client_id);
    bind_text(stmt, 2, message.session_id);
    bind_text(stmt, 3, message.correlation_id);
    bind_text(stmt, 4, message.role);
    bind_text(stmt, 5, message.content);
    bind_text(stmt, 6, message.mode);
    bind_text(stmt, 7, message.state);
    sqlite3_bind_int64(stmt, 8, to_epoch_ms(message.created_at));

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return db_error(db_, "failed to insert message");
    }
    return caf::unit;
}

caf::expected<void> SqliteHistoryStore::record_execution(const ExecutionEvent& event) {
    static const char* sql =
        "INSERT INTO execution_events "
        "(request_id, client_id, language, status, exit_code, elapsed_ms, stdout_truncated, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error(db_, "failed to prepare execution insert");
    }
    StatementGuard guard(stmt);

    bind_text(stmt, 1, event.request_id);
    bind_text(stmt, 2, event.client_id);
    bind_text(stmt, 3, event.language);
    bind_text(stmt, 4, event.status);
    sqlite3_bind_int(stmt, 5, event.exit_code);
    sqlite3_bind_int64(stmt, 6, event.elapsed_ms);
    sqlite3_bind_int(stmt, 7, event.stdout_truncated ? 1 : 0);
    sqlite3_bind_int64(stmt, 8, to_epoch_ms(event.created_at));

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return db_error(db_, "failed to insert execution event");
    }
    return caf::unit;
}

caf::expected<std::vector<ConversationMessage>> SqliteHistoryStore::recent_messages(const std::string& client_id,
                                                                                   size_t limit) {
    static const char* sql =
        "SELECT client_id, session_id, correlation_id, role, content, mode, state, created_at "
        "FROM conversation_messages WHERE client_id = ? ORDER BY id DESC LIMIT ?";

    std::vector<ConversationMessage> messages;
    if (limit == 0) {
        return messages;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error(db_, "failed to prepare history query");
    }
    StatementGuard guard(stmt);

    bind_text(stmt, 1, client_id);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(limit));

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ConversationMessage message;
        message.client_id = column_text(stmt, 0);
        message.session_id = column_text(stmt, 1);
        message.correlation_id = column_text(stmt, 2);
        message.role = column_text(stmt, 3);
        message.content = column_text(stmt, 4);
        message.mode = column_text(stmt, 5);
        message.state = column_text(stmt, 6);
        message.created_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(sqlite3_column_int64(stmt, 7)));
        messages.push_back(std::move(message));
    }
    if (rc != SQLITE_DONE) {
        return db_error(db_, "failed to read history");
    }

    std::reverse(messages.begin(), messages.end());
    return messages;
}

caf::expected<int64_t> SqliteHistoryStore::execution_count(const std::string& client_id) {
    static const char* sql = "SELECT COUNT(*) FROM execution_events WHERE client_id = ?";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return db_error(db_, "failed to prepare execution count");
    }
    StatementGuard guard(stmt);

    bind_text(stmt, 1, client_id);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        return db_error(db_, "failed to count executions");
    }
    return static_cast<int64_t>(sqlite3_column_int64(stmt, 0));
}

} // namespace gateway
} // namespace tutorgate
