#include "ledger_store.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <system_error>

namespace playtime
{
    namespace
    {
        using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;
        using Connection = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;

        constexpr const char* kSchema =
            "CREATE TABLE IF NOT EXISTS buckets ("
            "  name BLOB PRIMARY KEY"
            ") WITHOUT ROWID;"
            "CREATE TABLE IF NOT EXISTS entries ("
            "  bucket BLOB NOT NULL REFERENCES buckets(name),"
            "  key    BLOB NOT NULL,"
            "  value  BLOB NOT NULL,"
            "  PRIMARY KEY (bucket, key)"
            ") WITHOUT ROWID;";

        [[noreturn]] void fail(LedgerErrorKind kind, sqlite3* db, const std::string& what)
        {
            const char* detail = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
            throw LedgerError(kind, what + ": " + detail);
        }

        void exec(sqlite3* db, const char* sql, LedgerErrorKind kind = LedgerErrorKind::Transaction)
        {
            char* error = nullptr;
            if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK)
            {
                std::string message = error != nullptr ? error : sqlite3_errmsg(db);
                sqlite3_free(error);
                throw LedgerError(kind, std::string{sql} + ": " + message);
            }
        }

        Statement prepare(sqlite3* db, const char* sql)
        {
            sqlite3_stmt* raw = nullptr;
            if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
            {
                fail(LedgerErrorKind::Transaction, db, "prepare failed");
            }
            return Statement(raw, &sqlite3_finalize);
        }

        void bind_blob(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value)
        {
            if (sqlite3_bind_blob(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK)
            {
                fail(LedgerErrorKind::Transaction, db, "bind failed");
            }
        }

        std::string column_blob(sqlite3_stmt* stmt, int column)
        {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, column));
            const int size = sqlite3_column_bytes(stmt, column);
            return data != nullptr ? std::string(data, static_cast<std::size_t>(size)) : std::string{};
        }

        void step_done(sqlite3* db, sqlite3_stmt* stmt, const char* what)
        {
            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                fail(LedgerErrorKind::Transaction, db, what);
            }
        }

        // Runs fn between begin and COMMIT, rolling back if anything throws.
        template <typename Fn>
        void run_transaction(sqlite3* db, const char* begin, Fn&& fn)
        {
            exec(db, begin);
            try
            {
                fn();
            }
            catch (...)
            {
                if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
                {
                    spdlog::error("LedgerStore: rollback failed: {}", sqlite3_errmsg(db));
                }
                throw;
            }

            if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
            {
                const std::string message = sqlite3_errmsg(db);
                if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
                {
                    spdlog::error("LedgerStore: rollback after failed commit failed: {}", sqlite3_errmsg(db));
                }
                throw LedgerError(LedgerErrorKind::Transaction, "commit failed: " + message);
            }
        }
    }

    std::string_view to_string(LedgerErrorKind kind) noexcept
    {
        switch (kind)
        {
            case LedgerErrorKind::StoreOpen:
                return "store-open";
            case LedgerErrorKind::Transaction:
                return "transaction";
            case LedgerErrorKind::Decode:
                return "decode";
        }
        return "unknown";
    }

    LedgerError::LedgerError(LedgerErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {
    }

    ReadTransaction::ReadTransaction(sqlite3* db)
        : db_(db)
    {
    }

    bool ReadTransaction::hasBucket(const std::string& bucket) const
    {
        auto stmt = prepare(db_, "SELECT 1 FROM buckets WHERE name = ?1;");
        bind_blob(db_, stmt.get(), 1, bucket);

        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW)
        {
            return true;
        }
        if (rc != SQLITE_DONE)
        {
            fail(LedgerErrorKind::Transaction, db_, "bucket lookup failed");
        }
        return false;
    }

    std::optional<std::string> ReadTransaction::get(const std::string& bucket, const std::string& key) const
    {
        auto stmt = prepare(db_, "SELECT value FROM entries WHERE bucket = ?1 AND key = ?2;");
        bind_blob(db_, stmt.get(), 1, bucket);
        bind_blob(db_, stmt.get(), 2, key);

        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW)
        {
            return column_blob(stmt.get(), 0);
        }
        if (rc != SQLITE_DONE)
        {
            fail(LedgerErrorKind::Transaction, db_, "entry lookup failed");
        }
        return std::nullopt;
    }

    void ReadTransaction::forEach(const std::string& bucket,
                                  const std::function<void(const std::string&, const std::string&)>& visitor) const
    {
        auto stmt = prepare(db_, "SELECT key, value FROM entries WHERE bucket = ?1 ORDER BY key;");
        bind_blob(db_, stmt.get(), 1, bucket);

        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            visitor(column_blob(stmt.get(), 0), column_blob(stmt.get(), 1));
        }

        if (rc != SQLITE_DONE)
        {
            fail(LedgerErrorKind::Transaction, db_, "bucket iteration failed");
        }
    }

    void WriteTransaction::createBucketIfNotExists(const std::string& bucket)
    {
        if (bucket.empty())
        {
            throw LedgerError(LedgerErrorKind::Transaction, "bucket name required");
        }

        auto stmt = prepare(db_, "INSERT OR IGNORE INTO buckets (name) VALUES (?1);");
        bind_blob(db_, stmt.get(), 1, bucket);
        step_done(db_, stmt.get(), "bucket creation failed");
    }

    void WriteTransaction::put(const std::string& bucket, const std::string& key, const std::string& value)
    {
        if (key.empty())
        {
            throw LedgerError(LedgerErrorKind::Transaction, "key required");
        }

        auto stmt = prepare(db_,
            "INSERT INTO entries (bucket, key, value) VALUES (?1, ?2, ?3) "
            "ON CONFLICT (bucket, key) DO UPDATE SET value = excluded.value;");
        bind_blob(db_, stmt.get(), 1, bucket);
        bind_blob(db_, stmt.get(), 2, key);
        bind_blob(db_, stmt.get(), 3, value);
        step_done(db_, stmt.get(), "entry write failed");
    }

    LedgerStore::LedgerStore(std::filesystem::path path)
        : path_(std::move(path))
    {
        if (path_.has_parent_path() && !std::filesystem::exists(path_.parent_path()))
        {
            std::error_code ec;
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec)
            {
                throw LedgerError(LedgerErrorKind::StoreOpen,
                    "cannot create ledger directory " + path_.parent_path().string() + ": " + ec.message());
            }
        }

        sqlite3* raw = nullptr;
        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(path_.string().c_str(), &raw, flags, nullptr) != SQLITE_OK)
        {
            Connection guard(raw, &sqlite3_close);
            fail(LedgerErrorKind::StoreOpen, raw, "cannot open ledger " + path_.string());
        }
        db_ = raw;

        try
        {
            sqlite3_busy_timeout(db_, busy_timeout_ms);
            exec(db_, "PRAGMA journal_mode=WAL;", LedgerErrorKind::StoreOpen);
            exec(db_, "PRAGMA synchronous=FULL;", LedgerErrorKind::StoreOpen);
            exec(db_, "PRAGMA foreign_keys=ON;", LedgerErrorKind::StoreOpen);
            initSchema();
        }
        catch (...)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }

        spdlog::info("Ledger store opened: {}", path_.string());
    }

    LedgerStore::~LedgerStore()
    {
        close();
    }

    void LedgerStore::initSchema()
    {
        try
        {
            exec(db_, kSchema, LedgerErrorKind::StoreOpen);
        }
        catch (const LedgerError& ex)
        {
            throw LedgerError(LedgerErrorKind::StoreOpen, "ledger schema unusable: " + std::string{ex.what()});
        }
    }

    void LedgerStore::update(const std::function<void(WriteTransaction&)>& fn)
    {
        std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
        if (db_ == nullptr)
        {
            throw LedgerError(LedgerErrorKind::Transaction, "ledger store is closed");
        }

        std::lock_guard<std::mutex> writer(writeMutex_);
        WriteTransaction tx(db_);
        run_transaction(db_, "BEGIN IMMEDIATE;", [&]() { fn(tx); });
    }

    void LedgerStore::view(const std::function<void(const ReadTransaction&)>& fn) const
    {
        std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
        if (db_ == nullptr)
        {
            throw LedgerError(LedgerErrorKind::Transaction, "ledger store is closed");
        }

        sqlite3* raw = nullptr;
        if (sqlite3_open_v2(path_.string().c_str(), &raw, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr) != SQLITE_OK)
        {
            Connection guard(raw, &sqlite3_close);
            fail(LedgerErrorKind::Transaction, raw, "cannot open read connection");
        }
        Connection reader(raw, &sqlite3_close);
        sqlite3_busy_timeout(reader.get(), busy_timeout_ms);

        ReadTransaction tx(reader.get());
        run_transaction(reader.get(), "BEGIN;", [&]() { fn(tx); });
    }

    void LedgerStore::close()
    {
        std::unique_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
        if (db_ == nullptr)
        {
            return;
        }

        std::lock_guard<std::mutex> writer(writeMutex_);
        if (sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr) != SQLITE_OK)
        {
            spdlog::warn("LedgerStore: checkpoint before close failed: {}", sqlite3_errmsg(db_));
        }

        if (sqlite3_close(db_) != SQLITE_OK)
        {
            spdlog::error("LedgerStore: close reported: {}", sqlite3_errmsg(db_));
            sqlite3_close_v2(db_);
        }
        db_ = nullptr;
        spdlog::info("Ledger store closed: {}", path_.string());
    }

    bool LedgerStore::isOpen() const
    {
        std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
        return db_ != nullptr;
    }
}
