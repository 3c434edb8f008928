#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>

struct sqlite3;

namespace playtime
{
    enum class LedgerErrorKind
    {
        StoreOpen,
        Transaction,
        Decode
    };

    [[nodiscard]] std::string_view to_string(LedgerErrorKind kind) noexcept;

    class LedgerError : public std::runtime_error
    {
    public:
        LedgerError(LedgerErrorKind kind, const std::string& message);

        [[nodiscard]] LedgerErrorKind kind() const noexcept { return kind_; }

    private:
        LedgerErrorKind kind_;
    };

    // Read access to the bucket/key/value layout. A bucket groups every entry
    // for one identity; keys and values are opaque byte strings.
    class ReadTransaction
    {
    public:
        explicit ReadTransaction(sqlite3* db);

        ReadTransaction(const ReadTransaction&) = delete;
        ReadTransaction& operator=(const ReadTransaction&) = delete;

        [[nodiscard]] bool hasBucket(const std::string& bucket) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& bucket, const std::string& key) const;
        void forEach(const std::string& bucket,
                     const std::function<void(const std::string&, const std::string&)>& visitor) const;

    protected:
        sqlite3* db_;
    };

    class WriteTransaction : public ReadTransaction
    {
    public:
        using ReadTransaction::ReadTransaction;

        void createBucketIfNotExists(const std::string& bucket);
        void put(const std::string& bucket, const std::string& key, const std::string& value);
    };

    // Durable transactional key-value store on top of SQLite.
    //
    // update() runs on the single write connection and is serialized process-wide;
    // view() opens its own read-only connection so readers never wait on a writer
    // and only ever observe committed state. Any exception escaping the callback
    // rolls the transaction back and is rethrown unchanged.
    class LedgerStore
    {
    public:
        static constexpr int busy_timeout_ms = 5000;

        explicit LedgerStore(std::filesystem::path path);
        ~LedgerStore();

        LedgerStore(const LedgerStore&) = delete;
        LedgerStore& operator=(const LedgerStore&) = delete;

        void update(const std::function<void(WriteTransaction&)>& fn);
        void view(const std::function<void(const ReadTransaction&)>& fn) const;

        void close();
        [[nodiscard]] bool isOpen() const;
        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        void initSchema();

        std::filesystem::path path_;
        mutable std::shared_mutex lifecycleMutex_;
        std::mutex writeMutex_;
        sqlite3* db_{nullptr};
    };
}
