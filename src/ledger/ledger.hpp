#pragma once

#include "ledger_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace playtime
{
    // activity id -> accumulated nanoseconds
    using ActivityTotals = std::map<std::string, std::int64_t>;

    // Cumulative playtime per (identity, activity), one store bucket per identity.
    class Ledger
    {
    public:
        // Throws LedgerError(StoreOpen) when the store cannot be attached.
        static std::unique_ptr<Ledger> open(const std::filesystem::path& storePath);

        explicit Ledger(std::unique_ptr<LedgerStore> store);
        ~Ledger();

        Ledger(const Ledger&) = delete;
        Ledger& operator=(const Ledger&) = delete;

        // Adds elapsed to the stored total in a single transaction and returns the
        // new total. Throws LedgerError(Decode) if the stored value is corrupt;
        // nothing is written in that case.
        std::int64_t merge(const std::string& identity, const std::string& activity, std::chrono::nanoseconds elapsed);

        // nullopt means the identity has no history at all, which is not the same
        // as an identity whose totals are all zero.
        [[nodiscard]] std::optional<ActivityTotals> query(const std::string& identity) const;

        void close();
        [[nodiscard]] bool isOpen() const;
        [[nodiscard]] const std::filesystem::path& path() const noexcept { return store_->path(); }

        // Exposed for tooling and tests that need raw bucket access.
        [[nodiscard]] LedgerStore& store() noexcept { return *store_; }

    private:
        std::unique_ptr<LedgerStore> store_;
    };
}
