#include "ledger.hpp"
#include "varint.hpp"

#include <spdlog/spdlog.h>

namespace playtime
{
    namespace
    {
        std::int64_t decode_total(const std::string& identity, const std::string& activity, const std::string& raw)
        {
            const auto value = decode_varint(raw);
            if (!value)
            {
                throw LedgerError(LedgerErrorKind::Decode,
                    "corrupt ledger value for " + identity + "/" + activity + " (" + std::to_string(raw.size()) + " bytes)");
            }
            return *value;
        }
    }

    std::unique_ptr<Ledger> Ledger::open(const std::filesystem::path& storePath)
    {
        return std::make_unique<Ledger>(std::make_unique<LedgerStore>(storePath));
    }

    Ledger::Ledger(std::unique_ptr<LedgerStore> store)
        : store_(std::move(store))
    {
    }

    Ledger::~Ledger()
    {
        close();
    }

    std::int64_t Ledger::merge(const std::string& identity, const std::string& activity, std::chrono::nanoseconds elapsed)
    {
        if (identity.empty() || activity.empty())
        {
            throw LedgerError(LedgerErrorKind::Transaction, "merge requires identity and activity");
        }

        std::int64_t total = 0;
        store_->update([&](WriteTransaction& tx) {
            tx.createBucketIfNotExists(identity);

            std::int64_t current = 0;
            if (const auto stored = tx.get(identity, activity))
            {
                current = decode_total(identity, activity, *stored);
            }

            total = current + elapsed.count();
            tx.put(identity, activity, encode_varint(total));
        });

        spdlog::debug("Ledger: {} on {} +{}ns -> {}ns", identity, activity, elapsed.count(), total);
        return total;
    }

    std::optional<ActivityTotals> Ledger::query(const std::string& identity) const
    {
        std::optional<ActivityTotals> result;
        store_->view([&](const ReadTransaction& tx) {
            if (!tx.hasBucket(identity))
            {
                return;
            }

            ActivityTotals totals;
            tx.forEach(identity, [&](const std::string& activity, const std::string& raw) {
                totals[activity] = decode_total(identity, activity, raw);
            });
            result = std::move(totals);
        });
        return result;
    }

    void Ledger::close()
    {
        if (store_)
        {
            store_->close();
        }
    }

    bool Ledger::isOpen() const
    {
        return store_ && store_->isOpen();
    }
}
