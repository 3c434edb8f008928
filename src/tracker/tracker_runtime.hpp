#pragma once

#include "activity_catalog.hpp"
#include "ledger.hpp"
#include "session_tracker.hpp"
#include "tracker_config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tracker
{
    // Owns the ledger, the session tracker and the checkpoint thread for one
    // process. Signal adapters talk to the engine through this object only.
    class TrackerRuntime
    {
    public:
        struct Status
        {
            bool running{false};
            std::size_t liveSessions{0};
            std::size_t catalogEntries{0};
            std::uint64_t snapshotsTaken{0};
            std::size_t lastSnapshotFlushed{0};
            std::optional<std::chrono::system_clock::time_point> lastSnapshotAt;
            std::string lastErrorMessage;
        };

        explicit TrackerRuntime(TrackerConfig config, Clock clock = {});
        ~TrackerRuntime();

        TrackerRuntime(const TrackerRuntime&) = delete;
        TrackerRuntime& operator=(const TrackerRuntime&) = delete;

        // Opens the ledger. Returns false (see Status::lastErrorMessage) when the
        // store cannot be opened.
        bool start();

        // Drains pending ends, snapshots live sessions and closes the ledger.
        void stop();
        bool isRunning() const noexcept;

        Status getStatus() const;

        void onActivityStarted(const std::string& identity, const std::string& activity);
        bool onActivityEnded(const std::string& identity);

        // Presence update: an activity (known to the catalog when
        // require_known_activities is set) starts or switches the session,
        // anything else ends it.
        void onPresence(const std::string& identity, const std::optional<std::string>& activity);

        // Stored totals only; throws playtime::LedgerError on store failure.
        std::optional<playtime::ActivityTotals> totalsFor(const std::string& identity) const;
        std::string playedReport(const std::string& identity) const;

        std::size_t snapshotNow();

        const playtime::ActivityCatalog& catalog() const noexcept { return catalog_; }
        const TrackerConfig& config() const noexcept { return config_; }

        SessionTracker* sessionTracker() noexcept { return sessionTracker_.get(); }
        const SessionTracker* sessionTracker() const noexcept { return sessionTracker_.get(); }

    private:
        void checkpointLoop();
        void loadActivityCatalog();
        void setError(std::string message) const;
        void recordSnapshot(std::size_t flushed);

        TrackerConfig config_;
        Clock clock_;
        playtime::ActivityCatalog catalog_;

        std::unique_ptr<playtime::Ledger> ledger_;
        std::unique_ptr<SessionTracker> sessionTracker_;

        mutable std::mutex statusMutex_;
        mutable std::string lastError_;
        std::uint64_t snapshotsTaken_{0};
        std::size_t lastSnapshotFlushed_{0};
        std::optional<std::chrono::system_clock::time_point> lastSnapshotAt_;

        std::thread checkpointThread_;
        std::atomic_bool running_{false};
        std::atomic_bool stopRequested_{false};
        std::mutex checkpointMutex_;
        std::condition_variable checkpointCv_;
    };
}
