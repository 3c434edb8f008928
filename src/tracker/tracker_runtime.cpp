#include "tracker_runtime.hpp"
#include "playtime_report.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

namespace tracker
{
    TrackerRuntime::TrackerRuntime(TrackerConfig config, Clock clock)
        : config_(std::move(config))
        , clock_(std::move(clock))
    {
    }

    TrackerRuntime::~TrackerRuntime()
    {
        stop();
    }

    bool TrackerRuntime::start()
    {
        if (running_.load())
        {
            return true;
        }

        loadActivityCatalog();

        try
        {
            ledger_ = playtime::Ledger::open(config_.database);
        }
        catch (const playtime::LedgerError& ex)
        {
            setError("Unable to open ledger " + config_.database.string() + ": " + ex.what());
            return false;
        }

        SessionTracker::Config trackerConfig;
        trackerConfig.maxConcurrentMerges = config_.maxConcurrentMerges;
        trackerConfig.clock = clock_;
        sessionTracker_ = std::make_unique<SessionTracker>(*ledger_, std::move(trackerConfig));

        stopRequested_.store(false);
        running_.store(true);

        if (config_.snapshotIntervalSeconds > 0)
        {
            checkpointThread_ = std::thread([this]() {
                checkpointLoop();
            });
        }
        else
        {
            spdlog::info("Periodic snapshots disabled");
        }

        spdlog::info("Tracker runtime started (ledger {}, snapshot every {}s, {} merge worker(s))",
            config_.database.string(), config_.snapshotIntervalSeconds, config_.maxConcurrentMerges);
        return true;
    }

    void TrackerRuntime::stop()
    {
        // Adapters calling in from here on see a stopped runtime.
        if (!running_.exchange(false))
        {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(checkpointMutex_);
            stopRequested_.store(true);
        }
        checkpointCv_.notify_all();

        if (checkpointThread_.joinable())
        {
            checkpointThread_.join();
        }

        // Drain ends, final snapshot, close ledger.
        recordSnapshot(sessionTracker_->shutdown());

        spdlog::info("Tracker runtime stopped");
    }

    bool TrackerRuntime::isRunning() const noexcept
    {
        return running_.load();
    }

    TrackerRuntime::Status TrackerRuntime::getStatus() const
    {
        Status status;
        status.running = running_.load();
        status.catalogEntries = catalog_.size();
        if (sessionTracker_)
        {
            status.liveSessions = sessionTracker_->liveCount();
        }

        std::lock_guard<std::mutex> guard(statusMutex_);
        status.snapshotsTaken = snapshotsTaken_;
        status.lastSnapshotFlushed = lastSnapshotFlushed_;
        status.lastSnapshotAt = lastSnapshotAt_;
        status.lastErrorMessage = lastError_;
        return status;
    }

    void TrackerRuntime::onActivityStarted(const std::string& identity, const std::string& activity)
    {
        if (!running_.load())
        {
            spdlog::warn("Ignoring start for {}: runtime not running", identity);
            return;
        }

        if (identity.empty() || activity.empty())
        {
            spdlog::warn("Ignoring start with empty identity or activity");
            return;
        }

        if (sessionTracker_->startSession(identity, activity) == StartOutcome::Rejected)
        {
            spdlog::warn("Start for {} on {} arrived during shutdown and was dropped", identity, activity);
        }
    }

    bool TrackerRuntime::onActivityEnded(const std::string& identity)
    {
        if (!running_.load())
        {
            return false;
        }
        return sessionTracker_->requestEnd(identity);
    }

    void TrackerRuntime::onPresence(const std::string& identity, const std::optional<std::string>& activity)
    {
        const bool known = activity && !activity->empty()
            && (!config_.requireKnownActivities || catalog_.contains(*activity));

        if (known)
        {
            onActivityStarted(identity, *activity);
            return;
        }

        if (activity && !activity->empty())
        {
            spdlog::debug("Presence for {} names unknown activity {}", identity, *activity);
        }
        onActivityEnded(identity);
    }

    std::optional<playtime::ActivityTotals> TrackerRuntime::totalsFor(const std::string& identity) const
    {
        if (!sessionTracker_ || !running_.load())
        {
            throw playtime::LedgerError(playtime::LedgerErrorKind::Transaction, "tracker runtime is not running");
        }
        return sessionTracker_->getTotal(identity);
    }

    std::string TrackerRuntime::playedReport(const std::string& identity) const
    {
        const auto totals = totalsFor(identity);
        return render_totals(totals, catalog_, sessionTracker_->liveElapsed(identity));
    }

    std::size_t TrackerRuntime::snapshotNow()
    {
        if (!running_.load())
        {
            return 0;
        }

        const auto flushed = sessionTracker_->snapshot();
        recordSnapshot(flushed);
        return flushed;
    }

    void TrackerRuntime::checkpointLoop()
    {
        const auto interval = std::chrono::seconds(config_.snapshotIntervalSeconds);

        std::unique_lock<std::mutex> lock(checkpointMutex_);
        while (!stopRequested_.load())
        {
            if (checkpointCv_.wait_for(lock, interval, [this]() { return stopRequested_.load(); }))
            {
                break;
            }

            lock.unlock();
            recordSnapshot(sessionTracker_->snapshot());
            lock.lock();
        }
    }

    void TrackerRuntime::recordSnapshot(std::size_t flushed)
    {
        std::lock_guard<std::mutex> guard(statusMutex_);
        ++snapshotsTaken_;
        lastSnapshotFlushed_ = flushed;
        lastSnapshotAt_ = std::chrono::system_clock::now();
    }

    void TrackerRuntime::loadActivityCatalog()
    {
        if (config_.activitiesFile.empty())
        {
            if (config_.requireKnownActivities)
            {
                spdlog::warn("require_known_activities is set but no activities file is configured; every presence will end sessions");
            }
            return;
        }

        std::error_code ec;
        if (!std::filesystem::exists(config_.activitiesFile, ec))
        {
            setError("Activity catalog not found: " + config_.activitiesFile.string());
            return;
        }

        try
        {
            catalog_ = playtime::load_activity_catalog_from_file(config_.activitiesFile);
            spdlog::info("Loaded {} activities from {}", catalog_.size(), config_.activitiesFile.string());
        }
        catch (const std::exception& ex)
        {
            setError(std::string{"Failed to load activity catalog: "} + ex.what());
        }
    }

    void TrackerRuntime::setError(std::string message) const
    {
        spdlog::error("{}", message);
        std::lock_guard<std::mutex> guard(statusMutex_);
        lastError_ = std::move(message);
    }
}
