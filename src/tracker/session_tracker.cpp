#include "session_tracker.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

namespace tracker
{
    namespace
    {
        long long to_ms(std::chrono::nanoseconds value)
        {
            return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(value).count());
        }
    }

    SessionTracker::SessionTracker(playtime::Ledger& ledger, Config config)
        : ledger_(ledger)
        , config_(std::move(config))
    {
        if (!config_.clock)
        {
            config_.clock = []() { return std::chrono::steady_clock::now(); };
        }

        if (config_.maxConcurrentMerges == 0)
        {
            spdlog::warn("SessionTracker: maxConcurrentMerges of 0 is invalid; using 1");
            config_.maxConcurrentMerges = 1;
        }

        dispatcher_ = std::thread([this]() {
            processEndRequests();
        });
    }

    SessionTracker::~SessionTracker()
    {
        shutdown();
    }

    StartOutcome SessionTracker::startSession(const std::string& identity, const std::string& activity)
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        std::unique_lock<std::mutex> work(workMutex_);
        if (!accepting_)
        {
            spdlog::warn("Refusing start for {} on {}: tracker is shutting down", identity, activity);
            return StartOutcome::Rejected;
        }

        const auto startedAt = now();

        auto it = sessions_.find(identity);
        if (it != sessions_.end() && it->second.activity == activity)
        {
            spdlog::debug("Ignoring repeated start for {} on {}", identity, activity);
            return StartOutcome::AlreadyActive;
        }

        StartOutcome outcome = StartOutcome::Opened;
        if (it != sessions_.end())
        {
            const Session& previous = it->second;
            spdlog::info("{} switched from {} to {}", identity, previous.activity, activity);

            EndRequest request;
            request.identity = identity;
            request.sequence = previous.sequence;
            request.detached = DetachedStretch{previous.activity, startedAt - previous.startedAt};
            endQueue_.push_back(std::move(request));
            workCv_.notify_all();
            outcome = StartOutcome::Switched;
        }
        work.unlock();

        Session session;
        session.identity = identity;
        session.activity = activity;
        session.startedAt = startedAt;
        session.sequence = nextSequence_++;
        sessions_[identity] = std::move(session);

        spdlog::info("Starting to count for {} on {}", identity, activity);
        return outcome;
    }

    bool SessionTracker::requestEnd(const std::string& identity)
    {
        EndRequest request;
        {
            std::lock_guard<std::mutex> lock(sessionMutex_);
            const auto it = sessions_.find(identity);
            if (it == sessions_.end())
            {
                spdlog::debug("No live session to end for {}", identity);
                return false;
            }
            request.identity = identity;
            request.sequence = it->second.sequence;
        }

        std::lock_guard<std::mutex> lock(workMutex_);
        if (!accepting_)
        {
            spdlog::warn("Dropping end request for {}: tracker is shutting down", identity);
            return false;
        }
        endQueue_.push_back(std::move(request));
        workCv_.notify_all();
        return true;
    }

    void SessionTracker::processEndRequests()
    {
        std::unique_lock<std::mutex> lock(workMutex_);
        while (true)
        {
            workCv_.wait(lock, [this]() {
                return (!endQueue_.empty() && inFlight_ < config_.maxConcurrentMerges)
                    || (stopping_ && endQueue_.empty());
            });

            if (endQueue_.empty())
            {
                break;
            }

            EndRequest request = std::move(endQueue_.front());
            endQueue_.pop_front();
            ++inFlight_;
            lock.unlock();

            try
            {
                std::thread([this, request]() {
                    runEndRequest(request);
                    finishWorker();
                }).detach();
            }
            catch (const std::system_error& ex)
            {
                spdlog::warn("SessionTracker: could not spawn merge worker ({}); merging on dispatcher", ex.what());
                runEndRequest(request);
                finishWorker();
            }

            lock.lock();
        }

        spdlog::debug("SessionTracker: end request dispatcher stopped");
    }

    void SessionTracker::runEndRequest(const EndRequest& request)
    {
        if (request.detached)
        {
            mergeStretch(request.identity, request.detached->activity, request.detached->elapsed, "switch");
            return;
        }

        Session session;
        {
            std::lock_guard<std::mutex> lock(sessionMutex_);
            const auto it = sessions_.find(request.identity);
            if (it == sessions_.end() || it->second.sequence != request.sequence)
            {
                spdlog::debug("Session for {} already closed; ignoring stale end request", request.identity);
                return;
            }
            session = std::move(it->second);
            sessions_.erase(it);
        }

        if (mergeStretch(session.identity, session.activity, now() - session.startedAt, "end"))
        {
            spdlog::info("Saved {}", session.identity);
        }
    }

    void SessionTracker::finishWorker()
    {
        std::lock_guard<std::mutex> lock(workMutex_);
        --inFlight_;
        workCv_.notify_all();
    }

    bool SessionTracker::mergeStretch(const std::string& identity, const std::string& activity,
                                      std::chrono::nanoseconds elapsed, const char* reason)
    {
        try
        {
            const auto total = ledger_.merge(identity, activity, elapsed);
            spdlog::debug("Merged {}ms for {} on {} ({}), total {}ms",
                to_ms(elapsed), identity, activity, reason, to_ms(std::chrono::nanoseconds{total}));
            return true;
        }
        catch (const playtime::LedgerError& ex)
        {
            spdlog::error("Error while updating game time for {} on {} ({} error): {}",
                identity, activity, playtime::to_string(ex.kind()), ex.what());
        }
        catch (const std::exception& ex)
        {
            spdlog::error("Error while updating game time for {} on {}: {}", identity, activity, ex.what());
        }
        return false;
    }

    std::size_t SessionTracker::snapshot()
    {
        struct Pending
        {
            std::string identity;
            std::string activity;
            std::chrono::nanoseconds elapsed;
        };

        // Elapsed time is moved out of each session under the lock, so an end
        // racing with the merge below only ever sees the post-snapshot stretch.
        std::vector<Pending> pending;
        {
            std::lock_guard<std::mutex> lock(sessionMutex_);
            const auto checkpoint = now();
            pending.reserve(sessions_.size());
            for (auto& [identity, session] : sessions_)
            {
                pending.push_back(Pending{identity, session.activity, checkpoint - session.startedAt});
                session.startedAt = checkpoint;
            }
        }

        std::size_t flushed = 0;
        for (const auto& entry : pending)
        {
            if (mergeStretch(entry.identity, entry.activity, entry.elapsed, "snapshot"))
            {
                ++flushed;
            }
        }

        spdlog::info("Snapshot done ({} of {} sessions)", flushed, pending.size());
        return flushed;
    }

    std::optional<playtime::ActivityTotals> SessionTracker::getTotal(const std::string& identity) const
    {
        return ledger_.query(identity);
    }

    std::optional<Session> SessionTracker::liveSession(const std::string& identity) const
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        const auto it = sessions_.find(identity);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::chrono::nanoseconds> SessionTracker::liveElapsed(const std::string& identity) const
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        const auto it = sessions_.find(identity);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now() - it->second.startedAt);
    }

    std::size_t SessionTracker::liveCount() const
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        return sessions_.size();
    }

    void SessionTracker::waitIdle()
    {
        std::unique_lock<std::mutex> lock(workMutex_);
        workCv_.wait(lock, [this]() {
            return endQueue_.empty() && inFlight_ == 0;
        });
    }

    std::size_t SessionTracker::shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(workMutex_);
            if (shutDown_)
            {
                return 0;
            }
            shutDown_ = true;
            accepting_ = false;
            stopping_ = true;
        }
        workCv_.notify_all();

        if (dispatcher_.joinable())
        {
            dispatcher_.join();
        }

        waitIdle();
        spdlog::info("All end requests drained; {} live session(s) left", liveCount());

        const auto flushed = snapshot();
        {
            std::lock_guard<std::mutex> lock(sessionMutex_);
            sessions_.clear();
        }
        ledger_.close();
        return flushed;
    }

    TimePoint SessionTracker::now() const
    {
        return config_.clock();
    }
}
