#pragma once

#include "ledger.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace tracker
{
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    struct Session
    {
        std::string identity;
        std::string activity;
        TimePoint startedAt{};
        std::uint64_t sequence{0};
    };

    enum class StartOutcome
    {
        Opened,
        AlreadyActive,
        Switched,
        Rejected
    };

    // Tracks which activity each identity is currently engaged in and feeds
    // elapsed time into the ledger.
    //
    // Ending a session is asynchronous: requestEnd() only queues the request, a
    // dispatcher thread hands each request to its own worker which removes the
    // session and merges it. At most Config::maxConcurrentMerges workers run at
    // once. A failed merge is logged and the stretch is dropped; nothing retries.
    //
    // getTotal() reports what the ledger holds. Time accumulated by a session that
    // is still live is not included until it is ended or snapshotted; use
    // liveElapsed() to add it when a running figure is wanted.
    class SessionTracker
    {
    public:
        struct Config
        {
            std::size_t maxConcurrentMerges{8};
            Clock clock;
        };

        SessionTracker(playtime::Ledger& ledger, Config config);
        ~SessionTracker();

        SessionTracker(const SessionTracker&) = delete;
        SessionTracker& operator=(const SessionTracker&) = delete;

        // Same activity again is a no-op. A different activity closes the running
        // session through the end path before the new one opens. Rejected once
        // shutdown() has begun.
        StartOutcome startSession(const std::string& identity, const std::string& activity);

        // Never blocks on I/O. Returns false when the identity has no live session
        // or the tracker is shutting down.
        bool requestEnd(const std::string& identity);

        // Merges every live session's elapsed time and restarts its clock. Returns
        // the number of sessions flushed; per-identity failures are logged.
        std::size_t snapshot();

        [[nodiscard]] std::optional<playtime::ActivityTotals> getTotal(const std::string& identity) const;

        [[nodiscard]] std::optional<Session> liveSession(const std::string& identity) const;
        [[nodiscard]] std::optional<std::chrono::nanoseconds> liveElapsed(const std::string& identity) const;
        [[nodiscard]] std::size_t liveCount() const;

        // Blocks until no end request is queued or being merged.
        void waitIdle();

        // Drains queued and in-flight ends, snapshots and forgets the remaining
        // sessions, then closes the ledger. Returns the number of sessions the final snapshot
        // flushed; later calls return 0.
        std::size_t shutdown();

    private:
        struct DetachedStretch
        {
            std::string activity;
            std::chrono::nanoseconds elapsed{0};
        };

        struct EndRequest
        {
            std::string identity;
            std::uint64_t sequence{0};
            std::optional<DetachedStretch> detached;
        };

        void processEndRequests();
        void runEndRequest(const EndRequest& request);
        void finishWorker();
        bool mergeStretch(const std::string& identity, const std::string& activity,
                          std::chrono::nanoseconds elapsed, const char* reason);
        TimePoint now() const;

        playtime::Ledger& ledger_;
        Config config_;

        mutable std::mutex sessionMutex_;
        std::unordered_map<std::string, Session> sessions_;
        std::uint64_t nextSequence_{1};

        std::mutex workMutex_;
        std::condition_variable workCv_;
        std::deque<EndRequest> endQueue_;
        std::size_t inFlight_{0};
        bool accepting_{true};
        bool stopping_{false};
        bool shutDown_{false};
        std::thread dispatcher_;
    };
}
