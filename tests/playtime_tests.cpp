#include "activity_catalog.hpp"
#include "ledger.hpp"
#include "ledger_store.hpp"
#include "varint.hpp"
#include "tracker/console_commands.hpp"
#include "tracker/playtime_report.hpp"
#include "tracker/session_tracker.hpp"
#include "tracker/tracker_config.hpp"
#include "tracker/tracker_runtime.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace
{
    using namespace std::chrono_literals;
    using playtime::ActivityTotals;
    using playtime::Ledger;
    using playtime::LedgerError;
    using playtime::LedgerErrorKind;

    template <typename Fn>
    void run_case(const char* name, Fn&& fn, int& failures)
    {
        try
        {
            fn();
            std::cout << "[PASS] " << name << "\n";
        }
        catch (const std::exception& ex)
        {
            std::cerr << "[FAIL] " << name << ": " << ex.what() << "\n";
            ++failures;
        }
        catch (...)
        {
            std::cerr << "[FAIL] " << name << ": unknown exception\n";
            ++failures;
        }
    }

    void expect(bool condition, const std::string& message)
    {
        if (!condition)
        {
            throw std::runtime_error(message);
        }
    }

    // Deterministic stand-in for steady_clock; every copy shares one offset.
    class ManualClock
    {
    public:
        tracker::Clock clock() const
        {
            auto offset = offset_;
            const auto base = base_;
            return [offset, base]() {
                return base + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::nanoseconds{offset->load()});
            };
        }

        void advance(std::chrono::nanoseconds step)
        {
            offset_->fetch_add(step.count());
        }

    private:
        std::shared_ptr<std::atomic<std::int64_t>> offset_ = std::make_shared<std::atomic<std::int64_t>>(0);
        tracker::TimePoint base_ = std::chrono::steady_clock::now();
    };

    class TempDir
    {
    public:
        explicit TempDir(const std::string& name)
        {
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path_ = std::filesystem::temp_directory_path() / ("playtime_tests_" + name + "_" + std::to_string(stamp));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        std::filesystem::path file(const std::string& name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };

    std::int64_t total_of(const std::optional<ActivityTotals>& totals, const std::string& activity)
    {
        expect(totals.has_value(), "expected history for identity");
        const auto it = totals->find(activity);
        expect(it != totals->end(), "expected an entry for " + activity);
        return it->second;
    }

    std::int64_t reopened_total(const std::filesystem::path& db, const std::string& identity, const std::string& activity)
    {
        auto ledger = Ledger::open(db);
        return total_of(ledger->query(identity), activity);
    }

    tracker::SessionTracker::Config tracker_config(const ManualClock& clock, std::size_t workers = 4)
    {
        tracker::SessionTracker::Config config;
        config.maxConcurrentMerges = workers;
        config.clock = clock.clock();
        return config;
    }

    void expect_ledger_error(LedgerErrorKind kind, const std::function<void()>& fn, const std::string& what)
    {
        try
        {
            fn();
        }
        catch (const LedgerError& ex)
        {
            if (ex.kind() != kind)
            {
                throw std::runtime_error(what + ": wrong error kind " + std::string{playtime::to_string(ex.kind())});
            }
            return;
        }
        throw std::runtime_error(what + ": expected LedgerError");
    }
}

int main()
{
    spdlog::set_level(spdlog::level::warn);
    int failures = 0;

    run_case("varint matches Go binary.PutVarint encoding", []() {
        expect(playtime::encode_varint(0) == std::string("\x00", 1), "0 should encode as 00");
        expect(playtime::encode_varint(1) == "\x02", "1 should encode as 02");
        expect(playtime::encode_varint(-1) == "\x01", "-1 should encode as 01");
        expect(playtime::encode_varint(63) == "\x7e", "63 should encode as 7e");
        expect(playtime::encode_varint(-64) == "\x7f", "-64 should encode as 7f");
        expect(playtime::encode_varint(64) == "\x80\x01", "64 should encode as 80 01");

        const auto max = std::numeric_limits<std::int64_t>::max();
        const auto min = std::numeric_limits<std::int64_t>::min();
        expect(playtime::encode_varint(max).size() == playtime::max_varint_length, "int64 max needs ten bytes");
        expect(playtime::decode_varint(playtime::encode_varint(max)) == max, "int64 max did not survive");
        expect(playtime::decode_varint(playtime::encode_varint(min)) == min, "int64 min did not survive");

        // 3600s in ns, as an hour of play
        const std::int64_t hour = 3'600'000'000'000;
        expect(playtime::decode_varint(playtime::encode_varint(hour)) == hour, "one hour did not survive");
    }, failures);

    run_case("varint decode tolerates padding and rejects corruption", []() {
        std::string padded = playtime::encode_varint(1234567);
        padded.resize(playtime::max_varint_length, '\0');
        expect(playtime::decode_varint(padded) == 1234567, "zero-padded value should decode");

        expect(!playtime::decode_varint(std::string{}), "empty value must not decode");
        expect(!playtime::decode_varint(std::string("\x80\x80", 2)), "truncated value must not decode");
        expect(!playtime::decode_varint(std::string(11, '\xff')), "overlong value must not decode");
        expect(!playtime::decode_varint(std::string("\xff\xff\xff\xff\xff\xff\xff\xff\xff\x02", 10)),
            "value overflowing 64 bits must not decode");
    }, failures);

    run_case("store rolls back a failed transaction", []() {
        TempDir dir("rollback");
        playtime::LedgerStore store(dir.file("ledger.db"));

        try
        {
            store.update([](playtime::WriteTransaction& tx) {
                tx.createBucketIfNotExists("alice");
                tx.put("alice", "chess", playtime::encode_varint(10));
                throw std::runtime_error("abort");
            });
            throw std::logic_error("update should have rethrown");
        }
        catch (const std::runtime_error& ex)
        {
            expect(std::string{ex.what()} == "abort", "unexpected exception from update");
        }

        bool seen = true;
        store.view([&](const playtime::ReadTransaction& tx) {
            seen = tx.hasBucket("alice");
        });
        expect(!seen, "rolled back bucket must not be visible");
    }, failures);

    run_case("store open rejects a corrupt file", []() {
        TempDir dir("corrupt");
        const auto path = dir.file("ledger.db");
        {
            std::ofstream out(path, std::ios::binary);
            out << std::string(4096, 'x');
        }

        expect_ledger_error(LedgerErrorKind::StoreOpen, [&]() {
            auto ledger = Ledger::open(path);
        }, "corrupt store");
    }, failures);

    run_case("ledger merge accumulates and query reports no history", []() {
        TempDir dir("ledger");
        auto ledger = Ledger::open(dir.file("ledger.db"));

        expect(!ledger->query("alice").has_value(), "unknown identity must report no history");

        expect(ledger->merge("alice", "chess", 5s) == std::chrono::nanoseconds(5s).count(), "first merge total");
        expect(ledger->merge("alice", "chess", 7s) == std::chrono::nanoseconds(12s).count(), "second merge total");
        ledger->merge("alice", "go", 0ns);

        const auto totals = ledger->query("alice");
        expect(total_of(totals, "chess") == std::chrono::nanoseconds(12s).count(), "chess total");
        expect(total_of(totals, "go") == 0, "zero play is still history");
        expect(totals->size() == 2, "expected exactly two activities");
        expect(!ledger->query("bob").has_value(), "other identity must stay untouched");
    }, failures);

    run_case("ledger surfaces decode corruption instead of zeroing", []() {
        TempDir dir("decode");
        auto ledger = Ledger::open(dir.file("ledger.db"));
        ledger->merge("alice", "chess", 3s);

        ledger->store().update([](playtime::WriteTransaction& tx) {
            tx.put("alice", "chess", std::string("\x80\x80\x80", 3));
        });

        expect_ledger_error(LedgerErrorKind::Decode, [&]() {
            ledger->merge("alice", "chess", 1s);
        }, "merge over corrupt value");

        expect_ledger_error(LedgerErrorKind::Decode, [&]() {
            (void)ledger->query("alice");
        }, "query over corrupt value");

        std::optional<std::string> raw;
        ledger->store().view([&](const playtime::ReadTransaction& tx) {
            raw = tx.get("alice", "chess");
        });
        expect(raw == std::string("\x80\x80\x80", 3), "failed merge must not rewrite the value");
    }, failures);

    run_case("ledger operations fail after close", []() {
        TempDir dir("closed");
        auto ledger = Ledger::open(dir.file("ledger.db"));
        ledger->close();
        ledger->close();
        expect(!ledger->isOpen(), "ledger should report closed");

        expect_ledger_error(LedgerErrorKind::Transaction, [&]() {
            ledger->merge("alice", "chess", 1s);
        }, "merge after close");
    }, failures);

    run_case("session accumulates elapsed time on end", []() {
        TempDir dir("accumulate");
        ManualClock clock;
        auto ledger = Ledger::open(dir.file("ledger.db"));
        tracker::SessionTracker sessions(*ledger, tracker_config(clock));

        expect(sessions.startSession("alice", "chess") == tracker::StartOutcome::Opened, "expected a new session");
        clock.advance(90s);
        expect(sessions.requestEnd("alice"), "end should be accepted");
        sessions.waitIdle();

        expect(total_of(sessions.getTotal("alice"), "chess") == std::chrono::nanoseconds(90s).count(), "total after end");
        expect(!sessions.liveSession("alice"), "session should be gone after end");
    }, failures);

    run_case("merges are additive across sessions", []() {
        TempDir dir("additive");
        ManualClock clock;
        auto ledger = Ledger::open(dir.file("ledger.db"));
        tracker::SessionTracker sessions(*ledger, tracker_config(clock));

        sessions.startSession("alice", "chess");
        clock.advance(40s);
        sessions.requestEnd("alice");
        sessions.waitIdle();

        clock.advance(1h);

        sessions.startSession("alice", "chess");
        clock.advance(25s);
        sessions.requestEnd("alice");
        sessions.waitIdle();

        expect(total_of(sessions.getTotal("alice"), "chess") == std::chrono::nanoseconds(65s).count(), "d1 + d2");
    }, failures);

    run_case("snapshot neither loses nor duplicates time", []() {
        TempDir dir("snapshot");
        ManualClock clock;
        auto ledger = Ledger::open(dir.file("ledger.db"));
        tracker::SessionTracker sessions(*ledger, tracker_config(clock));

        sessions.startSession("alice", "chess");
        clock.advance(30s);
        expect(sessions.snapshot() == 1, "snapshot should flush one session");
        expect(total_of(sessions.getTotal("alice"), "chess") == std::chrono::nanoseconds(30s).count(), "after snapshot");
        expect(sessions.liveSession("alice").has_value(), "snapshot must keep the session live");

        clock.advance(12s);
        sessions.requestEnd("alice");
        sessions.waitIdle();

        expect(total_of(sessions.getTotal("alice"), "chess") == std::chrono::nanoseconds(42s).count(), "d1 + d2 after end");
    }, failures);

    run_case("totals exclude live time until it is merged", []() {
        TempDir dir("live");
        ManualClock clock;
        auto ledger = Ledger::open(dir.file("ledger.db"));
        tracker::SessionTracker sessions(*ledger, tracker_config(clock));

        expect(!sessions.getTotal("alice").has_value(), "never played must be no history");
        expect(!sessions.requestEnd("alice"), "end without a session should be refused");

        sessions.startSession("alice", "chess");
        clock.advance(8s);
        expect(!sessions.getTotal("alice").has_value(), "live time must not appear in totals");
        expect(sessions.liveElapsed("alice") == std::chrono::nanoseconds(8s), "live elapsed should be reported separately");
    }, failures);

    run_case("repeated start keeps the running session", []() {
        TempDir dir("repeat");
        ManualClock clock;
        auto ledger = Ledger::open(dir.file("ledger.db"));
        tracker::SessionTracker sessions(*ledger, tracker_config(clock));

        sessions.startSession("alice", "chess");
        clock.advance(10s);
        expect(sessions.startSession("alice", "chess") == tracker::StartOutcome::AlreadyActive, "duplicate start");
        clock.advance(5s);
        sessions.requestEnd("alice");
        sessions.waitIdle();

        expect(total_of(sessions.getTotal("alice"), "chess") == std::chrono::nanoseconds(15s).count(),
            "duplicate start must not reset the clock");
    }, failures);

    run_case("switching activity closes the previous session", []() {
        TempDir dir("switch");
        ManualClock clock;
        auto ledger = Ledger::open(dir.file("ledger.db"));
        tracker::SessionTracker sessions(*ledger, tracker_config(clock));

        sessions.startSession("alice", "chess");
        clock.advance(20s);
        expect(sessions.startSession("alice", "go") == tracker::StartOutcome::Switched, "expected a switch");
        clock.advance(6s);
        sessions.waitIdle();

        const auto live = sessions.liveSession("alice");
        expect(live && live->activity == "go", "new activity should be live");
        expect(total_of(sessions.getTotal("alice"), "chess") == std::chrono::nanoseconds(20s).count(),
            "interrupted activity must keep its time");

        sessions.requestEnd("alice");
        sessions.waitIdle();
        expect(total_of(sessions.getTotal("alice"), "go") == std::chrono::nanoseconds(6s).count(), "second activity total");
    }, failures);

    run_case("stale end request does not close a newer session", []() {
        TempDir dir("stale");
        ManualClock clock;
        auto ledger = Ledger::open(dir.file("ledger.db"));
        tracker::SessionTracker sessions(*ledger, tracker_config(clock, 1));

        sessions.startSession("alice", "chess");
        clock.advance(10s);
        sessions.requestEnd("alice");
        sessions.startSession("alice", "go");
        sessions.waitIdle();

        const auto live = sessions.liveSession("alice");
        expect(live && live->activity == "go", "restarted session must survive the earlier end");
        expect(total_of(sessions.getTotal("alice"), "chess") == std::chrono::nanoseconds(10s).count(),
            "first session counted exactly once");
    }, failures);

    run_case("concurrent ends for distinct identities stay independent", []() {
        TempDir dir("concurrent");
        const auto db = dir.file("ledger.db");
        ManualClock clock;
        constexpr std::size_t identities = 32;

        {
            auto ledger = Ledger::open(db);
            tracker::SessionTracker sessions(*ledger, tracker_config(clock, 4));

            std::vector<std::thread> starters;
            for (std::size_t i = 0; i < identities; ++i)
            {
                starters.emplace_back([&sessions, i]() {
                    sessions.startSession("user" + std::to_string(i), "game" + std::to_string(i % 3));
                });
            }
            for (auto& thread : starters)
            {
                thread.join();
            }
            expect(sessions.liveCount() == identities, "every identity should be live");

            clock.advance(1min);

            std::vector<std::thread> enders;
            for (std::size_t i = 0; i < identities; ++i)
            {
                enders.emplace_back([&sessions, i]() {
                    sessions.requestEnd("user" + std::to_string(i));
                });
            }
            for (auto& thread : enders)
            {
                thread.join();
            }
            sessions.shutdown();
        }

        for (std::size_t i = 0; i < identities; ++i)
        {
            const auto identity = "user" + std::to_string(i);
            auto ledger = Ledger::open(db);
            const auto totals = ledger->query(identity);
            expect(totals && totals->size() == 1, identity + " should have exactly one activity");
            expect(total_of(totals, "game" + std::to_string(i % 3)) == std::chrono::nanoseconds(1min).count(),
                identity + " total mismatch");
        }
    }, failures);

    run_case("shutdown persists live sessions", []() {
        TempDir dir("shutdown");
        const auto db = dir.file("ledger.db");
        ManualClock clock;

        {
            auto ledger = Ledger::open(db);
            tracker::SessionTracker sessions(*ledger, tracker_config(clock));
            sessions.startSession("alice", "chess");
            clock.advance(45s);
            sessions.shutdown();
            expect(!ledger->isOpen(), "shutdown should close the ledger");
            expect(!sessions.requestEnd("alice"), "ends after shutdown must be refused");
        }

        expect(reopened_total(db, "alice", "chess") == std::chrono::nanoseconds(45s).count(), "total after reopen");
    }, failures);

    run_case("starts after shutdown are refused", []() {
        TempDir dir("closed");
        const auto db = dir.file("ledger.db");
        ManualClock clock;

        {
            auto ledger = Ledger::open(db);
            tracker::SessionTracker sessions(*ledger, tracker_config(clock));
            sessions.startSession("alice", "chess");
            clock.advance(45s);
            expect(sessions.shutdown() == 1, "final snapshot should flush the live session");

            clock.advance(10s);
            expect(sessions.startSession("bob", "go") == tracker::StartOutcome::Rejected, "new start after shutdown");
            expect(sessions.startSession("alice", "tetris") == tracker::StartOutcome::Rejected, "switch after shutdown");
            expect(sessions.liveCount() == 0, "nothing may be live after shutdown");
            expect(sessions.shutdown() == 0, "second shutdown flushes nothing");
        }

        auto ledger = Ledger::open(db);
        expect(!ledger->query("bob").has_value(), "refused start must leave no history");
        const auto alice = ledger->query("alice");
        expect(alice && alice->size() == 1, "refused switch must not add an activity");
        expect(total_of(alice, "chess") == std::chrono::nanoseconds(45s).count(), "alice total unchanged");
    }, failures);

    run_case("snapshot tolerates a failing identity", []() {
        TempDir dir("partial");
        ManualClock clock;
        auto ledger = Ledger::open(dir.file("ledger.db"));
        tracker::SessionTracker sessions(*ledger, tracker_config(clock));

        ledger->store().update([](playtime::WriteTransaction& tx) {
            tx.createBucketIfNotExists("bob");
            tx.put("bob", "chess", std::string("\xff", 1));
        });

        sessions.startSession("alice", "chess");
        sessions.startSession("bob", "chess");
        clock.advance(4s);

        expect(sessions.snapshot() == 1, "only the healthy identity should flush");
        expect(total_of(sessions.getTotal("alice"), "chess") == std::chrono::nanoseconds(4s).count(), "alice total");
        expect(sessions.liveCount() == 2, "both sessions stay live");
    }, failures);

    run_case("activity catalog accepts list and map forms", []() {
        const auto list = playtime::parse_activity_catalog(nlohmann::json::parse(
            R"([{"id": 11, "name": "Chess"}, {"id": "go", "name": "Go"}])"));
        expect(list.size() == 2, "list catalog size");
        expect(list.display_name("11") == "Chess", "numeric ids are stringified");
        expect(list.display_name("unknown") == "unknown", "unknown ids fall back to the id");

        const auto map = playtime::parse_activity_catalog(nlohmann::json::parse(R"({"7": "Tetris"})"));
        expect(map.contains("7") && map.name_for("7") == "Tetris", "map catalog lookup");

        bool threw = false;
        try
        {
            (void)playtime::parse_activity_catalog(nlohmann::json::parse(R"([{"id": 1}])"));
        }
        catch (const std::invalid_argument&)
        {
            threw = true;
        }
        expect(threw, "entries without a name must be rejected");
    }, failures);

    run_case("duration formatting and played report", []() {
        expect(tracker::format_duration(0ns) == "00:00:00", "zero duration");
        expect(tracker::format_duration(3725s) == "01:02:05", "hours minutes seconds");
        expect(tracker::format_duration(100h + 59s + 999ms) == "100:00:59", "hours do not wrap");

        playtime::ActivityCatalog catalog;
        catalog.add("11", "Chess");

        expect(tracker::render_totals(std::nullopt, catalog) == "No playtime recorded yet.\n", "no history text");

        const ActivityTotals totals{
            {"11", std::chrono::nanoseconds(10min).count()},
            {"22", std::chrono::nanoseconds(2h).count()}};
        const auto report = tracker::render_totals(totals, catalog);
        expect(report == "Played:\n  22  02:00:00\n  Chess  00:10:00\n", "unexpected report: " + report);

        const auto withLive = tracker::render_totals(totals, catalog, 90s);
        expect(withLive.find("(current session, not yet saved)  00:01:30") != std::string::npos, "live line missing");
    }, failures);

    run_case("configuration layering and validation", []() {
        tracker::TrackerConfig config;
        tracker::apply_config_json(config, nlohmann::json::parse(R"({
            "database": "/var/lib/playtime/ledger.db",
            "snapshot_interval_seconds": 60,
            "max_concurrent_merges": 2,
            "activities_file": "games.json",
            "require_known_activities": true,
            "log_level": "debug"
        })"));
        expect(config.database == "/var/lib/playtime/ledger.db", "database");
        expect(config.snapshotIntervalSeconds == 60, "snapshot interval");
        expect(config.maxConcurrentMerges == 2, "merge workers");
        expect(config.activitiesFile == "games.json", "activities file");
        expect(config.requireKnownActivities, "require known");
        expect(config.logLevel == spdlog::level::debug, "log level");

        tracker::apply_config_json(config, nlohmann::json::parse(R"({
            "snapshot_interval_seconds": -5,
            "max_concurrent_merges": 0,
            "log_level": "loud"
        })"));
        expect(config.snapshotIntervalSeconds == 60, "negative interval must be ignored");
        expect(config.maxConcurrentMerges == 2, "zero workers must be ignored");
        expect(config.logLevel == spdlog::level::debug, "bad level must be ignored");

        tracker::apply_config_json(config, nlohmann::json::parse(R"({"snapshot_interval_seconds": 5000000000})"));
        expect(config.snapshotIntervalSeconds == 60, "oversized interval must not wrap");
        tracker::apply_config_json(config, nlohmann::json::parse(R"({"snapshot_interval_seconds": -5000000000})"));
        expect(config.snapshotIntervalSeconds == 60, "hugely negative interval must be ignored");

        expect(tracker::parse_log_level("off") == spdlog::level::off, "off is a level");
        expect(!tracker::parse_log_level("nonsense"), "nonsense is not a level");
    }, failures);

    run_case("environment overrides configuration", []() {
        ::setenv("PLAYTIME_DB", "/srv/playtime/env.db", 1);
        ::setenv("PLAYTIME_SNAPSHOT_SECONDS", "42", 1);
        ::setenv("PLAYTIME_LOG_LEVEL", "warn", 1);

        tracker::TrackerConfig config;
        tracker::apply_environment(config);
        expect(config.database == "/srv/playtime/env.db", "PLAYTIME_DB override");
        expect(config.snapshotIntervalSeconds == 42, "PLAYTIME_SNAPSHOT_SECONDS override");
        expect(config.logLevel == spdlog::level::warn, "PLAYTIME_LOG_LEVEL override");

        ::setenv("PLAYTIME_SNAPSHOT_SECONDS", "soon", 1);
        ::setenv("PLAYTIME_LOG_LEVEL", "loud", 1);
        tracker::apply_environment(config);
        expect(config.snapshotIntervalSeconds == 42, "non-numeric interval must keep the previous value");
        expect(config.logLevel == spdlog::level::warn, "bad level must keep the previous value");

        ::setenv("PLAYTIME_SNAPSHOT_SECONDS", "99999999999", 1);
        tracker::apply_environment(config);
        expect(config.snapshotIntervalSeconds == 42, "oversized interval must keep the previous value");

        ::unsetenv("PLAYTIME_DB");
        ::unsetenv("PLAYTIME_SNAPSHOT_SECONDS");
        ::unsetenv("PLAYTIME_LOG_LEVEL");

        tracker::TrackerConfig untouched;
        tracker::apply_environment(untouched);
        expect(untouched.database == tracker::default_database, "unset variables leave defaults");
        expect(untouched.snapshotIntervalSeconds == tracker::default_snapshot_interval_seconds, "default interval");
    }, failures);

    run_case("console command parsing", []() {
        std::string error;

        auto start = tracker::parse_console_command("start 1234  Deep Rock Galactic ", error);
        expect(start && start->action == tracker::ConsoleAction::Start, "start parsed");
        expect(start->identity == "1234" && start->activity == "Deep Rock Galactic", "activity runs to end of line");

        auto presence = tracker::parse_console_command("presence 1234", error);
        expect(presence && presence->action == tracker::ConsoleAction::Presence && !presence->activity, "bare presence");

        expect(!tracker::parse_console_command("   ", error) && error.empty(), "blank line is silent");
        expect(!tracker::parse_console_command("start 1234", error) && !error.empty(), "start needs activity");
        expect(!tracker::parse_console_command("end", error) && !error.empty(), "end needs identity");
        expect(!tracker::parse_console_command("snapshot now", error) && !error.empty(), "snapshot takes nothing");
        expect(!tracker::parse_console_command("dance", error) && error == "Unsupported command: dance", "unknown verb");
    }, failures);

    run_case("runtime routes presence and persists on stop", []() {
        TempDir dir("runtime");
        const auto catalogPath = dir.file("games.json");
        {
            std::ofstream out(catalogPath);
            out << R"([{"id": 1, "name": "Chess"}])";
        }

        tracker::TrackerConfig config;
        config.database = dir.file("data") / "ledger.db";
        config.snapshotIntervalSeconds = 0;
        config.activitiesFile = catalogPath;
        config.requireKnownActivities = true;

        ManualClock clock;
        {
            tracker::TrackerRuntime runtime(config, clock.clock());
            expect(runtime.start(), "runtime should start");
            expect(runtime.catalog().size() == 1, "catalog loaded");

            runtime.onPresence("alice", std::string{"1"});
            runtime.onPresence("bob", std::string{"999"});
            expect(runtime.getStatus().liveSessions == 1, "unknown activity must not open a session");

            clock.advance(2min);
            runtime.onPresence("alice", std::nullopt);
            runtime.sessionTracker()->waitIdle();

            const auto report = runtime.playedReport("alice");
            expect(report == "Played:\n  Chess  00:02:00\n", "unexpected report: " + report);

            std::string error;
            const auto command = tracker::parse_console_command("start carol 1", error);
            expect(tracker::apply_console_command(runtime, *command) == "ok\n", "console start");
            clock.advance(30s);
            runtime.stop();
            expect(!runtime.isRunning(), "runtime stopped");
        }

        expect(reopened_total(config.database, "carol", "1") == std::chrono::nanoseconds(30s).count(),
            "stop must persist live sessions");
    }, failures);

    run_case("runtime ignores activity once stopped", []() {
        TempDir dir("stopped");
        tracker::TrackerConfig config;
        config.database = dir.file("ledger.db");
        config.snapshotIntervalSeconds = 0;

        ManualClock clock;
        {
            tracker::TrackerRuntime runtime(config, clock.clock());
            expect(runtime.start(), "runtime should start");
            runtime.onActivityStarted("alice", "chess");
            clock.advance(1min);
            runtime.stop();

            const auto status = runtime.getStatus();
            expect(status.snapshotsTaken == 1, "stop counts as a snapshot");
            expect(status.lastSnapshotFlushed == 1, "stop should report the sessions it flushed");

            runtime.onActivityStarted("bob", "go");
            runtime.onPresence("alice", std::string{"tetris"});
            expect(!runtime.onActivityEnded("alice"), "ends after stop are refused");
            expect(runtime.getStatus().liveSessions == 0, "no session may open after stop");
        }

        auto ledger = Ledger::open(config.database);
        expect(!ledger->query("bob").has_value(), "start after stop must leave no history");
        expect(total_of(ledger->query("alice"), "chess") == std::chrono::nanoseconds(1min).count(), "alice total");
    }, failures);

    run_case("runtime checkpoints live sessions periodically", []() {
        TempDir dir("checkpoint");
        tracker::TrackerConfig config;
        config.database = dir.file("ledger.db");
        config.snapshotIntervalSeconds = 1;

        ManualClock clock;
        tracker::TrackerRuntime runtime(config, clock.clock());
        expect(runtime.start(), "runtime should start");
        runtime.onActivityStarted("alice", "chess");
        clock.advance(40s);

        const auto deadline = std::chrono::steady_clock::now() + 10s;
        while (runtime.getStatus().snapshotsTaken == 0 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(100ms);
        }
        expect(runtime.getStatus().snapshotsTaken > 0, "checkpoint thread never ran");

        expect(total_of(runtime.totalsFor("alice"), "chess") == std::chrono::nanoseconds(40s).count(),
            "checkpoint should store elapsed time while the session is live");
        expect(runtime.sessionTracker()->liveSession("alice").has_value(), "session stays live after a checkpoint");
        runtime.stop();
    }, failures);

    run_case("runtime start fails on an unusable store", []() {
        TempDir dir("badstore");
        const auto path = dir.file("ledger.db");
        {
            std::ofstream out(path, std::ios::binary);
            out << std::string(4096, 'x');
        }

        tracker::TrackerConfig config;
        config.database = path;
        config.snapshotIntervalSeconds = 0;

        tracker::TrackerRuntime runtime(config);
        expect(!runtime.start(), "start should fail");
        expect(!runtime.getStatus().lastErrorMessage.empty(), "error should be reported");
        expect(!runtime.isRunning(), "runtime must not be running");
    }, failures);

    if (failures == 0)
    {
        std::cout << "All playtime tests passed." << std::endl;
        return 0;
    }

    std::cerr << failures << " test(s) failed." << std::endl;
    return 1;
}
