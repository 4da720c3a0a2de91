#include <catch2/catch.hpp>
#include "fakes.hpp"
#include "watchdog/action_log.hpp"
#include "watchdog/watchdog.hpp"
#include <fstream>
#include <sstream>

using namespace warden;
using warden::testing::FakeProbe;
using warden::testing::FakeServiceControl;
using warden::testing::RecordingSignaller;
using warden::testing::ScriptedHealthProbe;
using warden::testing::TempDir;
using warden::testing::make_process;
using namespace std::chrono_literals;

namespace {

const std::string kWorkers = "^claude";
const std::string kBuilds = "npx tsc";

// Workers 100.. with the lowest pid oldest
std::vector<probe::ProcessInfo> workers(size_t n) {
    std::vector<probe::ProcessInfo> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(make_process(static_cast<pid_t>(100 + i), 5000.0 - 10.0 * i));
    }
    return out;
}

void backdate(const std::filesystem::path& path, std::chrono::seconds age) {
    std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - age);
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

struct Fixture {
    TempDir dir;
    FakeProbe probe;
    RecordingSignaller signaller;
    watchdog::WatchdogConfig config;

    Fixture() {
        config.worker_role = probe::WorkerRole{"claude", kWorkers, std::nullopt};
        config.build_role = probe::WorkerRole{"build", kBuilds, std::nullopt};
        config.flag_path = dir / "night-watch-active";
        config.action_log = dir / "watchdog.log";
        config.orphan_patterns = {"mcp-a", "mcp-b"};
        config.health_recheck_delay = 0ms;
    }

    watchdog::SweepReport sweep(services::HealthProbe* health = nullptr,
                                services::ServiceControl* service = nullptr) {
        watchdog::ActionLog log(config.action_log);
        watchdog::Watchdog dog(config, probe, signaller, log, health, service);
        return dog.sweep();
    }
};

} // namespace

TEST_CASE("Ceiling terminates exactly the excess, oldest first", "[watchdog]") {
    Fixture f;
    f.probe.set_workers(kWorkers, workers(9));

    auto report = f.sweep();

    // 100 is the oldest and therefore primary
    REQUIRE(report.primary_pid);
    CHECK(*report.primary_pid == 100);
    auto terminated = f.signaller.pids_with(SIGTERM);
    REQUIRE(terminated.size() == 3);
    CHECK(terminated[0] == 101);
    CHECK(terminated[1] == 102);
    CHECK(terminated[2] == 103);
    CHECK(report.count(watchdog::Check::PROCESS_CEILING, "sigterm") == 3);
    CHECK(f.signaller.pids_with(SIGKILL).empty());
}

TEST_CASE("Ceiling leaves a compliant host alone", "[watchdog]") {
    Fixture f;
    f.probe.set_workers(kWorkers, workers(6));

    auto report = f.sweep();

    CHECK(report.actions.empty());
    CHECK(f.signaller.sent().empty());
}

TEST_CASE("The primary named by the pid file is spared", "[watchdog]") {
    Fixture f;
    f.config.primary_pid_file = f.dir / "primary.pid";
    std::ofstream(f.config.primary_pid_file) << 101 << "\n";
    f.probe.set_workers(kWorkers, workers(8));

    auto report = f.sweep();

    REQUIRE(report.primary_pid);
    CHECK(*report.primary_pid == 101);
    auto terminated = f.signaller.pids_with(SIGTERM);
    REQUIRE(terminated.size() == 2);
    CHECK(terminated[0] == 100);
    CHECK(terminated[1] == 102);
}

TEST_CASE("A pid file naming a dead process falls back to the oldest", "[watchdog]") {
    Fixture f;
    f.config.primary_pid_file = f.dir / "primary.pid";
    std::ofstream(f.config.primary_pid_file) << 999 << "\n";
    f.probe.set_workers(kWorkers, workers(7));

    auto report = f.sweep();

    CHECK(*report.primary_pid == 100);
    auto terminated = f.signaller.pids_with(SIGTERM);
    REQUIRE(terminated.size() == 1);
    CHECK(terminated[0] == 101);
}

TEST_CASE("Protected mode suspends ceiling enforcement", "[watchdog]") {
    Fixture f;
    coord::CoordinationFlag flag(f.config.flag_path);
    flag.activate();
    f.probe.set_workers(kWorkers, workers(9));

    auto report = f.sweep();

    CHECK(report.protected_mode);
    CHECK(f.signaller.sent().empty());
    CHECK(report.count(watchdog::Check::PROCESS_CEILING, "warn") == 1);
    CHECK(std::filesystem::exists(f.config.flag_path));
}

TEST_CASE("A stale flag is removed and enforcement resumes", "[watchdog]") {
    Fixture f;
    coord::CoordinationFlag flag(f.config.flag_path);
    flag.activate();
    backdate(f.config.flag_path, 45min);
    f.probe.set_workers(kWorkers, workers(9));

    auto report = f.sweep();

    CHECK_FALSE(report.protected_mode);
    CHECK_FALSE(std::filesystem::exists(f.config.flag_path));
    CHECK(f.signaller.pids_with(SIGTERM).size() == 3);
    CHECK(read_file(f.config.action_log).find("stale") != std::string::npos);
}

TEST_CASE("No flag means no stale flag entry", "[watchdog]") {
    Fixture f;
    f.probe.set_workers(kWorkers, workers(9));

    auto report = f.sweep();

    CHECK_FALSE(report.protected_mode);
    CHECK(read_file(f.config.action_log).find("stale") == std::string::npos);
}

TEST_CASE("A fresh flag is kept and not reported stale", "[watchdog]") {
    Fixture f;
    coord::CoordinationFlag(f.config.flag_path).activate();

    auto report = f.sweep();

    CHECK(report.protected_mode);
    CHECK(std::filesystem::exists(f.config.flag_path));
    CHECK(read_file(f.config.action_log).find("stale") == std::string::npos);
}

TEST_CASE("Critical memory kills every worker but the primary", "[watchdog]") {
    Fixture f;
    f.probe.set_workers(kWorkers, workers(3));
    f.probe.set_free_gb(1.5);

    SECTION("normal mode") {
        f.sweep();
    }

    SECTION("protected mode") {
        coord::CoordinationFlag(f.config.flag_path).activate();
        auto report = f.sweep();
        CHECK(report.protected_mode);
    }

    auto killed = f.signaller.pids_with(SIGKILL);
    REQUIRE(killed.size() == 2);
    CHECK(killed[0] == 101);
    CHECK(killed[1] == 102);
}

TEST_CASE("Enough free memory kills nothing", "[watchdog]") {
    Fixture f;
    f.probe.set_workers(kWorkers, workers(3));
    f.probe.set_free_gb(2.0);

    auto report = f.sweep();

    CHECK(report.count(watchdog::Check::CRITICAL_MEMORY, "sigkill") == 0);
    CHECK(f.signaller.sent().empty());
}

TEST_CASE("Session artifacts are pruned to the retention count", "[watchdog]") {
    Fixture f;
    auto sessions = f.dir / "sessions";
    std::filesystem::create_directories(sessions);
    for (int i = 0; i < 25; ++i) {
        auto file = sessions / ("s" + std::to_string(i) + ".jsonl");
        std::ofstream(file) << "{}\n";
        // s0 is the oldest
        backdate(file, std::chrono::seconds(1000 - i));
    }
    std::ofstream(sessions / "notes.txt") << "keep\n";
    backdate(sessions / "notes.txt", 5000s);
    f.config.session_dir = sessions;

    auto report = f.sweep();

    CHECK(report.count(watchdog::Check::SESSION_PRUNING, "delete") == 5);
    for (int i = 0; i < 5; ++i) {
        CHECK_FALSE(std::filesystem::exists(sessions / ("s" + std::to_string(i) + ".jsonl")));
    }
    for (int i = 5; i < 25; ++i) {
        CHECK(std::filesystem::exists(sessions / ("s" + std::to_string(i) + ".jsonl")));
    }
    CHECK(std::filesystem::exists(sessions / "notes.txt"));
}

TEST_CASE("Runaway builds are killed past their limit", "[watchdog]") {
    Fixture f;
    std::vector<probe::ProcessInfo> builds;
    builds.push_back(make_process(700, 900.0));
    builds.push_back(make_process(701, 400.0));
    builds.push_back(make_process(702, 100.0));
    f.probe.set_workers(kBuilds, builds);

    SECTION("normal limit") {
        f.sweep();
        auto killed = f.signaller.pids_with(SIGKILL);
        REQUIRE(killed.size() == 2);
        CHECK(killed[0] == 700);
        CHECK(killed[1] == 701);
    }

    SECTION("protected limit") {
        coord::CoordinationFlag(f.config.flag_path).activate();
        f.sweep();
        auto killed = f.signaller.pids_with(SIGKILL);
        REQUIRE(killed.size() == 1);
        CHECK(killed[0] == 700);
    }

    SECTION("a build that exited mid-sweep is skipped") {
        f.probe.forget_age(700);
        f.sweep();
        auto killed = f.signaller.pids_with(SIGKILL);
        REQUIRE(killed.size() == 1);
        CHECK(killed[0] == 701);
    }
}

TEST_CASE("Zombies are reported but never signalled", "[watchdog]") {
    Fixture f;
    f.probe.set_zombies(4);

    auto report = f.sweep();

    CHECK(report.count(watchdog::Check::ZOMBIES, "warn") == 1);
    CHECK(f.signaller.sent().empty());
}

TEST_CASE("Liveness restarts only after two failed probes", "[watchdog]") {
    Fixture f;
    FakeServiceControl service;

    SECTION("two failures restart") {
        ScriptedHealthProbe health(std::vector<int>{500, 500});
        auto report = f.sweep(&health, &service);
        CHECK(health.calls() == 2);
        CHECK(service.restarts == 1);
        CHECK(report.count(watchdog::Check::LIVENESS, "restart") == 1);
    }

    SECTION("recovery on the re-check") {
        ScriptedHealthProbe health(std::vector<int>{500, 200});
        auto report = f.sweep(&health, &service);
        CHECK(health.calls() == 2);
        CHECK(service.restarts == 0);
    }

    SECTION("healthy on the first probe") {
        ScriptedHealthProbe health(std::vector<int>{200});
        f.sweep(&health, &service);
        CHECK(health.calls() == 1);
        CHECK(service.restarts == 0);
    }

    SECTION("no response counts as a failure") {
        ScriptedHealthProbe health(std::vector<int>{0});
        f.sweep(&health, &service);
        CHECK(service.restarts == 1);
    }

    SECTION("an inactive service is not probed") {
        service.active = false;
        ScriptedHealthProbe health(std::vector<int>{500});
        f.sweep(&health, &service);
        CHECK(health.calls() == 0);
        CHECK(service.restarts == 0);
    }
}

TEST_CASE("Orphaned helpers are killed, adopted ones are kept", "[watchdog]") {
    Fixture f;
    f.probe.set_workers(kWorkers, workers(1));

    std::vector<probe::ProcessInfo> helpers;
    helpers.push_back(make_process(800, 600.0, 1));        // parent died, reparented to init
    helpers.push_back(make_process(801, 600.0, 850));      // under a live worker, via a shell
    helpers.push_back(make_process(802, 60.0, 1));         // orphaned but young
    f.probe.set_workers("mcp-a", helpers);
    f.probe.set_parent(850, 100);

    // Matched by two patterns, killed once
    std::vector<probe::ProcessInfo> others;
    others.push_back(make_process(800, 600.0, 1));
    f.probe.set_workers("mcp-b", others);

    auto report = f.sweep();

    auto killed = f.signaller.pids_with(SIGKILL);
    REQUIRE(killed.size() == 1);
    CHECK(killed[0] == 800);
    CHECK(report.count(watchdog::Check::ORPHANS, "sigkill") == 1);
}

TEST_CASE("Ancestor walk gives up past the depth limit", "[watchdog]") {
    Fixture f;
    f.config.orphan_max_depth = 3;
    f.probe.set_workers(kWorkers, workers(1));

    std::vector<probe::ProcessInfo> helpers;
    helpers.push_back(make_process(900, 600.0, 901));
    f.probe.set_workers("mcp-a", helpers);
    f.probe.set_parent(901, 902);
    f.probe.set_parent(902, 903);
    f.probe.set_parent(903, 100);

    f.sweep();

    auto killed = f.signaller.pids_with(SIGKILL);
    REQUIRE(killed.size() == 1);
    CHECK(killed[0] == 900);
}

TEST_CASE("A failing check does not stop the sweep", "[watchdog]") {
    Fixture f;
    f.probe.set_workers(kWorkers, workers(8));
    f.probe.set_zombies(1);
    f.probe.set_memory_unavailable(true);

    auto report = f.sweep();

    REQUIRE(report.failures.size() == 1);
    CHECK(report.failures[0].check == watchdog::Check::CRITICAL_MEMORY);
    CHECK(report.count(watchdog::Check::PROCESS_CEILING, "sigterm") == 2);
    CHECK(report.count(watchdog::Check::ZOMBIES, "warn") == 1);
}

TEST_CASE("Actions are written to the log and the report", "[watchdog]") {
    Fixture f;
    f.probe.set_workers(kWorkers, workers(7));

    auto report = f.sweep();

    auto log = read_file(f.config.action_log);
    CHECK(log.find("Killing excess claude process: 101") != std::string::npos);
    CHECK(log.find("7 claude processes running (max 6)") != std::string::npos);
    CHECK(log[0] == '[');

    auto j = report.to_json();
    CHECK(j["protected_mode"] == false);
    CHECK(j["primary_pid"] == 100);
    REQUIRE(j["actions"].size() == 1);
    CHECK(j["actions"][0]["check"] == "process_ceiling");
    CHECK(j["actions"][0]["action"] == "sigterm");
    CHECK(j["actions"][0]["target"] == "101");
    CHECK(j["failures"].empty());
}

TEST_CASE("Stop ends the sweep loop", "[watchdog]") {
    Fixture f;
    f.config.period = 3600s;
    watchdog::ActionLog log(f.config.action_log);
    watchdog::Watchdog dog(f.config, f.probe, f.signaller, log);

    std::thread loop([&]() { dog.run(); });
    std::this_thread::sleep_for(50ms);
    dog.stop();
    loop.join();
    SUCCEED();
}

TEST_CASE("Processes of other users are neither counted nor signalled", "[watchdog]") {
    Fixture f;
    const uid_t mine = 1000;
    const uid_t theirs = 2000;
    f.config.worker_role.uid = mine;
    f.config.build_role.uid = mine;

    // Six of ours, and six older ones belonging to someone else
    std::vector<probe::ProcessInfo> all;
    for (pid_t pid = 100; pid < 106; ++pid) {
        auto info = make_process(pid, 1000.0 - pid);
        info.uid = mine;
        all.push_back(info);
    }
    for (pid_t pid = 200; pid < 206; ++pid) {
        auto info = make_process(pid, 9000.0 - pid);
        info.uid = theirs;
        all.push_back(info);
    }
    f.probe.set_workers(kWorkers, all);

    auto build = make_process(300, 3600.0);
    build.uid = theirs;
    std::vector<probe::ProcessInfo> builds;
    builds.push_back(build);
    f.probe.set_workers(kBuilds, builds);

    auto helper = make_process(400, 3600.0, 1);
    helper.uid = theirs;
    std::vector<probe::ProcessInfo> helpers;
    helpers.push_back(helper);
    f.probe.set_workers("mcp-a", helpers);

    SECTION("ceiling, builds and orphans") {
        auto report = f.sweep();

        REQUIRE(report.primary_pid);
        CHECK(*report.primary_pid == 100);
        CHECK(f.signaller.sent().empty());
    }

    SECTION("critical memory") {
        f.probe.set_free_gb(0.5);
        f.sweep();

        auto killed = f.signaller.pids_with(SIGKILL);
        REQUIRE(killed.size() == 5);
        for (pid_t pid : killed) {
            CHECK(pid > 100);
            CHECK(pid < 106);
        }
    }
}
