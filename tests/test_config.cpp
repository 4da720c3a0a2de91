#include <catch2/catch.hpp>
#include "admission/admission_controller.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "fakes.hpp"
#include "lock/lock_broker.hpp"
#include "runtime/worker/process.hpp"
#include "supervisor/config.hpp"
#include "watchdog/config.hpp"

using namespace warden;
using warden::testing::ScopedEnv;

TEST_CASE("Typed environment lookups fall back on bad input", "[config]") {
    SECTION("integers") {
        ScopedEnv good("WARDEN_TEST_INT", "42");
        ScopedEnv bad("WARDEN_TEST_BAD_INT", "42abc");
        CHECK(core::config::get_env_int("WARDEN_TEST_INT", 7) == 42);
        CHECK(core::config::get_env_int("WARDEN_TEST_BAD_INT", 7) == 7);
        CHECK(core::config::get_env_int("WARDEN_TEST_MISSING_INT", 7) == 7);
    }

    SECTION("doubles") {
        ScopedEnv good("WARDEN_TEST_DOUBLE", "2.5");
        ScopedEnv bad("WARDEN_TEST_BAD_DOUBLE", "lots");
        CHECK(core::config::get_env_double("WARDEN_TEST_DOUBLE", 1.0) == Approx(2.5));
        CHECK(core::config::get_env_double("WARDEN_TEST_BAD_DOUBLE", 1.0) == Approx(1.0));
    }

    SECTION("strings") {
        ScopedEnv empty("WARDEN_TEST_EMPTY", "");
        CHECK(core::config::get_env_or("WARDEN_TEST_EMPTY", "fallback") == "fallback");
        CHECK(core::config::get_env("WARDEN_TEST_MISSING_STR").empty());
    }
}

TEST_CASE("split_command breaks on whitespace", "[config]") {
    auto argv = core::config::split_command("  systemctl   restart\tapi.service ");
    REQUIRE(argv.size() == 3);
    CHECK(argv[0] == "systemctl");
    CHECK(argv[1] == "restart");
    CHECK(argv[2] == "api.service");
    CHECK(core::config::split_command("").empty());
}

TEST_CASE("Log level names", "[config][logging]") {
    CHECK(core::log_level_from_string("debug") == spdlog::level::debug);
    CHECK(core::log_level_from_string("warning") == spdlog::level::warn);
    CHECK(core::log_level_from_string("error") == spdlog::level::err);
    CHECK(core::log_level_from_string("warn") == spdlog::level::warn);
    CHECK(core::log_level_from_string("err") == spdlog::level::err);
    CHECK(core::log_level_from_string("critical") == spdlog::level::critical);
    CHECK(core::log_level_from_string("off") == spdlog::level::off);
    CHECK(core::log_level_from_string("bogus") == spdlog::level::info);
    CHECK(core::log_level_from_string("") == spdlog::level::info);

    ScopedEnv level("WARDEN_LOG_LEVEL", "error");
    core::init_logger();
    CHECK(spdlog::get_level() == spdlog::level::err);
    core::set_log_level(spdlog::level::info);
}

TEST_CASE("Component configs read WARDEN_ variables", "[config]") {
    SECTION("lock") {
        ScopedEnv timeout("WARDEN_LOCK_TIMEOUT_SEC", "5");
        ScopedEnv name("WARDEN_LOCK_NAME", "ops.lock");
        auto config = lock::LockConfig::from_env();
        CHECK(config.timeout == std::chrono::seconds(5));
        CHECK(config.lock_name == "ops.lock");
        CHECK(config.control_dir == ".git");
    }

    SECTION("admission defaults") {
        auto limits = admission::AdmissionLimits::from_env();
        CHECK(limits.max_concurrent == 2);
        CHECK(limits.min_free_gb == Approx(4.0));
        CHECK(limits.max_load_per_cpu == Approx(0.0));
    }

    SECTION("admission overrides") {
        ScopedEnv max("WARDEN_MAX_CONCURRENT", "3");
        ScopedEnv mem("WARDEN_MIN_FREE_GB", "1.5");
        auto limits = admission::AdmissionLimits::from_env();
        CHECK(limits.max_concurrent == 3);
        CHECK(limits.min_free_gb == Approx(1.5));
    }

    SECTION("watchdog") {
        ScopedEnv state("WARDEN_STATE_DIR", "/var/lib/warden");
        ScopedEnv workers("WARDEN_MAX_WORKERS", "4");
        ScopedEnv orphans("WARDEN_ORPHAN_PATTERNS", "foo-mcp, bar-mcp ,,");
        ScopedEnv recheck("WARDEN_HEALTH_RECHECK_SEC", "0.5");
        ScopedEnv restart("WARDEN_SERVICE_RESTART_CMD", "svc restart api");
        auto config = watchdog::WatchdogConfig::from_env();
        CHECK(config.max_workers == 4);
        CHECK(config.max_session_files == 20);
        CHECK(config.build_max_age == std::chrono::seconds(300));
        CHECK(config.build_max_age_protected == std::chrono::seconds(600));
        CHECK(config.critical_free_gb == Approx(2.0));
        CHECK(config.health_recheck_delay == std::chrono::milliseconds(500));
        CHECK(config.health_timeout == std::chrono::milliseconds(5000));
        CHECK(config.flag_staleness == std::chrono::minutes(30));
        CHECK(config.period == std::chrono::seconds(60));
        CHECK(config.action_log == std::filesystem::path("/var/lib/warden/watchdog.log"));
        REQUIRE(config.orphan_patterns.size() == 2);
        CHECK(config.orphan_patterns[0] == "foo-mcp");
        CHECK(config.orphan_patterns[1] == "bar-mcp");
        REQUIRE(config.service_restart_command.size() == 3);
        CHECK(config.service_restart_command[0] == "svc");
    }

    SECTION("supervisor") {
        ScopedEnv state("WARDEN_STATE_DIR", "/var/lib/warden");
        ScopedEnv timeout("WARDEN_TASK_TIMEOUT_SEC", "90");
        auto config = supervisor::SupervisorConfig::from_env();
        CHECK(config.task_timeout == std::chrono::seconds(90));
        CHECK(config.task_dir == std::filesystem::path("/var/lib/warden/tasks"));
        CHECK(config.primary_pid_file == std::filesystem::path("/var/lib/warden/primary.pid"));
        CHECK(config.role.pattern == "^claude");
        REQUIRE(config.role.uid);
        CHECK(*config.role.uid == getuid());
    }

    SECTION("worker owner") {
        SECTION("defaults to the current user") {
            ScopedEnv unset("WARDEN_WORKER_UID", "");
            auto config = watchdog::WatchdogConfig::from_env();
            REQUIRE(config.worker_role.uid);
            CHECK(*config.worker_role.uid == getuid());
            REQUIRE(config.build_role.uid);
            CHECK(*config.build_role.uid == getuid());
        }

        SECTION("explicit uid") {
            ScopedEnv uid("WARDEN_WORKER_UID", "4242");
            auto config = watchdog::WatchdogConfig::from_env();
            REQUIRE(config.worker_role.uid);
            CHECK(*config.worker_role.uid == 4242u);
            CHECK(*supervisor::SupervisorConfig::from_env().role.uid == 4242u);
        }

        SECTION("negative matches every owner") {
            ScopedEnv uid("WARDEN_WORKER_UID", "-1");
            CHECK_FALSE(watchdog::WatchdogConfig::from_env().worker_role.uid);
            CHECK_FALSE(supervisor::SupervisorConfig::from_env().role.uid);
        }
    }

    SECTION("runner") {
        ScopedEnv command("WARDEN_WORKER_COMMAND", "agent --batch -p");
        auto config = runtime::RunnerConfig::from_env();
        REQUIRE(config.command.size() == 3);
        CHECK(config.command[0] == "agent");
        CHECK(config.command[2] == "-p");
    }
}
