#include <catch2/catch.hpp>
#include "fakes.hpp"
#include "runtime/task/journal.hpp"
#include "runtime/task/registry.hpp"
#include <fstream>

using namespace warden;
using namespace warden::runtime;
using warden::testing::FakeHandle;
using warden::testing::FakeProcess;
using warden::testing::TempDir;

namespace {

TaskSnapshot make_task(const std::string& id, const std::string& role = "claude") {
    TaskSnapshot task;
    task.id = id;
    task.role = role;
    task.prompt = "fix the build";
    task.working_directory = "/srv/repo";
    return task;
}

std::shared_ptr<FakeProcess> start(TaskRegistry& registry, const std::string& id, pid_t pid) {
    auto process = std::make_shared<FakeProcess>();
    REQUIRE(registry.mark_running(id, std::make_unique<FakeHandle>(pid, process)));
    return process;
}

} // namespace

TEST_CASE("Task status names", "[registry]") {
    CHECK(std::string(task_status_to_string(TaskStatus::TIMED_OUT)) == "timed_out");
    CHECK(task_status_from_string("cancelled") == TaskStatus::CANCELLED);
    CHECK(is_terminal(TaskStatus::COMPLETED));
    CHECK_FALSE(is_terminal(TaskStatus::RUNNING));
    CHECK(generate_task_id().size() == 8);
}

TEST_CASE("Registered tasks start queued", "[registry]") {
    TaskRegistry registry;
    auto task = make_task("a1");
    task.status = TaskStatus::RUNNING;
    registry.register_task(task);

    auto snapshot = registry.get("a1");
    REQUIRE(snapshot);
    CHECK(snapshot->status == TaskStatus::QUEUED);
    CHECK(snapshot->created_at != std::chrono::system_clock::time_point{});
    CHECK_FALSE(snapshot->started_at);
    CHECK_FALSE(registry.get("missing"));
}

TEST_CASE("Reusing a task id is rejected", "[registry]") {
    TaskRegistry registry;
    registry.register_task(make_task("dup"));

    try {
        registry.register_task(make_task("dup"));
        FAIL("expected DuplicateTask");
    } catch (const DuplicateTask& e) {
        CHECK(e.id() == "dup");
    }
}

TEST_CASE("Lifecycle from queued to completed", "[registry]") {
    TaskRegistry registry;
    registry.register_task(make_task("t1"));
    auto process = start(registry, "t1", 4242);

    auto running = registry.get("t1");
    REQUIRE(running);
    CHECK(running->status == TaskStatus::RUNNING);
    CHECK(running->pid == 4242);
    CHECK(running->started_at);
    CHECK(registry.running_count("claude") == 1);
    CHECK(registry.running_count("other") == 0);

    // Still alive: nothing to collect
    CHECK(registry.poll_exits().empty());

    process->exit(0);
    auto finished = registry.poll_exits();
    REQUIRE(finished.size() == 1);
    CHECK(finished[0].id == "t1");
    CHECK(finished[0].status == TaskStatus::COMPLETED);
    REQUIRE(finished[0].exit_info);
    CHECK(finished[0].exit_info->exit_code == 0);
    CHECK(registry.running_count("claude") == 0);

    CHECK(registry.poll_exits().empty());
}

TEST_CASE("A non-zero exit fails the task", "[registry]") {
    TaskRegistry registry;
    registry.register_task(make_task("t2"));
    auto process = start(registry, "t2", 1);
    process->exit(3);

    auto finished = registry.poll_exits();
    REQUIRE(finished.size() == 1);
    CHECK(finished[0].status == TaskStatus::FAILED);
    CHECK(finished[0].exit_info->exit_code == 3);
}

TEST_CASE("Terminal transitions happen once", "[registry]") {
    TaskRegistry registry;
    registry.register_task(make_task("t3"));

    ExitInfo info;
    info.error = "spawn failed";
    CHECK(registry.mark_terminal("t3", TaskStatus::FAILED, info));
    CHECK_FALSE(registry.mark_terminal("t3", TaskStatus::COMPLETED, ExitInfo{}));
    CHECK(registry.get("t3")->status == TaskStatus::FAILED);
    CHECK(registry.get("t3")->exit_info->error == "spawn failed");

    CHECK_FALSE(registry.mark_terminal("unknown", TaskStatus::FAILED, ExitInfo{}));
    CHECK_THROWS_AS(registry.mark_terminal("t3", TaskStatus::RUNNING, ExitInfo{}), std::invalid_argument);
}

TEST_CASE("A worker for a task that is no longer queued is stopped", "[registry]") {
    TaskRegistry registry;
    registry.register_task(make_task("t4"));
    registry.terminate("t4", TaskStatus::CANCELLED, false);

    auto process = std::make_shared<FakeProcess>();
    process->ignores_sigterm = true;
    CHECK_FALSE(registry.mark_running("t4", std::make_unique<FakeHandle>(77, process)));
    CHECK(process->kills == 1);
    CHECK_FALSE(process->alive);
    CHECK(process->signal == SIGKILL);
    CHECK(registry.get("t4")->status == TaskStatus::CANCELLED);

    CHECK_THROWS_AS(registry.mark_running("t4", nullptr), std::invalid_argument);
}

TEST_CASE("Only terminal tasks can be acknowledged", "[registry]") {
    TaskRegistry registry;
    registry.register_task(make_task("t5"));
    auto process = start(registry, "t5", 5);

    CHECK_FALSE(registry.acknowledge("t5"));
    process->exit(0);
    registry.poll_exits();
    CHECK(registry.acknowledge("t5"));
    CHECK_FALSE(registry.get("t5"));
    CHECK_FALSE(registry.acknowledge("t5"));
}

TEST_CASE("Termination records the reason", "[registry]") {
    TaskRegistry registry;

    SECTION("queued tasks finish immediately") {
        registry.register_task(make_task("q"));
        CHECK(registry.terminate("q", TaskStatus::CANCELLED, false));
        auto task = registry.get("q");
        CHECK(task->status == TaskStatus::CANCELLED);
        CHECK_FALSE(registry.terminate("q", TaskStatus::CANCELLED, false));
    }

    SECTION("graceful termination of a running task") {
        registry.register_task(make_task("r"));
        auto process = start(registry, "r", 9);
        CHECK(registry.terminate("r", TaskStatus::TIMED_OUT, false));
        CHECK(process->terminations == 1);
        CHECK(process->kills == 0);

        auto finished = registry.poll_exits();
        REQUIRE(finished.size() == 1);
        CHECK(finished[0].status == TaskStatus::TIMED_OUT);
        CHECK(finished[0].exit_info->signal == SIGTERM);
    }

    SECTION("immediate termination") {
        registry.register_task(make_task("k"));
        auto process = start(registry, "k", 10);
        process->ignores_sigterm = true;
        CHECK(registry.terminate("k", TaskStatus::CANCELLED, true));
        CHECK(process->kills == 1);
        CHECK(registry.poll_exits()[0].status == TaskStatus::CANCELLED);
    }
}

TEST_CASE("Primary pid and counts", "[registry]") {
    TaskRegistry registry;
    auto primary = make_task("p");
    primary.primary = true;
    registry.register_task(primary);
    registry.register_task(make_task("s"));

    CHECK_FALSE(registry.primary_pid());
    start(registry, "p", 1234);
    CHECK(registry.primary_pid() == 1234);
    CHECK(registry.count(TaskStatus::RUNNING) == 1);
    CHECK(registry.count(TaskStatus::QUEUED) == 1);
    CHECK(registry.list().size() == 2);
}

TEST_CASE("Finished tasks outlive acknowledgment in the journal", "[registry][journal]") {
    TempDir dir;
    auto journal = std::make_shared<TaskJournal>(dir / "tasks");

    {
        TaskRegistry registry(journal);
        registry.register_task(make_task("j1"));
        auto process = start(registry, "j1", 31);
        process->exit(0);
        registry.poll_exits();
        REQUIRE(registry.acknowledge("j1"));

        auto from_journal = registry.get("j1");
        REQUIRE(from_journal);
        CHECK(from_journal->status == TaskStatus::COMPLETED);
        CHECK(from_journal->prompt == "fix the build");
    }

    // A new registry (supervisor restart) still finds it
    TaskRegistry restarted(journal);
    auto task = restarted.get("j1");
    REQUIRE(task);
    CHECK(task->id == "j1");
    CHECK(task->pid == 31);
    REQUIRE(task->exit_info);
    CHECK(task->exit_info->exit_code == 0);
    CHECK(task->started_at);

    CHECK(std::filesystem::exists(dir / "tasks" / "j1.json"));
    CHECK(journal->output_path("j1") == dir / "tasks" / "j1.log");
}

TEST_CASE("Journal lookups stay inside the journal directory", "[journal]") {
    TempDir dir;
    TaskJournal journal(dir / "tasks");
    std::ofstream(dir / "secret.json") << R"({"task_id": "secret", "status": "completed"})";

    CHECK_FALSE(journal.load("../secret"));
    CHECK_FALSE(journal.load(".."));
    CHECK_FALSE(journal.load("missing"));

    std::ofstream(dir / "tasks" / "broken.json") << "{not json";
    CHECK_FALSE(journal.load("broken"));
}

TEST_CASE("Prompts that are not clean UTF-8 still reach the journal", "[registry][journal]") {
    TempDir dir;
    auto journal = std::make_shared<TaskJournal>(dir / "tasks");
    TaskRegistry registry(journal);

    SECTION("multi-byte character past the first 499 bytes") {
        auto task = make_task("u1");
        task.prompt = std::string(499, 'a') + "\xC3\xA9";
        registry.register_task(task);

        CHECK(registry.mark_terminal("u1", TaskStatus::FAILED, ExitInfo{}));
        CHECK(registry.get("u1")->status == TaskStatus::FAILED);

        REQUIRE(registry.acknowledge("u1"));
        auto saved = registry.get("u1");
        REQUIRE(saved);
        CHECK(saved->status == TaskStatus::FAILED);
        CHECK(saved->prompt == task.prompt);
    }

    SECTION("invalid bytes") {
        auto task = make_task("u2");
        task.prompt = "deploy \xFF\xFE now \xC3";
        registry.register_task(task);
        auto process = start(registry, "u2", 52);
        process->exit(0);

        auto finished = registry.poll_exits();
        REQUIRE(finished.size() == 1);
        CHECK(finished[0].status == TaskStatus::COMPLETED);

        REQUIRE(registry.acknowledge("u2"));
        auto saved = registry.get("u2");
        REQUIRE(saved);
        CHECK(saved->status == TaskStatus::COMPLETED);
        CHECK(saved->prompt.rfind("deploy ", 0) == 0);
    }
}
