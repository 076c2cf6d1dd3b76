#include <catch2/catch_test_macros.hpp>

#include "platform/linux/posix_process_launcher.hpp"
#include "session/worker_supervisor.hpp"
#include "tmp_dir.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <sys/types.h>

using namespace std::chrono_literals;

namespace {

LaunchSpec shell(const std::string& name, const std::string& script, const std::string& dir = "") {
    return LaunchSpec{.name = name, .argv = {"/bin/sh", "-c", script}, .working_dir = dir};
}

bool process_gone(int pid) {
    return ::kill(pid, 0) == -1 && errno == ESRCH;
}

} // namespace

TEST_CASE("WorkerSupervisor with real processes", "[supervisor]") {
    PosixProcessLauncher launcher;

    SECTION("InterruptedWorkersExit") {
        WorkerSupervisor sup(launcher,
                             {LaunchSpec{.name = "mic", .argv = {"sleep", "30"}},
                              LaunchSpec{.name = "speaker", .argv = {"sleep", "30"}}},
                             200ms);
        REQUIRE(sup.start());
        REQUIRE(sup.running());
        auto pids = sup.pids();
        REQUIRE(pids.size() == 2);

        auto exits = sup.stop(5s);
        REQUIRE(exits.size() == 2);
        REQUIRE(exits[0].name == "mic");
        REQUIRE(exits[1].name == "speaker");
        for (const auto& e : exits) {
            REQUIRE(e.exit_code == 128 + SIGINT);
            REQUIRE_FALSE(e.killed);
        }
        REQUIRE_FALSE(sup.running());
        for (int pid : pids) REQUIRE(process_gone(pid));
    }

    SECTION("WorkerFlushesOnInterrupt") {
        TmpDir dir("supervisor");
        WorkerSupervisor sup(
            launcher,
            {shell("mic", "trap 'echo flushed > out.txt; exit 0' INT; while :; do sleep 0.1; done",
                   dir.path.string())},
            200ms);
        REQUIRE(sup.start());

        auto exits = sup.stop(5s);
        REQUIRE(exits.size() == 1);
        REQUIRE(exits[0].exit_code == 0);
        REQUIRE_FALSE(exits[0].killed);
        REQUIRE(read_text(dir.file("out.txt")) == "flushed\n");
    }

    SECTION("WorkingDirAndEnvironment") {
        TmpDir dir("supervisor_env");
        LaunchSpec spec = shell("mic", "echo \"$SCRIBE_TEST_VAR\" > env.txt; exec sleep 30",
                                dir.path.string());
        spec.env = {{"SCRIBE_TEST_VAR", "utf-8"}};

        WorkerSupervisor sup(launcher, {spec}, 200ms);
        REQUIRE(sup.start());
        sup.stop(5s);
        REQUIRE(read_text(dir.file("env.txt")) == "utf-8\n");
    }

    SECTION("StragglerIsKilled") {
        WorkerSupervisor sup(
            launcher, {shell("speaker", "trap '' INT; while :; do sleep 0.1; done")}, 200ms);
        REQUIRE(sup.start());
        auto pids = sup.pids();

        auto exits = sup.stop(300ms);
        REQUIRE(exits.size() == 1);
        REQUIRE(exits[0].killed);
        REQUIRE(exits[0].exit_code == 128 + SIGKILL);
        REQUIRE_FALSE(sup.running());
        REQUIRE(process_gone(pids[0]));
    }

    SECTION("EarlyExitFailsStartAndKillsTheRest") {
        WorkerSupervisor sup(launcher,
                             {LaunchSpec{.name = "mic", .argv = {"sleep", "30"}},
                              shell("speaker", "exit 3")},
                             500ms);
        auto res = sup.start();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ErrorKind::WorkerStartFailed);
        REQUIRE(res.error().worker == "speaker");
        REQUIRE(res.error().exit_code == 3);
        REQUIRE_FALSE(sup.running());
        REQUIRE(sup.pids().empty());
    }

    SECTION("MissingExecutableReports127") {
        WorkerSupervisor sup(
            launcher, {LaunchSpec{.name = "mic", .argv = {"/nonexistent/meeting-scribe-worker"}}},
            500ms);
        auto res = sup.start();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().worker == "mic");
        REQUIRE(res.error().exit_code == 127);
    }

    SECTION("StartTwiceRefused") {
        WorkerSupervisor sup(launcher, {LaunchSpec{.name = "mic", .argv = {"sleep", "30"}}}, 100ms);
        REQUIRE(sup.start());
        auto again = sup.start();
        REQUIRE_FALSE(again);
        REQUIRE(sup.pids().size() == 1);
        sup.stop(5s);
    }

    SECTION("StopWithNothingRunning") {
        WorkerSupervisor sup(launcher, {}, 100ms);
        REQUIRE(sup.stop(1s).empty());
    }
}
