#include <catch2/catch_test_macros.hpp>

#include "platform/linux/procfs_scanner.hpp"

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

TEST_CASE("ProcfsScanner", "[procfs]") {
    ProcfsScanner scanner;

    SECTION("FindsSelf") {
        std::string our_comm;
        if (auto f = fopen("/proc/self/comm", "r")) {
            char buf[256];
            if (fgets(buf, sizeof(buf), f)) {
                our_comm = buf;
                if (!our_comm.empty() && our_comm.back() == '\n') our_comm.pop_back();
            }
            fclose(f);
        }
        REQUIRE_FALSE(our_comm.empty());

        auto names = scanner.process_names();
        REQUIRE(std::ranges::find(names, our_comm) != names.end());
    }

    SECTION("FindsChildByExecutableName") {
        pid_t child = fork();
        REQUIRE(child >= 0);
        if (child == 0) {
            execlp("sleep", "sleep", "10", nullptr);
            _exit(127);
        }

        bool found = false;
        for (int i = 0; i < 100 && !found; ++i) {
            auto names = scanner.process_names();
            found = std::ranges::find(names, "sleep") != names.end();
            if (!found) usleep(10000);
        }

        kill(child, SIGKILL);
        waitpid(child, nullptr, 0);
        REQUIRE(found);
    }
}
