#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

void redirect(FILE* stream, const char* path, const char* mode) {
    if (!std::freopen(path, mode, stream)) {
        // stderr may already be gone; nothing better to do than try.
        std::println(stderr, "daemonize: cannot reopen stream on {}: {}", path, std::strerror(errno));
    }
}

} // namespace

void daemonize(const std::string& log_path) {
    if (!log_path.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(log_path).parent_path(), ec);
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        std::println(stderr, "setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // Don't pin whatever directory we were started from.
    if (chdir("/") < 0) {
        std::println(stderr, "chdir(/) failed: {}", std::strerror(errno));
    }
    umask(027);

    redirect(stdin, "/dev/null", "r");
    redirect(stdout, "/dev/null", "w");
    redirect(stderr, log_path.empty() ? "/dev/null" : log_path.c_str(), "a");
    std::setvbuf(stderr, nullptr, _IOLBF, 0);
}

} // namespace platform
