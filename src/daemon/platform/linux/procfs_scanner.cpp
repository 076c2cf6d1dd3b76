#include "platform/linux/procfs_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

std::vector<std::string> ProcfsScanner::process_names() const {
    std::vector<std::string> names;

    std::error_code ec;
    for (auto& entry : fs::directory_iterator("/proc", ec)) {
        auto dir = entry.path().filename().string();
        if (dir.empty() || !std::ranges::all_of(dir, [](unsigned char c) { return std::isdigit(c); }))
            continue;

        int pid = std::stoi(dir);
        auto comm = read_comm(pid);
        if (comm.empty()) continue; // exited mid-scan or kernel thread we can't read

        auto exe = read_exe_name(pid);
        if (!exe.empty() && exe != comm) names.push_back(exe);
        names.push_back(std::move(comm));
    }

    return names;
}

std::string ProcfsScanner::read_comm(int pid) {
    std::ifstream f(std::format("/proc/{}/comm", pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

std::string ProcfsScanner::read_exe_name(int pid) {
    std::ifstream f(std::format("/proc/{}/cmdline", pid), std::ios::binary);
    if (!f.is_open()) return {};

    // argv[0] is the first NUL-terminated field.
    std::string argv0;
    std::getline(f, argv0, '\0');
    if (argv0.empty()) return {};
    return fs::path(argv0).filename().string();
}
