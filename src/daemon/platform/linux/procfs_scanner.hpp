#pragma once

#include "platform/process_scanner.hpp"

#include <string>
#include <vector>

// Walks /proc. Reports both comm (truncated to 15 chars by the kernel) and
// the basename of argv[0], so long executable names still match.
class ProcfsScanner : public ProcessScanner {
public:
    std::vector<std::string> process_names() const override;

private:
    static std::string read_comm(int pid);
    static std::string read_exe_name(int pid);
};
