#pragma once

#include <string>
#include <vector>

class ProcessScanner {
public:
    virtual ~ProcessScanner() = default;

    // Names of every process currently running, as the OS reports them.
    virtual std::vector<std::string> process_names() const = 0;
};
