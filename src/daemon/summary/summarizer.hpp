#pragma once

#include <expected>
#include <string>

// External text-generation step: combined transcript in, "title line +
// bullet summary" text out.
class Summarizer {
public:
    virtual ~Summarizer() = default;
    virtual std::expected<std::string, std::string> summarize(const std::string& transcript) = 0;
};
