#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Absolute paths of everything a recording cycle reads or produces.
struct ArtifactSet {
    std::string mic;
    std::string speaker;
    std::string combined;
    std::string summary;

    // Paths among {mic, speaker} that do not currently exist, in that order.
    std::vector<std::string> missing_inputs() const {
        std::vector<std::string> missing;
        std::error_code ec;
        if (!std::filesystem::exists(mic, ec)) missing.push_back(mic);
        if (!std::filesystem::exists(speaker, ec)) missing.push_back(speaker);
        return missing;
    }
};
