#pragma once

#include "artifacts.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct Config {
    struct Workers {
        std::string working_dir; // empty: daemon's cwd at load time
        std::vector<std::string> mic_command = {"python3", "mic_worker.py"};
        std::vector<std::string> speaker_command = {"python3", "speaker_worker.py"};
        std::map<std::string, std::string> env = {{"PYTHONIOENCODING", "utf-8"}};
    } workers;

    struct Artifacts {
        std::string mic = "Mic_transcript.txt";
        std::string speaker = "Speaker_transcript.txt";
        std::string combined = "Combined_transcript.txt";
        std::string summary = "Meeting_summary.txt";
    } artifacts;

    struct Timing {
        uint32_t settle_ms = 2000;
        uint32_t stop_timeout_s = 180;
        uint32_t artifact_wait_s = 120;
        uint32_t artifact_poll_ms = 2000;
    } timing;

    struct MeetingApp {
        std::string name;
        std::vector<std::string> processes;

        bool operator==(const MeetingApp&) const = default;
    };

    struct Presence {
        uint32_t poll_ms = 2000;
        std::vector<MeetingApp> apps = {
            {"Zoom", {"zoom", "ZoomWebviewHost", "CptHost"}},
            {"Teams", {"teams", "teams-for-linux", "ms-teams"}},
            {"Google Meet", {"chrome", "msedge", "firefox"}},
        };
        // Never a match on their own: a browser is not proof of a meeting.
        std::vector<std::string> browser_processes = {"chrome", "chromium", "msedge", "firefox"};
    } presence;

    struct Summary {
        bool enabled = true;
        std::string url = "http://localhost:11434";
        std::string api_format = "openai"; // "openai" or "ollama"
        std::string model = "llama3";
        std::string api_key_env;
        uint32_t timeout_s = 300;
    } summary;

    struct Indicator {
        bool notifications = true;
    } indicator;

    // Artifact names resolved against the worker working directory.
    ArtifactSet artifact_paths() const;

    static Config load(const std::string& path);
    static Config load_default();
};
