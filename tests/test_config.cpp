#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ms_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (::write(fd, content.data(), content.size()) < 0) std::perror("write");
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.workers.mic_command == std::vector<std::string>{"python3", "mic_worker.py"});
        REQUIRE(cfg.workers.env.at("PYTHONIOENCODING") == "utf-8");
        REQUIRE(cfg.artifacts.mic == "Mic_transcript.txt");
        REQUIRE(cfg.artifacts.combined == "Combined_transcript.txt");
        REQUIRE(cfg.timing.settle_ms == 2000);
        REQUIRE(cfg.timing.stop_timeout_s == 180);
        REQUIRE(cfg.timing.artifact_wait_s == 120);
        REQUIRE(cfg.presence.apps.size() == 3);
        REQUIRE(cfg.presence.apps[0].name == "Zoom");
        REQUIRE(cfg.summary.enabled);
        REQUIRE(cfg.summary.api_format == "openai");
        REQUIRE(cfg.indicator.notifications);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "workers": {
                "working_dir": "/srv/meetings",
                "mic": { "command": ["./mic"] },
                "speaker": { "command": ["./speaker", "--loopback"] },
                "env": { "LANG": "C.UTF-8" }
            },
            "artifacts": { "combined": "out/combined.txt" },
            "timing": { "settle_ms": 500, "stop_timeout_s": 30, "artifact_wait_s": 10, "artifact_poll_ms": 250 },
            "presence": {
                "poll_ms": 1000,
                "apps": [ { "name": "Jitsi", "processes": ["jitsi-meet"] } ],
                "browser_processes": ["brave"]
            },
            "summary": {
                "enabled": false,
                "url": "http://10.0.0.1:8080",
                "api_format": "ollama",
                "model": "mistral",
                "api_key_env": "SCRIBE_KEY",
                "timeout_s": 60
            },
            "indicator": { "notifications": false }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.workers.working_dir == "/srv/meetings");
        REQUIRE(cfg.workers.mic_command == std::vector<std::string>{"./mic"});
        REQUIRE(cfg.workers.speaker_command == std::vector<std::string>{"./speaker", "--loopback"});
        REQUIRE(cfg.workers.env.size() == 1);
        REQUIRE(cfg.workers.env.at("LANG") == "C.UTF-8");
        REQUIRE(cfg.artifacts.combined == "out/combined.txt");
        REQUIRE(cfg.artifacts.mic == "Mic_transcript.txt");
        REQUIRE(cfg.timing.settle_ms == 500);
        REQUIRE(cfg.timing.stop_timeout_s == 30);
        REQUIRE(cfg.timing.artifact_wait_s == 10);
        REQUIRE(cfg.timing.artifact_poll_ms == 250);
        REQUIRE(cfg.presence.poll_ms == 1000);
        REQUIRE(cfg.presence.apps == std::vector<Config::MeetingApp>{{"Jitsi", {"jitsi-meet"}}});
        REQUIRE(cfg.presence.browser_processes == std::vector<std::string>{"brave"});
        REQUIRE_FALSE(cfg.summary.enabled);
        REQUIRE(cfg.summary.url == "http://10.0.0.1:8080");
        REQUIRE(cfg.summary.api_format == "ollama");
        REQUIRE(cfg.summary.model == "mistral");
        REQUIRE(cfg.summary.api_key_env == "SCRIBE_KEY");
        REQUIRE(cfg.summary.timeout_s == 60);
        REQUIRE_FALSE(cfg.indicator.notifications);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "summary": { "model": "phi3" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.summary.model == "phi3");
        // Other fields retain defaults
        REQUIRE(cfg.summary.url == "http://localhost:11434");
        REQUIRE(cfg.timing.settle_ms == 2000);
        REQUIRE(cfg.presence.apps.size() == 3);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.summary.model == "llama3");
        REQUIRE(cfg.timing.settle_ms == 2000);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "summary": { "model": "phi3" }, "timing": { "settle_ms": "soon" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.summary.model == "llama3");
        REQUIRE(cfg.timing.settle_ms == 2000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ms_test_nonexistent_config_file.json");
        REQUIRE(cfg.summary.model == "llama3");
        REQUIRE(cfg.timing.settle_ms == 2000);
    }
}

TEST_CASE("Config artifact paths", "[config]") {
    Config cfg;
    cfg.workers.working_dir = "/srv/meetings";

    SECTION("RelativeNamesResolveAgainstWorkingDir") {
        auto paths = cfg.artifact_paths();
        REQUIRE(paths.mic == "/srv/meetings/Mic_transcript.txt");
        REQUIRE(paths.speaker == "/srv/meetings/Speaker_transcript.txt");
        REQUIRE(paths.combined == "/srv/meetings/Combined_transcript.txt");
        REQUIRE(paths.summary == "/srv/meetings/Meeting_summary.txt");
    }

    SECTION("AbsoluteNamesKept") {
        cfg.artifacts.summary = "/home/me/notes/summary.txt";
        cfg.artifacts.combined = "out/../combined.txt";
        auto paths = cfg.artifact_paths();
        REQUIRE(paths.summary == "/home/me/notes/summary.txt");
        REQUIRE(paths.combined == "/srv/meetings/combined.txt");
    }

    SECTION("EmptyWorkingDirUsesCwd") {
        cfg.workers.working_dir.clear();
        auto paths = cfg.artifact_paths();
        REQUIRE(paths.mic == (std::filesystem::current_path() / "Mic_transcript.txt").string());
    }
}
