#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string resolve(const std::string& dir, const std::string& name) {
    fs::path p(name);
    if (p.is_absolute()) return p.string();
    return (fs::path(dir) / p).lexically_normal().string();
}

} // namespace

ArtifactSet Config::artifact_paths() const {
    std::string dir = workers.working_dir;
    if (dir.empty()) {
        std::error_code ec;
        dir = fs::current_path(ec).string();
    }
    return ArtifactSet{
        .mic = resolve(dir, artifacts.mic),
        .speaker = resolve(dir, artifacts.speaker),
        .combined = resolve(dir, artifacts.combined),
        .summary = resolve(dir, artifacts.summary),
    };
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("workers")) {
            auto& w = j["workers"];
            if (w.contains("working_dir")) cfg.workers.working_dir = w["working_dir"].get<std::string>();
            if (w.contains("mic") && w["mic"].contains("command"))
                cfg.workers.mic_command = w["mic"]["command"].get<std::vector<std::string>>();
            if (w.contains("speaker") && w["speaker"].contains("command"))
                cfg.workers.speaker_command = w["speaker"]["command"].get<std::vector<std::string>>();
            if (w.contains("env"))
                cfg.workers.env = w["env"].get<std::map<std::string, std::string>>();
        }

        if (j.contains("artifacts")) {
            auto& a = j["artifacts"];
            if (a.contains("mic")) cfg.artifacts.mic = a["mic"].get<std::string>();
            if (a.contains("speaker")) cfg.artifacts.speaker = a["speaker"].get<std::string>();
            if (a.contains("combined")) cfg.artifacts.combined = a["combined"].get<std::string>();
            if (a.contains("summary")) cfg.artifacts.summary = a["summary"].get<std::string>();
        }

        if (j.contains("timing")) {
            auto& t = j["timing"];
            if (t.contains("settle_ms")) cfg.timing.settle_ms = t["settle_ms"].get<uint32_t>();
            if (t.contains("stop_timeout_s")) cfg.timing.stop_timeout_s = t["stop_timeout_s"].get<uint32_t>();
            if (t.contains("artifact_wait_s")) cfg.timing.artifact_wait_s = t["artifact_wait_s"].get<uint32_t>();
            if (t.contains("artifact_poll_ms")) cfg.timing.artifact_poll_ms = t["artifact_poll_ms"].get<uint32_t>();
        }

        if (j.contains("presence")) {
            auto& p = j["presence"];
            if (p.contains("poll_ms")) cfg.presence.poll_ms = p["poll_ms"].get<uint32_t>();
            if (p.contains("apps")) {
                std::vector<MeetingApp> apps;
                for (auto& entry : p["apps"]) {
                    apps.push_back({
                        .name = entry.at("name").get<std::string>(),
                        .processes = entry.at("processes").get<std::vector<std::string>>(),
                    });
                }
                cfg.presence.apps = std::move(apps);
            }
            if (p.contains("browser_processes"))
                cfg.presence.browser_processes = p["browser_processes"].get<std::vector<std::string>>();
        }

        if (j.contains("summary")) {
            auto& s = j["summary"];
            if (s.contains("enabled")) cfg.summary.enabled = s["enabled"].get<bool>();
            if (s.contains("url")) cfg.summary.url = s["url"].get<std::string>();
            if (s.contains("api_format")) cfg.summary.api_format = s["api_format"].get<std::string>();
            if (s.contains("model")) cfg.summary.model = s["model"].get<std::string>();
            if (s.contains("api_key_env")) cfg.summary.api_key_env = s["api_key_env"].get<std::string>();
            if (s.contains("timeout_s")) cfg.summary.timeout_s = s["timeout_s"].get<uint32_t>();
        }

        if (j.contains("indicator")) {
            auto& i = j["indicator"];
            if (i.contains("notifications")) cfg.indicator.notifications = i["notifications"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
