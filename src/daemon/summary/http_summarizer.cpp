#include "summary/http_summarizer.hpp"

#include <curl/curl.h>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpSummarizer::HttpSummarizer(std::string url, std::string api_format, std::string model,
                               std::string api_key, uint32_t timeout_s)
    : url_(std::move(url)), api_format_(std::move(api_format)), model_(std::move(model)),
      api_key_(std::move(api_key)), timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpSummarizer::~HttpSummarizer() {
    curl_global_cleanup();
}

const char* HttpSummarizer::instructions() {
    return "You summarize meeting transcripts. Lines are tagged (MIC) for the local "
           "participant and (SPEAKER) for everyone else. Reply with a single title line, "
           "then a blank line, then concise bullet points covering decisions, action "
           "items with owners, and open questions. Do not invent content.";
}

std::string HttpSummarizer::endpoint() const {
    if (api_format_ == "ollama") return url_ + "/api/generate";
    return url_ + "/v1/chat/completions";
}

json HttpSummarizer::build_request(const std::string& transcript) const {
    if (api_format_ == "ollama") {
        return {
            {"model", model_},
            {"system", instructions()},
            {"prompt", "Transcript:\n\n" + transcript},
            {"stream", false},
        };
    }
    return {
        {"model", model_},
        {"temperature", 0.2},
        {"messages", json::array({
            {{"role", "system"}, {"content", instructions()}},
            {{"role", "user"}, {"content", "Transcript:\n\n" + transcript}},
        })},
    };
}

std::expected<std::string, std::string> HttpSummarizer::parse_response(const std::string& body) const {
    try {
        auto j = json::parse(body);
        std::string text;

        if (j.contains("error")) {
            auto& e = j["error"];
            auto msg = e.is_object() ? e.value("message", e.dump()) : e.is_string() ? e.get<std::string>() : e.dump();
            return std::unexpected("server error: " + msg);
        }

        if (api_format_ == "ollama") {
            if (!j.contains("response")) return std::unexpected("unexpected response: " + body);
            text = j["response"].get<std::string>();
        } else {
            if (!j.contains("choices") || j["choices"].empty())
                return std::unexpected("unexpected response: " + body);
            text = j["choices"][0].at("message").at("content").get<std::string>();
        }

        auto start_pos = text.find_first_not_of(" \t\n\r");
        if (start_pos == std::string::npos) return std::unexpected("empty summary");
        auto end_pos = text.find_last_not_of(" \t\n\r");
        return text.substr(start_pos, end_pos - start_pos + 1);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<std::string, std::string> HttpSummarizer::summarize(const std::string& transcript) {
    if (transcript.empty()) {
        return std::unexpected("empty transcript");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    auto url = endpoint();
    auto payload = build_request(transcript).dump();
    std::string response_body;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string auth;
    if (!api_key_.empty()) {
        auth = "Authorization: Bearer " + api_key_;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s_));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (http_status >= 400) {
        auto parsed = parse_response(response_body);
        if (!parsed) return std::unexpected("HTTP " + std::to_string(http_status) + ": " + parsed.error());
        return std::unexpected("HTTP " + std::to_string(http_status));
    }

    return parse_response(response_body);
}
