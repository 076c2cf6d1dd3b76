#pragma once

#include "summary/summarizer.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

class HttpSummarizer : public Summarizer {
public:
    // api_format: "openai" (/v1/chat/completions) or "ollama" (/api/generate)
    HttpSummarizer(std::string url, std::string api_format, std::string model,
                   std::string api_key = "", uint32_t timeout_s = 300);
    ~HttpSummarizer() override;

    std::expected<std::string, std::string> summarize(const std::string& transcript) override;

    // Request body for the configured api format.
    nlohmann::json build_request(const std::string& transcript) const;

    // Pulls the generated text out of a response body.
    std::expected<std::string, std::string> parse_response(const std::string& body) const;

    static const char* instructions();

private:
    std::string endpoint() const;

    std::string url_;
    std::string api_format_;
    std::string model_;
    std::string api_key_;
    uint32_t timeout_s_;
};
