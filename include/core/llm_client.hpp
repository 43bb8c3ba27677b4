#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace askql {

// LLM use case types
enum class LlmUseCase : uint8_t {
    NL_TO_SQL,
    RESULT_EXPLANATION
};

[[nodiscard]] inline const char* llm_use_case_to_string(LlmUseCase uc) {
    switch (uc) {
        case LlmUseCase::NL_TO_SQL:          return "nl_to_sql";
        case LlmUseCase::RESULT_EXPLANATION: return "result_explanation";
        default:                             return "unknown";
    }
}

struct LlmRequest {
    LlmUseCase use_case = LlmUseCase::NL_TO_SQL;
    std::string prompt;
    std::string context;
    std::string model;              // empty = Config::default_model
    double temperature = 0.2;
    int max_tokens = 1024;
};

struct LlmResponse {
    bool success = false;
    std::string content;
    std::string error;
    std::string model_used;
    std::chrono::milliseconds latency{0};
};

/**
 * @brief Client for the external text-generation engine.
 *
 * Speaks the OpenAI chat-completions format or the Anthropic messages format
 * via httplib::Client; request and response bodies go through nlohmann::json.
 * Features:
 * - Rate limiting on API calls (per-minute window)
 * - Graceful degradation if the engine is unavailable
 * - System prompts per use case
 *
 * One attempt per request. Callers enforce their own deadline on top of the
 * HTTP timeouts.
 */
class LlmClient {
public:
    struct Config {
        bool enabled = false;
        std::string provider = "openai";            // "openai" | "anthropic"
        std::string endpoint = "https://api.openai.com";
        std::string api_key;
        std::string default_model = "gpt-4o-mini";
        uint32_t timeout_ms = 10000;
        double temperature = 0.2;
        int max_tokens = 1024;
        uint32_t max_requests_per_minute = 60;
    };

    LlmClient();
    explicit LlmClient(Config config);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    // Core API
    [[nodiscard]] LlmResponse complete(const LlmRequest& request);

    // Convenience methods
    [[nodiscard]] LlmResponse nl_to_sql(const std::string& question,
                                        const std::string& schema_context);
    [[nodiscard]] LlmResponse explain_result(const std::string& question,
                                             const std::string& sql,
                                             const std::string& sample_rows_json);

    // System prompt access (for testing)
    [[nodiscard]] static std::string get_system_prompt(LlmUseCase use_case);

    /**
     * @brief Build the provider-specific request body
     */
    [[nodiscard]] static std::string build_request_body(const std::string& provider,
                                                        const std::string& model,
                                                        const std::string& system_prompt,
                                                        const std::string& user_prompt,
                                                        double temperature,
                                                        int max_tokens);

    /**
     * @brief Pull the generated text out of a provider response body
     * @return Text content, or empty when the body has none
     * @throws nlohmann::json::exception on a body that is not JSON
     */
    [[nodiscard]] static std::string extract_content(const std::string& provider,
                                                     const std::string& body);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t rate_limited = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] LlmResponse call_api(const std::string& system_prompt,
                                       const std::string& user_prompt,
                                       const std::string& model,
                                       double temperature,
                                       int max_tokens);

    [[nodiscard]] bool check_rate_limit();

    Config config_;

    // Rate limiting
    std::atomic<uint32_t> requests_this_minute_{0};
    std::chrono::steady_clock::time_point minute_start_ =
        std::chrono::steady_clock::now();
    std::mutex rate_mutex_;

    // Stats
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> rate_limited_{0};
};

} // namespace askql
