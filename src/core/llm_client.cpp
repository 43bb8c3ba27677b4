#include "core/llm_client.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>

namespace askql {

// ============================================================================
// Construction
// ============================================================================

LlmClient::LlmClient() = default;

LlmClient::LlmClient(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// System Prompts
// ============================================================================

std::string LlmClient::get_system_prompt(LlmUseCase use_case) {
    switch (use_case) {
        case LlmUseCase::NL_TO_SQL:
            return "You are a senior data analyst writing PostgreSQL. Given a question and "
                   "a database schema, write one query that answers the question.\n"
                   "Rules:\n"
                   "- ONLY SELECT statements\n"
                   "- NO comments\n"
                   "- NO markdown\n"
                   "- Use ONLY the provided schema\n"
                   "- Return ONLY raw SQL";

        case LlmUseCase::RESULT_EXPLANATION:
            return "You are a helpful data analyst. Provide a concise, plain-English "
                   "explanation of the results. Keep it under 150 words. Be specific "
                   "about numbers and trends.";

        default:
            return "You are a helpful assistant for database questions.";
    }
}

// ============================================================================
// Rate Limiting
// ============================================================================

bool LlmClient::check_rate_limit() {
    std::lock_guard lock(rate_mutex_);
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - minute_start_);

    if (elapsed.count() >= 60) {
        // New minute window
        minute_start_ = now;
        requests_this_minute_.store(0, std::memory_order_relaxed);
    }

    const uint32_t current = requests_this_minute_.load(std::memory_order_relaxed);
    if (current >= config_.max_requests_per_minute) {
        return false;
    }

    requests_this_minute_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

// ============================================================================
// Core API
// ============================================================================

LlmResponse LlmClient::complete(const LlmRequest& request) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (!config_.enabled) {
        return {false, "", "LLM client is disabled", "", {}};
    }

    if (!check_rate_limit()) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "Rate limited: too many LLM API requests", "", {}};
    }

    const auto system_prompt = get_system_prompt(request.use_case);
    const auto model = request.model.empty() ? config_.default_model : request.model;
    const auto user_prompt = request.context.empty()
        ? request.prompt
        : request.prompt + "\n\n" + request.context;

    return call_api(system_prompt, user_prompt, model, request.temperature, request.max_tokens);
}

// ============================================================================
// Request / Response Bodies
// ============================================================================

std::string LlmClient::build_request_body(const std::string& provider,
                                          const std::string& model,
                                          const std::string& system_prompt,
                                          const std::string& user_prompt,
                                          double temperature,
                                          int max_tokens) {
    nlohmann::json body;
    body["model"] = model;
    body["max_tokens"] = max_tokens;
    body["temperature"] = temperature;

    if (provider == "anthropic") {
        // Anthropic: system prompt is a top-level field
        body["system"] = system_prompt;
        body["messages"] = nlohmann::json::array({
            {{"role", "user"}, {"content", user_prompt}}
        });
    } else {
        body["messages"] = nlohmann::json::array({
            {{"role", "system"}, {"content", system_prompt}},
            {{"role", "user"}, {"content", user_prompt}}
        });
    }
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string LlmClient::extract_content(const std::string& provider, const std::string& body) {
    const auto json = nlohmann::json::parse(body);

    if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        const auto content = json.find("content");
        if (content == json.end() || !content->is_array()) return "";
        for (const auto& block : *content) {
            if (block.value("type", "") == "text") {
                return block.value("text", "");
            }
        }
        return "";
    }

    // OpenAI: {"choices":[{"message":{"content":"..."}}]}
    const auto choices = json.find("choices");
    if (choices == json.end() || !choices->is_array() || choices->empty()) return "";
    const auto& first = choices->front();
    const auto message = first.find("message");
    if (message == first.end() || !message->is_object()) return "";
    const auto text = message->find("content");
    if (text == message->end() || !text->is_string()) return "";
    return text->get<std::string>();
}

// ============================================================================
// API Call
// ============================================================================

LlmResponse LlmClient::call_api(
    const std::string& system_prompt,
    const std::string& user_prompt,
    const std::string& model,
    double temperature,
    int max_tokens) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);

    const auto start = std::chrono::steady_clock::now();
    const auto elapsed = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };
    const auto fail = [&, this](std::string error) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return LlmResponse{false, "", std::move(error), model, elapsed()};
    };

    if (config_.api_key.empty()) {
        return fail("No API key configured");
    }

    if (config_.endpoint.empty()) {
        return fail("No endpoint configured");
    }

    const auto json_body = build_request_body(config_.provider, model, system_prompt,
                                              user_prompt, temperature, max_tokens);

    // HTTP client
    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_write_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers;
    std::string path;

    if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"}
        };
        path = "/v1/messages";
    } else {
        headers = {
            {"Authorization", "Bearer " + config_.api_key}
        };
        path = "/v1/chat/completions";
    }

    const auto res = cli.Post(path, headers, json_body, "application/json");
    if (!res) {
        return fail(std::format("HTTP request failed: {}", httplib::to_string(res.error())));
    }

    if (res->status != httplib::StatusCode::OK_200) {
        return fail(std::format("API error: HTTP {} - {}", res->status,
                                res->body.substr(0, 200)));
    }

    std::string content;
    try {
        content = extract_content(config_.provider, res->body);
    } catch (const nlohmann::json::exception& e) {
        return fail(std::format("Unparseable API response: {}", e.what()));
    }
    if (content.empty()) {
        return fail("API response carried no text content");
    }

    return {true, std::move(content), "", model, elapsed()};
}

// ============================================================================
// Convenience Methods
// ============================================================================

LlmResponse LlmClient::nl_to_sql(const std::string& question,
                                 const std::string& schema_context) {
    LlmRequest req;
    req.use_case = LlmUseCase::NL_TO_SQL;
    req.prompt = "Schema:\n" + schema_context;
    req.context = "Question: " + question;
    req.temperature = config_.temperature;
    req.max_tokens = config_.max_tokens;
    return complete(req);
}

LlmResponse LlmClient::explain_result(const std::string& question,
                                      const std::string& sql,
                                      const std::string& sample_rows_json) {
    LlmRequest req;
    req.use_case = LlmUseCase::RESULT_EXPLANATION;
    req.prompt = std::format("Question: {}\nSQL: {}", question, sql);
    req.context = "Sample rows:\n" + sample_rows_json;
    req.temperature = config_.temperature;
    req.max_tokens = config_.max_tokens;
    return complete(req);
}

// ============================================================================
// Stats
// ============================================================================

LlmClient::Stats LlmClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        rate_limited_.load(std::memory_order_relaxed)
    };
}

} // namespace askql
