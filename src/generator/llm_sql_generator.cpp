#include "generator/llm_sql_generator.hpp"

namespace askql {

LlmSqlGenerator::LlmSqlGenerator(std::shared_ptr<LlmClient> client)
    : client_(std::move(client)) {}

GenerationResult LlmSqlGenerator::generate(const std::string& question,
                                           const SchemaMap& schema) {
    if (!client_ || !client_->is_enabled()) {
        return GenerationResult::failure(GenerationStatus::UNAVAILABLE,
                                         "generation engine is disabled");
    }

    const auto response = client_->nl_to_sql(question, format_schema_context(schema));
    if (!response.success) {
        return GenerationResult::failure(GenerationStatus::UNAVAILABLE, response.error);
    }
    return GenerationResult::success(response.content);
}

std::string LlmSqlGenerator::format_schema_context(const SchemaMap& schema) {
    std::string out;
    for (const auto& [name, table] : schema) {
        out += name;
        out += '(';
        for (size_t i = 0; i < table->columns.size(); ++i) {
            if (i > 0) out += ", ";
            out += table->columns[i].name;
            out += ' ';
            out += table->columns[i].type;
        }
        out += ")\n";
    }
    return out;
}

} // namespace askql
