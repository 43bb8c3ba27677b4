#pragma once

#include "core/llm_client.hpp"
#include "generator/isql_generator.hpp"

#include <memory>
#include <string>

namespace askql {

/**
 * @brief ISqlGenerator backed by the LLM client
 */
class LlmSqlGenerator : public ISqlGenerator {
public:
    explicit LlmSqlGenerator(std::shared_ptr<LlmClient> client);

    GenerationResult generate(const std::string& question,
                              const SchemaMap& schema) override;

    /**
     * @brief Render the schema for the prompt
     *
     * One line per table, tables in name order:
     *   sales(id integer, region text, amount numeric)
     */
    [[nodiscard]] static std::string format_schema_context(const SchemaMap& schema);

private:
    std::shared_ptr<LlmClient> client_;
};

} // namespace askql
