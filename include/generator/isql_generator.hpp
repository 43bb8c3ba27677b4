#pragma once

#include "core/types.hpp"

#include <string>

namespace askql {

enum class GenerationStatus {
    OK,
    UNAVAILABLE,
    TIMEOUT,
    MALFORMED
};

inline const char* generation_status_to_string(GenerationStatus status) {
    switch (status) {
        case GenerationStatus::OK: return "ok";
        case GenerationStatus::UNAVAILABLE: return "unavailable";
        case GenerationStatus::TIMEOUT: return "timeout";
        case GenerationStatus::MALFORMED: return "malformed";
        default: return "unknown";
    }
}

struct GenerationResult {
    GenerationStatus status = GenerationStatus::UNAVAILABLE;
    std::string sql;            // raw engine output when status == OK
    std::string error;

    [[nodiscard]] bool ok() const { return status == GenerationStatus::OK; }

    static GenerationResult success(std::string sql) {
        return {GenerationStatus::OK, std::move(sql), ""};
    }

    static GenerationResult failure(GenerationStatus status, std::string error) {
        return {status, "", std::move(error)};
    }
};

/**
 * @brief External natural-language-to-SQL engine
 *
 * May block for as long as the engine takes; callers bound it with
 * run_with_deadline(). Called from worker threads, so implementations must
 * be thread-safe.
 */
class ISqlGenerator {
public:
    virtual ~ISqlGenerator() = default;

    [[nodiscard]] virtual GenerationResult generate(const std::string& question,
                                                    const SchemaMap& schema) = 0;
};

} // namespace askql
