#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace askql {

// ============================================================================
// Basic Enums
// ============================================================================

/// Error taxonomy surfaced by the pipeline. GenerationUnavailable has no
/// member here: it always degrades to the template branch.
enum class ErrorCode {
    NONE,
    VALIDATION_REJECTED,
    TEMPLATE_UNMATCHED,
    EXECUTION_TIMEOUT,
    EXECUTION_FAILURE,
    INVALID_REQUEST,
    INTERNAL_ERROR
};

/// Stable reason codes carried by every rejection.
enum class RejectReason {
    NONE,
    INVALID_REQUEST,
    EMPTY_QUERY,
    MALFORMED_QUERY,
    MULTIPLE_STATEMENTS,
    NOT_READ_ONLY,
    FORBIDDEN_KEYWORD,
    FORBIDDEN_CONSTRUCT,
    TABLE_NOT_ALLOWED,
    LIMIT_EXCEEDED,
    NO_ACCESSIBLE_TABLES,
    TEMPLATE_UNMATCHED,
    EXECUTION_TIMEOUT,
    EXECUTION_FAILURE,
    INTERNAL_ERROR
};

enum class CandidateSource {
    GENERATED,
    TEMPLATE
};

// ============================================================================
// Identity
// ============================================================================

/**
 * @brief Caller identity supplied by the external auth layer.
 *
 * Trusted as already authenticated. Table permissions are derived from
 * the role only, never from user_id.
 */
struct Identity {
    std::string user_id;
    std::string role;
};

// ============================================================================
// Candidate
// ============================================================================

struct Candidate {
    std::string sql;
    CandidateSource source = CandidateSource::TEMPLATE;
};

// ============================================================================
// Schema Metadata
// ============================================================================

struct ColumnMetadata {
    std::string name;
    std::string type;           // information_schema data_type, lowercased
    bool nullable;

    ColumnMetadata() : nullable(true) {}
    ColumnMetadata(std::string n, std::string t, bool is_nullable = true)
        : name(std::move(n)), type(std::move(t)), nullable(is_nullable) {}
};

struct TableMetadata {
    std::string schema;
    std::string name;
    std::vector<ColumnMetadata> columns;                   // ordinal order
    std::unordered_map<std::string, size_t> column_index;  // name -> index

    const ColumnMetadata* find_column(const std::string& col_name) const {
        const auto it = column_index.find(col_name);
        if (it != column_index.end() && it->second < columns.size()) {
            return &columns[it->second];
        }
        return nullptr;
    }

    void add_column(ColumnMetadata col) {
        column_index[col.name] = columns.size();
        columns.push_back(std::move(col));
    }
};

// Keyed by lowercased table name. Ordered so prompts and permitted-table
// listings are deterministic.
using SchemaMap = std::map<std::string, std::shared_ptr<const TableMetadata>>;

// ============================================================================
// Query Results
// ============================================================================

/// A single cell: text value, or nullopt for SQL NULL.
using Value = std::optional<std::string>;
using Row = std::vector<Value>;

struct QueryResult {
    bool success;
    ErrorCode error_code;
    std::string error_message;      // caller-facing, never database text

    std::vector<std::string> column_names;
    std::vector<Row> rows;
    bool truncated;                 // rows stopped at the ceiling

    std::chrono::microseconds execution_time;

    QueryResult()
        : success(false),
          error_code(ErrorCode::NONE),
          truncated(false),
          execution_time(0) {}

    [[nodiscard]] size_t row_count() const { return rows.size(); }
};

// ============================================================================
// Helper Functions
// ============================================================================

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::VALIDATION_REJECTED: return "ValidationRejected";
        case ErrorCode::TEMPLATE_UNMATCHED: return "TemplateUnmatched";
        case ErrorCode::EXECUTION_TIMEOUT: return "ExecutionTimeout";
        case ErrorCode::EXECUTION_FAILURE: return "ExecutionFailure";
        case ErrorCode::INVALID_REQUEST: return "InvalidRequest";
        case ErrorCode::INTERNAL_ERROR: return "InternalError";
        default: return "UNKNOWN";
    }
}

inline const char* reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "None";
        case RejectReason::INVALID_REQUEST: return "InvalidRequest";
        case RejectReason::EMPTY_QUERY: return "EmptyQuery";
        case RejectReason::MALFORMED_QUERY: return "MalformedQuery";
        case RejectReason::MULTIPLE_STATEMENTS: return "MultipleStatements";
        case RejectReason::NOT_READ_ONLY: return "NotReadOnly";
        case RejectReason::FORBIDDEN_KEYWORD: return "ForbiddenKeyword";
        case RejectReason::FORBIDDEN_CONSTRUCT: return "ForbiddenConstruct";
        case RejectReason::TABLE_NOT_ALLOWED: return "TableNotAllowed";
        case RejectReason::LIMIT_EXCEEDED: return "LimitExceeded";
        case RejectReason::NO_ACCESSIBLE_TABLES: return "NoAccessibleTables";
        case RejectReason::TEMPLATE_UNMATCHED: return "TemplateUnmatched";
        case RejectReason::EXECUTION_TIMEOUT: return "ExecutionTimeout";
        case RejectReason::EXECUTION_FAILURE: return "ExecutionFailure";
        case RejectReason::INTERNAL_ERROR: return "InternalError";
        default: return "Unknown";
    }
}

inline const char* candidate_source_to_string(CandidateSource source) {
    switch (source) {
        case CandidateSource::GENERATED: return "generated";
        case CandidateSource::TEMPLATE: return "template";
        default: return "unknown";
    }
}

} // namespace askql
