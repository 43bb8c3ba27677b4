#pragma once

#include <string>
#include <string_view>

namespace askql {

/**
 * @brief Clean up candidate SQL text before validation
 *
 * Strips a surrounding markdown code fence (and its language tag), a leading
 * "SQL:" label, and trailing semicolons; collapses whitespace runs outside
 * quoted literals and identifiers to a single space.
 *
 * This is tidying only. The validator still treats the result as untrusted.
 */
[[nodiscard]] std::string normalize_candidate(std::string_view raw);

} // namespace askql
