#pragma once

#include "core/types.hpp"
#include "policy/access_policy.hpp"

#include <string>

namespace askql {

/**
 * @brief Outcome of candidate production
 *
 * Either a candidate tagged with its source, or a TEMPLATE_UNMATCHED
 * rejection. Generation failures never appear here; they degrade to the
 * template branch and set fell_back.
 */
struct ProduceResult {
    bool success = false;
    Candidate candidate;
    RejectReason reason = RejectReason::NONE;
    std::string message;
    bool fell_back = false;

    static ProduceResult ok(Candidate c) {
        ProduceResult r;
        r.success = true;
        r.candidate = std::move(c);
        return r;
    }

    static ProduceResult unmatched(std::string msg) {
        ProduceResult r;
        r.reason = RejectReason::TEMPLATE_UNMATCHED;
        r.message = std::move(msg);
        return r;
    }
};

/**
 * @brief Turns a question into candidate SQL over the caller's filtered schema
 *
 * Implementations only ever see the tables in the given scope.
 */
class ICandidateProducer {
public:
    virtual ~ICandidateProducer() = default;

    [[nodiscard]] virtual ProduceResult produce(const std::string& question,
                                                const AccessScope& scope) = 0;
};

} // namespace askql
