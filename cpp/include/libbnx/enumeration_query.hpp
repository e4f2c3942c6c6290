#pragma once

#include "libbnx/model_types.hpp"
#include "libbnx/network.hpp"
#include "libbnx/probability_table.hpp"

#include <string>
#include <vector>

namespace libbnx {

class JointDistribution;

// Exact posterior queries by summing joint rows consistent with the evidence.
class EnumerationQuery {
public:
    explicit EnumerationQuery(const Network& network, InferenceOptions options = {});

    // Posterior over the query variable's domain. Throws ZeroTotalProbability when no joint row
    // with positive probability agrees with the evidence.
    [[nodiscard]] ProbabilityTable ask(const VariableHandle& query, const Evidence& evidence = {}) const;

    [[nodiscard]] ProbabilityTable ask(const std::string& query, const NamedEvidence& evidence = {}) const;

    // Posterior of every variable, in canonical order, from one pass over the joint rows.
    [[nodiscard]] std::vector<ProbabilityTable> posterior_marginals(const Evidence& evidence = {}) const;

    [[nodiscard]] Evidence resolve(const NamedEvidence& evidence) const;

private:
    template <typename Visitor>
    std::size_t scan(const Evidence& evidence, Visitor&& visit) const;

    const Network& network_;
    InferenceOptions options_;
};

[[nodiscard]] ProbabilityTable ask(const Network& network,
                                   const VariableHandle& query,
                                   const Evidence& evidence,
                                   const InferenceOptions& options = {});

[[nodiscard]] ProbabilityTable ask(const Network& network,
                                   const std::string& query,
                                   const NamedEvidence& evidence,
                                   const InferenceOptions& options = {});

}  // namespace libbnx
