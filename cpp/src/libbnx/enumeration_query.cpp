#include "libbnx/enumeration_query.hpp"

#include "libbnx/errors.hpp"
#include "libbnx/joint_distribution.hpp"

#include <Eigen/Core>

#include <iostream>
#include <optional>
#include <utility>

namespace libbnx {

EnumerationQuery::EnumerationQuery(const Network& network, InferenceOptions options)
    : network_(network), options_(options) {}

template <typename Visitor>
std::size_t EnumerationQuery::scan(const Evidence& evidence, Visitor&& visit) const {
    std::vector<std::pair<std::size_t, const Outcome*>> constraints;
    constraints.reserve(evidence.size());
    for (const auto& [handle, value] : evidence) {
        constraints.emplace_back(network_.variable_index(handle), &value);
    }

    std::optional<JointDistribution> local;
    const JointDistribution& joint = options_.cache_joint
        ? network_.joint_distribution(options_)
        : local.emplace(JointDistributionBuilder(options_).build(network_));

    const auto& rows = joint.rows();
    const Eigen::VectorXd& probabilities = joint.probabilities();
    std::size_t matched = 0;
    for (std::size_t r = 0; r < rows.size(); ++r) {
        const Row& row = rows[r];
        bool consistent = true;
        for (const auto& [index, value] : constraints) {
            if (row[index] != *value) {
                consistent = false;
                break;
            }
        }
        if (!consistent) {
            continue;
        }
        visit(row, probabilities[static_cast<Eigen::Index>(r)]);
        ++matched;
    }

    if (options_.verbose) {
        std::cout << "Enumeration: " << matched << " of " << rows.size() << " joint rows match "
                  << evidence.size() << " evidence entries" << std::endl;
    }
    return matched;
}

ProbabilityTable EnumerationQuery::ask(const VariableHandle& query, const Evidence& evidence) const {
    const std::size_t query_index = network_.variable_index(query);
    const Variable& variable = network_.variable(query_index);

    Eigen::VectorXd totals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(variable.domain().size()));
    scan(evidence, [&](const Row& row, double probability) {
        totals[static_cast<Eigen::Index>(variable.domain_index(row[query_index]))] += probability;
    });

    if (!(totals.sum() > 0.0)) {
        throw ZeroTotalProbability("evidence has zero total probability when querying " + variable.name());
    }
    return ProbabilityTable(variable.domain(), totals);
}

ProbabilityTable EnumerationQuery::ask(const std::string& query, const NamedEvidence& evidence) const {
    return ask(network_.lookup(query).handle(), resolve(evidence));
}

std::vector<ProbabilityTable> EnumerationQuery::posterior_marginals(const Evidence& evidence) const {
    const std::size_t n = network_.size();
    std::vector<Eigen::VectorXd> totals;
    totals.reserve(n);
    for (const auto& variable : network_.variables()) {
        totals.push_back(Eigen::VectorXd::Zero(static_cast<Eigen::Index>(variable.domain().size())));
    }

    scan(evidence, [&](const Row& row, double probability) {
        for (std::size_t i = 0; i < n; ++i) {
            totals[i][static_cast<Eigen::Index>(network_.variable(i).domain_index(row[i]))] += probability;
        }
    });

    std::vector<ProbabilityTable> result;
    result.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (!(totals[i].sum() > 0.0)) {
            throw ZeroTotalProbability("evidence has zero total probability");
        }
        result.emplace_back(network_.variable(i).domain(), totals[i]);
    }
    return result;
}

Evidence EnumerationQuery::resolve(const NamedEvidence& evidence) const {
    Evidence resolved;
    for (const auto& [name, value] : evidence) {
        resolved.emplace(network_.lookup(name).handle(), value);
    }
    return resolved;
}

ProbabilityTable ask(const Network& network,
                     const VariableHandle& query,
                     const Evidence& evidence,
                     const InferenceOptions& options) {
    return EnumerationQuery(network, options).ask(query, evidence);
}

ProbabilityTable ask(const Network& network,
                     const std::string& query,
                     const NamedEvidence& evidence,
                     const InferenceOptions& options) {
    return EnumerationQuery(network, options).ask(query, evidence);
}

}  // namespace libbnx
