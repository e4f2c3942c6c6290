#pragma once

#include "libbnx/cpt_spec.hpp"
#include "libbnx/model_types.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace libbnx {

// Normalized distribution over outcomes. Keeps insertion order.
class ProbabilityTable {
public:
    // Absolute slack allowed on the [0, 1] range check after normalization.
    static constexpr double kRangeTolerance = 1e-12;

    explicit ProbabilityTable(const Weights& weights);

    // Binary shorthand {true: p, false: 1 - p}.
    explicit ProbabilityTable(double p);

    ProbabilityTable(std::vector<Outcome> outcomes, const Eigen::VectorXd& weights);

    [[nodiscard]] static ProbabilityTable from_spec(const DistributionSpec& spec);

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool contains(const Outcome& outcome) const;

    [[nodiscard]] double probability(const Outcome& outcome) const;

    [[nodiscard]] const std::vector<Outcome>& outcomes() const noexcept;

    [[nodiscard]] const Eigen::VectorXd& probabilities() const noexcept;

    [[nodiscard]] Weights entries() const;

    [[nodiscard]] double sum() const;

    [[nodiscard]] std::string to_string() const;

private:
    void assign(const Outcome& outcome, double weight, std::vector<double>& weights);

    void normalize(const std::vector<double>& weights);

    std::vector<Outcome> outcomes_;
    Eigen::VectorXd probabilities_;
    std::unordered_map<Outcome, std::size_t, OutcomeHash> index_;
};

std::ostream& operator<<(std::ostream& os, const ProbabilityTable& table);

}  // namespace libbnx
