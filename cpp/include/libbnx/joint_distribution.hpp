#pragma once

#include "libbnx/model_types.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace libbnx {

class Network;

// Distribution over full assignments. Each row holds one value per network variable, in the
// network's canonical order.
class JointDistribution {
public:
    // Normalizes weights; throws ZeroTotalProbability when they sum to zero.
    JointDistribution(std::vector<Row> rows, Eigen::VectorXd weights);

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] const std::vector<Row>& rows() const noexcept;

    [[nodiscard]] const Row& row(std::size_t index) const;

    [[nodiscard]] const Eigen::VectorXd& probabilities() const noexcept;

    [[nodiscard]] double probability(const Row& row) const;

    [[nodiscard]] double sum() const;

private:
    std::vector<Row> rows_;
    Eigen::VectorXd probabilities_;
    std::unordered_map<Row, std::size_t, RowHash> index_;
};

/**
 * Materializes the joint distribution of a network by enumeration.
 *
 * Rows are produced as the Cartesian product of every variable's domain, with the last variable
 * varying fastest. The probability of a row is the chain-rule product
 *
 *     P(row) = prod_i P(X_i = row[i] | parents(X_i) = row restricted to parent positions)
 *
 * The row count is the product of all domain sizes, so cost grows exponentially with the
 * number of variables. Builds larger than InferenceOptions::max_joint_rows are refused.
 */
class JointDistributionBuilder {
public:
    explicit JointDistributionBuilder(InferenceOptions options = {});

    [[nodiscard]] JointDistribution build(const Network& network) const;

    // Product of all domain sizes; throws std::length_error on size_t overflow.
    [[nodiscard]] static std::size_t candidate_row_count(const Network& network);

    // Unnormalized chain-rule probability of one full assignment.
    [[nodiscard]] static double row_probability(const Network& network, const Row& row);

private:
    InferenceOptions options_;
};

}  // namespace libbnx
