#include "libbnx/joint_distribution.hpp"

#include "libbnx/errors.hpp"
#include "libbnx/network.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace libbnx {

JointDistribution::JointDistribution(std::vector<Row> rows, Eigen::VectorXd weights)
    : rows_(std::move(rows)), probabilities_(std::move(weights)) {
    if (static_cast<Eigen::Index>(rows_.size()) != probabilities_.size()) {
        throw std::invalid_argument("joint distribution row and weight counts differ");
    }
    const double total = probabilities_.sum();
    if (!(total > 0.0) || !std::isfinite(total)) {
        throw ZeroTotalProbability("joint distribution has zero total probability");
    }
    probabilities_ /= total;
    index_.reserve(rows_.size());
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        index_.emplace(rows_[i], i);
    }
}

std::size_t JointDistribution::size() const noexcept {
    return rows_.size();
}

const std::vector<Row>& JointDistribution::rows() const noexcept {
    return rows_;
}

const Row& JointDistribution::row(std::size_t index) const {
    if (index >= rows_.size()) {
        throw std::out_of_range("joint row index out of range: " + std::to_string(index));
    }
    return rows_[index];
}

const Eigen::VectorXd& JointDistribution::probabilities() const noexcept {
    return probabilities_;
}

double JointDistribution::probability(const Row& row) const {
    auto it = index_.find(row);
    if (it == index_.end()) {
        throw std::out_of_range("row not in joint distribution: " + to_string(row));
    }
    return probabilities_[static_cast<Eigen::Index>(it->second)];
}

double JointDistribution::sum() const {
    return probabilities_.sum();
}

JointDistributionBuilder::JointDistributionBuilder(InferenceOptions options) : options_(options) {}

std::size_t JointDistributionBuilder::candidate_row_count(const Network& network) {
    std::size_t count = 1;
    for (const auto& variable : network.variables()) {
        const std::size_t domain_size = variable.domain().size();
        if (count > std::numeric_limits<std::size_t>::max() / domain_size) {
            throw std::length_error("joint row count overflows size_t");
        }
        count *= domain_size;
    }
    return count;
}

double JointDistributionBuilder::row_probability(const Network& network, const Row& row) {
    if (row.size() != network.size()) {
        throw std::invalid_argument("joint row has " + std::to_string(row.size()) + " values for " +
                                    std::to_string(network.size()) + " variables");
    }
    double product = 1.0;
    Row parent_values;
    for (std::size_t i = 0; i < row.size(); ++i) {
        const Variable& variable = network.variable(i);
        parent_values.clear();
        for (const auto& parent : variable.parents()) {
            parent_values.push_back(row[parent.index]);
        }
        product *= variable.probability(row[i], parent_values);
    }
    return product;
}

JointDistribution JointDistributionBuilder::build(const Network& network) const {
    if (network.empty()) {
        throw std::invalid_argument("network must contain at least one variable");
    }
    const auto start = std::chrono::steady_clock::now();
    const std::size_t count = candidate_row_count(network);
    if (count > options_.max_joint_rows) {
        throw std::length_error("joint distribution needs " + std::to_string(count) + " rows, limit is " +
                                std::to_string(options_.max_joint_rows));
    }

    const std::size_t n = network.size();
    std::vector<std::size_t> digits(n, 0);
    std::vector<Row> rows;
    rows.reserve(count);
    Eigen::VectorXd weights(static_cast<Eigen::Index>(count));

    for (std::size_t r = 0; r < count; ++r) {
        Row row(n);
        for (std::size_t i = 0; i < n; ++i) {
            row[i] = network.variable(i).domain()[digits[i]];
        }
        weights[static_cast<Eigen::Index>(r)] = row_probability(network, row);
        rows.push_back(std::move(row));

        for (std::size_t i = n; i-- > 0;) {
            if (++digits[i] < network.variable(i).domain().size()) {
                break;
            }
            digits[i] = 0;
        }
    }

    if (options_.verbose) {
        const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
        std::cout << "Joint distribution: " << n << " variables, " << count << " rows, total mass "
                  << weights.sum() << ", built in " << elapsed.count() << " ms" << std::endl;
    }
    return JointDistribution(std::move(rows), std::move(weights));
}

}  // namespace libbnx
