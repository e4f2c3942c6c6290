#include "libbnx/probability_table.hpp"

#include "libbnx/errors.hpp"

#include <cmath>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace libbnx {

namespace {
void check_weight(const Outcome& outcome, double weight) {
    if (!std::isfinite(weight)) {
        throw InvalidProbabilityValue("non-finite weight for outcome " + to_string(outcome));
    }
    if (weight < 0.0) {
        throw InvalidProbabilityValue("negative weight for outcome " + to_string(outcome));
    }
}
}  // namespace

ProbabilityTable::ProbabilityTable(const Weights& weights) {
    std::vector<double> raw;
    raw.reserve(weights.size());
    for (const auto& [outcome, weight] : weights) {
        assign(outcome, weight, raw);
    }
    normalize(raw);
}

ProbabilityTable::ProbabilityTable(double p)
    : ProbabilityTable(Weights{{Outcome(true), p}, {Outcome(false), 1.0 - p}}) {}

ProbabilityTable::ProbabilityTable(std::vector<Outcome> outcomes, const Eigen::VectorXd& weights) {
    if (static_cast<Eigen::Index>(outcomes.size()) != weights.size()) {
        throw std::invalid_argument("outcome and weight counts differ");
    }
    std::vector<double> raw;
    raw.reserve(outcomes.size());
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        assign(outcomes[i], weights[static_cast<Eigen::Index>(i)], raw);
    }
    normalize(raw);
}

ProbabilityTable ProbabilityTable::from_spec(const DistributionSpec& spec) {
    if (spec.is_binary()) {
        return ProbabilityTable(spec.binary_probability());
    }
    return ProbabilityTable(spec.weights());
}

void ProbabilityTable::assign(const Outcome& outcome, double weight, std::vector<double>& weights) {
    check_weight(outcome, weight);
    auto it = index_.find(outcome);
    if (it != index_.end()) {
        weights[it->second] = weight;
        return;
    }
    index_.emplace(outcome, outcomes_.size());
    outcomes_.push_back(outcome);
    weights.push_back(weight);
}

void ProbabilityTable::normalize(const std::vector<double>& weights) {
    probabilities_ = Eigen::Map<const Eigen::VectorXd>(weights.data(), static_cast<Eigen::Index>(weights.size()));
    const double total = probabilities_.sum();
    if (!(total > 0.0) || !std::isfinite(total)) {
        throw ZeroTotalProbability("cannot normalize distribution with zero total weight");
    }
    probabilities_ /= total;
    for (Eigen::Index i = 0; i < probabilities_.size(); ++i) {
        const double value = probabilities_[i];
        if (value < -kRangeTolerance || value > 1.0 + kRangeTolerance) {
            throw InvalidProbabilityValue("probability outside [0, 1] for outcome " +
                                          libbnx::to_string(outcomes_[static_cast<std::size_t>(i)]));
        }
    }
}

std::size_t ProbabilityTable::size() const noexcept {
    return outcomes_.size();
}

bool ProbabilityTable::contains(const Outcome& outcome) const {
    return index_.contains(outcome);
}

double ProbabilityTable::probability(const Outcome& outcome) const {
    auto it = index_.find(outcome);
    if (it == index_.end()) {
        throw std::out_of_range("outcome not in distribution: " + libbnx::to_string(outcome));
    }
    return probabilities_[static_cast<Eigen::Index>(it->second)];
}

const std::vector<Outcome>& ProbabilityTable::outcomes() const noexcept {
    return outcomes_;
}

const Eigen::VectorXd& ProbabilityTable::probabilities() const noexcept {
    return probabilities_;
}

Weights ProbabilityTable::entries() const {
    Weights result;
    result.reserve(outcomes_.size());
    for (std::size_t i = 0; i < outcomes_.size(); ++i) {
        result.emplace_back(outcomes_[i], probabilities_[static_cast<Eigen::Index>(i)]);
    }
    return result;
}

double ProbabilityTable::sum() const {
    return probabilities_.sum();
}

std::string ProbabilityTable::to_string() const {
    std::ostringstream os;
    os << '{';
    for (std::size_t i = 0; i < outcomes_.size(); ++i) {
        if (i > 0) {
            os << ", ";
        }
        os << libbnx::to_string(outcomes_[i]) << ": " << probabilities_[static_cast<Eigen::Index>(i)];
    }
    os << '}';
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const ProbabilityTable& table) {
    return os << table.to_string();
}

}  // namespace libbnx
