#include "libbnx/variable.hpp"

#include "libbnx/errors.hpp"

#include <stdexcept>
#include <utility>

namespace libbnx {

Variable::Variable(std::string name,
                   VariableHandle handle,
                   std::vector<VariableHandle> parents,
                   std::vector<std::string> parent_names,
                   ConditionalTable table)
    : name_(std::move(name)),
      handle_(handle),
      parents_(std::move(parents)),
      parent_names_(std::move(parent_names)),
      table_(std::move(table)) {
    if (name_.empty()) {
        throw std::invalid_argument("variable name must be non-empty");
    }
    if (parents_.size() != parent_names_.size() || parents_.size() != table_.parent_count()) {
        throw std::invalid_argument("parent list does not match cpt arity for variable " + name_);
    }
    for (const auto& [row, distribution] : table_.rows()) {
        for (const auto& outcome : distribution.outcomes()) {
            if (domain_index_.emplace(outcome, domain_.size()).second) {
                domain_.push_back(outcome);
            }
        }
    }
    if (domain_.empty()) {
        throw std::invalid_argument("variable has an empty domain: " + name_);
    }
}

const std::string& Variable::name() const noexcept {
    return name_;
}

VariableHandle Variable::handle() const noexcept {
    return handle_;
}

const std::vector<VariableHandle>& Variable::parents() const noexcept {
    return parents_;
}

const std::vector<std::string>& Variable::parent_names() const noexcept {
    return parent_names_;
}

const ConditionalTable& Variable::table() const noexcept {
    return table_;
}

const std::vector<Outcome>& Variable::domain() const noexcept {
    return domain_;
}

std::size_t Variable::domain_index(const Outcome& value) const noexcept {
    auto it = domain_index_.find(value);
    if (it == domain_index_.end()) {
        return npos;
    }
    return it->second;
}

const ProbabilityTable& Variable::conditional(const Row& parent_values) const {
    return table_.lookup(parent_values);
}

const ProbabilityTable& Variable::conditional_on(const Evidence& evidence) const {
    Row row;
    row.reserve(parents_.size());
    for (std::size_t i = 0; i < parents_.size(); ++i) {
        auto it = evidence.find(parents_[i]);
        if (it == evidence.end()) {
            throw MissingConditionalRow("no value supplied for parent " + parent_names_[i] + " of " + name_);
        }
        row.push_back(it->second);
    }
    return table_.lookup(row);
}

double Variable::probability(const Outcome& value, const Row& parent_values) const {
    return conditional(parent_values).probability(value);
}

}  // namespace libbnx
