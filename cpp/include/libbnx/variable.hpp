#pragma once

#include "libbnx/conditional_table.hpp"
#include "libbnx/model_types.hpp"
#include "libbnx/probability_table.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace libbnx {

// A network member: its parents are fixed at construction and its domain is the union of the
// outcomes of every CPT row, in first-seen order.
class Variable {
public:
    Variable(std::string name,
             VariableHandle handle,
             std::vector<VariableHandle> parents,
             std::vector<std::string> parent_names,
             ConditionalTable table);

    [[nodiscard]] const std::string& name() const noexcept;

    [[nodiscard]] VariableHandle handle() const noexcept;

    [[nodiscard]] const std::vector<VariableHandle>& parents() const noexcept;

    [[nodiscard]] const std::vector<std::string>& parent_names() const noexcept;

    [[nodiscard]] const ConditionalTable& table() const noexcept;

    [[nodiscard]] const std::vector<Outcome>& domain() const noexcept;

    // Position of value in domain(), or npos.
    [[nodiscard]] std::size_t domain_index(const Outcome& value) const noexcept;

    [[nodiscard]] const ProbabilityTable& conditional(const Row& parent_values) const;

    [[nodiscard]] const ProbabilityTable& conditional_on(const Evidence& evidence) const;

    [[nodiscard]] double probability(const Outcome& value, const Row& parent_values) const;

private:
    std::string name_;
    VariableHandle handle_;
    std::vector<VariableHandle> parents_;
    std::vector<std::string> parent_names_;
    ConditionalTable table_;
    std::vector<Outcome> domain_;
    std::unordered_map<Outcome, std::size_t, OutcomeHash> domain_index_;
};

}  // namespace libbnx
