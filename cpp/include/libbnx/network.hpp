#pragma once

#include "libbnx/cpt_spec.hpp"
#include "libbnx/model_types.hpp"
#include "libbnx/variable.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace libbnx {

class JointDistribution;

// Append-only collection of variables. Insertion order is the canonical variable order and must
// place parents before children.
class Network {
public:
    Network();
    ~Network();

    Network(Network&& other) noexcept;
    Network& operator=(Network&& other) noexcept;

    Network(const Network&) = delete;
    Network& operator=(const Network&) = delete;

    Network& add(std::string name, std::vector<std::string> parent_names, const CptSpec& cpt);

    [[nodiscard]] const Variable& lookup(const std::string& name) const;

    [[nodiscard]] std::size_t variable_index(const VariableHandle& handle) const;

    [[nodiscard]] const Variable& variable(const VariableHandle& handle) const;

    [[nodiscard]] const Variable& variable(std::size_t index) const;

    [[nodiscard]] bool contains(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t find_index(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] const std::vector<Variable>& variables() const noexcept;

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::uint64_t id() const noexcept;

    // Built on first use and shared by later calls, including concurrent ones. The options of the
    // call that performs the build apply.
    [[nodiscard]] const JointDistribution& joint_distribution(const InferenceOptions& options = {}) const;

private:
    struct JointCache;

    std::uint64_t id_;
    std::vector<Variable> variables_;
    std::unordered_map<std::string, std::size_t> index_;
    std::unique_ptr<JointCache> joint_cache_;
};

}  // namespace libbnx
