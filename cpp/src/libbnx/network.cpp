#include "libbnx/network.hpp"

#include "libbnx/errors.hpp"
#include "libbnx/joint_distribution.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace libbnx {

namespace {
[[nodiscard]] std::uint64_t next_network_id() noexcept {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}
}  // namespace

struct Network::JointCache {
    std::once_flag once;
    std::optional<JointDistribution> joint;
};

Network::Network() : id_(next_network_id()), joint_cache_(std::make_unique<JointCache>()) {}

Network::~Network() = default;

Network::Network(Network&& other) noexcept
    : id_(std::exchange(other.id_, next_network_id())),
      variables_(std::move(other.variables_)),
      index_(std::move(other.index_)),
      joint_cache_(std::move(other.joint_cache_)) {
    other.variables_.clear();
    other.index_.clear();
}

Network& Network::operator=(Network&& other) noexcept {
    if (this != &other) {
        id_ = std::exchange(other.id_, next_network_id());
        variables_ = std::move(other.variables_);
        index_ = std::move(other.index_);
        joint_cache_ = std::move(other.joint_cache_);
        other.variables_.clear();
        other.index_.clear();
    }
    return *this;
}

Network& Network::add(std::string name, std::vector<std::string> parent_names, const CptSpec& cpt) {
    if (name.empty()) {
        throw std::invalid_argument("variable name must be non-empty");
    }
    if (index_.contains(name)) {
        throw std::invalid_argument("duplicate variable name: " + name);
    }

    std::vector<VariableHandle> parents;
    parents.reserve(parent_names.size());
    std::unordered_set<std::string> seen;
    seen.reserve(parent_names.size());
    for (const auto& parent : parent_names) {
        auto it = index_.find(parent);
        if (it == index_.end()) {
            throw UnknownVariable("unknown parent " + parent + " for variable " + name);
        }
        if (!seen.insert(parent).second) {
            throw std::invalid_argument("variable " + name + " lists parent multiple times: " + parent);
        }
        parents.push_back(variables_[it->second].handle());
    }

    auto table = ConditionalTable::from_spec(cpt, parents.size());
    const VariableHandle handle{id_, variables_.size()};
    variables_.emplace_back(name, handle, std::move(parents), std::move(parent_names), std::move(table));
    index_.emplace(std::move(name), handle.index);
    joint_cache_ = std::make_unique<JointCache>();
    return *this;
}

const Variable& Network::lookup(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw UnknownVariable("unknown variable: " + name);
    }
    return variables_[it->second];
}

std::size_t Network::variable_index(const VariableHandle& handle) const {
    if (handle.network != id_ || handle.index >= variables_.size()) {
        throw VariableNotInNetwork("variable handle " + std::to_string(handle.network) + ":" +
                                   std::to_string(handle.index) + " does not belong to network " +
                                   std::to_string(id_));
    }
    return handle.index;
}

const Variable& Network::variable(const VariableHandle& handle) const {
    return variables_[variable_index(handle)];
}

const Variable& Network::variable(std::size_t index) const {
    if (index >= variables_.size()) {
        throw std::out_of_range("variable index out of range: " + std::to_string(index));
    }
    return variables_[index];
}

bool Network::contains(const std::string& name) const noexcept {
    return index_.contains(name);
}

std::size_t Network::find_index(const std::string& name) const noexcept {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return npos;
    }
    return it->second;
}

std::size_t Network::size() const noexcept {
    return variables_.size();
}

bool Network::empty() const noexcept {
    return variables_.empty();
}

const std::vector<Variable>& Network::variables() const noexcept {
    return variables_;
}

std::vector<std::string> Network::names() const {
    std::vector<std::string> result;
    result.reserve(variables_.size());
    for (const auto& variable : variables_) {
        result.push_back(variable.name());
    }
    return result;
}

std::uint64_t Network::id() const noexcept {
    return id_;
}

const JointDistribution& Network::joint_distribution(const InferenceOptions& options) const {
    if (!joint_cache_) {
        throw std::logic_error("joint distribution requested from a moved-from network");
    }
    std::call_once(joint_cache_->once, [&] {
        joint_cache_->joint.emplace(JointDistributionBuilder(options).build(*this));
    });
    return *joint_cache_->joint;
}

}  // namespace libbnx
