#pragma once

#include <Eigen/Dense>

#include <functional>
#include <optional>
#include <string>
#include <vector>

// Execution collaborator: runs replicate simulations of configurations
class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;

    // Ensure n_replicates simulations exist for every configuration
    virtual void dispatch(const std::vector<int>& configuration_ids, int n_replicates) = 0;

    // Simulations recorded for a configuration
    virtual std::vector<int> simulationIds(int configuration_id) const = 0;
};

// Scalar objective evaluated per simulation; nullopt marks a failed or missing
// replicate. The name identifies the objective in result caches.
struct ObjectiveFunction {
    std::string name;
    std::function<std::optional<double>(int simulation_id)> fn;
};

enum class ReplicatePolicy {
    Propagate,       // any missing replicate is an EvaluationError
    ExcludeMissing   // average the successful replicates; all missing is an EvaluationError
};

ReplicatePolicy parseReplicatePolicy(const std::string& name);

// One entry per recorded simulation, padded with missing entries up to n_replicates
std::vector<std::optional<double>> evaluateReplicates(const ExecutionBackend& backend, int configuration_id,
                                                      int n_replicates, const ObjectiveFunction& objective);

double aggregateReplicates(const std::vector<std::optional<double>>& values, ReplicatePolicy policy,
                           int configuration_id);

// Replicate-averaged objective for every entry of a configuration-id scheme.
// Each unique configuration is evaluated once.
Eigen::MatrixXd evaluateScheme(const Eigen::MatrixXi& scheme, const ExecutionBackend& backend,
                               const ObjectiveFunction& objective, int n_replicates,
                               ReplicatePolicy policy);
