#include "execution.hpp"

#include "errors.hpp"
#include "parse_utils.hpp"

#include <iostream>
#include <map>

ReplicatePolicy parseReplicatePolicy(const std::string& name) {
    const std::string key = parseutil::lowerCopy(parseutil::trimCopy(name));
    if (key == "propagate") return ReplicatePolicy::Propagate;
    if (key == "exclude_missing") return ReplicatePolicy::ExcludeMissing;
    throw ValidationError("Invalid replicate policy: '" + name +
                          "' (expected 'propagate' or 'exclude_missing')");
}

std::vector<std::optional<double>> evaluateReplicates(const ExecutionBackend& backend, int configuration_id,
                                                      int n_replicates, const ObjectiveFunction& objective) {
    std::vector<std::optional<double>> values;
    for (int simulation_id : backend.simulationIds(configuration_id)) {
        values.push_back(objective.fn(simulation_id));
    }
    while (static_cast<int>(values.size()) < n_replicates) {
        values.emplace_back(std::nullopt);
    }
    return values;
}

double aggregateReplicates(const std::vector<std::optional<double>>& values, ReplicatePolicy policy,
                           int configuration_id) {
    double sum = 0.0;
    int count = 0;
    for (const auto& v : values) {
        if (v) {
            sum += *v;
            ++count;
        }
    }
    const int missing = static_cast<int>(values.size()) - count;
    const std::string where = "configuration " + std::to_string(configuration_id);

    if (count == 0) {
        throw EvaluationError("No successful replicates for " + where);
    }
    if (missing > 0) {
        if (policy == ReplicatePolicy::Propagate) {
            throw EvaluationError(std::to_string(missing) + " of " + std::to_string(values.size()) +
                                  " replicates missing for " + where);
        }
        std::cerr << "Warning: excluding " << missing << " missing replicate(s) for " << where << std::endl;
    }
    return sum / count;
}

Eigen::MatrixXd evaluateScheme(const Eigen::MatrixXi& scheme, const ExecutionBackend& backend,
                               const ObjectiveFunction& objective, int n_replicates,
                               ReplicatePolicy policy) {
    std::map<int, double> cache;
    Eigen::MatrixXd values(scheme.rows(), scheme.cols());
    for (Eigen::Index c = 0; c < scheme.cols(); ++c) {
        for (Eigen::Index r = 0; r < scheme.rows(); ++r) {
            const int id = scheme(r, c);
            auto it = cache.find(id);
            if (it == cache.end()) {
                const double v = aggregateReplicates(
                    evaluateReplicates(backend, id, n_replicates, objective), policy, id);
                it = cache.emplace(id, v).first;
            }
            values(r, c) = it->second;
        }
    }
    return values;
}
