#pragma once

#include "add_variations.hpp"
#include "design.hpp"
#include "execution.hpp"
#include "parsed_variations.hpp"
#include "variation_store.hpp"

#include <Eigen/Dense>

#include <array>
#include <map>
#include <string>
#include <vector>

// Morris one-at-a-time screening on LHS base points
struct MOAT {
    LHSVariation lhs_variation;

    explicit MOAT(int n, Rng& rng, bool add_noise = false, bool orthogonalize = true)
        : lhs_variation(n, rng, add_noise, orthogonalize) {}
};

enum class FirstOrderMethod { Sobol1993, Jansen1999, Saltelli2010 };
enum class TotalOrderMethod { Homma1996, Jansen1999, Sobol2007 };

FirstOrderMethod parseFirstOrderMethod(const std::string& name);
TotalOrderMethod parseTotalOrderMethod(const std::string& name);
std::string toString(FirstOrderMethod method);
std::string toString(TotalOrderMethod method);

struct SobolIndexMethods {
    FirstOrderMethod first_order = FirstOrderMethod::Jansen1999;
    TotalOrderMethod total_order = TotalOrderMethod::Jansen1999;
};

// Sobol' variance decomposition from two Sobol design matrices A and B
struct SobolGSA {
    SobolVariation sobol_variation;  // always two matrices
    SobolIndexMethods index_methods;

    explicit SobolGSA(int n, SobolIndexMethods methods = SobolIndexMethods(),
                      SobolRandomization randomization = SobolRandomization::None,
                      SkipStart skip_start = SkipStart::automatic(),
                      IncludeOne include_one = IncludeOne::Auto,
                      Rng* rng = nullptr)
        : sobol_variation(n, 2, randomization, skip_start, include_one, rng),
          index_methods(methods) {}
};

// Random balance design with Fourier analysis of the reordered responses
struct RBD {
    RBDVariation rbd_variation;
    int num_harmonics;

    RBD(int n, Rng& rng, int num_harmonics = 6, bool use_sobol = true);
};

struct MorrisResult {
    Eigen::VectorXd means;       // mean elementary effect per feature
    Eigen::VectorXd means_star;  // mean absolute elementary effect
    Eigen::VectorXd variances;   // sample variance across base points (0 with one base point)
    Eigen::MatrixXd effects;     // base points x features
};

struct SobolResult {
    Eigen::VectorXd first_order;  // one entry per focus feature
    Eigen::VectorXd total_order;
};

// Realized GSA design: a matrix of configuration ids whose columns are labelled
// by `header`, plus statistics cached per objective name.
class GSASampling {
public:
    virtual ~GSASampling() = default;

    // "moat", "sobol" or "rbd"
    virtual std::string method() const = 0;

    const Eigen::MatrixXi& scheme() const { return scheme_; }
    const std::vector<std::string>& header() const { return header_; }
    int nReplicates() const { return n_replicates_; }

    ReplicatePolicy replicatePolicy() const { return policy_; }
    void setReplicatePolicy(ReplicatePolicy policy) { policy_ = policy; }

    // Unique configuration ids, ascending
    std::vector<int> configurationIds() const;

    // Computes and caches the statistics for an objective; no-op when cached
    virtual void calculateGSA(const ObjectiveFunction& objective, const ExecutionBackend& backend) = 0;
    virtual bool hasResult(const std::string& objective_name) const = 0;
    virtual std::vector<std::string> calculatedObjectives() const = 0;

    virtual std::string describe() const;

protected:
    GSASampling(Eigen::MatrixXi scheme, std::vector<std::string> header, int n_replicates);

    Eigen::MatrixXd evaluate(const ObjectiveFunction& objective, const ExecutionBackend& backend) const;

private:
    Eigen::MatrixXi scheme_;
    std::vector<std::string> header_;
    int n_replicates_;
    ReplicatePolicy policy_ = ReplicatePolicy::Propagate;
};

// Scheme columns: base, then one perturbed configuration per feature
class MOATSampling : public GSASampling {
public:
    MOATSampling(Eigen::MatrixXi scheme, std::vector<std::string> header, int n_replicates);

    std::string method() const override { return "moat"; }
    void calculateGSA(const ObjectiveFunction& objective, const ExecutionBackend& backend) override;
    bool hasResult(const std::string& objective_name) const override;
    std::vector<std::string> calculatedObjectives() const override;

    const MorrisResult& result(const std::string& objective_name) const;

private:
    std::map<std::string, MorrisResult> results_;
};

// Scheme columns: A, B, then A_B(i) for each focus feature i
class SobolSampling : public GSASampling {
public:
    SobolSampling(Eigen::MatrixXi scheme, std::vector<std::string> header, int n_replicates,
                  SobolIndexMethods index_methods);

    std::string method() const override { return "sobol"; }
    void calculateGSA(const ObjectiveFunction& objective, const ExecutionBackend& backend) override;
    bool hasResult(const std::string& objective_name) const override;
    std::vector<std::string> calculatedObjectives() const override;
    std::string describe() const override;

    const SobolIndexMethods& indexMethods() const { return index_methods_; }
    const SobolResult& result(const std::string& objective_name) const;

private:
    SobolIndexMethods index_methods_;
    std::map<std::string, SobolResult> results_;
};

// Scheme column j lists configurations in feature j's periodic order
class RBDSampling : public GSASampling {
public:
    RBDSampling(Eigen::MatrixXi scheme, std::vector<std::string> header, int n_replicates,
                int num_harmonics, bool half_period);

    std::string method() const override { return "rbd"; }
    void calculateGSA(const ObjectiveFunction& objective, const ExecutionBackend& backend) override;
    bool hasResult(const std::string& objective_name) const override;
    std::vector<std::string> calculatedObjectives() const override;
    std::string describe() const override;

    int numHarmonics() const { return num_harmonics_; }
    double numCycles() const { return half_period_ ? 0.5 : 1.0; }
    const Eigen::VectorXd& result(const std::string& objective_name) const;

private:
    int num_harmonics_;
    bool half_period_;
    std::map<std::string, Eigen::VectorXd> results_;
};

// New row at `loc` moving dimension d of the row `reference_id` by +/-0.5 in CDF
// space: up when its CDF is below 0.5, down otherwise. Co-varied members must
// share the same CDF. Returns reference_id when the location does not own d.
int perturbVariation(VariationStore& store, Location loc, const ParsedVariations& pv,
                     int reference_id, int d);

// Map per-location id matrices (identical shapes) to configuration ids
Eigen::MatrixXi variationsToConfigurations(VariationStore& store,
                                           const std::array<Eigen::MatrixXi, kNumLocations>& location_ids);

// Build the design, materialize it, register configurations and dispatch the
// runs. `ignore_indices` (0-based features) is only supported by Sobol'.
MOATSampling runSensitivitySampling(const MOAT& method, int n_replicates, const ParsedVariations& pv,
                                    VariationStore& store, ExecutionBackend& backend,
                                    const VariationID& reference,
                                    const std::vector<int>& ignore_indices = {});
SobolSampling runSensitivitySampling(const SobolGSA& method, int n_replicates, const ParsedVariations& pv,
                                     VariationStore& store, ExecutionBackend& backend,
                                     const VariationID& reference,
                                     const std::vector<int>& ignore_indices = {});
RBDSampling runSensitivitySampling(const RBD& method, int n_replicates, const ParsedVariations& pv,
                                   VariationStore& store, ExecutionBackend& backend,
                                   const VariationID& reference,
                                   const std::vector<int>& ignore_indices = {});

// "<directory>/<method>_scheme.h5"
std::string schemeFilename(const GSASampling& sampling, const std::string& directory);

// Audit artifact mapping design coordinates to configuration ids
void recordSensitivityScheme(const GSASampling& sampling, const std::string& filename);

// Calculate every objective, then record the scheme into `directory`. Returns the artifact path.
std::string sensitivityResults(GSASampling& sampling, const std::vector<ObjectiveFunction>& objectives,
                               const ExecutionBackend& backend, const std::string& directory);
