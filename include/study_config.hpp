#pragma once

#include "config.hpp"
#include "design.hpp"
#include "execution.hpp"
#include "parsed_variations.hpp"
#include "sensitivity.hpp"
#include "variation.hpp"
#include "variation_store.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

enum class StudyMethod { Grid, LHS, Sobol, RBD, MOAT, SobolGSA, RBDGSA };

StudyMethod parseStudyMethod(const std::string& name);
std::string toString(StudyMethod method);
bool isSensitivityMethod(StudyMethod method);

// Everything a study config file describes: the varied dimensions, the base
// values of the in-memory store and the sampling settings.
struct StudyConfig {
    StudyMethod method = StudyMethod::LHS;
    std::vector<CoVariation> variations;
    std::vector<std::pair<TargetPath, double>> base_values;

    int n_points = 15;
    int n_replicates = 1;
    std::uint64_t seed = 0;

    // LHS / MOAT
    bool add_noise = false;
    bool orthogonalize = true;

    // Sobol designs
    int n_matrices = 1;
    SkipStart skip_start = SkipStart::automatic();
    IncludeOne include_one = IncludeOne::Auto;
    SobolRandomization randomization = SobolRandomization::None;

    // GSA
    SobolIndexMethods index_methods;
    int num_harmonics = 6;
    bool use_sobol = true;
    std::vector<int> ignore_indices;
    ReplicatePolicy replicate_policy = ReplicatePolicy::Propagate;

    static StudyConfig fromConfig(const Config& cfg);

    ParsedVariations parsedVariations() const;

    // Store holding every [[base]] value
    std::unique_ptr<InMemoryVariationStore> makeStore() const;

    std::string describe() const;
};

// Materialize a pure design (grid, lhs, sobol or rbd); one VariationID per design point.
// The overload without an rng draws from Rng(study.seed).
std::vector<VariationID> runDesign(const StudyConfig& study, VariationStore& store, Rng& rng,
                                   const VariationID& reference = VariationID());
std::vector<VariationID> runDesign(const StudyConfig& study, VariationStore& store,
                                   const VariationID& reference = VariationID());

// Build and dispatch a GSA study (moat, sobol_gsa or rbd_gsa), seeded like runDesign
std::unique_ptr<GSASampling> runSensitivity(const StudyConfig& study, VariationStore& store,
                                            ExecutionBackend& backend, Rng& rng,
                                            const VariationID& reference = VariationID());
std::unique_ptr<GSASampling> runSensitivity(const StudyConfig& study, VariationStore& store,
                                            ExecutionBackend& backend,
                                            const VariationID& reference = VariationID());
