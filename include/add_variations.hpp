#pragma once

#include "design.hpp"
#include "parsed_variations.hpp"
#include "variation_store.hpp"

#include <Eigen/Dense>

#include <array>
#include <string>
#include <vector>

struct AddGridVariationsResult {
    // Row-major over `shape` (first dimension slowest)
    std::vector<VariationID> all_variation_ids;
    std::vector<int> shape;
};

struct AddLHSVariationsResult {
    std::vector<VariationID> all_variation_ids;  // one per sample
    Eigen::MatrixXd cdfs;                        // n x d
};

struct AddSobolVariationsResult {
    // Sample-major: entry sample * n_matrices + matrix
    std::vector<VariationID> all_variation_ids;
    CdfCube cdfs;

    const VariationID& at(int sample, int matrix) const {
        return all_variation_ids[static_cast<size_t>(sample) * cdfs.matrices() + matrix];
    }
};

struct AddRBDVariationsResult {
    std::vector<VariationID> all_variation_ids;  // one per sample
    Eigen::MatrixXd cdfs;
    Eigen::MatrixXi sorting;
    // Per location, n x d: column j lists the sample ids in dimension j's angular order
    std::array<Eigen::MatrixXi, kNumLocations> location_variation_ids;
};

// Materialize one row per CDF row (n x d) at a location: inverse-CDF every
// variation at the location through its owning column, copy static columns
// from the reference row, and get-or-insert.
std::vector<int> cdfsToVariationIds(VariationStore& store, Location loc, const ParsedVariations& pv,
                                    int reference_id, const Eigen::MatrixXd& cdfs);

// Tensor grid over the location's owned discrete dimensions, row-major with the
// first owned dimension slowest
std::vector<int> gridToVariationIds(VariationStore& store, Location loc, const ParsedVariations& pv,
                                    int reference_id);

// Get-or-insert the reference row with the given columns replaced
int addVariationRow(VariationStore& store, Location loc, int reference_id,
                    const std::vector<std::string>& columns, const std::vector<double>& values);

AddGridVariationsResult addVariations(const GridVariation& grid, VariationStore& store,
                                      const ParsedVariations& pv, const VariationID& reference);
AddLHSVariationsResult addVariations(const LHSVariation& lhs, VariationStore& store,
                                     const ParsedVariations& pv, const VariationID& reference);
AddSobolVariationsResult addVariations(const SobolVariation& sobol, VariationStore& store,
                                       const ParsedVariations& pv, const VariationID& reference);
AddRBDVariationsResult addVariations(const RBDVariation& rbd, VariationStore& store,
                                     const ParsedVariations& pv, const VariationID& reference);
