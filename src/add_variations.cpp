#include "add_variations.hpp"

#include "errors.hpp"

#include <algorithm>
#include <iostream>

namespace {

// Static columns are read once from the reference row; each insert only
// supplies the varied values
class LocationRowWriter {
public:
    LocationRowWriter(VariationStore& store, Location loc, int reference_id,
                      std::vector<std::string> varied_columns)
        : store_(store), loc_(loc), varied_columns_(std::move(varied_columns)) {
        for (const auto& column : store_.prepareColumns(loc_, varied_columns_)) {
            static_values_.emplace_back(column, store_.referenceValue(loc_, reference_id, column));
        }
    }

    int insert(const std::vector<double>& values) const {
        ColumnValues varied;
        varied.reserve(values.size());
        for (size_t k = 0; k < values.size(); ++k) {
            varied.emplace_back(varied_columns_[k], values[k]);
        }
        return store_.getOrInsertRow(loc_, static_values_, varied);
    }

private:
    VariationStore& store_;
    Location loc_;
    std::vector<std::string> varied_columns_;
    ColumnValues static_values_;
};

std::vector<VariationID> assembleIds(const std::vector<std::vector<int>>& location_ids, size_t count,
                                     const VariationID& reference) {
    std::vector<VariationID> all(count, reference);
    for (Location loc : kAllLocations) {
        const auto& ids = location_ids[locationIndex(loc)];
        if (ids.empty()) continue;
        for (size_t i = 0; i < count; ++i) {
            all[i][loc] = ids[i];
        }
    }
    return all;
}

std::vector<std::vector<int>> materializeAll(VariationStore& store, const ParsedVariations& pv,
                                             const VariationID& reference, const Eigen::MatrixXd& cdfs) {
    std::vector<std::vector<int>> location_ids(kNumLocations);
    for (Location loc : pv.variedLocations()) {
        location_ids[locationIndex(loc)] = cdfsToVariationIds(store, loc, pv, reference[loc], cdfs);
    }
    return location_ids;
}

}  // namespace

std::vector<int> cdfsToVariationIds(VariationStore& store, Location loc, const ParsedVariations& pv,
                                    int reference_id, const Eigen::MatrixXd& cdfs) {
    if (cdfs.cols() != pv.dimension()) {
        throw ValidationError("cdfsToVariationIds: CDF matrix has " + std::to_string(cdfs.cols()) +
                              " columns for " + std::to_string(pv.dimension()) + " dimensions");
    }
    const LocationParsedVariations& lpv = pv.at(loc);
    std::vector<int> ids(static_cast<size_t>(cdfs.rows()), reference_id);
    if (lpv.empty()) {
        return ids;
    }

    LocationRowWriter writer(store, loc, reference_id, lpv.columnNames());
    std::vector<double> values(lpv.variations.size());
    for (Eigen::Index r = 0; r < cdfs.rows(); ++r) {
        for (size_t k = 0; k < lpv.variations.size(); ++k) {
            values[k] = lpv.variations[k].inverse(cdfs(r, lpv.indices[k]));
        }
        ids[r] = writer.insert(values);
    }
    return ids;
}

std::vector<int> gridToVariationIds(VariationStore& store, Location loc, const ParsedVariations& pv,
                                    int reference_id) {
    const LocationParsedVariations& lpv = pv.at(loc);
    if (lpv.empty()) {
        return {reference_id};
    }
    const std::vector<int> dims = lpv.dimensions();
    std::vector<int> extent;
    size_t total = 1;
    for (int d : dims) {
        const int size = pv.sizes()[d];
        if (size < 1) {
            throw ValidationError("Grid requires discrete dimensions; '" + pv.variations()[d].columnName() +
                                  "' is continuous");
        }
        extent.push_back(size);
        total *= static_cast<size_t>(size);
    }
    // Position of each variation's owning dimension within `dims`
    std::vector<size_t> slot(lpv.variations.size());
    for (size_t k = 0; k < lpv.variations.size(); ++k) {
        slot[k] = static_cast<size_t>(std::find(dims.begin(), dims.end(), lpv.indices[k]) - dims.begin());
    }

    LocationRowWriter writer(store, loc, reference_id, lpv.columnNames());
    std::vector<int> ids;
    ids.reserve(total);
    std::vector<int> sub(dims.size(), 0);
    std::vector<double> values(lpv.variations.size());
    for (size_t flat = 0; flat < total; ++flat) {
        size_t rem = flat;
        for (size_t j = dims.size(); j-- > 0;) {
            sub[j] = static_cast<int>(rem % static_cast<size_t>(extent[j]));
            rem /= static_cast<size_t>(extent[j]);
        }
        for (size_t k = 0; k < lpv.variations.size(); ++k) {
            values[k] = lpv.variations[k].values()[sub[slot[k]]];
        }
        ids.push_back(writer.insert(values));
    }
    return ids;
}

int addVariationRow(VariationStore& store, Location loc, int reference_id,
                    const std::vector<std::string>& columns, const std::vector<double>& values) {
    if (columns.size() != values.size()) {
        throw ValidationError("addVariationRow: column and value counts differ");
    }
    LocationRowWriter writer(store, loc, reference_id, columns);
    return writer.insert(values);
}

AddGridVariationsResult addVariations(const GridVariation&, VariationStore& store,
                                      const ParsedVariations& pv, const VariationID& reference) {
    if (!pv.allDiscrete()) {
        throw ValidationError("Grid variations require every dimension to be discrete");
    }
    AddGridVariationsResult result;
    result.shape = pv.sizes();
    size_t total = 1;
    for (int s : result.shape) total *= static_cast<size_t>(s);

    result.all_variation_ids.assign(total, reference);
    std::vector<int> sub(result.shape.size(), 0);
    for (Location loc : pv.variedLocations()) {
        const std::vector<int> ids = gridToVariationIds(store, loc, pv, reference[loc]);
        const std::vector<int> dims = pv.at(loc).dimensions();
        // Broadcast the location's grid across the dimensions it does not own
        for (size_t flat = 0; flat < total; ++flat) {
            size_t rem = flat;
            for (size_t j = result.shape.size(); j-- > 0;) {
                sub[j] = static_cast<int>(rem % static_cast<size_t>(result.shape[j]));
                rem /= static_cast<size_t>(result.shape[j]);
            }
            size_t local = 0;
            for (int d : dims) {
                local = local * static_cast<size_t>(result.shape[d]) + static_cast<size_t>(sub[d]);
            }
            result.all_variation_ids[flat][loc] = ids[local];
        }
    }
    return result;
}

AddLHSVariationsResult addVariations(const LHSVariation& lhs, VariationStore& store,
                                     const ParsedVariations& pv, const VariationID& reference) {
    AddLHSVariationsResult result;
    result.cdfs = generateLHSCDFs(lhs, pv.dimension());
    const auto location_ids = materializeAll(store, pv, reference, result.cdfs);
    result.all_variation_ids = assembleIds(location_ids, static_cast<size_t>(lhs.n), reference);
    return result;
}

AddSobolVariationsResult addVariations(const SobolVariation& sobol, VariationStore& store,
                                       const ParsedVariations& pv, const VariationID& reference) {
    AddSobolVariationsResult result{{}, generateSobolCDFs(sobol, pv.dimension())};
    const Eigen::MatrixXd rows = result.cdfs.stacked();
    const auto location_ids = materializeAll(store, pv, reference, rows);
    result.all_variation_ids = assembleIds(location_ids, static_cast<size_t>(rows.rows()), reference);
    return result;
}

AddRBDVariationsResult addVariations(const RBDVariation& rbd, VariationStore& store,
                                     const ParsedVariations& pv, const VariationID& reference) {
    if (rbd.use_sobol) {
        std::cout << "Using Sobol sequence for RBD." << std::endl;
    }
    AddRBDVariationsResult result;
    const RBDCDFs design = generateRBDCDFs(rbd, pv.dimension());
    result.cdfs = design.cdfs;
    result.sorting = design.sorting;

    const auto location_ids = materializeAll(store, pv, reference, result.cdfs);
    result.all_variation_ids = assembleIds(location_ids, static_cast<size_t>(rbd.n), reference);

    const int n = rbd.n;
    const int d = pv.dimension();
    for (Location loc : kAllLocations) {
        Eigen::MatrixXi& m = result.location_variation_ids[locationIndex(loc)];
        m.resize(n, d);
        for (int j = 0; j < d; ++j) {
            for (int r = 0; r < n; ++r) {
                m(r, j) = result.all_variation_ids[result.sorting(r, j)][loc];
            }
        }
    }
    return result;
}
