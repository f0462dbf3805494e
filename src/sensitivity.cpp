#include "sensitivity.hpp"

#include "errors.hpp"
#include "parse_utils.hpp"

#include <highfive/H5Easy.hpp>
#include <highfive/H5File.hpp>
#include <unsupported/Eigen/FFT>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <complex>
#include <filesystem>
#include <iostream>
#include <set>
#include <sstream>

namespace {

constexpr double kCoVariationCdfTol = 1e-10;

std::vector<std::string> featureNames(const ParsedVariations& pv) {
    std::vector<std::string> names;
    for (const auto& cv : pv.variations()) {
        names.push_back(cv.columnName());
    }
    return names;
}

// Id matrices for every location, filled with the reference id
std::array<Eigen::MatrixXi, kNumLocations> referenceIdMatrices(const VariationID& reference,
                                                               Eigen::Index rows, Eigen::Index cols) {
    std::array<Eigen::MatrixXi, kNumLocations> ids;
    for (Location loc : kAllLocations) {
        ids[locationIndex(loc)] = Eigen::MatrixXi::Constant(rows, cols, reference[loc]);
    }
    return ids;
}

void dispatchScheme(ExecutionBackend& backend, const GSASampling& sampling) {
    const std::vector<int> ids = sampling.configurationIds();
    std::cout << "Running " << sampling.method() << " sensitivity analysis: " << ids.size()
              << " configurations x " << sampling.nReplicates() << " replicates" << std::endl;
    backend.dispatch(ids, sampling.nReplicates());
}

void rejectIgnoreIndices(const std::vector<int>& ignore_indices, const char* method) {
    if (!ignore_indices.empty()) {
        throw UnsupportedOptionError(std::string(method) +
                                     " does not support ignore_indices; only Sobol' does");
    }
}

void checkTotalVariance(double total_variance, const std::string& objective_name, const char* method) {
    if (!(total_variance > 0.0) || !std::isfinite(total_variance)) {
        std::ostringstream msg;
        msg << method << ": total variance of '" << objective_name << "' is " << total_variance
            << "; indices are undefined";
        throw ComputationError(msg.str());
    }
}

template <typename Map>
std::vector<std::string> mapKeys(const Map& m) {
    std::vector<std::string> keys;
    for (const auto& entry : m) keys.push_back(entry.first);
    return keys;
}

template <typename Map>
const typename Map::mapped_type& lookupResult(const Map& m, const std::string& name, const char* method) {
    auto it = m.find(name);
    if (it == m.end()) {
        throw LookupError(std::string(method) + ": no result calculated for '" + name + "'");
    }
    return it->second;
}

}  // namespace

FirstOrderMethod parseFirstOrderMethod(const std::string& name) {
    const std::string key = parseutil::lowerCopy(parseutil::trimCopy(name));
    if (key == "sobol1993") return FirstOrderMethod::Sobol1993;
    if (key == "jansen1999") return FirstOrderMethod::Jansen1999;
    if (key == "saltelli2010") return FirstOrderMethod::Saltelli2010;
    throw ValidationError("Invalid first order method: '" + name +
                          "' (expected Sobol1993, Jansen1999 or Saltelli2010)");
}

TotalOrderMethod parseTotalOrderMethod(const std::string& name) {
    const std::string key = parseutil::lowerCopy(parseutil::trimCopy(name));
    if (key == "homma1996") return TotalOrderMethod::Homma1996;
    if (key == "jansen1999") return TotalOrderMethod::Jansen1999;
    if (key == "sobol2007") return TotalOrderMethod::Sobol2007;
    throw ValidationError("Invalid total order method: '" + name +
                          "' (expected Homma1996, Jansen1999 or Sobol2007)");
}

std::string toString(FirstOrderMethod method) {
    switch (method) {
        case FirstOrderMethod::Sobol1993: return "Sobol1993";
        case FirstOrderMethod::Jansen1999: return "Jansen1999";
        case FirstOrderMethod::Saltelli2010: return "Saltelli2010";
    }
    return "unknown";
}

std::string toString(TotalOrderMethod method) {
    switch (method) {
        case TotalOrderMethod::Homma1996: return "Homma1996";
        case TotalOrderMethod::Jansen1999: return "Jansen1999";
        case TotalOrderMethod::Sobol2007: return "Sobol2007";
    }
    return "unknown";
}

RBD::RBD(int n, Rng& rng, int harmonics, bool use_sobol)
    : rbd_variation(n, rng, use_sobol), num_harmonics(harmonics) {
    if (num_harmonics < 1) {
        throw ValidationError("RBD: num_harmonics must be >= 1, got " + std::to_string(num_harmonics));
    }
}

// ---------------------------------------------------------------------------
// GSASampling

GSASampling::GSASampling(Eigen::MatrixXi scheme, std::vector<std::string> header, int n_replicates)
    : scheme_(std::move(scheme)), header_(std::move(header)), n_replicates_(n_replicates) {
    if (static_cast<Eigen::Index>(header_.size()) != scheme_.cols()) {
        throw ValidationError("GSASampling: header has " + std::to_string(header_.size()) +
                              " entries for " + std::to_string(scheme_.cols()) + " scheme columns");
    }
    if (n_replicates_ < 1) {
        throw ValidationError("GSASampling: n_replicates must be >= 1, got " + std::to_string(n_replicates_));
    }
}

std::vector<int> GSASampling::configurationIds() const {
    std::set<int> unique(scheme_.data(), scheme_.data() + scheme_.size());
    return std::vector<int>(unique.begin(), unique.end());
}

Eigen::MatrixXd GSASampling::evaluate(const ObjectiveFunction& objective,
                                      const ExecutionBackend& backend) const {
    return evaluateScheme(scheme_, backend, objective, n_replicates_, policy_);
}

std::string GSASampling::describe() const {
    std::ostringstream out;
    std::string title = method();
    std::transform(title.begin(), title.end(), title.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    title += " sampling";
    out << title << "\n" << std::string(title.size(), '-') << "\n";
    out << "Scheme: " << scheme_.rows() << " x " << scheme_.cols() << " ("
        << configurationIds().size() << " unique configurations)\n";
    out << "Replicates: " << n_replicates_ << "\n";
    out << "Columns:";
    for (const auto& h : header_) out << " [" << h << "]";
    out << "\n";
    const std::vector<std::string> done = calculatedObjectives();
    if (!done.empty()) {
        out << "Calculated objectives:\n";
        for (const auto& name : done) out << "  " << name << "\n";
    }
    return out.str();
}

// ---------------------------------------------------------------------------
// MOAT

MOATSampling::MOATSampling(Eigen::MatrixXi scheme, std::vector<std::string> header, int n_replicates)
    : GSASampling(std::move(scheme), std::move(header), n_replicates) {}

void MOATSampling::calculateGSA(const ObjectiveFunction& objective, const ExecutionBackend& backend) {
    if (hasResult(objective.name)) {
        return;
    }
    const Eigen::MatrixXd vals = evaluate(objective, backend);
    const Eigen::Index n = vals.rows();
    const Eigen::Index d = vals.cols() - 1;

    MorrisResult result;
    // Every perturbation moves its feature by 0.5 in CDF space
    result.effects = 2.0 * (vals.rightCols(d).colwise() - vals.col(0));
    result.means = result.effects.colwise().mean().transpose();
    result.means_star = result.effects.cwiseAbs().colwise().mean().transpose();
    result.variances = Eigen::VectorXd::Zero(d);
    if (n > 1) {
        for (Eigen::Index j = 0; j < d; ++j) {
            const Eigen::VectorXd centered = (result.effects.col(j).array() - result.means(j)).matrix();
            result.variances(j) = centered.squaredNorm() / static_cast<double>(n - 1);
        }
    }
    results_.emplace(objective.name, std::move(result));
}

bool MOATSampling::hasResult(const std::string& objective_name) const {
    return results_.count(objective_name) > 0;
}

std::vector<std::string> MOATSampling::calculatedObjectives() const {
    return mapKeys(results_);
}

const MorrisResult& MOATSampling::result(const std::string& objective_name) const {
    return lookupResult(results_, objective_name, "MOAT");
}

int perturbVariation(VariationStore& store, Location loc, const ParsedVariations& pv,
                     int reference_id, int d) {
    const LocationParsedVariations& lpv = pv.at(loc);
    std::vector<const ElementaryVariation*> evs;
    for (size_t k = 0; k < lpv.variations.size(); ++k) {
        if (lpv.indices[k] == d) evs.push_back(&lpv.variations[k]);
    }
    if (evs.empty()) {
        return reference_id;
    }

    std::vector<std::string> columns;
    for (const ElementaryVariation* ev : evs) {
        columns.push_back(ev->columnName());
    }
    store.prepareColumns(loc, columns);
    std::vector<double> base_cdfs;
    for (const ElementaryVariation* ev : evs) {
        base_cdfs.push_back(ev->cdf(store.referenceValue(loc, reference_id, ev->columnName())));
    }
    const auto [lo, hi] = std::minmax_element(base_cdfs.begin(), base_cdfs.end());
    if (*hi - *lo >= kCoVariationCdfTol) {
        std::ostringstream msg;
        msg << "perturbVariation: co-varied base values must share one CDF, got range [" << *lo
            << ", " << *hi << "] for dimension " << d;
        throw ValidationError(msg.str());
    }

    // Exactly 0.5 moves down
    const double cdf = base_cdfs.front() < 0.5 ? base_cdfs.front() + 0.5 : base_cdfs.front() - 0.5;
    std::vector<double> values;
    for (const ElementaryVariation* ev : evs) {
        values.push_back(ev->inverse(cdf));
    }
    return addVariationRow(store, loc, reference_id, columns, values);
}

Eigen::MatrixXi variationsToConfigurations(VariationStore& store,
                                           const std::array<Eigen::MatrixXi, kNumLocations>& location_ids) {
    const Eigen::MatrixXi& first = location_ids.front();
    for (const auto& ids : location_ids) {
        if (ids.rows() != first.rows() || ids.cols() != first.cols()) {
            throw ValidationError("variationsToConfigurations: location id matrices differ in shape");
        }
    }
    Eigen::MatrixXi configuration_ids(first.rows(), first.cols());
    for (Eigen::Index c = 0; c < first.cols(); ++c) {
        for (Eigen::Index r = 0; r < first.rows(); ++r) {
            VariationID vid;
            for (Location loc : kAllLocations) {
                vid[loc] = location_ids[locationIndex(loc)](r, c);
            }
            configuration_ids(r, c) = store.getOrInsertConfiguration(vid);
        }
    }
    return configuration_ids;
}

MOATSampling runSensitivitySampling(const MOAT& method, int n_replicates, const ParsedVariations& pv,
                                    VariationStore& store, ExecutionBackend& backend,
                                    const VariationID& reference,
                                    const std::vector<int>& ignore_indices) {
    rejectIgnoreIndices(ignore_indices, "MOAT");
    const AddLHSVariationsResult lhs = addVariations(method.lhs_variation, store, pv, reference);
    const int n = static_cast<int>(lhs.all_variation_ids.size());
    const int d = pv.dimension();

    auto location_ids = referenceIdMatrices(reference, n, 1 + d);
    for (Location loc : pv.variedLocations()) {
        Eigen::MatrixXi& ids = location_ids[locationIndex(loc)];
        for (int i = 0; i < n; ++i) {
            const int base_id = lhs.all_variation_ids[i][loc];
            ids(i, 0) = base_id;
            for (int j = 0; j < d; ++j) {
                ids(i, 1 + j) = perturbVariation(store, loc, pv, base_id, j);
            }
        }
    }

    std::vector<std::string> header = {"base"};
    for (const auto& name : featureNames(pv)) header.push_back(name);
    MOATSampling sampling(variationsToConfigurations(store, location_ids), header, n_replicates);
    dispatchScheme(backend, sampling);
    return sampling;
}

// ---------------------------------------------------------------------------
// Sobol'

SobolSampling::SobolSampling(Eigen::MatrixXi scheme, std::vector<std::string> header, int n_replicates,
                             SobolIndexMethods index_methods)
    : GSASampling(std::move(scheme), std::move(header), n_replicates), index_methods_(index_methods) {}

void SobolSampling::calculateGSA(const ObjectiveFunction& objective, const ExecutionBackend& backend) {
    if (hasResult(objective.name)) {
        return;
    }
    const Eigen::MatrixXd vals = evaluate(objective, backend);
    const Eigen::Index n = vals.rows();
    const Eigen::Index d = vals.cols() - 2;
    const Eigen::VectorXd A = vals.col(0);
    const Eigen::VectorXd B = vals.col(1);

    const double expected_value_sq = A.cwiseProduct(B).mean();
    Eigen::VectorXd AB(2 * n);
    AB << A, B;
    const double total_variance = (AB.array() - AB.mean()).square().sum() / static_cast<double>(2 * n - 1);
    checkTotalVariance(total_variance, objective.name, "Sobol'");

    SobolResult result;
    result.first_order.resize(d);
    result.total_order.resize(d);
    for (Eigen::Index i = 0; i < d; ++i) {
        const Eigen::VectorXd ABi = vals.col(2 + i);
        double first = 0.0;
        switch (index_methods_.first_order) {
            case FirstOrderMethod::Sobol1993:
                first = B.cwiseProduct(ABi).mean() - expected_value_sq;
                break;
            case FirstOrderMethod::Jansen1999:
                first = total_variance - 0.5 * (B - ABi).squaredNorm() / static_cast<double>(n);
                break;
            case FirstOrderMethod::Saltelli2010:
                first = B.cwiseProduct(ABi - A).mean();
                break;
        }
        double total = 0.0;
        switch (index_methods_.total_order) {
            case TotalOrderMethod::Homma1996:
                total = total_variance - A.cwiseProduct(ABi).mean() + expected_value_sq;
                break;
            case TotalOrderMethod::Jansen1999:
                total = 0.5 * (ABi - A).squaredNorm() / static_cast<double>(n);
                break;
            case TotalOrderMethod::Sobol2007:
                total = A.cwiseProduct(A - ABi).mean();
                break;
        }
        result.first_order(i) = first / total_variance;
        result.total_order(i) = total / total_variance;
    }
    results_.emplace(objective.name, std::move(result));
}

bool SobolSampling::hasResult(const std::string& objective_name) const {
    return results_.count(objective_name) > 0;
}

std::vector<std::string> SobolSampling::calculatedObjectives() const {
    return mapKeys(results_);
}

std::string SobolSampling::describe() const {
    std::ostringstream out;
    out << GSASampling::describe();
    out << "Index methods: first order " << toString(index_methods_.first_order)
        << ", total order " << toString(index_methods_.total_order) << "\n";
    return out.str();
}

const SobolResult& SobolSampling::result(const std::string& objective_name) const {
    return lookupResult(results_, objective_name, "Sobol'");
}

SobolSampling runSensitivitySampling(const SobolGSA& method, int n_replicates, const ParsedVariations& pv,
                                     VariationStore& store, ExecutionBackend& backend,
                                     const VariationID& reference,
                                     const std::vector<int>& ignore_indices) {
    const int d = pv.dimension();
    for (int i : ignore_indices) {
        if (i < 0 || i >= d) {
            throw ValidationError("Sobol': ignore index " + std::to_string(i) + " out of range for " +
                                  std::to_string(d) + " features");
        }
    }
    if (method.sobol_variation.n_matrices != 2) {
        throw ValidationError("Sobol': design must have exactly 2 matrices");
    }
    std::vector<int> focus_indices;
    for (int i = 0; i < d; ++i) {
        if (std::find(ignore_indices.begin(), ignore_indices.end(), i) == ignore_indices.end()) {
            focus_indices.push_back(i);
        }
    }

    const AddSobolVariationsResult sobol = addVariations(method.sobol_variation, store, pv, reference);
    const int n = sobol.cdfs.samples();
    const Eigen::MatrixXd A = sobol.cdfs.matrix(0);
    const Eigen::MatrixXd B = sobol.cdfs.matrix(1);

    const Eigen::Index n_cols = 2 + static_cast<Eigen::Index>(focus_indices.size());
    auto location_ids = referenceIdMatrices(reference, n, n_cols);
    for (Location loc : pv.variedLocations()) {
        Eigen::MatrixXi& ids = location_ids[locationIndex(loc)];
        for (int s = 0; s < n; ++s) {
            ids(s, 0) = sobol.at(s, 0)[loc];
            ids(s, 1) = sobol.at(s, 1)[loc];
        }
        for (size_t f = 0; f < focus_indices.size(); ++f) {
            ids.col(2 + f) = ids.col(0);
        }
    }

    // A_B(i): A with column i taken from B; only locations owning i get new rows
    std::vector<std::string> header = {"A", "B"};
    const std::vector<std::string> names = featureNames(pv);
    for (size_t f = 0; f < focus_indices.size(); ++f) {
        const int i = focus_indices[f];
        header.push_back(names[i]);
        Eigen::MatrixXd ABi = A;
        ABi.col(i) = B.col(i);
        for (Location loc : pv.variedLocations()) {
            if (!pv.at(loc).ownsDimension(i)) continue;
            const std::vector<int> ids = cdfsToVariationIds(store, loc, pv, reference[loc], ABi);
            for (int s = 0; s < n; ++s) {
                location_ids[locationIndex(loc)](s, 2 + static_cast<Eigen::Index>(f)) = ids[s];
            }
        }
    }

    SobolSampling sampling(variationsToConfigurations(store, location_ids), header, n_replicates,
                           method.index_methods);
    dispatchScheme(backend, sampling);
    return sampling;
}

// ---------------------------------------------------------------------------
// RBD

RBDSampling::RBDSampling(Eigen::MatrixXi scheme, std::vector<std::string> header, int n_replicates,
                         int num_harmonics, bool half_period)
    : GSASampling(std::move(scheme), std::move(header), n_replicates),
      num_harmonics_(num_harmonics), half_period_(half_period) {}

void RBDSampling::calculateGSA(const ObjectiveFunction& objective, const ExecutionBackend& backend) {
    if (hasResult(objective.name)) {
        return;
    }
    const Eigen::MatrixXd ordered = evaluate(objective, backend);
    const Eigen::Index n = ordered.rows();
    const Eigen::Index d = ordered.cols();

    // Half-period designs are mirror-extended with the reversed interior so the
    // signal is periodic
    const Eigen::Index n_mirror = (half_period_ && n > 2) ? n - 2 : 0;
    const Eigen::Index N = n + n_mirror;

    Eigen::FFT<double> fft;
    Eigen::VectorXd indices(d);
    for (Eigen::Index j = 0; j < d; ++j) {
        std::vector<double> signal(static_cast<size_t>(N));
        for (Eigen::Index r = 0; r < n; ++r) signal[r] = ordered(r, j);
        for (Eigen::Index m = 0; m < n_mirror; ++m) signal[n + m] = ordered(n - 2 - m, j);

        std::vector<std::complex<double>> spectrum;
        fft.fwd(spectrum, signal);

        double V = 0.0;
        double Vi = 0.0;
        const Eigen::Index harmonics = std::min<Eigen::Index>(N - 1, num_harmonics_);
        for (Eigen::Index k = 1; k < N; ++k) {
            const double power = std::norm(spectrum[k]) / static_cast<double>(N);
            V += power;
            if (k <= harmonics) Vi += power;
        }
        checkTotalVariance(V, objective.name, "RBD");
        indices(j) = 2.0 * Vi / V;
    }
    results_.emplace(objective.name, std::move(indices));
}

bool RBDSampling::hasResult(const std::string& objective_name) const {
    return results_.count(objective_name) > 0;
}

std::vector<std::string> RBDSampling::calculatedObjectives() const {
    return mapKeys(results_);
}

std::string RBDSampling::describe() const {
    std::ostringstream out;
    out << GSASampling::describe();
    out << "Number of harmonics: " << num_harmonics_ << "\n";
    out << "Number of cycles (1/2 or 1): " << (half_period_ ? "1/2" : "1") << "\n";
    return out.str();
}

const Eigen::VectorXd& RBDSampling::result(const std::string& objective_name) const {
    return lookupResult(results_, objective_name, "RBD");
}

RBDSampling runSensitivitySampling(const RBD& method, int n_replicates, const ParsedVariations& pv,
                                   VariationStore& store, ExecutionBackend& backend,
                                   const VariationID& reference,
                                   const std::vector<int>& ignore_indices) {
    rejectIgnoreIndices(ignore_indices, "RBD");
    const AddRBDVariationsResult rbd = addVariations(method.rbd_variation, store, pv, reference);
    RBDSampling sampling(variationsToConfigurations(store, rbd.location_variation_ids), featureNames(pv),
                         n_replicates, method.num_harmonics, method.rbd_variation.half_period);
    dispatchScheme(backend, sampling);
    return sampling;
}

// ---------------------------------------------------------------------------
// Scheme artifact

std::string schemeFilename(const GSASampling& sampling, const std::string& directory) {
    return (std::filesystem::path(directory) / (sampling.method() + "_scheme.h5")).string();
}

void recordSensitivityScheme(const GSASampling& sampling, const std::string& filename) {
    HighFive::File file(filename, HighFive::File::Overwrite);

    const Eigen::MatrixXi& scheme = sampling.scheme();
    std::vector<std::vector<int>> rows(static_cast<size_t>(scheme.rows()),
                                       std::vector<int>(static_cast<size_t>(scheme.cols())));
    for (Eigen::Index r = 0; r < scheme.rows(); ++r) {
        for (Eigen::Index c = 0; c < scheme.cols(); ++c) {
            rows[r][c] = scheme(r, c);
        }
    }

    H5Easy::dump(file, "/method", sampling.method());
    H5Easy::dump(file, "/header", sampling.header());
    H5Easy::dump(file, "/n_replicates", sampling.nReplicates());
    H5Easy::dump(file, "/configuration_ids", rows);
}

std::string sensitivityResults(GSASampling& sampling, const std::vector<ObjectiveFunction>& objectives,
                               const ExecutionBackend& backend, const std::string& directory) {
    for (const auto& objective : objectives) {
        sampling.calculateGSA(objective, backend);
    }
    const std::string path = schemeFilename(sampling, directory);
    recordSensitivityScheme(sampling, path);
    return path;
}
