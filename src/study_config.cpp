#include "study_config.hpp"

#include "add_variations.hpp"
#include "errors.hpp"
#include "parse_utils.hpp"

#include <limits>
#include <map>
#include <sstream>

namespace {

double requireParam(const VariationConfigEntry& entry, const std::string& key) {
    auto it = entry.params.find(key);
    if (it == entry.params.end()) {
        throw ValidationError("variation '" + entry.target + "' (line " + std::to_string(entry.line) +
                              ") with distribution '" + entry.distribution + "' requires '" + key + "'");
    }
    return it->second;
}

double optionalParam(const VariationConfigEntry& entry, const std::string& key, double default_val) {
    auto it = entry.params.find(key);
    return it == entry.params.end() ? default_val : it->second;
}

ElementaryVariation buildVariation(const VariationConfigEntry& entry) {
    if (entry.distribution.empty()) {
        return discreteVariation(entry.target, entry.values);
    }
    if (entry.distribution == "uniform") {
        for (const auto& [key, value] : entry.params) {
            (void)value;
            if (key != "lb" && key != "ub") {
                throw ValidationError("variation '" + entry.target + "' (line " + std::to_string(entry.line) +
                                      "): uniform distribution does not take '" + key + "'");
            }
        }
        return uniformVariation(entry.target, requireParam(entry, "lb"), requireParam(entry, "ub"), entry.flip);
    }
    const double inf = std::numeric_limits<double>::infinity();
    return normalVariation(entry.target, requireParam(entry, "mu"), requireParam(entry, "sigma"), entry.flip,
                           optionalParam(entry, "lb", -inf), optionalParam(entry, "ub", inf));
}

// Variations sharing a group name form one CoVariation placed where the first
// member appears
std::vector<CoVariation> buildCoVariations(const std::vector<VariationConfigEntry>& entries) {
    std::vector<std::vector<ElementaryVariation>> dims;
    std::map<std::string, size_t> group_dim;
    for (const auto& entry : entries) {
        ElementaryVariation ev = buildVariation(entry);
        if (entry.group.empty()) {
            dims.push_back({std::move(ev)});
            continue;
        }
        auto it = group_dim.find(entry.group);
        if (it == group_dim.end()) {
            group_dim.emplace(entry.group, dims.size());
            dims.push_back({std::move(ev)});
        } else {
            dims[it->second].push_back(std::move(ev));
        }
    }
    std::vector<CoVariation> variations;
    variations.reserve(dims.size());
    for (auto& members : dims) {
        variations.emplace_back(std::move(members));
    }
    return variations;
}

SkipStart parseSkipStart(const std::string& raw) {
    const std::string value = parseutil::lowerCopy(parseutil::trimCopy(raw));
    if (value == "auto") return SkipStart::automatic();
    if (value == "true") return SkipStart::toDenominator();
    if (value == "false") return SkipStart::none();
    const int k = parseutil::parseIntStrict(value, "skip_start");
    if (k < 0) {
        throw ValidationError("skip_start must be auto, true, false or a non-negative integer (got '" + raw + "')");
    }
    return SkipStart::points(k);
}

IncludeOne parseIncludeOne(const std::string& raw) {
    const std::string value = parseutil::lowerCopy(parseutil::trimCopy(raw));
    if (value == "auto") return IncludeOne::Auto;
    if (value == "true") return IncludeOne::Yes;
    if (value == "false") return IncludeOne::No;
    throw ValidationError("include_one must be auto, true or false (got '" + raw + "')");
}

SobolRandomization parseRandomization(const std::string& raw) {
    const std::string value = parseutil::lowerCopy(parseutil::trimCopy(raw));
    if (value == "none") return SobolRandomization::None;
    if (value == "shift") return SobolRandomization::Shift;
    if (value == "digital_shift") return SobolRandomization::DigitalShift;
    throw ValidationError("randomization must be none, shift or digital_shift (got '" + raw + "')");
}

std::string toString(SobolRandomization randomization) {
    switch (randomization) {
        case SobolRandomization::None: return "none";
        case SobolRandomization::Shift: return "shift";
        case SobolRandomization::DigitalShift: return "digital_shift";
    }
    return "unknown";
}

}  // namespace

StudyMethod parseStudyMethod(const std::string& name) {
    const std::string value = parseutil::lowerCopy(parseutil::trimCopy(name));
    if (value == "grid") return StudyMethod::Grid;
    if (value == "lhs") return StudyMethod::LHS;
    if (value == "sobol") return StudyMethod::Sobol;
    if (value == "rbd") return StudyMethod::RBD;
    if (value == "moat") return StudyMethod::MOAT;
    if (value == "sobol_gsa") return StudyMethod::SobolGSA;
    if (value == "rbd_gsa") return StudyMethod::RBDGSA;
    throw ValidationError("method must be grid, lhs, sobol, rbd, moat, sobol_gsa or rbd_gsa (got '" +
                          name + "')");
}

std::string toString(StudyMethod method) {
    switch (method) {
        case StudyMethod::Grid: return "grid";
        case StudyMethod::LHS: return "lhs";
        case StudyMethod::Sobol: return "sobol";
        case StudyMethod::RBD: return "rbd";
        case StudyMethod::MOAT: return "moat";
        case StudyMethod::SobolGSA: return "sobol_gsa";
        case StudyMethod::RBDGSA: return "rbd_gsa";
    }
    return "unknown";
}

bool isSensitivityMethod(StudyMethod method) {
    return method == StudyMethod::MOAT || method == StudyMethod::SobolGSA || method == StudyMethod::RBDGSA;
}

StudyConfig StudyConfig::fromConfig(const Config& cfg) {
    StudyConfig study;
    study.method = parseStudyMethod(cfg.getString("method"));

    if (cfg.getVariationEntries().empty()) {
        throw ValidationError("Config must define at least one [[variation]] section");
    }
    study.variations = buildCoVariations(cfg.getVariationEntries());
    for (const auto& entry : cfg.getBaseEntries()) {
        study.base_values.emplace_back(TargetPath::parse(entry.target), entry.value);
    }

    study.n_points = cfg.getInt("n_points", study.n_points);
    study.n_replicates = cfg.getInt("n_replicates", study.n_replicates);
    const int seed = cfg.getInt("seed", 0);
    if (seed < 0) {
        throw ValidationError("seed must be non-negative (got " + std::to_string(seed) + ")");
    }
    study.seed = static_cast<std::uint64_t>(seed);
    if (study.n_points < 1) {
        throw ValidationError("n_points must be >= 1 (got " + std::to_string(study.n_points) + ")");
    }
    if (study.n_replicates < 1) {
        throw ValidationError("n_replicates must be >= 1 (got " + std::to_string(study.n_replicates) + ")");
    }

    study.add_noise = cfg.getBool("add_noise", study.add_noise);
    study.orthogonalize = cfg.getBool("orthogonalize", study.orthogonalize);

    study.n_matrices = cfg.getInt("n_matrices", study.n_matrices);
    study.skip_start = parseSkipStart(cfg.getString("skip_start", "auto"));
    study.include_one = parseIncludeOne(cfg.getString("include_one", "auto"));
    study.randomization = parseRandomization(cfg.getString("randomization", "none"));

    study.index_methods.first_order = parseFirstOrderMethod(cfg.getString("first_order", "Jansen1999"));
    study.index_methods.total_order = parseTotalOrderMethod(cfg.getString("total_order", "Jansen1999"));
    study.num_harmonics = cfg.getInt("num_harmonics", study.num_harmonics);
    study.use_sobol = cfg.getBool("use_sobol", study.use_sobol);
    study.ignore_indices = cfg.getIntList("ignore_indices");
    study.replicate_policy = parseReplicatePolicy(cfg.getString("replicate_policy", "propagate"));
    return study;
}

ParsedVariations StudyConfig::parsedVariations() const {
    return ParsedVariations(variations);
}

std::unique_ptr<InMemoryVariationStore> StudyConfig::makeStore() const {
    auto store = std::make_unique<InMemoryVariationStore>();
    for (const auto& [target, value] : base_values) {
        store->setBaseValue(target, value);
    }
    return store;
}

std::string StudyConfig::describe() const {
    std::ostringstream out;
    out << "Study: " << toString(method) << "\n";
    out << "  points: " << n_points;
    if (isSensitivityMethod(method)) {
        out << ", replicates: " << n_replicates;
    }
    out << ", seed: " << seed << "\n";
    if (method == StudyMethod::Sobol || method == StudyMethod::SobolGSA) {
        out << "  randomization: " << toString(randomization) << "\n";
    }
    if (method == StudyMethod::SobolGSA) {
        out << "  index methods: " << toString(index_methods.first_order) << " / "
            << toString(index_methods.total_order) << "\n";
    }
    if (method == StudyMethod::RBD || method == StudyMethod::RBDGSA) {
        out << "  sobol points: " << (use_sobol ? "yes" : "no") << "\n";
    }
    out << "Dimensions (" << variations.size() << "):\n";
    for (size_t i = 0; i < variations.size(); ++i) {
        out << "[" << i << "] " << variations[i].describe();
    }
    out << "Base values: " << base_values.size() << "\n";
    return out.str();
}

std::vector<VariationID> runDesign(const StudyConfig& study, VariationStore& store, Rng& rng,
                                   const VariationID& reference) {
    const ParsedVariations pv = study.parsedVariations();
    switch (study.method) {
        case StudyMethod::Grid:
            return addVariations(GridVariation{}, store, pv, reference).all_variation_ids;
        case StudyMethod::LHS: {
            LHSVariation lhs(study.n_points, rng, study.add_noise, study.orthogonalize);
            return addVariations(lhs, store, pv, reference).all_variation_ids;
        }
        case StudyMethod::Sobol: {
            SobolVariation sobol(study.n_points, study.n_matrices, study.randomization, study.skip_start,
                                 study.include_one, &rng);
            return addVariations(sobol, store, pv, reference).all_variation_ids;
        }
        case StudyMethod::RBD: {
            RBDVariation rbd(study.n_points, rng, study.use_sobol);
            return addVariations(rbd, store, pv, reference).all_variation_ids;
        }
        default:
            throw ValidationError("runDesign: '" + toString(study.method) +
                                  "' is a sensitivity method; use runSensitivity");
    }
}

std::vector<VariationID> runDesign(const StudyConfig& study, VariationStore& store,
                                   const VariationID& reference) {
    Rng rng(study.seed);
    return runDesign(study, store, rng, reference);
}

std::unique_ptr<GSASampling> runSensitivity(const StudyConfig& study, VariationStore& store,
                                            ExecutionBackend& backend, Rng& rng,
                                            const VariationID& reference) {
    const ParsedVariations pv = study.parsedVariations();
    std::unique_ptr<GSASampling> sampling;
    switch (study.method) {
        case StudyMethod::MOAT: {
            MOAT moat(study.n_points, rng, study.add_noise, study.orthogonalize);
            sampling = std::make_unique<MOATSampling>(runSensitivitySampling(
                moat, study.n_replicates, pv, store, backend, reference, study.ignore_indices));
            break;
        }
        case StudyMethod::SobolGSA: {
            SobolGSA sobol(study.n_points, study.index_methods, study.randomization, study.skip_start,
                           study.include_one, &rng);
            sampling = std::make_unique<SobolSampling>(runSensitivitySampling(
                sobol, study.n_replicates, pv, store, backend, reference, study.ignore_indices));
            break;
        }
        case StudyMethod::RBDGSA: {
            RBD rbd(study.n_points, rng, study.num_harmonics, study.use_sobol);
            sampling = std::make_unique<RBDSampling>(runSensitivitySampling(
                rbd, study.n_replicates, pv, store, backend, reference, study.ignore_indices));
            break;
        }
        default:
            throw ValidationError("runSensitivity: '" + toString(study.method) +
                                  "' is not a sensitivity method; use runDesign");
    }
    sampling->setReplicatePolicy(study.replicate_policy);
    return sampling;
}

std::unique_ptr<GSASampling> runSensitivity(const StudyConfig& study, VariationStore& store,
                                            ExecutionBackend& backend, const VariationID& reference) {
    Rng rng(study.seed);
    return runSensitivity(study, store, backend, rng, reference);
}
