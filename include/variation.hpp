#pragma once

#include "distribution.hpp"
#include "target_path.hpp"

#include <limits>
#include <memory>
#include <string>
#include <vector>

enum class VariationKind { Discrete, Distributed };

// One varied parameter: either an enumerated value list (Discrete) or a
// continuous distribution (Distributed). Immutable once constructed.
//
// CDF coordinates are the common currency of all sampling methods:
//   Discrete:     cdf(v_i) = i/(n-1), inverse(c) = v[clamp(floor(c*n), 0, n-1)]
//   Distributed:  cdf(x) = F(x) (1 - F(x) when flipped), inverse(c) = F^-1(c or 1-c)
class ElementaryVariation {
public:
    static ElementaryVariation discrete(TargetPath target, std::vector<double> values);
    static ElementaryVariation distributed(TargetPath target,
                                           std::shared_ptr<const Distribution> distribution,
                                           bool flip = false);

    VariationKind kind() const { return kind_; }
    bool isDiscrete() const { return kind_ == VariationKind::Discrete; }

    const TargetPath& target() const { return target_; }
    Location location() const { return target_.location(); }
    std::string columnName() const { return target_.columnName(); }

    // Number of values for Discrete, -1 for Distributed
    int size() const;

    const std::vector<double>& values() const;
    const Distribution& distribution() const;
    bool flip() const { return flip_; }

    double cdf(double value) const;
    double inverse(double cdf) const;
    std::vector<double> inverse(const std::vector<double>& cdfs) const;

    std::string describe() const;

private:
    ElementaryVariation(TargetPath target, VariationKind kind);

    TargetPath target_;
    VariationKind kind_;
    std::vector<double> values_;
    std::shared_ptr<const Distribution> distribution_;
    bool flip_ = false;
};

ElementaryVariation discreteVariation(const std::string& target, std::vector<double> values);
ElementaryVariation uniformVariation(const std::string& target, double lb, double ub, bool flip = false);
ElementaryVariation normalVariation(const std::string& target, double mu, double sigma, bool flip = false,
                                    double lb = -std::numeric_limits<double>::infinity(),
                                    double ub = std::numeric_limits<double>::infinity());

// Group of elementary variations sampled from one shared CDF coordinate.
// All members are Discrete with equal length, or all Distributed.
class CoVariation {
public:
    // Singleton dimension; implicit so a bare variation can be passed where a dimension is expected
    CoVariation(ElementaryVariation variation);
    explicit CoVariation(std::vector<ElementaryVariation> members);

    const std::vector<ElementaryVariation>& members() const { return members_; }
    VariationKind kind() const { return members_.front().kind(); }
    int size() const { return members_.front().size(); }

    // Member column names joined with " AND "
    std::string columnName() const;

    // One value per member, all driven by the same CDF draw
    std::vector<double> inverse(double cdf) const;

    std::string describe() const;

private:
    std::vector<ElementaryVariation> members_;
};
