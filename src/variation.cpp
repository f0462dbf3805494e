#include "variation.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

void checkCdf(double cdf, const std::string& column) {
    if (std::isnan(cdf) || cdf < 0.0 || cdf > 1.0) {
        std::ostringstream msg;
        msg << "Variation '" << column << "': CDF must be in [0, 1], got " << cdf;
        throw ValidationError(msg.str());
    }
}

}  // namespace

ElementaryVariation::ElementaryVariation(TargetPath target, VariationKind kind)
    : target_(std::move(target)), kind_(kind) {}

ElementaryVariation ElementaryVariation::discrete(TargetPath target, std::vector<double> values) {
    if (values.empty()) {
        throw ValidationError("Discrete variation '" + target.columnName() +
                              "': value list must not be empty");
    }
    ElementaryVariation ev(std::move(target), VariationKind::Discrete);
    ev.values_ = std::move(values);
    return ev;
}

ElementaryVariation ElementaryVariation::distributed(TargetPath target,
                                                     std::shared_ptr<const Distribution> distribution,
                                                     bool flip) {
    if (!distribution) {
        throw ValidationError("Distributed variation '" + target.columnName() +
                              "': distribution must not be null");
    }
    ElementaryVariation ev(std::move(target), VariationKind::Distributed);
    ev.distribution_ = std::move(distribution);
    ev.flip_ = flip;
    return ev;
}

int ElementaryVariation::size() const {
    return isDiscrete() ? static_cast<int>(values_.size()) : -1;
}

const std::vector<double>& ElementaryVariation::values() const {
    if (!isDiscrete()) {
        throw std::logic_error("Variation '" + columnName() + "' is distributed and has no value list");
    }
    return values_;
}

const Distribution& ElementaryVariation::distribution() const {
    if (isDiscrete()) {
        throw std::logic_error("Variation '" + columnName() + "' is discrete and has no distribution");
    }
    return *distribution_;
}

double ElementaryVariation::cdf(double value) const {
    if (!isDiscrete()) {
        const double c = distribution_->cdf(value);
        return flip_ ? 1.0 - c : c;
    }
    auto it = std::find(values_.begin(), values_.end(), value);
    if (it == values_.end()) {
        std::ostringstream msg;
        msg << "Discrete variation '" << columnName() << "': value " << value << " is not a member";
        throw ValidationError(msg.str());
    }
    // A single value sits at the bottom of the CDF range
    if (values_.size() == 1) {
        return 0.0;
    }
    return static_cast<double>(it - values_.begin()) / static_cast<double>(values_.size() - 1);
}

double ElementaryVariation::inverse(double cdf) const {
    checkCdf(cdf, columnName());
    if (!isDiscrete()) {
        return distribution_->quantile(flip_ ? 1.0 - cdf : cdf);
    }
    const long n = static_cast<long>(values_.size());
    const long index = std::clamp(static_cast<long>(std::floor(cdf * static_cast<double>(n))), 0L, n - 1);
    return values_[static_cast<size_t>(index)];
}

std::vector<double> ElementaryVariation::inverse(const std::vector<double>& cdfs) const {
    std::vector<double> out;
    out.reserve(cdfs.size());
    for (double c : cdfs) {
        out.push_back(inverse(c));
    }
    return out;
}

std::string ElementaryVariation::describe() const {
    std::ostringstream out;
    out << (isDiscrete() ? "DiscreteVariation" : "DistributedVariation")
        << " (" << locationName(location()) << "): " << columnName() << "\n";
    if (isDiscrete()) {
        out << "  values: [";
        for (size_t i = 0; i < values_.size(); ++i) {
            out << (i > 0 ? ", " : "") << values_[i];
        }
        out << "]\n";
    } else {
        out << "  distribution: " << distribution_->describe() << "\n";
        if (flip_) {
            out << "  flipped: cdf(x) = 1 - F(x)\n";
        }
    }
    return out.str();
}

ElementaryVariation discreteVariation(const std::string& target, std::vector<double> values) {
    return ElementaryVariation::discrete(TargetPath::parse(target), std::move(values));
}

ElementaryVariation uniformVariation(const std::string& target, double lb, double ub, bool flip) {
    return ElementaryVariation::distributed(TargetPath::parse(target),
                                            std::make_shared<UniformDistribution>(lb, ub), flip);
}

ElementaryVariation normalVariation(const std::string& target, double mu, double sigma, bool flip,
                                    double lb, double ub) {
    return ElementaryVariation::distributed(TargetPath::parse(target),
                                            std::make_shared<NormalDistribution>(mu, sigma, lb, ub), flip);
}

CoVariation::CoVariation(ElementaryVariation variation) {
    members_.push_back(std::move(variation));
}

CoVariation::CoVariation(std::vector<ElementaryVariation> members) : members_(std::move(members)) {
    if (members_.empty()) {
        throw ValidationError("CoVariation: must have at least one member");
    }
    const ElementaryVariation& first = members_.front();
    for (const auto& ev : members_) {
        if (ev.kind() != first.kind()) {
            throw ValidationError("CoVariation: cannot mix discrete and distributed members ('" +
                                  first.columnName() + "' vs '" + ev.columnName() + "')");
        }
        if (ev.isDiscrete() && ev.size() != first.size()) {
            throw ValidationError("CoVariation: discrete members must have equal length ('" +
                                  first.columnName() + "' has " + std::to_string(first.size()) +
                                  ", '" + ev.columnName() + "' has " + std::to_string(ev.size()) + ")");
        }
    }
}

std::string CoVariation::columnName() const {
    std::string name;
    for (size_t i = 0; i < members_.size(); ++i) {
        if (i > 0) name += " AND ";
        name += members_[i].columnName();
    }
    return name;
}

std::vector<double> CoVariation::inverse(double cdf) const {
    std::vector<double> out;
    out.reserve(members_.size());
    for (const auto& ev : members_) {
        out.push_back(ev.inverse(cdf));
    }
    return out;
}

std::string CoVariation::describe() const {
    if (members_.size() == 1) {
        return members_.front().describe();
    }
    std::ostringstream out;
    out << "CoVariation (" << (kind() == VariationKind::Discrete ? "discrete" : "distributed")
        << ", " << members_.size() << " members):\n";
    for (const auto& ev : members_) {
        out << "  " << ev.describe();
    }
    return out.str();
}
