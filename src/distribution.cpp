#include "distribution.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

void checkProbability(double p, const char* context) {
    if (std::isnan(p) || p < 0.0 || p > 1.0) {
        std::ostringstream msg;
        msg << context << ": probability must be in [0, 1], got " << p;
        throw ValidationError(msg.str());
    }
}

}  // namespace

UniformDistribution::UniformDistribution(double lb, double ub)
    : lb_(lb), ub_(ub), dist_(std::isfinite(lb) && std::isfinite(ub) && lb < ub ? lb : 0.0,
                              std::isfinite(lb) && std::isfinite(ub) && lb < ub ? ub : 1.0) {
    if (!std::isfinite(lb) || !std::isfinite(ub) || !(lb < ub)) {
        std::ostringstream msg;
        msg << "UniformDistribution: need finite lb < ub, got [" << lb << ", " << ub << "]";
        throw ValidationError(msg.str());
    }
}

double UniformDistribution::cdf(double x) const {
    if (std::isnan(x)) {
        throw ValidationError("UniformDistribution::cdf: NaN argument");
    }
    if (x <= lb_) return 0.0;
    if (x >= ub_) return 1.0;
    return boost::math::cdf(dist_, x);
}

double UniformDistribution::quantile(double p) const {
    checkProbability(p, "UniformDistribution::quantile");
    return boost::math::quantile(dist_, p);
}

std::string UniformDistribution::describe() const {
    std::ostringstream out;
    out << "Uniform(" << lb_ << ", " << ub_ << ")";
    return out.str();
}

NormalDistribution::NormalDistribution(double mu, double sigma, double lb, double ub)
    : mu_(mu), sigma_(sigma), lb_(lb), ub_(ub),
      dist_(mu, (std::isfinite(sigma) && sigma > 0.0) ? sigma : 1.0),
      cdf_lb_(0.0), cdf_ub_(1.0) {
    if (!std::isfinite(mu) || !std::isfinite(sigma) || sigma <= 0.0) {
        std::ostringstream msg;
        msg << "NormalDistribution: need finite mu and sigma > 0, got mu=" << mu
            << ", sigma=" << sigma;
        throw ValidationError(msg.str());
    }
    if (std::isnan(lb) || std::isnan(ub) || !(lb < ub)) {
        std::ostringstream msg;
        msg << "NormalDistribution: truncation bounds need lb < ub, got [" << lb << ", " << ub << "]";
        throw ValidationError(msg.str());
    }
    cdf_lb_ = boost::math::cdf(dist_, lb);
    cdf_ub_ = boost::math::cdf(dist_, ub);
    if (!(cdf_ub_ > cdf_lb_)) {
        throw ValidationError("NormalDistribution: truncation interval carries no probability mass");
    }
}

bool NormalDistribution::truncated() const {
    return std::isfinite(lb_) || std::isfinite(ub_);
}

double NormalDistribution::cdf(double x) const {
    if (std::isnan(x)) {
        throw ValidationError("NormalDistribution::cdf: NaN argument");
    }
    if (x <= lb_) return 0.0;
    if (x >= ub_) return 1.0;
    const double c = (boost::math::cdf(dist_, x) - cdf_lb_) / (cdf_ub_ - cdf_lb_);
    return std::clamp(c, 0.0, 1.0);
}

double NormalDistribution::quantile(double p) const {
    checkProbability(p, "NormalDistribution::quantile");
    // Boundary probabilities map onto the support bounds, which are infinite when untruncated
    if (p == 0.0) return lb_;
    if (p == 1.0) return ub_;
    const double q = cdf_lb_ + p * (cdf_ub_ - cdf_lb_);
    if (q <= 0.0) return lb_;
    if (q >= 1.0) return ub_;
    return std::clamp(boost::math::quantile(dist_, q), lb_, ub_);
}

std::string NormalDistribution::describe() const {
    std::ostringstream out;
    out << "Normal(" << mu_ << ", " << sigma_ << ")";
    if (truncated()) {
        out << " truncated to [" << lb_ << ", " << ub_ << "]";
    }
    if (!std::isfinite(lb_) || !std::isfinite(ub_)) {
        out << " (unbounded: CDF 0 or 1 maps to an infinite value)";
    }
    return out.str();
}
