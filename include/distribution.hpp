#pragma once

#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/uniform.hpp>

#include <limits>
#include <string>

// Continuous distribution backing a Distributed variation
class Distribution {
public:
    virtual ~Distribution() = default;

    virtual double cdf(double x) const = 0;
    // Inverse CDF for p in [0,1]
    virtual double quantile(double p) const = 0;
    virtual std::string describe() const = 0;
};

class UniformDistribution : public Distribution {
public:
    UniformDistribution(double lb, double ub);

    double cdf(double x) const override;
    double quantile(double p) const override;
    std::string describe() const override;

private:
    double lb_;
    double ub_;
    boost::math::uniform dist_;
};

// Normal distribution, truncated to [lb, ub] when either bound is finite.
// quantile(0) and quantile(1) return the bounds, so an unbounded side yields
// +-inf. Sobol designs that start at the origin or include the point 1 hit
// those probabilities; bound the distribution when using them.
class NormalDistribution : public Distribution {
public:
    NormalDistribution(double mu, double sigma,
                       double lb = -std::numeric_limits<double>::infinity(),
                       double ub = std::numeric_limits<double>::infinity());

    double cdf(double x) const override;
    double quantile(double p) const override;
    bool truncated() const;
    std::string describe() const override;

private:
    double mu_;
    double sigma_;
    double lb_;
    double ub_;
    boost::math::normal dist_;
    double cdf_lb_;  // untruncated CDF at the bounds
    double cdf_ub_;
};
