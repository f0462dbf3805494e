#include "design.hpp"

#include "errors.hpp"
#include "sampling.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace {

bool isPow2(long long x) {
    return x > 0 && (x & (x - 1)) == 0;
}

int floorLog2(long long x) {
    int r = 0;
    while (x > 1) {
        x >>= 1;
        ++r;
    }
    return r;
}

// k^d, or -1 when it exceeds limit
long long intPow(long long k, int d, long long limit) {
    long long r = 1;
    for (int i = 0; i < d; ++i) {
        r *= k;
        if (r > limit) return -1;
    }
    return r;
}

void checkPositive(int value, const char* what, const char* context) {
    if (value < 1) {
        throw ValidationError(std::string(context) + ": " + what + " must be >= 1, got " +
                              std::to_string(value));
    }
}

// Stable permutation ordering the entries of a column ascending
std::vector<int> sortPermutation(const Eigen::VectorXd& column) {
    std::vector<int> order(static_cast<size_t>(column.size()));
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&column](int a, int b) { return column(a) < column(b); });
    return order;
}

std::vector<int> randomPermutation(int n, Rng& rng) {
    std::vector<int> perm(static_cast<size_t>(n));
    std::iota(perm.begin(), perm.end(), 0);
    std::shuffle(perm.begin(), perm.end(), rng);
    return perm;
}

}  // namespace

LHSVariation::LHSVariation(int n_, Rng& rng_, bool add_noise_, bool orthogonalize_)
    : n(n_), rng(&rng_), add_noise(add_noise_), orthogonalize(orthogonalize_) {
    checkPositive(n, "n", "LHSVariation");
}

SobolVariation::SobolVariation(int n_, int n_matrices_, SobolRandomization randomization_,
                               SkipStart skip_start_, IncludeOne include_one_, Rng* rng_)
    : n(n_), n_matrices(n_matrices_), randomization(randomization_),
      skip_start(skip_start_), include_one(include_one_), rng(rng_) {
    checkPositive(n, "n", "SobolVariation");
    checkPositive(n_matrices, "n_matrices", "SobolVariation");
    if (randomization != SobolRandomization::None && rng == nullptr) {
        throw ValidationError("SobolVariation: randomization requires an rng");
    }
    if (skip_start.mode == SkipStart::Mode::Count && skip_start.count < 0) {
        throw ValidationError("SobolVariation: skip_start count must be >= 0");
    }
}

RBDVariation::RBDVariation(int n_, Rng& rng_, bool use_sobol_, std::optional<int> pow2_diff_,
                           std::optional<double> num_cycles_)
    : n(n_), rng(&rng_), use_sobol(use_sobol_), pow2_diff(0), half_period(use_sobol_) {
    checkPositive(n, "n", "RBDVariation");
    if (use_sobol) {
        const long k = std::lround(std::log2(static_cast<double>(n)));
        const int diff = n - (1 << k);
        if (pow2_diff_ && *pow2_diff_ != diff) {
            throw ValidationError("RBDVariation: pow2_diff must be n - 2^k = " + std::to_string(diff) +
                                  ", got " + std::to_string(*pow2_diff_));
        }
        if (std::abs(diff) > 1) {
            throw ValidationError("RBDVariation: n must be within 1 of a power of 2 when using Sobol, got " +
                                  std::to_string(n));
        }
        if (num_cycles_ && *num_cycles_ != 0.5) {
            throw ValidationError("RBDVariation: num_cycles must be 1/2 when using Sobol");
        }
        pow2_diff = diff;
    } else if (num_cycles_ && *num_cycles_ != 1.0) {
        throw ValidationError("RBDVariation: num_cycles must be 1 with a random design");
    }
}

CdfCube::CdfCube(int dims, int matrices, int samples)
    : dims_(dims), matrices_(matrices), samples_(samples),
      data_(static_cast<size_t>(dims) * matrices * samples, 0.0) {}

double& CdfCube::operator()(int dim, int matrix, int sample) {
    return data_[(static_cast<size_t>(sample) * matrices_ + matrix) * dims_ + dim];
}

double CdfCube::operator()(int dim, int matrix, int sample) const {
    return data_[(static_cast<size_t>(sample) * matrices_ + matrix) * dims_ + dim];
}

Eigen::MatrixXd CdfCube::matrix(int m) const {
    Eigen::MatrixXd out(samples_, dims_);
    for (int s = 0; s < samples_; ++s) {
        for (int d = 0; d < dims_; ++d) {
            out(s, d) = (*this)(d, m, s);
        }
    }
    return out;
}

Eigen::MatrixXd CdfCube::stacked() const {
    Eigen::MatrixXd out(samples_ * matrices_, dims_);
    for (int s = 0; s < samples_; ++s) {
        for (int m = 0; m < matrices_; ++m) {
            for (int d = 0; d < dims_; ++d) {
                out(s * matrices_ + m, d) = (*this)(d, m, s);
            }
        }
    }
    return out;
}

SobolSubsequence resolveSobolSubsequence(int n, SkipStart skip_start, IncludeOne include_one) {
    checkPositive(n, "n", "resolveSobolSubsequence");
    SobolSubsequence sub;
    sub.include_one = (include_one == IncludeOne::Yes);

    if (skip_start.mode == SkipStart::Mode::Auto) {
        if (isPow2(static_cast<long long>(n) + 1)) {
            skip_start = SkipStart::points(1);
        } else {
            skip_start = SkipStart::none();
            if (isPow2(static_cast<long long>(n) - 1) && include_one == IncludeOne::Auto) {
                sub.include_one = true;
            }
        }
    }

    sub.n_draws = n - (sub.include_one ? 1 : 0);
    switch (skip_start.mode) {
        case SkipStart::Mode::None:
            sub.skip = 0;
            break;
        case SkipStart::Mode::ToDenominator:
            sub.skip = sub.n_draws <= 1 ? 1 : (1 << (floorLog2(sub.n_draws - 1) + 1));
            break;
        case SkipStart::Mode::Count:
            sub.skip = skip_start.count;
            break;
        case SkipStart::Mode::Auto:
            break;
    }
    return sub;
}

Eigen::MatrixXi orthogonalLHS(int k, int d, Rng& rng) {
    checkPositive(k, "k", "orthogonalLHS");
    checkPositive(d, "d", "orthogonalLHS");
    const long long n_ll = intPow(k, d, 1LL << 30);
    if (n_ll < 0) {
        throw ValidationError("orthogonalLHS: k^d is too large");
    }
    const int n = static_cast<int>(n_ll);
    const int box = n / k;  // points per 1-D box at resolution k

    Eigen::MatrixXi inds = Eigen::MatrixXi::Zero(n, d);
    for (int i = 0; i < d; ++i) {
        if (i == 0) {
            for (int r = 0; r < n; ++r) inds(r, 0) = r;
        } else {
            // A bin groups points sharing the same box in dimensions 0..i-1; the
            // sort below keeps each bin's rows contiguous
            const int n_bins = static_cast<int>(intPow(k, i, n_ll));
            const int bin_size = n / n_bins;
            std::vector<std::vector<int>> bins(static_cast<size_t>(n_bins));
            for (int j = 0; j < n_bins; ++j) {
                for (int r = 0; r < bin_size; ++r) {
                    bins[j].push_back(j * bin_size + r);
                }
            }
            for (int pt = 0; pt < bin_size; ++pt) {
                std::vector<int> picked(static_cast<size_t>(n_bins));
                for (int j = 0; j < n_bins; ++j) {
                    auto& bin = bins[j];
                    std::uniform_int_distribution<size_t> pick(0, bin.size() - 1);
                    const size_t at = pick(rng);
                    picked[j] = bin[at];
                    bin.erase(bin.begin() + static_cast<std::ptrdiff_t>(at));
                }
                const std::vector<int> perm = randomPermutation(n_bins, rng);
                for (int j = 0; j < n_bins; ++j) {
                    inds(picked[j], i) = perm[j] + pt * n_bins;
                }
            }
        }

        std::vector<int> order(static_cast<size_t>(n));
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
            for (int c = 0; c <= i; ++c) {
                const int ba = inds(a, c) / box;
                const int bb = inds(b, c) / box;
                if (ba != bb) return ba < bb;
            }
            return false;
        });
        Eigen::MatrixXi sorted(n, d);
        for (int r = 0; r < n; ++r) {
            sorted.row(r) = inds.row(order[r]);
        }
        inds = sorted;
    }
    return inds;
}

Eigen::MatrixXd generateLHSCDFs(int n, int d, Rng& rng, bool add_noise, bool orthogonalize) {
    checkPositive(n, "n", "generateLHSCDFs");
    checkPositive(d, "d", "generateLHSCDFs");

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::vector<double> base(static_cast<size_t>(n));
    for (int j = 0; j < n; ++j) {
        const double offset = add_noise ? unit(rng) : 0.5;
        base[j] = (static_cast<double>(j + 1) - offset) / n;
    }

    const int k = static_cast<int>(std::lround(std::pow(static_cast<double>(n), 1.0 / d)));
    Eigen::MatrixXi inds;
    if (orthogonalize && intPow(k, d, n) == n) {
        inds = orthogonalLHS(k, d, rng);
    } else {
        inds.resize(n, d);
        for (int c = 0; c < d; ++c) {
            const std::vector<int> perm = randomPermutation(n, rng);
            for (int r = 0; r < n; ++r) inds(r, c) = perm[r];
        }
    }

    Eigen::MatrixXd cdfs(n, d);
    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < d; ++c) {
            cdfs(r, c) = base[inds(r, c)];
        }
    }
    return cdfs;
}

Eigen::MatrixXd generateLHSCDFs(const LHSVariation& lhs, int d) {
    return generateLHSCDFs(lhs.n, d, *lhs.rng, lhs.add_noise, lhs.orthogonalize);
}

CdfCube generateSobolCDFs(int n, int d, int n_matrices, SobolRandomization randomization,
                          SkipStart skip_start, IncludeOne include_one, Rng* rng) {
    checkPositive(d, "d", "generateSobolCDFs");
    checkPositive(n_matrices, "n_matrices", "generateSobolCDFs");
    if (randomization != SobolRandomization::None && rng == nullptr) {
        throw ValidationError("generateSobolCDFs: randomization requires an rng");
    }
    const SobolSubsequence sub = resolveSobolSubsequence(n, skip_start, include_one);
    const size_t total_dims = static_cast<size_t>(d) * n_matrices;

    SobolSequence seq(total_dims);
    seq.skip(static_cast<size_t>(sub.skip));

    std::vector<uint32_t> digital_shift(total_dims, 0);
    std::vector<double> shift(total_dims, 0.0);
    if (randomization == SobolRandomization::DigitalShift) {
        std::uniform_int_distribution<uint32_t> word;
        for (auto& w : digital_shift) w = word(*rng);
    } else if (randomization == SobolRandomization::Shift) {
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        for (auto& u : shift) u = unit(*rng);
    }

    // Row r of the d * n_matrices sequence feeds dimension r % d of matrix r / d
    CdfCube cube(d, n_matrices, n);
    for (int s = 0; s < sub.n_draws; ++s) {
        const std::vector<uint32_t> bits = seq.nextBits();
        for (size_t r = 0; r < total_dims; ++r) {
            double x = SobolSequence::toUnit(bits[r] ^ digital_shift[r]);
            if (randomization == SobolRandomization::Shift) {
                x += shift[r];
                x -= std::floor(x);
            }
            cube(static_cast<int>(r % d), static_cast<int>(r / d), s) = x;
        }
    }
    if (sub.include_one) {
        for (int m = 0; m < n_matrices; ++m) {
            for (int c = 0; c < d; ++c) {
                cube(c, m, n - 1) = 1.0;
            }
        }
    }
    return cube;
}

CdfCube generateSobolCDFs(const SobolVariation& sobol, int d) {
    return generateSobolCDFs(sobol.n, d, sobol.n_matrices, sobol.randomization,
                             sobol.skip_start, sobol.include_one, sobol.rng);
}

RBDCDFs generateRBDCDFs(const RBDVariation& rbd, int d) {
    checkPositive(d, "d", "generateRBDCDFs");
    const int n = rbd.n;
    RBDCDFs out;
    out.cdfs.resize(n, d);
    out.sorting.resize(n, d);

    if (rbd.use_sobol) {
        if (n == 1) {
            out.cdfs.setConstant(0.5);
            out.sorting.setZero();
            return out;
        }
        SkipStart skip = SkipStart::none();
        if (rbd.pow2_diff == -1) {
            skip = SkipStart::points(1);
        } else if (rbd.pow2_diff == 0) {
            skip = SkipStart::toDenominator();
        }
        const IncludeOne include_one = rbd.pow2_diff == 1 ? IncludeOne::Yes : IncludeOne::No;
        out.cdfs = generateSobolCDFs(n, d, 1, SobolRandomization::None, skip, include_one).matrix(0);
        for (int c = 0; c < d; ++c) {
            const std::vector<int> order = sortPermutation(out.cdfs.col(c));
            for (int r = 0; r < n; ++r) out.sorting(r, c) = order[r];
        }
        return out;
    }

    // Evenly spaced angles on [-pi, pi), each dimension independently permuted
    Eigen::MatrixXd angles(n, d);
    for (int c = 0; c < d; ++c) {
        const std::vector<int> perm = randomPermutation(n, *rbd.rng);
        for (int r = 0; r < n; ++r) {
            angles(r, c) = -M_PI + 2.0 * M_PI * static_cast<double>(perm[r]) / n;
        }
    }
    for (int c = 0; c < d; ++c) {
        for (int r = 0; r < n; ++r) {
            out.cdfs(r, c) = std::clamp(0.5 + std::asin(std::sin(angles(r, c))) / M_PI, 0.0, 1.0);
        }
        const std::vector<int> order = sortPermutation(angles.col(c));
        for (int r = 0; r < n; ++r) out.sorting(r, c) = order[r];
    }
    return out;
}
