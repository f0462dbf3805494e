#pragma once

#include <Eigen/Dense>

#include <optional>
#include <random>
#include <vector>

// Explicit random number generator threaded through every sampling method
using Rng = std::mt19937_64;

// Full tensor grid over discrete dimensions
struct GridVariation {};

// Latin hypercube sample of n points
struct LHSVariation {
    int n;
    Rng* rng;
    bool add_noise;      // uniform point inside each bin instead of the bin center
    bool orthogonalize;  // orthogonal LHS when n == k^d

    LHSVariation(int n, Rng& rng, bool add_noise = false, bool orthogonalize = true);
};

enum class SobolRandomization {
    None,
    Shift,         // Cranley-Patterson rotation: x + U mod 1, one U per dimension
    DigitalShift   // XOR of the 32-bit fraction with one random word per dimension
};

// Where the drawn Sobol subsequence starts
struct SkipStart {
    enum class Mode {
        Auto,           // chosen from n, see resolveSobolSubsequence
        None,           // start at the origin
        ToDenominator,  // smallest block of points sharing one denominator that holds the draws
        Count           // skip a fixed number of points
    };
    Mode mode = Mode::Auto;
    int count = 0;

    static SkipStart automatic() { return {Mode::Auto, 0}; }
    static SkipStart none() { return {Mode::None, 0}; }
    static SkipStart toDenominator() { return {Mode::ToDenominator, 0}; }
    static SkipStart points(int k) { return {Mode::Count, k}; }
};

enum class IncludeOne { Auto, Yes, No };

// Resolved subsequence: skip `skip` points (point 0 is the origin), draw
// `n_draws` consecutive points, then append the all-ones point if include_one.
struct SobolSubsequence {
    int skip = 0;
    bool include_one = false;
    int n_draws = 0;
};

// Decision table for the automatic choices:
//   n = 2^k - 1   skip the origin, start at 0.5
//   n = 2^k + 1   start at the origin, draw 2^k points, append 1
//   n = 2^k       start at the origin
//   otherwise     start at the origin
SobolSubsequence resolveSobolSubsequence(int n, SkipStart skip_start, IncludeOne include_one);

struct SobolVariation {
    int n;
    int n_matrices;
    SobolRandomization randomization;
    SkipStart skip_start;
    IncludeOne include_one;
    Rng* rng;  // required unless randomization is None

    explicit SobolVariation(int n, int n_matrices = 1,
                            SobolRandomization randomization = SobolRandomization::None,
                            SkipStart skip_start = SkipStart::automatic(),
                            IncludeOne include_one = IncludeOne::Auto,
                            Rng* rng = nullptr);
};

// Random balance design. With Sobol points the sorted samples trace half a sine
// period (n must be within 1 of a power of two); otherwise evenly spaced angles
// on (-pi, pi] are permuted independently per dimension and trace a full period.
struct RBDVariation {
    int n;
    Rng* rng;
    bool use_sobol;
    int pow2_diff;     // n - 2^round(log2 n); only meaningful with Sobol
    bool half_period;  // num_cycles == 1/2

    RBDVariation(int n, Rng& rng, bool use_sobol = true,
                 std::optional<int> pow2_diff = std::nullopt,
                 std::optional<double> num_cycles = std::nullopt);

    double numCycles() const { return half_period ? 0.5 : 1.0; }
};

// CDF values indexed (dimension, matrix, sample)
class CdfCube {
public:
    CdfCube(int dims, int matrices, int samples);

    int dims() const { return dims_; }
    int matrices() const { return matrices_; }
    int samples() const { return samples_; }

    double& operator()(int dim, int matrix, int sample);
    double operator()(int dim, int matrix, int sample) const;

    // samples x dims slice of one design matrix
    Eigen::MatrixXd matrix(int m) const;
    // (samples * matrices) x dims; row r holds sample r / matrices of matrix r % matrices
    Eigen::MatrixXd stacked() const;

private:
    int dims_;
    int matrices_;
    int samples_;
    std::vector<double> data_;
};

struct RBDCDFs {
    Eigen::MatrixXd cdfs;     // n x d
    Eigen::MatrixXi sorting;  // column j lists sample rows in dimension j's angular order
};

// Orthogonal LHS bin indices (0-based) for n = k^d points. Every projection onto
// two dimensions puts exactly n/k^2 points in each cell of the k x k grid.
Eigen::MatrixXi orthogonalLHS(int k, int d, Rng& rng);

// n x d matrix of LHS CDF coordinates
Eigen::MatrixXd generateLHSCDFs(int n, int d, Rng& rng, bool add_noise = false,
                                bool orthogonalize = true);
Eigen::MatrixXd generateLHSCDFs(const LHSVariation& lhs, int d);

CdfCube generateSobolCDFs(int n, int d, int n_matrices = 1,
                          SobolRandomization randomization = SobolRandomization::None,
                          SkipStart skip_start = SkipStart::automatic(),
                          IncludeOne include_one = IncludeOne::Auto,
                          Rng* rng = nullptr);
CdfCube generateSobolCDFs(const SobolVariation& sobol, int d);

RBDCDFs generateRBDCDFs(const RBDVariation& rbd, int d);
