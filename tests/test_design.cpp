#include "design.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <vector>

namespace {

// Every column holds exactly one value per bin of width 1/n
bool isLatin(const Eigen::MatrixXd& cdfs) {
    const Eigen::Index n = cdfs.rows();
    for (Eigen::Index c = 0; c < cdfs.cols(); ++c) {
        std::vector<int> hits(static_cast<size_t>(n), 0);
        for (Eigen::Index r = 0; r < n; ++r) {
            const double x = cdfs(r, c);
            if (x < 0.0 || x > 1.0) return false;
            hits[std::min<size_t>(static_cast<size_t>(x * n), static_cast<size_t>(n - 1))]++;
        }
        if (std::any_of(hits.begin(), hits.end(), [](int h) { return h != 1; })) return false;
    }
    return true;
}

bool sameSubsequence(const SobolSubsequence& s, int skip, bool include_one, int n_draws) {
    return s.skip == skip && s.include_one == include_one && s.n_draws == n_draws;
}

}  // namespace

bool testLHSStratification() {
    std::cout << "Testing LHS stratification..." << std::endl;
    bool passed = true;

    Rng rng(42);
    for (bool add_noise : {false, true}) {
        const Eigen::MatrixXd cdfs = generateLHSCDFs(10, 3, rng, add_noise);
        if (cdfs.rows() != 10 || cdfs.cols() != 3 || !isLatin(cdfs)) {
            std::cout << "  FAILED: not a Latin hypercube (add_noise=" << add_noise << ")" << std::endl;
            passed = false;
        }
    }

    // Without noise the values are bin centers
    const Eigen::MatrixXd centers = generateLHSCDFs(4, 2, rng, false, false);
    for (Eigen::Index c = 0; c < 2; ++c) {
        std::vector<double> column(centers.col(c).data(), centers.col(c).data() + 4);
        std::sort(column.begin(), column.end());
        const std::vector<double> expected = {0.125, 0.375, 0.625, 0.875};
        if (column != expected) {
            std::cout << "  FAILED: column " << c << " is not the set of bin centers" << std::endl;
            passed = false;
        }
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

bool testOrthogonalLHS() {
    std::cout << "Testing orthogonal LHS (strength-2 property)..." << std::endl;
    bool passed = true;

    Rng rng(1);
    // n = k^d with k = 2, d = 2 and k = 3, d = 3
    for (auto kd : {std::pair<int, int>{2, 2}, std::pair<int, int>{3, 3}, std::pair<int, int>{4, 2}}) {
        const int k = kd.first;
        const int d = kd.second;
        const int n = static_cast<int>(std::lround(std::pow(k, d)));
        const Eigen::MatrixXd cdfs = generateLHSCDFs(n, d, rng);
        if (!isLatin(cdfs)) {
            std::cout << "  FAILED: k=" << k << ", d=" << d << " is not Latin" << std::endl;
            passed = false;
        }
        for (int a = 0; a < d; ++a) {
            for (int b = a + 1; b < d; ++b) {
                std::vector<int> cells(static_cast<size_t>(k * k), 0);
                for (int r = 0; r < n; ++r) {
                    const int ca = static_cast<int>(cdfs(r, a) * k);
                    const int cb = static_cast<int>(cdfs(r, b) * k);
                    cells[ca * k + cb]++;
                }
                const int per_cell = n / (k * k);
                if (std::any_of(cells.begin(), cells.end(), [per_cell](int c) { return c != per_cell; })) {
                    std::cout << "  FAILED: k=" << k << ", d=" << d << ", projection (" << a << "," << b
                              << ") is not a perfect k x k grid" << std::endl;
                    passed = false;
                }
            }
        }
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

bool testSobolDecisionTable() {
    std::cout << "Testing Sobol subsequence decision table..." << std::endl;
    bool passed = true;

    struct Case {
        int n;
        SkipStart skip;
        IncludeOne include;
        int skip_expected;
        bool include_expected;
        int draws_expected;
    };
    const std::vector<Case> cases = {
        {7, SkipStart::automatic(), IncludeOne::Auto, 1, false, 7},   // 2^k - 1
        {9, SkipStart::automatic(), IncludeOne::Auto, 0, true, 8},    // 2^k + 1
        {8, SkipStart::automatic(), IncludeOne::Auto, 0, false, 8},   // 2^k
        {10, SkipStart::automatic(), IncludeOne::Auto, 0, false, 10}, // otherwise
        {9, SkipStart::automatic(), IncludeOne::No, 0, false, 9},
        {8, SkipStart::automatic(), IncludeOne::Yes, 0, true, 7},
        {8, SkipStart::toDenominator(), IncludeOne::Auto, 8, false, 8},
        {5, SkipStart::toDenominator(), IncludeOne::Auto, 8, false, 5},
        {1, SkipStart::toDenominator(), IncludeOne::Auto, 1, false, 1},
        {6, SkipStart::points(3), IncludeOne::Auto, 3, false, 6},
        {3, SkipStart::none(), IncludeOne::Auto, 0, false, 3},
    };
    for (const auto& c : cases) {
        const SobolSubsequence s = resolveSobolSubsequence(c.n, c.skip, c.include);
        if (!sameSubsequence(s, c.skip_expected, c.include_expected, c.draws_expected)) {
            std::cout << "  FAILED: n=" << c.n << " resolved to skip=" << s.skip << ", include_one="
                      << s.include_one << ", n_draws=" << s.n_draws << std::endl;
            passed = false;
        }
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

bool testSobolCDFs() {
    std::cout << "Testing Sobol CDF cube..." << std::endl;
    bool passed = true;

    const CdfCube pow2 = generateSobolCDFs(8, 1);
    if (pow2(0, 0, 0) != 0.0) {
        std::cout << "  FAILED: n=8 should start at 0" << std::endl;
        passed = false;
    }

    const CdfCube minus_one = generateSobolCDFs(7, 1);
    for (int s = 0; s < 7; ++s) {
        if (minus_one(0, 0, s) == 0.0) {
            std::cout << "  FAILED: n=7 contains 0" << std::endl;
            passed = false;
        }
    }
    if (minus_one(0, 0, 0) != 0.5) {
        std::cout << "  FAILED: n=7 should start at 0.5" << std::endl;
        passed = false;
    }

    const CdfCube plus_one = generateSobolCDFs(9, 2);
    if (plus_one(0, 0, 8) != 1.0 || plus_one(1, 0, 8) != 1.0) {
        std::cout << "  FAILED: n=9 should end with the all-ones point" << std::endl;
        passed = false;
    }

    // Matrices come from disjoint sequence dimensions
    const CdfCube two = generateSobolCDFs(16, 2, 2);
    if (two.matrices() != 2 || two.samples() != 16 || two.dims() != 2) {
        std::cout << "  FAILED: cube shape" << std::endl;
        passed = false;
    }
    const Eigen::MatrixXd a = two.matrix(0);
    const Eigen::MatrixXd b = two.matrix(1);
    if ((a - b).cwiseAbs().maxCoeff() == 0.0) {
        std::cout << "  FAILED: matrices A and B are identical" << std::endl;
        passed = false;
    }
    const Eigen::MatrixXd stacked = two.stacked();
    if (stacked.rows() != 32 || stacked.row(2) != a.row(1) || stacked.row(3) != b.row(1)) {
        std::cout << "  FAILED: stacked rows are not sample-major" << std::endl;
        passed = false;
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

bool testSobolRandomization() {
    std::cout << "Testing Sobol randomization..." << std::endl;
    bool passed = true;

    Rng rng(9);
    for (SobolRandomization r : {SobolRandomization::Shift, SobolRandomization::DigitalShift}) {
        const CdfCube cube = generateSobolCDFs(64, 3, 1, r, SkipStart::none(), IncludeOne::No, &rng);
        const Eigen::MatrixXd m = cube.matrix(0);
        if (m.minCoeff() < 0.0 || m.maxCoeff() >= 1.0) {
            std::cout << "  FAILED: randomized values left [0, 1)" << std::endl;
            passed = false;
        }
        // Both randomizations keep every 1-D projection stratified
        for (Eigen::Index c = 0; c < 3; ++c) {
            std::set<int> bins;
            for (Eigen::Index s = 0; s < 64; ++s) bins.insert(static_cast<int>(m(s, c) * 64));
            if (bins.size() != 64) {
                std::cout << "  FAILED: randomized column " << c << " lost stratification" << std::endl;
                passed = false;
            }
        }
    }

    try {
        generateSobolCDFs(8, 1, 1, SobolRandomization::Shift);
        std::cout << "  FAILED: randomization without rng accepted" << std::endl;
        passed = false;
    } catch (const ValidationError&) {
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

bool testRBDSobolDesign() {
    std::cout << "Testing RBD Sobol design..." << std::endl;
    bool passed = true;

    Rng rng(0);
    for (int n : {15, 16, 17}) {
        RBDVariation rbd(n, rng);
        if (!rbd.half_period || rbd.pow2_diff != n - 16) {
            std::cout << "  FAILED: n=" << n << " pow2_diff=" << rbd.pow2_diff << std::endl;
            passed = false;
        }
        const RBDCDFs design = generateRBDCDFs(rbd, 2);
        for (Eigen::Index c = 0; c < 2; ++c) {
            std::set<int> rows;
            for (Eigen::Index r = 0; r < n; ++r) {
                rows.insert(design.sorting(r, c));
                if (r > 0 && design.cdfs(design.sorting(r, c), c) < design.cdfs(design.sorting(r - 1, c), c)) {
                    std::cout << "  FAILED: n=" << n << " sorting is not ascending" << std::endl;
                    passed = false;
                }
            }
            if (static_cast<int>(rows.size()) != n) {
                std::cout << "  FAILED: n=" << n << " sorting is not a permutation" << std::endl;
                passed = false;
            }
        }
    }

    try {
        RBDVariation bad(12, rng);
        std::cout << "  FAILED: n=12 accepted with Sobol" << std::endl;
        passed = false;
    } catch (const ValidationError&) {
    }
    try {
        RBDVariation bad(16, rng, true, 1);
        std::cout << "  FAILED: wrong pow2_diff accepted" << std::endl;
        passed = false;
    } catch (const ValidationError&) {
    }
    try {
        RBDVariation explicit_diff(17, rng, true, 1);
        if (explicit_diff.pow2_diff != 1) {
            std::cout << "  FAILED: matching pow2_diff not kept" << std::endl;
            passed = false;
        }
    } catch (const ValidationError& e) {
        std::cout << "  FAILED: matching pow2_diff rejected: " << e.what() << std::endl;
        passed = false;
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

bool testRBDRandomDesign() {
    std::cout << "Testing RBD random design..." << std::endl;
    bool passed = true;

    Rng rng(4);
    RBDVariation rbd(12, rng, false);
    if (rbd.half_period || rbd.numCycles() != 1.0) {
        std::cout << "  FAILED: random design should trace a full period" << std::endl;
        passed = false;
    }
    const RBDCDFs design = generateRBDCDFs(rbd, 3);
    for (Eigen::Index c = 0; c < 3; ++c) {
        // In angular order the CDFs follow 0.5 + asin(sin(theta)) / pi for evenly spaced theta
        for (Eigen::Index r = 0; r < 12; ++r) {
            const double theta = -M_PI + 2.0 * M_PI * static_cast<double>(r) / 12.0;
            const double expected = 0.5 + std::asin(std::sin(theta)) / M_PI;
            if (std::abs(design.cdfs(design.sorting(r, c), c) - expected) > 1e-12) {
                std::cout << "  FAILED: column " << c << " row " << r << " off the sine curve" << std::endl;
                passed = false;
            }
        }
    }

    try {
        RBDVariation bad(12, rng, false, std::nullopt, 0.5);
        std::cout << "  FAILED: half period accepted for a random design" << std::endl;
        passed = false;
    } catch (const ValidationError&) {
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

bool testDeterminismWithSeed() {
    std::cout << "Testing designs are reproducible from the rng seed..." << std::endl;
    bool passed = true;

    Rng a(123);
    Rng b(123);
    if (generateLHSCDFs(20, 4, a, true) != generateLHSCDFs(20, 4, b, true)) {
        std::cout << "  FAILED: LHS differs for equal seeds" << std::endl;
        passed = false;
    }
    const RBDCDFs ra = generateRBDCDFs(RBDVariation(30, a, false), 2);
    const RBDCDFs rb = generateRBDCDFs(RBDVariation(30, b, false), 2);
    if (ra.cdfs != rb.cdfs || ra.sorting != rb.sorting) {
        std::cout << "  FAILED: RBD differs for equal seeds" << std::endl;
        passed = false;
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

int main() {
    std::cout << "Design Generation Tests" << std::endl;
    std::cout << "=======================" << std::endl << std::endl;

    int passed = 0;
    const int total = 8;

    if (testLHSStratification()) passed++;
    if (testOrthogonalLHS()) passed++;
    if (testSobolDecisionTable()) passed++;
    if (testSobolCDFs()) passed++;
    if (testSobolRandomization()) passed++;
    if (testRBDSobolDesign()) passed++;
    if (testRBDRandomDesign()) passed++;
    if (testDeterminismWithSeed()) passed++;

    std::cout << std::endl << "Summary: " << passed << "/" << total << " tests passed" << std::endl;
    return (passed == total) ? 0 : 1;
}
