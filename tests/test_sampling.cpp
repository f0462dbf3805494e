#include "errors.hpp"
#include "sampling.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

// Every coordinate lies in [0, 1) and equals its bit form, from one dimension
// up to the full direction-number table
bool testUnitRangeAndBits() {
    std::cout << "Testing unit range [0,1)^d and bit form..." << std::endl;

    bool passed = true;

    for (size_t dim : {size_t{1}, size_t{2}, size_t{21}, size_t{22}, size_t{64}, size_t{1000},
                       SobolSequence::kMaxDimension}) {
        SobolSequence seq(dim);
        SobolSequence bits(dim);
        if (seq.dimension() != dim) {
            std::cout << "  FAILED: dimension() reports " << seq.dimension() << " for " << dim << std::endl;
            passed = false;
        }

        for (int i = 0; i < 512; ++i) {
            const std::vector<double> pt = seq.next();
            const std::vector<uint32_t> raw = bits.nextBits();
            for (size_t d = 0; d < dim; ++d) {
                if (pt[d] < 0.0 || pt[d] >= 1.0 || pt[d] != SobolSequence::toUnit(raw[d])) {
                    std::cout << "  FAILED: dim=" << dim << ", i=" << i << ", d=" << d
                              << ", value=" << pt[d] << std::endl;
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

// First points of the two leading dimensions
bool testKnownPoints() {
    std::cout << "Testing known leading points..." << std::endl;

    const std::vector<double> dim1 = {0.0, 0.5, 0.75, 0.25, 0.375, 0.875, 0.625, 0.125};
    const std::vector<double> dim2 = {0.0, 0.5, 0.25, 0.75, 0.375, 0.875, 0.125, 0.625};

    SobolSequence seq(2);
    bool passed = true;

    for (size_t i = 0; i < dim1.size(); ++i) {
        auto pt = seq.next();
        if (pt[0] != dim1[i] || pt[1] != dim2[i]) {
            std::cout << "  FAILED: point " << i << " is (" << pt[0] << ", " << pt[1]
                      << "), expected (" << dim1[i] << ", " << dim2[i] << ")" << std::endl;
            passed = false;
        }
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

// Two generators, and one generator after reset(), agree bit for bit
bool testReproducible() {
    std::cout << "Testing reproducibility across instances and reset..." << std::endl;

    const size_t dim = 7;
    SobolSequence a(dim);
    SobolSequence b(dim);
    std::vector<std::vector<uint32_t>> first;
    for (int i = 0; i < 200; ++i) {
        first.push_back(a.nextBits());
    }

    bool passed = true;
    a.reset();
    for (int i = 0; i < 200; ++i) {
        if (a.nextBits() != first[i] || b.nextBits() != first[i]) {
            std::cout << "  FAILED: sequences differ at i=" << i << std::endl;
            passed = false;
            break;
        }
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

// The first 2^m points put exactly one coordinate in each interval of width 2^-m,
// in every dimension
bool testOneDimensionalStratification() {
    std::cout << "Testing 1-D stratification of leading 2^m points..." << std::endl;

    bool passed = true;
    const size_t dim = SobolSequence::kMaxDimension;

    for (int m = 1; m <= 8; ++m) {
        const int n = 1 << m;
        SobolSequence seq(dim);
        std::vector<std::vector<int>> hits(dim, std::vector<int>(static_cast<size_t>(n), 0));
        for (int i = 0; i < n; ++i) {
            auto pt = seq.next();
            for (size_t d = 0; d < dim; ++d) {
                hits[d][static_cast<size_t>(pt[d] * n)]++;
            }
        }
        for (size_t d = 0; d < dim; ++d) {
            if (std::any_of(hits[d].begin(), hits[d].end(), [](int c) { return c != 1; })) {
                std::cout << "  FAILED: dimension " << d + 1 << " is not stratified at 2^" << m
                          << std::endl;
                passed = false;
            }
        }
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

// Dimensions 1 and 2 form a (0,m,2)-net: for 256 points every elementary box of
// area 1/16 (1x16, 2x8, 4x4, 8x2, 16x1 splits) holds exactly 16 points
bool testTwoDimensionalNet() {
    std::cout << "Testing (0,m,2)-net property of the leading pair..." << std::endl;

    const int n = 256;
    SobolSequence seq(2);
    std::vector<std::vector<double>> points;
    for (int i = 0; i < n; ++i) {
        points.push_back(seq.next());
    }

    bool passed = true;
    for (int kx = 0; kx <= 4; ++kx) {
        const int nx = 1 << kx;
        const int ny = 16 / nx;
        std::vector<int> boxes(static_cast<size_t>(nx * ny), 0);
        for (const auto& pt : points) {
            const int bx = static_cast<int>(pt[0] * nx);
            const int by = static_cast<int>(pt[1] * ny);
            boxes[static_cast<size_t>(bx * ny + by)]++;
        }
        if (std::any_of(boxes.begin(), boxes.end(), [](int c) { return c != 16; })) {
            std::cout << "  FAILED: " << nx << "x" << ny << " boxes are not evenly filled" << std::endl;
            passed = false;
        }
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

bool testSkip() {
    std::cout << "Testing skip()..." << std::endl;

    bool passed = true;
    for (size_t dim : {size_t{4}, size_t{40}}) {
        SobolSequence reference(dim);
        for (int i = 0; i < 37; ++i) {
            reference.next();
        }
        SobolSequence skipped(dim);
        skipped.skip(37);

        if (skipped.index() != 37) {
            std::cout << "  FAILED: index after skip(37) is " << skipped.index() << std::endl;
            passed = false;
        }
        if (skipped.nextBits() != reference.nextBits()) {
            std::cout << "  FAILED: dim=" << dim << " skip(37) does not land on point 37" << std::endl;
            passed = false;
        }

        // Skipping mid-sequence, and skipping only the origin
        skipped.skip(10);
        for (int i = 0; i < 10; ++i) {
            reference.nextBits();
        }
        if (skipped.nextBits() != reference.nextBits()) {
            std::cout << "  FAILED: dim=" << dim << " skip(10) after drawing is off" << std::endl;
            passed = false;
        }
        SobolSequence origin_only(dim);
        SobolSequence drawn(dim);
        origin_only.skip(1);
        drawn.nextBits();
        if (origin_only.nextBits() != drawn.nextBits()) {
            std::cout << "  FAILED: dim=" << dim << " skip(1) from the start is off" << std::endl;
            passed = false;
        }
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

// index() counts drawn and skipped points; reset() returns to the origin
bool testIndex() {
    std::cout << "Testing index tracking..." << std::endl;

    SobolSequence seq(3);
    bool passed = true;

    seq.next();
    seq.nextBits();
    seq.skip(5);
    if (seq.index() != 7) {
        std::cout << "  FAILED: index after 2 draws and skip(5) is " << seq.index() << std::endl;
        passed = false;
    }

    seq.reset();
    const std::vector<double> origin = seq.next();
    if (seq.index() != 1 || std::any_of(origin.begin(), origin.end(), [](double v) { return v != 0.0; })) {
        std::cout << "  FAILED: first point after reset should be the origin" << std::endl;
        passed = false;
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

bool testInvalidDimension() {
    std::cout << "Testing invalid dimensions are rejected..." << std::endl;

    bool passed = true;
    for (size_t dim : {size_t{0}, SobolSequence::kMaxDimension + 1}) {
        try {
            SobolSequence seq(dim);
            std::cout << "  FAILED: dimension " << dim << " was accepted" << std::endl;
            passed = false;
        } catch (const ValidationError&) {
        }
    }

    if (passed) {
        std::cout << "  PASSED" << std::endl;
    }
    return passed;
}

int main() {
    std::cout << "Sobol Sequence Tests" << std::endl;
    std::cout << "====================" << std::endl << std::endl;

    int num_passed = 0;
    int num_tests = 8;

    if (testUnitRangeAndBits()) num_passed++;
    if (testKnownPoints()) num_passed++;
    if (testReproducible()) num_passed++;
    if (testOneDimensionalStratification()) num_passed++;
    if (testTwoDimensionalNet()) num_passed++;
    if (testSkip()) num_passed++;
    if (testIndex()) num_passed++;
    if (testInvalidDimension()) num_passed++;

    std::cout << std::endl;
    std::cout << "Results: " << num_passed << "/" << num_tests << " tests passed" << std::endl;

    return (num_passed == num_tests) ? 0 : 1;
}
