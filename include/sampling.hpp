#pragma once

#include <boost/random/sobol.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

// Sobol quasi-random sequence generator
// Wraps Boost.Random's Gray-code Sobol engine (Joe & Kuo direction numbers).
// Point 0 is the origin; subsequent points lie in [0,1)^dim.
class SobolSequence {
public:
    static constexpr size_t kMaxDimension = boost::random::default_sobol_table::max_dimension;

    // Create generator for given dimension (1 to kMaxDimension)
    explicit SobolSequence(size_t dim);

    // Generate next point in [0,1)^dim
    std::vector<double> next();

    // Generate next point as 32-bit binary fractions (value = bits * 2^-32)
    std::vector<uint32_t> nextBits();

    // Advance past n points without returning them
    void skip(size_t n);

    // Reset sequence to beginning
    void reset();

    // Number of points generated so far
    size_t index() const { return index_; }

    size_t dimension() const { return dim_; }

    static double toUnit(uint32_t bits);

private:
    using Engine = boost::random::sobol_engine<uint32_t, 32>;

    size_t dim_;
    size_t index_;
    Engine engine_;  // Yields points 1, 2, ...; the origin is emitted here

    static size_t checkedDimension(size_t dim);
};
