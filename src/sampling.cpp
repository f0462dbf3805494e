#include "sampling.hpp"

#include "errors.hpp"

#include <string>

static constexpr double SOBOL_SCALE = 1.0 / 4294967296.0;  // 2^-32

SobolSequence::SobolSequence(size_t dim)
    : dim_(checkedDimension(dim)), index_(0), engine_(dim_) {}

size_t SobolSequence::checkedDimension(size_t dim) {
    if (dim < 1 || dim > kMaxDimension) {
        throw ValidationError("SobolSequence: dimension must be 1-" + std::to_string(kMaxDimension) +
                              ", got " + std::to_string(dim));
    }
    return dim;
}

std::vector<uint32_t> SobolSequence::nextBits() {
    std::vector<uint32_t> bits(dim_, 0);
    if (index_ > 0) {
        // Throws std::range_error once 2^32 points are exhausted
        engine_.generate(bits.begin(), bits.end());
    }
    index_++;
    return bits;
}

std::vector<double> SobolSequence::next() {
    const std::vector<uint32_t> bits = nextBits();
    std::vector<double> result(dim_);
    for (size_t d = 0; d < dim_; ++d) {
        result[d] = toUnit(bits[d]);
    }
    return result;
}

void SobolSequence::skip(size_t n) {
    if (n == 0) {
        return;
    }
    if (index_ == 0) {
        index_ = 1;
        --n;
    }
    engine_.discard(static_cast<boost::uintmax_t>(n) * dim_);
    index_ += n;
}

void SobolSequence::reset() {
    index_ = 0;
    engine_.seed();
}

double SobolSequence::toUnit(uint32_t bits) {
    return static_cast<double>(bits) * SOBOL_SCALE;
}
