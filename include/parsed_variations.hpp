#pragma once

#include "target_path.hpp"
#include "variation.hpp"

#include <array>
#include <vector>

// Elementary variations stored at one location, each paired with the index of
// the dimension (CoVariation) that owns it. Indices are non-decreasing.
struct LocationParsedVariations {
    std::vector<ElementaryVariation> variations;
    std::vector<int> indices;

    bool empty() const { return variations.empty(); }
    bool ownsDimension(int d) const;
    // Owned dimension indices without repeats, ascending
    std::vector<int> dimensions() const;
    std::vector<std::string> columnNames() const;
};

// Ordered list of sampled dimensions, bucketed by location so each sampling
// method can materialize one location at a time.
class ParsedVariations {
public:
    explicit ParsedVariations(std::vector<CoVariation> variations);

    const std::vector<CoVariation>& variations() const { return variations_; }

    // Cardinality per dimension, -1 for continuous dimensions
    const std::vector<int>& sizes() const { return sizes_; }
    int dimension() const { return static_cast<int>(variations_.size()); }
    bool allDiscrete() const;

    const LocationParsedVariations& at(Location loc) const { return by_location_[locationIndex(loc)]; }

    // Locations holding at least one variation, in kAllLocations order
    std::vector<Location> variedLocations() const;

private:
    std::vector<CoVariation> variations_;
    std::vector<int> sizes_;
    std::array<LocationParsedVariations, kNumLocations> by_location_;
};
