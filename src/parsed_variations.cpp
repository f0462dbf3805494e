#include "parsed_variations.hpp"

#include "errors.hpp"

#include <algorithm>
#include <set>

bool LocationParsedVariations::ownsDimension(int d) const {
    return std::find(indices.begin(), indices.end(), d) != indices.end();
}

std::vector<int> LocationParsedVariations::dimensions() const {
    std::vector<int> dims;
    for (int d : indices) {
        if (dims.empty() || dims.back() != d) {
            dims.push_back(d);
        }
    }
    return dims;
}

std::vector<std::string> LocationParsedVariations::columnNames() const {
    std::vector<std::string> names;
    names.reserve(variations.size());
    for (const auto& ev : variations) {
        names.push_back(ev.columnName());
    }
    return names;
}

ParsedVariations::ParsedVariations(std::vector<CoVariation> variations)
    : variations_(std::move(variations)) {
    if (variations_.empty()) {
        throw ValidationError("ParsedVariations: at least one variation is required");
    }

    std::set<std::string> seen_columns;
    for (size_t d = 0; d < variations_.size(); ++d) {
        sizes_.push_back(variations_[d].size());
        for (const auto& ev : variations_[d].members()) {
            const std::string key = locationName(ev.location()) + ":" + ev.columnName();
            if (!seen_columns.insert(key).second) {
                throw ValidationError("ParsedVariations: target '" + ev.columnName() +
                                      "' is varied more than once");
            }
            // Appending in dimension order keeps each bucket's indices non-decreasing
            auto& bucket = by_location_[locationIndex(ev.location())];
            bucket.variations.push_back(ev);
            bucket.indices.push_back(static_cast<int>(d));
        }
    }
}

bool ParsedVariations::allDiscrete() const {
    return std::all_of(sizes_.begin(), sizes_.end(), [](int s) { return s > 0; });
}

std::vector<Location> ParsedVariations::variedLocations() const {
    std::vector<Location> locs;
    for (Location loc : kAllLocations) {
        if (!at(loc).empty()) {
            locs.push_back(loc);
        }
    }
    return locs;
}
