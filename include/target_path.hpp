#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

// Input document that a varied parameter lives in. Each location has its own
// parameter table in the variation store.
enum class Location { Config, Rulesets, Intracellular, IcCell, IcEcm };

constexpr size_t kNumLocations = 5;
constexpr std::array<Location, kNumLocations> kAllLocations = {
    Location::Config, Location::Rulesets, Location::Intracellular,
    Location::IcCell, Location::IcEcm
};

inline size_t locationIndex(Location loc) { return static_cast<size_t>(loc); }

// "config", "rulesets", "intracellular", "ic_cell", "ic_ecm"
std::string locationName(Location loc);
Location parseLocation(const std::string& name);

// Path of elements addressing one parameter inside a location's input document,
// e.g. "overall/max_time" or "behavior_ruleset:name:default/mapping/max_response".
// The location is inferred from the first element.
class TargetPath {
public:
    TargetPath() = default;
    explicit TargetPath(std::vector<std::string> elements);

    // Parse a '/'-separated path
    static TargetPath parse(const std::string& path);

    const std::vector<std::string>& elements() const { return elements_; }
    Location location() const { return location_; }

    // Storage column key: elements joined with '/'
    std::string columnName() const;

    bool operator==(const TargetPath& other) const { return elements_ == other.elements_; }
    bool operator!=(const TargetPath& other) const { return !(*this == other); }

private:
    std::vector<std::string> elements_;
    Location location_ = Location::Config;
};
