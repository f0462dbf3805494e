#pragma once

#include <map>
#include <string>
#include <vector>

// One [[variation]] block. Either `values` is set (discrete) or `distribution`
// names a continuous distribution with its parameters.
struct VariationConfigEntry {
    std::string target;
    std::vector<double> values;
    std::string distribution;  // "uniform", "normal" or empty for discrete
    std::map<std::string, double> params;  // lb, ub, mu, sigma
    bool flip = false;
    std::string group;  // entries sharing a group form one co-varied dimension
    int line = 0;       // line of the section marker, for error messages
};

// One "<target path> = <value>" line of a [[base]] block
struct BaseValueEntry {
    std::string target;
    double value = 0.0;
    int line = 0;
};

// key=value config file parser with [[variation]] and [[base]] section support.
// '#' starts a comment anywhere on a line.
class Config {
public:
    static Config load(const std::string& filename);

    const std::vector<VariationConfigEntry>& getVariationEntries() const { return variations_; }
    const std::vector<BaseValueEntry>& getBaseEntries() const { return base_values_; }

    bool has(const std::string& key) const;

    std::string getString(const std::string& key) const;
    std::string getString(const std::string& key, const std::string& default_val) const;

    double getDouble(const std::string& key) const;
    double getDouble(const std::string& key, double default_val) const;

    int getInt(const std::string& key) const;
    int getInt(const std::string& key, int default_val) const;

    bool getBool(const std::string& key, bool default_val) const;

    // Empty when the key is absent or set to "[]"
    std::vector<int> getIntList(const std::string& key) const;

private:
    std::map<std::string, std::string> values_;
    std::vector<VariationConfigEntry> variations_;
    std::vector<BaseValueEntry> base_values_;
};
