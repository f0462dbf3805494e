#include "config.hpp"

#include "errors.hpp"
#include "parse_utils.hpp"

#include <fstream>
#include <set>

namespace {

enum class Section { Global, Variation, Base };

std::string stripInlineComment(const std::string& s) {
    size_t hash = s.find('#');
    if (hash == std::string::npos) {
        return s;
    }
    return s.substr(0, hash);
}

bool isDistributionParam(const std::string& key) {
    static const std::set<std::string> kParams = {"lb", "ub", "mu", "sigma"};
    return kParams.find(key) != kParams.end();
}

std::string atLine(const std::string& key, int line_num) {
    return "'" + key + "' at line " + std::to_string(line_num);
}

void validateVariationSection(const VariationConfigEntry& entry) {
    const std::string where = "[[variation]] section starting at line " + std::to_string(entry.line);
    if (entry.target.empty()) {
        throw ValidationError("Missing required parameter 'target' in " + where);
    }
    if (entry.values.empty() == entry.distribution.empty()) {
        throw ValidationError("Exactly one of 'values' or 'distribution' must be set in " + where);
    }
    if (!entry.values.empty() && !entry.params.empty()) {
        throw ValidationError("Distribution parameters given for discrete variation in " + where);
    }
}

}  // namespace

Config Config::load(const std::string& filename) {
    Config config;
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    std::string line;
    int line_num = 0;
    Section section = Section::Global;
    VariationConfigEntry current_variation;
    auto finalizeSection = [&]() {
        if (section == Section::Variation) {
            validateVariationSection(current_variation);
            config.variations_.push_back(current_variation);
        }
    };

    while (std::getline(file, line)) {
        line_num++;

        std::string uncommented = stripInlineComment(line);
        std::string trimmed = parseutil::trimCopy(uncommented);
        if (trimmed.empty()) {
            continue;
        }

        if (trimmed == "[[variation]]" || trimmed == "[[base]]") {
            finalizeSection();
            if (trimmed == "[[variation]]") {
                section = Section::Variation;
                current_variation = VariationConfigEntry();
                current_variation.line = line_num;
            } else {
                section = Section::Base;
            }
            continue;
        }
        if (trimmed.front() == '[') {
            throw ValidationError("Unknown section '" + trimmed + "' at line " + std::to_string(line_num));
        }

        size_t eq = uncommented.find('=');
        if (eq == std::string::npos) {
            throw ValidationError("Invalid config line " + std::to_string(line_num) + ": " + line);
        }

        std::string key = parseutil::trimCopy(uncommented.substr(0, eq));
        std::string value = parseutil::trimCopy(uncommented.substr(eq + 1));

        if (key.empty()) {
            throw ValidationError("Empty key at line " + std::to_string(line_num));
        }

        if (section == Section::Variation) {
            if (key == "target") {
                current_variation.target = value;
            } else if (key == "values") {
                current_variation.values = parseutil::parseDoubleListStrict(value, atLine(key, line_num));
            } else if (key == "distribution") {
                current_variation.distribution = parseutil::lowerCopy(value);
                if (current_variation.distribution != "uniform" &&
                    current_variation.distribution != "normal") {
                    throw ValidationError("Invalid value for " + atLine(key, line_num) +
                                          ": expected 'uniform' or 'normal', got '" + value + "'");
                }
            } else if (isDistributionParam(key)) {
                current_variation.params[key] = parseutil::parseDoubleStrict(value, atLine(key, line_num));
            } else if (key == "flip") {
                current_variation.flip = parseutil::parseBoolStrict(value, atLine(key, line_num));
            } else if (key == "group") {
                current_variation.group = value;
            } else {
                throw ValidationError("Unknown variation parameter '" + key + "' at line " +
                                      std::to_string(line_num));
            }
        } else if (section == Section::Base) {
            BaseValueEntry entry;
            entry.target = key;
            entry.value = parseutil::parseDoubleStrict(value, atLine(key, line_num));
            entry.line = line_num;
            config.base_values_.push_back(entry);
        } else {
            config.values_[key] = value;
        }
    }

    finalizeSection();
    return config;
}

bool Config::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::string Config::getString(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        throw LookupError("Missing config key: " + key);
    }
    return it->second;
}

std::string Config::getString(const std::string& key, const std::string& default_val) const {
    auto it = values_.find(key);
    return (it != values_.end()) ? it->second : default_val;
}

double Config::getDouble(const std::string& key) const {
    return parseutil::parseDoubleStrict(getString(key), "'" + key + "'");
}

double Config::getDouble(const std::string& key, double default_val) const {
    if (!has(key)) return default_val;
    return getDouble(key);
}

int Config::getInt(const std::string& key) const {
    return parseutil::parseIntStrict(getString(key), "'" + key + "'");
}

int Config::getInt(const std::string& key, int default_val) const {
    if (!has(key)) return default_val;
    return getInt(key);
}

bool Config::getBool(const std::string& key, bool default_val) const {
    if (!has(key)) return default_val;
    return parseutil::parseBoolStrict(getString(key), "'" + key + "'");
}

std::vector<int> Config::getIntList(const std::string& key) const {
    if (!has(key)) return {};
    const std::string value = getString(key);
    if (parseutil::trimCopy(value) == "[]") return {};
    return parseutil::parseIntListStrict(value, "'" + key + "'");
}
