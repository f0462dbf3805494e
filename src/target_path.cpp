#include "target_path.hpp"

#include "errors.hpp"
#include "parse_utils.hpp"

#include <sstream>

namespace {

std::vector<std::string> splitTokens(const std::string& s, char sep) {
    std::vector<std::string> tokens;
    std::string token;
    std::stringstream ss(s);
    while (std::getline(ss, token, sep)) {
        tokens.push_back(token);
    }
    // getline drops a trailing empty token
    if (!s.empty() && s.back() == sep) {
        tokens.emplace_back();
    }
    return tokens;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// An element with 4+ ':' tokens is either <tag>::<child>:<content> or
// <tag>:<attr>:custom:<name>
void validateElement(const std::string& element, const std::string& path) {
    if (element.empty()) {
        throw ValidationError("TargetPath: empty element in '" + path + "'");
    }
    const std::vector<std::string> tokens = splitTokens(element, ':');
    if (tokens.size() < 4) {
        return;
    }
    if (tokens[1].empty() || tokens[2] == "custom") {
        return;
    }
    throw ValidationError("TargetPath: invalid element '" + element + "' in '" + path +
                          "' (expected <tag>::<child>:<content> or <tag>:<attr>:custom:<name>)");
}

Location inferLocation(const std::string& first) {
    if (startsWith(first, "behavior_ruleset:name:") ||
        startsWith(first, "hypothesis_ruleset:name:")) {
        return Location::Rulesets;
    }
    if (first == "intracellulars") {
        return Location::Intracellular;
    }
    if (startsWith(first, "cell_patches:name:")) {
        return Location::IcCell;
    }
    if (startsWith(first, "layer:ID:")) {
        return Location::IcEcm;
    }
    return Location::Config;
}

}  // namespace

std::string locationName(Location loc) {
    switch (loc) {
        case Location::Config: return "config";
        case Location::Rulesets: return "rulesets";
        case Location::Intracellular: return "intracellular";
        case Location::IcCell: return "ic_cell";
        case Location::IcEcm: return "ic_ecm";
    }
    throw std::invalid_argument("locationName: unknown location");
}

Location parseLocation(const std::string& name) {
    for (Location loc : kAllLocations) {
        if (locationName(loc) == name) return loc;
    }
    throw ValidationError("Invalid location: '" + name +
                          "' (expected config, rulesets, intracellular, ic_cell or ic_ecm)");
}

TargetPath::TargetPath(std::vector<std::string> elements) : elements_(std::move(elements)) {
    if (elements_.empty()) {
        throw ValidationError("TargetPath: path must have at least one element");
    }
    const std::string joined = columnName();
    for (const auto& element : elements_) {
        validateElement(element, joined);
    }
    location_ = inferLocation(elements_.front());
}

TargetPath TargetPath::parse(const std::string& path) {
    const std::string trimmed = parseutil::trimCopy(path);
    if (trimmed.empty()) {
        throw ValidationError("TargetPath: empty path");
    }
    return TargetPath(splitTokens(trimmed, '/'));
}

std::string TargetPath::columnName() const {
    std::string name;
    for (size_t i = 0; i < elements_.size(); ++i) {
        if (i > 0) name += "/";
        name += elements_[i];
    }
    return name;
}
