#include "variation_store.hpp"

#include "errors.hpp"

#include <highfive/H5Easy.hpp>
#include <highfive/H5File.hpp>

#include <algorithm>
#include <set>

int InMemoryVariationStore::Table::columnIndex(const std::string& column) const {
    auto it = std::find(columns.begin(), columns.end(), column);
    return it == columns.end() ? -1 : static_cast<int>(it - columns.begin());
}

void InMemoryVariationStore::setBaseValue(const TargetPath& target, double value) {
    setBaseValue(target.location(), target.columnName(), value);
}

void InMemoryVariationStore::setBaseValue(Location loc, const std::string& column, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    Table& t = table(loc);
    if (t.columnIndex(column) >= 0) {
        throw std::logic_error("InMemoryVariationStore: base value for '" + column +
                               "' set after the column was created");
    }
    t.base_values[column] = value;
}

std::vector<std::string> InMemoryVariationStore::prepareColumns(
    Location loc, const std::vector<std::string>& varied_columns) {
    std::lock_guard<std::mutex> lock(mutex_);
    Table& t = table(loc);

    std::vector<std::string> static_columns;
    const std::set<std::string> varied(varied_columns.begin(), varied_columns.end());
    for (const auto& column : t.columns) {
        if (varied.find(column) == varied.end()) {
            static_columns.push_back(column);
        }
    }

    bool added = false;
    for (const auto& column : varied_columns) {
        if (t.columnIndex(column) >= 0) continue;
        auto base = t.base_values.find(column);
        if (base == t.base_values.end()) {
            throw LookupError("No base value for '" + column + "' in " + locationName(loc) +
                              " inputs");
        }
        t.columns.push_back(column);
        for (auto& row : t.rows) {
            row.push_back(base->second);
        }
        added = true;
    }

    // Keys grow with the new columns; every row received the same values so ids stay unique
    if (added) {
        t.index.clear();
        for (size_t id = 0; id < t.rows.size(); ++id) {
            t.index.emplace(t.rows[id], static_cast<int>(id));
        }
    }
    return static_columns;
}

int InMemoryVariationStore::getOrInsertRow(Location loc, const ColumnValues& static_values,
                                           const ColumnValues& varied_values) {
    std::lock_guard<std::mutex> lock(mutex_);
    Table& t = table(loc);

    std::vector<double> row = t.rows.front();
    std::vector<bool> assigned(t.columns.size(), false);
    auto assign = [&](const ColumnValues& values) {
        for (const auto& [column, value] : values) {
            const int c = t.columnIndex(column);
            if (c < 0) {
                throw LookupError("Column '" + column + "' has not been prepared in " +
                                  locationName(loc) + " inputs");
            }
            if (assigned[c]) {
                throw ValidationError("Column '" + column + "' assigned twice in one row");
            }
            row[c] = value;
            assigned[c] = true;
        }
    };
    assign(static_values);
    assign(varied_values);

    auto it = t.index.find(row);
    if (it != t.index.end()) {
        return it->second;
    }
    const int id = static_cast<int>(t.rows.size());
    t.rows.push_back(row);
    t.index.emplace(std::move(row), id);
    return id;
}

double InMemoryVariationStore::referenceValue(Location loc, int id, const std::string& column) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Table& t = table(loc);
    if (id < 0 || static_cast<size_t>(id) >= t.rows.size()) {
        throw LookupError("No " + locationName(loc) + " variation with id " + std::to_string(id));
    }
    const int c = t.columnIndex(column);
    if (c < 0) {
        throw LookupError("No column '" + column + "' in " + locationName(loc) + " variations");
    }
    return t.rows[id][c];
}

int InMemoryVariationStore::getOrInsertConfiguration(const VariationID& variation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (Location loc : kAllLocations) {
        const int id = variation_id[loc];
        if (id < 0 || static_cast<size_t>(id) >= table(loc).rows.size()) {
            throw LookupError("Configuration references missing " + locationName(loc) +
                              " variation " + std::to_string(id));
        }
    }
    auto it = configuration_index_.find(variation_id);
    if (it != configuration_index_.end()) {
        return it->second;
    }
    configurations_.push_back(variation_id);
    const int id = static_cast<int>(configurations_.size());
    configuration_index_.emplace(variation_id, id);
    return id;
}

size_t InMemoryVariationStore::rowCount(Location loc) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table(loc).rows.size();
}

std::vector<std::string> InMemoryVariationStore::columns(Location loc) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table(loc).columns;
}

size_t InMemoryVariationStore::configurationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configurations_.size();
}

VariationID InMemoryVariationStore::configuration(int configuration_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (configuration_id < 1 || static_cast<size_t>(configuration_id) > configurations_.size()) {
        throw LookupError("No configuration with id " + std::to_string(configuration_id));
    }
    return configurations_[configuration_id - 1];
}

void InMemoryVariationStore::writeHDF5(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);
    HighFive::File file(filename, HighFive::File::Overwrite);

    for (Location loc : kAllLocations) {
        const Table& t = table(loc);
        if (t.columns.empty()) continue;
        const std::string group = "/" + locationName(loc);
        file.createGroup(group);
        H5Easy::dump(file, group + "/columns", t.columns);
        H5Easy::dump(file, group + "/values", t.rows);
    }

    std::vector<std::vector<int>> configs;
    configs.reserve(configurations_.size());
    for (const auto& vid : configurations_) {
        configs.emplace_back(vid.ids.begin(), vid.ids.end());
    }
    std::vector<std::string> location_names;
    for (Location loc : kAllLocations) {
        location_names.push_back(locationName(loc));
    }
    H5Easy::dump(file, "/configurations/locations", location_names);
    H5Easy::dump(file, "/configurations/count", static_cast<int>(configs.size()));
    if (!configs.empty()) {
        H5Easy::dump(file, "/configurations/variation_ids", configs);
    }
}
