#pragma once

#include "target_path.hpp"

#include <array>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// One parameter-row id per location. Locations that are not varied keep the
// caller's reference id.
struct VariationID {
    std::array<int, kNumLocations> ids{};

    int& operator[](Location loc) { return ids[locationIndex(loc)]; }
    int operator[](Location loc) const { return ids[locationIndex(loc)]; }

    bool operator<(const VariationID& other) const { return ids < other.ids; }
    bool operator==(const VariationID& other) const { return ids == other.ids; }
    bool operator!=(const VariationID& other) const { return ids != other.ids; }
};

using ColumnValues = std::vector<std::pair<std::string, double>>;

// Persistence collaborator. Every get-or-insert is atomic: identical tuples
// always resolve to the same id, also under concurrent callers.
class VariationStore {
public:
    virtual ~VariationStore() = default;

    // Register varied columns that do not exist yet (existing rows take the
    // location's base value) and return the existing columns not being varied.
    virtual std::vector<std::string> prepareColumns(Location loc,
                                                    const std::vector<std::string>& varied_columns) = 0;

    virtual int getOrInsertRow(Location loc, const ColumnValues& static_values,
                               const ColumnValues& varied_values) = 0;

    // Throws LookupError if the row or column is absent
    virtual double referenceValue(Location loc, int id, const std::string& column) const = 0;

    // Configuration: one full VariationID, i.e. one concrete parameter combination
    virtual int getOrInsertConfiguration(const VariationID& variation_id) = 0;
};

// Thread-safe in-memory store. Row 0 of every location is the base row built
// from the registered base values; configuration ids start at 1.
class InMemoryVariationStore : public VariationStore {
public:
    InMemoryVariationStore() = default;

    // Base values must be registered before their column is first varied
    void setBaseValue(const TargetPath& target, double value);
    void setBaseValue(Location loc, const std::string& column, double value);

    std::vector<std::string> prepareColumns(Location loc,
                                            const std::vector<std::string>& varied_columns) override;
    int getOrInsertRow(Location loc, const ColumnValues& static_values,
                       const ColumnValues& varied_values) override;
    double referenceValue(Location loc, int id, const std::string& column) const override;
    int getOrInsertConfiguration(const VariationID& variation_id) override;

    size_t rowCount(Location loc) const;
    std::vector<std::string> columns(Location loc) const;
    size_t configurationCount() const;
    VariationID configuration(int configuration_id) const;

    // Snapshot of every parameter table and the configuration map
    void writeHDF5(const std::string& filename) const;

private:
    struct Table {
        std::vector<std::string> columns;
        std::vector<std::vector<double>> rows{std::vector<double>{}};
        std::map<std::vector<double>, int> index{{std::vector<double>{}, 0}};
        std::map<std::string, double> base_values;

        int columnIndex(const std::string& column) const;
    };

    Table& table(Location loc) { return tables_[locationIndex(loc)]; }
    const Table& table(Location loc) const { return tables_[locationIndex(loc)]; }

    mutable std::mutex mutex_;
    std::array<Table, kNumLocations> tables_;
    std::vector<VariationID> configurations_;
    std::map<VariationID, int> configuration_index_;
};
