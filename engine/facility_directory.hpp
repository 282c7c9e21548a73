#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <mutex>

struct FacilityRecord {
    std::string id;
    std::string name;
    std::string address;
};

// Identifier -> facility lookup consumed by the resolver
class FacilityLookup {
public:
    virtual ~FacilityLookup() = default;
    virtual std::optional<FacilityRecord> lookupById(const std::string& id) const = 0;
};

// In-memory facility table. Slowly changing; safe for concurrent readers
// and writers.
class FacilityDirectory : public FacilityLookup {
private:
    mutable std::mutex directory_mutex;
    std::unordered_map<std::string, FacilityRecord> facilities;  // id -> record

public:
    FacilityDirectory() = default;
    explicit FacilityDirectory(const std::vector<FacilityRecord>& records);

    std::optional<FacilityRecord> lookupById(const std::string& id) const override;

    void setEntry(const std::string& id, const std::string& name, const std::string& address);
    bool removeEntry(const std::string& id);
    std::vector<std::string> ids() const;
    size_t size() const;

    // Reads "id;name;address" lines ('#' comments and blank lines skipped).
    // Returns the number of records loaded; throws std::runtime_error if the
    // file cannot be opened or a line is malformed.
    size_t loadFromFile(const std::string& path);
};

// Receiving facilities known out of the box
std::vector<FacilityRecord> defaultFacilities();
