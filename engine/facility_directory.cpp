#include "facility_directory.hpp"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace

FacilityDirectory::FacilityDirectory(const std::vector<FacilityRecord>& records) {
    for (const auto& record : records) {
        facilities[trim(record.id)] = record;
    }
}

std::optional<FacilityRecord> FacilityDirectory::lookupById(const std::string& id) const {
    std::lock_guard<std::mutex> lock(directory_mutex);

    auto it = facilities.find(trim(id));
    if (it == facilities.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FacilityDirectory::setEntry(const std::string& id, const std::string& name, const std::string& address) {
    std::string key = trim(id);
    if (key.empty()) {
        throw std::invalid_argument("Facility id must not be empty");
    }

    std::lock_guard<std::mutex> lock(directory_mutex);
    facilities[key] = FacilityRecord{key, trim(name), trim(address)};
}

bool FacilityDirectory::removeEntry(const std::string& id) {
    std::lock_guard<std::mutex> lock(directory_mutex);
    return facilities.erase(trim(id)) > 0;
}

std::vector<std::string> FacilityDirectory::ids() const {
    std::lock_guard<std::mutex> lock(directory_mutex);

    std::vector<std::string> result;
    result.reserve(facilities.size());
    for (const auto& [id, record] : facilities) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t FacilityDirectory::size() const {
    std::lock_guard<std::mutex> lock(directory_mutex);
    return facilities.size();
}

size_t FacilityDirectory::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open facility file: " + path);
    }

    // Parse everything before touching the table so a bad file changes nothing
    std::vector<FacilityRecord> records;
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        size_t first = content.find(';');
        size_t second = first == std::string::npos ? std::string::npos : content.find(';', first + 1);
        if (second == std::string::npos) {
            throw std::runtime_error(path + ":" + std::to_string(line_number) +
                                     ": expected id;name;address");
        }

        FacilityRecord record;
        record.id = trim(content.substr(0, first));
        record.name = trim(content.substr(first + 1, second - first - 1));
        record.address = trim(content.substr(second + 1));
        if (record.id.empty() || record.address.empty()) {
            throw std::runtime_error(path + ":" + std::to_string(line_number) +
                                     ": id and address are required");
        }
        records.push_back(record);
    }

    {
        std::lock_guard<std::mutex> lock(directory_mutex);
        for (const auto& record : records) {
            facilities[record.id] = record;
        }
    }

    std::cout << "[INFO] Loaded " << records.size() << " facilities from " << path << "\n";
    return records.size();
}

std::vector<FacilityRecord> defaultFacilities() {
    return {
        {"1061", "Gert Svith, Birkesig Grusgrav", "Rugvænget 18, 8444 Grenå"},
        {"1013", "JJ Grus A/S (Kalbygård Grusgrav)", "Hovedvejen 24A, 8670 Låsby"},
        {"1327", "Johs. Sørensen & Sønner A/S, Ren depotjord", "Holmstrupgårdvej 9, 8220 Brabrand"},
        {"2191", "JJ Grus A/S (Ans)", "Søndermarksgade 43, 8643 Ans"},
        {"1901", "EHJ Energi & Miljø A/S - Let forurenet jord", "Hadstenvej 16, 8940 Randers SV"},
    };
}
