#include "ingest/entry_loader.hpp"
#include "core/date.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace lpi {

std::vector<EntryRecord> parse_entries(const json& document) {
    const json* array = &document;
    // Accept both a bare array and {"entries": [...]}
    if (document.is_object() && document.contains("entries")) {
        array = &document["entries"];
    }
    if (!array->is_array()) {
        throw std::runtime_error("Entries document must be a JSON array");
    }

    std::vector<EntryRecord> entries;
    std::vector<long> day_numbers;
    std::set<std::string> seen;

    for (size_t i = 0; i < array->size(); ++i) {
        const json& item = (*array)[i];
        if (!item.is_object()) {
            throw std::runtime_error("Entry #" + std::to_string(i) + " is not a JSON object");
        }

        EntryRecord entry;
        try {
            entry = EntryRecord::from_json(item);
        } catch (const json::exception& e) {
            throw std::runtime_error("Entry #" + std::to_string(i) + " has a malformed field: " + e.what());
        }

        if (entry.entry_id.empty()) {
            throw std::runtime_error("Entry #" + std::to_string(i) + " has no entry_id");
        }
        if (!seen.insert(entry.entry_id).second) {
            throw std::runtime_error("Duplicate entry_id '" + entry.entry_id + "'");
        }

        try {
            Date date = parse_iso_date(entry.date);
            day_numbers.push_back(date.to_days());
            entry.date = date.to_string();
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Entry '" + entry.entry_id + "': " + e.what());
        }

        entries.push_back(std::move(entry));
    }

    std::vector<size_t> order(entries.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return day_numbers[a] < day_numbers[b]; });

    std::vector<EntryRecord> sorted;
    sorted.reserve(entries.size());
    for (size_t i : order) sorted.push_back(std::move(entries[i]));
    return sorted;
}

std::vector<EntryRecord> load_entries(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open entries file: " + path);
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in " + path + ": " + e.what());
    }

    try {
        return parse_entries(document);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

void save_entries(const std::vector<EntryRecord>& entries, const std::string& path) {
    json arr = json::array();
    for (const auto& e : entries) arr.push_back(e.to_json());

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write entries file: " + path);
    }
    file << arr.dump(2);
}

std::string combined_text(const EntryRecord& entry) {
    std::string out;
    auto append = [&out](const char* tag, const std::string& part) {
        if (part.empty()) return;
        if (!out.empty()) out += " ";
        out += tag;
        out += part;
    };
    append("Diary: ", entry.text);
    append("Voice: ", entry.voice_transcript);
    append("Scene: ", entry.image_caption);
    return out;
}

} // namespace lpi
