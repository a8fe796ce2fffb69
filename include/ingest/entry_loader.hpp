#pragma once

#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lpi {

/**
 * @brief Load daily entries from a JSON array file
 *
 * Entries are validated (non-empty unique entry_id, ISO date) and returned
 * in chronological order; entries on the same date keep file order.
 *
 * @throws std::runtime_error naming the file or offending entry
 */
std::vector<EntryRecord> load_entries(const std::string& path);

// Same validation over an already parsed document
std::vector<EntryRecord> parse_entries(const nlohmann::json& document);

void save_entries(const std::vector<EntryRecord>& entries, const std::string& path);

// "Diary: <text> Voice: <transcript> Scene: <caption>", empty parts skipped
std::string combined_text(const EntryRecord& entry);

} // namespace lpi
