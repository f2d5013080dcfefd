#pragma once

#include "types.hpp"
#include <optional>
#include <string>

namespace tether {

// ============================================================================
// record - one row of the tracked table
// ============================================================================

struct record {
    std::string id;            // UUID, immutable once assigned
    std::string name;
    std::string owner_id;
    timestamp_t created_at{};
    timestamp_t updated_at{};  // non-decreasing per id
    bool deleted = false;      // tombstone

    bool operator==(const record& other) const {
        return id == other.id && name == other.name && owner_id == other.owner_id &&
               created_at == other.created_at && updated_at == other.updated_at &&
               deleted == other.deleted;
    }
    bool operator!=(const record& other) const { return !(*this == other); }

    // Serialize as a backend row: {"id","name","owner_id","created_at","updated_at","deleted"}
    std::string to_json() const;

    // Accepts "owner_id" or "user_id" for the owner column. Returns nullopt on
    // malformed JSON or a missing id.
    static std::optional<record> from_json(const std::string& json);
};

// Partial update. Only the name is mutable through the facade.
struct record_patch {
    std::optional<std::string> name;

    bool empty() const { return !name.has_value(); }
};

} // namespace tether
