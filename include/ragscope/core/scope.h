#pragma once

#include <ragscope/core/types.h>

#include <cstdint>
#include <functional>
#include <string>

namespace ragscope {

/**
 * Isolation boundary for every persisted entity: a folder owned by one user.
 * Two scopes are equal only when both components match.
 */
struct Scope {
    int64_t folder_id = -1;
    std::string owner_id;

    Scope() = default;
    Scope(int64_t folder, std::string owner) : folder_id(folder), owner_id(std::move(owner)) {}

    bool isValid() const { return folder_id >= 0 && !owner_id.empty(); }

    // Stable textual form used in log lines and storage keys
    std::string toString() const { return std::to_string(folder_id) + ":" + owner_id; }

    bool operator==(const Scope& other) const {
        return folder_id == other.folder_id && owner_id == other.owner_id;
    }
    bool operator!=(const Scope& other) const { return !(*this == other); }
    bool operator<(const Scope& other) const {
        return folder_id != other.folder_id ? folder_id < other.folder_id
                                            : owner_id < other.owner_id;
    }
};

inline Result<void> validateScope(const Scope& scope) {
    if (scope.folder_id < 0) {
        return Error{ErrorCode::ValidationError,
                     "Malformed scope: negative folder id " + std::to_string(scope.folder_id)};
    }
    if (scope.owner_id.empty()) {
        return Error{ErrorCode::ValidationError, "Malformed scope: empty owner id"};
    }
    return {};
}

} // namespace ragscope

template <> struct std::hash<ragscope::Scope> {
    size_t operator()(const ragscope::Scope& s) const noexcept {
        size_t h = std::hash<int64_t>{}(s.folder_id);
        return h ^ (std::hash<std::string>{}(s.owner_id) + 0x9e3779b97f4a7c15ull + (h << 6) +
                    (h >> 2));
    }
};
