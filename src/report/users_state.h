#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Reloaded {

/**
 * Users created by one run
 */
struct SavedUserState {
    std::string homeserver_url;
    size_t amount = 0;
    // Localpart pairs
    std::vector<std::pair<std::string, std::string>> friendships;
};

/**
 * Cross-run user counters keyed by execution id, persisted as YAML
 */
class UsersState {
public:
    /**
     * Loads the file; a missing file yields an empty state.
     * Parse failures are logged and also yield an empty state.
     */
    static UsersState Load(const std::string& filename);

    /**
     * Rewrites the file with the current entries
     * @return false if the file couldn't be written
     */
    bool Save(const std::string& filename) const;

    void AddUsers(uint64_t execution_id, SavedUserState state);

    const std::map<uint64_t, SavedUserState>& entries() const { return entries_; }

    // Users created across every recorded run against the homeserver
    size_t TotalUsers(const std::string& homeserver_url) const;

private:
    std::map<uint64_t, SavedUserState> entries_;
};

} // namespace Reloaded
