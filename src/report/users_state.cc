#include "users_state.h"

#include <filesystem>
#include <fstream>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Reloaded {

UsersState UsersState::Load(const std::string& filename) {
    UsersState state;
    if (!std::filesystem::exists(filename)) {
        VLOG(1) << "No users state at " << filename << ", starting empty";
        return state;
    }

    try {
        YAML::Node root = YAML::LoadFile(filename);
        for (const auto& entry : root) {
            uint64_t execution_id = entry.first.as<uint64_t>();
            const YAML::Node& node = entry.second;

            SavedUserState saved;
            saved.homeserver_url = node["homeserver_url"].as<std::string>("");
            saved.amount = node["amount"].as<size_t>(0);
            if (node["friendships"]) {
                for (const auto& pair : node["friendships"]) {
                    if (pair.size() != 2) {
                        LOG(WARNING) << "Skipping malformed friendship in " << filename;
                        continue;
                    }
                    saved.friendships.emplace_back(pair[0].as<std::string>(), pair[1].as<std::string>());
                }
            }
            state.entries_[execution_id] = std::move(saved);
        }
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Error parsing users state " << filename << ": " << e.what();
        state.entries_.clear();
    }
    return state;
}

bool UsersState::Save(const std::string& filename) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [execution_id, saved] : entries_) {
        out << YAML::Key << execution_id << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "homeserver_url" << YAML::Value << saved.homeserver_url;
        out << YAML::Key << "amount" << YAML::Value << saved.amount;
        out << YAML::Key << "friendships" << YAML::Value << YAML::BeginSeq;
        for (const auto& [first, second] : saved.friendships) {
            out << YAML::Flow << YAML::BeginSeq << first << second << YAML::EndSeq;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG(ERROR) << "Failed to open users state " << filename << " for writing";
        return false;
    }
    file << out.c_str() << "\n";
    file.close();
    if (file.fail()) {
        LOG(ERROR) << "Failed to write users state " << filename;
        return false;
    }
    return true;
}

void UsersState::AddUsers(uint64_t execution_id, SavedUserState state) {
    entries_[execution_id] = std::move(state);
}

size_t UsersState::TotalUsers(const std::string& homeserver_url) const {
    size_t total = 0;
    for (const auto& [execution_id, saved] : entries_) {
        if (saved.homeserver_url == homeserver_url) {
            total += saved.amount;
        }
    }
    return total;
}

} // namespace Reloaded
