#include "gbe/foundation/config_manager.hpp"

#include <algorithm>

#include "gbe/foundation/battle_logger.hpp"

namespace gbe::foundation {

BattleResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        GBE_LOG_INFO(LogCategory::Config, "loaded configuration from " + path.string());
        return BattleResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return BattleResult<void>::err(
            BattleError(ErrorCode::ConfigLoadFailed,
                        "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return BattleResult<void>::err(
            BattleError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

BattleResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return BattleResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return BattleResult<void>::err(
            BattleError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, node] : entries_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace gbe::foundation
