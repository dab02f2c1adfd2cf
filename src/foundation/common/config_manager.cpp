#include "rk/foundation/config_manager.hpp"

#include <algorithm>
#include <set>

#include "rk/foundation/limiter_logger.hpp"

namespace rk::foundation {

LimiterResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return loadNode(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        RK_LOG_ERROR(LogCategory::Config, "failed to open config file: " + path.string());
        return LimiterResult<void>::err(
            LimiterError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        RK_LOG_ERROR(LogCategory::Config, std::string("YAML parse error: ") + e.what());
        return LimiterResult<void>::err(
            LimiterError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

LimiterResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        return loadNode(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        RK_LOG_ERROR(LogCategory::Config, std::string("YAML parse error: ") + e.what());
        return LimiterResult<void>::err(
            LimiterError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

LimiterResult<void> ConfigManager::loadNode(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
    return LimiterResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childKeys(std::string_view section) const {
    std::lock_guard lock(mutex_);
    std::string prefix(section);
    if (!prefix.empty()) {
        prefix += '.';
    }

    std::set<std::string> names;
    for (const auto& [key, node] : entries_) {
        if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        auto rest = key.substr(prefix.size());
        names.insert(rest.substr(0, rest.find('.')));
    }
    return {names.begin(), names.end()};
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

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it != watchers_.end()) {
            callbacks = it->second;
        }
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace rk::foundation
