/**
 * @file CStoragePathManager.cpp
 * @brief Implementation of configuration-driven store path resolution
 */

#include "CStoragePathManager.hpp"
#include <lap/core/CPath.hpp>

namespace lap {
namespace tks {

// Static member initialization
TokenStoreConfig CStoragePathManager::s_config;
bool CStoragePathManager::s_isInitialized = false;

TokenStoreConfig CStoragePathManager::getConfig() {
    if (!s_isInitialized) {
        try {
            auto json = loadTokenStoreConfig();

            auto parsed = parseConfig(json);
            if (parsed.HasValue()) {
                s_config = parsed.Value();
            } else {
                s_config = TokenStoreConfig();
                LAP_TKS_LOG_WARN << "Invalid tokenstore config, using defaults: "
                                 << parsed.Error().Message().data();
            }
        } catch (const std::exception& e) {
            // Fallback to default on error
            s_config = TokenStoreConfig();
            LAP_TKS_LOG_ERROR << "Failed to load config: " << e.what()
                              << ", using default data directory: " << s_config.dataDir.data();
        }

        s_isInitialized = true;
    }

    return s_config;
}

core::String CStoragePathManager::getDataDirectory() {
    return getConfig().dataDir;
}

core::String CStoragePathManager::getDefaultStorePath() {
    auto config = getConfig();
    return core::Path::appendString(config.dataDir, config.fileName);
}

core::String CStoragePathManager::getStoreFilePath(core::StringView instance) {
    core::String normalizedPath = normalizeInstancePath(instance);
    if (normalizedPath.empty()) {
        return getDefaultStorePath();
    }

    if (normalizedPath.front() == '/') {
        return normalizedPath;
    }

    return core::Path::appendString(getDataDirectory(), normalizedPath);
}

core::Result<TokenStoreConfig> CStoragePathManager::parseConfig(const nlohmann::json& config) {
    using result = core::Result<TokenStoreConfig>;

    TokenStoreConfig parsed;

    if (config.is_null()) {
        return result::FromValue(parsed);
    }
    if (!config.is_object()) {
        LAP_TKS_LOG_ERROR << "tokenstore config must be an object";
        return result::FromError(TksErrc::kInvalidArgument);
    }

    try {
        parsed.dataDir      = config.value("dataDir", parsed.dataDir);
        parsed.fileName     = config.value("fileName", parsed.fileName);
        parsed.cacheTtlMs   = config.value("cacheTtlMs", parsed.cacheTtlMs);
        parsed.keyField     = config.value("keyField", parsed.keyField);
        parsed.sessionField = config.value("sessionField", parsed.sessionField);
        parsed.recordsField = config.value("recordsField", parsed.recordsField);
        parsed.jsonIndent   = config.value("jsonIndent", parsed.jsonIndent);
    } catch (const nlohmann::json::exception& e) {
        LAP_TKS_LOG_ERROR << "tokenstore config has a wrongly typed value: " << e.what();
        return result::FromError(TksErrc::kInvalidArgument);
    }

    if (parsed.dataDir.empty() || parsed.fileName.empty()
        || parsed.keyField.empty() || parsed.sessionField.empty() || parsed.recordsField.empty()) {
        LAP_TKS_LOG_ERROR << "tokenstore config contains an empty path or field name";
        return result::FromError(TksErrc::kInvalidArgument);
    }

    if (parsed.keyField == parsed.sessionField) {
        LAP_TKS_LOG_ERROR << "tokenstore keyField and sessionField must differ: " << parsed.keyField.data();
        return result::FromError(TksErrc::kInvalidArgument);
    }

    if (parsed.recordsField == LAP_TKS_SALT_FIELD) {
        LAP_TKS_LOG_ERROR << "tokenstore recordsField collides with the salt field";
        return result::FromError(TksErrc::kInvalidArgument);
    }

    if (parsed.jsonIndent < 0) {
        LAP_TKS_LOG_ERROR << "tokenstore jsonIndent must not be negative: " << parsed.jsonIndent;
        return result::FromError(TksErrc::kInvalidArgument);
    }

    return result::FromValue(parsed);
}

bool CStoragePathManager::pathExists(core::StringView path) {
    return core::Path::isDirectory(path);
}

core::String CStoragePathManager::normalizeInstancePath(core::StringView instance) {
    core::String normalized(instance.data(), instance.size());

    while (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }

    return normalized;
}

nlohmann::json CStoragePathManager::loadTokenStoreConfig() {
    auto& configManager = core::ConfigManager::getInstance();

    try {
        return configManager.getModuleConfigJson(LAP_TKS_CONFIG_MODULE);
    } catch (const std::exception& e) {
        LAP_TKS_LOG_ERROR << "Failed to load tokenstore config: " << e.what();
        throw;
    }
}

} // namespace tks
} // namespace lap
