/**
 * @file CStoragePathManager.hpp
 * @brief Configuration-driven store path resolution
 *
 * Directory Structure:
 * {dataDir}/
 * ├── accounts.json            # default store ({fileName})
 * └── {instance}               # named store files, relative to dataDir
 *
 * Absolute instance specifiers ("/var/lib/app/tokens.json") are used as-is.
 *
 * @note All paths use Core::Path and Core::ConfigManager
 */

#ifndef LAP_TOKENSTORE_CSTORAGEPATHMANAGER_HPP
#define LAP_TOKENSTORE_CSTORAGEPATHMANAGER_HPP

#include <lap/core/CCore.hpp>
#include <lap/core/CConfig.hpp>

#include "CDataType.hpp"

namespace lap {
namespace tks {

/**
 * @class CStoragePathManager
 * @brief Resolves the token store configuration and the file behind each store instance
 */
class CStoragePathManager {
public:
    /**
     * @brief Get the validated token store configuration
     * @return Configuration from module "tokenstore", defaults for missing keys
     * @note Loaded once and cached; an invalid configuration falls back to defaults
     */
    static TokenStoreConfig getConfig();

    /**
     * @brief Get the data directory
     * @return {dataDir} (e.g., "/tmp/lap_tokenstore")
     */
    static core::String getDataDirectory();

    /**
     * @brief Get the default store file path
     * @return {dataDir}/{fileName}
     */
    static core::String getDefaultStorePath();

    /**
     * @brief Get the store file path for an instance
     * @param instance File name relative to dataDir (e.g., "work/accounts.json")
     *                 or an absolute file path
     * @return Resolved file path, the default store for an empty instance
     */
    static core::String getStoreFilePath(core::StringView instance);

    /**
     * @brief Parse and validate a "tokenstore" module configuration
     * @param config Module JSON, missing keys keep their defaults
     * @return kInvalidArgument on empty fields, identical key and session
     *         fields, wrongly typed values or a negative indent
     */
    static core::Result<TokenStoreConfig> parseConfig(const nlohmann::json& config);

    /**
     * @brief Check if a path exists and is a directory
     */
    static bool pathExists(core::StringView path);

#ifdef UNIT_TEST
    /**
     * @brief Reset cached configuration for testing
     * @note Only available in test builds
     */
    static void resetForTesting() {
        s_isInitialized = false;
        s_config = TokenStoreConfig();
    }

    /**
     * @brief Replace the cached configuration for testing
     */
    static void setConfigForTesting(const TokenStoreConfig& config) {
        s_config = config;
        s_isInitialized = true;
    }
#endif

private:
    /**
     * @brief Normalize instance path by removing trailing slashes
     */
    static core::String normalizeInstancePath(core::StringView instance);

    /**
     * @brief Load configuration from Core::ConfigManager
     * @throw If configuration module "tokenstore" cannot be read
     */
    static nlohmann::json loadTokenStoreConfig();

    // Cached configuration (loaded on first access)
    static TokenStoreConfig s_config;
    static bool s_isInitialized;
};

} // namespace tks
} // namespace lap

#endif // LAP_TOKENSTORE_CSTORAGEPATHMANAGER_HPP
