/**
 * @file CDataType.hpp
 * @brief Common types, configuration and logging of the TokenStore module
 * @version 0.1
 * @date 2025-11-20
 *
 *
 */
#ifndef LAP_TOKENSTORE_DATATYPE_HPP
#define LAP_TOKENSTORE_DATATYPE_HPP

#include <functional>
#include <nlohmann/json.hpp>

// core
#include <lap/core/CTypedef.hpp>
#include <lap/core/CString.hpp>
#include <lap/log/CLog.hpp>

// tokenstore common
#include "CTksErrorDomain.hpp"

namespace lap
{
namespace tks
{
    // ========================================================================
    // Logging Configuration
    // ========================================================================
    #define LAP_TKS_LOG_CONTEXT_ID       "TKS"
    #define LAP_TKS_LOG_CONTEXT_DESC     "TokenStore log ctx"

#if !defined(LAP_DEBUG) && !defined(LAP_TKS_NO_DEBUG_LOG)
    #define LAP_DEBUG
#endif

#ifdef LAP_DEBUG
    #define LAP_TKS_LOG                  LAP_LOG( LAP_TKS_LOG_CONTEXT_ID, LAP_TKS_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kVerbose )
    #define LAP_TKS_LOG_VERBOSE          LAP_TKS_LOG.LogVerbose().WithLocation( __FILE__, __LINE__ )
    #define LAP_TKS_LOG_DEBUG            LAP_TKS_LOG.LogDebug().WithLocation( __FILE__, __LINE__ )
    #define LAP_TKS_LOG_INFO             LAP_TKS_LOG.LogInfo().WithLocation( __FILE__, __LINE__ )
#else
    #define LAP_TKS_LOG                  LAP_LOG( LAP_TKS_LOG_CONTEXT_ID, LAP_TKS_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kWarn )
    #define LAP_TKS_LOG_VERBOSE          LAP_TKS_LOG.LogOff()
    #define LAP_TKS_LOG_DEBUG            LAP_TKS_LOG.LogOff()
    #define LAP_TKS_LOG_INFO             LAP_TKS_LOG.LogOff()
#endif
    #define LAP_TKS_LOG_WARN             LAP_TKS_LOG.LogWarn().WithLocation( __FILE__, __LINE__ )
    #define LAP_TKS_LOG_ERROR            LAP_TKS_LOG.LogError().WithLocation( __FILE__, __LINE__ )
    #define LAP_TKS_LOG_FATAL            LAP_TKS_LOG.LogFatal().WithLocation( __FILE__, __LINE__ )

    // ========================================================================
    // Default Configuration
    // ========================================================================
    #define LAP_TKS_CONFIG_MODULE                   "tokenstore"

    #define LAP_TKS_DEFAULT_DATA_DIR                "/tmp/lap_tokenstore"
    #define LAP_TKS_DEFAULT_FILE_NAME               "accounts.json"
    #define LAP_TKS_DEFAULT_CACHE_TTL_MS            5000U

    // Record layout
    #define LAP_TKS_DEFAULT_KEY_FIELD               "refresh_token"
    #define LAP_TKS_DEFAULT_SESSION_FIELD           "sessionId"
    #define LAP_TKS_DEFAULT_RECORDS_FIELD           "tokens"
    #define LAP_TKS_SALT_FIELD                      "salt"

    #define LAP_TKS_DEFAULT_JSON_INDENT             2

    // Salt: number of random bytes, hex encoded
    #define LAP_TKS_SALT_BYTES                      32U

    // ========================================================================
    // Records
    // ========================================================================

    /**
     * @brief One token record: a JSON object keyed by its key field
     */
    using Record        = nlohmann::json;
    using RecordList    = core::Vector< Record >;

    /**
     * @brief Produces a fresh random salt; called once per store bootstrap
     */
    using SaltGenerator = ::std::function< core::String() >;

    /**
     * @brief Structural shape of a decoded store file
     */
    enum class DocumentShape : core::UInt8
    {
        kLegacySequence     = 0,    // bare array of records, no salt
        kDocument           = 1,    // { salt, tokens: [...] }
        kDocumentNoRecords  = 2,    // object without a usable record array
        kUnrecognized       = 3     // scalar or null
    };

    /**
     * @brief Outcome of a merge that did not fail
     */
    enum class MergeStatus : core::UInt8
    {
        kApplied            = 0,    // merged sequence was persisted
        kSkipped            = 1     // store unreadable and empty, nothing written
    };

    // ========================================================================
    // TokenStore Configuration Structure
    // ========================================================================

    /**
     * @brief TokenStore module configuration
     * Loaded from Core::ConfigManager "tokenstore" module
     */
    struct TokenStoreConfig {
        core::String dataDir{ LAP_TKS_DEFAULT_DATA_DIR };
        core::String fileName{ LAP_TKS_DEFAULT_FILE_NAME };
        core::UInt32 cacheTtlMs{ LAP_TKS_DEFAULT_CACHE_TTL_MS };
        core::String keyField{ LAP_TKS_DEFAULT_KEY_FIELD };
        core::String sessionField{ LAP_TKS_DEFAULT_SESSION_FIELD };
        core::String recordsField{ LAP_TKS_DEFAULT_RECORDS_FIELD };
        core::Int32  jsonIndent{ LAP_TKS_DEFAULT_JSON_INDENT };
    };

    /**
     * @brief Field names that define the record layout of one store
     */
    struct RecordLayout {
        core::String keyField{ LAP_TKS_DEFAULT_KEY_FIELD };
        core::String sessionField{ LAP_TKS_DEFAULT_SESSION_FIELD };
        core::String recordsField{ LAP_TKS_DEFAULT_RECORDS_FIELD };
    };

    inline RecordLayout toLayout( const TokenStoreConfig& config )
    {
        return RecordLayout{ config.keyField, config.sessionField, config.recordsField };
    }

    core::String shapeToString( DocumentShape shape ) noexcept;

} // namespace tks
} // namespace lap

#endif
