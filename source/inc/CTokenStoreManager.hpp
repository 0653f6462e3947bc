/**
 * @file CTokenStoreManager.hpp
 * @brief Process-wide registry of open token stores
 * @version 0.1
 * @date 2025-11-20
 *
 * One TokenStore (and therefore one write pipeline) exists per resolved file
 * path, so every caller in the process shares the same FIFO ordering.
 */
#ifndef LAP_TOKENSTORE_TOKENSTOREMANAGER_HPP
#define LAP_TOKENSTORE_TOKENSTOREMANAGER_HPP

#include <lap/core/CInstanceSpecifier.hpp>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"
#include "CTokenStore.hpp"

namespace lap
{
namespace tks
{
    class CTokenStoreManager final
    {
    public:
        IMP_OPERATOR_NEW(CTokenStoreManager)

    private:
        using _TokenStoreMap    = core::UnorderedMap< core::String, core::SharedHandle< TokenStore > >;

    public:
        static CTokenStoreManager& getInstance() noexcept
        {
            static CTokenStoreManager instance;

            return instance;
        }

        core::Bool                              initialize() noexcept;
        void                                    uninitialize() noexcept;
        inline core::Bool                       isInitialized() noexcept             { return m_bInitialized; }

        /**
         * @brief Get or open the store behind an instance specifier
         * @param indicate File name under the data directory, or an absolute path
         * @param bCreate Create the file if it doesn't exist
         * @return kNotInitialized before initialize(), kStoreNotFound when the
         *         file is missing and bCreate is false
         */
        core::Result< core::SharedHandle< TokenStore > >        getTokenStore( const core::InstanceSpecifier&, core::Bool bCreate = false ) noexcept;

        /**
         * @brief Get or open the store at a resolved file path
         */
        core::Result< core::SharedHandle< TokenStore > >        getTokenStoreByPath( core::StringView strFile, core::Bool bCreate = false ) noexcept;

        /**
         * @brief Close a store; queued writes finish first
         */
        core::Result< void >                    CloseTokenStore( const core::InstanceSpecifier& ) noexcept;

        inline const TokenStoreConfig&          getConfig() const noexcept              { return m_config; }
        core::Size                              getOpenStoreCount() noexcept;

    protected:
        CTokenStoreManager() noexcept;
        ~CTokenStoreManager() noexcept;

    private:
        core::Bool                              m_bInitialized{ false };
        TokenStoreConfig                        m_config;

        core::Mutex                             m_mtxStoreMap;
        _TokenStoreMap                          m_storeMap;
    };

    core::Result< core::SharedHandle< TokenStore > >               OpenTokenStore( const core::InstanceSpecifier &, core::Bool bCreate ) noexcept;
    core::Result< core::SharedHandle< TokenStore > >               OpenTokenStore( const core::InstanceSpecifier & ) noexcept;
} // namespace tks
} // namespace lap

#endif // LAP_TOKENSTORE_TOKENSTOREMANAGER_HPP
