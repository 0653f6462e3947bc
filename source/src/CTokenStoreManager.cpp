#include <lap/core/CFile.hpp>
#include <lap/log/CLog.hpp>

#include "CTokenStoreManager.hpp"
#include "CStoragePathManager.hpp"

namespace lap
{
namespace tks
{
    core::Bool CTokenStoreManager::initialize() noexcept
    {
        if ( m_bInitialized )     return true;

        m_config = CStoragePathManager::getConfig();

        LAP_TKS_LOG_INFO << "CTokenStoreManager initialized, data directory: " << m_config.dataDir;

        m_bInitialized = true;

        return true;
    }

    void CTokenStoreManager::uninitialize() noexcept
    {
        if ( !m_bInitialized )    return;

        // drain every write pipeline before the handles go away
        {
            core::LockGuard lock( m_mtxStoreMap );

            for ( auto&& it = m_storeMap.begin(); it != m_storeMap.end(); ++it ) {
                it->second->Close();
            }

            m_storeMap.clear();
        }

        m_bInitialized = false;
    }

    core::Result< core::SharedHandle< TokenStore > > CTokenStoreManager::getTokenStore( const core::InstanceSpecifier& indicate, core::Bool bCreate ) noexcept
    {
        using result = core::Result< core::SharedHandle< TokenStore > >;

        if ( !m_bInitialized ) return result::FromError( TksErrc::kNotInitialized );

        core::StringView instanceId = indicate.ToString();

        if ( instanceId.empty() ) {
            LAP_TKS_LOG_WARN << "CTokenStoreManager::getTokenStore with invalid instance specifier";
            return result::FromError( TksErrc::kStoreNotFound );
        }

        return getTokenStoreByPath( CStoragePathManager::getStoreFilePath( instanceId ), bCreate );
    }

    core::Result< core::SharedHandle< TokenStore > > CTokenStoreManager::getTokenStoreByPath( core::StringView strFile, core::Bool bCreate ) noexcept
    {
        using result = core::Result< core::SharedHandle< TokenStore > >;

        if ( !m_bInitialized ) return result::FromError( TksErrc::kNotInitialized );

        if ( strFile.empty() ) return result::FromError( TksErrc::kInvalidArgument );

        core::String strPath( strFile.data(), strFile.size() );

        core::LockGuard lock( m_mtxStoreMap );

        auto&& it = m_storeMap.find( strPath );
        if ( it != m_storeMap.end() ) {
            return result::FromValue( it->second );
        }

        if ( !bCreate && !core::File::Util::exists( strPath.c_str() ) ) {
            LAP_TKS_LOG_WARN << "CTokenStoreManager::getTokenStore store file not found: " << strPath;
            return result::FromError( TksErrc::kStoreNotFound );
        }

        auto store = ::std::make_shared< TokenStore >( strPath, m_config );

        if ( bCreate ) {
            // create or migrate the file now so open failures surface here
            store->GetSalt();
            if ( !core::File::Util::exists( strPath.c_str() ) ) {
                LAP_TKS_LOG_ERROR << "CTokenStoreManager::getTokenStore can not create " << strPath;
                return result::FromError( TksErrc::kPhysicalStorageFailure );
            }
        }

        m_storeMap.emplace( strPath, store );

        LAP_TKS_LOG_INFO << "Opened token store: " << strPath;
        return result::FromValue( store );
    }

    core::Result< void > CTokenStoreManager::CloseTokenStore( const core::InstanceSpecifier& indicate ) noexcept
    {
        using result = core::Result< void >;

        if ( !m_bInitialized ) return result::FromError( TksErrc::kNotInitialized );

        core::String strPath = CStoragePathManager::getStoreFilePath( indicate.ToString() );

        core::LockGuard lock( m_mtxStoreMap );

        auto&& it = m_storeMap.find( strPath );
        if ( it == m_storeMap.end() ) {
            return result::FromError( TksErrc::kStoreNotFound );
        }

        it->second->Close();
        m_storeMap.erase( it );

        return result::FromValue();
    }

    core::Size CTokenStoreManager::getOpenStoreCount() noexcept
    {
        core::LockGuard lock( m_mtxStoreMap );

        return m_storeMap.size();
    }

    CTokenStoreManager::CTokenStoreManager() noexcept
    {
        ;
    }

    CTokenStoreManager::~CTokenStoreManager() noexcept
    {
        uninitialize();
    }

    core::Result< core::SharedHandle< TokenStore > > OpenTokenStore( const core::InstanceSpecifier &store, core::Bool bCreate ) noexcept
    {
        return CTokenStoreManager::getInstance().getTokenStore( store, bCreate );
    }

    core::Result< core::SharedHandle< TokenStore > > OpenTokenStore( const core::InstanceSpecifier &store ) noexcept
    {
        return CTokenStoreManager::getInstance().getTokenStore( store );
    }
} // namespace tks
} // namespace lap
