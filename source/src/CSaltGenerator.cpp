#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <random>
#include <thread>
#include <unistd.h>

#include <lap/core/CCrypto.hpp>
#include "CSaltGenerator.hpp"

namespace lap
{
namespace tks
{
    namespace
    {
        template< typename Engine >
        core::String toSalt( Engine& engine )
        {
            core::UInt8 bytes[ LAP_TKS_SALT_BYTES ];
            for ( core::Size i = 0; i < LAP_TKS_SALT_BYTES; i += sizeof( core::UInt32 ) ) {
                core::UInt32 value = static_cast< core::UInt32 >( engine() );
                bytes[i]        = static_cast< core::UInt8 >( value & 0xFF );
                bytes[i + 1]    = static_cast< core::UInt8 >( ( value >> 8 ) & 0xFF );
                bytes[i + 2]    = static_cast< core::UInt8 >( ( value >> 16 ) & 0xFF );
                bytes[i + 3]    = static_cast< core::UInt8 >( ( value >> 24 ) & 0xFF );
            }

            core::String salt = core::Crypto::Util::bytesToHex( bytes, LAP_TKS_SALT_BYTES );
            ::std::transform( salt.begin(), salt.end(), salt.begin(),
                              []( unsigned char c ) { return static_cast< char >( ::std::tolower( c ) ); } );

            return salt;
        }
    }

    core::String CSaltGenerator::Generate()
    {
        ::std::random_device rd;
        return toSalt( rd );
    }

    core::String CSaltGenerator::Fallback() noexcept
    {
        auto seed = static_cast< core::UInt64 >( ::std::chrono::steady_clock::now().time_since_epoch().count() )
                  ^ ( static_cast< core::UInt64 >( ::getpid() ) << 32 )
                  ^ static_cast< core::UInt64 >( ::std::hash< ::std::thread::id >()( ::std::this_thread::get_id() ) );

        ::std::mt19937 engine( static_cast< ::std::mt19937::result_type >( seed ^ ( seed >> 32 ) ) );
        return toSalt( engine );
    }
} // namespace tks
} // namespace lap
