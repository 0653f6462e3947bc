#include "CStoreDocument.hpp"

namespace lap
{
namespace tks
{
    core::Result< StoreDocument > CStoreDocument::Decode( core::StringView strText, const RecordLayout& layout ) noexcept
    {
        using result = core::Result< StoreDocument >;

        StoreDocument document;

        try {
            if ( strText.empty() ) {
                document.root = nlohmann::json::object();
            } else {
                document.root = nlohmann::json::parse( strText.begin(), strText.end() );
            }
        } catch ( const nlohmann::json::parse_error& e ) {
            LAP_TKS_LOG_WARN.logFormat( "CStoreDocument::Decode parse JSON failed with exception: %s", e.what() );
            return result::FromError( TksErrc::kIntegrityCorrupted );
        }

        const auto& root = document.root;

        if ( root.is_array() ) {
            document.shape = DocumentShape::kLegacySequence;
            document.records.assign( root.begin(), root.end() );
            return result::FromValue( ::std::move( document ) );
        }

        if ( !root.is_object() ) {
            document.shape = DocumentShape::kUnrecognized;
            return result::FromValue( ::std::move( document ) );
        }

        auto saltIt = root.find( LAP_TKS_SALT_FIELD );
        if ( saltIt != root.end() && saltIt->is_string() ) {
            document.salt = saltIt->get< ::std::string >();
        }

        auto recordsIt = root.find( layout.recordsField );
        if ( recordsIt != root.end() && recordsIt->is_array() ) {
            document.shape = DocumentShape::kDocument;
            document.records.assign( recordsIt->begin(), recordsIt->end() );
        } else {
            document.shape = DocumentShape::kDocumentNoRecords;
        }

        return result::FromValue( ::std::move( document ) );
    }

    core::Result< core::String > CStoreDocument::Encode( core::StringView strSalt, const RecordList& records,
                                                         const RecordLayout& layout, core::Int32 indent ) noexcept
    {
        nlohmann::json root = nlohmann::json::object();
        root[ LAP_TKS_SALT_FIELD ]  = ::std::string( strSalt.data(), strSalt.size() );
        root[ layout.recordsField ] = nlohmann::json::array();

        for ( const auto& record : records ) {
            root[ layout.recordsField ].push_back( record );
        }

        return Dump( root, indent );
    }

    core::Result< core::String > CStoreDocument::Dump( const nlohmann::json& root, core::Int32 indent ) noexcept
    {
        using result = core::Result< core::String >;

        try {
            return result::FromValue( root.dump( indent ) );
        } catch ( const nlohmann::json::type_error& e ) {
            // invalid UTF-8 inside a string value
            LAP_TKS_LOG_ERROR.logFormat( "CStoreDocument::Dump failed with exception: %s", e.what() );
            return result::FromError( TksErrc::kInvalidRecord );
        }
    }
} // namespace tks
} // namespace lap
