/**
 * @file CStoreDocument.hpp
 * @brief Decoding and encoding of the on-disk store document
 * @version 0.1
 * @date 2025-11-20
 *
 * Current format:
 * ```json
 * {
 *   "salt": "5f0c...",
 *   "tokens": [ { "refresh_token": "...", ... } ]
 * }
 * ```
 *
 * Legacy format (no salt) is a bare array of records. Both decode into
 * the same StoreDocument; the shape tag tells the caller which one was found.
 */
#ifndef LAP_TOKENSTORE_STOREDOCUMENT_HPP
#define LAP_TOKENSTORE_STOREDOCUMENT_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace tks
{
    struct StoreDocument
    {
        DocumentShape                       shape{ DocumentShape::kUnrecognized };
        core::String                        salt;       ///< Empty when the file carries no usable salt
        RecordList                          records;    ///< Valid for kLegacySequence and kDocument
        nlohmann::json                      root;       ///< Parsed top-level value as found on disk

        core::Bool hasRecords() const noexcept
        {
            return shape == DocumentShape::kLegacySequence || shape == DocumentShape::kDocument;
        }
    };

    class CStoreDocument final
    {
    public:
        /**
         * @brief Parse file content into a StoreDocument
         *
         * An empty text decodes as an empty object.
         * @return kIntegrityCorrupted if the text is not valid JSON
         */
        static core::Result< StoreDocument > Decode( core::StringView strText, const RecordLayout& layout ) noexcept;

        /**
         * @brief Serialize { salt, <recordsField>: records }
         * @return kInvalidRecord if the records cannot be serialized
         */
        static core::Result< core::String > Encode( core::StringView strSalt, const RecordList& records,
                                                    const RecordLayout& layout, core::Int32 indent ) noexcept;

        /**
         * @brief Serialize an arbitrary root value (used for in-place migration)
         */
        static core::Result< core::String > Dump( const nlohmann::json& root, core::Int32 indent ) noexcept;

    private:
        CStoreDocument() = delete;
    };
} // namespace tks
} // namespace lap

#endif // LAP_TOKENSTORE_STOREDOCUMENT_HPP
