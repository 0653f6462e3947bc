/**
 * @file CSaltGenerator.hpp
 * @brief Default salt source of the token store
 * @version 0.1
 * @date 2025-11-20
 */
#ifndef LAP_TOKENSTORE_SALTGENERATOR_HPP
#define LAP_TOKENSTORE_SALTGENERATOR_HPP

#include <lap/core/CString.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace tks
{
    class CSaltGenerator final
    {
    public:
        /**
         * @brief LAP_TKS_SALT_BYTES random bytes as lowercase hex
         * @throws std::system_error if the random device cannot be opened
         */
        static core::String Generate();

        /**
         * @brief Process-local salt seeded from the clock, pid and thread
         * @note Not for persistence; used when the configured source fails
         */
        static core::String Fallback() noexcept;

        static SaltGenerator Default() noexcept
        {
            return &CSaltGenerator::Generate;
        }

    private:
        CSaltGenerator() = delete;
    };
} // namespace tks
} // namespace lap

#endif // LAP_TOKENSTORE_SALTGENERATOR_HPP
