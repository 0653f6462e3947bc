/**
 * @file CTokenStorage.hpp
 * @brief
 * @version 0.1
 * @date 2025-11-20
 *
 *
 */
#ifndef LAP_TOKENSTORE_TOKENSTORAGE_HPP
#define LAP_TOKENSTORE_TOKENSTORAGE_HPP

#include <lap/core/CCore.hpp>
#include <lap/log/CLog.hpp>

// tks common
#include "CDataType.hpp"
#include "CTksErrorDomain.hpp"

// file primitives
#include "CAtomicFileWriter.hpp"
#include "CStoreDocument.hpp"
#include "CSaltGenerator.hpp"

// store
#include "CTokenStore.hpp"

#include "CStoragePathManager.hpp"
#include "CTokenStoreManager.hpp"

#endif
