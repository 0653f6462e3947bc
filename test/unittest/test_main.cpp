/**
 * @file test_main.cpp
 * @brief Main entry point for TokenStore module unit tests
 * @date 2025-11-20
 */

#include <gtest/gtest.h>
#include <lap/log/CLog.hpp>
#include "CTokenStorage.hpp"

int main(int argc, char **argv)
{
    ::lap::core::MemoryManager::getInstance();  // Initialize memory manager first

    // Initialize logging
    ::lap::log::LogManager::getInstance().initialize();

    // Initialize Google Test
    ::testing::InitGoogleTest(&argc, argv);

    int result = RUN_ALL_TESTS();

    ::lap::tks::CTokenStoreManager::getInstance().uninitialize();

    return result;
}
