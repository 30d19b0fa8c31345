#include "utils/cli.hpp"

#include <gtest/gtest.h>

using namespace ctp;

namespace {

TEST(TestThreadCount, Accepted)
{
    EXPECT_EQ(utils::parse_thread_count("0"), 0u);
    EXPECT_EQ(utils::parse_thread_count("4"), 4u);
    EXPECT_EQ(utils::parse_thread_count("256"), config::MAX_WORKER_THREADS);
}

TEST(TestThreadCount, Rejected)
{
    EXPECT_FALSE(utils::parse_thread_count(""));
    EXPECT_FALSE(utils::parse_thread_count("abc"));
    EXPECT_FALSE(utils::parse_thread_count("4x"));
    EXPECT_FALSE(utils::parse_thread_count("-1"));
    EXPECT_FALSE(utils::parse_thread_count("+4"));
    EXPECT_FALSE(utils::parse_thread_count("257"));
    EXPECT_FALSE(utils::parse_thread_count("4294967296"));
    EXPECT_FALSE(utils::parse_thread_count("99999999999999999999"));
}

} // namespace
