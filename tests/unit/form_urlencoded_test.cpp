#include "http/form_urlencoded.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

using namespace ctp;
using namespace ctp::http;

namespace {

TEST(TestFormUrlencoded, DecodeKeepsEveryOccurrence)
{
    auto pairs = form::decode("foo=foo&os=linux&foo=bar");
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0], (std::pair<std::string, std::string>{"foo", "foo"}));
    EXPECT_EQ(pairs[2], (std::pair<std::string, std::string>{"foo", "bar"}));
}

TEST(TestFormUrlencoded, DecodeEscapes)
{
    auto pairs = form::decode("q=a+b%26c&flag&&empty=");
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0].second, "a b&c");
    EXPECT_EQ(pairs[1].first, "flag");
    EXPECT_EQ(pairs[1].second, "");
    EXPECT_EQ(pairs[2].first, "empty");
}

TEST(TestFormUrlencoded, DecodeCollapsedLastWins)
{
    auto pairs = form::decode_collapsed("foo=foo&os=linux&foo=foo2");
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[0].first, "foo");
    EXPECT_EQ(pairs[0].second, "foo2");
    EXPECT_EQ(pairs[1].first, "os");
}

TEST(TestFormUrlencoded, MalformedEscape)
{
    EXPECT_THROW(form::decode("a=%zz"), InvalidUri);
    EXPECT_THROW(form::decode("a=%4"), InvalidUri);
    EXPECT_THROW(form::decode("a=%"), InvalidUri);
}

TEST(TestFormUrlencoded, Encode)
{
    EXPECT_EQ(form::encode({}), "");
    EXPECT_EQ(form::encode({{"foo", "bar"}, {"os", "linux"}}), "foo=bar&os=linux");
    EXPECT_EQ(form::encode({{"q", "a b&c/d"}}), "q=a+b%26c%2Fd");
    EXPECT_EQ(form::encode_component("*-._~"), "*-._%7E");
}

} // namespace
