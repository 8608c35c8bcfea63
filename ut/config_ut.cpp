#include <gtest/gtest.h>

#include <cstdlib>

#include <baton_config.hpp>
#include <baton_errors.hpp>

using namespace baton;
using namespace std::chrono_literals;

TEST(options_from_comma_separated, empty_string_gives_defaults) {
    const auto o = options_from_comma_separated("");
    EXPECT_EQ(o.m_timeout, 5000ms);
    EXPECT_EQ(o.m_region_bytes, 65536u);
}

TEST(options_from_comma_separated, single_option) {
    EXPECT_EQ(options_from_comma_separated("timeout=250").m_timeout, 250ms);
    EXPECT_EQ(options_from_comma_separated("size=4096").m_region_bytes, 4096u);
}

TEST(options_from_comma_separated, both_options_in_any_order) {
    const auto o = options_from_comma_separated("size=1024,timeout=10");
    EXPECT_EQ(o.m_timeout, 10ms);
    EXPECT_EQ(o.m_region_bytes, 1024u);
}

TEST(options_from_comma_separated, empty_segments_are_skipped) {
    const auto o = options_from_comma_separated(",timeout=7,,size=64,");
    EXPECT_EQ(o.m_timeout, 7ms);
    EXPECT_EQ(o.m_region_bytes, 64u);
}

TEST(options_from_comma_separated, later_value_wins) {
    EXPECT_EQ(options_from_comma_separated("timeout=1,timeout=2").m_timeout, 2ms);
}

TEST(options_from_comma_separated, unknown_name_is_rejected) {
    EXPECT_THROW(options_from_comma_separated("timeout=1,colour=red"), configure::unsupported_option);
}

TEST(options_from_comma_separated, bare_name_is_rejected) {
    EXPECT_THROW(options_from_comma_separated("timeout"), configure::unsupported_option);
}

TEST(options_from_comma_separated, non_numeric_value_is_rejected) {
    EXPECT_THROW(options_from_comma_separated("timeout=fast"), configure::not_a_number_option_value);
    EXPECT_THROW(options_from_comma_separated("size="), configure::not_a_number_option_value);
    EXPECT_THROW(options_from_comma_separated("size=12kb"), configure::not_a_number_option_value);
    EXPECT_THROW(options_from_comma_separated("timeout=-5"), configure::not_a_number_option_value);
}

TEST(options_from_comma_separated, out_of_range_value_is_rejected) {
    EXPECT_THROW(options_from_comma_separated("size=2147483648"), configure::impossible_option_value);
    EXPECT_THROW(options_from_comma_separated("timeout=99999999999999999999999"), configure::impossible_option_value);
    EXPECT_EQ(options_from_comma_separated("size=2147483647").m_region_bytes, 2147483647u);
}

struct when_env_variable_is_used : public testing::Test
{
    void TearDown() override {
        unsetenv(configure::env_BATON_OPTIONS);
    }
};

TEST_F(when_env_variable_is_used, then_unset_variable_gives_defaults) {
    unsetenv(configure::env_BATON_OPTIONS);
    const auto o = options_from_env();
    EXPECT_EQ(o.m_timeout, 5000ms);
    EXPECT_EQ(o.m_region_bytes, 65536u);
}

TEST_F(when_env_variable_is_used, then_variable_is_parsed) {
    setenv(configure::env_BATON_OPTIONS, "timeout=42,size=128", 1);
    const auto o = options_from_env();
    EXPECT_EQ(o.m_timeout, 42ms);
    EXPECT_EQ(o.m_region_bytes, 128u);
}

TEST_F(when_env_variable_is_used, then_malformed_variable_throws) {
    setenv(configure::env_BATON_OPTIONS, "size=big", 1);
    EXPECT_THROW(options_from_env(), configure::impossible_option_value);
}
