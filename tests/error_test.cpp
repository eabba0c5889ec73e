#include "../src/util/hard_assert.hpp"

#include <docsync-cpp/error.hpp>

#include <gtest/gtest.h>

#include <source_location>
#include <string>

using namespace docsync_cpp;

TEST(ErrorCode, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorCode::ok),                  "ok");
    EXPECT_EQ(to_string_view(ErrorCode::cancelled),           "cancelled");
    EXPECT_EQ(to_string_view(ErrorCode::invalid_argument),    "invalid_argument");
    EXPECT_EQ(to_string_view(ErrorCode::failed_precondition), "failed_precondition");
    EXPECT_EQ(to_string_view(ErrorCode::aborted),             "aborted");
    EXPECT_EQ(to_string_view(ErrorCode::unavailable),         "unavailable");
    EXPECT_EQ(to_string_view(ErrorCode::unauthenticated),     "unauthenticated");
}

TEST(ErrorCode, numbering_follows_rpc_status_codes) {
    EXPECT_EQ(static_cast<int>(ErrorCode::not_found), 5);
    EXPECT_EQ(static_cast<int>(ErrorCode::resource_exhausted), 8);
    EXPECT_EQ(static_cast<int>(ErrorCode::unauthenticated), 16);
}

TEST(ErrorCode, retryable_codes_are_not_permanent) {
    EXPECT_FALSE(is_permanent_error(ErrorCode::unavailable));
    EXPECT_FALSE(is_permanent_error(ErrorCode::resource_exhausted));
    EXPECT_FALSE(is_permanent_error(ErrorCode::deadline_exceeded));
    EXPECT_FALSE(is_permanent_error(ErrorCode::internal));
    EXPECT_FALSE(is_permanent_error(ErrorCode::unauthenticated));
    EXPECT_FALSE(is_permanent_error(ErrorCode::cancelled));
    EXPECT_FALSE(is_permanent_error(ErrorCode::unknown));
}

TEST(ErrorCode, terminal_codes_are_permanent) {
    EXPECT_TRUE(is_permanent_error(ErrorCode::invalid_argument));
    EXPECT_TRUE(is_permanent_error(ErrorCode::permission_denied));
    EXPECT_TRUE(is_permanent_error(ErrorCode::failed_precondition));
    EXPECT_TRUE(is_permanent_error(ErrorCode::data_loss));
}

TEST(ErrorCode, aborted_writes_are_retried) {
    EXPECT_TRUE(is_permanent_error(ErrorCode::aborted));
    EXPECT_FALSE(is_permanent_write_error(ErrorCode::aborted));
    EXPECT_TRUE(is_permanent_write_error(ErrorCode::permission_denied));
    EXPECT_FALSE(is_permanent_write_error(ErrorCode::unavailable));
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorCode::not_found, "missing"};
    const auto e2 = Error{ErrorCode::not_found, "missing"};
    const auto e3 = Error{ErrorCode::aborted, "missing"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
    EXPECT_NE(e1, (Error{ErrorCode::not_found, "other"}));
}

TEST(Result, holds_value_or_error) {
    auto ok = Result<int>{42};
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(*ok, 42);

    auto failed = Result<int>{Error{ErrorCode::unavailable, "offline"}};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::unavailable);
    EXPECT_EQ(failed.error().message, "offline");
}

TEST(Exception, carries_the_error) {
    try {
        throw Exception{ErrorCode::invalid_argument, "bad path"};
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::invalid_argument);
        EXPECT_EQ(e.error().message, "bad path");
        EXPECT_EQ(std::string{e.what()}, "bad path");
    }
}

TEST(HardAssert, passing_check_does_nothing) {
    auto count = 3;
    EXPECT_NO_THROW(util::hard_assert(count == 3, "count is {}", count));
    EXPECT_NO_THROW(util::hard_assert(true, "no arguments"));
}

TEST(HardAssert, failing_check_throws_the_formatted_message) {
    auto target_id = 7;
    try {
        util::hard_assert(target_id == 3, "unexpected target {} in {}", target_id, std::string{"watch"});
        FAIL() << "expected InternalError";
    } catch (const InternalError& e) {
        EXPECT_EQ(std::string{e.what()}, "unexpected target 7 in watch");
    }
}

TEST(HardAssert, hard_fail_always_throws) {
    EXPECT_THROW(util::hard_fail("unreachable state {}", 2), InternalError);
}

TEST(HardAssert, format_records_the_call_site) {
    auto line = std::source_location::current().line() + 1;
    auto format = util::LocatedFormat<int>{"value {}"};
    EXPECT_EQ(format.where.line(), line);
    EXPECT_NE(std::string{format.where.file_name()}.find("error_test.cpp"), std::string::npos);
}
