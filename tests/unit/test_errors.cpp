#include <gtest/gtest.h>
#include "core/errors/gym_errors.hpp"

using namespace compgym::core::errors;

// Simulates a remote copy that can fail
Result<std::string> simulate_fetch(bool should_fail) {
    if (should_fail) {
        return GymError{ErrorCategory::Resource, "Copy failed", "resource_sync_failed"};
    }
    return std::string("file contents here");
}

Status simulate_flush(bool should_fail) {
    if (should_fail) {
        return GymError{ErrorCategory::Resource, "Channel offline", "channel_offline"};
    }
    return ok();
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_fetch(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "file contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_fetch(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Resource);
    EXPECT_EQ(error.message, "Copy failed");
    EXPECT_EQ(error.code, "resource_sync_failed");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, StatusCarriesNoValue) {
    EXPECT_FALSE(is_error(simulate_flush(false)));

    auto failed = simulate_flush(true);
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).code, "channel_offline");
}

TEST(ErrorModelTest, DefaultCodeIsUnknown) {
    GymError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Storage), "storage");
    EXPECT_EQ(to_string(ErrorCategory::Lookup), "lookup");
}
