// ============================================================================
// Error Code Tests
// ============================================================================

#include "heir/core/error.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace heir;

TEST(ErrorTest, MakeErrorCode) {
    std::error_code ec = make_error_code(Errc::NotSet);
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(ec.value(), static_cast<int>(Errc::NotSet));
    EXPECT_EQ(std::string(ec.category().name()), "heir");
}

TEST(ErrorTest, ErrorMessages) {
    EXPECT_EQ(make_error_code(Errc::NotSet).message(), "Inheritable local is not set in this task");
    EXPECT_EQ(make_error_code(Errc::NoExecutor).message(), "No executor available to spawn on");
}

TEST(ErrorTest, CategorySingleton) {
    EXPECT_EQ(&HeirCategory(), &HeirCategory());
}

TEST(ErrorTest, ImplicitConversionFromErrc) {
    Error ec = Errc::NoExecutor;
    EXPECT_EQ(ec, make_error_code(Errc::NoExecutor));
    EXPECT_NE(ec, make_error_code(Errc::NotSet));
}

TEST(ErrorTest, DistinctFromGenericCategory) {
    std::error_code ours = Errc::NotSet;
    std::error_code generic(static_cast<int>(Errc::NotSet), std::generic_category());
    EXPECT_NE(ours, generic);
}

TEST(ErrorTest, UnknownErrorCodeMessage) {
    std::error_code ec = make_error_code(static_cast<Errc>(9999));
    EXPECT_EQ(ec.message(), "Unknown heir error");
}
