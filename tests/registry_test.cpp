// ============================================================================
// Registry Tests
// ============================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>

#include "heir/heir.hpp"

using namespace heir;

namespace {

InheritableLocal<int> kAlpha{"alpha"};
InheritableLocal<std::string> kBeta{"beta"};

bool Registered(VariableId id) {
    auto entries = Registry::Instance().Entries();
    return std::any_of(entries.begin(), entries.end(), [id](const Descriptor& d) { return d.id == id; });
}

}  // namespace

TEST(RegistryTest, NamespaceScopeLocalsAreRegistered) {
    EXPECT_TRUE(kAlpha.IsInheritable());
    EXPECT_TRUE(kBeta.IsInheritable());
    EXPECT_TRUE(Registered(kAlpha.Id()));
    EXPECT_TRUE(Registered(kBeta.Id()));
}

TEST(RegistryTest, NamesAreKept) {
    EXPECT_STREQ(kAlpha.Name(), "alpha");
    EXPECT_STREQ(kBeta.Name(), "beta");
}

TEST(RegistryTest, IdsAreUnique) {
    std::set<VariableId> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(Registry::Instance().AllocateId());
    }
    ids.insert(kAlpha.Id());
    ids.insert(kBeta.Id());
    EXPECT_EQ(ids.size(), 102u);
}

TEST(RegistryTest, EntriesSealTheRegistry) {
    (void)Registry::Instance().Entries();
    EXPECT_TRUE(Registry::Instance().IsSealed());
}

TEST(RegistryTest, LateDeclarationIsNotInheritable) {
    (void)Registry::Instance().Entries();

    InheritableLocal<int> late{"late"};
    EXPECT_FALSE(late.IsInheritable());
    EXPECT_FALSE(Registered(late.Id()));

    // Still a working task-local...
    late.SyncScope(3, [&] { EXPECT_EQ(late.Get().ValueOr(0), 3); });

    // ...that wrapped tasks never see.
    auto read_late = [&late]() -> Task<bool> {
        co_return late.IsSet();
    };
    Task<bool> wrapped = late.SyncScope(3, [&] { return Inherit(read_late()); });
    EXPECT_FALSE(SyncWait(std::move(wrapped)));
}

TEST(RegistryTest, LateDeclarationDoesNotDisturbOthers) {
    (void)Registry::Instance().Entries();

    InheritableLocal<int> late{"late"};
    ASSERT_FALSE(late.IsInheritable());

    auto read_alpha = []() -> Task<int> {
        co_return kAlpha.Get().ValueOr(-1);
    };
    Task<int> wrapped = kAlpha.SyncScope(8, [&] { return Inherit(read_alpha()); });
    EXPECT_EQ(SyncWait(std::move(wrapped)), 8);
}
