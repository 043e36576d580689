// ============================================================================
// Cell Tests
// ============================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>

#include "heir/local/cell.hpp"
#include "heir/local/registry.hpp"

using namespace heir;

namespace {

VariableId FreshId() {
    return Registry::Instance().AllocateId();
}

}  // namespace

TEST(CellTest, EmptyByDefault) {
    VariableId id = FreshId();

    EXPECT_FALSE(Cell<int>::IsActive(id));
    EXPECT_EQ(Cell<int>::Top(id), nullptr);
    EXPECT_EQ(Cell<int>::Capture(id), nullptr);
    EXPECT_EQ(Cell<int>::Depth(id), 0u);
}

TEST(CellTest, PushAndPopAreLifo) {
    VariableId id = FreshId();
    auto outer = std::make_shared<const int>(1);
    auto inner = std::make_shared<const int>(2);

    Cell<int>::Push(id, outer);
    Cell<int>::Push(id, inner);
    EXPECT_EQ(*Cell<int>::Top(id), 2);
    EXPECT_EQ(Cell<int>::Depth(id), 2u);

    Cell<int>::Pop(id, inner.get());
    EXPECT_EQ(*Cell<int>::Top(id), 1);

    Cell<int>::Pop(id, outer.get());
    EXPECT_FALSE(Cell<int>::IsActive(id));
}

TEST(CellTest, CaptureSharesTheValue) {
    VariableId id = FreshId();
    auto value = std::make_shared<const std::string>("shared");

    Cell<std::string>::Push(id, value);
    SharedHandle captured = Cell<std::string>::Capture(id);
    EXPECT_EQ(captured.get(), value.get());
    EXPECT_EQ(value.use_count(), 3);

    Cell<std::string>::Pop(id, value.get());
}

TEST(CellTest, StacksArePerThread) {
    VariableId id = FreshId();
    auto value = std::make_shared<const int>(5);
    Cell<int>::Push(id, value);

    bool seen_elsewhere = true;
    std::thread other([&] { seen_elsewhere = Cell<int>::IsActive(id); });
    other.join();

    EXPECT_FALSE(seen_elsewhere);
    EXPECT_TRUE(Cell<int>::IsActive(id));
    Cell<int>::Pop(id, value.get());
}

TEST(CellTest, DescriptorDispatchesToCell) {
    VariableId id = FreshId();
    Descriptor descriptor = DescribeCell<double>(id, "ratio");
    auto value = std::make_shared<const double>(0.5);

    EXPECT_EQ(descriptor.id, id);
    EXPECT_STREQ(descriptor.name, "ratio");
    EXPECT_FALSE(descriptor.is_active(id));

    descriptor.push(id, value);
    EXPECT_TRUE(descriptor.is_active(id));
    EXPECT_EQ(*Cell<double>::Top(id), 0.5);

    descriptor.pop(id, value.get());
    EXPECT_FALSE(Cell<double>::IsActive(id));
}

TEST(CellDeathTest, PopOnEmptyStackAborts) {
    VariableId id = FreshId();
    EXPECT_DEATH(Cell<int>::Pop(id, nullptr), "scope already exited");
}

TEST(CellDeathTest, PopOutOfOrderAborts) {
    VariableId id = FreshId();
    EXPECT_DEATH(
        {
            auto outer = std::make_shared<const int>(1);
            auto inner = std::make_shared<const int>(2);
            Cell<int>::Push(id, outer);
            Cell<int>::Push(id, inner);
            Cell<int>::Pop(id, outer.get());
        },
        "scope already exited");
}
