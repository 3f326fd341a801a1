#include "installer/errors.hpp"
#include "installer/task_registry.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace installer::test {

class TaskRegistryTest : public ::testing::Test {
protected:
    TaskRegistry registry;
};

TEST_F(TaskRegistryTest, RegisterReturnsFreshHandles) {
    auto handles = registry.registerTask("v20.0.0", TaskKind::Download);

    ASSERT_TRUE(handles.cancel);
    ASSERT_TRUE(handles.paused);
    ASSERT_TRUE(handles.pid);
    EXPECT_EQ(handles.kind, TaskKind::Download);
    EXPECT_FALSE(handles.isCancelled());
    EXPECT_FALSE(handles.isPaused());
    EXPECT_FALSE(handles.pid->get().has_value());
    EXPECT_TRUE(registry.contains("v20.0.0"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(TaskRegistryTest, DuplicateRegistrationThrowsAlreadyRunning) {
    registry.registerTask("typescript@5.4.0", TaskKind::ProcessInstall);

    try {
        registry.registerTask("typescript@5.4.0", TaskKind::ProcessInstall);
        FAIL() << "expected AlreadyRunningError";
    } catch (const AlreadyRunningError& ex) {
        EXPECT_EQ(ex.id(), "typescript@5.4.0");
    }
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(TaskRegistryTest, DistinctIdsCoexist) {
    registry.registerTask("v20.0.0", TaskKind::Download);
    registry.registerTask("v18.19.0", TaskKind::Download);
    registry.registerTask("eslint", TaskKind::ProcessInstall);

    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(registry.ids(), (std::vector<std::string>{"eslint", "v18.19.0", "v20.0.0"}));
}

TEST_F(TaskRegistryTest, LookupFallsBackToVersionPrefix) {
    auto handles = registry.registerTask("v20.0.0", TaskKind::Download);

    const auto [exact_id, exact] = registry.lookup("v20.0.0");
    EXPECT_EQ(exact_id, "v20.0.0");
    EXPECT_EQ(exact.cancel, handles.cancel);

    const auto [fallback_id, fallback] = registry.lookup("20.0.0");
    EXPECT_EQ(fallback_id, "v20.0.0");
    EXPECT_EQ(fallback.paused, handles.paused);
}

TEST_F(TaskRegistryTest, LookupPrefersExactMatch) {
    registry.registerTask("20.0.0", TaskKind::Download);
    registry.registerTask("v20.0.0", TaskKind::Download);

    EXPECT_EQ(registry.lookup("20.0.0").first, "20.0.0");
}

TEST_F(TaskRegistryTest, LookupUnknownThrowsNotFound) {
    registry.registerTask("v20.0.0", TaskKind::Download);

    EXPECT_THROW((void)registry.lookup("v18.0.0"), NotFoundError);
    EXPECT_THROW((void)registry.lookup("18.0.0"), NotFoundError);
    EXPECT_THROW((void)registry.lookup(""), NotFoundError);
}

TEST_F(TaskRegistryTest, UnregisterIsIdempotent) {
    registry.registerTask("v20.0.0", TaskKind::Download);

    registry.unregisterTask("v20.0.0");
    EXPECT_FALSE(registry.contains("v20.0.0"));
    EXPECT_NO_THROW(registry.unregisterTask("v20.0.0"));
    EXPECT_THROW((void)registry.lookup("v20.0.0"), NotFoundError);

    // The id is free again once its worker is gone.
    EXPECT_NO_THROW(registry.registerTask("v20.0.0", TaskKind::Download));
}

TEST_F(TaskRegistryTest, ConcurrentRegistrationAcceptsExactlyOne) {
    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            try {
                registry.registerTask("v21.1.0", TaskKind::Download);
                ++accepted;
            } catch (const AlreadyRunningError&) {
                ++rejected;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(rejected.load(), 15);
}

TEST(NormalizeVersionIdTest, AddsPrefixOnce) {
    EXPECT_EQ(TaskRegistry::normalizeVersionId("20.0.0"), "v20.0.0");
    EXPECT_EQ(TaskRegistry::normalizeVersionId("v20.0.0"), "v20.0.0");
}

TEST(PidSlotTest, WritesOnce) {
    PidSlot slot;
    EXPECT_FALSE(slot.get().has_value());
    EXPECT_TRUE(slot.set(4242));
    EXPECT_FALSE(slot.set(4343));
    ASSERT_TRUE(slot.get().has_value());
    EXPECT_EQ(*slot.get(), 4242u);
}

} // namespace installer::test
