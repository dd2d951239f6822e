#include <gtest/gtest.h>
#include "content/content_lifecycle.h"
#include "content/instanced_model_content.h"
#include "core/format/errors.h"
#include "utils/fake_collaborators.h"
#include <string>
#include <vector>

using namespace I3dm::Content;
using I3dm::Core::Format::MalformedTileError;
using namespace I3dm::Test;

class ContentLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        lifecycle.readyToProcessPromise().then(
            [this](InstancedModelContent*) { events.push_back("readyToProcess"); },
            [this](std::exception_ptr) { events.push_back("readyToProcess rejected"); });
        lifecycle.readyPromise().then(
            [this](InstancedModelContent*) { events.push_back("ready"); },
            [this](std::exception_ptr) { events.push_back("failed"); });
    }

    // Value carried by the readiness signals
    InstancedModelContent* content() { return &owner; }

    Tileset tileset;
    Tile tile;
    FakeScheduler scheduler;
    FakeResourceFactory factory;
    InstancedModelContent owner{tileset, tile, "tiles/trees.i3dm", scheduler, factory};

    ContentLifecycle lifecycle;
    std::vector<std::string> events;
};

TEST_F(ContentLifecycleTest, StartsUnloaded) {
    EXPECT_EQ(lifecycle.state(), ContentState::UNLOADED);
    EXPECT_FALSE(lifecycle.isDestroyed());
    EXPECT_TRUE(lifecycle.readyToProcessPromise().isPending());
    EXPECT_TRUE(lifecycle.readyPromise().isPending());
}

TEST_F(ContentLifecycleTest, HappyPathSignalsInOrder) {
    lifecycle.beginLoading();
    EXPECT_EQ(lifecycle.state(), ContentState::LOADING);
    EXPECT_TRUE(events.empty());

    lifecycle.beginProcessing(content());
    EXPECT_EQ(lifecycle.state(), ContentState::PROCESSING);
    EXPECT_EQ(lifecycle.readyToProcessPromise().value(), content());

    lifecycle.finishReady(content());
    EXPECT_EQ(lifecycle.state(), ContentState::READY);
    EXPECT_EQ(lifecycle.readyPromise().value(), content());

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "readyToProcess");
    EXPECT_EQ(events[1], "ready");
}

TEST_F(ContentLifecycleTest, ProcessingDirectlyFromUnloaded) {
    lifecycle.beginProcessing(content());
    EXPECT_EQ(lifecycle.state(), ContentState::PROCESSING);
}

TEST_F(ContentLifecycleTest, FailWhileLoading) {
    lifecycle.beginLoading();
    lifecycle.fail(std::make_exception_ptr(MalformedTileError("bad tile")));

    EXPECT_EQ(lifecycle.state(), ContentState::FAILED);
    EXPECT_TRUE(lifecycle.readyPromise().isRejected());
    EXPECT_TRUE(lifecycle.readyToProcessPromise().isPending());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], "failed");
}

TEST_F(ContentLifecycleTest, FailWhileProcessing) {
    lifecycle.beginLoading();
    lifecycle.beginProcessing(content());
    lifecycle.fail(std::make_exception_ptr(MalformedTileError("bad model")));

    EXPECT_EQ(lifecycle.state(), ContentState::FAILED);
    EXPECT_THROW(std::rethrow_exception(lifecycle.readyPromise().error()), MalformedTileError);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1], "failed");
}

TEST_F(ContentLifecycleTest, IllegalTransitions) {
    EXPECT_THROW(lifecycle.finishReady(content()), std::logic_error);
    EXPECT_THROW(lifecycle.fail(nullptr), std::logic_error);

    lifecycle.beginLoading();
    EXPECT_THROW(lifecycle.beginLoading(), std::logic_error);
    EXPECT_THROW(lifecycle.finishReady(content()), std::logic_error);

    lifecycle.beginProcessing(content());
    EXPECT_THROW(lifecycle.beginProcessing(content()), std::logic_error);
    EXPECT_THROW(lifecycle.beginLoading(), std::logic_error);

    lifecycle.finishReady(content());
    EXPECT_THROW(lifecycle.fail(std::make_exception_ptr(MalformedTileError("late"))), std::logic_error);
    EXPECT_THROW(lifecycle.finishReady(content()), std::logic_error);
    EXPECT_EQ(lifecycle.state(), ContentState::READY);
}

TEST_F(ContentLifecycleTest, FailedIsTerminal) {
    lifecycle.beginLoading();
    lifecycle.fail(std::make_exception_ptr(MalformedTileError("bad")));
    EXPECT_THROW(lifecycle.beginProcessing(content()), std::logic_error);
    EXPECT_THROW(lifecycle.beginLoading(), std::logic_error);
    EXPECT_EQ(lifecycle.state(), ContentState::FAILED);
}

TEST_F(ContentLifecycleTest, StateNames) {
    EXPECT_STREQ(toString(ContentState::UNLOADED), "UNLOADED");
    EXPECT_STREQ(toString(ContentState::PROCESSING), "PROCESSING");
    EXPECT_STREQ(toString(ContentState::FAILED), "FAILED");
}
