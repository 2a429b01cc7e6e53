#pragma once

#include "common_fixture.hpp"
#include "utility/fake_remote.hpp"

#include <explorer/explorer_session.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace Explorer::Test
{
    class ExplorerSessionTests : public CommonFixture
    {
      protected:
        void SetUp() override
        {
            fileSystem_->setHome("/home/user");
            fileSystem_->addTextFile("/home/user/notes.txt", "notes");
            fileSystem_->addDirectory("/home/user/projects");
            fileSystem_->addDirectory("/home/other");
            fileSystem_->addTextFile(
                "/etc/passwd", "root:x:0:0:root:/root:/bin/bash\nuser:x:1000:1000::/home/user:/bin/sh\n");
            fileSystem_->addTextFile("/etc/group", "root:x:0:\nusers:x:1000:\n");
        }

        std::unique_ptr<ExplorerSession> makeSession()
        {
            return std::make_unique<ExplorerSession>(
                ui_.get_executor(),
                std::make_shared<FakeSftpClient>(fileSystem_),
                std::make_shared<FakeChannelSource>(fileSystem_, 4),
                Persistence::ExplorerOptions{},
                [this](NotificationType type, std::string const& message) {
                    notifications_.emplace_back(type, message);
                });
        }

      protected:
        std::shared_ptr<FakeFileSystem> fileSystem_{std::make_shared<FakeFileSystem>()};
        std::vector<std::pair<NotificationType, std::string>> notifications_{};
    };

    TEST_F(ExplorerSessionTests, StartsInHomeDirectory)
    {
        auto session = makeSession();
        session->start();

        auto const& state = session->navigation().state();
        ASSERT_TRUE(pumpUntil([&]() {
            return state.currentPath == "/home/user" && !state.loading && state.userGroupMapRevision >= 2;
        }));

        EXPECT_EQ(state.homeDirectory, "/home/user");
        EXPECT_FALSE(state.canGoBack());
        EXPECT_FALSE(state.error.has_value());
        ASSERT_EQ(state.fileList.size(), 2u);
        EXPECT_TRUE(state.cache.isValid("/"));
        EXPECT_TRUE(state.cache.isValid("/home"));
        EXPECT_TRUE(state.cache.isValid("/home/user"));
        EXPECT_EQ(state.userGroupMap.username(1000), "user");
        EXPECT_EQ(state.userGroupMap.groupname(1000), "users");
        EXPECT_TRUE(notifications_.empty());
    }

    TEST_F(ExplorerSessionTests, TreeShowsPathToHome)
    {
        auto session = makeSession();
        session->start();

        auto const& state = session->navigation().state();
        ASSERT_TRUE(pumpUntil([&]() {
            return state.currentPath == "/home/user" && !state.loading;
        }));

        const auto rows = session->navigation().directoryTree();
        std::vector<std::string> paths{};
        std::ranges::transform(rows, std::back_inserter(paths), &TreeRow::path);

        ASSERT_FALSE(paths.empty());
        EXPECT_EQ(paths.front(), "/");
        EXPECT_NE(std::ranges::find(paths, "/home"), paths.end());
        EXPECT_NE(std::ranges::find(paths, "/home/other"), paths.end());
        EXPECT_NE(std::ranges::find(paths, "/home/user/projects"), paths.end());
    }

    TEST_F(ExplorerSessionTests, OptionsAreCompletedWithDefaults)
    {
        auto session = makeSession();
        auto const& options = session->options();

        ASSERT_TRUE(options.transfer.channelCount.has_value());
        ASSERT_TRUE(options.transfer.parallelTransfers.has_value());
        EXPECT_EQ(*options.transfer.parallelTransfers, 3);
        ASSERT_TRUE(options.navigation.showHidden.has_value());
        EXPECT_FALSE(*options.navigation.showHidden);
    }

    TEST_F(ExplorerSessionTests, SessionsGetDistinctIds)
    {
        auto first = makeSession();
        auto second = makeSession();
        EXPECT_NE(first->id(), second->id());
    }

    TEST_F(ExplorerSessionTests, OpenFailsWithoutChannel)
    {
        auto refused = ExplorerSession::open(
            ui_.get_executor(), std::make_shared<FakeChannelSource>(fileSystem_, 0), Persistence::ExplorerOptions{});
        ASSERT_FALSE(refused);
        EXPECT_NE(refused.error().find("Channel refused"), std::string::npos);

        auto missing = ExplorerSession::open(ui_.get_executor(), nullptr, Persistence::ExplorerOptions{});
        EXPECT_FALSE(missing);
    }

    TEST_F(ExplorerSessionTests, OpenUsesChannelFromSession)
    {
        auto opened = ExplorerSession::open(
            ui_.get_executor(), std::make_shared<FakeChannelSource>(fileSystem_, 1), Persistence::ExplorerOptions{});
        ASSERT_TRUE(opened);

        (*opened)->start();
        EXPECT_TRUE(pumpUntil([&]() {
            return (*opened)->navigation().state().currentPath == "/home/user";
        }));
    }

    TEST_F(ExplorerSessionTests, DefaultLoggingConfigurationSucceeds)
    {
        EXPECT_TRUE(configureLogging(Persistence::LogOptions{.level = "off"}));
    }
}
