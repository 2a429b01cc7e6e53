#pragma once

#include <explorer/executors.hpp>
#include <shared_data/file_entry.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace Explorer::Test
{
    class CommonFixture : public ::testing::Test
    {
      protected:
        ~CommonFixture() override
        {
            ioPool_.join();
        }

        Executors executors()
        {
            return Executors{.ui = ui_.get_executor(), .io = ioPool_.get_executor()};
        }

        /**
         * @brief Runs the ui executor until predicate holds.
         */
        bool pumpUntil(std::function<bool()> const& predicate, std::chrono::milliseconds timeout = std::chrono::seconds{5})
        {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline)
            {
                ui_.restart();
                ui_.poll();
                if (predicate())
                    return true;
                std::this_thread::sleep_for(std::chrono::milliseconds{1});
            }
            return predicate();
        }

        /**
         * @brief Runs the ui executor for a while, for checking that nothing happens.
         */
        void pumpFor(std::chrono::milliseconds duration)
        {
            pumpUntil(
                []() {
                    return false;
                },
                duration);
        }

        static SharedData::FileEntry makeEntry(
            std::string const& directory,
            std::string const& name,
            SharedData::FileType type = SharedData::FileType::File)
        {
            return SharedData::FileEntry{
                .name = name,
                .path = directory == "/" ? "/" + name : directory + "/" + name,
                .type = type,
                .size = type == SharedData::FileType::Directory ? 0u : 100u,
            };
        }

        static SharedData::FileEntry makeDirectory(std::string const& directory, std::string const& name)
        {
            return makeEntry(directory, name, SharedData::FileType::Directory);
        }

      protected:
        boost::asio::io_context ui_{};
        boost::asio::thread_pool ioPool_{2};
    };
}
