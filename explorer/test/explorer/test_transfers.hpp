#pragma once

#include "utility/fake_remote.hpp"

#include <explorer/multi_channel_transfer.hpp>
#include <explorer/single_channel_transfer.hpp>
#include <explorer/transfer_job.hpp>
#include <ssh/mocks/channel_source_mock.hpp>
#include <utility/temporary_directory.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstring>
#include <expected>
#include <fstream>
#include <future>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace Explorer::Test
{
    class TransferTests : public ::testing::Test
    {
      protected:
        static constexpr std::uint64_t mebibyte = 1024 * 1024;

        TransferJobOptions jobOptions() const
        {
            return TransferJobOptions{
                .chunkSize = 64 * 1024,
                .progressInterval = std::chrono::milliseconds{0},
                .operationTimeout = std::chrono::seconds{5},
                .channelCount = 4,
                .multiChannelThreshold = 1 * mebibyte,
            };
        }

        std::vector<std::byte> readLocal(std::filesystem::path const& path) const
        {
            std::ifstream reader{path, std::ios::binary};
            std::vector<char> raw{std::istreambuf_iterator<char>{reader}, std::istreambuf_iterator<char>{}};
            std::vector<std::byte> bytes(raw.size());
            std::memcpy(bytes.data(), raw.data(), raw.size());
            return bytes;
        }

        void writeLocal(std::filesystem::path const& path, std::vector<std::byte> const& data) const
        {
            std::ofstream writer{path, std::ios::binary};
            writer.write(reinterpret_cast<char const*>(data.data()), static_cast<std::streamsize>(data.size()));
        }

        ProgressCallback recordProgress()
        {
            return [this](TransferProgress const& progress) {
                std::scoped_lock lock{progressGuard_};
                progress_.push_back(progress);
            };
        }

        void expectMonotonicProgressEndingAt(std::uint64_t total)
        {
            std::scoped_lock lock{progressGuard_};
            ASSERT_FALSE(progress_.empty());
            for (std::size_t i = 1; i < progress_.size(); ++i)
                EXPECT_GE(progress_[i].transferredBytes, progress_[i - 1].transferredBytes);
            EXPECT_EQ(progress_.back().transferredBytes, total);
        }

        std::vector<std::shared_ptr<SecureShell::ISftpClient>> makeChannels(int count)
        {
            std::vector<std::shared_ptr<SecureShell::ISftpClient>> channels{};
            for (int i = 0; i < count; ++i)
                channels.push_back(std::make_shared<FakeSftpClient>(fileSystem_));
            return channels;
        }

        struct JobOutcome
        {
            std::optional<std::expected<void, SharedData::ExplorerError>> result{};
            std::optional<std::uint64_t> started{};
        };

        TransferJob makeJob(
            SharedData::TransferDirection direction,
            std::filesystem::path const& local,
            std::string const& remote,
            int grantedChannels,
            JobOutcome& outcome,
            TransferJobOptions options)
        {
            channelSource_ = std::make_shared<FakeChannelSource>(fileSystem_, grantedChannels);
            return makeJob(direction, local, remote, channelSource_, outcome, std::move(options));
        }

        TransferJob makeJob(
            SharedData::TransferDirection direction,
            std::filesystem::path const& local,
            std::string const& remote,
            std::shared_ptr<SecureShell::ISftpChannelSource> channelSource,
            JobOutcome& outcome,
            TransferJobOptions options)
        {
            return TransferJob{
                TransferRequest{
                    .id = Ids::generateTransferId(),
                    .direction = direction,
                    .localPath = local,
                    .remotePath = remote,
                },
                primary_,
                std::move(channelSource),
                control_,
                std::move(options),
                TransferJobEvents{
                    .onStarted =
                        [&outcome](std::uint64_t total) {
                            outcome.started = total;
                        },
                    .onProgress = recordProgress(),
                    .onFinished =
                        [&outcome](auto const& result) {
                            outcome.result = result;
                        },
                },
            };
        }

      protected:
        Utility::TemporaryDirectory directory_{"transfers"};
        std::shared_ptr<FakeFileSystem> fileSystem_{std::make_shared<FakeFileSystem>()};
        std::shared_ptr<FakeSftpClient> primary_{std::make_shared<FakeSftpClient>(fileSystem_)};
        std::shared_ptr<FakeChannelSource> channelSource_{};
        std::shared_ptr<TransferControl> control_{std::make_shared<TransferControl>()};
        std::mutex progressGuard_{};
        std::vector<TransferProgress> progress_{};
    };

    TEST_F(TransferTests, SingleChannelDownloadCopiesContent)
    {
        const auto data = makePattern(300000);
        fileSystem_->addFile("/data/small.bin", data);

        SingleChannelTransfer transfer{primary_, control_, jobOptions(), recordProgress()};
        const auto local = directory_.path() / "small.bin";
        ASSERT_TRUE(transfer.download("/data/small.bin", local, data.size()));

        EXPECT_EQ(readLocal(local), data);
        EXPECT_EQ(transfer.transferred(), data.size());
        expectMonotonicProgressEndingAt(data.size());
    }

    TEST_F(TransferTests, SingleChannelUploadCopiesContent)
    {
        const auto data = makePattern(200000);
        const auto local = directory_.path() / "up.bin";
        writeLocal(local, data);
        fileSystem_->addDirectory("/target");

        SingleChannelTransfer transfer{primary_, control_, jobOptions(), recordProgress()};
        ASSERT_TRUE(transfer.upload(local, "/target/up.bin", data.size()));
        EXPECT_EQ(fileSystem_->content("/target/up.bin"), data);
        expectMonotonicProgressEndingAt(data.size());
    }

    TEST_F(TransferTests, FortyMebibytesOverFourChannels)
    {
        const auto data = makePattern(40 * mebibyte);
        fileSystem_->addFile("/data/big.bin", data);

        auto options = jobOptions();
        options.chunkSize = 256 * 1024;
        fileSystem_->streamLimit = 256 * 1024;
        MultiChannelTransfer transfer{makeChannels(4), control_, options, recordProgress()};
        const auto local = directory_.path() / "big.bin";
        ASSERT_TRUE(transfer.download("/data/big.bin", local, data.size()));

        ASSERT_EQ(transfer.transferredPerRange().size(), 4u);
        std::uint64_t sum = 0;
        for (auto bytes : transfer.transferredPerRange())
        {
            EXPECT_EQ(bytes, 10 * mebibyte);
            sum += bytes;
        }
        EXPECT_EQ(sum, data.size());
        EXPECT_EQ(readLocal(local), data);
        expectMonotonicProgressEndingAt(data.size());
    }

    TEST_F(TransferTests, MultiChannelUploadPresizesAndFillsRemote)
    {
        const auto data = makePattern(3 * mebibyte + 17);
        const auto local = directory_.path() / "up.bin";
        writeLocal(local, data);
        fileSystem_->addDirectory("/target");

        MultiChannelTransfer transfer{makeChannels(3), control_, jobOptions(), recordProgress()};
        ASSERT_TRUE(transfer.upload(local, "/target/up.bin", data.size()));
        EXPECT_EQ(fileSystem_->content("/target/up.bin"), data);
        EXPECT_EQ(transfer.transferredPerRange().back(), mebibyte + 17);
    }

    TEST_F(TransferTests, PauseAndResumePreserveBytes)
    {
        const auto data = makePattern(1 * mebibyte);
        fileSystem_->addFile("/data/pause.bin", data);

        std::promise<void> paused{};
        std::once_flag pauseOnce{};
        fileSystem_->setTransferHook([this, &paused, &pauseOnce](std::uint64_t offset) {
            if (offset >= 256 * 1024)
            {
                std::call_once(pauseOnce, [&]() {
                    control_->pause();
                    paused.set_value();
                });
            }
        });

        SingleChannelTransfer transfer{primary_, control_, jobOptions(), recordProgress()};
        const auto local = directory_.path() / "pause.bin";
        std::optional<std::expected<void, SharedData::ExplorerError>> result{};
        std::thread worker{[&]() {
            result = transfer.download("/data/pause.bin", local, data.size());
        }};

        ASSERT_EQ(paused.get_future().wait_for(std::chrono::seconds{5}), std::future_status::ready);
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        const auto readsWhilePaused = fileSystem_->readCalls();
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
        EXPECT_EQ(fileSystem_->readCalls(), readsWhilePaused);

        control_->resume();
        worker.join();

        ASSERT_TRUE(result && *result);
        EXPECT_EQ(readLocal(local), data);
        expectMonotonicProgressEndingAt(data.size());
    }

    TEST_F(TransferTests, MultiChannelPauseHoldsEveryRange)
    {
        const auto data = makePattern(4 * mebibyte);
        fileSystem_->addFile("/data/pause.bin", data);

        std::promise<void> paused{};
        std::once_flag pauseOnce{};
        fileSystem_->setTransferHook([this, &paused, &pauseOnce](std::uint64_t offset) {
            if (offset % mebibyte >= 256 * 1024)
            {
                std::call_once(pauseOnce, [&]() {
                    control_->pause();
                    paused.set_value();
                });
            }
        });

        MultiChannelTransfer transfer{makeChannels(4), control_, jobOptions(), recordProgress()};
        const auto local = directory_.path() / "pause.bin";
        std::optional<std::expected<void, SharedData::ExplorerError>> result{};
        std::thread worker{[&]() {
            result = transfer.download("/data/pause.bin", local, data.size());
        }};

        ASSERT_EQ(paused.get_future().wait_for(std::chrono::seconds{5}), std::future_status::ready);
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        const auto readsWhilePaused = fileSystem_->readCalls();
        std::size_t reportsWhilePaused = 0;
        std::uint64_t bytesWhilePaused = 0;
        {
            std::scoped_lock lock{progressGuard_};
            reportsWhilePaused = progress_.size();
            bytesWhilePaused = progress_.empty() ? 0 : progress_.back().transferredBytes;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
        EXPECT_EQ(fileSystem_->readCalls(), readsWhilePaused);
        EXPECT_LT(bytesWhilePaused, data.size());
        {
            std::scoped_lock lock{progressGuard_};
            EXPECT_EQ(progress_.size(), reportsWhilePaused);
        }

        control_->resume();
        worker.join();

        ASSERT_TRUE(result && *result);
        EXPECT_EQ(readLocal(local), data);
        ASSERT_EQ(transfer.transferredPerRange().size(), 4u);
        std::uint64_t sum = 0;
        for (auto bytes : transfer.transferredPerRange())
            sum += bytes;
        EXPECT_EQ(sum, data.size());
        expectMonotonicProgressEndingAt(data.size());
    }

    TEST_F(TransferTests, CancelledDownloadLeavesNoLocalFile)
    {
        const auto data = makePattern(2 * mebibyte);
        fileSystem_->addFile("/data/cancel.bin", data);
        fileSystem_->setTransferHook([this](std::uint64_t offset) {
            if (offset >= 512 * 1024)
                control_->cancel();
        });

        JobOutcome outcome{};
        const auto local = directory_.path() / "cancel.bin";
        auto job = makeJob(SharedData::TransferDirection::Download, local, "/data/cancel.bin", 4, outcome, jobOptions());
        job.run();

        ASSERT_TRUE(outcome.result);
        ASSERT_FALSE(*outcome.result);
        EXPECT_EQ(outcome.result->error().type, SharedData::ExplorerErrorType::Cancelled);
        EXPECT_FALSE(std::filesystem::exists(local));
        EXPECT_FALSE(std::filesystem::exists(job.temporaryPath()));
    }

    TEST_F(TransferTests, CancelDuringLastChunkLeavesNoLocalFile)
    {
        const auto data = makePattern(100000);
        fileSystem_->addFile("/data/last.bin", data);
        fileSystem_->setTransferHook([this](std::uint64_t offset) {
            if (offset >= 64 * 1024)
                control_->cancel();
        });

        JobOutcome outcome{};
        const auto local = directory_.path() / "last.bin";
        auto job = makeJob(SharedData::TransferDirection::Download, local, "/data/last.bin", 4, outcome, jobOptions());
        job.run();

        ASSERT_TRUE(outcome.result);
        ASSERT_FALSE(*outcome.result);
        EXPECT_EQ(outcome.result->error().type, SharedData::ExplorerErrorType::Cancelled);
        EXPECT_FALSE(std::filesystem::exists(local));
        EXPECT_FALSE(std::filesystem::exists(job.temporaryPath()));
        EXPECT_FALSE(control_->commit());
    }

    TEST_F(TransferTests, CompletedDownloadRenamesTemporaryFile)
    {
        const auto data = makePattern(100000);
        fileSystem_->addFile("/data/done.bin", data);

        JobOutcome outcome{};
        const auto local = directory_.path() / "nested" / "done.bin";
        auto job = makeJob(SharedData::TransferDirection::Download, local, "/data/done.bin", 4, outcome, jobOptions());
        job.run();

        ASSERT_TRUE(outcome.result && *outcome.result);
        EXPECT_EQ(outcome.started, data.size());
        EXPECT_EQ(readLocal(local), data);
        EXPECT_FALSE(std::filesystem::exists(job.temporaryPath()));
        EXPECT_EQ(job.strategy(), TransferStrategy::SingleChannel);
        EXPECT_FALSE(control_->cancel());
    }

    TEST_F(TransferTests, ThresholdDecidesStrategy)
    {
        auto options = jobOptions();
        options.multiChannelThreshold = 100000;
        fileSystem_->addFile("/data/below.bin", makePattern(99999));
        fileSystem_->addFile("/data/at.bin", makePattern(100000));

        JobOutcome below{};
        auto belowJob = makeJob(
            SharedData::TransferDirection::Download, directory_.path() / "below.bin", "/data/below.bin", 4, below, options);
        belowJob.run();
        ASSERT_TRUE(below.result && *below.result);
        EXPECT_EQ(belowJob.strategy(), TransferStrategy::SingleChannel);
        EXPECT_EQ(channelSource_->requested(), 0);

        JobOutcome at{};
        auto atJob = makeJob(
            SharedData::TransferDirection::Download, directory_.path() / "at.bin", "/data/at.bin", 4, at, options);
        atJob.run();
        ASSERT_TRUE(at.result && *at.result);
        EXPECT_EQ(atJob.strategy(), TransferStrategy::MultiChannel);
        EXPECT_EQ(channelSource_->requested(), 4);
        EXPECT_EQ(readLocal(directory_.path() / "at.bin"), makePattern(100000));
    }

    TEST_F(TransferTests, SingleGrantedChannelFallsBack)
    {
        const auto data = makePattern(2 * mebibyte);
        fileSystem_->addFile("/data/fallback.bin", data);

        JobOutcome outcome{};
        const auto local = directory_.path() / "fallback.bin";
        auto job = makeJob(SharedData::TransferDirection::Download, local, "/data/fallback.bin", 1, outcome, jobOptions());
        job.run();

        ASSERT_TRUE(outcome.result && *outcome.result);
        EXPECT_EQ(job.strategy(), TransferStrategy::SingleChannel);
        EXPECT_EQ(channelSource_->requested(), 4);
        EXPECT_EQ(readLocal(local), data);
    }

    TEST_F(TransferTests, PartialGrantReducesSplit)
    {
        const auto data = makePattern(3 * mebibyte);
        fileSystem_->addFile("/data/partial.bin", data);

        JobOutcome outcome{};
        const auto local = directory_.path() / "partial.bin";
        auto job = makeJob(SharedData::TransferDirection::Download, local, "/data/partial.bin", 3, outcome, jobOptions());
        job.run();

        ASSERT_TRUE(outcome.result && *outcome.result);
        EXPECT_EQ(job.strategy(), TransferStrategy::MultiChannel);
        EXPECT_EQ(readLocal(local), data);
    }

    TEST_F(TransferTests, WorkerFailureFailsWholeTransfer)
    {
        const auto data = makePattern(4 * mebibyte);
        fileSystem_->addFile("/data/broken.bin", data);
        fileSystem_->failTransferAt(2 * mebibyte + 100);

        JobOutcome outcome{};
        const auto local = directory_.path() / "broken.bin";
        auto job = makeJob(SharedData::TransferDirection::Download, local, "/data/broken.bin", 4, outcome, jobOptions());
        job.run();

        ASSERT_TRUE(outcome.result);
        ASSERT_FALSE(*outcome.result);
        EXPECT_EQ(outcome.result->error().type, SharedData::ExplorerErrorType::PartialWorkerFailure);
        EXPECT_NE(outcome.result->error().message().find("Injected read failure"), std::string::npos);
        EXPECT_NE(outcome.result->error().message().find("Range 2"), std::string::npos);
        EXPECT_FALSE(std::filesystem::exists(local));
        EXPECT_FALSE(std::filesystem::exists(job.temporaryPath()));
    }

    TEST_F(TransferTests, ExistingFileIsKeptWithoutOverwrite)
    {
        fileSystem_->addFile("/data/file.bin", makePattern(1000));
        const auto local = directory_.path() / "file.bin";
        writeLocal(local, makePattern(10));

        auto options = jobOptions();
        options.mayOverwrite = false;
        JobOutcome outcome{};
        auto job = makeJob(SharedData::TransferDirection::Download, local, "/data/file.bin", 4, outcome, options);
        job.run();

        ASSERT_TRUE(outcome.result);
        ASSERT_FALSE(*outcome.result);
        EXPECT_EQ(outcome.result->error().type, SharedData::ExplorerErrorType::FileExists);
        EXPECT_EQ(fileSystem_->readCalls(), 0u);
        EXPECT_EQ(readLocal(local), makePattern(10));
    }

    TEST_F(TransferTests, CancelledUploadLeavesPartialRemoteFile)
    {
        const auto data = makePattern(1 * mebibyte);
        const auto local = directory_.path() / "up.bin";
        writeLocal(local, data);
        fileSystem_->addDirectory("/target");
        fileSystem_->setTransferHook([this](std::uint64_t offset) {
            if (offset >= 256 * 1024)
                control_->cancel();
        });

        JobOutcome outcome{};
        auto options = jobOptions();
        options.channelCount = 1;
        auto job = makeJob(SharedData::TransferDirection::Upload, local, "/target/up.bin", 1, outcome, options);
        job.run();

        ASSERT_TRUE(outcome.result);
        ASSERT_FALSE(*outcome.result);
        EXPECT_EQ(outcome.result->error().type, SharedData::ExplorerErrorType::Cancelled);
        ASSERT_TRUE(fileSystem_->exists("/target/up.bin"));
        EXPECT_LT(fileSystem_->content("/target/up.bin")->size(), data.size());
    }

    TEST_F(TransferTests, RefusedAndEmptyChannelsAreSkipped)
    {
        using Grant = std::expected<std::shared_ptr<SecureShell::ISftpClient>, SecureShell::SftpError>;
        const auto data = makePattern(3 * mebibyte);
        fileSystem_->addFile("/data/mixed.bin", data);

        auto source = std::make_shared<::testing::StrictMock<SecureShell::Test::ChannelSourceMock>>();
        EXPECT_CALL(*source, openSftpChannel())
            .WillOnce(::testing::InvokeWithoutArgs([this]() {
                return makeReadyFuture(Grant{std::make_shared<FakeSftpClient>(fileSystem_)});
            }))
            .WillOnce(::testing::InvokeWithoutArgs([]() {
                return makeReadyFuture<Grant>(std::unexpected(SecureShell::SftpError{.message = "Channel refused"}));
            }))
            .WillOnce(::testing::InvokeWithoutArgs([]() {
                return makeReadyFuture(Grant{std::shared_ptr<SecureShell::ISftpClient>{}});
            }))
            .WillOnce(::testing::InvokeWithoutArgs([this]() {
                return makeReadyFuture(Grant{std::make_shared<FakeSftpClient>(fileSystem_)});
            }));

        JobOutcome outcome{};
        const auto local = directory_.path() / "mixed.bin";
        auto job = makeJob(SharedData::TransferDirection::Download, local, "/data/mixed.bin", source, outcome, jobOptions());
        job.run();

        ASSERT_TRUE(outcome.result && *outcome.result);
        EXPECT_EQ(job.strategy(), TransferStrategy::MultiChannel);
        EXPECT_EQ(readLocal(local), data);
    }

    TEST_F(TransferTests, AllChannelsRefusedUsesPrimary)
    {
        using Grant = std::expected<std::shared_ptr<SecureShell::ISftpClient>, SecureShell::SftpError>;
        const auto data = makePattern(2 * mebibyte);
        fileSystem_->addFile("/data/refused.bin", data);

        auto source = std::make_shared<::testing::StrictMock<SecureShell::Test::ChannelSourceMock>>();
        EXPECT_CALL(*source, openSftpChannel()).Times(4).WillRepeatedly(::testing::InvokeWithoutArgs([]() {
            return makeReadyFuture<Grant>(
                std::unexpected(SecureShell::SftpError{.message = "Administratively prohibited"}));
        }));

        JobOutcome outcome{};
        const auto local = directory_.path() / "refused.bin";
        auto job = makeJob(SharedData::TransferDirection::Download, local, "/data/refused.bin", source, outcome, jobOptions());
        job.run();

        ASSERT_TRUE(outcome.result && *outcome.result);
        EXPECT_EQ(job.strategy(), TransferStrategy::SingleChannel);
        EXPECT_EQ(readLocal(local), data);
    }
}
