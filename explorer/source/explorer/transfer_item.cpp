#include <explorer/transfer_item.hpp>
#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>
#include <utility/remote_path.hpp>

#include <algorithm>

namespace Explorer
{
    using SharedData::TransferDirection;
    using SharedData::TransferStatus;

    TransferItem::TransferItem(
        Ids::TransferId id,
        TransferDirection direction,
        std::filesystem::path localPath,
        std::string remotePath,
        std::uint64_t totalBytes)
        : id_{std::move(id)}
        , direction_{direction}
        , localPath_{std::move(localPath)}
        , remotePath_{std::move(remotePath)}
        , totalBytes_{totalBytes}
        , transferredBytes_{0}
        , speed_{0}
        , status_{TransferStatus::Pending}
        , error_{std::nullopt}
        , control_{std::make_shared<TransferControl>()}
    {}

    std::string TransferItem::fileName() const
    {
        if (direction_ == TransferDirection::Download)
            return Utility::remoteFileName(remotePath_);
        return localPath_.filename().string();
    }

    double TransferItem::percentage() const
    {
        if (totalBytes_ == 0)
            return status_ == TransferStatus::Completed ? 100.0 : 0.0;
        return std::min(100.0, 100.0 * static_cast<double>(transferredBytes_) / static_cast<double>(totalBytes_));
    }

    bool TransferItem::start(std::uint64_t totalBytes)
    {
        if (!transitionTo(SharedData::activeStatusFor(direction_)))
            return false;
        totalBytes_ = totalBytes;
        return true;
    }

    bool TransferItem::pause()
    {
        if (!SharedData::isActive(status_) || !transitionTo(TransferStatus::Paused))
            return false;
        control_->pause();
        speed_ = 0;
        return true;
    }

    bool TransferItem::resume()
    {
        if (status_ != TransferStatus::Paused || !transitionTo(SharedData::activeStatusFor(direction_)))
            return false;
        control_->resume();
        return true;
    }

    bool TransferItem::cancel()
    {
        if (!SharedData::canTransitionTo(status_, TransferStatus::Cancelled, direction_))
            return false;
        if (!control_->cancel())
        {
            Log::debug("TransferItem: {} already committed its result, not cancelling.", id_.value());
            return false;
        }
        status_ = TransferStatus::Cancelled;
        speed_ = 0;
        error_ = "Cancelled by user";
        return true;
    }

    bool TransferItem::complete()
    {
        if (!transitionTo(TransferStatus::Completed))
            return false;
        transferredBytes_ = std::max(transferredBytes_, totalBytes_);
        speed_ = 0;
        return true;
    }

    bool TransferItem::fail(std::string error)
    {
        if (!transitionTo(TransferStatus::Failed))
            return false;
        speed_ = 0;
        error_ = std::move(error);
        return true;
    }

    void TransferItem::updateProgress(TransferProgress const& progress)
    {
        if (SharedData::isTerminal(status_))
            return;

        transferredBytes_ = std::max(transferredBytes_, progress.transferredBytes);
        if (progress.totalBytes != 0)
            totalBytes_ = progress.totalBytes;
        speed_ = status_ == TransferStatus::Paused ? 0 : progress.speed;
    }

    bool TransferItem::transitionTo(TransferStatus status)
    {
        if (!SharedData::canTransitionTo(status_, status, direction_))
        {
            Log::debug(
                "TransferItem: Ignoring transition of {} from {} to {}.",
                id_.value(),
                Utility::enumToString(status_, "?"),
                Utility::enumToString(status, "?"));
            return false;
        }
        status_ = status;
        return true;
    }
}
