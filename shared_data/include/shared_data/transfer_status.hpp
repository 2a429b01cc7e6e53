#pragma once

#include <utility/describe.hpp>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(TransferDirection, Upload, Download)

    BOOST_DEFINE_ENUM_CLASS(TransferStatus, Pending, Uploading, Downloading, Paused, Completed, Failed, Cancelled)

    /**
     * @brief Completed, Failed and Cancelled. Nothing leaves a terminal state.
     */
    constexpr bool isTerminal(TransferStatus status)
    {
        return status == TransferStatus::Completed || status == TransferStatus::Failed ||
            status == TransferStatus::Cancelled;
    }

    /**
     * @brief Bytes are moving.
     */
    constexpr bool isActive(TransferStatus status)
    {
        return status == TransferStatus::Uploading || status == TransferStatus::Downloading;
    }

    constexpr TransferStatus activeStatusFor(TransferDirection direction)
    {
        return direction == TransferDirection::Upload ? TransferStatus::Uploading : TransferStatus::Downloading;
    }

    /**
     * @brief The transfer state machine. Pending starts into the active state of its direction, active states
     * complete, fail or pause, Paused only resumes into its direction, and everything non terminal can be cancelled.
     * Pending and Paused may also fail, e.g. when the remote file cannot be opened.
     */
    constexpr bool canTransitionTo(TransferStatus from, TransferStatus to, TransferDirection direction)
    {
        if (isTerminal(from))
            return false;
        if (to == TransferStatus::Cancelled)
            return true;

        switch (from)
        {
            case TransferStatus::Pending:
                return to == activeStatusFor(direction) || to == TransferStatus::Failed;
            case TransferStatus::Uploading:
            case TransferStatus::Downloading:
                return from == activeStatusFor(direction) &&
                    (to == TransferStatus::Paused || to == TransferStatus::Completed || to == TransferStatus::Failed);
            case TransferStatus::Paused:
                return to == activeStatusFor(direction) || to == TransferStatus::Failed;
            default:
                return false;
        }
    }
}
