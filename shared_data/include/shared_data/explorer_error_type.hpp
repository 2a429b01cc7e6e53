#pragma once

#include <utility/describe.hpp>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        ExplorerErrorType,
        ProtocolError,
        ConnectionLost,
        Cancelled,
        PartialWorkerFailure,
        FutureTimeout,
        LocalIoError,
        InvalidPath,
        FileExists,
        ChannelUnavailable);
}
