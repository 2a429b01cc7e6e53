#pragma once

#include <utility/describe.hpp>

#include <functional>
#include <string>

namespace Explorer
{
    BOOST_DEFINE_ENUM_CLASS(NotificationType, Info, Warning, Error)

    /**
     * @brief Receives transient messages, e.g. for toasts. Always called on the ui executor.
     */
    using NotificationSink = std::function<void(NotificationType, std::string const&)>;
}
