#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>

#include <utility>

namespace Explorer
{
    /**
     * @brief The two execution domains. All state lives on ui, which is single threaded. io runs protocol calls
     * and may block on them.
     */
    struct Executors
    {
        boost::asio::any_io_executor ui;
        boost::asio::any_io_executor io;
    };

    /**
     * @brief Runs work on the io executor and hands its result to onResult on the ui executor.
     */
    template <typename WorkT, typename HandlerT>
    void dispatch(Executors const& executors, WorkT&& work, HandlerT&& onResult)
    {
        boost::asio::post(
            executors.io,
            [ui = executors.ui, work = std::forward<WorkT>(work), onResult = std::forward<HandlerT>(onResult)]() mutable {
                auto result = work();
                boost::asio::post(ui, [onResult = std::move(onResult), result = std::move(result)]() mutable {
                    onResult(std::move(result));
                });
            });
    }
}
