#include <explorer/navigation_history.hpp>

namespace Explorer
{
    void NavigationHistory::push(std::string path)
    {
        back_.push_back(std::move(path));
        forward_.clear();
    }

    std::optional<std::string> NavigationHistory::goBack(std::string current)
    {
        if (back_.empty())
            return std::nullopt;

        auto previous = std::move(back_.back());
        back_.pop_back();
        forward_.push_back(std::move(current));
        return previous;
    }

    std::optional<std::string> NavigationHistory::goForward(std::string current)
    {
        if (forward_.empty())
            return std::nullopt;

        auto next = std::move(forward_.back());
        forward_.pop_back();
        back_.push_back(std::move(current));
        return next;
    }

    void NavigationHistory::clear()
    {
        back_.clear();
        forward_.clear();
    }
}
