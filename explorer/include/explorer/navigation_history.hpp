#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Explorer
{
    /**
     * @brief Browser style back/forward stacks.
     */
    class NavigationHistory
    {
      public:
        /**
         * @brief Records the path that is being left. Clears the forward stack.
         */
        void push(std::string path);

        /**
         * @brief Pops the back stack and moves current onto the forward stack.
         *
         * @return The path to go to, nothing if there is no history.
         */
        std::optional<std::string> goBack(std::string current);

        /**
         * @brief Mirror of goBack.
         */
        std::optional<std::string> goForward(std::string current);

        bool canGoBack() const noexcept
        {
            return !back_.empty();
        }
        bool canGoForward() const noexcept
        {
            return !forward_.empty();
        }

        void clear();

        std::vector<std::string> const& backStack() const noexcept
        {
            return back_;
        }
        std::vector<std::string> const& forwardStack() const noexcept
        {
            return forward_;
        }

      private:
        std::vector<std::string> back_{};
        std::vector<std::string> forward_{};
    };
}
