#pragma once

#include <functional>

namespace scenemcp
{
    struct scope_guard
    {
        std::function<void()> onExit;
        ~scope_guard()
        {
            if (onExit)
            {
                onExit();
            }
        }

        scope_guard(scope_guard const &) = delete;
        scope_guard & operator=(scope_guard const &) = delete;

        scope_guard(std::function<void()> onExit)
            : onExit(std::move(onExit))
        {
        }

        /// Disarm the guard, e.g. after ownership of a resource has been handed over
        void dismiss()
        {
            onExit = nullptr;
        }
    };
}
