#pragma once

#include <atomic>

#include "ftpcmd/error_codes.hpp"

namespace ftpcmd
{

    class CancellationToken
    {
    public:
        void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

        bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

        void throw_if_cancelled() const
        {
            if (cancelled())
            {
                throw CancelledError();
            }
        }

    private:
        std::atomic<bool> cancelled_{false};
    };

} // namespace ftpcmd
