#pragma once
#include <csignal>
#include <atomic>
#include "cancellation.hpp"
#include "logging.hpp"

namespace signals
{

    // Token flipped by the handler; only an atomic store happens inside the handler
    inline std::atomic<CancellationToken *> shutdownToken{nullptr};
    inline volatile std::sig_atomic_t lastSignal = 0;

    inline void signalHandler(int signal)
    {
        lastSignal = signal;

        CancellationToken *token = shutdownToken.load();
        if (token)
        {
            token->cancel();
        }
    }

    // Register signal handlers that cancel the given run
    inline void setupSignalHandlers(CancellationToken &token)
    {
        shutdownToken.store(&token);
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        log_debug("Signal handlers registered for graceful shutdown");
    }

    inline void resetSignalHandlers()
    {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        shutdownToken.store(nullptr);
    }

} // namespace signals
