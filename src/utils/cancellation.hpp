#pragma once
#include <atomic>

// Run-wide cancellation flag, set from the signal handler or from tests
class CancellationToken
{
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};
