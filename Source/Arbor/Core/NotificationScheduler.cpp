#include "Arbor/Core/NotificationScheduler.h"

#include "Arbor/Runtime/BindingDiagnostics.h"
#include <exception>

namespace Arbor
{
    NotificationScheduler::NotificationScheduler(std::function<void()> requestDrainIn)
        : requestDrain(std::move(requestDrainIn))
    {
    }

    void NotificationScheduler::enqueueAll(const Observable& source, const std::vector<Observer*>& observers)
    {
        if (observers.empty())
            return;

        bool shouldRequest = false;
        {
            const juce::ScopedLock scopedLock(queueLock);
            for (auto* observer : observers)
            {
                if (observer != nullptr)
                    pending[observer].insert(&source);
            }

            if (!pending.empty() && !drainScheduled && !draining)
            {
                drainScheduled = true;
                counters.drainRequests += 1;
                shouldRequest = true;
            }
        }

        if (shouldRequest && requestDrain != nullptr)
            requestDrain();
    }

    void NotificationScheduler::cancel(const Observable& source, Observer& observer)
    {
        const juce::ScopedLock scopedLock(queueLock);
        const auto it = pending.find(&observer);
        if (it == pending.end())
            return;

        it->second.erase(&source);
        if (it->second.empty())
            pending.erase(it);
    }

    void NotificationScheduler::drain()
    {
        if (drainEntered.exchange(true))
            return;

        for (;;)
        {
            {
                const juce::ScopedLock scopedLock(queueLock);
                drainScheduled = false;
                draining = true;
                counters.drains += 1;
            }

            while (auto* observer = popPending())
                invokeIsolated(*observer);

            drainEntered.store(false);

            // Picks up entries whose drain was rejected while this one was finishing.
            {
                const juce::ScopedLock scopedLock(queueLock);
                if (!drainScheduled || pending.empty())
                    return;
            }

            if (drainEntered.exchange(true))
                return;
        }
    }

    Observer* NotificationScheduler::popPending()
    {
        const juce::ScopedLock scopedLock(queueLock);
        if (pending.empty())
        {
            // Cleared under the same lock as the emptiness check so a concurrent
            // enqueue either lands in this drain or requests the next one.
            draining = false;
            return nullptr;
        }

        const auto it = pending.begin();
        auto* observer = it->first;
        pending.erase(it);
        counters.invocations += 1;
        return observer;
    }

    void NotificationScheduler::invokeIsolated(Observer& observer)
    {
        try
        {
            observer.observedChanged();
        }
        catch (const std::exception& exception)
        {
            reportFailure(exception.what());
        }
        catch (...)
        {
            reportFailure("unknown exception");
        }
    }

    void NotificationScheduler::reportFailure(const juce::String& message)
    {
        {
            const juce::ScopedLock scopedLock(queueLock);
            counters.failures += 1;
        }

        if (auto* sink = diagnostics.load(); sink != nullptr)
            sink->report(Runtime::DiagnosticKind::callbackFailure, "NotificationScheduler", message);
        else
            DBG("[Arbor][Scheduler] observer failed: " + message);
    }

    void NotificationScheduler::setDiagnostics(Runtime::BindingDiagnostics* diagnosticsIn) noexcept
    {
        diagnostics.store(diagnosticsIn);
    }

    size_t NotificationScheduler::pendingCount() const
    {
        const juce::ScopedLock scopedLock(queueLock);
        return pending.size();
    }

    bool NotificationScheduler::isDrainScheduled() const
    {
        const juce::ScopedLock scopedLock(queueLock);
        return drainScheduled;
    }

    NotificationScheduler::Stats NotificationScheduler::stats() const
    {
        const juce::ScopedLock scopedLock(queueLock);
        return counters;
    }
}
