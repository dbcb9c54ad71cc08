#pragma once

#include "Arbor/Core/Observer.h"
#include <juce_core/juce_core.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Arbor::Runtime
{
    class BindingDiagnostics;
}

namespace Arbor
{
    class Observable;

    /*
        Collects observers whose Observables fired and invokes each of them once
        per drain, on the one thread that calls drain().

        A pending observer remembers every Observable that enqueued it, and
        stays pending until each of those sources has cancelled it.

        Enqueueing is allowed from any thread. The drain request passed to the
        constructor is called at most once per drain cycle; the host must then
        call drain() on the designated thread. Observers enqueued while a drain
        is running are invoked by that same drain.
    */
    class NotificationScheduler
    {
    public:
        struct Stats
        {
            std::uint64_t drainRequests = 0;
            std::uint64_t drains = 0;
            std::uint64_t invocations = 0;
            std::uint64_t failures = 0;
        };

        explicit NotificationScheduler(std::function<void()> requestDrainIn);
        virtual ~NotificationScheduler() = default;

        void enqueueAll(const Observable& source, const std::vector<Observer*>& observers);

        // Withdraws source's claim on a pending invocation, if any.
        void cancel(const Observable& source, Observer& observer);

        void drain();

        void setDiagnostics(Runtime::BindingDiagnostics* diagnosticsIn) noexcept;

        [[nodiscard]] size_t pendingCount() const;
        [[nodiscard]] bool isDrainScheduled() const;
        [[nodiscard]] Stats stats() const;

    private:
        Observer* popPending();
        void invokeIsolated(Observer& observer);
        void reportFailure(const juce::String& message);

        std::function<void()> requestDrain;
        std::atomic<Runtime::BindingDiagnostics*> diagnostics { nullptr };

        juce::CriticalSection queueLock;
        std::unordered_map<Observer*, std::unordered_set<const Observable*>> pending;
        bool drainScheduled = false;
        bool draining = false;
        std::atomic<bool> drainEntered { false };
        Stats counters {};

        JUCE_DECLARE_NON_COPYABLE(NotificationScheduler)
    };
}
