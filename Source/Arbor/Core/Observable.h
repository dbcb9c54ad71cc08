#pragma once

#include "Arbor/Core/NotificationScheduler.h"
#include "Arbor/Core/Observer.h"
#include <juce_core/juce_core.h>
#include <unordered_set>

namespace Arbor
{
    /*
        Fan-out notification point. notify() never calls observers directly: it
        hands every registered observer to the scheduler, which invokes each of
        them once in its next drain.
    */
    class Observable
    {
    public:
        explicit Observable(NotificationScheduler& schedulerIn);

        void addObserver(Observer& observer);

        // Also withdraws this Observable's pending invocation of the observer.
        // An invocation another Observable enqueued still runs.
        void removeObserver(Observer& observer);

        void notify();

        [[nodiscard]] bool isObserving(const Observer& observer) const;
        [[nodiscard]] size_t observerCount() const;

    private:
        NotificationScheduler& scheduler;
        juce::CriticalSection observerLock;
        std::unordered_set<Observer*> observers;

        JUCE_DECLARE_NON_COPYABLE(Observable)
    };
}
