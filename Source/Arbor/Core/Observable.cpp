#include "Arbor/Core/Observable.h"

#include <algorithm>
#include <vector>

namespace Arbor
{
    Observable::Observable(NotificationScheduler& schedulerIn)
        : scheduler(schedulerIn)
    {
    }

    void Observable::addObserver(Observer& observer)
    {
        const juce::ScopedLock scopedLock(observerLock);
        observers.insert(&observer);
    }

    void Observable::removeObserver(Observer& observer)
    {
        const juce::ScopedLock scopedLock(observerLock);
        if (observers.erase(&observer) > 0)
            scheduler.cancel(*this, observer);
    }

    void Observable::notify()
    {
        const juce::ScopedLock scopedLock(observerLock);
        if (observers.empty())
            return;

        // Enqueued under the observer lock so removeObserver() cannot slip in
        // between the copy and the enqueue.
        scheduler.enqueueAll(*this, std::vector<Observer*>(observers.begin(), observers.end()));
    }

    bool Observable::isObserving(const Observer& observer) const
    {
        const juce::ScopedLock scopedLock(observerLock);
        return std::any_of(observers.begin(),
                           observers.end(),
                           [&observer](const Observer* candidate)
                           {
                               return candidate == &observer;
                           });
    }

    size_t Observable::observerCount() const
    {
        const juce::ScopedLock scopedLock(observerLock);
        return observers.size();
    }
}
