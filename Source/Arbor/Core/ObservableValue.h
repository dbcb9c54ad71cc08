#pragma once

#include "Arbor/Core/Observable.h"
#include <juce_core/juce_core.h>
#include <utility>

namespace Arbor
{
    /*
        A value cell that notifies its observers when set() changes the value.
        get() reflects a set() immediately on every thread; observers hear about
        it later, from the scheduler's drain.
    */
    template <typename ValueType>
    class ObservableValue
    {
    public:
        ObservableValue(NotificationScheduler& scheduler, ValueType initialValue)
            : changeObservable(scheduler),
              value(std::move(initialValue))
        {
        }

        [[nodiscard]] ValueType get() const
        {
            const juce::ScopedLock scopedLock(valueLock);
            return value;
        }

        // Returns false, without notifying, when newValue equals the current value.
        bool set(ValueType newValue)
        {
            {
                const juce::ScopedLock scopedLock(valueLock);
                if (value == newValue)
                    return false;

                value = std::move(newValue);
            }

            changeObservable.notify();
            return true;
        }

        void addObserver(Observer& observer) { changeObservable.addObserver(observer); }
        void removeObserver(Observer& observer) { changeObservable.removeObserver(observer); }

        Observable& observable() noexcept { return changeObservable; }
        const Observable& observable() const noexcept { return changeObservable; }

    private:
        Observable changeObservable;
        juce::CriticalSection valueLock;
        ValueType value;

        JUCE_DECLARE_NON_COPYABLE(ObservableValue)
    };
}
