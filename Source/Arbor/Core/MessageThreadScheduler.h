#pragma once

#include "Arbor/Core/NotificationScheduler.h"
#include <juce_events/juce_events.h>

namespace Arbor
{
    // Drains on the JUCE message thread.
    class MessageThreadScheduler : public NotificationScheduler,
                                   private juce::AsyncUpdater
    {
    public:
        MessageThreadScheduler();
        ~MessageThreadScheduler() override;

        // Runs an outstanding drain now. Message thread only.
        void dispatchPendingNow();

    private:
        void handleAsyncUpdate() override;
    };
}
