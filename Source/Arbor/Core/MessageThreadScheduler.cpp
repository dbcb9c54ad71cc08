#include "Arbor/Core/MessageThreadScheduler.h"

namespace Arbor
{
    MessageThreadScheduler::MessageThreadScheduler()
        : NotificationScheduler([this] { triggerAsyncUpdate(); })
    {
    }

    MessageThreadScheduler::~MessageThreadScheduler()
    {
        cancelPendingUpdate();
    }

    void MessageThreadScheduler::dispatchPendingNow()
    {
        handleUpdateNowIfNeeded();
    }

    void MessageThreadScheduler::handleAsyncUpdate()
    {
        drain();
    }
}
