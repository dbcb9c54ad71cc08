#include <juce_events/juce_events.h>

#include "Arbor/Core/MessageThreadScheduler.h"
#include "Arbor/Core/NotificationScheduler.h"
#include "Arbor/Core/Observable.h"
#include "Arbor/Core/ObservableValue.h"
#include "Arbor/Runtime/BindingDiagnostics.h"

#include <atomic>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace
{
    // Records drain requests instead of posting them, so tests decide when to drain.
    struct ManualHost
    {
        int drainRequests = 0;
        Arbor::NotificationScheduler scheduler { [this] { ++drainRequests; } };
    };

    class CountingObserver : public Arbor::Observer
    {
    public:
        explicit CountingObserver(std::function<void()> onChangeIn = {})
            : onChange(std::move(onChangeIn))
        {
        }

        void observedChanged() override
        {
            calls += 1;
            if (onChange != nullptr)
                onChange();
        }

        int calls = 0;

    private:
        std::function<void()> onChange;
    };

    juce::Result testObserverSetSemantics()
    {
        ManualHost host;
        Arbor::Observable observable(host.scheduler);
        CountingObserver observer;

        observable.addObserver(observer);
        observable.addObserver(observer);
        if (observable.observerCount() != 1)
            return juce::Result::fail("observer registered twice must be stored once");

        observable.notify();
        if (observer.calls != 0)
            return juce::Result::fail("notify must not call observers synchronously");
        if (host.drainRequests != 1)
            return juce::Result::fail("notify must request exactly one drain");

        host.scheduler.drain();
        if (observer.calls != 1)
            return juce::Result::fail("observer must run once per drain, ran " + juce::String(observer.calls));

        observable.removeObserver(observer);
        observable.removeObserver(observer);
        if (observable.isObserving(observer))
            return juce::Result::fail("removeObserver left the observer registered");

        observable.notify();
        if (host.drainRequests != 1 || host.scheduler.pendingCount() != 0)
            return juce::Result::fail("notify without observers must have no effect");

        return juce::Result::ok();
    }

    juce::Result testValueSetOnlyNotifiesOnChange()
    {
        ManualHost host;
        Arbor::ObservableValue<juce::String> value(host.scheduler, "A");
        CountingObserver observer;
        value.addObserver(observer);

        if (value.set("A"))
            return juce::Result::fail("setting an equal value must report no change");

        host.scheduler.drain();
        if (observer.calls != 0 || host.drainRequests != 0)
            return juce::Result::fail("equal value must not notify");

        if (!value.set("B"))
            return juce::Result::fail("setting a new value must report a change");
        if (value.get() != "B")
            return juce::Result::fail("get must reflect set immediately");
        if (observer.calls != 0)
            return juce::Result::fail("set must not notify synchronously");

        host.scheduler.drain();
        if (observer.calls != 1)
            return juce::Result::fail("changed value must notify exactly once");

        value.removeObserver(observer);
        return juce::Result::ok();
    }

    juce::Result testRapidSetsCoalesce()
    {
        ManualHost host;
        Arbor::ObservableValue<int> first(host.scheduler, 0);
        Arbor::ObservableValue<int> second(host.scheduler, 0);
        CountingObserver shared;
        CountingObserver onlyFirst;

        first.addObserver(shared);
        first.addObserver(onlyFirst);
        second.addObserver(shared);

        for (int i = 1; i <= 50; ++i)
        {
            first.set(i);
            second.set(-i);
        }

        if (host.drainRequests != 1)
            return juce::Result::fail("one drain request expected per cycle, got " + juce::String(host.drainRequests));
        if (host.scheduler.pendingCount() != 2)
            return juce::Result::fail("two distinct observers expected pending");

        host.scheduler.drain();
        if (shared.calls != 1 || onlyFirst.calls != 1)
            return juce::Result::fail("observers must run once per drain across sources");

        first.set(100);
        if (host.drainRequests != 2)
            return juce::Result::fail("the next cycle must request a new drain");

        host.scheduler.drain();
        if (shared.calls != 2 || onlyFirst.calls != 2)
            return juce::Result::fail("second cycle must run each observer once more");

        first.removeObserver(shared);
        first.removeObserver(onlyFirst);
        second.removeObserver(shared);
        return juce::Result::ok();
    }

    juce::Result testEnqueueDuringDrainRunsInSameDrain()
    {
        ManualHost host;
        Arbor::Observable trigger(host.scheduler);
        Arbor::Observable followUp(host.scheduler);
        CountingObserver late;
        CountingObserver early([&followUp] { followUp.notify(); });

        trigger.addObserver(early);
        followUp.addObserver(late);

        trigger.notify();
        host.scheduler.drain();

        if (early.calls != 1 || late.calls != 1)
            return juce::Result::fail("observer enqueued during a drain must run in that drain");
        if (host.drainRequests != 1)
            return juce::Result::fail("enqueue during a drain must not request another drain");
        if (host.scheduler.pendingCount() != 0 || host.scheduler.isDrainScheduled())
            return juce::Result::fail("drain must leave the queue empty and unscheduled");

        const auto stats = host.scheduler.stats();
        if (stats.drains != 1 || stats.invocations != 2)
            return juce::Result::fail("unexpected drain stats");

        trigger.removeObserver(early);
        followUp.removeObserver(late);
        return juce::Result::ok();
    }

    juce::Result testNestedDrainIsIgnored()
    {
        ManualHost host;
        Arbor::Observable observable(host.scheduler);
        Arbor::Observable other(host.scheduler);
        CountingObserver otherObserver;
        CountingObserver reentrant([&host, &other]
                                   {
                                       other.notify();
                                       host.scheduler.drain();
                                   });

        observable.addObserver(reentrant);
        other.addObserver(otherObserver);
        observable.notify();
        host.scheduler.drain();

        if (reentrant.calls != 1 || otherObserver.calls != 1)
            return juce::Result::fail("nested drain must not re-run callbacks");
        if (host.scheduler.stats().drains != 1)
            return juce::Result::fail("nested drain must not count as a drain");

        observable.removeObserver(reentrant);
        other.removeObserver(otherObserver);
        return juce::Result::ok();
    }

    juce::Result testFailingObserverDoesNotStopDrain()
    {
        ManualHost host;
        Arbor::Runtime::BindingDiagnostics diagnostics;
        diagnostics.setSettings({ Arbor::Runtime::DiagnosticLogLevel::off });
        host.scheduler.setDiagnostics(&diagnostics);

        std::vector<Arbor::Runtime::DiagnosticEvent> events;
        diagnostics.setListener([&events](const Arbor::Runtime::DiagnosticEvent& event) { events.push_back(event); });

        Arbor::Observable observable(host.scheduler);
        CountingObserver throwing([] { throw std::runtime_error("boom"); });
        CountingObserver throwingUnknown([] { throw 42; });
        CountingObserver healthy;

        observable.addObserver(throwing);
        observable.addObserver(throwingUnknown);
        observable.addObserver(healthy);
        observable.notify();
        host.scheduler.drain();

        if (throwing.calls != 1 || throwingUnknown.calls != 1 || healthy.calls != 1)
            return juce::Result::fail("every pending observer must run despite failures");
        if (host.scheduler.stats().failures != 2)
            return juce::Result::fail("scheduler must count both failures");
        if (diagnostics.count(Arbor::Runtime::DiagnosticKind::callbackFailure) != 2 || events.size() != 2)
            return juce::Result::fail("failures must reach the diagnostic sink");

        bool sawMessage = false;
        for (const auto& event : events)
            sawMessage = sawMessage || event.message == "boom";
        if (!sawMessage)
            return juce::Result::fail("failure message must be forwarded");

        observable.removeObserver(throwing);
        observable.removeObserver(throwingUnknown);
        observable.removeObserver(healthy);
        return juce::Result::ok();
    }

    juce::Result testRemoveObserverCancelsPendingCall()
    {
        ManualHost host;
        Arbor::ObservableValue<int> value(host.scheduler, 0);
        CountingObserver removed;
        CountingObserver kept;

        value.addObserver(removed);
        value.addObserver(kept);
        value.set(1);
        value.removeObserver(removed);
        host.scheduler.drain();

        if (removed.calls != 0)
            return juce::Result::fail("removed observer must not run in a pending drain");
        if (kept.calls != 1)
            return juce::Result::fail("remaining observer must still run");

        value.removeObserver(kept);
        return juce::Result::ok();
    }

    juce::Result testRemoveObserverKeepsOtherSourcesPending()
    {
        ManualHost host;
        Arbor::Observable first(host.scheduler);
        Arbor::Observable second(host.scheduler);
        CountingObserver observer;

        first.addObserver(observer);
        second.addObserver(observer);

        second.notify();
        first.removeObserver(observer);
        host.scheduler.drain();

        if (observer.calls != 1)
            return juce::Result::fail("change from a source still observed must be delivered, got "
                                      + juce::String(observer.calls));
        if (first.isObserving(observer) || !second.isObserving(observer))
            return juce::Result::fail("removal must only affect its own source");

        first.addObserver(observer);
        first.notify();
        second.notify();
        if (host.scheduler.pendingCount() != 1)
            return juce::Result::fail("both sources must share one pending entry");

        first.removeObserver(observer);
        if (host.scheduler.pendingCount() != 1)
            return juce::Result::fail("entry must stay pending while another source claims it");

        second.removeObserver(observer);
        if (host.scheduler.pendingCount() != 0)
            return juce::Result::fail("entry must go once every source has withdrawn");

        host.scheduler.drain();
        if (observer.calls != 1)
            return juce::Result::fail("withdrawn entry must not run");

        return juce::Result::ok();
    }

    juce::Result testConcurrentSettersCoalesce()
    {
        ManualHost host;
        constexpr int threadCount = 4;
        constexpr int setsPerThread = 500;

        std::vector<std::unique_ptr<Arbor::ObservableValue<int>>> values;
        std::vector<std::unique_ptr<CountingObserver>> observers;
        for (int i = 0; i < threadCount; ++i)
        {
            values.push_back(std::make_unique<Arbor::ObservableValue<int>>(host.scheduler, 0));
            observers.push_back(std::make_unique<CountingObserver>());
            values.back()->addObserver(*observers.back());
        }

        std::vector<std::thread> threads;
        for (int t = 0; t < threadCount; ++t)
        {
            threads.emplace_back([&values, t]
                                 {
                                     for (int i = 1; i <= setsPerThread; ++i)
                                         values[static_cast<size_t>(t)]->set(i);
                                 });
        }

        for (auto& thread : threads)
            thread.join();

        if (host.drainRequests != 1)
            return juce::Result::fail("concurrent setters must request a single drain, got " + juce::String(host.drainRequests));

        host.scheduler.drain();
        for (int i = 0; i < threadCount; ++i)
        {
            if (observers[static_cast<size_t>(i)]->calls != 1)
                return juce::Result::fail("observer " + juce::String(i) + " must run exactly once");
            if (values[static_cast<size_t>(i)]->get() != setsPerThread)
                return juce::Result::fail("value " + juce::String(i) + " lost its last write");
            values[static_cast<size_t>(i)]->removeObserver(*observers[static_cast<size_t>(i)]);
        }

        return juce::Result::ok();
    }

    juce::Result testMessageThreadSchedulerDrainsOnDispatch()
    {
        Arbor::MessageThreadScheduler scheduler;
        Arbor::ObservableValue<juce::String> value(scheduler, "idle");
        CountingObserver observer;
        value.addObserver(observer);

        value.set("busy");
        if (!scheduler.isDrainScheduled())
            return juce::Result::fail("set must schedule a drain on the message thread");
        if (observer.calls != 0)
            return juce::Result::fail("observer must wait for the message thread");

        scheduler.dispatchPendingNow();
        if (observer.calls != 1)
            return juce::Result::fail("dispatchPendingNow must drain the pending observer");
        if (scheduler.isDrainScheduled())
            return juce::Result::fail("drain must clear the scheduled flag");

        value.removeObserver(observer);
        return juce::Result::ok();
    }

    juce::Result testDiagnosticsLevels()
    {
        Arbor::Runtime::BindingDiagnostics diagnostics;
        using Arbor::Runtime::DiagnosticKind;
        using Arbor::Runtime::DiagnosticLogLevel;

        if (!diagnostics.shouldLog(DiagnosticKind::childrenQueryFailure))
            return juce::Result::fail("failures must log at the default level");
        if (diagnostics.shouldLog(DiagnosticKind::lateNotification))
            return juce::Result::fail("late notifications must stay quiet at the default level");

        diagnostics.setSettings({ DiagnosticLogLevel::trace });
        if (!diagnostics.shouldLog(DiagnosticKind::lateNotification))
            return juce::Result::fail("trace level must log late notifications");

        diagnostics.setSettings({ DiagnosticLogLevel::off });
        if (diagnostics.shouldLog(DiagnosticKind::callbackFailure))
            return juce::Result::fail("off must silence failures");

        diagnostics.report(DiagnosticKind::duplicateNode, "node 'B'", "already materialised");
        diagnostics.report(DiagnosticKind::duplicateNode, "node 'B'", "already materialised");
        if (diagnostics.count(DiagnosticKind::duplicateNode) != 2 || diagnostics.totalCount() != 2)
            return juce::Result::fail("reports must be counted even when not logged");

        Arbor::Runtime::DiagnosticEvent event;
        event.kind = DiagnosticKind::duplicateNode;
        event.source = "node 'B'";
        event.message = "already materialised";
        if (Arbor::Runtime::BindingDiagnostics::formatEvent(event) != "kind=duplicateNode source=node 'B' message=already materialised")
            return juce::Result::fail("unexpected event format: " + Arbor::Runtime::BindingDiagnostics::formatEvent(event));

        diagnostics.resetSession();
        if (diagnostics.totalCount() != 0)
            return juce::Result::fail("resetSession must clear counters");

        return juce::Result::ok();
    }
}

int main()
{
    const juce::ScopedJuceInitialiser_GUI juceInitialiser;

    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Observer set semantics", testObserverSetSemantics },
        { "Value set notifies only on change", testValueSetOnlyNotifiesOnChange },
        { "Rapid sets coalesce", testRapidSetsCoalesce },
        { "Enqueue during drain", testEnqueueDuringDrainRunsInSameDrain },
        { "Nested drain ignored", testNestedDrainIsIgnored },
        { "Failing observer isolation", testFailingObserverDoesNotStopDrain },
        { "Remove cancels pending call", testRemoveObserverCancelsPendingCall },
        { "Remove keeps other sources pending", testRemoveObserverKeepsOtherSourcesPending },
        { "Concurrent setters coalesce", testConcurrentSettersCoalesce },
        { "Message thread scheduler", testMessageThreadSchedulerDrainsOnDispatch },
        { "Diagnostics levels", testDiagnosticsLevels }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Arbor core smoke passed." << std::endl;
    return 0;
}
