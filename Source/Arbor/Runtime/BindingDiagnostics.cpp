#include "Arbor/Runtime/BindingDiagnostics.h"

#include <numeric>

namespace Arbor::Runtime
{
    namespace
    {
        DiagnosticLogLevel minimumLevelFor(DiagnosticKind kind) noexcept
        {
            switch (kind)
            {
                case DiagnosticKind::callbackFailure: return DiagnosticLogLevel::error;
                case DiagnosticKind::childrenQueryFailure: return DiagnosticLogLevel::error;
                case DiagnosticKind::invalidNode: return DiagnosticLogLevel::error;
                case DiagnosticKind::duplicateNode: return DiagnosticLogLevel::info;
                case DiagnosticKind::lateNotification: return DiagnosticLogLevel::trace;
            }

            return DiagnosticLogLevel::trace;
        }
    }

    void BindingDiagnostics::setSettings(Settings nextSettings)
    {
        const juce::ScopedLock scopedLock(lock);
        diagnosticSettings = nextSettings;
    }

    BindingDiagnostics::Settings BindingDiagnostics::settings() const
    {
        const juce::ScopedLock scopedLock(lock);
        return diagnosticSettings;
    }

    void BindingDiagnostics::setListener(Listener nextListener)
    {
        const juce::ScopedLock scopedLock(lock);
        listener = std::move(nextListener);
    }

    void BindingDiagnostics::report(DiagnosticKind kind, const juce::String& source, const juce::String& message)
    {
        DiagnosticEvent event;
        event.kind = kind;
        event.source = source;
        event.message = message;

        Listener listenerCopy;
        {
            const juce::ScopedLock scopedLock(lock);
            counters[static_cast<size_t>(kind)] += 1;
            listenerCopy = listener;
        }

        if (shouldLog(kind))
            DBG("[Arbor] " + formatEvent(event));

        if (listenerCopy != nullptr)
            listenerCopy(event);
    }

    std::uint64_t BindingDiagnostics::count(DiagnosticKind kind) const
    {
        const juce::ScopedLock scopedLock(lock);
        return counters[static_cast<size_t>(kind)];
    }

    std::uint64_t BindingDiagnostics::totalCount() const
    {
        const juce::ScopedLock scopedLock(lock);
        return std::accumulate(counters.begin(), counters.end(), std::uint64_t { 0 });
    }

    void BindingDiagnostics::resetSession()
    {
        const juce::ScopedLock scopedLock(lock);
        counters.fill(0);
    }

    bool BindingDiagnostics::shouldLog(DiagnosticKind kind) const
    {
        const auto level = settings().logLevel;
        if (level == DiagnosticLogLevel::off)
            return false;

        return static_cast<int>(level) >= static_cast<int>(minimumLevelFor(kind));
    }

    juce::String BindingDiagnostics::formatEvent(const DiagnosticEvent& event)
    {
        auto text = juce::String("kind=") + kindToText(event.kind)
                  + " source=" + (event.source.isNotEmpty() ? event.source : juce::String("n/a"));

        if (event.message.isNotEmpty())
            text += " message=" + event.message;

        return text;
    }

    const char* BindingDiagnostics::kindToText(DiagnosticKind kind) noexcept
    {
        switch (kind)
        {
            case DiagnosticKind::callbackFailure: return "callbackFailure";
            case DiagnosticKind::childrenQueryFailure: return "childrenQueryFailure";
            case DiagnosticKind::lateNotification: return "lateNotification";
            case DiagnosticKind::duplicateNode: return "duplicateNode";
            case DiagnosticKind::invalidNode: return "invalidNode";
        }

        return "unknown";
    }
}
