#pragma once

#include <juce_core/juce_core.h>
#include <array>
#include <cstdint>
#include <functional>

namespace Arbor::Runtime
{
    enum class DiagnosticLogLevel
    {
        off,
        error,
        info,
        trace
    };

    enum class DiagnosticKind
    {
        callbackFailure,
        childrenQueryFailure,
        lateNotification,
        duplicateNode,
        invalidNode
    };

    struct DiagnosticEvent
    {
        DiagnosticKind kind = DiagnosticKind::callbackFailure;
        juce::String source;
        juce::String message;
    };

    class BindingDiagnostics
    {
    public:
        struct Settings
        {
            DiagnosticLogLevel logLevel = DiagnosticLogLevel::error;
        };

        using Listener = std::function<void(const DiagnosticEvent&)>;

        void setSettings(Settings nextSettings);
        [[nodiscard]] Settings settings() const;

        // Receives every reported event, whatever the log level.
        void setListener(Listener nextListener);

        void report(DiagnosticKind kind, const juce::String& source, const juce::String& message);

        [[nodiscard]] std::uint64_t count(DiagnosticKind kind) const;
        [[nodiscard]] std::uint64_t totalCount() const;
        void resetSession();

        [[nodiscard]] bool shouldLog(DiagnosticKind kind) const;
        [[nodiscard]] static juce::String formatEvent(const DiagnosticEvent& event);
        [[nodiscard]] static const char* kindToText(DiagnosticKind kind) noexcept;

    private:
        static constexpr size_t kindCount = 5;

        juce::CriticalSection lock;
        Settings diagnosticSettings {};
        Listener listener;
        std::array<std::uint64_t, kindCount> counters {};
    };
}
