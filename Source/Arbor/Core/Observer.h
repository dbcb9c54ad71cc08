#pragma once

#include <functional>
#include <utility>

namespace Arbor
{
    /*
        Receives deferred change notifications. The pointer is the identity used
        for registration, coalescing and cancellation, so an Observer must be
        removed from every Observable before it is destroyed.
    */
    class Observer
    {
    public:
        virtual ~Observer() = default;
        virtual void observedChanged() = 0;
    };

    class FunctionObserver : public Observer
    {
    public:
        explicit FunctionObserver(std::function<void()> callbackIn)
            : callback(std::move(callbackIn))
        {
        }

        void observedChanged() override
        {
            if (callback != nullptr)
                callback();
        }

    private:
        std::function<void()> callback;
    };
}
