#pragma once

#include "Arbor/Public/Types.h"
#include <juce_core/juce_core.h>
#include <functional>

namespace Arbor
{
    /*
        The visual tree a TreeBinding drives. Every call happens on the message
        thread, and the user events must be raised there too.

        setExpanded() is programmatic and must not raise onUserExpand or
        onUserCollapse.
    */
    class TreeViewSurface
    {
    public:
        virtual ~TreeViewSurface() = default;

        virtual ItemId createRootItem(const juce::String& text) = 0;
        virtual ItemId appendChildItem(ItemId parent, const juce::String& text) = 0;
        virtual void destroyItem(ItemId item) = 0;
        virtual void destroyChildren(ItemId item) = 0;

        virtual void setItemText(ItemId item, const juce::String& text) = 0;
        virtual void setHasChildrenIndicator(ItemId item, bool hasChildren) = 0;
        virtual bool isExpanded(ItemId item) const = 0;
        virtual void setExpanded(ItemId item, bool shouldBeExpanded) = 0;

        std::function<void(ItemId)> onUserExpand;
        std::function<void(ItemId)> onUserCollapse;
    };
}
