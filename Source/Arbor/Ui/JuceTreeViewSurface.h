#pragma once

#include "Arbor/Public/TreeViewSurface.h"
#include "Arbor/Public/Types.h"
#include <juce_gui_basics/juce_gui_basics.h>
#include <memory>
#include <unordered_map>

namespace Arbor::Ui
{
    // TreeViewSurface backed by a juce::TreeView. Message thread only.
    class JuceTreeViewSurface : public TreeViewSurface
    {
    public:
        struct Options
        {
            int rowHeight = 22;
            bool rootItemVisible = true;
        };

        explicit JuceTreeViewSurface(Options optionsIn = {});
        ~JuceTreeViewSurface() override;

        ItemId createRootItem(const juce::String& text) override;
        ItemId appendChildItem(ItemId parent, const juce::String& text) override;
        void destroyItem(ItemId item) override;
        void destroyChildren(ItemId item) override;

        void setItemText(ItemId item, const juce::String& text) override;
        void setHasChildrenIndicator(ItemId item, bool hasChildren) override;
        bool isExpanded(ItemId item) const override;
        void setExpanded(ItemId item, bool shouldBeExpanded) override;

        juce::TreeView& treeView() noexcept;
        [[nodiscard]] juce::TreeViewItem* findTreeItem(ItemId item) const;
        [[nodiscard]] juce::String itemText(ItemId item) const;
        [[nodiscard]] int itemCount() const noexcept;

    private:
        class Item;

        Item* findItem(ItemId item) const;
        void forgetSubtree(juce::TreeViewItem& item);
        void handleOpennessChanged(const Item& item, bool isNowOpen);

        Options surfaceOptions;
        juce::TreeView view;
        std::unique_ptr<Item> rootItem;
        std::unordered_map<ItemId, Item*> itemsById;
        ItemId nextItemId = kInvalidItemId + 1;
        bool suppressOpennessCallbacks = false;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(JuceTreeViewSurface)
    };
}
