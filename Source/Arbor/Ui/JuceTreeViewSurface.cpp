#include "Arbor/Ui/JuceTreeViewSurface.h"

namespace Arbor::Ui
{
    class JuceTreeViewSurface::Item : public juce::TreeViewItem
    {
    public:
        Item(JuceTreeViewSurface& ownerIn, ItemId idIn, const juce::String& textIn)
            : owner(ownerIn), id(idIn), text(textIn)
        {
        }

        juce::String getUniqueName() const override { return juce::String(id); }
        bool mightContainSubItems() override { return hasChildren; }
        int getItemHeight() const override { return owner.surfaceOptions.rowHeight; }
        ItemId itemId() const noexcept { return id; }
        const juce::String& itemText() const noexcept { return text; }

        void setItemText(const juce::String& newText)
        {
            if (text == newText)
                return;

            text = newText;
            repaintItem();
        }

        void setHasChildren(bool shouldHaveChildren)
        {
            if (hasChildren == shouldHaveChildren)
                return;

            hasChildren = shouldHaveChildren;
            treeHasChanged();
        }

        void paintItem(juce::Graphics& g, int width, int height) override
        {
            if (isSelected())
            {
                g.setColour(juce::Colour::fromRGB(56, 98, 160));
                g.fillRoundedRectangle(juce::Rectangle<float>(1.0f, 1.0f, static_cast<float>(width - 2), static_cast<float>(height - 2)), 4.0f);
            }

            g.setColour(juce::Colour::fromRGB(206, 212, 222));
            g.setFont(juce::FontOptions(12.0f));
            g.drawFittedText(text, juce::Rectangle<int>(0, 0, width, height).reduced(6, 1), juce::Justification::centredLeft, 1);
        }

        void itemOpennessChanged(bool isNowOpen) override
        {
            owner.handleOpennessChanged(*this, isNowOpen);
        }

    private:
        JuceTreeViewSurface& owner;
        ItemId id = kInvalidItemId;
        juce::String text;
        bool hasChildren = false;
    };

    JuceTreeViewSurface::JuceTreeViewSurface(Options optionsIn)
        : surfaceOptions(optionsIn)
    {
        surfaceOptions.rowHeight = juce::jmax(8, surfaceOptions.rowHeight);

        view.setRootItemVisible(surfaceOptions.rootItemVisible);
        view.setMultiSelectEnabled(false);
        view.setDefaultOpenness(false);
        view.setColour(juce::TreeView::backgroundColourId, juce::Colour::fromRGB(24, 28, 34));
        view.setColour(juce::TreeView::linesColourId, juce::Colour::fromRGBA(255, 255, 255, 18));
    }

    JuceTreeViewSurface::~JuceTreeViewSurface()
    {
        onUserExpand = nullptr;
        onUserCollapse = nullptr;
        itemsById.clear();
        view.setRootItem(nullptr);
        rootItem.reset();
    }

    ItemId JuceTreeViewSurface::createRootItem(const juce::String& text)
    {
        if (rootItem != nullptr)
        {
            DBG("[Arbor][JuceTreeView] root item already exists");
            return kInvalidItemId;
        }

        const auto id = nextItemId++;
        rootItem = std::make_unique<Item>(*this, id, text);
        itemsById[id] = rootItem.get();

        const juce::ScopedValueSetter<bool> suppress(suppressOpennessCallbacks, true);
        view.setRootItem(rootItem.get());
        return id;
    }

    ItemId JuceTreeViewSurface::appendChildItem(ItemId parent, const juce::String& text)
    {
        auto* parentItem = findItem(parent);
        if (parentItem == nullptr)
        {
            DBG("[Arbor][JuceTreeView] append under unknown item " + juce::String(parent));
            return kInvalidItemId;
        }

        const auto id = nextItemId++;
        auto* child = new Item(*this, id, text);
        parentItem->addSubItem(child);
        itemsById[id] = child;
        return id;
    }

    void JuceTreeViewSurface::destroyItem(ItemId item)
    {
        auto* target = findItem(item);
        if (target == nullptr)
            return;

        const juce::ScopedValueSetter<bool> suppress(suppressOpennessCallbacks, true);
        forgetSubtree(*target);

        if (target == rootItem.get())
        {
            view.setRootItem(nullptr);
            rootItem.reset();
            return;
        }

        if (auto* parent = target->getParentItem(); parent != nullptr)
            parent->removeSubItem(target->getIndexInParent(), true);
    }

    void JuceTreeViewSurface::destroyChildren(ItemId item)
    {
        auto* target = findItem(item);
        if (target == nullptr)
            return;

        const juce::ScopedValueSetter<bool> suppress(suppressOpennessCallbacks, true);
        for (int i = 0; i < target->getNumSubItems(); ++i)
        {
            if (auto* child = target->getSubItem(i); child != nullptr)
                forgetSubtree(*child);
        }

        target->clearSubItems();
    }

    void JuceTreeViewSurface::setItemText(ItemId item, const juce::String& text)
    {
        if (auto* target = findItem(item); target != nullptr)
            target->setItemText(text);
    }

    void JuceTreeViewSurface::setHasChildrenIndicator(ItemId item, bool hasChildren)
    {
        if (auto* target = findItem(item); target != nullptr)
            target->setHasChildren(hasChildren);
    }

    bool JuceTreeViewSurface::isExpanded(ItemId item) const
    {
        const auto* target = findItem(item);
        return target != nullptr && target->isOpen();
    }

    void JuceTreeViewSurface::setExpanded(ItemId item, bool shouldBeExpanded)
    {
        auto* target = findItem(item);
        if (target == nullptr)
            return;

        const juce::ScopedValueSetter<bool> suppress(suppressOpennessCallbacks, true);
        target->setOpen(shouldBeExpanded);
    }

    juce::TreeView& JuceTreeViewSurface::treeView() noexcept
    {
        return view;
    }

    juce::TreeViewItem* JuceTreeViewSurface::findTreeItem(ItemId item) const
    {
        return findItem(item);
    }

    juce::String JuceTreeViewSurface::itemText(ItemId item) const
    {
        if (const auto* target = findItem(item); target != nullptr)
            return target->itemText();

        return {};
    }

    int JuceTreeViewSurface::itemCount() const noexcept
    {
        return static_cast<int>(itemsById.size());
    }

    JuceTreeViewSurface::Item* JuceTreeViewSurface::findItem(ItemId item) const
    {
        const auto it = itemsById.find(item);
        return it == itemsById.end() ? nullptr : it->second;
    }

    void JuceTreeViewSurface::forgetSubtree(juce::TreeViewItem& item)
    {
        for (int i = 0; i < item.getNumSubItems(); ++i)
        {
            if (auto* child = item.getSubItem(i); child != nullptr)
                forgetSubtree(*child);
        }

        if (const auto* surfaceItem = dynamic_cast<const Item*>(&item); surfaceItem != nullptr)
            itemsById.erase(surfaceItem->itemId());
    }

    void JuceTreeViewSurface::handleOpennessChanged(const Item& item, bool isNowOpen)
    {
        if (suppressOpennessCallbacks)
            return;

        const auto id = item.itemId();
        if (isNowOpen)
        {
            if (onUserExpand != nullptr)
                onUserExpand(id);
        }
        else if (onUserCollapse != nullptr)
        {
            onUserCollapse(id);
        }
    }
}
