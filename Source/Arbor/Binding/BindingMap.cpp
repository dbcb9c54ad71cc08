#include "Arbor/Binding/BindingMap.h"

namespace Arbor
{
    bool BindingMap::insert(BindingEntry entry)
    {
        if (entry.node == nullptr || entry.item == kInvalidItemId)
            return false;
        if (itemByNode.count(entry.node.get()) > 0 || entryByItem.count(entry.item) > 0)
            return false;

        const auto item = entry.item;
        itemByNode.emplace(entry.node.get(), item);
        entryByItem.emplace(item, std::move(entry));
        return true;
    }

    std::optional<BindingEntry> BindingMap::eraseItem(ItemId item)
    {
        const auto it = entryByItem.find(item);
        if (it == entryByItem.end())
            return std::nullopt;

        auto entry = std::move(it->second);
        entryByItem.erase(it);
        itemByNode.erase(entry.node.get());
        return entry;
    }

    BindingEntry* BindingMap::entryFor(ItemId item) noexcept
    {
        const auto it = entryByItem.find(item);
        return it == entryByItem.end() ? nullptr : &it->second;
    }

    const BindingEntry* BindingMap::entryFor(ItemId item) const noexcept
    {
        const auto it = entryByItem.find(item);
        return it == entryByItem.end() ? nullptr : &it->second;
    }

    ItemId BindingMap::itemFor(const TreeNode& node) const noexcept
    {
        const auto it = itemByNode.find(&node);
        return it == itemByNode.end() ? kInvalidItemId : it->second;
    }

    bool BindingMap::contains(const TreeNode& node) const noexcept
    {
        return itemByNode.count(&node) > 0;
    }

    size_t BindingMap::size() const noexcept
    {
        return entryByItem.size();
    }

    bool BindingMap::isEmpty() const noexcept
    {
        return entryByItem.empty();
    }
}
