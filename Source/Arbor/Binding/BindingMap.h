#pragma once

#include "Arbor/Core/Observer.h"
#include "Arbor/Public/TreeNode.h"
#include "Arbor/Public/Types.h"
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace Arbor
{
    struct BindingEntry
    {
        std::shared_ptr<TreeNode> node;
        ItemId item = kInvalidItemId;
        ItemId parent = kInvalidItemId;
        std::vector<ItemId> children;
        bool expanded = false;

        // Expanded items that skipped this node because it was already bound here.
        std::vector<ItemId> waitingParents;

        std::unique_ptr<Observer> labelWatcher;
        std::unique_ptr<Observer> childrenWatcher;
    };

    /*
        node -> item and item -> entry, updated together. A node has an entry
        exactly when it has an item, and each side holds a key at most once.
    */
    class BindingMap
    {
    public:
        // Fails, leaving the map untouched, when the node or the item is already mapped.
        bool insert(BindingEntry entry);

        std::optional<BindingEntry> eraseItem(ItemId item);

        [[nodiscard]] BindingEntry* entryFor(ItemId item) noexcept;
        [[nodiscard]] const BindingEntry* entryFor(ItemId item) const noexcept;
        [[nodiscard]] ItemId itemFor(const TreeNode& node) const noexcept;
        [[nodiscard]] bool contains(const TreeNode& node) const noexcept;

        [[nodiscard]] size_t size() const noexcept;
        [[nodiscard]] bool isEmpty() const noexcept;

    private:
        std::unordered_map<const TreeNode*, ItemId> itemByNode;
        std::unordered_map<ItemId, BindingEntry> entryByItem;
    };
}
