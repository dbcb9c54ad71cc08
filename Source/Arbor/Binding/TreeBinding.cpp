#include "Arbor/Binding/TreeBinding.h"

#include <algorithm>
#include <exception>

namespace Arbor
{
    namespace
    {
        juce::String describeItem(ItemId item, TreeNode& node)
        {
            return "item " + juce::String(item) + " '" + node.getTreeLabel().get() + "'";
        }

        juce::String describeNode(TreeNode& node)
        {
            return "node '" + node.getTreeLabel().get() + "'";
        }

        void addWaitingParent(BindingEntry& holder, ItemId parent)
        {
            if (holder.item == parent || holder.parent == parent)
                return;

            auto& waiting = holder.waitingParents;
            if (std::find(waiting.begin(), waiting.end(), parent) == waiting.end())
                waiting.push_back(parent);
        }
    }

    class TreeBinding::NodeWatcher : public Observer
    {
    public:
        enum class Kind
        {
            label,
            children
        };

        NodeWatcher(TreeBinding& ownerIn, TreeNode& nodeIn, Kind kindIn)
            : owner(ownerIn), node(nodeIn), kind(kindIn)
        {
        }

        void observedChanged() override
        {
            if (kind == Kind::label)
                owner.handleLabelChanged(node);
            else
                owner.handleChildrenChanged(node);
        }

    private:
        TreeBinding& owner;
        TreeNode& node;
        Kind kind;
    };

    TreeBinding::TreeBinding(TreeViewSurface& surfaceIn,
                             Runtime::BindingDiagnostics& diagnosticsIn,
                             Options optionsIn)
        : surface(surfaceIn),
          diagnostics(diagnosticsIn),
          bindingOptions(optionsIn)
    {
        surface.onUserExpand = [this](ItemId item)
        {
            const auto result = expand(item);
            if (result.failed())
                DBG("[Arbor][TreeBinding] item " + juce::String(item) + " stays collapsed: " + result.getErrorMessage());
        };
        surface.onUserCollapse = [this](ItemId item) { collapse(item); };
    }

    TreeBinding::~TreeBinding()
    {
        detach();
        surface.onUserExpand = nullptr;
        surface.onUserCollapse = nullptr;
    }

    juce::Result TreeBinding::attach(std::shared_ptr<TreeNode> rootNode)
    {
        const juce::ScopedLock scopedLock(bindingLock);

        if (rootNode == nullptr)
            return juce::Result::fail("root node is null");
        if (root != kInvalidItemId)
            return juce::Result::fail("a root node is already attached");

        root = materialiseLocked(rootNode, kInvalidItemId);
        if (root == kInvalidItemId)
            return juce::Result::fail("view refused to create the root item");

        // Some views open the root themselves, e.g. a JUCE TreeView with a hidden root.
        const auto rootAlreadyOpen = surface.isExpanded(root);
        if ((bindingOptions.expandRootOnAttach || rootAlreadyOpen) && !rootNode->isTreeLeaf())
        {
            // A failure is reported by expandLocked and leaves the root collapsed.
            if (expandLocked(root).wasOk())
                surface.setExpanded(root, true);
        }

        return juce::Result::ok();
    }

    void TreeBinding::detach()
    {
        const juce::ScopedLock scopedLock(bindingLock);
        if (root == kInvalidItemId)
            return;

        releaseSubtreeLocked(root);
        pendingClaims.clear();
        surface.destroyItem(root);
        root = kInvalidItemId;
    }

    juce::Result TreeBinding::expand(ItemId item)
    {
        const juce::ScopedLock scopedLock(bindingLock);
        return expandLocked(item);
    }

    void TreeBinding::collapse(ItemId item)
    {
        const juce::ScopedLock scopedLock(bindingLock);
        collapseLocked(item);
        settleClaimsLocked();
    }

    void TreeBinding::handleLabelChanged(TreeNode& node)
    {
        const juce::ScopedLock scopedLock(bindingLock);

        const auto item = bindings.itemFor(node);
        if (item == kInvalidItemId)
        {
            diagnostics.report(Runtime::DiagnosticKind::lateNotification, describeNode(node), "label change after dematerialise");
            return;
        }

        surface.setItemText(item, node.getTreeLabel().get());
    }

    void TreeBinding::handleChildrenChanged(TreeNode& node)
    {
        const juce::ScopedLock scopedLock(bindingLock);

        const auto item = bindings.itemFor(node);
        if (item == kInvalidItemId)
        {
            diagnostics.report(Runtime::DiagnosticKind::lateNotification, describeNode(node), "children change after dematerialise");
            return;
        }

        // Collapsed items query their children on the next expand anyway.
        if (const auto* entry = bindings.entryFor(item); entry == nullptr || !entry->expanded)
            return;

        const auto result = rebuildLocked(item);
        if (result.failed())
            DBG("[Arbor][TreeBinding] rebuild of item " + juce::String(item) + " failed: " + result.getErrorMessage());

        settleClaimsLocked();
    }

    juce::Result TreeBinding::expandLocked(ItemId item)
    {
        auto* entry = bindings.entryFor(item);
        if (entry == nullptr)
        {
            diagnostics.report(Runtime::DiagnosticKind::lateNotification, "item " + juce::String(item), "expand of unbound item");
            return juce::Result::ok();
        }

        const auto node = entry->node;
        if (node->isTreeLeaf() || entry->expanded)
            return juce::Result::ok();

        std::vector<std::shared_ptr<TreeNode>> children;
        const auto queryResult = queryChildren(*node, children);
        if (queryResult.failed())
        {
            diagnostics.report(Runtime::DiagnosticKind::childrenQueryFailure, describeItem(item, *node), queryResult.getErrorMessage());
            surface.setExpanded(item, false);
            return queryResult;
        }

        entry->expanded = true;
        entry->children.reserve(children.size());

        for (const auto& child : children)
        {
            if (child == nullptr)
            {
                diagnostics.report(Runtime::DiagnosticKind::invalidNode, describeItem(item, *node), "children contain a null node");
                continue;
            }

            if (auto* holder = bindings.entryFor(bindings.itemFor(*child)); holder != nullptr)
            {
                addWaitingParent(*holder, item);
                diagnostics.report(Runtime::DiagnosticKind::duplicateNode,
                                   describeNode(*child),
                                   "already materialised as item " + juce::String(holder->item));
                continue;
            }

            const auto childItem = materialiseLocked(child, item);
            if (childItem != kInvalidItemId)
                entry->children.push_back(childItem);
        }

        return juce::Result::ok();
    }

    void TreeBinding::collapseLocked(ItemId item)
    {
        auto* entry = bindings.entryFor(item);
        if (entry == nullptr)
        {
            diagnostics.report(Runtime::DiagnosticKind::lateNotification, "item " + juce::String(item), "collapse of unbound item");
            return;
        }

        if (!entry->expanded)
            return;

        for (const auto child : entry->children)
            releaseSubtreeLocked(child);

        entry->children.clear();
        entry->expanded = false;
        surface.destroyChildren(item);
    }

    juce::Result TreeBinding::rebuildLocked(ItemId item)
    {
        collapseLocked(item);
        return expandLocked(item);
    }

    void TreeBinding::settleClaimsLocked()
    {
        while (!pendingClaims.empty())
        {
            const auto claim = pendingClaims.front();
            pendingClaims.erase(pendingClaims.begin());

            auto* waiter = bindings.entryFor(claim.parent);
            if (waiter == nullptr || !waiter->expanded)
                continue;

            // Bound again elsewhere before this parent got its turn.
            if (auto* holder = bindings.entryFor(bindings.itemFor(*claim.node)); holder != nullptr)
            {
                addWaitingParent(*holder, claim.parent);
                continue;
            }

            const auto result = rebuildLocked(claim.parent);
            if (result.failed())
                DBG("[Arbor][TreeBinding] reclaim under item " + juce::String(claim.parent) + " failed: " + result.getErrorMessage());
        }
    }

    ItemId TreeBinding::materialiseLocked(const std::shared_ptr<TreeNode>& node, ItemId parent)
    {
        auto labelWatcher = std::make_unique<NodeWatcher>(*this, *node, NodeWatcher::Kind::label);
        auto childrenWatcher = std::make_unique<NodeWatcher>(*this, *node, NodeWatcher::Kind::children);

        // Observers go in before the label is read so a concurrent set() is never lost.
        node->getTreeLabel().addObserver(*labelWatcher);
        node->getTreeChildrenChange().addObserver(*childrenWatcher);

        const auto label = node->getTreeLabel().get();
        const auto item = parent == kInvalidItemId ? surface.createRootItem(label)
                                                   : surface.appendChildItem(parent, label);

        BindingEntry entry;
        entry.node = node;
        entry.item = item;
        entry.parent = parent;
        entry.labelWatcher = std::move(labelWatcher);
        entry.childrenWatcher = std::move(childrenWatcher);

        auto* labelObserver = entry.labelWatcher.get();
        auto* childrenObserver = entry.childrenWatcher.get();

        if (!bindings.insert(std::move(entry)))
        {
            node->getTreeLabel().removeObserver(*labelObserver);
            node->getTreeChildrenChange().removeObserver(*childrenObserver);
            if (item != kInvalidItemId)
                surface.destroyItem(item);

            diagnostics.report(Runtime::DiagnosticKind::invalidNode, describeNode(*node), "could not bind a view item");
            return kInvalidItemId;
        }

        if (!node->isTreeLeaf())
            surface.setHasChildrenIndicator(item, true);

        return item;
    }

    void TreeBinding::releaseSubtreeLocked(ItemId item)
    {
        auto entry = bindings.eraseItem(item);
        if (!entry.has_value())
            return;

        for (const auto child : entry->children)
            releaseSubtreeLocked(child);

        for (const auto parent : entry->waitingParents)
            pendingClaims.push_back({ parent, entry->node });

        entry->node->getTreeLabel().removeObserver(*entry->labelWatcher);
        entry->node->getTreeChildrenChange().removeObserver(*entry->childrenWatcher);
    }

    juce::Result TreeBinding::queryChildren(TreeNode& node, std::vector<std::shared_ptr<TreeNode>>& outChildren)
    {
        try
        {
            outChildren = node.getTreeChildren();
        }
        catch (const std::exception& exception)
        {
            return juce::Result::fail("children query failed: " + juce::String(exception.what()));
        }
        catch (...)
        {
            return juce::Result::fail("children query failed: unknown exception");
        }

        return juce::Result::ok();
    }

    ItemId TreeBinding::rootItem() const
    {
        const juce::ScopedLock scopedLock(bindingLock);
        return root;
    }

    ItemId TreeBinding::findItem(const TreeNode& node) const
    {
        const juce::ScopedLock scopedLock(bindingLock);
        return bindings.itemFor(node);
    }

    std::shared_ptr<TreeNode> TreeBinding::findNode(ItemId item) const
    {
        const juce::ScopedLock scopedLock(bindingLock);
        if (const auto* entry = bindings.entryFor(item); entry != nullptr)
            return entry->node;

        return nullptr;
    }

    bool TreeBinding::isExpanded(ItemId item) const
    {
        const juce::ScopedLock scopedLock(bindingLock);
        const auto* entry = bindings.entryFor(item);
        return entry != nullptr && entry->expanded;
    }

    std::vector<ItemId> TreeBinding::childItems(ItemId item) const
    {
        const juce::ScopedLock scopedLock(bindingLock);
        if (const auto* entry = bindings.entryFor(item); entry != nullptr)
            return entry->children;

        return {};
    }

    size_t TreeBinding::materialisedCount() const
    {
        const juce::ScopedLock scopedLock(bindingLock);
        return bindings.size();
    }

    const TreeBinding::Options& TreeBinding::options() const noexcept
    {
        return bindingOptions;
    }
}
