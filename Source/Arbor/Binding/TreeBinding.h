#pragma once

#include "Arbor/Binding/BindingMap.h"
#include "Arbor/Public/TreeNode.h"
#include "Arbor/Public/TreeViewSurface.h"
#include "Arbor/Public/Types.h"
#include "Arbor/Runtime/BindingDiagnostics.h"
#include <juce_core/juce_core.h>
#include <memory>
#include <vector>

namespace Arbor
{
    /*
        Keeps a TreeViewSurface in step with a tree of TreeNodes.

        Only the root and the children of expanded items are materialised: each
        has exactly one item, one BindingMap entry and observers on its label and
        children-changed Observable. Children are queried on expand and never
        cached; a children change on an expanded item rebuilds its children from
        scratch, so deeper expansion state below it is lost.

        Everything here runs on the message thread. Observer callbacks arrive
        through the NotificationScheduler, never from inside the binding lock.

        A node is bound to at most one item. A parent whose children include a
        node already materialised elsewhere skips it and reports a duplicate;
        once the holder lets go of the node, the skipping parent is rebuilt so
        a node moved between parents always reappears.
    */
    class TreeBinding
    {
    public:
        struct Options
        {
            bool expandRootOnAttach = false;
        };

        TreeBinding(TreeViewSurface& surfaceIn,
                    Runtime::BindingDiagnostics& diagnosticsIn,
                    Options optionsIn = {});
        ~TreeBinding();

        juce::Result attach(std::shared_ptr<TreeNode> root);
        void detach();

        juce::Result expand(ItemId item);
        void collapse(ItemId item);

        [[nodiscard]] ItemId rootItem() const;
        [[nodiscard]] ItemId findItem(const TreeNode& node) const;
        [[nodiscard]] std::shared_ptr<TreeNode> findNode(ItemId item) const;
        [[nodiscard]] bool isExpanded(ItemId item) const;
        [[nodiscard]] std::vector<ItemId> childItems(ItemId item) const;
        [[nodiscard]] size_t materialisedCount() const;
        [[nodiscard]] const Options& options() const noexcept;

    private:
        class NodeWatcher;

        void handleLabelChanged(TreeNode& node);
        void handleChildrenChanged(TreeNode& node);

        juce::Result expandLocked(ItemId item);
        void collapseLocked(ItemId item);
        juce::Result rebuildLocked(ItemId item);
        void settleClaimsLocked();
        ItemId materialiseLocked(const std::shared_ptr<TreeNode>& node, ItemId parent);
        void releaseSubtreeLocked(ItemId item);
        static juce::Result queryChildren(TreeNode& node, std::vector<std::shared_ptr<TreeNode>>& outChildren);

        TreeViewSurface& surface;
        Runtime::BindingDiagnostics& diagnostics;
        Options bindingOptions;

        juce::CriticalSection bindingLock;
        BindingMap bindings;
        ItemId root = kInvalidItemId;

        struct PendingClaim
        {
            ItemId parent = kInvalidItemId;
            std::shared_ptr<TreeNode> node;
        };

        // Released nodes that another expanded item skipped as duplicates.
        std::vector<PendingClaim> pendingClaims;

        JUCE_DECLARE_NON_COPYABLE(TreeBinding)
    };
}
