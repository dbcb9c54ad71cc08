#pragma once

#include "Arbor/Core/NotificationScheduler.h"
#include "Arbor/Public/TreeNode.h"
#include <juce_core/juce_core.h>
#include <memory>
#include <vector>

namespace Arbor
{
    // A TreeNode whose label and children can be edited from any thread.
    class MutableTreeNode : public TreeNode
    {
    public:
        enum class Kind
        {
            branch,
            leaf
        };

        MutableTreeNode(NotificationScheduler& schedulerIn, const juce::String& labelIn, Kind kindIn);

        ObservableValue<juce::String>& getTreeLabel() override;
        bool isTreeLeaf() const override;
        std::vector<std::shared_ptr<TreeNode>> getTreeChildren() override;
        Observable& getTreeChildrenChange() override;

        bool setLabel(const juce::String& newLabel);

        // These return false for a leaf, or when the child list would not change.
        bool setChildren(std::vector<std::shared_ptr<TreeNode>> newChildren);
        bool addChild(std::shared_ptr<TreeNode> child);
        bool removeChild(const TreeNode& child);

        [[nodiscard]] int childCount() const;

    private:
        const Kind kind;
        ObservableValue<juce::String> label;
        Observable childrenChange;

        juce::CriticalSection childrenLock;
        std::vector<std::shared_ptr<TreeNode>> children;

        JUCE_DECLARE_NON_COPYABLE(MutableTreeNode)
    };
}
