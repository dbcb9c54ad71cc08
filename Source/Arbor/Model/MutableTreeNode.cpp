#include "Arbor/Model/MutableTreeNode.h"

#include <algorithm>

namespace Arbor
{
    MutableTreeNode::MutableTreeNode(NotificationScheduler& schedulerIn, const juce::String& labelIn, Kind kindIn)
        : kind(kindIn),
          label(schedulerIn, labelIn),
          childrenChange(schedulerIn)
    {
    }

    ObservableValue<juce::String>& MutableTreeNode::getTreeLabel()
    {
        return label;
    }

    bool MutableTreeNode::isTreeLeaf() const
    {
        return kind == Kind::leaf;
    }

    std::vector<std::shared_ptr<TreeNode>> MutableTreeNode::getTreeChildren()
    {
        const juce::ScopedLock scopedLock(childrenLock);
        return children;
    }

    Observable& MutableTreeNode::getTreeChildrenChange()
    {
        return childrenChange;
    }

    bool MutableTreeNode::setLabel(const juce::String& newLabel)
    {
        return label.set(newLabel);
    }

    bool MutableTreeNode::setChildren(std::vector<std::shared_ptr<TreeNode>> newChildren)
    {
        if (kind == Kind::leaf)
            return false;

        {
            const juce::ScopedLock scopedLock(childrenLock);
            if (children == newChildren)
                return false;

            children = std::move(newChildren);
        }

        childrenChange.notify();
        return true;
    }

    bool MutableTreeNode::addChild(std::shared_ptr<TreeNode> child)
    {
        if (kind == Kind::leaf || child == nullptr)
            return false;

        {
            const juce::ScopedLock scopedLock(childrenLock);
            children.push_back(std::move(child));
        }

        childrenChange.notify();
        return true;
    }

    bool MutableTreeNode::removeChild(const TreeNode& child)
    {
        {
            const juce::ScopedLock scopedLock(childrenLock);
            const auto it = std::find_if(children.begin(),
                                         children.end(),
                                         [&child](const std::shared_ptr<TreeNode>& candidate)
                                         {
                                             return candidate.get() == &child;
                                         });
            if (it == children.end())
                return false;

            children.erase(it);
        }

        childrenChange.notify();
        return true;
    }

    int MutableTreeNode::childCount() const
    {
        const juce::ScopedLock scopedLock(childrenLock);
        return static_cast<int>(children.size());
    }
}
