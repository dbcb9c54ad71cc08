#pragma once

#include "Arbor/Core/Observable.h"
#include "Arbor/Core/ObservableValue.h"
#include <juce_core/juce_core.h>
#include <memory>
#include <vector>

namespace Arbor
{
    /*
        A node of the domain tree, implemented by application code.

        isTreeLeaf() must return the same answer for the lifetime of the node;
        a leaf never has children. getTreeChildren() is called only when the
        binding needs the children and must not be cached by the node, it may
        throw. getTreeChildrenChange() fires whenever the result of
        getTreeChildren() may have changed. Label and children changes may be
        made from any thread.
    */
    class TreeNode
    {
    public:
        virtual ~TreeNode() = default;

        virtual ObservableValue<juce::String>& getTreeLabel() = 0;
        virtual bool isTreeLeaf() const = 0;
        virtual std::vector<std::shared_ptr<TreeNode>> getTreeChildren() = 0;
        virtual Observable& getTreeChildrenChange() = 0;
    };
}
