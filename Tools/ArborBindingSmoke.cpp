#include <juce_gui_basics/juce_gui_basics.h>

#include "Arbor/Arbor.h"

#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace
{
    using Arbor::ItemId;
    using Arbor::kInvalidItemId;
    using Arbor::MutableTreeNode;
    using Arbor::Runtime::DiagnosticKind;

    class RecordingSurface : public Arbor::TreeViewSurface
    {
    public:
        struct Item
        {
            ItemId parent = kInvalidItemId;
            juce::String text;
            bool hasChildren = false;
            bool expanded = false;
            std::vector<ItemId> children;
        };

        ItemId createRootItem(const juce::String& text) override
        {
            const auto id = nextId++;
            items[id] = { kInvalidItemId, text, false, false, {} };
            return id;
        }

        ItemId appendChildItem(ItemId parent, const juce::String& text) override
        {
            const auto it = items.find(parent);
            if (it == items.end())
                return kInvalidItemId;

            const auto id = nextId++;
            it->second.children.push_back(id);
            items[id] = { parent, text, false, false, {} };
            return id;
        }

        void destroyItem(ItemId item) override
        {
            const auto it = items.find(item);
            if (it == items.end())
                return;

            if (const auto parentIt = items.find(it->second.parent); parentIt != items.end())
            {
                auto& siblings = parentIt->second.children;
                siblings.erase(std::remove(siblings.begin(), siblings.end(), item), siblings.end());
            }

            eraseRecursive(item);
        }

        void destroyChildren(ItemId item) override
        {
            const auto it = items.find(item);
            if (it == items.end())
                return;

            const auto children = it->second.children;
            for (const auto child : children)
                eraseRecursive(child);

            items[item].children.clear();
        }

        void setItemText(ItemId item, const juce::String& text) override
        {
            textUpdates += 1;
            if (const auto it = items.find(item); it != items.end())
                it->second.text = text;
        }

        void setHasChildrenIndicator(ItemId item, bool hasChildren) override
        {
            if (const auto it = items.find(item); it != items.end())
                it->second.hasChildren = hasChildren;
        }

        bool isExpanded(ItemId item) const override
        {
            const auto it = items.find(item);
            return it != items.end() && it->second.expanded;
        }

        void setExpanded(ItemId item, bool shouldBeExpanded) override
        {
            if (const auto it = items.find(item); it != items.end())
                it->second.expanded = shouldBeExpanded;
        }

        void userExpand(ItemId item)
        {
            setExpanded(item, true);
            if (onUserExpand != nullptr)
                onUserExpand(item);
        }

        void userCollapse(ItemId item)
        {
            setExpanded(item, false);
            if (onUserCollapse != nullptr)
                onUserCollapse(item);
        }

        const Item* find(ItemId item) const
        {
            const auto it = items.find(item);
            return it == items.end() ? nullptr : &it->second;
        }

        juce::StringArray childTexts(ItemId item) const
        {
            juce::StringArray texts;
            if (const auto* entry = find(item); entry != nullptr)
            {
                for (const auto child : entry->children)
                    texts.add(items.at(child).text);
            }

            return texts;
        }

        size_t size() const noexcept { return items.size(); }

        int textUpdates = 0;

    private:
        void eraseRecursive(ItemId item)
        {
            const auto it = items.find(item);
            if (it == items.end())
                return;

            const auto children = it->second.children;
            for (const auto child : children)
                eraseRecursive(child);

            items.erase(item);
        }

        std::map<ItemId, Item> items;
        ItemId nextId = 1;
    };

    class ProbeNode : public MutableTreeNode
    {
    public:
        using MutableTreeNode::MutableTreeNode;

        std::vector<std::shared_ptr<Arbor::TreeNode>> getTreeChildren() override
        {
            queries += 1;
            if (failQueries)
                throw std::runtime_error("backend offline");

            return MutableTreeNode::getTreeChildren();
        }

        size_t observerCount()
        {
            return getTreeLabel().observable().observerCount() + getTreeChildrenChange().observerCount();
        }

        int queries = 0;
        bool failQueries = false;
    };

    struct Fixture
    {
        Fixture()
        {
            diagnostics.setSettings({ Arbor::Runtime::DiagnosticLogLevel::off });
            scheduler.setDiagnostics(&diagnostics);
        }

        std::shared_ptr<ProbeNode> branch(const juce::String& label)
        {
            return std::make_shared<ProbeNode>(scheduler, label, MutableTreeNode::Kind::branch);
        }

        std::shared_ptr<ProbeNode> leaf(const juce::String& label)
        {
            return std::make_shared<ProbeNode>(scheduler, label, MutableTreeNode::Kind::leaf);
        }

        int drainRequests = 0;
        Arbor::NotificationScheduler scheduler { [this] { ++drainRequests; } };
        Arbor::Runtime::BindingDiagnostics diagnostics;
        RecordingSurface surface;
    };

    juce::Result testExpandRenameCollapseScenario()
    {
        Fixture fixture;
        auto a = fixture.branch("A");
        auto b = fixture.leaf("B");
        auto c = fixture.leaf("C");
        a->setChildren({ b, c });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        const auto attachResult = binding.attach(a);
        if (attachResult.failed())
            return attachResult;

        const auto root = binding.rootItem();
        const auto* rootItem = fixture.surface.find(root);
        if (rootItem == nullptr || rootItem->text != "A" || !rootItem->hasChildren)
            return juce::Result::fail("root item must show A with a children indicator");
        if (a->queries != 0)
            return juce::Result::fail("attach must not query children");

        fixture.surface.userExpand(root);
        if (fixture.surface.childTexts(root) != juce::StringArray { "B", "C" })
            return juce::Result::fail("expand must show B and C, got " + fixture.surface.childTexts(root).joinIntoString(","));
        if (binding.materialisedCount() != 3 || !binding.isExpanded(root))
            return juce::Result::fail("expand must materialise both children");

        std::set<Arbor::TreeNode*> boundNodes;
        for (const auto item : binding.childItems(root))
        {
            const auto node = binding.findNode(item);
            if (node == nullptr || binding.findItem(*node) != item)
                return juce::Result::fail("child mapping must hold in both directions");
            boundNodes.insert(node.get());
        }
        if (boundNodes.size() != 2)
            return juce::Result::fail("each child must map to a distinct node");

        const auto itemB = binding.findItem(*b);
        const auto itemC = binding.findItem(*c);

        b->setLabel("B2");
        if (fixture.surface.find(itemB)->text != "B")
            return juce::Result::fail("label change must wait for the drain");

        fixture.scheduler.drain();
        if (fixture.surface.find(itemB)->text != "B2")
            return juce::Result::fail("drain must update B's text");
        if (fixture.surface.find(itemC)->text != "C" || binding.materialisedCount() != 3)
            return juce::Result::fail("label change must not touch C or the map size");

        fixture.surface.userCollapse(root);
        if (binding.materialisedCount() != 1 || fixture.surface.size() != 1)
            return juce::Result::fail("collapse must remove both child items and map entries");
        if (b->observerCount() != 0 || c->observerCount() != 0)
            return juce::Result::fail("collapse must unregister child observers");

        fixture.surface.userExpand(root);
        if (a->queries != 2)
            return juce::Result::fail("re-expand must query children again");

        const auto rebuilt = binding.childItems(root);
        if (rebuilt.size() != 2 || rebuilt[0] == itemB || rebuilt[0] == itemC)
            return juce::Result::fail("re-expand must build fresh items");
        if (fixture.surface.childTexts(root) != juce::StringArray { "B2", "C" })
            return juce::Result::fail("fresh items must show the current labels");

        return juce::Result::ok();
    }

    juce::Result testLeafNodes()
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        auto folder = fixture.branch("folder");
        auto file = fixture.leaf("file");
        root->setChildren({ folder, file });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(root); result.failed())
            return result;

        fixture.surface.userExpand(binding.rootItem());
        const auto fileItem = binding.findItem(*file);
        const auto folderItem = binding.findItem(*folder);

        if (fixture.surface.find(fileItem)->hasChildren)
            return juce::Result::fail("leaf must not get a children indicator");
        if (!fixture.surface.find(folderItem)->hasChildren)
            return juce::Result::fail("branch must get a children indicator even when empty");

        const auto result = binding.expand(fileItem);
        if (result.failed() || file->queries != 0 || binding.isExpanded(fileItem))
            return juce::Result::fail("expand on a leaf must be a no-op");

        Fixture leafFixture;
        auto lonely = leafFixture.leaf("lonely");
        Arbor::TreeBinding leafBinding(leafFixture.surface, leafFixture.diagnostics);
        if (const auto attachResult = leafBinding.attach(lonely); attachResult.failed())
            return attachResult;
        if (leafFixture.surface.find(leafBinding.rootItem())->hasChildren)
            return juce::Result::fail("leaf root must not get a children indicator");

        return juce::Result::ok();
    }

    juce::Result testLabelChangeAfterCollapseIsIgnored()
    {
        Fixture fixture;
        auto a = fixture.branch("A");
        auto b = fixture.leaf("B");
        a->setChildren({ b });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(a); result.failed())
            return result;

        fixture.surface.userExpand(binding.rootItem());
        fixture.scheduler.drain();
        fixture.surface.textUpdates = 0;

        b->setLabel("pending");
        fixture.surface.userCollapse(binding.rootItem());
        b->setLabel("after");
        fixture.scheduler.drain();

        if (fixture.surface.textUpdates != 0)
            return juce::Result::fail("former child label change must not reach the view");
        if (fixture.scheduler.stats().failures != 0 || fixture.diagnostics.count(DiagnosticKind::callbackFailure) != 0)
            return juce::Result::fail("former child label change must not fail");
        if (b->observerCount() != 0)
            return juce::Result::fail("former child must have no observers");

        return juce::Result::ok();
    }

    juce::Result testChildrenChangeWhileCollapsed()
    {
        Fixture fixture;
        auto a = fixture.branch("A");
        a->setChildren({ fixture.leaf("B") });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(a); result.failed())
            return result;

        // Opened by the view alone; the binding still holds the item collapsed.
        fixture.surface.setExpanded(binding.rootItem(), true);
        a->addChild(fixture.leaf("C"));
        fixture.scheduler.drain();

        if (a->queries != 0)
            return juce::Result::fail("collapsed item must not query children on change");
        if (fixture.surface.size() != 1 || binding.materialisedCount() != 1)
            return juce::Result::fail("collapsed item must not change the view");

        fixture.surface.userExpand(binding.rootItem());
        if (fixture.surface.childTexts(binding.rootItem()) != juce::StringArray { "B", "C" })
            return juce::Result::fail("next expand must see the new children");

        return juce::Result::ok();
    }

    juce::Result testChildrenChangeWhileExpandedRebuilds()
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        auto folder = fixture.branch("folder");
        auto nested = fixture.leaf("nested");
        folder->setChildren({ nested });
        root->setChildren({ folder, fixture.leaf("file") });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(root); result.failed())
            return result;

        fixture.surface.userExpand(binding.rootItem());
        fixture.surface.userExpand(binding.findItem(*folder));
        if (binding.materialisedCount() != 4)
            return juce::Result::fail("expected root, folder, nested and file materialised");

        root->addChild(fixture.leaf("added"));
        fixture.scheduler.drain();

        if (fixture.surface.childTexts(binding.rootItem()) != juce::StringArray { "folder", "file", "added" })
            return juce::Result::fail("rebuild must show the current children, got "
                                      + fixture.surface.childTexts(binding.rootItem()).joinIntoString(","));
        if (root->queries != 2)
            return juce::Result::fail("rebuild must query children once");

        const auto folderItem = binding.findItem(*folder);
        if (binding.isExpanded(folderItem) || binding.findItem(*nested) != kInvalidItemId)
            return juce::Result::fail("rebuild drops deeper expansion state");
        if (nested->observerCount() != 0)
            return juce::Result::fail("rebuild must release the dropped subtree's observers");
        if (binding.materialisedCount() != 4)
            return juce::Result::fail("expected root and three children after rebuild");

        return juce::Result::ok();
    }

    juce::Result testExpandFailureLeavesItemCollapsed()
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        root->setChildren({ fixture.leaf("child") });
        root->failQueries = true;

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(root); result.failed())
            return result;

        const auto rootItem = binding.rootItem();
        fixture.surface.userExpand(rootItem);

        if (fixture.surface.isExpanded(rootItem) || binding.isExpanded(rootItem))
            return juce::Result::fail("failed expand must leave the item collapsed");
        if (fixture.surface.size() != 1 || binding.materialisedCount() != 1)
            return juce::Result::fail("failed expand must not leave partial children");
        if (fixture.diagnostics.count(DiagnosticKind::childrenQueryFailure) != 1)
            return juce::Result::fail("failed expand must be reported");

        const auto direct = binding.expand(rootItem);
        if (direct.wasOk() || !direct.getErrorMessage().contains("backend offline"))
            return juce::Result::fail("expand must return the query failure");

        root->failQueries = false;
        fixture.surface.userExpand(rootItem);
        if (fixture.surface.childTexts(rootItem) != juce::StringArray { "child" })
            return juce::Result::fail("expand must work once the query succeeds");

        return juce::Result::ok();
    }

    juce::Result testRebuildFailureLeavesItemCollapsed()
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        auto child = fixture.leaf("child");
        root->setChildren({ child });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(root); result.failed())
            return result;

        const auto rootItem = binding.rootItem();
        fixture.surface.userExpand(rootItem);

        root->failQueries = true;
        root->addChild(fixture.leaf("second"));
        fixture.scheduler.drain();

        if (fixture.surface.isExpanded(rootItem) || fixture.surface.size() != 1)
            return juce::Result::fail("failed rebuild must leave the item collapsed without children");
        if (child->observerCount() != 0 || binding.materialisedCount() != 1)
            return juce::Result::fail("failed rebuild must release the old children");
        if (fixture.scheduler.stats().failures != 0)
            return juce::Result::fail("rebuild failure must not escape into the drain");

        return juce::Result::ok();
    }

    enum class MoveOrder
    {
        addThenRemove,
        removeThenAdd,
        sameDrain
    };

    juce::Result checkMoveBetweenSiblings(MoveOrder order, const juce::String& orderName)
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        auto from = fixture.branch("from");
        auto to = fixture.branch("to");
        auto moved = fixture.leaf("moved");
        from->setChildren({ moved });
        root->setChildren({ from, to });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(root); result.failed())
            return result;

        fixture.surface.userExpand(binding.rootItem());
        const auto fromItem = binding.findItem(*from);
        const auto toItem = binding.findItem(*to);
        fixture.surface.userExpand(fromItem);
        fixture.surface.userExpand(toItem);

        switch (order)
        {
            case MoveOrder::addThenRemove:
                to->addChild(moved);
                fixture.scheduler.drain();
                from->removeChild(*moved);
                fixture.scheduler.drain();
                break;
            case MoveOrder::removeThenAdd:
                from->removeChild(*moved);
                fixture.scheduler.drain();
                to->addChild(moved);
                fixture.scheduler.drain();
                break;
            case MoveOrder::sameDrain:
                from->removeChild(*moved);
                to->addChild(moved);
                fixture.scheduler.drain();
                break;
        }

        if (fixture.surface.childTexts(toItem) != juce::StringArray { "moved" })
            return juce::Result::fail(orderName + ": moved node must appear under its new parent");
        if (!fixture.surface.childTexts(fromItem).isEmpty())
            return juce::Result::fail(orderName + ": moved node must leave its old parent");

        const auto children = binding.childItems(toItem);
        if (children.size() != 1 || binding.findNode(children.front()) != moved || binding.findItem(*moved) != children.front())
            return juce::Result::fail(orderName + ": moved node must be mapped under its new parent");
        if (binding.materialisedCount() != 4 || moved->observerCount() != 2)
            return juce::Result::fail(orderName + ": moved node must be bound exactly once");

        return juce::Result::ok();
    }

    juce::Result testNodeMovedBetweenSiblings()
    {
        const std::vector<std::pair<MoveOrder, juce::String>> orders =
        {
            { MoveOrder::addThenRemove, "add then remove" },
            { MoveOrder::removeThenAdd, "remove then add" },
            { MoveOrder::sameDrain, "same drain" }
        };

        for (const auto& [order, name] : orders)
        {
            if (const auto result = checkMoveBetweenSiblings(order, name); result.failed())
                return result;
        }

        return juce::Result::ok();
    }

    juce::Result testCollapseHandsSharedNodeToWaitingParent()
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        auto left = fixture.branch("left");
        auto right = fixture.branch("right");
        auto shared = fixture.leaf("shared");
        left->setChildren({ shared });
        right->setChildren({ shared });
        root->setChildren({ left, right });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(root); result.failed())
            return result;

        fixture.surface.userExpand(binding.rootItem());
        const auto leftItem = binding.findItem(*left);
        const auto rightItem = binding.findItem(*right);
        fixture.surface.userExpand(leftItem);
        fixture.surface.userExpand(rightItem);

        if (fixture.surface.childTexts(leftItem) != juce::StringArray { "shared" }
            || !fixture.surface.childTexts(rightItem).isEmpty())
            return juce::Result::fail("the first expanded parent must hold the shared node");

        fixture.surface.userCollapse(leftItem);
        if (fixture.surface.childTexts(rightItem) != juce::StringArray { "shared" })
            return juce::Result::fail("the waiting parent must pick the node up once it is released");
        if (binding.materialisedCount() != 4)
            return juce::Result::fail("the shared node must still be bound once");

        return juce::Result::ok();
    }

    juce::Result testNestedCollapseReleasesDescendants()
    {
        Fixture fixture;
        auto a = fixture.branch("A");
        auto x = fixture.branch("X");
        auto y = fixture.branch("Y");
        auto z = fixture.leaf("Z");
        a->setChildren({ x });
        x->setChildren({ y });
        y->setChildren({ z });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(a); result.failed())
            return result;

        fixture.surface.userExpand(binding.rootItem());
        fixture.surface.userExpand(binding.findItem(*x));
        fixture.surface.userExpand(binding.findItem(*y));
        if (binding.materialisedCount() != 4 || fixture.surface.size() != 4)
            return juce::Result::fail("expected four materialised nodes");

        fixture.surface.userCollapse(binding.rootItem());
        if (binding.materialisedCount() != 1 || fixture.surface.size() != 1)
            return juce::Result::fail("collapse must destroy every descendant");
        if (x->observerCount() != 0 || y->observerCount() != 0 || z->observerCount() != 0)
            return juce::Result::fail("collapse must unregister every descendant");
        if (a->observerCount() != 2)
            return juce::Result::fail("collapsed root must keep its own observers");

        return juce::Result::ok();
    }

    juce::Result testSharedNodeIsNotBoundTwice()
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        auto shared = fixture.leaf("shared");
        root->setChildren({ shared, shared, nullptr, root });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(root); result.failed())
            return result;

        fixture.surface.userExpand(binding.rootItem());
        if (fixture.surface.childTexts(binding.rootItem()) != juce::StringArray { "shared" })
            return juce::Result::fail("a node must be materialised once");
        if (fixture.diagnostics.count(DiagnosticKind::duplicateNode) != 2)
            return juce::Result::fail("the repeated child and the root itself must be reported");
        if (fixture.diagnostics.count(DiagnosticKind::invalidNode) != 1)
            return juce::Result::fail("a null child must be reported");
        if (binding.findItem(*root) != binding.rootItem())
            return juce::Result::fail("the first mapping must not be overwritten");

        root->setChildren({});
        return juce::Result::ok();
    }

    juce::Result testAttachAndDetach()
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        auto child = fixture.leaf("child");
        root->setChildren({ child });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (binding.attach(nullptr).wasOk())
            return juce::Result::fail("null root must be rejected");
        if (const auto result = binding.attach(root); result.failed())
            return result;
        if (binding.attach(fixture.branch("other")).wasOk())
            return juce::Result::fail("second attach must be rejected");

        fixture.surface.userExpand(binding.rootItem());
        binding.detach();

        if (fixture.surface.size() != 0 || binding.materialisedCount() != 0 || binding.rootItem() != kInvalidItemId)
            return juce::Result::fail("detach must destroy every item and entry");
        if (root->observerCount() != 0 || child->observerCount() != 0)
            return juce::Result::fail("detach must unregister every observer");

        root->setLabel("renamed");
        fixture.scheduler.drain();
        if (fixture.surface.textUpdates != 0)
            return juce::Result::fail("detached nodes must not reach the view");

        if (const auto result = binding.attach(root); result.failed())
            return juce::Result::fail("attach after detach must succeed: " + result.getErrorMessage());

        return juce::Result::ok();
    }

    juce::Result testExpandRootOnAttach()
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        root->setChildren({ fixture.leaf("one"), fixture.leaf("two") });

        int userExpands = 0;
        Arbor::TreeBinding::Options options;
        options.expandRootOnAttach = true;
        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics, options);

        auto bindingExpand = fixture.surface.onUserExpand;
        fixture.surface.onUserExpand = [&userExpands, bindingExpand](ItemId item)
        {
            userExpands += 1;
            bindingExpand(item);
        };

        if (const auto result = binding.attach(root); result.failed())
            return result;

        if (!fixture.surface.isExpanded(binding.rootItem()) || !binding.isExpanded(binding.rootItem()))
            return juce::Result::fail("root must start expanded");
        if (fixture.surface.childTexts(binding.rootItem()) != juce::StringArray { "one", "two" })
            return juce::Result::fail("pre-expanded root must show its children");
        if (userExpands != 0)
            return juce::Result::fail("programmatic expansion must not look like a user event");

        return juce::Result::ok();
    }

    juce::Result testDestructionReleasesEverything()
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        auto child = fixture.leaf("child");
        root->setChildren({ child });

        {
            Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
            if (const auto result = binding.attach(root); result.failed())
                return result;

            fixture.surface.userExpand(binding.rootItem());
            child->setLabel("pending");
        }

        if (root->observerCount() != 0 || child->observerCount() != 0)
            return juce::Result::fail("destroyed binding must leave no observers");
        if (fixture.surface.onUserExpand != nullptr || fixture.surface.onUserCollapse != nullptr)
            return juce::Result::fail("destroyed binding must uninstall its view callbacks");
        if (fixture.scheduler.pendingCount() != 0)
            return juce::Result::fail("destroyed binding must cancel its pending callbacks");

        fixture.scheduler.drain();
        return juce::Result::ok();
    }

    juce::Result testMutationsFromWorkerThread()
    {
        Fixture fixture;
        auto root = fixture.branch("root");
        auto child = fixture.leaf("child");
        root->setChildren({ child });

        Arbor::TreeBinding binding(fixture.surface, fixture.diagnostics);
        if (const auto result = binding.attach(root); result.failed())
            return result;

        fixture.surface.userExpand(binding.rootItem());

        std::thread worker([&fixture, &root, &child]
                           {
                               for (int i = 0; i < 200; ++i)
                                   child->setLabel("child " + juce::String(i));

                               root->addChild(fixture.leaf("from worker"));
                           });
        worker.join();

        if (fixture.drainRequests != 1)
            return juce::Result::fail("worker mutations must coalesce into one drain request");

        fixture.scheduler.drain();
        if (fixture.surface.childTexts(binding.rootItem()) != juce::StringArray { "child 199", "from worker" })
            return juce::Result::fail("view must converge on the worker's final state, got "
                                      + fixture.surface.childTexts(binding.rootItem()).joinIntoString(","));

        return juce::Result::ok();
    }

    juce::Result testMutableTreeNodeRules()
    {
        Fixture fixture;
        auto leaf = fixture.leaf("leaf");
        auto branch = fixture.branch("branch");
        auto child = fixture.leaf("child");

        if (leaf->addChild(child) || leaf->setChildren({ child }))
            return juce::Result::fail("leaf must reject children");

        Arbor::FunctionObserver observer([] {});
        branch->getTreeChildrenChange().addObserver(observer);

        if (!branch->addChild(child) || branch->childCount() != 1)
            return juce::Result::fail("branch must accept a child");
        fixture.scheduler.drain();

        if (branch->setChildren({ child }))
            return juce::Result::fail("identical child list must not count as a change");
        if (fixture.scheduler.pendingCount() != 0)
            return juce::Result::fail("identical child list must not notify");

        if (branch->removeChild(*leaf))
            return juce::Result::fail("removing an unknown child must fail");
        if (!branch->removeChild(*child) || branch->childCount() != 0)
            return juce::Result::fail("removing a known child must succeed");
        if (fixture.scheduler.pendingCount() != 1)
            return juce::Result::fail("removing a child must notify");

        if (branch->setLabel("branch") || !branch->setLabel("renamed"))
            return juce::Result::fail("setLabel must report whether the label changed");

        branch->getTreeChildrenChange().removeObserver(observer);
        return juce::Result::ok();
    }

    juce::Result testHiddenRootStartsExpanded()
    {
        Fixture fixture;
        auto root = fixture.branch("hidden");
        root->setChildren({ fixture.leaf("one"), fixture.leaf("two") });

        Arbor::Ui::JuceTreeViewSurface::Options options;
        options.rootItemVisible = false;
        Arbor::Ui::JuceTreeViewSurface surface(options);
        Arbor::TreeBinding binding(surface, fixture.diagnostics);
        if (const auto result = binding.attach(root); result.failed())
            return result;

        const auto rootItem = binding.rootItem();
        auto* rootTreeItem = surface.findTreeItem(rootItem);
        if (rootTreeItem == nullptr || !rootTreeItem->isOpen())
            return juce::Result::fail("a hidden root is always open in the tree view");
        if (!binding.isExpanded(rootItem) || rootTreeItem->getNumSubItems() != 2)
            return juce::Result::fail("a hidden root must show its children straight away");

        root->addChild(fixture.leaf("three"));
        fixture.scheduler.drain();
        if (rootTreeItem->getNumSubItems() != 3 || root->queries != 2)
            return juce::Result::fail("a hidden root must rebuild once on a children change");

        return juce::Result::ok();
    }

    juce::Result testBindingMapKeepsBothSidesInStep()
    {
        Fixture fixture;
        auto first = fixture.leaf("first");
        auto second = fixture.leaf("second");

        const auto makeEntry = [](std::shared_ptr<Arbor::TreeNode> node, ItemId item)
        {
            Arbor::BindingEntry entry;
            entry.node = std::move(node);
            entry.item = item;
            return entry;
        };

        Arbor::BindingMap map;
        if (!map.isEmpty() || !map.insert(makeEntry(first, 1)))
            return juce::Result::fail("first insert must succeed on an empty map");
        if (map.insert(makeEntry(first, 2)) || map.insert(makeEntry(second, 1)))
            return juce::Result::fail("insert must reject a node or item that is already mapped");
        if (map.insert(makeEntry(nullptr, 3)) || map.insert(makeEntry(second, kInvalidItemId)))
            return juce::Result::fail("insert must reject a null node or an invalid item");
        if (map.size() != 1 || map.itemFor(*first) != 1 || map.entryFor(1)->node != first)
            return juce::Result::fail("rejected inserts must leave the map untouched");

        if (map.eraseItem(7).has_value())
            return juce::Result::fail("erasing an unknown item must return nothing");

        const auto erased = map.eraseItem(1);
        if (!erased.has_value() || erased->node != first)
            return juce::Result::fail("erase must hand back the entry");
        if (!map.isEmpty() || map.contains(*first) || map.entryFor(1) != nullptr)
            return juce::Result::fail("erase must drop both sides");

        return juce::Result::ok();
    }

    juce::Result testJuceTreeViewSurface()
    {
        Fixture fixture;
        auto root = fixture.branch("A");
        auto b = fixture.leaf("B");
        auto folder = fixture.branch("folder");
        root->setChildren({ b, folder });

        Arbor::Ui::JuceTreeViewSurface surface;
        Arbor::TreeBinding binding(surface, fixture.diagnostics);
        if (const auto result = binding.attach(root); result.failed())
            return result;

        auto* rootTreeItem = surface.findTreeItem(binding.rootItem());
        if (rootTreeItem == nullptr || surface.treeView().getRootItem() != rootTreeItem)
            return juce::Result::fail("root item must be installed in the tree view");
        if (!rootTreeItem->mightContainSubItems() || rootTreeItem->isOpen())
            return juce::Result::fail("root must start closed with a children indicator");

        rootTreeItem->setOpen(true);
        if (rootTreeItem->getNumSubItems() != 2 || surface.itemCount() != 3)
            return juce::Result::fail("opening the root must add two tree items");

        const auto itemB = binding.findItem(*b);
        if (surface.itemText(itemB) != "B" || surface.findTreeItem(itemB)->mightContainSubItems())
            return juce::Result::fail("leaf item must show B without a children indicator");
        if (!surface.findTreeItem(binding.findItem(*folder))->mightContainSubItems())
            return juce::Result::fail("branch item must show a children indicator");

        b->setLabel("B2");
        fixture.scheduler.drain();
        if (surface.itemText(itemB) != "B2")
            return juce::Result::fail("label change must reach the tree item");

        rootTreeItem->setOpen(false);
        if (rootTreeItem->getNumSubItems() != 0 || surface.itemCount() != 1 || binding.materialisedCount() != 1)
            return juce::Result::fail("closing the root must remove its tree items");

        root->failQueries = true;
        rootTreeItem->setOpen(true);
        if (rootTreeItem->isOpen() || rootTreeItem->getNumSubItems() != 0)
            return juce::Result::fail("failed expand must close the tree item again");

        binding.detach();
        if (surface.treeView().getRootItem() != nullptr || surface.itemCount() != 0)
            return juce::Result::fail("detach must clear the tree view");

        return juce::Result::ok();
    }
}

int main()
{
    const juce::ScopedJuceInitialiser_GUI juceInitialiser;

    const std::vector<std::pair<const char*, std::function<juce::Result()>>> tests =
    {
        { "Expand, rename, collapse, re-expand", testExpandRenameCollapseScenario },
        { "Leaf nodes", testLeafNodes },
        { "Label change after collapse", testLabelChangeAfterCollapseIsIgnored },
        { "Children change while collapsed", testChildrenChangeWhileCollapsed },
        { "Children change while expanded", testChildrenChangeWhileExpandedRebuilds },
        { "Expand failure", testExpandFailureLeavesItemCollapsed },
        { "Rebuild failure", testRebuildFailureLeavesItemCollapsed },
        { "Node moved between siblings", testNodeMovedBetweenSiblings },
        { "Collapse hands shared node over", testCollapseHandsSharedNodeToWaitingParent },
        { "Nested collapse", testNestedCollapseReleasesDescendants },
        { "Shared node", testSharedNodeIsNotBoundTwice },
        { "Attach and detach", testAttachAndDetach },
        { "Expand root on attach", testExpandRootOnAttach },
        { "Destruction", testDestructionReleasesEverything },
        { "Worker thread mutations", testMutationsFromWorkerThread },
        { "MutableTreeNode rules", testMutableTreeNodeRules },
        { "BindingMap", testBindingMapKeepsBothSidesInStep },
        { "JUCE tree view surface", testJuceTreeViewSurface },
        { "Hidden JUCE root", testHiddenRootStartsExpanded }
    };

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Arbor binding smoke passed." << std::endl;
    return 0;
}
