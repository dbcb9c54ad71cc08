#pragma once

#include "Arbor/Binding/TreeBinding.h"
#include "Arbor/Core/MessageThreadScheduler.h"
#include "Arbor/Core/NotificationScheduler.h"
#include "Arbor/Core/Observable.h"
#include "Arbor/Core/ObservableValue.h"
#include "Arbor/Core/Observer.h"
#include "Arbor/Model/MutableTreeNode.h"
#include "Arbor/Public/TreeNode.h"
#include "Arbor/Public/TreeViewSurface.h"
#include "Arbor/Public/Types.h"
#include "Arbor/Runtime/BindingDiagnostics.h"
#include "Arbor/Ui/JuceTreeViewSurface.h"
