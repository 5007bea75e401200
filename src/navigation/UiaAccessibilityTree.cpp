// =============================================================================
// SlideBridge - UiaAccessibilityTree
// UI Automation client over IUIAutomation. Created on the worker thread, so
// it shares the worker's apartment. Elements are looked up fresh for every
// request and released when the request finishes.
// =============================================================================

#include "slidebridge/navigation/AccessibilityTree.h"
#include "slidebridge/support/DebugLog.h"

#ifndef SLIDEBRIDGE_TESTING

#include "slidebridge/automation/ComHelpers.h"

#include <uiautomation.h>

#pragma comment(lib, "Ole32.lib")
#pragma comment(lib, "OleAut32.lib")

namespace SlideBridge
{

// UIA_E_ELEMENTNOTAVAILABLE: the element left the tree.
static constexpr HRESULT kElementNotAvailable = static_cast<HRESULT>(0x80040201L);

static TreeStatus statusFrom(HRESULT hr)
{
    if (SUCCEEDED(hr))
        return TreeStatus::Ok;
    return hr == kElementNotAvailable ? TreeStatus::Stale : TreeStatus::Failed;
}

static ComRef<IUIAutomationCondition> controlTypeCondition(IUIAutomation* automation, CONTROLTYPEID type)
{
    ComRef<IUIAutomationCondition> condition;
    VARIANT value;
    VariantInit(&value);
    value.vt = VT_I4;
    value.lVal = type;
    automation->CreatePropertyCondition(UIA_ControlTypePropertyId, value, condition.put());
    return condition;
}

// ─── Element ─────────────────────────────────────────────────────────────────

class UiaElement : public UiElement
{
public:
    // automation must outlive the element (owned by the tree).
    UiaElement(IUIAutomation* automation, ComRef<IUIAutomationElement> element)
        : automation_(automation)
        , element_(std::move(element))
    {
    }

    TreeStatus listItems(std::vector<std::unique_ptr<UiElement>>& out) override
    {
        out.clear();
        auto itemCondition = controlTypeCondition(automation_, UIA_ListItemControlTypeId);
        if (!itemCondition)
            return TreeStatus::Failed;

        ComRef<IUIAutomationElementArray> found;
        HRESULT hr = element_->FindAll(TreeScope_Children, itemCondition.get(), found.put());
        if (FAILED(hr))
            return statusFrom(hr);

        int length = 0;
        if (found)
            found->get_Length(&length);

        if (length == 0)
        {
            // Cards usually sit in a list one level down.
            auto listCondition = controlTypeCondition(automation_, UIA_ListControlTypeId);
            ComRef<IUIAutomationElement> list;
            hr = element_->FindFirst(TreeScope_Descendants, listCondition.get(), list.put());
            if (FAILED(hr))
                return statusFrom(hr);
            if (!list)
                return TreeStatus::Ok; // pane with no comments

            hr = list->FindAll(TreeScope_Children, itemCondition.get(), found.put());
            if (FAILED(hr))
                return statusFrom(hr);
            if (found)
                found->get_Length(&length);
        }

        for (int i = 0; i < length; ++i)
        {
            ComRef<IUIAutomationElement> item;
            if (SUCCEEDED(found->GetElement(i, item.put())) && item)
                out.push_back(std::make_unique<UiaElement>(automation_, std::move(item)));
        }
        return TreeStatus::Ok;
    }

    TreeStatus setFocus() override
    {
        return statusFrom(element_->SetFocus());
    }

    std::string name() override
    {
        BSTR value = nullptr;
        if (FAILED(element_->get_CurrentName(&value)))
            return {};
        std::string result = fromBstr(value);
        SysFreeString(value);
        return result;
    }

private:
    IUIAutomation* automation_;
    ComRef<IUIAutomationElement> element_;
};

// ─── Tree ────────────────────────────────────────────────────────────────────

class UiaAccessibilityTree : public AccessibilityTree
{
public:
    UiaAccessibilityTree()
    {
        HRESULT hr = CoCreateInstance(__uuidof(CUIAutomation), nullptr, CLSCTX_INPROC_SERVER,
                                      __uuidof(IUIAutomation), reinterpret_cast<void**>(automation_.put()));
        if (FAILED(hr))
            logError("UI Automation unavailable, comment focus disabled");
    }

    std::unique_ptr<UiElement> find(uintptr_t windowHandle, const ElementCondition& condition) override
    {
        if (!automation_ || windowHandle == 0)
            return nullptr;

        ComRef<IUIAutomationElement> root;
        HRESULT hr = automation_->ElementFromHandle(reinterpret_cast<UIA_HWND>(windowHandle), root.put());
        if (FAILED(hr) || !root)
            return nullptr;

        for (const auto& id : condition.automationIds)
        {
            BSTR idValue = SysAllocString(widen(id).c_str());
            if (!idValue)
                continue;

            ComRef<IUIAutomationCondition> byId;
            hr = automation_->CreatePropertyCondition(UIA_AutomationIdPropertyId, bstrArg(idValue), byId.put());
            if (SUCCEEDED(hr))
            {
                ComRef<IUIAutomationElement> match;
                hr = root->FindFirst(TreeScope_Descendants, byId.get(), match.put());
                if (SUCCEEDED(hr) && match)
                {
                    SysFreeString(idValue);
                    return std::make_unique<UiaElement>(automation_.get(), std::move(match));
                }
            }
            SysFreeString(idValue);
        }
        return nullptr;
    }

private:
    ComRef<IUIAutomation> automation_;
};

std::unique_ptr<AccessibilityTree> createPlatformAccessibilityTree()
{
    return std::make_unique<UiaAccessibilityTree>();
}

} // namespace SlideBridge

#else // SLIDEBRIDGE_TESTING: no accessibility tree outside Windows

namespace SlideBridge
{

class InertAccessibilityTree : public AccessibilityTree
{
public:
    std::unique_ptr<UiElement> find(uintptr_t, const ElementCondition&) override { return nullptr; }
};

std::unique_ptr<AccessibilityTree> createPlatformAccessibilityTree()
{
    return std::make_unique<InertAccessibilityTree>();
}

} // namespace SlideBridge

#endif // SLIDEBRIDGE_TESTING
