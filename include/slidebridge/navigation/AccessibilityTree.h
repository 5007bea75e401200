#pragma once
// =============================================================================
// SlideBridge - AccessibilityTree
// Query-only view of the application's accessibility tree. Element handles
// are ephemeral: valid until the next tree mutation, never stored across
// operations.
// =============================================================================

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace SlideBridge
{

enum class TreeStatus : uint8_t
{
    Ok,
    Stale,   // element no longer in the tree
    Failed,
};

// Structural search condition. Matched against the automation id, never
// against localized names.
struct ElementCondition
{
    std::vector<std::string> automationIds;  // any of
};

class UiElement
{
public:
    virtual ~UiElement() = default;

    // List-item children in visual order.
    virtual TreeStatus listItems(std::vector<std::unique_ptr<UiElement>>& out) = 0;

    // Requests focus. Does not wait for the host to observe the change.
    virtual TreeStatus setFocus() = 0;

    virtual std::string name() = 0;
};

class AccessibilityTree
{
public:
    virtual ~AccessibilityTree() = default;

    // First descendant of the top-level window matching condition, or null.
    virtual std::unique_ptr<UiElement> find(uintptr_t windowHandle, const ElementCondition& condition) = 0;
};

// UI Automation implementation on Windows; inert elsewhere. Must be created
// and used on the worker thread (after its apartment is entered).
std::unique_ptr<AccessibilityTree> createPlatformAccessibilityTree();

} // namespace SlideBridge
