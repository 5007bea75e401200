// =============================================================================
// SlideBridge - FocusNavigator
// Comment-card focus over the abstract accessibility tree.
// =============================================================================

#include "slidebridge/navigation/FocusNavigator.h"
#include "slidebridge/automation/AppSession.h"
#include "slidebridge/support/DebugLog.h"

#include <exception>

namespace SlideBridge
{

FocusNavigator::FocusNavigator(AccessibilityTree* tree, Options options)
    : tree_(tree)
    , options_(std::move(options))
{
}

void FocusNavigator::setOptions(Options options)
{
    options_ = std::move(options);
}

bool FocusNavigator::ensurePaneVisible(AppSession& session)
{
    auto pressed = session.isCommandPressed(options_.paneCommand);
    if (pressed && *pressed)
        return true;

    if (!pressed)
    {
        // Toggle state unknown: toggling blind could hide a visible pane.
        // Leave it alone and let the tree search decide.
        logWarning("comments pane toggle state unavailable, not toggling");
        return true;
    }

    if (!session.executeCommand(options_.paneCommand))
    {
        logWarning("could not show comments pane");
        return false;
    }
    return true;
}

FocusNavigator::Attempt FocusNavigator::tryFocus(const WindowKey& window, int ordinal, bool& paneFound)
{
    ElementCondition condition;
    condition.automationIds = options_.paneAutomationIds;

    std::unique_ptr<UiElement> pane = tree_->find(window.hwnd, condition);
    if (!pane)
        return Attempt::Retry;
    paneFound = true;

    std::vector<std::unique_ptr<UiElement>> items;
    if (pane->listItems(items) != TreeStatus::Ok)
        return Attempt::Retry;

    if (ordinal > static_cast<int>(items.size()))
        return Attempt::NotFound;

    TreeStatus status = items[static_cast<size_t>(ordinal - 1)]->setFocus();
    if (status == TreeStatus::Ok)
        return Attempt::Focused;
    return Attempt::Retry;
}

FocusStatus FocusNavigator::focusComment(AppSession& session, const WindowKey& window, int ordinal)
{
    if (ordinal < 1 || !tree_)
        return FocusStatus::NotFound;

    try
    {
        if (!ensurePaneVisible(session))
            return FocusStatus::PaneNotVisible;

        bool paneFound = false;
        Attempt attempt = tryFocus(window, ordinal, paneFound);
        if (attempt == Attempt::Focused)
            return FocusStatus::Success;
        if (attempt == Attempt::NotFound)
            return FocusStatus::NotFound;

        // The pane may have been rebuilt between locate and select.
        logDebug("comment card stale, re-locating pane");
        attempt = tryFocus(window, ordinal, paneFound);
        if (attempt == Attempt::Focused)
            return FocusStatus::Success;
        return paneFound ? FocusStatus::NotFound : FocusStatus::PaneNotVisible;
    }
    catch (const std::exception& e)
    {
        logError(std::string("focus comment failed: ") + e.what());
        return FocusStatus::NotFound;
    }
}

} // namespace SlideBridge
