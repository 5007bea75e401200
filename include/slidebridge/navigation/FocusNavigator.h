#pragma once
// =============================================================================
// SlideBridge - FocusNavigator
// Moves keyboard focus to one comment card in the comments pane.
//
// The pane's show command is a toggle: its pressed state is checked first so
// an already visible pane is never hidden. The pane is located by automation
// id, its list items enumerated, and the item at the ordinal focused. A stale
// element triggers exactly one re-locate before NotFound is reported.
// =============================================================================

#include "slidebridge/common/Types.h"
#include "slidebridge/navigation/AccessibilityTree.h"

#include <string>
#include <vector>

namespace SlideBridge
{

class AppSession;

class FocusNavigator
{
public:
    struct Options
    {
        std::vector<std::string> paneAutomationIds{"CommentsPane", "NewCommentsPane"};
        std::string paneCommand = "ReviewShowComments";

        Options();
    };

    // tree is not owned and may be null (always NotFound).
    explicit FocusNavigator(AccessibilityTree* tree, Options options = Options());

    void setOptions(Options options);

    // ordinal is 1-based. Never throws.
    FocusStatus focusComment(AppSession& session, const WindowKey& window, int ordinal);

private:
    enum class Attempt { Focused, NotFound, Retry };

    bool ensurePaneVisible(AppSession& session);
    Attempt tryFocus(const WindowKey& window, int ordinal, bool& paneFound);

    AccessibilityTree* tree_;
    Options options_;
};

inline FocusNavigator::Options::Options() = default;

} // namespace SlideBridge
