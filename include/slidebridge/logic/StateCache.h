#pragma once
// =============================================================================
// SlideBridge - StateCache
// Per-window slide snapshots. Owned by the automation worker; every read and
// write happens on that thread. Other threads only ever receive copies.
// =============================================================================

#include "slidebridge/common/Types.h"

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace SlideBridge
{

class StateCache
{
public:
    // Overwrites the counts for (window, slide). Returns false when nothing
    // changed, in which case callers must not re-announce. A changed comment
    // count invalidates the resolution fields (status unknown until re-read).
    bool update(const WindowKey& window, int slideIndex, int commentCount, bool notesPresent);

    // Replaces the comment list (author/text/replies from the primary
    // interface). Statuses already known for the slide are not carried over.
    bool storeComments(const WindowKey& window, int slideIndex, std::vector<CommentRecord> comments);

    // Updates only the resolution summary and freshness flag.
    bool mergeResolution(const WindowKey& window, int slideIndex,
                         const ResolutionSummary& summary, Freshness freshness);

    // Same, plus per-comment statuses (by ordinal). Author, text, creation
    // time and replies are left untouched.
    bool mergeResolution(const WindowKey& window, int slideIndex,
                         const ResolutionSummary& summary, Freshness freshness,
                         const std::vector<ResolutionStatus>& perComment);

    std::optional<SlideSnapshot> get(const WindowKey& window, int slideIndex) const;

    // ── Window bookkeeping ──
    void noteWindow(const WindowKey& window, bool active = false);
    void setLastKnownSlide(const WindowKey& window, int slideIndex);
    std::optional<DocumentWindowHandle> window(const WindowKey& window) const;
    std::vector<DocumentWindowHandle> windows() const;
    std::vector<int> slidesFor(const WindowKey& window) const;

    void discardWindow(const WindowKey& window);
    void discardPresentation(const std::string& presentation);
    void clear();

    size_t snapshotCount() const { return snapshots_.size(); }

private:
    using SlideKey = std::pair<WindowKey, int>;

    SlideSnapshot& slot(const WindowKey& window, int slideIndex);

    std::map<WindowKey, DocumentWindowHandle> windows_;
    std::map<SlideKey, SlideSnapshot> snapshots_;
};

} // namespace SlideBridge
