// =============================================================================
// SlideBridge - StateCache
// Snapshot store keyed by (window, slide). Entries are overwritten on every
// observation and never evicted individually: the key space is bounded by
// slide count times open windows.
// =============================================================================

#include "slidebridge/logic/StateCache.h"

#include <algorithm>

namespace SlideBridge
{

static ResolutionSummary allUnknown(int count)
{
    ResolutionSummary s;
    s.unknown = count;
    return s;
}

SlideSnapshot& StateCache::slot(const WindowKey& window, int slideIndex)
{
    noteWindow(window);
    auto [it, inserted] = snapshots_.try_emplace(SlideKey{window, slideIndex});
    if (inserted)
        it->second.slideIndex = slideIndex;
    return it->second;
}

bool StateCache::update(const WindowKey& window, int slideIndex, int commentCount, bool notesPresent)
{
    if (slideIndex <= 0 || commentCount < 0)
        return false;

    const bool existed = snapshots_.count(SlideKey{window, slideIndex}) != 0;
    SlideSnapshot& snap = slot(window, slideIndex);

    if (existed && snap.commentCount == commentCount && snap.notesPresent == notesPresent)
        return false;

    if (!existed || snap.commentCount != commentCount)
    {
        // Resolution data described a different set of comments.
        snap.resolution = allUnknown(commentCount);
        snap.freshness = Freshness::Unknown;
    }
    snap.commentCount = commentCount;
    snap.notesPresent = notesPresent;
    return true;
}

bool StateCache::storeComments(const WindowKey& window, int slideIndex, std::vector<CommentRecord> comments)
{
    if (slideIndex <= 0)
        return false;

    SlideSnapshot& snap = slot(window, slideIndex);
    for (auto& c : comments)
        c.slideIndex = slideIndex;

    if (snap.comments == comments)
        return false;

    snap.comments = std::move(comments);
    return true;
}

bool StateCache::mergeResolution(const WindowKey& window, int slideIndex,
                                 const ResolutionSummary& summary, Freshness freshness)
{
    auto it = snapshots_.find(SlideKey{window, slideIndex});
    if (it == snapshots_.end())
        return false; // nothing observed yet for this slide

    SlideSnapshot& snap = it->second;
    if (snap.resolution == summary && snap.freshness == freshness)
        return false;

    snap.resolution = summary;
    snap.freshness = freshness;
    return true;
}

bool StateCache::mergeResolution(const WindowKey& window, int slideIndex,
                                 const ResolutionSummary& summary, Freshness freshness,
                                 const std::vector<ResolutionStatus>& perComment)
{
    auto it = snapshots_.find(SlideKey{window, slideIndex});
    if (it == snapshots_.end())
        return false;

    bool changed = mergeResolution(window, slideIndex, summary, freshness);

    auto& comments = it->second.comments;
    const size_t n = std::min(comments.size(), perComment.size());
    for (size_t i = 0; i < n; ++i)
    {
        if (comments[i].status != perComment[i])
        {
            comments[i].status = perComment[i];
            changed = true;
        }
    }
    return changed;
}

std::optional<SlideSnapshot> StateCache::get(const WindowKey& window, int slideIndex) const
{
    auto it = snapshots_.find(SlideKey{window, slideIndex});
    if (it == snapshots_.end())
        return std::nullopt;
    return it->second;
}

// ─── Window bookkeeping ──────────────────────────────────────────────────────

void StateCache::noteWindow(const WindowKey& window, bool active)
{
    auto [it, inserted] = windows_.try_emplace(window);
    if (inserted)
        it->second.key = window;
    if (active)
    {
        for (auto& entry : windows_)
            entry.second.active = false;
        it->second.active = true;
    }
}

void StateCache::setLastKnownSlide(const WindowKey& window, int slideIndex)
{
    noteWindow(window);
    windows_[window].lastKnownSlide = slideIndex;
}

std::optional<DocumentWindowHandle> StateCache::window(const WindowKey& window) const
{
    auto it = windows_.find(window);
    if (it == windows_.end())
        return std::nullopt;
    return it->second;
}

std::vector<DocumentWindowHandle> StateCache::windows() const
{
    std::vector<DocumentWindowHandle> result;
    result.reserve(windows_.size());
    for (const auto& entry : windows_)
        result.push_back(entry.second);
    return result;
}

std::vector<int> StateCache::slidesFor(const WindowKey& window) const
{
    std::vector<int> slides;
    for (auto it = snapshots_.lower_bound(SlideKey{window, 0});
         it != snapshots_.end() && it->first.first == window; ++it)
    {
        slides.push_back(it->first.second);
    }
    return slides;
}

void StateCache::discardWindow(const WindowKey& window)
{
    windows_.erase(window);
    for (auto it = snapshots_.begin(); it != snapshots_.end();)
    {
        if (it->first.first == window)
            it = snapshots_.erase(it);
        else
            ++it;
    }
}

void StateCache::discardPresentation(const std::string& presentation)
{
    for (auto it = windows_.begin(); it != windows_.end();)
    {
        if (it->first.presentation == presentation)
            it = windows_.erase(it);
        else
            ++it;
    }
    for (auto it = snapshots_.begin(); it != snapshots_.end();)
    {
        if (it->first.first.presentation == presentation)
            it = snapshots_.erase(it);
        else
            ++it;
    }
}

void StateCache::clear()
{
    windows_.clear();
    snapshots_.clear();
}

} // namespace SlideBridge
