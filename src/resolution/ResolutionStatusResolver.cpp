// =============================================================================
// SlideBridge - ResolutionStatusResolver
// Tiered saved-file reads, keyed by presentation. Windows showing the same
// presentation share one read.
// =============================================================================

#include "slidebridge/resolution/ResolutionStatusResolver.h"
#include "slidebridge/resolution/CommentCorrelator.h"
#include "slidebridge/resolution/SavedFileReader.h"
#include "slidebridge/automation/AppSession.h"
#include "slidebridge/logic/StateCache.h"
#include "slidebridge/support/DebugLog.h"
#include "slidebridge/support/SettingsManager.h"

#include <algorithm>

namespace SlideBridge
{

ResolutionStatusResolver::ResolutionStatusResolver(SavedFileReader* reader)
    : reader_(reader)
{
}

void ResolutionStatusResolver::configure(const SettingsSnapshot& settings)
{
    refreshMs_ = settings.resolutionRefreshMs;
    saveDelayMs_ = settings.saveRereadDelayMs;
    retryAttempts_ = settings.fileRetryAttempts;
    retryBackoffMs_ = settings.fileRetryBackoffMs;
}

ResolutionTier ResolutionStatusResolver::tier()
{
    if (!tier_)
    {
        if (!reader_)
            tier_ = ResolutionTier::Unavailable;
        else if (reader_->canBypassLocks())
            tier_ = ResolutionTier::SnapshotRead;
        else
            tier_ = ResolutionTier::SaveHook;

        if (*tier_ == ResolutionTier::Unavailable)
            logWarning(std::string("no saved-file reader: ") + toString(ErrorKind::ResolutionUnavailable));
        else
            logDebug(std::string("resolution status tier: ") + toString(*tier_));
    }
    return *tier_;
}

// ─── Scheduling ──────────────────────────────────────────────────────────────

ResolutionStatusResolver::Entry& ResolutionStatusResolver::entryFor(const WindowKey& window)
{
    Entry& entry = entries_[window.presentation];
    if (std::find(entry.windows.begin(), entry.windows.end(), window) == entry.windows.end())
        entry.windows.push_back(window);
    return entry;
}

void ResolutionStatusResolver::schedule(const WindowKey& window, int64_t now)
{
    if (tier() == ResolutionTier::Unavailable)
        return;
    Entry& entry = entryFor(window);
    if (!entry.data && entry.dueAt < 0 && !entry.unavailable)
        entry.dueAt = now;
}

void ResolutionStatusResolver::onSaved(const WindowKey& window, int64_t now)
{
    if (tier() == ResolutionTier::Unavailable)
        return;
    Entry& entry = entryFor(window);
    entry.savePending = true;
    entry.unavailable = false; // a first save gives a never-saved deck a file
    entry.attempts = 0;
    entry.dueAt = now + saveDelayMs_;
}

void ResolutionStatusResolver::requestRefresh(const WindowKey& window, int64_t now)
{
    if (tier() == ResolutionTier::Unavailable)
        return;
    Entry& entry = entryFor(window);
    entry.attempts = 0;
    entry.dueAt = now;
}

void ResolutionStatusResolver::forget(const std::string& presentation)
{
    entries_.erase(presentation);
}

std::optional<int64_t> ResolutionStatusResolver::nextDue() const
{
    std::optional<int64_t> earliest;
    for (const auto& kv : entries_)
    {
        if (kv.second.dueAt >= 0 && (!earliest || kv.second.dueAt < *earliest))
            earliest = kv.second.dueAt;
    }
    return earliest;
}

bool ResolutionStatusResolver::hasData(const std::string& presentation) const
{
    auto it = entries_.find(presentation);
    return it != entries_.end() && it->second.data.has_value();
}

// ─── Reads ───────────────────────────────────────────────────────────────────

void ResolutionStatusResolver::markUnavailable(Entry& entry, const std::string& presentation,
                                               const char* reason)
{
    if (!entry.unavailable)
        logWarning("resolution status unavailable for " + presentation + ": " + reason);
    entry.unavailable = true;
    entry.data.reset();
    entry.attempts = 0;
    entry.dueAt = -1;
}

void ResolutionStatusResolver::readNow(Entry& entry, const std::string& presentation,
                                       int64_t now, AppSession& session)
{
    entry.dueAt = -1;
    if (entry.windows.empty())
        return;

    auto path = session.savedPath(entry.windows.front());
    if (!path)
    {
        // Remote call failed; not the same as "never saved".
        entry.dueAt = now + retryBackoffMs_;
        return;
    }
    if (path->empty())
    {
        markUnavailable(entry, presentation, "never saved");
        return;
    }

    const ResolutionTier t = tier();
    FileReadResult read = t == ResolutionTier::SnapshotRead ? reader_->readSnapshot(*path)
                                                            : reader_->readShared(*path);
    switch (read.status)
    {
    case FileReadStatus::Locked:
    {
        ++entry.attempts;
        if (entry.attempts < retryAttempts_)
        {
            const int shift = std::min(entry.attempts - 1, 10);
            entry.dueAt = now + (static_cast<int64_t>(retryBackoffMs_) << shift);
            logDebug("saved file locked, retry " + std::to_string(entry.attempts));
        }
        else
        {
            logWarning("saved file still locked after " + std::to_string(entry.attempts) +
                       " attempts, keeping previous status");
            entry.attempts = 0;
            if (t == ResolutionTier::SnapshotRead)
                entry.dueAt = now + refreshMs_;
        }
        return;
    }
    case FileReadStatus::Missing:
        markUnavailable(entry, presentation, "saved file missing");
        return;
    case FileReadStatus::Failed:
        markUnavailable(entry, presentation, "saved file unreadable");
        if (t == ResolutionTier::SnapshotRead)
            entry.dueAt = now + refreshMs_;
        return;
    case FileReadStatus::Ok:
        break;
    }

    auto parsed = OoxmlCommentReader::read(read.bytes);
    if (!parsed)
    {
        markUnavailable(entry, presentation, "saved file is not a presentation package");
        return;
    }

    entry.data = std::move(parsed);
    entry.unavailable = false;
    entry.savePending = false;
    entry.attempts = 0;
    if (t == ResolutionTier::SnapshotRead)
        entry.dueAt = now + refreshMs_;
}

std::vector<std::pair<WindowKey, int>> ResolutionStatusResolver::runDue(int64_t now, AppSession& session,
                                                                        StateCache& cache)
{
    std::vector<std::pair<WindowKey, int>> changed;
    for (auto& kv : entries_)
    {
        Entry& entry = kv.second;
        if (entry.dueAt < 0 || entry.dueAt > now)
            continue;

        readNow(entry, kv.first, now, session);

        for (const auto& window : entry.windows)
        {
            for (int slide : cache.slidesFor(window))
            {
                if (applyTo(window, slide, session, cache))
                    changed.emplace_back(window, slide);
            }
        }
    }
    return changed;
}

// ─── Merge ───────────────────────────────────────────────────────────────────

bool ResolutionStatusResolver::applyTo(const WindowKey& window, int slideIndex,
                                       AppSession& session, StateCache& cache)
{
    auto snap = cache.get(window, slideIndex);
    if (!snap)
        return false;

    const size_t liveCount = std::max(static_cast<size_t>(std::max(snap->commentCount, 0)),
                                      snap->comments.size());

    auto it = entries_.find(window.presentation);
    const bool haveData = tier() != ResolutionTier::Unavailable && it != entries_.end() &&
                          !it->second.unavailable && it->second.data;
    if (!haveData)
    {
        std::vector<ResolutionStatus> unknown(liveCount, ResolutionStatus::Unknown);
        return cache.mergeResolution(window, slideIndex, CommentCorrelator::summarize(unknown),
                                     Freshness::Unknown, unknown);
    }

    static const std::vector<CommentRecord> kNoComments;
    const auto* fromFile = it->second.data->slide(slideIndex);
    auto statuses = CommentCorrelator::statuses(
        CommentCorrelator::correlate(snap->comments, fromFile ? *fromFile : kNoComments));
    // Comments the live read could not enumerate stay unknown.
    statuses.resize(liveCount, ResolutionStatus::Unknown);

    Freshness freshness = Freshness::StaleCached;
    if (!it->second.savePending)
    {
        auto unsaved = session.hasUnsavedChanges(window);
        if (unsaved && !*unsaved)
            freshness = Freshness::Fresh;
    }

    return cache.mergeResolution(window, slideIndex, CommentCorrelator::summarize(statuses),
                                 freshness, statuses);
}

const char* toString(ResolutionTier tier)
{
    switch (tier)
    {
    case ResolutionTier::SnapshotRead: return "snapshot_read";
    case ResolutionTier::SaveHook:     return "save_hook";
    case ResolutionTier::Unavailable:  return "unavailable";
    }
    return "unavailable";
}

} // namespace SlideBridge
