#pragma once
// =============================================================================
// SlideBridge - ResolutionStatusResolver
// Recovers comment resolution status, which the automation interface never
// exposes, from the presentation's saved file and merges it into the
// StateCache with a freshness flag.
//
//   Tier 1 (SnapshotRead) - lock-bypassing read on first use, then every
//                           resolutionRefreshMs and after each save
//   Tier 2 (SaveHook)     - shared read on first use and after each save;
//                           a locked file is retried with exponential backoff
//   Tier 3 (Unavailable)  - no reader, never-saved or unreadable file:
//                           statuses stay Unknown with Freshness::Unknown
//
// Runs on the worker thread on its own schedule (runDue), decoupled from
// slide-change events.
// =============================================================================

#include "slidebridge/common/Types.h"
#include "slidebridge/resolution/OoxmlCommentReader.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace SlideBridge
{

class AppSession;
class SavedFileReader;
class StateCache;
struct SettingsSnapshot;

enum class ResolutionTier : uint8_t
{
    SnapshotRead,
    SaveHook,
    Unavailable,
};

class ResolutionStatusResolver
{
public:
    // reader may be null (Tier 3 everywhere). Not owned.
    explicit ResolutionStatusResolver(SavedFileReader* reader);

    void configure(const SettingsSnapshot& settings);

    // Decided once, on first call.
    ResolutionTier tier();

    // First sight of a window: its presentation is read on the next runDue.
    void schedule(const WindowKey& window, int64_t now);
    // Save completed: re-read after saveRereadDelayMs.
    void onSaved(const WindowKey& window, int64_t now);
    // Explicit refresh request: re-read on the next runDue.
    void requestRefresh(const WindowKey& window, int64_t now);
    void forget(const std::string& presentation);

    // Performs every read that is due and re-merges all cached slides of the
    // affected windows. Returns the (window, slide) keys whose cached
    // resolution changed.
    std::vector<std::pair<WindowKey, int>> runDue(int64_t now, AppSession& session, StateCache& cache);

    // Merges the last file data into one cached slide. Call after the
    // slide's comments were stored. Returns true when the cache changed.
    bool applyTo(const WindowKey& window, int slideIndex, AppSession& session, StateCache& cache);

    // Earliest pending read, for diagnostics and tests.
    std::optional<int64_t> nextDue() const;

    bool hasData(const std::string& presentation) const;

private:
    struct Entry
    {
        std::vector<WindowKey> windows;
        std::optional<PresentationComments> data;
        int64_t dueAt = -1;        // -1 = nothing scheduled
        int     attempts = 0;      // consecutive Locked results
        bool    savePending = false;
        bool    unavailable = false;
    };

    Entry& entryFor(const WindowKey& window);
    void readNow(Entry& entry, const std::string& presentation, int64_t now, AppSession& session);
    void markUnavailable(Entry& entry, const std::string& presentation, const char* reason);

    SavedFileReader* reader_;
    std::optional<ResolutionTier> tier_;
    std::map<std::string, Entry> entries_;

    int refreshMs_ = 30000;
    int saveDelayMs_ = 1500;
    int retryAttempts_ = 5;
    int retryBackoffMs_ = 250;
};

const char* toString(ResolutionTier tier);

} // namespace SlideBridge
