#pragma once
// =============================================================================
// SlideBridge - Common Types
// Shared data structures, constants, and request/response records.
// =============================================================================

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace SlideBridge
{

// Identity of one open document window. The presentation identity is the
// full path when saved, otherwise the window title. hwnd is the top-level
// frame holding the window (0 when unknown). index is the window's 1-based
// position among the presentation's windows and tells apart two windows on
// the same deck (0 when unknown).
struct WindowKey
{
    std::string presentation;
    uintptr_t   hwnd = 0;
    int         index = 0;

    bool empty() const { return presentation.empty() && hwnd == 0; }

    bool operator==(const WindowKey& o) const
    {
        return hwnd == o.hwnd && index == o.index && presentation == o.presentation;
    }
    bool operator!=(const WindowKey& o) const { return !(*this == o); }
    bool operator<(const WindowKey& o) const
    {
        return std::tie(presentation, index, hwnd) < std::tie(o.presentation, o.index, o.hwnd);
    }
};

// One open document window as last observed. Never persisted.
struct DocumentWindowHandle
{
    WindowKey key;
    int       lastKnownSlide = 0;  // 1-based, 0 = not yet observed
    bool      active = false;      // application-reported "active" flag
};

enum class ResolutionStatus : uint8_t
{
    Active,
    Resolved,
    Closed,
    Unknown,
};

// Whether cached data reflects the in-memory document or only the last save.
enum class Freshness : uint8_t
{
    Fresh,
    StaleCached,
    Unknown,
};

// Closed threads are counted as resolved.
struct ResolutionSummary
{
    int active = 0;
    int resolved = 0;
    int unknown = 0;

    int total() const { return active + resolved + unknown; }

    bool operator==(const ResolutionSummary& o) const
    {
        return active == o.active && resolved == o.resolved && unknown == o.unknown;
    }
    bool operator!=(const ResolutionSummary& o) const { return !(*this == o); }
};

struct CommentRecord
{
    std::string author;
    std::string text;
    std::string created;   // ISO-8601, empty when unavailable
    std::vector<CommentRecord> replies;
    ResolutionStatus status = ResolutionStatus::Unknown;
    int slideIndex = 0;

    bool operator==(const CommentRecord& o) const
    {
        return author == o.author && text == o.text && created == o.created &&
               replies == o.replies && status == o.status && slideIndex == o.slideIndex;
    }
    bool operator!=(const CommentRecord& o) const { return !(*this == o); }
};

struct SlideSnapshot
{
    int  slideIndex = 0;   // 1-based
    int  commentCount = 0;
    bool notesPresent = false;
    ResolutionSummary resolution;
    Freshness freshness = Freshness::Unknown;
    std::vector<CommentRecord> comments;

    bool operator==(const SlideSnapshot& o) const
    {
        return slideIndex == o.slideIndex && commentCount == o.commentCount &&
               notesPresent == o.notesPresent && resolution == o.resolution &&
               freshness == o.freshness && comments == o.comments;
    }
    bool operator!=(const SlideSnapshot& o) const { return !(*this == o); }
};

// Ordered weakest to strongest.
enum class ConfidenceTier : uint8_t
{
    None,
    WeakFuzzy,
    StrongFuzzy,
    Prefix,
    Exact,
};

// Derived per scan, never stored.
struct MentionMatch
{
    size_t         commentIndex = 0;
    std::string    candidate;
    std::string    matchedVariant;
    ConfidenceTier tier = ConfidenceTier::None;
    double         similarity = 0.0;
};

enum class FocusStatus : uint8_t
{
    Success,
    NotFound,
    PaneNotVisible,
};

enum class ErrorKind : uint8_t
{
    NotAttached,            // target application unreachable
    WindowAmbiguous,        // resolver fell through every fallback
    SubscriptionLost,       // event delivery stopped, re-attach required
    ResolutionUnavailable,  // no resolution source, surfaced as a caveat
    FocusNotFound,          // tree search failed after one retry
    RequestRejected,        // request queue full
};

// Application view types (ppViewType)
namespace ViewType
{
static constexpr int SlideMaster = 3;
static constexpr int SlideSorter = 5;
static constexpr int Outline     = 6;
static constexpr int Normal      = 9;
static constexpr int Notes       = 10;
static constexpr int Reading     = 50;
} // namespace ViewType

// Host -> worker requests (small, immutable, copied through the lock-free queue)
enum class RequestKind : uint8_t
{
    None = 0,
    NavigateSlide,    // argument: direction (-1 / +1)
    FocusComment,     // argument: 1-based ordinal
    RefreshStatus,
    ReadNotes,
    ReannounceSlide,
    ReadComments,
};

struct BridgeRequest
{
    RequestKind kind = RequestKind::None;
    int32_t     argument = 0;
};

// Worker -> host responses (copies only, never references to worker state)
enum class ResponseKind : uint8_t
{
    SlideChanged,
    FocusResult,
    Error,
};

struct BridgeResponse
{
    ResponseKind  kind = ResponseKind::SlideChanged;
    int           slideIndex = 0;
    SlideSnapshot snapshot;
    FocusStatus   focus = FocusStatus::Success;
    ErrorKind     error = ErrorKind::NotAttached;
    std::string   message;
};

const char* toString(ResolutionStatus status);
const char* toString(Freshness freshness);
const char* toString(ErrorKind kind);
const char* toString(FocusStatus status);

} // namespace SlideBridge
