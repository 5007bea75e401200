#pragma once
// =============================================================================
// SlideBridge - Host C ABI
// Flat entry points for a screen-reading host loaded in another runtime. One
// bridge instance per process. Call from a single host thread.
// =============================================================================

#include <stdint.h>

#if defined(_WIN32) && defined(SLIDEBRIDGE_HOST_EXPORTS)
#define SLIDEBRIDGE_API __declspec(dllexport)
#elif defined(_WIN32)
#define SLIDEBRIDGE_API __declspec(dllimport)
#else
#define SLIDEBRIDGE_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

// Request kinds accepted by sbSubmit (same values as RequestKind).
enum SbRequest
{
    SB_NAVIGATE_SLIDE  = 1,  // argument: -1 previous, +1 next
    SB_FOCUS_COMMENT   = 2,  // argument: 1-based ordinal
    SB_REFRESH_STATUS  = 3,
    SB_READ_NOTES      = 4,
    SB_REANNOUNCE      = 5,
    SB_READ_COMMENTS   = 6,
};

enum SbResponseKind
{
    SB_SLIDE_CHANGED = 0,
    SB_FOCUS_RESULT  = 1,
    SB_ERROR         = 2,
};

typedef struct SbResponse
{
    int32_t kind;           // SbResponseKind
    int32_t slideIndex;
    int32_t commentCount;
    int32_t notesPresent;
    int32_t active;
    int32_t resolved;
    int32_t unknown;
    int32_t freshness;      // 0 fresh, 1 stale cached, 2 unknown
    int32_t focusStatus;    // 0 success, 1 not found, 2 pane not visible
    int32_t error;          // ErrorKind value, valid when kind == SB_ERROR
} SbResponse;

// configPath may be null for the default location. Returns 1 on success.
SLIDEBRIDGE_API int sbStart(const char* configPath);
SLIDEBRIDGE_API int sbStop(void);

// Returns 1 when queued, 0 when not started or the queue is full.
SLIDEBRIDGE_API int sbSubmit(int32_t request, int32_t argument);

// Copies the next announcement (UTF-8, NUL-terminated, truncated to fit).
// Returns its full length in bytes, 0 when none is pending.
SLIDEBRIDGE_API int sbPollAnnouncement(char* buffer, int32_t bufferSize);

// Returns 1 and fills out when a response is pending, otherwise 0.
SLIDEBRIDGE_API int sbPollResponse(SbResponse* out);

// Host focus object's window, used to disambiguate windows.
SLIDEBRIDGE_API void sbSetFocusWindow(uintptr_t hwnd);

SLIDEBRIDGE_API int sbIsAttached(void);

#ifdef __cplusplus
}
#endif
