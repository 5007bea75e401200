#pragma once
// =============================================================================
// SlideBridge - AnnouncementFormatter
// Pre-formatted speech strings. The host receives finished text only.
// =============================================================================

#include "slidebridge/common/Types.h"

#include <optional>
#include <string>
#include <vector>

namespace SlideBridge
{

class AnnouncementFormatter
{
public:
    // "Slide 3, 2 comments, 1 resolved, has notes", then the caveat when the
    // slide has comments and the status is not fresh.
    static std::string slideChanged(const SlideSnapshot& snapshot);

    // "Comment 1 of 2, Sarah Johnson: text, 1 reply, resolved"
    static std::string comment(const CommentRecord& comment, int ordinal, int total);

    // Header line, one line per comment, one per reply, then the caveat.
    static std::vector<std::string> commentsReadout(const SlideSnapshot& snapshot);

    static std::string notes(int slideIndex, const std::optional<std::string>& text);

    static std::string focusFailure(FocusStatus status, int ordinal);

    // Empty for Fresh.
    static std::string caveat(Freshness freshness);

    static std::string mentions(size_t commentCount);

    static std::string viewSwitched();
    static std::string notAttached();
    static std::string requestRejected();
};

} // namespace SlideBridge
