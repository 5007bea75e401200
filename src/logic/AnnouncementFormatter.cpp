// =============================================================================
// SlideBridge - AnnouncementFormatter
// =============================================================================

#include "slidebridge/logic/AnnouncementFormatter.h"

namespace SlideBridge
{

static std::string counted(int n, const char* singular, const char* plural)
{
    return std::to_string(n) + " " + (n == 1 ? singular : plural);
}

static const char* statusWord(ResolutionStatus status)
{
    switch (status)
    {
    case ResolutionStatus::Active:   return "active";
    case ResolutionStatus::Resolved: return "resolved";
    case ResolutionStatus::Closed:   return "closed";
    case ResolutionStatus::Unknown:  return "";
    }
    return "";
}

static std::string collapse(const std::string& text)
{
    std::string out;
    bool space = false;
    for (char c : text)
    {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ')
        {
            space = !out.empty();
            continue;
        }
        if (space)
            out += ' ';
        space = false;
        out += c;
    }
    return out;
}

std::string AnnouncementFormatter::slideChanged(const SlideSnapshot& snapshot)
{
    std::string text = "Slide " + std::to_string(snapshot.slideIndex) + ", ";
    if (snapshot.commentCount == 0)
        text += "no comments";
    else
        text += counted(snapshot.commentCount, "comment", "comments");

    if (snapshot.commentCount > 0 && snapshot.freshness != Freshness::Unknown &&
        snapshot.resolution.resolved > 0)
    {
        text += ", " + std::to_string(snapshot.resolution.resolved) + " resolved";
    }

    if (snapshot.notesPresent)
        text += ", has notes";

    if (snapshot.commentCount > 0 && snapshot.freshness != Freshness::Fresh)
        text += ", " + caveat(snapshot.freshness);
    return text;
}

std::string AnnouncementFormatter::comment(const CommentRecord& comment, int ordinal, int total)
{
    std::string text = "Comment " + std::to_string(ordinal) + " of " + std::to_string(total) + ", ";
    text += comment.author.empty() ? std::string("unknown author") : comment.author;
    text += ": " + collapse(comment.text);

    if (!comment.replies.empty())
        text += ", " + counted(static_cast<int>(comment.replies.size()), "reply", "replies");

    const char* status = statusWord(comment.status);
    if (status[0] != '\0')
        text += std::string(", ") + status;
    return text;
}

std::vector<std::string> AnnouncementFormatter::commentsReadout(const SlideSnapshot& snapshot)
{
    std::vector<std::string> lines;
    if (snapshot.commentCount == 0)
    {
        lines.push_back("No comments on slide " + std::to_string(snapshot.slideIndex));
        return lines;
    }

    lines.push_back(counted(snapshot.commentCount, "comment", "comments") + " on slide " +
                    std::to_string(snapshot.slideIndex));

    const int total = static_cast<int>(snapshot.comments.size());
    for (int i = 0; i < total; ++i)
    {
        const CommentRecord& c = snapshot.comments[static_cast<size_t>(i)];
        lines.push_back(comment(c, i + 1, total));
        for (size_t r = 0; r < c.replies.size(); ++r)
        {
            const CommentRecord& reply = c.replies[r];
            lines.push_back("Reply " + std::to_string(r + 1) + ", " +
                            (reply.author.empty() ? std::string("unknown author") : reply.author) +
                            ": " + collapse(reply.text));
        }
    }

    std::string note = caveat(snapshot.freshness);
    if (!note.empty())
        lines.push_back(note);
    return lines;
}

std::string AnnouncementFormatter::notes(int slideIndex, const std::optional<std::string>& text)
{
    if (!text || collapse(*text).empty())
        return "No notes on slide " + std::to_string(slideIndex);
    return "Notes: " + collapse(*text);
}

std::string AnnouncementFormatter::focusFailure(FocusStatus status, int ordinal)
{
    switch (status)
    {
    case FocusStatus::Success:        return {};
    case FocusStatus::NotFound:       return "Comment " + std::to_string(ordinal) + " not found";
    case FocusStatus::PaneNotVisible: return "Comments pane could not be shown";
    }
    return {};
}

std::string AnnouncementFormatter::caveat(Freshness freshness)
{
    switch (freshness)
    {
    case Freshness::Fresh:       return {};
    case Freshness::StaleCached: return "Resolution status from last save";
    case Freshness::Unknown:     return "Resolution status unavailable";
    }
    return {};
}

std::string AnnouncementFormatter::mentions(size_t commentCount)
{
    return "You are mentioned in " +
           counted(static_cast<int>(commentCount), "comment", "comments");
}

std::string AnnouncementFormatter::viewSwitched()
{
    return "Switched to Normal view";
}

std::string AnnouncementFormatter::notAttached()
{
    return "Presentation editor not connected";
}

std::string AnnouncementFormatter::requestRejected()
{
    return "Busy, try again";
}

} // namespace SlideBridge
