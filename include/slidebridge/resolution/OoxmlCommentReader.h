#pragma once
// =============================================================================
// SlideBridge - OoxmlCommentReader
// Extracts comments, with their resolution status, from a saved .pptx
// package image. Understands both comment formats:
//   modern  (ppt/comments/modernComment_*.xml) - carries status
//   legacy  (ppt/comments/comment*.xml)        - no status, always Unknown
// Slide numbering follows presentation.xml's slide id list, which is the
// order the application shows, not the part file names.
// =============================================================================

#include "slidebridge/common/Types.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace SlideBridge
{

struct PresentationComments
{
    int slideCount = 0;
    // 1-based slide index -> comments in document order
    std::map<int, std::vector<CommentRecord>> bySlide;
    bool hasModernComments = false;

    const std::vector<CommentRecord>* slide(int slideIndex) const
    {
        auto it = bySlide.find(slideIndex);
        return it == bySlide.end() ? nullptr : &it->second;
    }
};

class OoxmlCommentReader
{
public:
    // nullopt when the bytes are not a readable presentation package.
    // Never throws.
    static std::optional<PresentationComments> read(const std::string& packageBytes);

    // Absent attribute means active.
    static ResolutionStatus statusFromAttribute(const std::string& value);

    // Resolves a relationship target against the part that declares it:
    // ("ppt/slides/slide1.xml", "../comments/modernComment_1.xml")
    //   -> "ppt/comments/modernComment_1.xml"
    static std::string resolveTarget(const std::string& sourcePart, const std::string& target);
};

} // namespace SlideBridge
