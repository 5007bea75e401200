#pragma once
// =============================================================================
// SlideBridge - CommentCorrelator
// Pairs comments read from the saved file with comments reported by the live
// automation interface. The two sources share no identifier, so the join is
// probabilistic: (slide, ordinal, text), with author as a tiebreak. The text
// prefix narrows candidates; only the full normalized text confirms a pair.
// An unpaired live comment gets Unknown, never a neighbour's status.
// =============================================================================

#include "slidebridge/common/Types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SlideBridge
{

enum class CorrelationConfidence : uint8_t
{
    None,
    Medium,  // full text matched at a different ordinal
    High,    // same ordinal, same full text
};

struct Correlation
{
    std::optional<size_t> fileIndex;  // index into the file's comment list
    CorrelationConfidence confidence = CorrelationConfidence::None;
    ResolutionStatus status = ResolutionStatus::Unknown;
};

class CommentCorrelator
{
public:
    // One entry per live comment, in live order.
    static std::vector<Correlation> correlate(const std::vector<CommentRecord>& live,
                                              const std::vector<CommentRecord>& fromFile);

    // Statuses only, ready for StateCache::mergeResolution.
    static std::vector<ResolutionStatus> statuses(const std::vector<Correlation>& correlations);

    // Closed is counted as resolved.
    static ResolutionSummary summarize(const std::vector<ResolutionStatus>& statuses);

    // Whitespace-collapsed, ASCII-lowercased, first kPrefixLength bytes.
    static std::string textKey(const std::string& text);

    // Same normalization as textKey, cut at limit bytes.
    static std::string normalizedText(const std::string& text, size_t limit = std::string::npos);

    static constexpr size_t kPrefixLength = 40;
};

} // namespace SlideBridge
