#pragma once
// =============================================================================
// SlideBridge - MentionParser
// @mention extraction and identity matching. Pure and deterministic: no
// document, no settings, no globals.
// =============================================================================

#include "slidebridge/common/Types.h"

#include <string>
#include <vector>

namespace SlideBridge
{

class MentionParser
{
public:
    struct IdentityMatch
    {
        ConfidenceTier tier = ConfidenceTier::None;
        std::string    variant;      // identity variant that produced the tier
        double         similarity = 0.0;
    };

    // Capitalized words (at most kMaxNameWords) following '@'. Email-address
    // shapes are skipped. Total: any input yields a list, possibly empty.
    // Duplicates are reported once, in first-seen order.
    static std::vector<std::string> extractMentions(const std::string& text);

    // Tiers, strongest first:
    //   Exact       - case-insensitive equality
    //   Prefix      - candidate words are the leading words of a variant, or
    //                 the candidate minus trailing words equals a variant
    //   StrongFuzzy - similarity >= strongThreshold
    //   WeakFuzzy   - similarity >= weakThreshold
    static IdentityMatch classifyMatch(const std::string& candidate,
                                       const std::vector<std::string>& variants,
                                       double strongThreshold = kDefaultStrongThreshold,
                                       double weakThreshold = kDefaultWeakThreshold);

    // True for Exact/Prefix, or when the best similarity reaches threshold.
    static bool matchesIdentity(const std::string& candidate,
                                const std::vector<std::string>& variants,
                                double threshold = kDefaultStrongThreshold);

    // Normalized edit-distance ratio in [0, 1]. Token-wise minimum when both
    // sides have the same number of words, whole-string otherwise.
    static double similarity(const std::string& a, const std::string& b);

    // "Doe, John" -> {"Doe, John", "John Doe", "John"}
    static std::vector<std::string> identityVariants(const std::string& displayName);

    // Every mention in comments (and their replies) at WeakFuzzy or better.
    static std::vector<MentionMatch> findMentions(const std::vector<CommentRecord>& comments,
                                                  const std::vector<std::string>& variants,
                                                  double strongThreshold = kDefaultStrongThreshold,
                                                  double weakThreshold = kDefaultWeakThreshold);

    static constexpr size_t kMaxNameWords = 3;
    static constexpr double kDefaultStrongThreshold = 0.85;
    static constexpr double kDefaultWeakThreshold = 0.70;
};

} // namespace SlideBridge
