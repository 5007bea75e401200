// =============================================================================
// SlideBridge - CommentCorrelator
// Two passes: same-ordinal pairs first, then a unique text match elsewhere
// on the slide for whatever is left. The prefix key only selects candidates;
// a pair needs the full normalized texts to agree. Edited text between the
// save and the live read leaves the comment Unknown.
// =============================================================================

#include "slidebridge/resolution/CommentCorrelator.h"

#include <algorithm>
#include <cctype>

namespace SlideBridge
{

std::string CommentCorrelator::textKey(const std::string& text)
{
    return normalizedText(text, kPrefixLength);
}

std::string CommentCorrelator::normalizedText(const std::string& text, size_t limit)
{
    std::string key;
    bool pendingSpace = false;
    for (char ch : text)
    {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c))
        {
            pendingSpace = !key.empty();
            continue;
        }
        if (pendingSpace)
        {
            if (key.size() >= limit)
                break;
            key += ' ';
            pendingSpace = false;
        }
        if (key.size() >= limit)
            break;
        key += c < 0x80 ? static_cast<char>(std::tolower(c)) : ch;
    }
    return key;
}

static std::vector<std::string> nameWords(const std::string& name)
{
    std::string flat(name);
    for (auto& ch : flat)
    {
        if (ch == ',')
            ch = ' ';
    }
    std::vector<std::string> words;
    std::string key = CommentCorrelator::textKey(flat);
    size_t start = 0;
    while (start < key.size())
    {
        size_t end = key.find(' ', start);
        if (end == std::string::npos)
            end = key.size();
        if (end > start)
            words.push_back(key.substr(start, end - start));
        start = end + 1;
    }
    std::sort(words.begin(), words.end());
    return words;
}

// Authors may differ in form ("Doe, John" vs "John Doe") or be missing on one
// side; only a clear mismatch between two non-empty names disqualifies.
static bool authorsCompatible(const std::string& a, const std::string& b)
{
    if (a.empty() || b.empty())
        return true;
    return nameWords(a) == nameWords(b);
}

std::vector<Correlation> CommentCorrelator::correlate(const std::vector<CommentRecord>& live,
                                                      const std::vector<CommentRecord>& fromFile)
{
    std::vector<Correlation> result(live.size());
    std::vector<bool> claimed(fromFile.size(), false);

    std::vector<std::string> liveKeys, fileKeys, liveTexts, fileTexts;
    liveKeys.reserve(live.size());
    fileKeys.reserve(fromFile.size());
    for (const auto& c : live)
    {
        liveKeys.push_back(textKey(c.text));
        liveTexts.push_back(normalizedText(c.text));
    }
    for (const auto& c : fromFile)
    {
        fileKeys.push_back(textKey(c.text));
        fileTexts.push_back(normalizedText(c.text));
    }

    auto samePair = [&](size_t i, size_t j) {
        return liveKeys[i] == fileKeys[j] && liveTexts[i] == fileTexts[j] &&
               authorsCompatible(live[i].author, fromFile[j].author);
    };

    // ── Pass 1: same ordinal ──
    for (size_t i = 0; i < live.size() && i < fromFile.size(); ++i)
    {
        if (!liveKeys[i].empty() && samePair(i, i))
        {
            result[i].fileIndex = i;
            result[i].confidence = CorrelationConfidence::High;
            result[i].status = fromFile[i].status;
            claimed[i] = true;
        }
    }

    // ── Pass 2: unique unclaimed text match ──
    for (size_t i = 0; i < live.size(); ++i)
    {
        if (result[i].fileIndex || liveKeys[i].empty())
            continue;

        std::optional<size_t> match;
        bool ambiguous = false;
        for (size_t j = 0; j < fromFile.size(); ++j)
        {
            if (claimed[j] || !samePair(i, j))
                continue;
            if (match)
            {
                ambiguous = true;
                break;
            }
            match = j;
        }

        if (match && !ambiguous)
        {
            result[i].fileIndex = match;
            result[i].confidence = CorrelationConfidence::Medium;
            result[i].status = fromFile[*match].status;
            claimed[*match] = true;
        }
    }
    return result;
}

std::vector<ResolutionStatus> CommentCorrelator::statuses(const std::vector<Correlation>& correlations)
{
    std::vector<ResolutionStatus> out;
    out.reserve(correlations.size());
    for (const auto& c : correlations)
        out.push_back(c.fileIndex ? c.status : ResolutionStatus::Unknown);
    return out;
}

ResolutionSummary CommentCorrelator::summarize(const std::vector<ResolutionStatus>& statuses)
{
    ResolutionSummary s;
    for (auto status : statuses)
    {
        switch (status)
        {
        case ResolutionStatus::Active:
            ++s.active;
            break;
        case ResolutionStatus::Resolved:
        case ResolutionStatus::Closed:
            ++s.resolved;
            break;
        case ResolutionStatus::Unknown:
            ++s.unknown;
            break;
        }
    }
    return s;
}

} // namespace SlideBridge
