// =============================================================================
// SlideBridge - MentionParser
// Byte-oriented scanning. Names are compared ASCII-case-insensitively; UTF-8
// lead bytes are accepted as name characters so accented names survive
// extraction, but their case is not folded.
// =============================================================================

#include "slidebridge/mention/MentionParser.h"

#include <algorithm>
#include <cctype>

namespace SlideBridge
{

// ─── Character classes ───────────────────────────────────────────────────────

static bool isNameStart(unsigned char c)
{
    return (c >= 'A' && c <= 'Z') || c >= 0xC0;
}

static bool isNameByte(unsigned char c)
{
    return std::isalpha(c) || c >= 0x80 || c == '\'' || c == '-';
}

// Characters that can precede '@' in an address local part.
static bool isAddressByte(unsigned char c)
{
    return std::isalnum(c) || c == '.' || c == '_' || c == '-' || c == '+';
}

static std::string toLower(const std::string& s)
{
    std::string out(s);
    for (auto& ch : out)
    {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80)
            ch = static_cast<char>(std::tolower(c));
    }
    return out;
}

static std::vector<std::string> splitWords(const std::string& s)
{
    std::vector<std::string> words;
    size_t i = 0;
    while (i < s.size())
    {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        if (i > start)
            words.emplace_back(s, start, i - start);
    }
    return words;
}

static std::string joinWords(const std::vector<std::string>& words, size_t count)
{
    std::string out;
    for (size_t i = 0; i < count && i < words.size(); ++i)
    {
        if (i)
            out += ' ';
        out += words[i];
    }
    return out;
}

static std::string trim(const std::string& s)
{
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

// Drops a possessive "'s" and stray trailing apostrophes or hyphens.
static std::string stripWordTail(std::string word)
{
    if (word.size() > 2 && word.compare(word.size() - 2, 2, "'s") == 0)
        word.resize(word.size() - 2);
    while (!word.empty() && (word.back() == '\'' || word.back() == '-'))
        word.pop_back();
    return word;
}

// ─── Extraction ──────────────────────────────────────────────────────────────

std::vector<std::string> MentionParser::extractMentions(const std::string& text)
{
    std::vector<std::string> found;
    const size_t n = text.size();

    for (size_t at = 0; at < n; ++at)
    {
        if (text[at] != '@')
            continue;
        if (at > 0 && isAddressByte(static_cast<unsigned char>(text[at - 1])))
            continue; // user@host

        std::vector<std::string> words;
        bool domainShape = false;
        size_t pos = at + 1;

        while (words.size() < kMaxNameWords && pos < n &&
               isNameStart(static_cast<unsigned char>(text[pos])))
        {
            size_t end = pos;
            while (end < n && isNameByte(static_cast<unsigned char>(text[end])))
                ++end;

            // "@Example.com": a dot glued to an alphanumeric is a domain
            if (end + 1 < n && text[end] == '.' &&
                std::isalnum(static_cast<unsigned char>(text[end + 1])))
            {
                domainShape = words.empty();
                break;
            }

            std::string word = stripWordTail(text.substr(pos, end - pos));
            if (word.empty())
                break;
            words.push_back(std::move(word));
            pos = end;

            if (pos + 1 < n && text[pos] == ' ' &&
                isNameStart(static_cast<unsigned char>(text[pos + 1])))
                ++pos;
            else
                break;
        }

        if (domainShape || words.empty())
            continue;

        std::string candidate = joinWords(words, words.size());
        if (std::find(found.begin(), found.end(), candidate) == found.end())
            found.push_back(std::move(candidate));
    }
    return found;
}

// ─── Similarity ──────────────────────────────────────────────────────────────

static size_t editDistance(const std::string& a, const std::string& b)
{
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j)
        prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i)
    {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j)
        {
            size_t subst = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, subst});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

static double ratio(const std::string& a, const std::string& b)
{
    const size_t longest = std::max(a.size(), b.size());
    if (longest == 0)
        return 1.0;
    return 1.0 - static_cast<double>(editDistance(a, b)) / static_cast<double>(longest);
}

double MentionParser::similarity(const std::string& a, const std::string& b)
{
    const auto wa = splitWords(toLower(a));
    const auto wb = splitWords(toLower(b));

    if (!wa.empty() && wa.size() == wb.size())
    {
        // Every word must be close; "Jon Doe" is one typo in a short word.
        double worst = 1.0;
        for (size_t i = 0; i < wa.size(); ++i)
            worst = std::min(worst, ratio(wa[i], wb[i]));
        return worst;
    }
    return ratio(joinWords(wa, wa.size()), joinWords(wb, wb.size()));
}

// ─── Matching ────────────────────────────────────────────────────────────────

MentionParser::IdentityMatch MentionParser::classifyMatch(const std::string& candidate,
                                                          const std::vector<std::string>& variants,
                                                          double strongThreshold,
                                                          double weakThreshold)
{
    IdentityMatch best;
    const auto words = splitWords(toLower(candidate));
    if (words.empty())
        return best;

    auto consider = [&](ConfidenceTier tier, const std::string& variant, double score) {
        if (tier > best.tier || (tier == best.tier && score > best.similarity))
        {
            best.tier = tier;
            best.variant = variant;
            best.similarity = score;
        }
    };

    for (const auto& variant : variants)
    {
        const auto vw = splitWords(toLower(variant));
        if (vw.empty())
            continue;

        if (vw == words)
        {
            consider(ConfidenceTier::Exact, variant, 1.0);
            continue;
        }

        // "@John" for "John Doe"
        if (words.size() < vw.size() && std::equal(words.begin(), words.end(), vw.begin()))
            consider(ConfidenceTier::Prefix, variant, 1.0);

        // "@John Doe I" where the extractor ran into the sentence
        if (vw.size() < words.size() && std::equal(vw.begin(), vw.end(), words.begin()))
            consider(ConfidenceTier::Prefix, variant, 1.0);

        double score = 0.0;
        for (size_t k = words.size(); k > 0; --k)
            score = std::max(score, similarity(joinWords(words, k), variant));

        if (score >= strongThreshold)
            consider(ConfidenceTier::StrongFuzzy, variant, score);
        else if (score >= weakThreshold)
            consider(ConfidenceTier::WeakFuzzy, variant, score);
    }
    return best;
}

bool MentionParser::matchesIdentity(const std::string& candidate,
                                    const std::vector<std::string>& variants,
                                    double threshold)
{
    return classifyMatch(candidate, variants, threshold, threshold).tier != ConfidenceTier::None;
}

std::vector<std::string> MentionParser::identityVariants(const std::string& displayName)
{
    std::vector<std::string> variants;
    auto add = [&](const std::string& v) {
        if (v.empty())
            return;
        const std::string lowered = toLower(v);
        for (const auto& existing : variants)
        {
            if (toLower(existing) == lowered)
                return;
        }
        variants.push_back(v);
    };

    const std::string name = trim(displayName);
    if (name.empty())
        return variants;
    add(name);

    std::string canonical = name;
    const size_t comma = name.find(',');
    if (comma != std::string::npos)
    {
        const std::string last = trim(name.substr(0, comma));
        const std::string first = trim(name.substr(comma + 1));
        if (!last.empty() && !first.empty())
        {
            canonical = first + " " + last;
            add(canonical);
        }
    }

    const auto words = splitWords(canonical);
    if (words.size() > 1)
        add(words.front());
    return variants;
}

static void scanText(const std::string& text, size_t commentIndex,
                     const std::vector<std::string>& variants,
                     double strongThreshold, double weakThreshold,
                     std::vector<MentionMatch>& out)
{
    for (const auto& candidate : MentionParser::extractMentions(text))
    {
        auto m = MentionParser::classifyMatch(candidate, variants, strongThreshold, weakThreshold);
        if (m.tier == ConfidenceTier::None)
            continue;

        MentionMatch match;
        match.commentIndex = commentIndex;
        match.candidate = candidate;
        match.matchedVariant = m.variant;
        match.tier = m.tier;
        match.similarity = m.similarity;
        out.push_back(std::move(match));
    }
}

static void scanComment(const CommentRecord& comment, size_t commentIndex,
                        const std::vector<std::string>& variants,
                        double strongThreshold, double weakThreshold,
                        std::vector<MentionMatch>& out)
{
    scanText(comment.text, commentIndex, variants, strongThreshold, weakThreshold, out);
    for (const auto& reply : comment.replies)
        scanComment(reply, commentIndex, variants, strongThreshold, weakThreshold, out);
}

std::vector<MentionMatch> MentionParser::findMentions(const std::vector<CommentRecord>& comments,
                                                      const std::vector<std::string>& variants,
                                                      double strongThreshold,
                                                      double weakThreshold)
{
    std::vector<MentionMatch> matches;
    if (variants.empty())
        return matches;

    for (size_t i = 0; i < comments.size(); ++i)
        scanComment(comments[i], i, variants, strongThreshold, weakThreshold, matches);
    return matches;
}

} // namespace SlideBridge
