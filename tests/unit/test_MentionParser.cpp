// =============================================================================
// Unit tests for MentionParser
// Pure logic - no Win32 API dependencies.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "slidebridge/mention/MentionParser.h"

using namespace SlideBridge;
using Catch::Approx;

using Names = std::vector<std::string>;

// ── Extraction ──

TEST_CASE("Extracts a two-word mention", "[MentionParser]")
{
    REQUIRE(MentionParser::extractMentions("@John Doe please review") == Names{"John Doe"});
}

TEST_CASE("Stops at three name words", "[MentionParser]")
{
    REQUIRE(MentionParser::extractMentions("@Mary Ann Van Dyke") == Names{"Mary Ann Van"});
}

TEST_CASE("Email addresses are not mentions", "[MentionParser]")
{
    REQUIRE(MentionParser::extractMentions("mail john@example.com today").empty());
    REQUIRE(MentionParser::extractMentions("@Example.com is the domain").empty());
}

TEST_CASE("Lowercase after @ is not a name", "[MentionParser]")
{
    REQUIRE(MentionParser::extractMentions("meet @noon").empty());
}

TEST_CASE("Possessive and trailing punctuation are dropped", "[MentionParser]")
{
    REQUIRE(MentionParser::extractMentions("See @Sarah's note.") == Names{"Sarah"});
    REQUIRE(MentionParser::extractMentions("Thanks @Raj, @Li.") == Names{"Raj", "Li"});
}

TEST_CASE("Duplicate mentions are reported once", "[MentionParser]")
{
    REQUIRE(MentionParser::extractMentions("@Ana and @Ana again") == Names{"Ana"});
}

TEST_CASE("Extraction is total", "[MentionParser]")
{
    REQUIRE(MentionParser::extractMentions("").empty());
    REQUIRE(MentionParser::extractMentions("@").empty());
    REQUIRE(MentionParser::extractMentions("@@@ @ @-").empty());
    REQUIRE(MentionParser::extractMentions(std::string("\0@A", 3)) == Names{"A"});
}

// ── Matching ──

TEST_CASE("Exact match ignores case", "[MentionParser]")
{
    auto m = MentionParser::classifyMatch("john doe", {"John Doe"});
    REQUIRE(m.tier == ConfidenceTier::Exact);
    REQUIRE(m.variant == "John Doe");
}

TEST_CASE("First name alone is a prefix match", "[MentionParser]")
{
    auto m = MentionParser::classifyMatch("John", {"John Doe"});
    REQUIRE(m.tier == ConfidenceTier::Prefix);
}

TEST_CASE("Candidate that ran into the sentence is a prefix match", "[MentionParser]")
{
    auto m = MentionParser::classifyMatch("John Doe I", {"John Doe"});
    REQUIRE(m.tier == ConfidenceTier::Prefix);
}

TEST_CASE("One-letter typo in a short name is weak fuzzy", "[MentionParser]")
{
    auto m = MentionParser::classifyMatch("Jon Doe", {"John Doe"});
    REQUIRE(m.tier == ConfidenceTier::WeakFuzzy);
    REQUIRE(m.similarity == Approx(0.75));
}

TEST_CASE("Typo in a long name is strong fuzzy", "[MentionParser]")
{
    auto m = MentionParser::classifyMatch("Alexandra Smithson", {"Alexandra Smithsen"});
    REQUIRE(m.tier == ConfidenceTier::StrongFuzzy);
}

TEST_CASE("Unrelated name does not match", "[MentionParser]")
{
    REQUIRE(MentionParser::classifyMatch("Priya", {"John Doe", "John"}).tier == ConfidenceTier::None);
    REQUIRE_FALSE(MentionParser::matchesIdentity("Priya", {"John Doe"}));
}

TEST_CASE("matchesIdentity uses a single threshold", "[MentionParser]")
{
    REQUIRE(MentionParser::matchesIdentity("Jon Doe", {"John Doe"}, 0.70));
    REQUIRE_FALSE(MentionParser::matchesIdentity("Jon Doe", {"John Doe"}, 0.85));
}

TEST_CASE("Similarity is one for equal strings and symmetric", "[MentionParser]")
{
    REQUIRE(MentionParser::similarity("Anna", "anna") == Approx(1.0));
    REQUIRE(MentionParser::similarity("Anna", "Hanna") == Approx(MentionParser::similarity("Hanna", "Anna")));
    REQUIRE(MentionParser::similarity("", "") == Approx(1.0));
}

TEST_CASE("Identity variants from a last-first display name", "[MentionParser]")
{
    REQUIRE(MentionParser::identityVariants("Doe, John") == Names{"Doe, John", "John Doe", "John"});
    REQUIRE(MentionParser::identityVariants("John Doe") == Names{"John Doe", "John"});
    REQUIRE(MentionParser::identityVariants("Cher") == Names{"Cher"});
    REQUIRE(MentionParser::identityVariants("   ").empty());
}

// ── Scanning ──

TEST_CASE("findMentions scans replies under the parent's index", "[MentionParser]")
{
    CommentRecord first;
    first.text = "No mentions here";
    CommentRecord second;
    second.text = "Over to design";
    CommentRecord reply;
    reply.text = "@John can you check?";
    second.replies.push_back(reply);

    auto matches = MentionParser::findMentions({first, second}, {"John Doe", "John"});
    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].commentIndex == 1);
    REQUIRE(matches[0].candidate == "John");
    REQUIRE(matches[0].tier == ConfidenceTier::Exact);
}

TEST_CASE("findMentions with no identities finds nothing", "[MentionParser]")
{
    CommentRecord c;
    c.text = "@John Doe";
    REQUIRE(MentionParser::findMentions({c}, {}).empty());
}
