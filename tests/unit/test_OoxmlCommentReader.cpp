// =============================================================================
// Unit tests for OoxmlCommentReader
// Packages are built in memory with Poco::Zip.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include "slidebridge/resolution/OoxmlCommentReader.h"
#include "fakes/PptxBuilder.h"

using namespace SlideBridge;
using SlideBridge::Testing::PptxBuilder;

TEST_CASE("Modern comments carry status, author and text", "[OoxmlCommentReader]")
{
    PptxBuilder pptx;
    pptx.author("{A1}", "Sarah Johnson").author("{A2}", "Raj Patel");
    int s1 = pptx.addSlide();
    int s2 = pptx.addSlide();
    pptx.modernComment(s1, "{A1}", "Fix the chart", "resolved");
    pptx.modernComment(s1, "{A2}", "Source?");
    pptx.modernComment(s2, "{A2}", "Typo in title", "closed");

    auto result = OoxmlCommentReader::read(pptx.build());
    REQUIRE(result.has_value());
    REQUIRE(result->slideCount == 2);
    REQUIRE(result->hasModernComments);

    const auto* first = result->slide(1);
    REQUIRE(first != nullptr);
    REQUIRE(first->size() == 2);
    REQUIRE((*first)[0].author == "Sarah Johnson");
    REQUIRE((*first)[0].text == "Fix the chart");
    REQUIRE((*first)[0].status == ResolutionStatus::Resolved);
    REQUIRE_FALSE((*first)[0].created.empty());
    REQUIRE((*first)[1].status == ResolutionStatus::Active);

    REQUIRE(result->slide(2)->at(0).status == ResolutionStatus::Closed);
}

TEST_CASE("Replies inherit the thread status", "[OoxmlCommentReader]")
{
    PptxBuilder pptx;
    pptx.author("{A1}", "Sarah Johnson").author("{A2}", "Raj Patel");
    int s = pptx.addSlide();
    pptx.modernComment(s, "{A1}", "Can we cut this slide?", "resolved");
    pptx.reply(s, "{A2}", "Done");

    auto result = OoxmlCommentReader::read(pptx.build());
    REQUIRE(result.has_value());
    const auto& thread = result->slide(1)->at(0);
    REQUIRE(thread.replies.size() == 1);
    REQUIRE(thread.replies[0].author == "Raj Patel");
    REQUIRE(thread.replies[0].text == "Done");
    REQUIRE(thread.replies[0].status == ResolutionStatus::Resolved);
}

TEST_CASE("Slide order follows the presentation's slide list", "[OoxmlCommentReader]")
{
    PptxBuilder pptx;
    pptx.reverseSlideOrder = true;
    pptx.author("{A1}", "Sarah Johnson");
    int part1 = pptx.addSlide();
    int part2 = pptx.addSlide();
    pptx.modernComment(part1, "{A1}", "on part one");
    pptx.modernComment(part2, "{A1}", "on part two");

    auto result = OoxmlCommentReader::read(pptx.build());
    REQUIRE(result.has_value());
    REQUIRE(result->slide(1)->at(0).text == "on part two");
    REQUIRE(result->slide(2)->at(0).text == "on part one");
}

TEST_CASE("Authors part found without a relationship", "[OoxmlCommentReader]")
{
    PptxBuilder pptx;
    pptx.authorsRelationship = false;
    pptx.author("{A1}", "Sarah Johnson");
    int s = pptx.addSlide();
    pptx.modernComment(s, "{A1}", "hello");

    auto result = OoxmlCommentReader::read(pptx.build());
    REQUIRE(result.has_value());
    REQUIRE(result->slide(1)->at(0).author == "Sarah Johnson");
}

TEST_CASE("Legacy comments have unknown status", "[OoxmlCommentReader]")
{
    PptxBuilder pptx;
    pptx.legacyAuthor("0", "Old Reviewer");
    int s = pptx.addSlide();
    pptx.legacyComment(s, "0", "From 2019");

    auto result = OoxmlCommentReader::read(pptx.build());
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->hasModernComments);
    const auto& c = result->slide(1)->at(0);
    REQUIRE(c.author == "Old Reviewer");
    REQUIRE(c.text == "From 2019");
    REQUIRE(c.status == ResolutionStatus::Unknown);
}

TEST_CASE("Slides without comments have no entry", "[OoxmlCommentReader]")
{
    PptxBuilder pptx;
    pptx.addSlide();
    pptx.addSlide();

    auto result = OoxmlCommentReader::read(pptx.build());
    REQUIRE(result.has_value());
    REQUIRE(result->slideCount == 2);
    REQUIRE(result->slide(1) == nullptr);
    REQUIRE(result->bySlide.empty());
}

TEST_CASE("Garbage bytes are rejected without throwing", "[OoxmlCommentReader]")
{
    REQUIRE_FALSE(OoxmlCommentReader::read("").has_value());
    REQUIRE_FALSE(OoxmlCommentReader::read("not a zip archive at all").has_value());
}

TEST_CASE("Status attribute mapping", "[OoxmlCommentReader]")
{
    REQUIRE(OoxmlCommentReader::statusFromAttribute("") == ResolutionStatus::Active);
    REQUIRE(OoxmlCommentReader::statusFromAttribute("active") == ResolutionStatus::Active);
    REQUIRE(OoxmlCommentReader::statusFromAttribute("Resolved") == ResolutionStatus::Resolved);
    REQUIRE(OoxmlCommentReader::statusFromAttribute("closed") == ResolutionStatus::Closed);
    REQUIRE(OoxmlCommentReader::statusFromAttribute("archived") == ResolutionStatus::Unknown);
}

TEST_CASE("Relationship targets resolve against the source part", "[OoxmlCommentReader]")
{
    REQUIRE(OoxmlCommentReader::resolveTarget("ppt/slides/slide1.xml", "../comments/modernComment_1.xml") ==
            "ppt/comments/modernComment_1.xml");
    REQUIRE(OoxmlCommentReader::resolveTarget("ppt/presentation.xml", "slides/slide2.xml") ==
            "ppt/slides/slide2.xml");
    REQUIRE(OoxmlCommentReader::resolveTarget("ppt/presentation.xml", "/ppt/authors.xml") == "ppt/authors.xml");
}
