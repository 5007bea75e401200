// =============================================================================
// SlideBridge - OoxmlCommentReader
// Package access with Poco::Zip, part parsing with the Poco::XML DOM.
// Every part is looked up through relationships; fixed names are only a
// fallback for the author lists.
// =============================================================================

#include "slidebridge/resolution/OoxmlCommentReader.h"
#include "slidebridge/support/DebugLog.h"

#include <Poco/AutoPtr.h>
#include <Poco/Exception.h>
#include <Poco/Path.h>
#include <Poco/DOM/Document.h>
#include <Poco/DOM/DOMParser.h>
#include <Poco/DOM/Element.h>
#include <Poco/DOM/NodeList.h>
#include <Poco/SAX/InputSource.h>
#include <Poco/Zip/ZipArchive.h>
#include <Poco/Zip/ZipStream.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

using Poco::AutoPtr;
using Poco::Path;
using namespace Poco::XML;
using namespace Poco::Zip;

namespace SlideBridge
{

// ─── Namespaces and relationship types ───────────────────────────────────────

static const char* const kRelationshipsNs = "http://schemas.openxmlformats.org/package/2006/relationships";
static const char* const kPresentationNs  = "http://schemas.openxmlformats.org/presentationml/2006/main";
static const char* const kOfficeRelNs     = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
static const char* const kDrawingNs       = "http://schemas.openxmlformats.org/drawingml/2006/main";
static const char* const kModernNs        = "http://schemas.microsoft.com/office/powerpoint/2018/8/main";

static const char* const kSlideRel          = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slide";
static const char* const kLegacyCommentsRel = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/comments";
static const char* const kLegacyAuthorsRel  = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/commentAuthors";
static const char* const kModernCommentsRel = "http://schemas.microsoft.com/office/2018/10/relationships/comments";
static const char* const kModernAuthorsRel  = "http://schemas.microsoft.com/office/2018/10/relationships/authors";

static const char* const kPresentationPart = "ppt/presentation.xml";

// ─── Package ─────────────────────────────────────────────────────────────────

class PackageImage
{
public:
    explicit PackageImage(const std::string& bytes)
        : stream_(bytes, std::ios::in | std::ios::binary)
        , archive_(stream_)
    {
    }

    // Null when the part does not exist.
    AutoPtr<Document> parse(const std::string& part)
    {
        auto header = archive_.findHeader(part);
        if (header == archive_.headerEnd())
            return AutoPtr<Document>();

        stream_.clear();
        ZipInputStream zis(stream_, header->second, true);
        InputSource src(zis);
        DOMParser parser;
        return AutoPtr<Document>(parser.parse(&src));
    }

private:
    std::istringstream stream_;
    ZipArchive archive_;
};

struct Relationship
{
    std::string id;
    std::string type;
    std::string target;  // resolved part name
};

// ─── DOM helpers ─────────────────────────────────────────────────────────────

static bool isElement(Node* node, const char* ns, const char* local)
{
    if (!node || node->nodeType() != Node::ELEMENT_NODE)
        return false;
    return node->namespaceURI() == ns && node->localName() == local;
}

static Element* firstChildElement(Node* parent, const char* ns, const char* local)
{
    if (!parent)
        return nullptr;
    for (Node* n = parent->firstChild(); n; n = n->nextSibling())
    {
        if (isElement(n, ns, local))
            return static_cast<Element*>(n);
    }
    return nullptr;
}

static std::vector<Element*> childElements(Node* parent, const char* ns, const char* local)
{
    std::vector<Element*> out;
    if (!parent)
        return out;
    for (Node* n = parent->firstChild(); n; n = n->nextSibling())
    {
        if (isElement(n, ns, local))
            out.push_back(static_cast<Element*>(n));
    }
    return out;
}

// DrawingML text body: runs concatenated, paragraphs separated by newlines.
static std::string bodyText(Element* txBody)
{
    std::string text;
    for (Element* para : childElements(txBody, kDrawingNs, "p"))
    {
        std::string line;
        AutoPtr<NodeList> runs = para->getElementsByTagNameNS(kDrawingNs, "t");
        for (unsigned long i = 0; i < runs->length(); ++i)
            line += runs->item(i)->innerText();
        if (!text.empty())
            text += '\n';
        text += line;
    }
    return text;
}

// ─── Relationships ───────────────────────────────────────────────────────────

static std::string relationshipsPartFor(const std::string& part)
{
    Path p(part, Path::PATH_UNIX);
    const std::string name = p.getFileName();
    p.makeParent();
    return p.toString(Path::PATH_UNIX) + "_rels/" + name + ".rels";
}

static std::vector<Relationship> readRelationships(PackageImage& package, const std::string& part)
{
    std::vector<Relationship> rels;
    AutoPtr<Document> doc = package.parse(relationshipsPartFor(part));
    if (doc.isNull())
        return rels;

    for (Element* e : childElements(doc->documentElement(), kRelationshipsNs, "Relationship"))
    {
        if (e->getAttribute("TargetMode") == "External")
            continue;
        Relationship rel;
        rel.id = e->getAttribute("Id");
        rel.type = e->getAttribute("Type");
        rel.target = OoxmlCommentReader::resolveTarget(part, e->getAttribute("Target"));
        rels.push_back(std::move(rel));
    }
    return rels;
}

static std::string targetOfType(const std::vector<Relationship>& rels, const char* type)
{
    for (const auto& rel : rels)
    {
        if (rel.type == type)
            return rel.target;
    }
    return {};
}

// ─── Author lists ────────────────────────────────────────────────────────────

using AuthorMap = std::unordered_map<std::string, std::string>;

static AuthorMap readAuthors(PackageImage& package, const std::string& part,
                             const char* ns, const char* listName, const char* itemName)
{
    AuthorMap authors;
    if (part.empty())
        return authors;
    AutoPtr<Document> doc = package.parse(part);
    if (doc.isNull())
        return authors;

    Element* root = doc->documentElement();
    if (!isElement(root, ns, listName))
        return authors;
    for (Element* a : childElements(root, ns, itemName))
        authors[a->getAttribute("id")] = a->getAttribute("name");
    return authors;
}

static std::string authorName(const AuthorMap& authors, const std::string& id)
{
    auto it = authors.find(id);
    return it == authors.end() ? std::string() : it->second;
}

// ─── Comment parts ───────────────────────────────────────────────────────────

static void readModernComments(PackageImage& package, const std::string& part, int slideIndex,
                               const AuthorMap& authors, std::vector<CommentRecord>& out)
{
    AutoPtr<Document> doc = package.parse(part);
    if (doc.isNull())
        return;

    Element* root = doc->documentElement();
    if (!isElement(root, kModernNs, "cmLst"))
        return;

    for (Element* cm : childElements(root, kModernNs, "cm"))
    {
        CommentRecord rec;
        rec.author = authorName(authors, cm->getAttribute("authorId"));
        rec.created = cm->getAttribute("created");
        rec.status = OoxmlCommentReader::statusFromAttribute(cm->getAttribute("status"));
        rec.text = bodyText(firstChildElement(cm, kModernNs, "txBody"));
        rec.slideIndex = slideIndex;

        Element* replyList = firstChildElement(cm, kModernNs, "replyLst");
        for (Element* r : childElements(replyList, kModernNs, "reply"))
        {
            CommentRecord reply;
            reply.author = authorName(authors, r->getAttribute("authorId"));
            reply.created = r->getAttribute("created");
            reply.text = bodyText(firstChildElement(r, kModernNs, "txBody"));
            reply.status = rec.status; // replies share the thread's state
            reply.slideIndex = slideIndex;
            rec.replies.push_back(std::move(reply));
        }
        out.push_back(std::move(rec));
    }
}

static void readLegacyComments(PackageImage& package, const std::string& part, int slideIndex,
                               const AuthorMap& authors, std::vector<CommentRecord>& out)
{
    AutoPtr<Document> doc = package.parse(part);
    if (doc.isNull())
        return;

    Element* root = doc->documentElement();
    if (!isElement(root, kPresentationNs, "cmLst"))
        return;

    for (Element* cm : childElements(root, kPresentationNs, "cm"))
    {
        CommentRecord rec;
        rec.author = authorName(authors, cm->getAttribute("authorId"));
        rec.created = cm->getAttribute("dt");
        if (Element* text = firstChildElement(cm, kPresentationNs, "text"))
            rec.text = text->innerText();
        rec.status = ResolutionStatus::Unknown; // legacy format has no status
        rec.slideIndex = slideIndex;
        out.push_back(std::move(rec));
    }
}

// ─── Entry points ────────────────────────────────────────────────────────────

static PresentationComments readPackage(PackageImage& package)
{
    PresentationComments result;

    AutoPtr<Document> presentation = package.parse(kPresentationPart);
    if (presentation.isNull())
        throw Poco::NotFoundException("package has no presentation part");

    const auto presentationRels = readRelationships(package, kPresentationPart);
    std::unordered_map<std::string, std::string> slideById;
    for (const auto& rel : presentationRels)
    {
        if (rel.type == kSlideRel)
            slideById[rel.id] = rel.target;
    }

    std::vector<std::string> slideParts;
    Element* idList = firstChildElement(presentation->documentElement(), kPresentationNs, "sldIdLst");
    for (Element* sldId : childElements(idList, kPresentationNs, "sldId"))
    {
        auto it = slideById.find(sldId->getAttributeNS(kOfficeRelNs, "id"));
        if (it != slideById.end())
            slideParts.push_back(it->second);
    }
    result.slideCount = static_cast<int>(slideParts.size());

    std::string modernAuthorsPart = targetOfType(presentationRels, kModernAuthorsRel);
    if (modernAuthorsPart.empty())
        modernAuthorsPart = "ppt/authors.xml";
    std::string legacyAuthorsPart = targetOfType(presentationRels, kLegacyAuthorsRel);
    if (legacyAuthorsPart.empty())
        legacyAuthorsPart = "ppt/commentAuthors.xml";

    const AuthorMap modernAuthors = readAuthors(package, modernAuthorsPart, kModernNs, "authorLst", "author");
    const AuthorMap legacyAuthors = readAuthors(package, legacyAuthorsPart, kPresentationNs, "cmAuthorLst", "cmAuthor");

    for (size_t i = 0; i < slideParts.size(); ++i)
    {
        const int slideIndex = static_cast<int>(i) + 1;
        std::vector<CommentRecord> comments;

        for (const auto& rel : readRelationships(package, slideParts[i]))
        {
            if (rel.type == kModernCommentsRel)
            {
                readModernComments(package, rel.target, slideIndex, modernAuthors, comments);
                result.hasModernComments = true;
            }
            else if (rel.type == kLegacyCommentsRel)
            {
                readLegacyComments(package, rel.target, slideIndex, legacyAuthors, comments);
            }
        }

        if (!comments.empty())
            result.bySlide[slideIndex] = std::move(comments);
    }
    return result;
}

std::optional<PresentationComments> OoxmlCommentReader::read(const std::string& packageBytes)
{
    if (packageBytes.empty())
        return std::nullopt;

    try
    {
        PackageImage package(packageBytes);
        return readPackage(package);
    }
    catch (const Poco::Exception& e)
    {
        logWarning("saved presentation unreadable: " + e.displayText());
    }
    catch (const std::exception& e)
    {
        logWarning(std::string("saved presentation unreadable: ") + e.what());
    }
    return std::nullopt;
}

ResolutionStatus OoxmlCommentReader::statusFromAttribute(const std::string& value)
{
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (v.empty() || v == "active")
        return ResolutionStatus::Active;
    if (v == "resolved")
        return ResolutionStatus::Resolved;
    if (v == "closed")
        return ResolutionStatus::Closed;
    return ResolutionStatus::Unknown;
}

std::string OoxmlCommentReader::resolveTarget(const std::string& sourcePart, const std::string& target)
{
    if (target.empty())
        return {};
    if (target.front() == '/')
        return target.substr(1);

    Path base(sourcePart, Path::PATH_UNIX);
    base.makeParent();
    // Re-parsing collapses "." and ".." segments.
    Path resolved(base.toString(Path::PATH_UNIX) + target, Path::PATH_UNIX);
    return resolved.toString(Path::PATH_UNIX);
}

} // namespace SlideBridge
