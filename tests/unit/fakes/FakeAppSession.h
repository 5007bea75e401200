#pragma once
// =============================================================================
// Scripted AppSession and EventPayload doubles. Tests edit the public state
// directly; every call reads it fresh, like the live object model would.
// =============================================================================

#include "slidebridge/automation/AppSession.h"

#include <string>
#include <vector>

namespace SlideBridge
{
namespace Testing
{

struct FakeSlide
{
    std::vector<CommentRecord> comments;
    std::string notes;
};

struct FakeWindow
{
    WindowKey key;
    bool active = false;
    int currentSlide = 1;
    std::vector<FakeSlide> slides;
    int viewType = ViewType::Normal;
    bool inSlideShow = false;
    std::optional<std::string> savedPath = std::string();
    bool dirty = false;
};

inline CommentRecord makeComment(const std::string& author, const std::string& text,
                                 std::vector<CommentRecord> replies = {})
{
    CommentRecord c;
    c.author = author;
    c.text = text;
    c.replies = std::move(replies);
    return c;
}

class FakeAppSession : public AppSession
{
public:
    std::vector<FakeWindow> windowList;
    std::optional<WindowKey> activeAccessor;  // what ActiveWindow reports
    bool alive = true;
    std::optional<bool> panePressed = true;
    bool executeSucceeds = true;
    bool goToSucceeds = true;
    std::string userName;

    int observeCalls = 0;
    int commentsCalls = 0;
    int executeCalls = 0;
    int releaseCalls = 0;
    std::vector<int> goToRequests;

    FakeWindow& addWindow(const std::string& presentation, uintptr_t hwnd, int slideCount, int index = 0)
    {
        FakeWindow w;
        w.key.presentation = presentation;
        w.key.hwnd = hwnd;
        w.key.index = index;
        w.slides.resize(static_cast<size_t>(slideCount));
        windowList.push_back(std::move(w));
        return windowList.back();
    }

    FakeWindow* find(const WindowKey& key)
    {
        for (auto& w : windowList)
        {
            if (w.key == key)
                return &w;
        }
        return nullptr;
    }

    bool ping() override { return alive; }

    std::vector<DocumentWindowHandle> openWindows() override
    {
        std::vector<DocumentWindowHandle> out;
        for (const auto& w : windowList)
        {
            DocumentWindowHandle h;
            h.key = w.key;
            h.active = w.active;
            out.push_back(h);
        }
        return out;
    }

    std::optional<WindowKey> activeWindow() override { return activeAccessor; }

    std::optional<SlideObservation> observe(const WindowKey& window) override
    {
        ++observeCalls;
        FakeWindow* w = find(window);
        if (!w || w->currentSlide < 1 || w->currentSlide > static_cast<int>(w->slides.size()))
            return std::nullopt;

        const FakeSlide& slide = w->slides[static_cast<size_t>(w->currentSlide - 1)];
        SlideObservation obs;
        obs.slideIndex = w->currentSlide;
        obs.slideCount = static_cast<int>(w->slides.size());
        obs.commentCount = static_cast<int>(slide.comments.size());
        obs.notesPresent = !slide.notes.empty();
        obs.inSlideShow = w->inSlideShow;
        return obs;
    }

    std::vector<CommentRecord> comments(const WindowKey& window, int slideIndex) override
    {
        ++commentsCalls;
        const FakeSlide* slide = slideAt(window, slideIndex);
        if (!slide)
            return {};
        std::vector<CommentRecord> out = slide->comments;
        for (auto& c : out)
        {
            c.slideIndex = slideIndex;
            c.status = ResolutionStatus::Unknown;
        }
        return out;
    }

    std::optional<std::string> notesText(const WindowKey& window, int slideIndex) override
    {
        const FakeSlide* slide = slideAt(window, slideIndex);
        if (!slide)
            return std::nullopt;
        return slide->notes;
    }

    bool goToSlide(const WindowKey& window, int slideIndex) override
    {
        goToRequests.push_back(slideIndex);
        FakeWindow* w = find(window);
        if (!w || !goToSucceeds)
            return false;
        w->currentSlide = slideIndex;
        return true;
    }

    std::optional<int> viewType(const WindowKey& window) override
    {
        FakeWindow* w = find(window);
        if (!w)
            return std::nullopt;
        return w->viewType;
    }

    bool setViewType(const WindowKey& window, int viewType) override
    {
        FakeWindow* w = find(window);
        if (!w)
            return false;
        w->viewType = viewType;
        return true;
    }

    std::optional<std::string> savedPath(const WindowKey& window) override
    {
        FakeWindow* w = find(window);
        if (!w)
            return std::nullopt;
        return w->savedPath;
    }

    std::optional<bool> hasUnsavedChanges(const WindowKey& window) override
    {
        FakeWindow* w = find(window);
        if (!w)
            return std::nullopt;
        return w->dirty;
    }

    std::optional<bool> isCommandPressed(const std::string&) override { return panePressed; }

    bool executeCommand(const std::string&) override
    {
        ++executeCalls;
        if (executeSucceeds && panePressed)
            panePressed = !*panePressed;
        return executeSucceeds;
    }

    std::string userDisplayName() override { return userName; }

    void releaseSubscription() override { ++releaseCalls; }

private:
    const FakeSlide* slideAt(const WindowKey& window, int slideIndex)
    {
        FakeWindow* w = find(window);
        if (!w || slideIndex < 1 || slideIndex > static_cast<int>(w->slides.size()))
            return nullptr;
        return &w->slides[static_cast<size_t>(slideIndex - 1)];
    }
};

class FakePayload : public EventPayload
{
public:
    explicit FakePayload(std::optional<WindowKey> owner, std::string presentation = std::string())
        : owner_(std::move(owner))
        , presentation_(std::move(presentation))
    {
    }

    std::optional<WindowKey> owningWindow() const override { return owner_; }
    bool ownerInferred() const override { return inferred; }

    std::string presentation() const override
    {
        if (!presentation_.empty())
            return presentation_;
        return owner_ ? owner_->presentation : std::string();
    }

    bool inferred = false;

private:
    std::optional<WindowKey> owner_;
    std::string presentation_;
};

} // namespace Testing
} // namespace SlideBridge
