// =============================================================================
// SlideBridge - ComAppSession
// Late-bound IDispatch calls into the application object model. Every
// method runs on the worker thread that attached the session. Failures are
// reported as empty optionals or false; nothing here throws.
// =============================================================================

#include "slidebridge/automation/ComAppSession.h"
#include "slidebridge/support/DebugLog.h"

#ifndef SLIDEBRIDGE_TESTING

#include "slidebridge/automation/ComEventSink.h"
#include "slidebridge/automation/ComHelpers.h"

#include <ocidl.h>

#include <cstdio>

#pragma comment(lib, "Ole32.lib")
#pragma comment(lib, "OleAut32.lib")
#pragma comment(lib, "Advapi32.lib")

namespace SlideBridge
{

// ppPlaceholderBody
static constexpr int kBodyPlaceholder = 2;

static std::string formatDate(const VARIANT& v)
{
    Variant copy;
    if (FAILED(VariantChangeType(&copy.v, const_cast<VARIANT*>(&v), 0, VT_DATE)))
        return {};

    SYSTEMTIME st = {};
    if (!VariantTimeToSystemTime(copy.v.date, &st))
        return {};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04u-%02u-%02uT%02u:%02u:%02u",
                  st.wYear, st.wMonth, st.wDay, st.wHour, st.wMinute, st.wSecond);
    return buf;
}

static CommentRecord readComment(IDispatch* comment, int slideIndex, bool withReplies)
{
    CommentRecord record;
    record.slideIndex = slideIndex;
    record.author = getString(comment, L"Author").value_or(std::string());
    record.text = getString(comment, L"Text").value_or(std::string());

    Variant date;
    if (SUCCEEDED(getProperty(comment, L"DateTime", date)))
        record.created = formatDate(date.v);

    if (!withReplies)
        return record;

    // Comment.Replies is missing on old builds; no replies then.
    auto replies = getDispatch(comment, L"Replies");
    const int count = getInt(replies.get(), L"Count").value_or(0);
    for (int i = 1; i <= count; ++i)
    {
        auto reply = getDispatch(replies.get(), L"Item", {intArg(i)});
        if (reply)
            record.replies.push_back(readComment(reply.get(), slideIndex, false));
    }
    return record;
}

// ─── ComAppSession ───────────────────────────────────────────────────────────

class ComAppSession : public AppSession
{
public:
    ComAppSession(ComRef<IDispatch> app, ComRef<IConnectionPoint> point, DWORD cookie, ComEventSink* sink)
        : app_(std::move(app))
        , point_(std::move(point))
        , cookie_(cookie)
        , sink_(sink)
    {
    }

    ~ComAppSession() override { releaseSubscription(); }

    bool ping() override
    {
        return getString(app_.get(), L"Name").has_value();
    }

    std::vector<DocumentWindowHandle> openWindows() override
    {
        std::vector<DocumentWindowHandle> out;
        auto windows = getDispatch(app_.get(), L"Windows");
        const int count = getInt(windows.get(), L"Count").value_or(0);
        for (int i = 1; i <= count; ++i)
        {
            auto window = getDispatch(windows.get(), L"Item", {intArg(i)});
            auto key = windowKeyOf(window.get());
            if (!key)
                continue;
            DocumentWindowHandle handle;
            handle.key = *key;
            handle.active = getBool(window.get(), L"Active").value_or(false);
            out.push_back(std::move(handle));
        }
        return out;
    }

    std::optional<WindowKey> activeWindow() override
    {
        auto window = getDispatch(app_.get(), L"ActiveWindow");
        return windowKeyOf(window.get());
    }

    std::optional<SlideObservation> observe(const WindowKey& key) override
    {
        auto window = findWindow(key);
        auto presentation = getDispatch(window.get(), L"Presentation");
        if (!presentation)
            return std::nullopt;

        SlideObservation obs;
        auto slides = getDispatch(presentation.get(), L"Slides");
        obs.slideCount = getInt(slides.get(), L"Count").value_or(0);

        std::optional<int> index;
        auto show = getDispatch(presentation.get(), L"SlideShowWindow");
        if (show)
        {
            auto view = getDispatch(show.get(), L"View");
            auto slide = getDispatch(view.get(), L"Slide");
            index = getInt(slide.get(), L"SlideIndex");
            obs.inSlideShow = index.has_value();
        }
        if (!index)
        {
            auto view = getDispatch(window.get(), L"View");
            auto slide = getDispatch(view.get(), L"Slide");
            index = getInt(slide.get(), L"SlideIndex");
        }
        if (!index)
        {
            // Thumbnail pane focus leaves View.Slide unset; the selection still knows.
            auto selection = getDispatch(window.get(), L"Selection");
            auto range = getDispatch(selection.get(), L"SlideRange");
            index = getInt(range.get(), L"SlideIndex");
        }
        if (!index || *index < 1)
            return std::nullopt;
        obs.slideIndex = *index;

        auto slide = getDispatch(slides.get(), L"Item", {intArg(obs.slideIndex)});
        auto comments = getDispatch(slide.get(), L"Comments");
        obs.commentCount = getInt(comments.get(), L"Count").value_or(0);
        auto notes = bodyText(slide.get());
        obs.notesPresent = notes && !notes->empty();
        return obs;
    }

    std::vector<CommentRecord> comments(const WindowKey& key, int slideIndex) override
    {
        std::vector<CommentRecord> out;
        auto slide = slideOf(key, slideIndex);
        auto comments = getDispatch(slide.get(), L"Comments");
        const int count = getInt(comments.get(), L"Count").value_or(0);
        for (int i = 1; i <= count; ++i)
        {
            auto comment = getDispatch(comments.get(), L"Item", {intArg(i)});
            if (comment)
                out.push_back(readComment(comment.get(), slideIndex, true));
        }
        return out;
    }

    std::optional<std::string> notesText(const WindowKey& key, int slideIndex) override
    {
        auto slide = slideOf(key, slideIndex);
        if (!slide)
            return std::nullopt;
        return bodyText(slide.get()).value_or(std::string());
    }

    bool goToSlide(const WindowKey& key, int slideIndex) override
    {
        auto window = findWindow(key);
        auto presentation = getDispatch(window.get(), L"Presentation");
        auto show = getDispatch(presentation.get(), L"SlideShowWindow");
        if (show)
        {
            auto view = getDispatch(show.get(), L"View");
            if (SUCCEEDED(callMethod(view.get(), L"GotoSlide", {intArg(slideIndex)})))
                return true;
        }
        auto view = getDispatch(window.get(), L"View");
        return SUCCEEDED(callMethod(view.get(), L"GotoSlide", {intArg(slideIndex)}));
    }

    std::optional<int> viewType(const WindowKey& key) override
    {
        auto window = findWindow(key);
        return getInt(window.get(), L"ViewType");
    }

    bool setViewType(const WindowKey& key, int viewType) override
    {
        auto window = findWindow(key);
        return SUCCEEDED(putProperty(window.get(), L"ViewType", intArg(viewType)));
    }

    std::optional<std::string> savedPath(const WindowKey& key) override
    {
        auto window = findWindow(key);
        auto presentation = getDispatch(window.get(), L"Presentation");
        if (!presentation)
            return std::nullopt;
        auto dir = getString(presentation.get(), L"Path");
        if (!dir)
            return std::nullopt;
        if (dir->empty())
            return std::string();
        return getString(presentation.get(), L"FullName");
    }

    std::optional<bool> hasUnsavedChanges(const WindowKey& key) override
    {
        auto window = findWindow(key);
        auto presentation = getDispatch(window.get(), L"Presentation");
        auto saved = getBool(presentation.get(), L"Saved");
        if (!saved)
            return std::nullopt;
        return !*saved;
    }

    std::optional<bool> isCommandPressed(const std::string& commandId) override
    {
        auto bars = getDispatch(app_.get(), L"CommandBars");
        if (!bars)
            return std::nullopt;

        BSTR id = SysAllocString(widen(commandId).c_str());
        Variant out;
        HRESULT hr = getProperty(bars.get(), L"GetPressedMso", out, {bstrArg(id)});
        SysFreeString(id);
        if (FAILED(hr) || FAILED(VariantChangeType(&out.v, &out.v, 0, VT_I4)))
            return std::nullopt;
        return out.v.lVal != 0;
    }

    bool executeCommand(const std::string& commandId) override
    {
        auto bars = getDispatch(app_.get(), L"CommandBars");
        if (!bars)
            return false;

        BSTR id = SysAllocString(widen(commandId).c_str());
        HRESULT hr = callMethod(bars.get(), L"ExecuteMso", {bstrArg(id)});
        SysFreeString(id);
        if (FAILED(hr))
            logWarning("ExecuteMso failed for " + commandId);
        return SUCCEEDED(hr);
    }

    std::string userDisplayName() override
    {
        wchar_t buf[256] = {};
        DWORD size = sizeof(buf);
        LSTATUS rc = RegGetValueW(HKEY_CURRENT_USER, L"Software\\Microsoft\\Office\\Common\\UserInfo",
                                  L"UserName", RRF_RT_REG_SZ, nullptr, buf, &size);
        if (rc != ERROR_SUCCESS)
            return {};
        return narrow(buf);
    }

    void releaseSubscription() override
    {
        if (sink_)
            sink_->disconnect();
        if (point_ && cookie_ != 0)
        {
            HRESULT hr = point_->Unadvise(cookie_);
            if (FAILED(hr))
                logWarning("Unadvise failed");
        }
        cookie_ = 0;
        point_.reset();
        if (sink_)
        {
            sink_->Release();
            sink_ = nullptr;
        }
        app_.reset();
    }

private:
    // Exact key first. The frame handle of a window found only through
    // Application.HWND changes with activation, so presentation and index
    // alone also identify the window.
    ComRef<IDispatch> findWindow(const WindowKey& key)
    {
        auto windows = getDispatch(app_.get(), L"Windows");
        const int count = getInt(windows.get(), L"Count").value_or(0);
        ComRef<IDispatch> sameSlot;
        for (int i = 1; i <= count; ++i)
        {
            auto window = getDispatch(windows.get(), L"Item", {intArg(i)});
            auto candidate = windowKeyOf(window.get());
            if (!candidate)
                continue;
            if (*candidate == key)
                return window;
            if (!sameSlot && key.index != 0 && candidate->index == key.index &&
                candidate->presentation == key.presentation)
                sameSlot = std::move(window);
        }
        return sameSlot;
    }

    ComRef<IDispatch> slideOf(const WindowKey& key, int slideIndex)
    {
        auto window = findWindow(key);
        auto presentation = getDispatch(window.get(), L"Presentation");
        auto slides = getDispatch(presentation.get(), L"Slides");
        return getDispatch(slides.get(), L"Item", {intArg(slideIndex)});
    }

    // Text of the notes page body placeholder, empty optional on failure.
    static std::optional<std::string> bodyText(IDispatch* slide)
    {
        auto page = getDispatch(slide, L"NotesPage");
        auto shapes = getDispatch(page.get(), L"Shapes");
        auto placeholders = getDispatch(shapes.get(), L"Placeholders");
        const int count = getInt(placeholders.get(), L"Count").value_or(0);
        for (int i = 1; i <= count; ++i)
        {
            auto shape = getDispatch(placeholders.get(), L"Item", {intArg(i)});
            auto format = getDispatch(shape.get(), L"PlaceholderFormat");
            if (getInt(format.get(), L"Type").value_or(0) != kBodyPlaceholder)
                continue;
            auto frame = getDispatch(shape.get(), L"TextFrame");
            auto range = getDispatch(frame.get(), L"TextRange");
            return getString(range.get(), L"Text");
        }
        return std::nullopt;
    }

    ComRef<IDispatch> app_;
    ComRef<IConnectionPoint> point_;
    DWORD cookie_ = 0;
    ComEventSink* sink_ = nullptr;
};

// ─── ComConnector ────────────────────────────────────────────────────────────

class ComConnector : public AutomationConnector
{
public:
    std::unique_ptr<AppSession> attach(EventDispatcher& dispatcher) override
    {
        CLSID clsid;
        if (FAILED(CLSIDFromProgID(kApplicationProgId, &clsid)))
            return nullptr;

        ComRef<IUnknown> unknown;
        if (FAILED(GetActiveObject(clsid, nullptr, unknown.put())) || !unknown)
            return nullptr;

        ComRef<IDispatch> app;
        if (FAILED(unknown->QueryInterface(IID_IDispatch, reinterpret_cast<void**>(app.put()))))
            return nullptr;

        ComRef<IConnectionPointContainer> container;
        if (FAILED(unknown->QueryInterface(IID_IConnectionPointContainer,
                                           reinterpret_cast<void**>(container.put()))))
        {
            logWarning("application exposes no connection points");
            return nullptr;
        }

        ComRef<IConnectionPoint> point;
        const GUID events = toGuid(kApplicationEventsIid);
        HRESULT hr = container->FindConnectionPoint(events, point.put());
        if (FAILED(hr))
        {
            logWarning("event interface not found on application");
            return nullptr;
        }

        ComEventSink* sink = new ComEventSink(dispatcher);
        DWORD cookie = 0;
        hr = point->Advise(sink, &cookie);
        if (FAILED(hr))
        {
            sink->Release();
            logWarning("Advise failed");
            return nullptr;
        }

        return std::make_unique<ComAppSession>(std::move(app), std::move(point), cookie, sink);
    }
};

std::shared_ptr<AutomationConnector> createComConnector()
{
    return std::make_shared<ComConnector>();
}

uintptr_t platformForegroundWindow()
{
    return reinterpret_cast<uintptr_t>(GetForegroundWindow());
}

} // namespace SlideBridge

#else // SLIDEBRIDGE_TESTING: the application is never reachable

namespace SlideBridge
{

class DetachedConnector : public AutomationConnector
{
public:
    std::unique_ptr<AppSession> attach(EventDispatcher&) override { return nullptr; }
};

std::shared_ptr<AutomationConnector> createComConnector()
{
    return std::make_shared<DetachedConnector>();
}

uintptr_t platformForegroundWindow()
{
    return 0;
}

} // namespace SlideBridge

#endif // SLIDEBRIDGE_TESTING
