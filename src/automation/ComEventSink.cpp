// =============================================================================
// SlideBridge - ComEventSink
// EApplication callbacks arrive here on the worker thread, inside the pump's
// dispatch. Payload objects are wrapped without any remote call; the
// resolver queries them later in the same dispatch.
// =============================================================================

#ifndef SLIDEBRIDGE_TESTING

#include "slidebridge/automation/ComEventSink.h"
#include "slidebridge/automation/EventSink.h"
#include "slidebridge/automation/FrameWindows.h"
#include "slidebridge/support/DebugLog.h"

#include <cstring>
#include <exception>

namespace SlideBridge
{

GUID toGuid(const InterfaceId& id)
{
    GUID guid;
    guid.Data1 = id.data1;
    guid.Data2 = id.data2;
    guid.Data3 = id.data3;
    std::memcpy(guid.Data4, id.data4, sizeof(guid.Data4));
    return guid;
}

std::string presentationNameOf(IDispatch* presentation)
{
    if (!presentation)
        return {};
    auto fullName = getString(presentation, L"FullName");
    if (fullName && !fullName->empty())
        return *fullName;
    // Unsaved decks have no path; the name ("Presentation1") is the identity.
    return getString(presentation, L"Name").value_or(std::string());
}

// Two references denote the same object when their IUnknown pointers agree.
static bool sameObject(IDispatch* a, IDispatch* b)
{
    if (!a || !b)
        return false;
    ComRef<IUnknown> ua, ub;
    if (FAILED(a->QueryInterface(IID_IUnknown, reinterpret_cast<void**>(ua.put()))) ||
        FAILED(b->QueryInterface(IID_IUnknown, reinterpret_cast<void**>(ub.put()))))
        return false;
    return ua.get() == ub.get();
}

// 1-based position of documentWindow in Presentation.Windows, 0 if not found.
static int windowIndexOf(IDispatch* presentation, IDispatch* documentWindow)
{
    auto windows = getDispatch(presentation, L"Windows");
    const int count = getInt(windows.get(), L"Count").value_or(0);
    for (int i = 1; i <= count; ++i)
    {
        auto candidate = getDispatch(windows.get(), L"Item", {intArg(i)});
        if (sameObject(candidate.get(), documentWindow))
            return i;
    }
    return 0;
}

// Frame holding the window. Application.HWND is the active window's frame,
// so it only stands in when the caption lookup fails for the active window.
static uintptr_t frameHandleOf(IDispatch* documentWindow, const std::string& caption)
{
    auto app = getDispatch(documentWindow, L"Application");
    const uintptr_t appWindow =
        static_cast<uintptr_t>(static_cast<uint32_t>(getInt(app.get(), L"HWND").value_or(0)));

    uintptr_t hwnd = matchFrameWindow(caption, listFrameWindows(appWindow));
    if (hwnd == 0 && getBool(documentWindow, L"Active").value_or(false))
        hwnd = appWindow;
    if (hwnd == 0)
        logDebug("no frame window for \"" + caption + "\"");
    return hwnd;
}

std::optional<WindowKey> windowKeyOf(IDispatch* documentWindow)
{
    if (!documentWindow)
        return std::nullopt;

    WindowKey key;
    const std::string caption = getString(documentWindow, L"Caption").value_or(std::string());

    auto presentation = getDispatch(documentWindow, L"Presentation");
    key.presentation = presentationNameOf(presentation.get());
    if (key.presentation.empty())
        key.presentation = caption;
    key.index = windowIndexOf(presentation.get(), documentWindow);
    key.hwnd = frameHandleOf(documentWindow, caption);

    if (key.empty())
        return std::nullopt;
    return key;
}

// ─── ComEventPayload ─────────────────────────────────────────────────────────

ComEventPayload::ComEventPayload(ComRef<IDispatch> object, PayloadShape shape)
    : object_(std::move(object))
    , shape_(shape)
{
}

ComRef<IDispatch> ComEventPayload::presentationObject() const
{
    switch (shape_)
    {
    case PayloadShape::Presentation:
        object_->AddRef();
        return ComRef<IDispatch>(object_.get());
    case PayloadShape::SlideShowWindow:
        return getDispatch(object_.get(), L"Presentation");
    case PayloadShape::Selection:
    {
        // Selection.Parent is the DocumentWindow.
        auto window = getDispatch(object_.get(), L"Parent");
        return getDispatch(window.get(), L"Presentation");
    }
    }
    return ComRef<IDispatch>();
}

std::optional<WindowKey> ComEventPayload::owningWindow() const
{
    if (!object_)
        return std::nullopt;

    if (shape_ == PayloadShape::Selection)
    {
        auto window = getDispatch(object_.get(), L"Parent");
        return windowKeyOf(window.get());
    }

    // Slide show windows and presentations name no document window. With
    // several windows on the deck, the active one (else the first) is a guess.
    auto presentation = presentationObject();
    auto windows = getDispatch(presentation.get(), L"Windows");
    const int count = getInt(windows.get(), L"Count").value_or(0);
    if (count < 1)
        return std::nullopt;

    for (int i = 1; i <= count && count > 1; ++i)
    {
        auto window = getDispatch(windows.get(), L"Item", {intArg(i)});
        if (getBool(window.get(), L"Active").value_or(false))
            return windowKeyOf(window.get());
    }
    auto first = getDispatch(windows.get(), L"Item", {intArg(1)});
    return windowKeyOf(first.get());
}

bool ComEventPayload::ownerInferred() const
{
    if (!object_ || shape_ == PayloadShape::Selection)
        return false;
    auto presentation = presentationObject();
    auto windows = getDispatch(presentation.get(), L"Windows");
    return getInt(windows.get(), L"Count").value_or(0) > 1;
}

std::string ComEventPayload::presentation() const
{
    if (!object_)
        return {};
    auto presentation = presentationObject();
    return presentationNameOf(presentation.get());
}

// ─── ComEventSink ────────────────────────────────────────────────────────────

ComEventSink::ComEventSink(EventDispatcher& dispatcher)
    : dispatcher_(dispatcher)
{
}

ULONG STDMETHODCALLTYPE ComEventSink::AddRef()
{
    return ++refCount_;
}

ULONG STDMETHODCALLTYPE ComEventSink::Release()
{
    ULONG count = --refCount_;
    if (count == 0)
        delete this;
    return count;
}

HRESULT STDMETHODCALLTYPE ComEventSink::QueryInterface(REFIID riid, void** ppv)
{
    if (!ppv)
        return E_POINTER;

    const GUID events = toGuid(kApplicationEventsIid);
    if (riid == IID_IUnknown || riid == IID_IDispatch || riid == events)
    {
        *ppv = static_cast<IDispatch*>(this);
        AddRef();
        return S_OK;
    }
    *ppv = nullptr;
    return E_NOINTERFACE;
}

HRESULT STDMETHODCALLTYPE ComEventSink::GetTypeInfoCount(UINT* count)
{
    if (count)
        *count = 0;
    return S_OK;
}

HRESULT STDMETHODCALLTYPE ComEventSink::GetTypeInfo(UINT, LCID, ITypeInfo** info)
{
    if (info)
        *info = nullptr;
    return E_NOTIMPL;
}

HRESULT STDMETHODCALLTYPE ComEventSink::GetIDsOfNames(REFIID, LPOLESTR*, UINT, LCID, DISPID*)
{
    return DISP_E_UNKNOWNNAME;
}

HRESULT STDMETHODCALLTYPE ComEventSink::Invoke(DISPID dispId, REFIID, LCID, WORD,
                                               DISPPARAMS* params, VARIANT*, EXCEPINFO*, UINT*)
{
    if (!connected_.load(std::memory_order_acquire))
        return S_OK;

    try
    {
        auto kind = eventKindFromDispId(static_cast<int32_t>(dispId));
        if (!kind)
            return S_OK;

        // Arguments arrive in reverse order; every consumed event has one.
        ComRef<IDispatch> arg;
        if (params && params->cArgs >= 1)
        {
            VARIANT& v = params->rgvarg[params->cArgs - 1];
            IDispatch* p = nullptr;
            if (v.vt == VT_DISPATCH)
                p = v.pdispVal;
            else if (v.vt == (VT_DISPATCH | VT_BYREF) && v.ppdispVal)
                p = *v.ppdispVal;
            if (p)
            {
                p->AddRef();
                arg = ComRef<IDispatch>(p);
            }
        }

        std::shared_ptr<const EventPayload> payload;
        if (arg)
            payload = std::make_shared<ComEventPayload>(std::move(arg), describe(*kind).payload);

        dispatcher_.dispatchById(static_cast<int32_t>(dispId), std::move(payload));
    }
    catch (const std::exception& e)
    {
        logError(std::string("event callback failed: ") + e.what());
    }
    catch (...)
    {
        logError("event callback failed with a non-standard exception");
    }
    return S_OK;
}

} // namespace SlideBridge

#endif // SLIDEBRIDGE_TESTING
