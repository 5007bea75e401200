#pragma once
// =============================================================================
// SlideBridge - ComEventSink (Windows only)
// IDispatch sink advised on the application's EApplication connection point.
// Invoke() maps the dispatch id through the interface descriptor, wraps the
// single argument in a ComEventPayload and hands both to the dispatcher.
// It always returns S_OK: an error returned into the connection point can
// end delivery for good.
// =============================================================================

#include "slidebridge/automation/AppSession.h"
#include "slidebridge/automation/ComHelpers.h"
#include "slidebridge/automation/InterfaceDescriptor.h"

#include <atomic>

namespace SlideBridge
{

class EventDispatcher;

GUID toGuid(const InterfaceId& id);

// Identity of an application DocumentWindow object: presentation full name
// (caption when unsaved), the frame window found by caption, and the
// window's position in Presentation.Windows.
std::optional<WindowKey> windowKeyOf(IDispatch* documentWindow);

// Presentation.FullName, empty on failure.
std::string presentationNameOf(IDispatch* presentation);

class ComEventPayload : public EventPayload
{
public:
    ComEventPayload(ComRef<IDispatch> object, PayloadShape shape);

    std::optional<WindowKey> owningWindow() const override;
    bool ownerInferred() const override;
    std::string presentation() const override;

private:
    ComRef<IDispatch> presentationObject() const;

    ComRef<IDispatch> object_;
    PayloadShape shape_;
};

class ComEventSink : public IDispatch
{
public:
    explicit ComEventSink(EventDispatcher& dispatcher);

    // IUnknown
    ULONG STDMETHODCALLTYPE AddRef() override;
    ULONG STDMETHODCALLTYPE Release() override;
    HRESULT STDMETHODCALLTYPE QueryInterface(REFIID riid, void** ppv) override;

    // IDispatch
    HRESULT STDMETHODCALLTYPE GetTypeInfoCount(UINT* count) override;
    HRESULT STDMETHODCALLTYPE GetTypeInfo(UINT, LCID, ITypeInfo** info) override;
    HRESULT STDMETHODCALLTYPE GetIDsOfNames(REFIID, LPOLESTR*, UINT, LCID, DISPID*) override;
    HRESULT STDMETHODCALLTYPE Invoke(DISPID dispId, REFIID riid, LCID lcid, WORD flags,
                                     DISPPARAMS* params, VARIANT* result,
                                     EXCEPINFO* excep, UINT* argErr) override;

    // Called before Unadvise: late callbacks become no-ops.
    void disconnect() { connected_.store(false, std::memory_order_release); }

private:
    EventDispatcher& dispatcher_;
    std::atomic<ULONG> refCount_{1};
    std::atomic<bool> connected_{true};
};

} // namespace SlideBridge
