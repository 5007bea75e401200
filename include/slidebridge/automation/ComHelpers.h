#pragma once
// =============================================================================
// SlideBridge - COM helpers (Windows only)
// Reference holder, VARIANT holder, and IDispatch late binding by member
// name. Only included by translation units compiled without
// SLIDEBRIDGE_TESTING.
// =============================================================================

#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <windows.h>
#include <oleauto.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace SlideBridge
{

template <typename T>
class ComRef
{
public:
    ComRef() = default;
    // Takes ownership of an already-counted reference.
    explicit ComRef(T* p) : p_(p) {}
    ~ComRef() { reset(); }

    ComRef(const ComRef&) = delete;
    ComRef& operator=(const ComRef&) = delete;
    ComRef(ComRef&& o) noexcept : p_(o.p_) { o.p_ = nullptr; }
    ComRef& operator=(ComRef&& o) noexcept
    {
        if (this != &o)
        {
            reset();
            p_ = o.p_;
            o.p_ = nullptr;
        }
        return *this;
    }

    void reset()
    {
        if (p_)
        {
            p_->Release();
            p_ = nullptr;
        }
    }

    // Out-parameter slot; releases the current reference first.
    T** put()
    {
        reset();
        return &p_;
    }

    T* get() const { return p_; }
    T* operator->() const { return p_; }
    explicit operator bool() const { return p_ != nullptr; }

private:
    T* p_ = nullptr;
};

struct Variant
{
    VARIANT v;
    Variant() { VariantInit(&v); }
    ~Variant() { VariantClear(&v); }
    Variant(const Variant&) = delete;
    Variant& operator=(const Variant&) = delete;
};

inline std::wstring widen(const std::string& utf8)
{
    if (utf8.empty())
        return {};
    int len = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), static_cast<int>(utf8.size()), nullptr, 0);
    if (len <= 0)
        return {};
    std::wstring wide(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), static_cast<int>(utf8.size()), &wide[0], len);
    return wide;
}

inline std::string narrow(const wchar_t* wide, int length = -1)
{
    if (!wide)
        return {};
    int len = WideCharToMultiByte(CP_UTF8, 0, wide, length, nullptr, 0, nullptr, nullptr);
    if (len <= 0)
        return {};
    std::string out(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide, length, &out[0], len, nullptr, nullptr);
    if (length < 0)
        out.resize(static_cast<size_t>(len - 1)); // drop terminator
    return out;
}

inline std::string fromBstr(BSTR bstr)
{
    return bstr ? narrow(bstr, static_cast<int>(SysStringLen(bstr))) : std::string();
}

// Invokes a member by name. args are given in natural order.
inline HRESULT invokeByName(IDispatch* target, const wchar_t* member, WORD flags,
                            std::vector<VARIANT> args, VARIANT* result)
{
    if (!target)
        return E_POINTER;

    DISPID dispId = DISPID_UNKNOWN;
    LPOLESTR name = const_cast<LPOLESTR>(member);
    HRESULT hr = target->GetIDsOfNames(IID_NULL, &name, 1, LOCALE_USER_DEFAULT, &dispId);
    if (FAILED(hr))
        return hr;

    std::vector<VARIANT> reversed(args.rbegin(), args.rend());
    DISPPARAMS params = {};
    params.cArgs = static_cast<UINT>(reversed.size());
    params.rgvarg = reversed.empty() ? nullptr : reversed.data();

    EXCEPINFO excep = {};
    UINT argErr = 0;
    hr = target->Invoke(dispId, IID_NULL, LOCALE_USER_DEFAULT, flags, &params, result, &excep, &argErr);
    SysFreeString(excep.bstrSource);
    SysFreeString(excep.bstrDescription);
    SysFreeString(excep.bstrHelpFile);
    return hr;
}

inline HRESULT getProperty(IDispatch* target, const wchar_t* member, Variant& out,
                           std::vector<VARIANT> args = {})
{
    VariantClear(&out.v);
    return invokeByName(target, member, DISPATCH_PROPERTYGET | DISPATCH_METHOD, std::move(args), &out.v);
}

inline HRESULT callMethod(IDispatch* target, const wchar_t* member, std::vector<VARIANT> args = {})
{
    Variant ignored;
    return invokeByName(target, member, DISPATCH_METHOD, std::move(args), &ignored.v);
}

inline HRESULT putProperty(IDispatch* target, const wchar_t* member, VARIANT value)
{
    if (!target)
        return E_POINTER;

    DISPID dispId = DISPID_UNKNOWN;
    LPOLESTR name = const_cast<LPOLESTR>(member);
    HRESULT hr = target->GetIDsOfNames(IID_NULL, &name, 1, LOCALE_USER_DEFAULT, &dispId);
    if (FAILED(hr))
        return hr;

    DISPID namedArg = DISPID_PROPERTYPUT;
    DISPPARAMS params = {};
    params.rgvarg = &value;
    params.rgdispidNamedArgs = &namedArg;
    params.cArgs = 1;
    params.cNamedArgs = 1;
    return target->Invoke(dispId, IID_NULL, LOCALE_USER_DEFAULT, DISPATCH_PROPERTYPUT, &params,
                          nullptr, nullptr, nullptr);
}

inline ComRef<IDispatch> getDispatch(IDispatch* target, const wchar_t* member,
                                     std::vector<VARIANT> args = {})
{
    Variant out;
    if (FAILED(getProperty(target, member, out, std::move(args))) || out.v.vt != VT_DISPATCH ||
        !out.v.pdispVal)
        return ComRef<IDispatch>();
    IDispatch* p = out.v.pdispVal;
    p->AddRef();
    return ComRef<IDispatch>(p);
}

inline std::optional<int> getInt(IDispatch* target, const wchar_t* member)
{
    Variant out;
    if (FAILED(getProperty(target, member, out)))
        return std::nullopt;
    if (FAILED(VariantChangeType(&out.v, &out.v, 0, VT_I4)))
        return std::nullopt;
    return static_cast<int>(out.v.lVal);
}

// Office tri-state booleans (msoTrue = -1) convert like VARIANT_BOOL.
inline std::optional<bool> getBool(IDispatch* target, const wchar_t* member)
{
    auto value = getInt(target, member);
    if (!value)
        return std::nullopt;
    return *value != 0;
}

inline std::optional<std::string> getString(IDispatch* target, const wchar_t* member)
{
    Variant out;
    if (FAILED(getProperty(target, member, out)))
        return std::nullopt;
    if (FAILED(VariantChangeType(&out.v, &out.v, 0, VT_BSTR)))
        return std::nullopt;
    return fromBstr(out.v.bstrVal);
}

inline VARIANT intArg(int value)
{
    VARIANT v;
    VariantInit(&v);
    v.vt = VT_I4;
    v.lVal = value;
    return v;
}

// Caller keeps ownership of the BSTR in the returned VARIANT.
inline VARIANT bstrArg(BSTR value)
{
    VARIANT v;
    VariantInit(&v);
    v.vt = VT_BSTR;
    v.bstrVal = value;
    return v;
}

} // namespace SlideBridge
