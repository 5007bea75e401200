#pragma once
// =============================================================================
// SlideBridge - Interface Descriptor
// Hand-declared subset of the application's event source interface
// (EApplication). Only the events the bridge consumes are listed, each by its
// fixed dispatch id. The vendor type library is never loaded: it is not
// registered reliably across installations.
//
// Bump kDescriptorVersion whenever an entry is added or a dispatch id changes.
// =============================================================================

#include <array>
#include <cstdint>
#include <optional>

namespace SlideBridge
{

static constexpr uint32_t kDescriptorVersion = 2;

enum class AppEventKind : uint8_t
{
    WindowSelectionChange,  // arg: Selection
    SlideShowBegin,         // arg: SlideShowWindow
    SlideShowNextSlide,     // arg: SlideShowWindow (never fires for the first slide)
    SlideShowEnd,           // arg: Presentation
    PresentationSave,       // arg: Presentation
    PresentationClose,      // arg: Presentation
    Count
};

static constexpr size_t kAppEventKindCount = static_cast<size_t>(AppEventKind::Count);

// What the single event argument refers to.
enum class PayloadShape : uint8_t
{
    Selection,
    SlideShowWindow,
    Presentation,
};

struct EventDescriptor
{
    AppEventKind kind;
    int32_t      dispId;
    PayloadShape payload;
    const char*  name;
};

static constexpr std::array<EventDescriptor, kAppEventKindCount> kApplicationEvents = {{
    {AppEventKind::WindowSelectionChange, 2001, PayloadShape::Selection,       "WindowSelectionChange"},
    {AppEventKind::SlideShowBegin,        2011, PayloadShape::SlideShowWindow, "SlideShowBegin"},
    {AppEventKind::SlideShowNextSlide,    2013, PayloadShape::SlideShowWindow, "SlideShowNextSlide"},
    {AppEventKind::SlideShowEnd,          2014, PayloadShape::Presentation,    "SlideShowEnd"},
    {AppEventKind::PresentationSave,      2005, PayloadShape::Presentation,    "PresentationSave"},
    {AppEventKind::PresentationClose,     2004, PayloadShape::Presentation,    "PresentationClose"},
}};

// EApplication source interface {914934C2-5A91-11CF-8700-00AA0060263B}
struct InterfaceId
{
    uint32_t data1;
    uint16_t data2;
    uint16_t data3;
    uint8_t  data4[8];
};

static constexpr InterfaceId kApplicationEventsIid = {
    0x914934C2, 0x5A91, 0x11CF, {0x87, 0x00, 0x00, 0xAA, 0x00, 0x60, 0x26, 0x3B}};

// Programmatic identifier used for the running-object lookup.
static constexpr const wchar_t* kApplicationProgId = L"PowerPoint.Application";

std::optional<AppEventKind> eventKindFromDispId(int32_t dispId);
const EventDescriptor& describe(AppEventKind kind);

} // namespace SlideBridge
