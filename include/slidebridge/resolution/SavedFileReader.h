#pragma once
// =============================================================================
// SlideBridge - SavedFileReader
// Read-only access to the presentation's last-saved file image.
//
// readSnapshot(): point-in-time read that the application's share locks do
// not block (a shadow copy of the volume while the file is held open).
// Needs backup privilege and the shadow copy service; canBypassLocks()
// reports whether both are usable. Locked only for transient service states.
// readShared(): ordinary read with full sharing. Fails with Locked while the
// application is still writing the file after a save.
// =============================================================================

#include <cstdint>
#include <memory>
#include <string>

namespace SlideBridge
{

enum class FileReadStatus : uint8_t
{
    Ok,
    Locked,   // transient, retry with backoff
    Missing,
    Failed,
};

struct FileReadResult
{
    FileReadStatus status = FileReadStatus::Failed;
    std::string    bytes;

    bool ok() const { return status == FileReadStatus::Ok; }
};

class SavedFileReader
{
public:
    virtual ~SavedFileReader() = default;

    virtual bool canBypassLocks() = 0;
    virtual FileReadResult readSnapshot(const std::string& path) = 0;
    virtual FileReadResult readShared(const std::string& path) = 0;
};

// Windows: shadow-copy capable reader. Elsewhere: plain stream reader
// without lock bypass (canBypassLocks() is false).
std::unique_ptr<SavedFileReader> createPlatformFileReader();

const char* toString(FileReadStatus status);

} // namespace SlideBridge
