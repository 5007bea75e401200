// =============================================================================
// SlideBridge - SavedFileReader
// Win32 snapshot read: first a direct read that denies writers, which can
// only succeed while nobody holds the file open for writing. While the
// editor does, the file is read from a Volume Shadow Copy of its volume.
// Shared read: full share mode; a sharing violation while the application
// is mid-save is reported as Locked.
// =============================================================================

#include "slidebridge/resolution/SavedFileReader.h"
#include "slidebridge/support/DebugLog.h"

#ifndef SLIDEBRIDGE_TESTING

#include "slidebridge/automation/ComHelpers.h"

#include <vss.h>
#include <vswriter.h>
#include <vsbackup.h>

#include <algorithm>
#include <cstdio>
#include <cwchar>

#pragma comment(lib, "Advapi32.lib")
#pragma comment(lib, "VssApi.lib")

namespace SlideBridge
{

static constexpr DWORD kShareAll = FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE;
static constexpr DWORD kShadowWaitMs = 60000;

static std::string hex(HRESULT hr)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08lX", static_cast<unsigned long>(hr));
    return buf;
}

// Enables SeBackupPrivilege on the process token. Fails for standard users.
static bool enableBackupPrivilege()
{
    HANDLE token = nullptr;
    if (!OpenProcessToken(GetCurrentProcess(), TOKEN_ADJUST_PRIVILEGES | TOKEN_QUERY, &token))
        return false;

    TOKEN_PRIVILEGES tp = {};
    tp.PrivilegeCount = 1;
    tp.Privileges[0].Attributes = SE_PRIVILEGE_ENABLED;
    bool ok = LookupPrivilegeValueW(nullptr, SE_BACKUP_NAME, &tp.Privileges[0].Luid) &&
              AdjustTokenPrivileges(token, FALSE, &tp, sizeof(tp), nullptr, nullptr) &&
              GetLastError() != ERROR_NOT_ALL_ASSIGNED;
    CloseHandle(token);
    return ok;
}

static FileReadResult readHandle(HANDLE file)
{
    FileReadResult result;
    LARGE_INTEGER size = {};
    if (!GetFileSizeEx(file, &size) || size.QuadPart > 512LL * 1024 * 1024)
    {
        result.status = FileReadStatus::Failed;
        return result;
    }

    result.bytes.resize(static_cast<size_t>(size.QuadPart));
    size_t offset = 0;
    while (offset < result.bytes.size())
    {
        DWORD chunk = static_cast<DWORD>(std::min<size_t>(result.bytes.size() - offset, 1u << 20));
        DWORD got = 0;
        if (!ReadFile(file, &result.bytes[offset], chunk, &got, nullptr))
        {
            result.status = GetLastError() == ERROR_LOCK_VIOLATION ? FileReadStatus::Locked
                                                                   : FileReadStatus::Failed;
            result.bytes.clear();
            return result;
        }
        if (got == 0)
            break;
        offset += got;
    }
    result.bytes.resize(offset);
    result.status = FileReadStatus::Ok;
    return result;
}

static FileReadResult openAndRead(const std::wstring& path, DWORD shareMode)
{
    FileReadResult result;
    if (path.empty())
    {
        result.status = FileReadStatus::Missing;
        return result;
    }

    HANDLE file = CreateFileW(path.c_str(), GENERIC_READ, shareMode, nullptr, OPEN_EXISTING,
                              FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file == INVALID_HANDLE_VALUE)
    {
        DWORD err = GetLastError();
        if (err == ERROR_SHARING_VIOLATION || err == ERROR_LOCK_VIOLATION)
            result.status = FileReadStatus::Locked;
        else if (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND)
            result.status = FileReadStatus::Missing;
        else
            result.status = FileReadStatus::Failed;
        return result;
    }

    result = readHandle(file);
    CloseHandle(file);
    return result;
}

// ─── Volume Shadow Copy ──────────────────────────────────────────────────────

static HRESULT waitAsync(IVssAsync* async)
{
    if (!async)
        return E_POINTER;
    HRESULT hr = async->Wait(kShadowWaitMs);
    if (FAILED(hr))
        return hr;

    HRESULT status = S_OK;
    hr = async->QueryStatus(&status, nullptr);
    if (FAILED(hr))
        return hr;
    if (status == VSS_S_ASYNC_PENDING)
    {
        async->Cancel();
        return VSS_E_FLUSH_WRITES_TIMEOUT;
    }
    return FAILED(status) ? status : S_OK;
}

template <typename Start>
static HRESULT runAsync(Start start)
{
    ComRef<IVssAsync> async;
    HRESULT hr = start(async.put());
    return SUCCEEDED(hr) ? waitAsync(async.get()) : hr;
}

// Busy states of the shadow copy service clear on their own.
static bool transientShadowFailure(HRESULT hr)
{
    return hr == VSS_E_SNAPSHOT_SET_IN_PROGRESS || hr == VSS_E_FLUSH_WRITES_TIMEOUT ||
           hr == VSS_E_HOLD_WRITES_TIMEOUT || hr == VSS_E_WRITERERROR_TIMEOUT;
}

static HRESULT createBackupComponents(ComRef<IVssBackupComponents>& backup)
{
    HRESULT hr = CreateVssBackupComponents(backup.put());
    if (SUCCEEDED(hr))
        hr = backup->InitializeForBackup();
    return hr;
}

// Reads path from a non-persistent shadow copy of its volume. The shadow is
// deleted when the backup components are released.
static FileReadResult readShadowCopy(const std::wstring& path)
{
    FileReadResult result;
    wchar_t volume[MAX_PATH + 1] = {};
    if (!GetVolumePathNameW(path.c_str(), volume, MAX_PATH))
        return result;
    const size_t rootLength = wcslen(volume);
    if (rootLength == 0 || path.size() <= rootLength || _wcsnicmp(path.c_str(), volume, rootLength) != 0)
        return result;

    ComRef<IVssBackupComponents> backup;
    HRESULT hr = createBackupComponents(backup);
    if (SUCCEEDED(hr))
        hr = backup->SetContext(VSS_CTX_BACKUP);
    if (SUCCEEDED(hr))
        hr = backup->SetBackupState(false, false, VSS_BT_COPY, false);
    if (SUCCEEDED(hr))
        hr = runAsync([&](IVssAsync** a) { return backup->GatherWriterMetadata(a); });

    VSS_ID setId = GUID_NULL;
    VSS_ID snapshotId = GUID_NULL;
    bool started = false;
    if (SUCCEEDED(hr))
    {
        hr = backup->StartSnapshotSet(&setId);
        started = SUCCEEDED(hr);
    }
    if (SUCCEEDED(hr))
        hr = backup->AddToSnapshotSet(volume, GUID_NULL, &snapshotId);
    if (SUCCEEDED(hr))
        hr = runAsync([&](IVssAsync** a) { return backup->PrepareForBackup(a); });
    if (SUCCEEDED(hr))
        hr = runAsync([&](IVssAsync** a) { return backup->DoSnapshotSet(a); });

    std::wstring shadowPath;
    if (SUCCEEDED(hr))
    {
        VSS_SNAPSHOT_PROP prop = {};
        hr = backup->GetSnapshotProperties(snapshotId, &prop);
        if (SUCCEEDED(hr))
        {
            shadowPath = std::wstring(prop.m_pwszSnapshotDeviceObject) + L"\\" + path.substr(rootLength);
            VssFreeSnapshotProperties(&prop);
        }
    }

    if (FAILED(hr))
    {
        if (started)
            backup->AbortBackup();
        logWarning("shadow copy failed: " + hex(hr));
        result.status = transientShadowFailure(hr) ? FileReadStatus::Locked : FileReadStatus::Failed;
        return result;
    }

    result = openAndRead(shadowPath, kShareAll);

    hr = runAsync([&](IVssAsync** a) { return backup->BackupComplete(a); });
    if (FAILED(hr))
        logDebug("shadow copy completion reported " + hex(hr));
    return result;
}

// ─── Win32FileReader ─────────────────────────────────────────────────────────

class Win32FileReader : public SavedFileReader
{
public:
    // Needs backup privilege and a usable shadow copy service, which in
    // practice means an elevated process.
    bool canBypassLocks() override
    {
        if (!checked_)
        {
            checked_ = true;
            ComRef<IVssBackupComponents> backup;
            if (!enableBackupPrivilege())
                logDebug("backup privilege unavailable, using save-hook re-reads");
            else if (FAILED(createBackupComponents(backup)))
                logDebug("shadow copy service unavailable, using save-hook re-reads");
            else
                capable_ = true;
        }
        return capable_;
    }

    FileReadResult readSnapshot(const std::string& path) override
    {
        const std::wstring wide = widen(path);
        FileReadResult direct = openAndRead(wide, FILE_SHARE_READ);
        if (direct.status != FileReadStatus::Locked)
            return direct;
        return readShadowCopy(wide);
    }

    FileReadResult readShared(const std::string& path) override
    {
        return openAndRead(widen(path), kShareAll);
    }

private:
    bool checked_ = false;
    bool capable_ = false;
};

std::unique_ptr<SavedFileReader> createPlatformFileReader()
{
    return std::make_unique<Win32FileReader>();
}

} // namespace SlideBridge

#else // SLIDEBRIDGE_TESTING: stream reader for non-Win32 builds

#include <filesystem>
#include <fstream>
#include <iterator>

namespace SlideBridge
{

class StreamFileReader : public SavedFileReader
{
public:
    bool canBypassLocks() override { return false; }

    FileReadResult readSnapshot(const std::string& path) override { return readShared(path); }

    FileReadResult readShared(const std::string& path) override
    {
        FileReadResult result;
        std::error_code ec;
        if (path.empty() || !std::filesystem::exists(path, ec))
        {
            result.status = FileReadStatus::Missing;
            return result;
        }

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            result.status = FileReadStatus::Failed;
            return result;
        }
        result.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        result.status = in.bad() ? FileReadStatus::Failed : FileReadStatus::Ok;
        return result;
    }
};

std::unique_ptr<SavedFileReader> createPlatformFileReader()
{
    return std::make_unique<StreamFileReader>();
}

} // namespace SlideBridge

#endif // SLIDEBRIDGE_TESTING

namespace SlideBridge
{

const char* toString(FileReadStatus status)
{
    switch (status)
    {
    case FileReadStatus::Ok:      return "ok";
    case FileReadStatus::Locked:  return "locked";
    case FileReadStatus::Missing: return "missing";
    case FileReadStatus::Failed:  return "failed";
    }
    return "failed";
}

} // namespace SlideBridge
