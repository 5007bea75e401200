// =============================================================================
// SlideBridge - SettingsManager
// Config persistence and thread-safe snapshots.
//
// JSON load/save with per-field range validation, atomic snapshot
// distribution, observer notification.
// =============================================================================

#include "slidebridge/support/SettingsManager.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace SlideBridge
{

using json = nlohmann::json;

// ─── Config Path ─────────────────────────────────────────────────────────────

std::string SettingsManager::getDefaultConfigPath()
{
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (!appdata || appdata[0] == '\0')
        return {};
    return std::string(appdata) + "\\SlideBridge\\config.json";
#else
    // Non-Windows fallback (for testing on Linux)
    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0')
        return {};
    return std::string(home) + "/.slidebridge/config.json";
#endif
}

// ─── Load ────────────────────────────────────────────────────────────────────

bool SettingsManager::loadFromFile(const char* path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return false;

    // Parse with no-throw mode: corrupt -> return false, defaults stay
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return false;

    SettingsSnapshot settings; // Start from defaults

    // ── Integer fields ──
    auto readInt = [&](const char* key, int& target, int lo, int hi) {
        if (j.contains(key) && j[key].is_number_integer())
        {
            int v = j[key].get<int>();
            if (v >= lo && v <= hi)
                target = v;
        }
    };

    readInt("pumpWaitMs", settings.pumpWaitMs, 1, 1000);
    readInt("shutdownTimeoutMs", settings.shutdownTimeoutMs, 100, 30000);
    readInt("livenessProbeMs", settings.livenessProbeMs, 100, 60000);
    readInt("subscriptionStaleMs", settings.subscriptionStaleMs, 1000, 600000);
    readInt("resolutionRefreshMs", settings.resolutionRefreshMs, 1000, 3600000);
    readInt("saveRereadDelayMs", settings.saveRereadDelayMs, 0, 60000);
    readInt("fileRetryAttempts", settings.fileRetryAttempts, 1, 20);
    readInt("fileRetryBackoffMs", settings.fileRetryBackoffMs, 10, 10000);
    readInt("logLevel", settings.logLevel, 0, 2);

    // ── Float fields ──
    auto readFloat = [&](const char* key, float& target, float lo, float hi) {
        if (j.contains(key) && j[key].is_number())
        {
            float v = j[key].get<float>();
            if (v >= lo && v <= hi)
                target = v;
        }
    };

    readFloat("strongMatchThreshold", settings.strongMatchThreshold, 0.5f, 1.0f);
    readFloat("weakMatchThreshold", settings.weakMatchThreshold, 0.5f, 1.0f);

    // ── Cross-validation: weak must not exceed strong ──
    if (settings.weakMatchThreshold > settings.strongMatchThreshold)
    {
        settings.strongMatchThreshold = 0.85f;
        settings.weakMatchThreshold = 0.70f;
    }

    // ── Boolean fields ──
    auto readBool = [&](const char* key, bool& target) {
        if (j.contains(key) && j[key].is_boolean())
            target = j[key].get<bool>();
    };

    readBool("announceMentions", settings.announceMentions);
    readBool("ensureNormalView", settings.ensureNormalView);

    // ── String fields ──
    auto readString = [&](const char* key, std::string& target) {
        if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty())
            target = j[key].get<std::string>();
    };

    readString("commentsPaneCommand", settings.commentsPaneCommand);

    // ── String arrays: non-string entries are dropped ──
    auto readStringArray = [&](const char* key, std::vector<std::string>& target, bool allowEmpty) {
        if (!j.contains(key) || !j[key].is_array())
            return;
        std::vector<std::string> values;
        for (const auto& item : j[key])
        {
            if (item.is_string() && !item.get<std::string>().empty())
                values.push_back(item.get<std::string>());
        }
        if (!values.empty() || allowEmpty)
            target = std::move(values);
    };

    readStringArray("userIdentities", settings.userIdentities, true);
    readStringArray("commentsPaneAutomationIds", settings.commentsPaneAutomationIds, false);

    // Freeze as const and atomic swap + version bump
    auto snap = std::make_shared<const SettingsSnapshot>(settings);
    std::atomic_store(&current_, snap);
    version_.fetch_add(1, std::memory_order_release);

    for (auto& obs : observers_)
        obs.cb(*snap, obs.userData);

    return true;
}

// ─── Save ────────────────────────────────────────────────────────────────────

bool SettingsManager::saveToFile(const char* path) const
{
    auto snap = snapshot();

    json j;
    j["pumpWaitMs"]                = snap->pumpWaitMs;
    j["shutdownTimeoutMs"]         = snap->shutdownTimeoutMs;
    j["livenessProbeMs"]           = snap->livenessProbeMs;
    j["subscriptionStaleMs"]       = snap->subscriptionStaleMs;
    j["resolutionRefreshMs"]       = snap->resolutionRefreshMs;
    j["saveRereadDelayMs"]         = snap->saveRereadDelayMs;
    j["fileRetryAttempts"]         = snap->fileRetryAttempts;
    j["fileRetryBackoffMs"]        = snap->fileRetryBackoffMs;
    j["strongMatchThreshold"]      = snap->strongMatchThreshold;
    j["weakMatchThreshold"]        = snap->weakMatchThreshold;
    j["userIdentities"]            = snap->userIdentities;
    j["announceMentions"]          = snap->announceMentions;
    j["ensureNormalView"]          = snap->ensureNormalView;
    j["commentsPaneAutomationIds"] = snap->commentsPaneAutomationIds;
    j["commentsPaneCommand"]       = snap->commentsPaneCommand;
    j["logLevel"]                  = snap->logLevel;

    std::error_code ec;
    std::filesystem::path p(path);
    std::filesystem::create_directories(p.parent_path(), ec);
    // Ignore ec - directory may already exist or path may be a bare filename

    std::ofstream file(path);
    if (!file.is_open())
        return false;

    file << j.dump(4);
    return file.good();
}

// ─── Snapshot Access ─────────────────────────────────────────────────────────

std::shared_ptr<const SettingsSnapshot> SettingsManager::snapshot() const
{
    return std::atomic_load(&current_);
}

// ─── Apply ───────────────────────────────────────────────────────────────────

void SettingsManager::applySnapshot(const SettingsSnapshot& newSettings)
{
    auto snap = std::make_shared<const SettingsSnapshot>(newSettings);
    std::atomic_store(&current_, snap);
    version_.fetch_add(1, std::memory_order_release);

    for (auto& obs : observers_)
        obs.cb(newSettings, obs.userData);
}

// ─── Version ─────────────────────────────────────────────────────────────────

uint64_t SettingsManager::version() const
{
    return version_.load(std::memory_order_acquire);
}

// ─── Observer ────────────────────────────────────────────────────────────────

void SettingsManager::addObserver(ChangeCallback cb, void* userData)
{
    observers_.push_back({cb, userData});
}

} // namespace SlideBridge
