#pragma once
// =============================================================================
// SlideBridge - SettingsManager
// Loads, validates, saves config.json. Thread-safe snapshot model.
// =============================================================================

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace SlideBridge
{

struct SettingsSnapshot
{
    // Worker loop
    int     pumpWaitMs            = 50;     // bounded message-pump wait per cycle
    int     shutdownTimeoutMs     = 3000;
    int     livenessProbeMs       = 2000;
    int     subscriptionStaleMs   = 10000;  // silence before an event-gap check

    // Resolution-status reads
    int     resolutionRefreshMs   = 30000;
    int     saveRereadDelayMs     = 1500;
    int     fileRetryAttempts     = 5;
    int     fileRetryBackoffMs    = 250;

    // Mention matching
    float   strongMatchThreshold  = 0.85f;
    float   weakMatchThreshold    = 0.70f;
    std::vector<std::string> userIdentities;
    bool    announceMentions      = true;

    // Application behavior
    bool    ensureNormalView      = true;
    std::vector<std::string> commentsPaneAutomationIds{"CommentsPane", "NewCommentsPane"};
    std::string commentsPaneCommand = "ReviewShowComments";

    int     logLevel              = 1;      // 0=debug, 1=warning, 2=error
};

class SettingsManager
{
public:
    // Load settings from JSON file. Returns false on missing/corrupt file
    // (defaults remain in effect). Call snapshot() to read values.
    bool loadFromFile(const char* path);

    // Save current settings to JSON file. Creates parent directories if needed.
    bool saveToFile(const char* path) const;

    // Thread-safe snapshot read - no locks. Uses std::atomic_load on shared_ptr.
    std::shared_ptr<const SettingsSnapshot> snapshot() const;

    // Apply a modified snapshot: atomic-swaps, bumps version, notifies observers.
    void applySnapshot(const SettingsSnapshot& newSettings);

    // Default config file path: %AppData%\SlideBridge\config.json (or $HOME on non-Windows)
    static std::string getDefaultConfigPath();

    // Observer pattern (host thread only, low-frequency).
    // Called synchronously during applySnapshot() and loadFromFile().
    using ChangeCallback = void(*)(const SettingsSnapshot&, void* userData);
    void addObserver(ChangeCallback cb, void* userData);

    // Version counter - the worker compares this once per cycle.
    uint64_t version() const;

private:
    std::shared_ptr<const SettingsSnapshot> current_ = std::make_shared<SettingsSnapshot>();
    std::atomic<uint64_t> version_{0};

    struct Observer { ChangeCallback cb; void* userData; };
    std::vector<Observer> observers_;
};

} // namespace SlideBridge
