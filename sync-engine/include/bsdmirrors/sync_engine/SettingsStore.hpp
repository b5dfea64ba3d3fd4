/**
 * @file SettingsStore.hpp
 * @brief Validated, persisted engine settings
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

// Project Includes
#include <bsdmirrors/sync_engine/Database.hpp>
#include <bsdmirrors/sync_engine/Timestamp.hpp>

namespace bsdmirrors::sync_engine
{
namespace setting_keys
{
constexpr std::string_view SYNC_SCHEDULE        = "sync_schedule";
constexpr std::string_view SYNC_BANDWIDTH_LIMIT = "sync_bandwidth_limit";
constexpr std::string_view SYNC_TIMEOUT         = "sync_timeout";
constexpr std::string_view SYNC_ON_STARTUP      = "sync_on_startup";
} // namespace setting_keys

struct Setting
{
    std::string key;
    std::string value;
    std::string description;
    Timestamp   updatedAt;
};

// Typed view of the settings read by the scheduler and the executor
struct SyncSettings
{
    std::string          schedule;
    // KiB per second, 0 means unlimited
    std::int64_t         bandwidthLimit = 0;
    std::chrono::seconds timeout;
    bool                 syncOnStartup = false;
};

class SettingsStore
{
  public: // Types
    using SettingMap = std::map<std::string, std::string, std::less<>>;

  public: // Constructors
    // Keys missing from the database are created from `seeds` when present,
    // otherwise from their defaults. Stored values are never overwritten.
    explicit SettingsStore(Database& database, const SettingMap& seeds = {});
    SettingsStore(SettingsStore&) = delete;
    SettingsStore(SettingsStore&&) = delete;
    auto operator=(SettingsStore&) -> SettingsStore& = delete;
    auto operator=(SettingsStore&&) -> SettingsStore& = delete;

    ~SettingsStore() = default;

  public: // Methods
    [[nodiscard]]
    auto get(std::string_view key) const -> std::string;

    auto set(std::string_view key, std::string_view value) -> Setting;

    // All or nothing: every entry is validated before anything is written
    auto update(const SettingMap& values) -> std::vector<Setting>;

    // Ordered by key
    [[nodiscard]]
    auto list() const -> std::vector<Setting>;

    [[nodiscard]]
    auto snapshot() const -> SyncSettings;

  public: // Static Methods
    // Returns the normalized form of `value`; throws `validation_error`
    [[nodiscard]]
    static auto validate(std::string_view key, std::string_view value)
        -> std::string;

  private: // Methods
    auto load(const SettingMap& seeds) -> void;
    auto write(const std::vector<Setting>& settings) -> void;

  private: // Members
    Database&                                   m_Database;
    mutable std::mutex                          m_Mutex;
    std::map<std::string, Setting, std::less<>> m_Settings;
};
} // namespace bsdmirrors::sync_engine
