/**
 * @file SettingsStore.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/SettingsStore.hpp>

// Standard Library Includes
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

// Third Party Library Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <bsdmirrors/sync_engine/CronExpression.hpp>
#include <bsdmirrors/sync_engine/Errors.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
constexpr std::int64_t MIN_TIMEOUT_SECONDS = 1;
constexpr std::int64_t MAX_TIMEOUT_SECONDS = 7 * 24 * 60 * 60;

auto trim(std::string_view value) -> std::string_view
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
    {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
    {
        value.remove_suffix(1);
    }
    return value;
}

auto parse_integer(std::string_view key, std::string_view value) -> std::int64_t
{
    value = trim(value);

    std::int64_t number = 0;
    const auto [end, error]
        = std::from_chars(value.data(), value.data() + value.size(), number);

    if (value.empty() || error != std::errc {}
        || end != value.data() + value.size())
    {
        throw validation_error(
            std::format("{} must be an integer, got `{}`", key, value)
        );
    }

    return number;
}

auto normalize_schedule(std::string_view value) -> std::string
{
    const auto cron = CronExpression::parse(value);

    if (!cron.next_after(std::chrono::system_clock::now()).has_value())
    {
        throw validation_error(
            std::format("Cron expression `{}` never fires", cron.text())
        );
    }

    return cron.text();
}

auto normalize_bandwidth_limit(std::string_view value) -> std::string
{
    const auto limit = parse_integer(setting_keys::SYNC_BANDWIDTH_LIMIT, value);

    if (limit < 0)
    {
        throw validation_error(
            std::format("{} must not be negative", setting_keys::SYNC_BANDWIDTH_LIMIT)
        );
    }

    return std::to_string(limit);
}

auto normalize_timeout(std::string_view value) -> std::string
{
    const auto timeout = parse_integer(setting_keys::SYNC_TIMEOUT, value);

    if (timeout < MIN_TIMEOUT_SECONDS || timeout > MAX_TIMEOUT_SECONDS)
    {
        throw validation_error(
            std::format(
                "{} must be between {} and {} seconds",
                setting_keys::SYNC_TIMEOUT,
                MIN_TIMEOUT_SECONDS,
                MAX_TIMEOUT_SECONDS
            )
        );
    }

    return std::to_string(timeout);
}

auto normalize_boolean(std::string_view value) -> std::string
{
    std::string lowered(trim(value));
    std::ranges::transform(
        lowered,
        lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); }
    );

    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1")
    {
        return "true";
    }

    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0")
    {
        return "false";
    }

    throw validation_error(
        std::format("{} must be a boolean, got `{}`", setting_keys::SYNC_ON_STARTUP, value)
    );
}

struct SettingDefinition
{
    std::string_view key;
    std::string_view defaultValue;
    std::string_view description;
    auto (*normalize)(std::string_view) -> std::string;
};

constexpr std::array<SettingDefinition, 4> DEFINITIONS = { {
    { setting_keys::SYNC_SCHEDULE,
      "0 4 * * *",
      "Cron expression for scheduled mirror syncs",
      &normalize_schedule },
    { setting_keys::SYNC_BANDWIDTH_LIMIT,
      "0",
      "Bandwidth limit for rsync in KiB/s (0 = unlimited)",
      &normalize_bandwidth_limit },
    { setting_keys::SYNC_TIMEOUT,
      "21600",
      "Maximum duration of a single sync in seconds",
      &normalize_timeout },
    { setting_keys::SYNC_ON_STARTUP,
      "false",
      "Sync every enabled mirror when the engine starts",
      &normalize_boolean },
} };

auto find_definition(std::string_view key) -> const SettingDefinition&
{
    const auto definition = std::ranges::find(DEFINITIONS, key, &SettingDefinition::key);

    if (definition == DEFINITIONS.end())
    {
        throw validation_error(std::format("Unknown setting `{}`", key));
    }

    return *definition;
}
} // namespace

SettingsStore::SettingsStore(Database& database, const SettingMap& seeds)
    : m_Database(database)
{
    this->load(seeds);
}

auto SettingsStore::validate(std::string_view key, std::string_view value)
    -> std::string
{
    return find_definition(key).normalize(value);
}

auto SettingsStore::load(const SettingMap& seeds) -> void
{
    auto transaction = m_Database.begin();

    {
        auto select = transaction.prepare(
            "SELECT key, value, description, updated_at FROM settings"
        );

        while (select.step())
        {
            Setting setting { .key         = select.column_text(0),
                              .value       = select.column_text(1),
                              .description = select.column_text(2),
                              .updatedAt
                              = from_unix_millis(select.column_int64(3)) };

            m_Settings.emplace(setting.key, std::move(setting));
        }
    }

    for (const auto& definition : DEFINITIONS)
    {
        if (const auto stored = m_Settings.find(definition.key);
            stored != m_Settings.end())
        {
            try
            {
                stored->second.value = definition.normalize(stored->second.value);
            }
            catch (validation_error& ve)
            {
                throw config_error(
                    std::format("Stored value of {} is invalid: {}", definition.key, ve.what())
                );
            }

            continue;
        }

        std::string value(definition.defaultValue);

        if (const auto seed = seeds.find(definition.key); seed != seeds.end())
        {
            try
            {
                value = definition.normalize(seed->second);
            }
            catch (validation_error& ve)
            {
                throw config_error(
                    std::format("Invalid initial value for {}: {}", definition.key, ve.what())
                );
            }
        }

        Setting setting { .key         = std::string(definition.key),
                          .value       = std::move(value),
                          .description = std::string(definition.description),
                          .updatedAt   = now() };

        auto insert = transaction.prepare(
            "INSERT INTO settings (key, value, description, updated_at) "
            "VALUES (?, ?, ?, ?)"
        );
        insert.bind_text(1, setting.key)
            .bind_text(2, setting.value)
            .bind_text(3, setting.description)
            .bind_int64(4, to_unix_millis(setting.updatedAt));
        insert.step();

        spdlog::info("Initialized setting {} = \"{}\"", setting.key, setting.value);
        m_Settings.emplace(setting.key, std::move(setting));
    }

    transaction.commit();
}

auto SettingsStore::get(std::string_view key) const -> std::string
{
    const auto& definition = find_definition(key);

    const std::lock_guard<std::mutex> lock(m_Mutex);

    if (const auto setting = m_Settings.find(key); setting != m_Settings.end())
    {
        return setting->second.value;
    }

    return std::string(definition.defaultValue);
}

auto SettingsStore::set(std::string_view key, std::string_view value) -> Setting
{
    this->update({ { std::string(key), std::string(value) } });

    const std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Settings.at(std::string(key));
}

auto SettingsStore::update(const SettingMap& values) -> std::vector<Setting>
{
    const auto timestamp = now();

    std::vector<Setting> changed;
    changed.reserve(values.size());

    for (const auto& [key, value] : values)
    {
        const auto& definition = find_definition(key);

        changed.emplace_back(
            Setting { .key         = key,
                      .value       = definition.normalize(value),
                      .description = std::string(definition.description),
                      .updatedAt   = timestamp }
        );
    }

    {
        const std::lock_guard<std::mutex> lock(m_Mutex);

        this->write(changed);

        for (auto& setting : changed)
        {
            spdlog::info(
                "Setting {} changed from \"{}\" to \"{}\"",
                setting.key,
                m_Settings.at(setting.key).value,
                setting.value
            );
            m_Settings.insert_or_assign(setting.key, setting);
        }
    }

    return this->list();
}

auto SettingsStore::write(const std::vector<Setting>& settings) -> void
{
    auto transaction = m_Database.begin();

    for (const auto& setting : settings)
    {
        auto upsert = transaction.prepare(
            "INSERT INTO settings (key, value, description, updated_at) "
            "VALUES (?1, ?2, ?3, ?4) "
            "ON CONFLICT (key) DO UPDATE SET value = ?2, updated_at = ?4"
        );
        upsert.bind_text(1, setting.key)
            .bind_text(2, setting.value)
            .bind_text(3, setting.description)
            .bind_int64(4, to_unix_millis(setting.updatedAt));
        upsert.step();
    }

    transaction.commit();
}

auto SettingsStore::list() const -> std::vector<Setting>
{
    const std::lock_guard<std::mutex> lock(m_Mutex);

    std::vector<Setting> settings;
    settings.reserve(m_Settings.size());

    for (const auto& [key, setting] : m_Settings)
    {
        settings.emplace_back(setting);
    }

    return settings;
}

auto SettingsStore::snapshot() const -> SyncSettings
{
    const std::lock_guard<std::mutex> lock(m_Mutex);

    const auto value = [this](std::string_view key) -> const std::string&
    { return m_Settings.at(std::string(key)).value; };

    return SyncSettings {
        .schedule       = value(setting_keys::SYNC_SCHEDULE),
        .bandwidthLimit = std::stoll(value(setting_keys::SYNC_BANDWIDTH_LIMIT)),
        .timeout
        = std::chrono::seconds(std::stoll(value(setting_keys::SYNC_TIMEOUT))),
        .syncOnStartup = value(setting_keys::SYNC_ON_STARTUP) == "true",
    };
}
} // namespace bsdmirrors::sync_engine
