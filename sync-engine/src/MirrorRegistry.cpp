/**
 * @file MirrorRegistry.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/MirrorRegistry.hpp>

// Standard Library Includes
#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Third Party Library Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
constexpr std::string_view TARGET_COLUMNS
    = "id, name, kind, upstream_url, local_path, password_file, enabled, "
      "status, last_sync_started, last_sync_completed, last_sync_error, "
      "total_size_bytes, file_count";

constexpr std::size_t MAX_UPSTREAM_URL_LENGTH = 500;

auto optional_timestamp(const std::optional<std::int64_t>& millis)
    -> std::optional<Timestamp>
{
    if (!millis.has_value())
    {
        return std::nullopt;
    }

    return from_unix_millis(*millis);
}

auto read_target(const Statement& row) -> MirrorTarget
{
    return MirrorTarget {
        .id                = row.column_int64(0),
        .name              = row.column_text(1),
        .kind              = row.column_text(2),
        .upstreamUrl       = row.column_text(3),
        .localPath         = row.column_text(4),
        .passwordFile      = row.column_optional_text(5),
        .enabled           = row.column_int64(6) != 0,
        .status            = target_status_from_string(row.column_text(7)),
        .lastSyncStarted   = optional_timestamp(row.column_optional_int64(8)),
        .lastSyncCompleted = optional_timestamp(row.column_optional_int64(9)),
        .lastSyncError     = row.column_optional_text(10),
        .totalSizeBytes    = row.column_optional_int64(11),
        .fileCount         = row.column_optional_int64(12),
    };
}

auto select_target(Transaction& transaction, const TargetId id)
    -> std::optional<MirrorTarget>
{
    auto select = transaction.prepare(
        std::format("SELECT {} FROM mirrors WHERE id = ?", TARGET_COLUMNS)
    );
    select.bind_int64(1, id);

    if (!select.step())
    {
        return std::nullopt;
    }

    return read_target(select);
}
} // namespace

MirrorRegistry::MirrorRegistry(Database& database)
    : m_Database(database)
{
}

auto MirrorRegistry::validate_upstream_url(std::string_view url) -> void
{
    const bool knownScheme = url.starts_with("rsync://")
                          || url.starts_with("http://")
                          || url.starts_with("https://");

    if (!knownScheme)
    {
        throw validation_error(
            "upstream_url must start with rsync://, http://, or https://"
        );
    }

    if (url.size() > MAX_UPSTREAM_URL_LENGTH)
    {
        throw validation_error(
            std::format(
                "upstream_url must be {} characters or fewer",
                MAX_UPSTREAM_URL_LENGTH
            )
        );
    }
}

auto MirrorRegistry::register_target(const TargetDefinition& definition)
    -> MirrorTarget
{
    if (definition.name.empty() || definition.localPath.empty())
    {
        throw validation_error("A mirror needs a name and a local path");
    }

    MirrorRegistry::validate_upstream_url(definition.upstreamUrl);

    auto transaction = m_Database.begin();

    {
        auto insert = transaction.prepare(
            "INSERT INTO mirrors "
            "(name, kind, upstream_url, local_path, password_file, enabled, status) "
            "VALUES (?, ?, ?, ?, ?, ?, ?) ON CONFLICT (name) DO NOTHING"
        );
        insert.bind_text(1, definition.name)
            .bind_text(2, definition.kind)
            .bind_text(3, definition.upstreamUrl)
            .bind_text(4, definition.localPath)
            .bind_optional_text(5, definition.passwordFile)
            .bind_int64(6, definition.enabled ? 1 : 0)
            .bind_text(
                7,
                to_string(
                    definition.enabled ? TargetStatus::ACTIVE
                                       : TargetStatus::DISABLED
                )
            );
        insert.step();

        if (transaction.changes() > 0)
        {
            spdlog::info(
                "Registered mirror {} ({} -> {})",
                definition.name,
                definition.upstreamUrl,
                definition.localPath
            );
        }
    }

    std::optional<MirrorTarget> target;
    {
        auto select = transaction.prepare(
            std::format("SELECT {} FROM mirrors WHERE name = ?", TARGET_COLUMNS)
        );
        select.bind_text(1, definition.name);

        if (!select.step())
        {
            throw database_error(
                std::format("Mirror {} vanished while registering", definition.name)
            );
        }

        target = read_target(select);
    }

    transaction.commit();

    return *target;
}

auto MirrorRegistry::list_targets() const -> std::vector<MirrorTarget>
{
    auto transaction = m_Database.begin();
    auto select      = transaction.prepare(
        std::format("SELECT {} FROM mirrors ORDER BY name", TARGET_COLUMNS)
    );

    std::vector<MirrorTarget> targets;
    while (select.step())
    {
        targets.emplace_back(read_target(select));
    }

    return targets;
}

auto MirrorRegistry::get_target(const TargetId id) const -> MirrorTarget
{
    auto transaction = m_Database.begin();
    auto target      = select_target(transaction, id);

    if (!target.has_value())
    {
        throw target_not_found(std::format("Mirror {} not found", id));
    }

    return *target;
}

auto MirrorRegistry::find_target(std::string_view name) const
    -> std::optional<MirrorTarget>
{
    auto transaction = m_Database.begin();
    auto select      = transaction.prepare(
        std::format("SELECT {} FROM mirrors WHERE name = ?", TARGET_COLUMNS)
    );
    select.bind_text(1, name);

    if (!select.step())
    {
        return std::nullopt;
    }

    return read_target(select);
}

auto MirrorRegistry::apply_update(const TargetId id, const TargetUpdate& update)
    -> MirrorTarget
{
    if (update.upstreamUrl.has_value())
    {
        MirrorRegistry::validate_upstream_url(*update.upstreamUrl);
    }

    auto transaction = m_Database.begin();

    if (!select_target(transaction, id).has_value())
    {
        throw target_not_found(std::format("Mirror {} not found", id));
    }

    if (update.upstreamUrl.has_value())
    {
        auto statement = transaction.prepare(
            "UPDATE mirrors SET upstream_url = ? WHERE id = ?"
        );
        statement.bind_text(1, *update.upstreamUrl).bind_int64(2, id);
        statement.step();
    }

    if (update.enabled.has_value())
    {
        // A running sync keeps `syncing`; its release settles the status
        auto statement = transaction.prepare(
            "UPDATE mirrors SET enabled = ?1, status = CASE "
            "WHEN status = 'syncing' THEN status "
            "WHEN ?1 = 0 THEN 'disabled' "
            "WHEN status = 'disabled' THEN 'active' "
            "ELSE status END "
            "WHERE id = ?2"
        );
        statement.bind_int64(1, *update.enabled ? 1 : 0).bind_int64(2, id);
        statement.step();
    }

    auto target = select_target(transaction, id);
    transaction.commit();

    return *target;
}

auto MirrorRegistry::remove_target(const TargetId id) -> void
{
    auto transaction = m_Database.begin();

    {
        auto statement = transaction.prepare("DELETE FROM mirrors WHERE id = ?");
        statement.bind_int64(1, id);
        statement.step();
    }

    if (transaction.changes() == 0)
    {
        throw target_not_found(std::format("Mirror {} not found", id));
    }

    transaction.commit();
    spdlog::info("Removed mirror {}", id);
}

auto MirrorRegistry::recover_interrupted(std::string_view message) -> std::size_t
{
    auto transaction = m_Database.begin();

    {
        auto statement = transaction.prepare(
            "UPDATE mirrors SET "
            "status = CASE WHEN enabled = 0 THEN 'disabled' ELSE 'error' END, "
            "last_sync_error = ? "
            "WHERE status = 'syncing'"
        );
        statement.bind_text(1, message);
        statement.step();
    }

    const auto recovered = static_cast<std::size_t>(transaction.changes());
    transaction.commit();

    return recovered;
}

auto MirrorRegistry::mark_syncing(const TargetId id, const Timestamp startedAt)
    -> bool
{
    auto transaction = m_Database.begin();

    if (!select_target(transaction, id).has_value())
    {
        throw target_not_found(std::format("Mirror {} not found", id));
    }

    {
        auto statement = transaction.prepare(
            "UPDATE mirrors SET status = 'syncing', last_sync_started = ? "
            "WHERE id = ? AND enabled = 1"
        );
        statement.bind_int64(1, to_unix_millis(startedAt)).bind_int64(2, id);
        statement.step();
    }

    const bool marked = transaction.changes() > 0;
    transaction.commit();

    return marked;
}

auto MirrorRegistry::mark_finished(const TargetId id, const SyncOutcome& outcome)
    -> TargetStatus
{
    auto transaction = m_Database.begin();

    const auto target = select_target(transaction, id);
    if (!target.has_value())
    {
        throw target_not_found(std::format("Mirror {} not found", id));
    }

    TargetStatus finalStatus = TargetStatus::ERROR;
    if (!target->enabled)
    {
        finalStatus = TargetStatus::DISABLED;
    }
    else if (outcome.succeeded)
    {
        finalStatus = TargetStatus::ACTIVE;
    }

    {
        auto statement = transaction.prepare(
            "UPDATE mirrors SET status = ?1, "
            "last_sync_completed = CASE WHEN ?2 THEN ?3 ELSE last_sync_completed END, "
            "last_sync_error = CASE WHEN ?2 THEN NULL ELSE ?4 END, "
            "total_size_bytes = COALESCE(?5, total_size_bytes), "
            "file_count = COALESCE(?6, file_count) "
            "WHERE id = ?7"
        );
        statement.bind_text(1, to_string(finalStatus))
            .bind_int64(2, outcome.succeeded ? 1 : 0)
            .bind_int64(3, to_unix_millis(outcome.finishedAt))
            .bind_optional_text(4, outcome.error)
            .bind_optional_int64(5, outcome.succeeded ? outcome.totalSizeBytes : std::nullopt)
            .bind_optional_int64(6, outcome.succeeded ? outcome.fileCount : std::nullopt)
            .bind_int64(7, id);
        statement.step();
    }

    transaction.commit();

    return finalStatus;
}
} // namespace bsdmirrors::sync_engine
