/**
 * @file MirrorRegistry.hpp
 * @brief Persisted catalogue of mirror targets
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Project Includes
#include <bsdmirrors/sync_engine/Database.hpp>
#include <bsdmirrors/sync_engine/MirrorTarget.hpp>
#include <bsdmirrors/sync_engine/Timestamp.hpp>

namespace bsdmirrors::sync_engine
{
// A target as declared in the configuration file
struct TargetDefinition
{
    std::string                name;
    std::string                kind;
    std::string                upstreamUrl;
    std::string                localPath;
    std::optional<std::string> passwordFile;
    bool                       enabled = true;
};

// What a finished sync reports back to its target
struct SyncOutcome
{
    bool                        succeeded = false;
    Timestamp                   finishedAt;
    std::optional<std::int64_t> totalSizeBytes;
    std::optional<std::int64_t> fileCount;
    std::optional<std::string>  error;
};

class MirrorLockManager;

class MirrorRegistry
{
  public: // Constructors
    explicit MirrorRegistry(Database& database);
    MirrorRegistry(MirrorRegistry&) = delete;
    MirrorRegistry(MirrorRegistry&&) = delete;
    auto operator=(MirrorRegistry&) -> MirrorRegistry& = delete;
    auto operator=(MirrorRegistry&&) -> MirrorRegistry& = delete;

    ~MirrorRegistry() = default;

  public: // Methods
    // Inserts the target unless one with the same name exists. Existing rows
    // keep their administrative edits.
    auto register_target(const TargetDefinition& definition) -> MirrorTarget;

    [[nodiscard]]
    auto list_targets() const -> std::vector<MirrorTarget>;

    // Throws `target_not_found`
    [[nodiscard]]
    auto get_target(TargetId id) const -> MirrorTarget;

    [[nodiscard]]
    auto find_target(std::string_view name) const -> std::optional<MirrorTarget>;

    // Callers must make sure no sync is using the fields being changed
    auto apply_update(TargetId id, const TargetUpdate& update) -> MirrorTarget;

    auto remove_target(TargetId id) -> void;

    // Resets targets left `syncing` by a previous process. Returns how many.
    auto recover_interrupted(std::string_view message) -> std::size_t;

  public: // Static Methods
    // rsync://, http:// or https://, at most 500 characters
    static auto validate_upstream_url(std::string_view url) -> void;

  private: // Methods
    // Only the lock manager moves a target into and out of `syncing`
    friend class MirrorLockManager;

    // False when the target is disabled; throws `target_not_found`
    auto mark_syncing(TargetId id, Timestamp startedAt) -> bool;
    auto mark_finished(TargetId id, const SyncOutcome& outcome) -> TargetStatus;

  private: // Members
    Database& m_Database;
};
} // namespace bsdmirrors::sync_engine
