/**
 * @file Database.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/Database.hpp>

// Standard Library Includes
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

// Third Party Library Includes
#include <spdlog/spdlog.h>
#include <sqlite3.h>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
constexpr std::string_view SCHEMA = R"sql(
CREATE TABLE IF NOT EXISTS mirrors (
    id                  INTEGER PRIMARY KEY AUTOINCREMENT,
    name                TEXT    NOT NULL UNIQUE,
    kind                TEXT    NOT NULL,
    upstream_url        TEXT    NOT NULL,
    local_path          TEXT    NOT NULL,
    password_file       TEXT,
    enabled             INTEGER NOT NULL DEFAULT 1,
    status              TEXT    NOT NULL DEFAULT 'active',
    last_sync_started   INTEGER,
    last_sync_completed INTEGER,
    last_sync_error     TEXT,
    total_size_bytes    INTEGER,
    file_count          INTEGER
);

CREATE TABLE IF NOT EXISTS sync_jobs (
    id                INTEGER PRIMARY KEY AUTOINCREMENT,
    mirror_id         INTEGER NOT NULL REFERENCES mirrors(id) ON DELETE CASCADE,
    status            TEXT    NOT NULL DEFAULT 'pending',
    triggered_by      TEXT    NOT NULL,
    created_at        INTEGER NOT NULL,
    started_at        INTEGER,
    completed_at      INTEGER,
    files_transferred INTEGER,
    bytes_transferred INTEGER,
    files_deleted     INTEGER,
    exit_code         INTEGER,
    failure_kind      TEXT,
    output            TEXT    NOT NULL DEFAULT '',
    error_message     TEXT
);

CREATE INDEX IF NOT EXISTS sync_jobs_by_mirror ON sync_jobs (mirror_id, id);

CREATE TABLE IF NOT EXISTS settings (
    key         TEXT    PRIMARY KEY,
    value       TEXT    NOT NULL,
    description TEXT    NOT NULL,
    updated_at  INTEGER NOT NULL
);
)sql";

auto error_message(::sqlite3* handle) -> std::string
{
    return (handle != nullptr ? ::sqlite3_errmsg(handle) : "out of memory");
}

auto exec(::sqlite3* handle, std::string_view sql) -> void
{
    char*           rawError = nullptr;
    const std::string statement(sql);

    if (::sqlite3_exec(handle, statement.c_str(), nullptr, nullptr, &rawError)
        != SQLITE_OK)
    {
        std::string message = (rawError != nullptr ? rawError : "unknown error");
        ::sqlite3_free(rawError);

        throw database_error(
            std::format("Failed to execute `{}`: {}", statement, message)
        );
    }
}
} // namespace

Statement::Statement(::sqlite3* handle, std::string_view sql)
    : m_Handle(handle),
      m_Statement(nullptr)
{
    const int result = ::sqlite3_prepare_v2(
        m_Handle,
        sql.data(),
        static_cast<int>(sql.size()),
        &m_Statement,
        nullptr
    );

    if (result != SQLITE_OK)
    {
        throw database_error(
            std::format(
                "Failed to prepare `{}`: {}",
                sql,
                error_message(m_Handle)
            )
        );
    }
}

Statement::Statement(Statement&& other) noexcept
    : m_Handle(other.m_Handle),
      m_Statement(other.m_Statement)
{
    other.m_Statement = nullptr;
}

Statement::~Statement()
{
    ::sqlite3_finalize(m_Statement);
}

auto Statement::check_bind(const int result, const int index) -> void
{
    if (result != SQLITE_OK)
    {
        throw database_error(
            std::format(
                "Failed to bind parameter {}: {}",
                index,
                error_message(m_Handle)
            )
        );
    }
}

auto Statement::bind_int64(const int index, const std::int64_t value)
    -> Statement&
{
    this->check_bind(::sqlite3_bind_int64(m_Statement, index, value), index);
    return *this;
}

auto Statement::bind_text(const int index, std::string_view value)
    -> Statement&
{
    this->check_bind(
        ::sqlite3_bind_text(
            m_Statement,
            index,
            value.data(),
            static_cast<int>(value.size()),
            SQLITE_TRANSIENT
        ),
        index
    );
    return *this;
}

auto Statement::bind_optional_int64(
    const int                          index,
    const std::optional<std::int64_t>& value
) -> Statement&
{
    return (value.has_value() ? this->bind_int64(index, *value)
                              : this->bind_null(index));
}

auto Statement::bind_optional_text(
    const int                         index,
    const std::optional<std::string>& value
) -> Statement&
{
    return (value.has_value() ? this->bind_text(index, *value)
                              : this->bind_null(index));
}

auto Statement::bind_null(const int index) -> Statement&
{
    this->check_bind(::sqlite3_bind_null(m_Statement, index), index);
    return *this;
}

auto Statement::step() -> bool
{
    switch (::sqlite3_step(m_Statement))
    {
    case SQLITE_ROW:
        return true;

    case SQLITE_DONE:
        return false;

    default:
        throw database_error(
            std::format(
                "Failed to step `{}`: {}",
                ::sqlite3_sql(m_Statement),
                error_message(m_Handle)
            )
        );
    }
}

auto Statement::column_int64(const int index) const -> std::int64_t
{
    return ::sqlite3_column_int64(m_Statement, index);
}

auto Statement::column_text(const int index) const -> std::string
{
    const auto* text = ::sqlite3_column_text(m_Statement, index);

    if (text == nullptr)
    {
        return {};
    }

    return std::string(
        reinterpret_cast<const char*>(text),
        static_cast<std::size_t>(::sqlite3_column_bytes(m_Statement, index))
    );
}

auto Statement::column_optional_int64(const int index) const
    -> std::optional<std::int64_t>
{
    if (::sqlite3_column_type(m_Statement, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }

    return this->column_int64(index);
}

auto Statement::column_optional_text(const int index) const
    -> std::optional<std::string>
{
    if (::sqlite3_column_type(m_Statement, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }

    return this->column_text(index);
}

Transaction::Transaction(std::mutex& mutex, ::sqlite3* handle)
    : m_Lock(mutex),
      m_Handle(handle),
      m_Finished(false)
{
    exec(m_Handle, "BEGIN IMMEDIATE");
}

Transaction::~Transaction()
{
    if (m_Finished)
    {
        return;
    }

    if (::sqlite3_exec(m_Handle, "ROLLBACK", nullptr, nullptr, nullptr)
        != SQLITE_OK)
    {
        spdlog::error(
            "Failed to roll back transaction: {}",
            error_message(m_Handle)
        );
    }
}

auto Transaction::prepare(std::string_view sql) -> Statement
{
    return { m_Handle, sql };
}

auto Transaction::execute(std::string_view sql) -> void
{
    exec(m_Handle, sql);
}

auto Transaction::commit() -> void
{
    exec(m_Handle, "COMMIT");
    m_Finished = true;
}

auto Transaction::last_insert_id() const -> std::int64_t
{
    return ::sqlite3_last_insert_rowid(m_Handle);
}

auto Transaction::changes() const -> int
{
    return ::sqlite3_changes(m_Handle);
}

Database::Database(const std::filesystem::path& file)
    : m_Handle(nullptr)
{
    if (file != ":memory:" && file.has_parent_path())
    {
        std::error_code error;
        std::filesystem::create_directories(file.parent_path(), error);

        if (error)
        {
            throw database_error(
                std::format(
                    "Failed to create directory for database {}: {}",
                    file.string(),
                    error.message()
                )
            );
        }
    }

    const int result = ::sqlite3_open_v2(
        file.c_str(),
        &m_Handle,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );

    if (result != SQLITE_OK)
    {
        const std::string message = error_message(m_Handle);
        ::sqlite3_close(m_Handle);

        throw database_error(
            std::format("Failed to open database {}: {}", file.string(), message)
        );
    }

    try
    {
        constexpr int BUSY_TIMEOUT_MS = 5000;
        ::sqlite3_busy_timeout(m_Handle, BUSY_TIMEOUT_MS);

        exec(m_Handle, "PRAGMA foreign_keys = ON");
        exec(m_Handle, "PRAGMA journal_mode = WAL");

        this->create_schema();
    }
    catch (database_error&)
    {
        ::sqlite3_close(m_Handle);
        throw;
    }

    spdlog::debug("Opened database {}", file.string());
}

Database::~Database()
{
    if (::sqlite3_close(m_Handle) != SQLITE_OK)
    {
        spdlog::error("Failed to close database: {}", error_message(m_Handle));
    }
}

auto Database::begin() -> Transaction
{
    return { m_Mutex, m_Handle };
}

auto Database::create_schema() -> void
{
    auto transaction = this->begin();
    transaction.execute(SCHEMA);
    transaction.commit();
}
} // namespace bsdmirrors::sync_engine
