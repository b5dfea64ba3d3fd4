/**
 * @file Database.hpp
 * @brief Serialized access to the engine's SQLite database
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// Third Party Library Includes
#include <sqlite3.h>

namespace bsdmirrors::sync_engine
{
class Statement
{
  public: // Constructors
    Statement(::sqlite3* handle, std::string_view sql);
    Statement(Statement&) = delete;
    Statement(Statement&& other) noexcept;
    auto operator=(Statement&) -> Statement& = delete;
    auto operator=(Statement&&) -> Statement& = delete;

    ~Statement();

  public: // Methods
    // Parameter indices are 1-based, as in sqlite3_bind_*
    auto bind_int64(int index, std::int64_t value) -> Statement&;
    auto bind_text(int index, std::string_view value) -> Statement&;
    auto bind_optional_int64(int index, const std::optional<std::int64_t>& value)
        -> Statement&;
    auto bind_optional_text(int index, const std::optional<std::string>& value)
        -> Statement&;
    auto bind_null(int index) -> Statement&;

    // Returns true while a result row is available
    auto step() -> bool;

    [[nodiscard]]
    auto column_int64(int index) const -> std::int64_t;
    [[nodiscard]]
    auto column_text(int index) const -> std::string;
    [[nodiscard]]
    auto column_optional_int64(int index) const -> std::optional<std::int64_t>;
    [[nodiscard]]
    auto column_optional_text(int index) const -> std::optional<std::string>;

  private: // Methods
    auto check_bind(int result, int index) -> void;

  private: // Members
    ::sqlite3*      m_Handle;
    ::sqlite3_stmt* m_Statement;
};

class Transaction
{
  public: // Constructors
    Transaction(std::mutex& mutex, ::sqlite3* handle);
    Transaction(Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    auto operator=(Transaction&) -> Transaction& = delete;
    auto operator=(Transaction&&) -> Transaction& = delete;

    // Rolls back unless commit() was called
    ~Transaction();

  public: // Methods
    [[nodiscard]]
    auto prepare(std::string_view sql) -> Statement;
    auto execute(std::string_view sql) -> void;
    auto commit() -> void;

    [[nodiscard]]
    auto last_insert_id() const -> std::int64_t;
    [[nodiscard]]
    auto changes() const -> int;

  private: // Members
    std::unique_lock<std::mutex> m_Lock;
    ::sqlite3*                   m_Handle;
    bool                         m_Finished;
};

class Database
{
  public: // Constructors
    // `:memory:` opens a private in-memory database
    explicit Database(const std::filesystem::path& file);
    Database(Database&) = delete;
    Database(Database&&) = delete;
    auto operator=(Database&) -> Database& = delete;
    auto operator=(Database&&) -> Database& = delete;

    ~Database();

  public: // Methods
    // Blocks until no other transaction is open on this connection
    [[nodiscard]]
    auto begin() -> Transaction;

  private: // Methods
    auto create_schema() -> void;

  private: // Members
    ::sqlite3* m_Handle;
    std::mutex m_Mutex;
};
} // namespace bsdmirrors::sync_engine
