/**
 * @file OutputBuffer.hpp
 * @brief Fixed-capacity ring buffer holding the tail of a process' output
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace bsdmirrors::sync_engine
{
// Once full, every append evicts the oldest bytes. Not thread-safe; owned by
// the executor thread supervising the process.
class OutputBuffer
{
  public: // Constructors
    explicit OutputBuffer(std::size_t capacity);

  public: // Methods
    auto append(std::string_view data) -> void;

    [[nodiscard]]
    auto contents() const -> std::string;

    // Up to `count` trailing lines, newline separated, without a trailing
    // newline. A partial final line counts as a line.
    [[nodiscard]]
    auto tail_lines(std::size_t count) const -> std::string;

    [[nodiscard]]
    auto size() const -> std::size_t
    {
        return m_Size;
    }

    [[nodiscard]]
    auto capacity() const -> std::size_t
    {
        return m_Storage.size();
    }

    [[nodiscard]]
    auto evicted() const -> std::size_t
    {
        return m_Evicted;
    }

  private: // Members
    std::vector<char> m_Storage;
    std::size_t       m_Start;
    std::size_t       m_Size;
    std::size_t       m_Evicted;
};
} // namespace bsdmirrors::sync_engine
