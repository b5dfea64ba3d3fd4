/**
 * @file OutputBuffer.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/OutputBuffer.hpp>

// Standard Library Includes
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bsdmirrors::sync_engine
{
OutputBuffer::OutputBuffer(const std::size_t capacity)
    : m_Storage(capacity),
      m_Start(0),
      m_Size(0),
      m_Evicted(0)
{
    if (capacity == 0)
    {
        throw std::invalid_argument("Output buffer capacity must be non-zero");
    }
}

auto OutputBuffer::append(std::string_view data) -> void
{
    const std::size_t capacity = m_Storage.size();

    // Only the last `capacity` bytes of an oversized write can survive
    if (data.size() > capacity)
    {
        m_Evicted += m_Size + (data.size() - capacity);
        data.remove_prefix(data.size() - capacity);
        m_Start = 0;
        m_Size  = 0;
    }

    for (const char byte : data)
    {
        if (m_Size == capacity)
        {
            m_Start = (m_Start + 1) % capacity;
            --m_Size;
            ++m_Evicted;
        }

        m_Storage[(m_Start + m_Size) % capacity] = byte;
        ++m_Size;
    }
}

auto OutputBuffer::contents() const -> std::string
{
    std::string result;
    result.reserve(m_Size);

    const std::size_t firstChunk = std::min(m_Size, m_Storage.size() - m_Start);

    result.append(m_Storage.data() + m_Start, firstChunk);
    result.append(m_Storage.data(), m_Size - firstChunk);

    return result;
}

auto OutputBuffer::tail_lines(const std::size_t count) const -> std::string
{
    if (count == 0)
    {
        return {};
    }

    std::string text = this->contents();

    while (!text.empty() && text.back() == '\n')
    {
        text.pop_back();
    }

    std::size_t start = text.size();
    for (std::size_t found = 0; found < count && start != 0; ++found)
    {
        const auto newline = text.rfind('\n', start - 1);

        if (newline == std::string::npos)
        {
            start = 0;
            break;
        }

        start = (found + 1 == count ? newline + 1 : newline);
    }

    return text.substr(start);
}
} // namespace bsdmirrors::sync_engine
