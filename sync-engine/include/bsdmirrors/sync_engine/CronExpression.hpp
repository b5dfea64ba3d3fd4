/**
 * @file CronExpression.hpp
 * @brief Five-field cron schedule evaluated in UTC
 */

#pragma once

// Standard Library Includes
#include <bitset>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace bsdmirrors::sync_engine
{
class CronExpression
{
  public: // Constructors
    // Accepts `minute hour day-of-month month day-of-week` with `*`, lists,
    // ranges, steps and month/day names, or one of the `@daily` style macros.
    // Throws `validation_error` on malformed input.
    [[nodiscard]]
    static auto parse(std::string_view expression) -> CronExpression;

  public: // Methods
    [[nodiscard]]
    auto matches(std::chrono::system_clock::time_point time) const -> bool;

    // First whole minute strictly after `time` that matches. Empty when the
    // expression cannot fire within the next five years (e.g. `0 0 30 2 *`).
    [[nodiscard]]
    auto next_after(std::chrono::system_clock::time_point time) const
        -> std::optional<std::chrono::system_clock::time_point>;

    [[nodiscard]]
    auto text() const -> const std::string&
    {
        return m_Text;
    }

  private: // Constructors
    CronExpression() = default;

  private: // Methods
    [[nodiscard]]
    auto day_matches(const std::chrono::year_month_day& date) const -> bool;

  private: // Members
    std::bitset<60> m_Minutes;
    std::bitset<24> m_Hours;
    std::bitset<32> m_DaysOfMonth;
    std::bitset<13> m_Months;
    std::bitset<7>  m_DaysOfWeek;
    bool            m_DayOfMonthRestricted = false;
    bool            m_DayOfWeekRestricted  = false;
    std::string     m_Text;
};
} // namespace bsdmirrors::sync_engine
