/**
 * @file CronExpression.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/CronExpression.hpp>

// Standard Library Includes
#include <algorithm>
#include <array>
#include <bitset>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <format>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
using namespace std::string_view_literals;

constexpr std::array MONTH_NAMES = { "jan"sv, "feb"sv, "mar"sv, "apr"sv,
                                     "may"sv, "jun"sv, "jul"sv, "aug"sv,
                                     "sep"sv, "oct"sv, "nov"sv, "dec"sv };

constexpr std::array DAY_NAMES
    = { "sun"sv, "mon"sv, "tue"sv, "wed"sv, "thu"sv, "fri"sv, "sat"sv };

constexpr std::array<std::pair<std::string_view, std::string_view>, 7> MACROS
    = { {
        { "@yearly", "0 0 1 1 *" },
        { "@annually", "0 0 1 1 *" },
        { "@monthly", "0 0 1 * *" },
        { "@weekly", "0 0 * * 0" },
        { "@daily", "0 0 * * *" },
        { "@midnight", "0 0 * * *" },
        { "@hourly", "0 * * * *" },
    } };

struct FieldSpec
{
    std::string_view                  name;
    unsigned                          min;
    unsigned                          max;
    std::span<const std::string_view> names;
    // Value of names.front()
    unsigned nameBase;
};

constexpr FieldSpec MINUTE_FIELD { "minute", 0, 59, {}, 0 };
constexpr FieldSpec HOUR_FIELD { "hour", 0, 23, {}, 0 };
constexpr FieldSpec DAY_OF_MONTH_FIELD { "day-of-month", 1, 31, {}, 0 };
constexpr FieldSpec MONTH_FIELD { "month", 1, 12, MONTH_NAMES, 1 };
// 7 is accepted as an alias for Sunday
constexpr FieldSpec DAY_OF_WEEK_FIELD { "day-of-week", 0, 7, DAY_NAMES, 0 };

auto split(std::string_view text, const char delimiter)
    -> std::vector<std::string_view>
{
    std::vector<std::string_view> parts;

    std::size_t start = 0;
    while (true)
    {
        const auto end = text.find(delimiter, start);
        parts.emplace_back(text.substr(start, end - start));

        if (end == std::string_view::npos)
        {
            return parts;
        }

        start = end + 1;
    }
}

auto split_whitespace(std::string_view text) -> std::vector<std::string_view>
{
    constexpr auto WHITESPACE = " \t\n\r\f\v"sv;

    std::vector<std::string_view> fields;

    auto start = text.find_first_not_of(WHITESPACE);
    while (start != std::string_view::npos)
    {
        const auto end = text.find_first_of(WHITESPACE, start);
        fields.emplace_back(text.substr(start, end - start));
        start = text.find_first_not_of(WHITESPACE, end);
    }

    return fields;
}

auto parse_number(std::string_view token, const FieldSpec& spec) -> unsigned
{
    unsigned value = 0;
    const auto [end, error]
        = std::from_chars(token.data(), token.data() + token.size(), value);

    if (token.empty() || error != std::errc {}
        || end != token.data() + token.size())
    {
        throw validation_error(
            std::format("Invalid {} value `{}`", spec.name, token)
        );
    }

    return value;
}

auto parse_value(std::string_view token, const FieldSpec& spec) -> unsigned
{
    if (!token.empty() && std::isalpha(static_cast<unsigned char>(token.front())))
    {
        std::string lowered(token);
        std::ranges::transform(
            lowered,
            lowered.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); }
        );

        const auto found
            = std::ranges::find(spec.names, std::string_view(lowered));
        if (found == spec.names.end())
        {
            throw validation_error(
                std::format("Unknown {} name `{}`", spec.name, token)
            );
        }

        return spec.nameBase
             + static_cast<unsigned>(std::distance(spec.names.begin(), found));
    }

    const unsigned value = parse_number(token, spec);

    if (value < spec.min || value > spec.max)
    {
        throw validation_error(
            std::format(
                "{} value {} is outside {}-{}",
                spec.name,
                value,
                spec.min,
                spec.max
            )
        );
    }

    return value;
}

auto parse_field(std::string_view field, const FieldSpec& spec)
    -> std::bitset<64>
{
    std::bitset<64> values;

    for (const auto item : split(field, ','))
    {
        if (item.empty())
        {
            throw validation_error(
                std::format("Empty list item in {} field `{}`", spec.name, field)
            );
        }

        const auto slash = item.find('/');
        const auto range = item.substr(0, slash);

        unsigned step = 1;
        if (slash != std::string_view::npos)
        {
            step = parse_number(item.substr(slash + 1), spec);

            if (step == 0)
            {
                throw validation_error(
                    std::format("Zero step in {} field `{}`", spec.name, field)
                );
            }

            if (step > spec.max)
            {
                throw validation_error(
                    std::format(
                        "Step {} out of range in {} field `{}`",
                        step,
                        spec.name,
                        field
                    )
                );
            }
        }

        unsigned first = spec.min;
        unsigned last  = spec.max;

        if (range != "*")
        {
            const auto dash = range.find('-');

            if (dash != std::string_view::npos)
            {
                first = parse_value(range.substr(0, dash), spec);
                last  = parse_value(range.substr(dash + 1), spec);
            }
            else
            {
                first = parse_value(range, spec);
                // `5/15` means every 15 starting at 5
                last = (slash != std::string_view::npos ? spec.max : first);
            }

            if (first > last)
            {
                throw validation_error(
                    std::format(
                        "Descending range in {} field `{}`",
                        spec.name,
                        field
                    )
                );
            }
        }

        for (unsigned value = first; value <= last; value += step)
        {
            values.set(value);
        }
    }

    return values;
}

template <std::size_t N>
auto narrow(const std::bitset<64>& values) -> std::bitset<N>
{
    std::bitset<N> narrowed;
    for (std::size_t idx = 0; idx < N; ++idx)
    {
        narrowed.set(idx, values.test(idx));
    }
    return narrowed;
}
} // namespace

auto CronExpression::parse(std::string_view expression) -> CronExpression
{
    const auto trimmed = split_whitespace(expression);
    if (trimmed.empty())
    {
        throw validation_error("Cron expression is empty");
    }

    std::string_view effective = expression;
    if (trimmed.front().starts_with('@'))
    {
        const auto macro = std::ranges::find_if(
            MACROS,
            [&trimmed](const auto& entry) { return entry.first == trimmed.front(); }
        );

        if (trimmed.size() != 1 || macro == MACROS.end())
        {
            throw validation_error(
                std::format("Unknown cron macro `{}`", expression)
            );
        }

        effective = macro->second;
    }

    const auto fields = split_whitespace(effective);
    constexpr std::size_t FIELD_COUNT = 5;

    if (fields.size() != FIELD_COUNT)
    {
        throw validation_error(
            std::format(
                "Cron expression `{}` has {} fields; expected {}",
                expression,
                fields.size(),
                FIELD_COUNT
            )
        );
    }

    CronExpression cron;

    cron.m_Minutes     = narrow<60>(parse_field(fields.at(0), MINUTE_FIELD));
    cron.m_Hours       = narrow<24>(parse_field(fields.at(1), HOUR_FIELD));
    cron.m_DaysOfMonth = narrow<32>(parse_field(fields.at(2), DAY_OF_MONTH_FIELD));
    cron.m_Months      = narrow<13>(parse_field(fields.at(3), MONTH_FIELD));

    auto daysOfWeek = parse_field(fields.at(4), DAY_OF_WEEK_FIELD);
    if (daysOfWeek.test(7))
    {
        daysOfWeek.set(0);
    }
    cron.m_DaysOfWeek = narrow<7>(daysOfWeek);

    cron.m_DayOfMonthRestricted = !fields.at(2).starts_with('*');
    cron.m_DayOfWeekRestricted  = !fields.at(4).starts_with('*');

    std::string text;
    for (const auto field : trimmed)
    {
        text += (text.empty() ? "" : " ");
        text += field;
    }
    cron.m_Text = std::move(text);

    return cron;
}

auto CronExpression::day_matches(const std::chrono::year_month_day& date) const
    -> bool
{
    const std::chrono::weekday weekday { std::chrono::sys_days { date } };

    const bool dayOfMonth
        = m_DaysOfMonth.test(static_cast<unsigned>(date.day()));
    const bool dayOfWeek = m_DaysOfWeek.test(weekday.c_encoding());

    // Vixie cron: when both day fields are restricted either one may match
    if (m_DayOfMonthRestricted && m_DayOfWeekRestricted)
    {
        return dayOfMonth || dayOfWeek;
    }

    return dayOfMonth && dayOfWeek;
}

auto CronExpression::matches(const std::chrono::system_clock::time_point time) const
    -> bool
{
    using namespace std::chrono;

    const auto minute = floor<minutes>(time);
    const auto day    = floor<days>(minute);
    const year_month_day date { day };
    const hh_mm_ss       clock { minute - day };

    return m_Months.test(static_cast<unsigned>(date.month()))
        && this->day_matches(date)
        && m_Hours.test(static_cast<std::size_t>(clock.hours().count()))
        && m_Minutes.test(static_cast<std::size_t>(clock.minutes().count()));
}

auto CronExpression::next_after(const std::chrono::system_clock::time_point time) const
    -> std::optional<std::chrono::system_clock::time_point>
{
    using namespace std::chrono;

    sys_time<minutes> candidate = floor<minutes>(time) + minutes { 1 };
    const auto        limit     = candidate + days { 366 * 5 };

    while (candidate <= limit)
    {
        const auto           day = floor<days>(candidate);
        const year_month_day date { day };

        if (!m_Months.test(static_cast<unsigned>(date.month())))
        {
            const auto nextMonth
                = year_month { date.year(), date.month() } + months { 1 };
            candidate = sys_days { nextMonth / 1 };
            continue;
        }

        if (!this->day_matches(date))
        {
            candidate = day + days { 1 };
            continue;
        }

        const hh_mm_ss clock { candidate - day };
        const auto     hour = clock.hours().count();

        if (!m_Hours.test(static_cast<std::size_t>(hour)))
        {
            candidate = day + hours { hour + 1 };
            continue;
        }

        if (!m_Minutes.test(static_cast<std::size_t>(clock.minutes().count())))
        {
            candidate += minutes { 1 };
            continue;
        }

        return candidate;
    }

    return std::nullopt;
}
} // namespace bsdmirrors::sync_engine
