/**
 * @file TransferCommand.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/TransferCommand.hpp>

// Standard Library Includes
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

// Third Party Library Includes
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
using namespace std::string_view_literals;

constexpr auto PARTIAL_OPTION = "--partial"sv;

auto read_password(const std::filesystem::path& passwordFile) -> std::string
{
    std::ifstream passwordFileStream(passwordFile);

    if (!passwordFileStream.good())
    {
        throw spawn_error(
            std::format("Failed to read password file {}", passwordFile.string())
        );
    }

    std::string password;
    passwordFileStream >> password;

    return password;
}
} // namespace

auto TransferCommand::to_string() const -> std::string
{
    return fmt::format("{}", fmt::join(arguments, " "));
}

auto compose_transfer_command(
    const MirrorTarget&    target,
    const TransferOptions& options,
    const std::int64_t     bandwidthLimit
) -> TransferCommand
{
    TransferCommand command;

    command.arguments.emplace_back(options.executable.string());
    command.arguments.insert(
        command.arguments.end(),
        options.options.begin(),
        options.options.end()
    );

    // Interrupted runs must resume from their partial files
    if (std::ranges::find(options.options, PARTIAL_OPTION) == options.options.end())
    {
        command.arguments.emplace_back(PARTIAL_OPTION);
    }

    if (bandwidthLimit > 0)
    {
        command.arguments.emplace_back(std::format("--bwlimit={}", bandwidthLimit));
    }

    command.arguments.emplace_back(target.upstreamUrl);
    command.arguments.emplace_back(target.localPath);

    if (target.passwordFile.has_value())
    {
        spdlog::trace("Reading rsync password for {}", target.name);
        command.password = read_password(*target.passwordFile);
    }

    spdlog::trace("Sync Command: {{ {} }}", fmt::join(command.arguments, ", "));

    return command;
}
} // namespace bsdmirrors::sync_engine
