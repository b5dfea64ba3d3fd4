/**
 * @file TransferProcess.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/TransferProcess.hpp>

// System Includes
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Standard Library Includes
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <format>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>

extern char** environ;

namespace bsdmirrors::sync_engine
{
namespace
{
constexpr auto        CHECK_INTERVAL  = std::chrono::milliseconds(100);
constexpr std::size_t READ_CHUNK_SIZE = 4096;
constexpr int         EXEC_FAILURE    = 127;

auto os_error(const int error) -> std::string
{
    std::string errorMessage(BUFSIZ, '\0');

    // NOLINTNEXTLINE(*-include-cleaner)
    return ::strerror_r(error, errorMessage.data(), errorMessage.size());
}

auto to_c_strings(std::vector<std::string>& strings) -> std::vector<char*>
{
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);

    for (auto& string : strings)
    {
        pointers.emplace_back(string.data());
    }

    // Last item has to be a nullptr
    pointers.emplace_back(nullptr);

    return pointers;
}

auto child_environment(const TransferCommand& command) -> std::vector<std::string>
{
    using namespace std::string_view_literals;
    constexpr auto PASSWORD_VARIABLE = "RSYNC_PASSWORD="sv;

    std::vector<std::string> environment;

    for (char** entry = ::environ; entry != nullptr && *entry != nullptr; ++entry)
    {
        const std::string_view variable(*entry);

        if (!variable.starts_with(PASSWORD_VARIABLE))
        {
            environment.emplace_back(variable);
        }
    }

    if (command.password.has_value())
    {
        environment.emplace_back(
            std::format("{}{}", PASSWORD_VARIABLE, *command.password)
        );
    }

    return environment;
}

auto decode_wait_status(const int status) -> ProcessExit
{
    // NOLINTBEGIN(*-include-cleaner)
    if (WIFSIGNALED(status))
    {
        return ProcessExit { .reason = ProcessExit::Reason::SIGNALED,
                             .status = WTERMSIG(status) };
    }

    return ProcessExit { .reason = ProcessExit::Reason::EXITED,
                         .status = WEXITSTATUS(status) };
    // NOLINTEND(*-include-cleaner)
}
} // namespace

auto read_exec_result(const int pipe) -> std::optional<int>
{
    int     execError = 0;
    ssize_t count     = 0;
    do
    {
        count = ::read(pipe, &execError, sizeof(execError));
    } while (count == -1 && errno == EINTR);

    if (count < 0)
    {
        throw spawn_error(
            std::format("Failed to read the exec status pipe: {}", os_error(errno))
        );
    }

    if (count == 0)
    {
        return std::nullopt;
    }

    return execError;
}

TransferProcess::TransferProcess(const TransferCommand& command, std::string label)
    : m_Label(std::move(label)),
      m_ProcessID(-1),
      m_OutputPipe(-1)
{
    if (command.arguments.empty())
    {
        throw spawn_error(std::format("No transfer command for {}", m_Label));
    }

    // Everything the child touches is prepared before fork()
    auto arguments   = command.arguments;
    auto environment = child_environment(command);
    auto argv        = to_c_strings(arguments);
    auto envp        = to_c_strings(environment);

    std::array<int, 2> outputPipes    = { -1, -1 };
    std::array<int, 2> execErrorPipes = { -1, -1 };

    if (::pipe2(outputPipes.data(), O_CLOEXEC) != 0)
    {
        throw spawn_error(
            std::format(
                "Failed to create output pipe for {}: {}",
                m_Label,
                os_error(errno)
            )
        );
    }

    if (::pipe2(execErrorPipes.data(), O_CLOEXEC) != 0)
    {
        const int error = errno;
        ::close(outputPipes.at(0));
        ::close(outputPipes.at(1));

        throw spawn_error(
            std::format(
                "Failed to create exec pipe for {}: {}",
                m_Label,
                os_error(error)
            )
        );
    }

    const int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    // The daemon blocks SIGTERM for sigwait(); the transfer must not inherit that
    ::sigset_t unblocked;
    ::sigemptyset(&unblocked);

    const ::pid_t pid = ::fork();

    if (pid == 0) // Child Process
    {
        ::setpgid(0, 0);
        ::sigprocmask(SIG_SETMASK, &unblocked, nullptr);

        if (devNull >= 0)
        {
            ::dup2(devNull, STDIN_FILENO);
        }

        ::dup2(outputPipes.at(1), STDOUT_FILENO);
        ::dup2(outputPipes.at(1), STDERR_FILENO);

        ::execve(argv.front(), argv.data(), envp.data());

        // If we get here `::execve()` failed. The parent is blocked on this pipe.
        const int error = errno;
        [[maybe_unused]]
        const auto written
            = ::write(execErrorPipes.at(1), &error, sizeof(error));

        ::_exit(EXEC_FAILURE);
    }

    const int forkError = errno;

    if (devNull >= 0)
    {
        ::close(devNull);
    }

    ::close(outputPipes.at(1));
    ::close(execErrorPipes.at(1));

    if (pid == -1)
    {
        ::close(outputPipes.at(0));
        ::close(execErrorPipes.at(0));

        throw spawn_error(
            std::format("Failed to fork for {}: {}", m_Label, os_error(forkError))
        );
    }

    // Also done here so the group exists before anyone signals it
    ::setpgid(pid, pid);

    std::optional<int> execError;
    try
    {
        execError = read_exec_result(execErrorPipes.at(0));
    }
    catch (spawn_error& se)
    {
        ::close(execErrorPipes.at(0));
        ::close(outputPipes.at(0));

        // The exec may or may not have happened
        ::kill(-pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);

        spdlog::error("Lost track of the transfer for {}: {}", m_Label, se.what());
        throw;
    }

    ::close(execErrorPipes.at(0));

    if (execError.has_value())
    {
        ::waitpid(pid, nullptr, 0);
        ::close(outputPipes.at(0));

        throw spawn_error(
            std::format(
                "Failed to execute {}: {}",
                command.arguments.front(),
                os_error(*execError)
            )
        );
    }

    m_ProcessID  = pid;
    m_OutputPipe = outputPipes.at(0);

    spdlog::debug("Started transfer for {} (pid: {})", m_Label, m_ProcessID);
}

TransferProcess::~TransferProcess()
{
    if (!m_Exit.has_value())
    {
        spdlog::warn(
            "Transfer for {} abandoned while running, killing it (pid: {})",
            m_Label,
            m_ProcessID
        );

        ::kill(-m_ProcessID, SIGKILL);
        ::waitpid(m_ProcessID, nullptr, 0);
    }

    this->close_output();
}

auto TransferProcess::supervise(
    OutputBuffer&              output,
    const std::chrono::seconds timeout,
    const std::chrono::seconds grace,
    const std::stop_token&     stopToken
) -> ProcessExit
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        this->drain(output, CHECK_INTERVAL);

        if (this->try_reap())
        {
            while (this->drain(output, std::chrono::milliseconds(0)))
            {
            }

            break;
        }

        if (stopToken.stop_requested())
        {
            spdlog::warn(
                "Stopping transfer for {} on shutdown (pid: {})",
                m_Label,
                m_ProcessID
            );
            this->terminate(output, grace);

            return ProcessExit { .reason = ProcessExit::Reason::CANCELLED };
        }

        if (std::chrono::steady_clock::now() >= deadline)
        {
            spdlog::warn(
                "Transfer for {} has been running for at least {} second{}. "
                "Attempting to send SIGTERM. (pid: {})",
                m_Label,
                timeout.count(),
                // if not one second, plural
                (timeout.count() == 1 ? "" : "s"),
                m_ProcessID
            );
            this->terminate(output, grace);

            return ProcessExit { .reason = ProcessExit::Reason::TIMED_OUT };
        }
    }

    if (!m_PartialLine.empty())
    {
        spdlog::trace("[{}] {}", m_Label, m_PartialLine);
        m_PartialLine.clear();
    }

    this->close_output();

    return *m_Exit;
}

auto TransferProcess::drain(
    OutputBuffer&                   output,
    const std::chrono::milliseconds wait
) -> bool
{
    if (m_OutputPipe < 0)
    {
        std::this_thread::sleep_for(wait);
        return false;
    }

    ::pollfd descriptor { .fd = m_OutputPipe, .events = POLLIN, .revents = 0 };

    const int ready = ::poll(&descriptor, 1, static_cast<int>(wait.count()));

    if (ready == -1)
    {
        if (errno != EINTR)
        {
            spdlog::error(
                "poll() failed on output of {}! Error message: {}",
                m_Label,
                os_error(errno)
            );
            this->close_output();
        }

        return false;
    }

    if (ready == 0)
    {
        return false;
    }

    std::array<char, READ_CHUNK_SIZE> buffer {};

    const ssize_t count = ::read(m_OutputPipe, buffer.data(), buffer.size());

    if (count > 0)
    {
        this->consume(
            output,
            std::string_view(buffer.data(), static_cast<std::size_t>(count))
        );

        return true;
    }

    if (count == -1 && errno == EINTR)
    {
        return false;
    }

    // End of stream: every writer has exited or closed its end
    this->close_output();

    return false;
}

auto TransferProcess::consume(OutputBuffer& output, std::string_view data) -> void
{
    output.append(data);

    m_PartialLine.append(data);

    std::size_t lineEnd = m_PartialLine.find('\n');
    while (lineEnd != std::string::npos)
    {
        spdlog::trace(
            "[{}] {}",
            m_Label,
            std::string_view(m_PartialLine).substr(0, lineEnd)
        );

        m_PartialLine.erase(0, lineEnd + 1);
        lineEnd = m_PartialLine.find('\n');
    }

    // A line longer than the buffer is logged in pieces
    if (m_PartialLine.size() > output.capacity())
    {
        spdlog::trace("[{}] {}", m_Label, m_PartialLine);
        m_PartialLine.clear();
    }
}

auto TransferProcess::try_reap() -> bool
{
    if (m_Exit.has_value())
    {
        return true;
    }

    int status = 0;

    // NOLINTNEXTLINE(misc-include-cleaner)
    switch (const ::pid_t result = ::waitpid(m_ProcessID, &status, WNOHANG))
    {
    case 0: // Process still running
        return false;

    case -1:
        if (errno == EINTR)
        {
            return false;
        }

        spdlog::error(
            "waitpid() failed for transfer {} (pid: {})! Error message: {}",
            m_Label,
            m_ProcessID,
            os_error(errno)
        );
        m_Exit = ProcessExit { .reason = ProcessExit::Reason::EXITED,
                               .status = -1 };
        return true;

    default:
        spdlog::trace("Process {} successfully reaped", result);
        m_Exit = decode_wait_status(status);
        return true;
    }
}

auto TransferProcess::terminate(OutputBuffer& output, const std::chrono::seconds grace)
    -> void
{
    if (this->try_reap())
    {
        return;
    }

    if (::kill(-m_ProcessID, SIGTERM) != 0)
    {
        spdlog::error(
            "Failed to send process group {} a SIGTERM! Error message: {}",
            m_ProcessID,
            os_error(errno)
        );
    }
    else
    {
        spdlog::debug("Successfully sent process group {} a SIGTERM", m_ProcessID);
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;

    while (std::chrono::steady_clock::now() < deadline)
    {
        this->drain(output, CHECK_INTERVAL);

        if (this->try_reap())
        {
            this->close_output();
            return;
        }
    }

    spdlog::error("Failed to terminate process {} with SIGTERM", m_ProcessID);

    if (::kill(-m_ProcessID, SIGKILL) != 0)
    {
        spdlog::error(
            "Failed to send process group {} a SIGKILL! Error message: {}",
            m_ProcessID,
            os_error(errno)
        );
    }

    int     status = 0;
    ::pid_t result = 0;
    do
    {
        result = ::waitpid(m_ProcessID, &status, 0);
    } while (result == -1 && errno == EINTR);

    if (result == m_ProcessID)
    {
        spdlog::trace("Process {} successfully reaped", m_ProcessID);
        m_Exit = decode_wait_status(status);
    }
    else
    {
        spdlog::error("Failed to reap process {} after SIGKILL!", m_ProcessID);
        m_Exit = ProcessExit { .reason = ProcessExit::Reason::SIGNALED,
                               .status = SIGKILL };
    }

    this->close_output();
}

auto TransferProcess::close_output() -> void
{
    if (m_OutputPipe >= 0)
    {
        ::close(m_OutputPipe);
        m_OutputPipe = -1;
    }
}
} // namespace bsdmirrors::sync_engine
