/**
 * @file TransferProcess.hpp
 * @brief A supervised transfer subprocess running in its own process group
 */

#pragma once

// System Includes
#include <sys/types.h>

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

// Project Includes
#include <bsdmirrors/sync_engine/OutputBuffer.hpp>
#include <bsdmirrors/sync_engine/TransferCommand.hpp>

namespace bsdmirrors::sync_engine
{
struct ProcessExit
{
    enum class Reason : std::uint8_t
    {
        EXITED,
        SIGNALED,
        TIMED_OUT,
        CANCELLED,
    };

    Reason reason = Reason::EXITED;
    // Exit status for EXITED, signal number for SIGNALED, -1 otherwise
    int    status = -1;
};

// Waits on the close-on-exec pipe of a freshly forked child. Empty when the
// exec succeeded, otherwise the child's errno. Throws `spawn_error` if the
// pipe cannot be read.
[[nodiscard]]
auto read_exec_result(int pipe) -> std::optional<int>;

class TransferProcess
{
  public: // Constructors
    // Forks and execs `command`. Throws `spawn_error` if the executable could
    // not be started.
    TransferProcess(const TransferCommand& command, std::string label);
    TransferProcess(TransferProcess&) = delete;
    TransferProcess(TransferProcess&&) = delete;
    auto operator=(TransferProcess&) -> TransferProcess& = delete;
    auto operator=(TransferProcess&&) -> TransferProcess& = delete;

    // Kills and reaps the process group if it is still running
    ~TransferProcess();

  public: // Methods
    // Streams output into `output` until the process exits. On timeout or
    // stop request the group gets SIGTERM, then SIGKILL after `grace`.
    auto supervise(
        OutputBuffer&          output,
        std::chrono::seconds   timeout,
        std::chrono::seconds   grace,
        const std::stop_token& stopToken
    ) -> ProcessExit;

    [[nodiscard]]
    auto pid() const -> ::pid_t
    {
        return m_ProcessID;
    }

  private: // Methods
    // Returns true if any output was read
    auto drain(OutputBuffer& output, std::chrono::milliseconds wait) -> bool;
    auto consume(OutputBuffer& output, std::string_view data) -> void;
    auto try_reap() -> bool;
    auto terminate(OutputBuffer& output, std::chrono::seconds grace) -> void;
    auto close_output() -> void;

  private: // Members
    std::string                m_Label;
    ::pid_t                    m_ProcessID;
    int                        m_OutputPipe;
    std::optional<ProcessExit> m_Exit;
    std::string                m_PartialLine;
};
} // namespace bsdmirrors::sync_engine
