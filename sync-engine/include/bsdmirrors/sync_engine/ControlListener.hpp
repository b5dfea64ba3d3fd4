/**
 * @file ControlListener.hpp
 * @brief ZeroMQ request/reply socket exposing the engine's operations
 */

#pragma once

// Standard Library Includes
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <zmq.hpp>

// Project Includes
#include <bsdmirrors/sync_engine/SyncEngine.hpp>

namespace bsdmirrors::sync_engine
{
// Each request is one JSON object `{"command": ..., ...}`. Every reply
// carries `status`: `ok`, `busy`, `not_found`, `invalid`, `disabled` or
// `error`, with `message` set on anything but `ok`.
class ControlListener
{
  public: // Constructors
    ControlListener(SyncEngine& engine, std::string port);
    ControlListener(ControlListener&) = delete;
    ControlListener(ControlListener&&) = delete;
    auto operator=(ControlListener&) -> ControlListener& = delete;
    auto operator=(ControlListener&&) -> ControlListener& = delete;

    ~ControlListener();

  public: // Methods
    // Binds `tcp://*:<port>` and serves requests on a background thread
    auto start() -> void;
    auto stop() -> void;

    [[nodiscard]]
    auto handle_message(std::string_view message) -> std::string;

    [[nodiscard]]
    auto handle_request(const nlohmann::json& request) -> nlohmann::json;

  private: // Methods
    auto serve(const std::stop_token& stopToken) -> void;

    auto sync(const nlohmann::json& request) -> nlohmann::json;
    auto sync_all(const nlohmann::json& request) -> nlohmann::json;
    auto update_target(const nlohmann::json& request) -> nlohmann::json;
    auto update_settings(const nlohmann::json& request) -> nlohmann::json;

    [[nodiscard]]
    auto resolve_target(const nlohmann::json& request) const -> TargetId;

  private: // Members
    SyncEngine&    m_Engine;
    std::string    m_Port;
    zmq::context_t m_Context;
    zmq::socket_t  m_Socket;
    std::jthread   m_ListenerThread;
};
} // namespace bsdmirrors::sync_engine
