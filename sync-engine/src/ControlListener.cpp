/**
 * @file ControlListener.cpp
 * @brief
 */

// Header Being Defined
#include <bsdmirrors/sync_engine/ControlListener.hpp>

// Standard Library Includes
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <format>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <zmq.hpp>

// Project Includes
#include <bsdmirrors/sync_engine/Errors.hpp>
#include <bsdmirrors/sync_engine/Serialization.hpp>

namespace bsdmirrors::sync_engine
{
namespace
{
constexpr auto         RECEIVE_TIMEOUT   = std::chrono::milliseconds(500);
constexpr std::int64_t DEFAULT_JOB_LIMIT = 20;
constexpr std::int64_t MAX_JOB_LIMIT     = 1000;

auto reply(std::string_view status, std::string_view message) -> nlohmann::json
{
    return nlohmann::json { { "status", status }, { "message", message } };
}

auto ok() -> nlohmann::json
{
    return nlohmann::json { { "status", "ok" } };
}

auto job_limit(const nlohmann::json& request) -> std::size_t
{
    const auto limit = request.value("limit", DEFAULT_JOB_LIMIT);

    if (limit <= 0 || limit > MAX_JOB_LIMIT)
    {
        throw validation_error(
            std::format("limit must be between 1 and {}", MAX_JOB_LIMIT)
        );
    }

    return static_cast<std::size_t>(limit);
}

auto setting_value(const nlohmann::json& value) -> std::string
{
    if (value.is_string())
    {
        return value.get<std::string>();
    }

    if (value.is_boolean() || value.is_number_integer())
    {
        return value.dump();
    }

    throw validation_error("Setting values must be strings, integers or booleans");
}
} // namespace

ControlListener::ControlListener(SyncEngine& engine, std::string port)
    : m_Engine(engine),
      m_Port(std::move(port)),
      m_Socket(m_Context, zmq::socket_type::rep)
{
}

ControlListener::~ControlListener()
{
    this->stop();
}

auto ControlListener::start() -> void
{
    m_Socket.set(zmq::sockopt::rcvtimeo, static_cast<int>(RECEIVE_TIMEOUT.count()));
    m_Socket.set(zmq::sockopt::linger, 0);
    m_Socket.bind(std::format("tcp://*:{}", m_Port));

    spdlog::trace("Starting control listener thread");
    m_ListenerThread = std::jthread([this](const std::stop_token& stopToken)
                                    { this->serve(stopToken); });
    spdlog::info("Control socket listening on port {}", m_Port);
}

auto ControlListener::stop() -> void
{
    if (!m_ListenerThread.joinable())
    {
        return;
    }

    spdlog::info("Joining control listener thread");
    m_ListenerThread.request_stop();
    m_ListenerThread.join();
    spdlog::info("Control listener thread joined!");
}

auto ControlListener::serve(const std::stop_token& stopToken) -> void
{
    while (!stopToken.stop_requested())
    {
        zmq::message_t request;

        try
        {
            // Times out periodically so a stop request is noticed
            if (!m_Socket.recv(request, zmq::recv_flags::none).has_value())
            {
                continue;
            }

            const auto response = this->handle_message(request.to_string());

            m_Socket.send(zmq::message_t(response), zmq::send_flags::none);
        }
        catch (zmq::error_t& ze)
        {
            if (ze.num() == ETERM)
            {
                break;
            }

            spdlog::error("Control socket error: {}", ze.what());
        }
    }
}

auto ControlListener::handle_message(std::string_view message) -> std::string
{
    nlohmann::json request;

    try
    {
        request = nlohmann::json::parse(message);
    }
    catch (nlohmann::json::parse_error& pe)
    {
        return reply("invalid", std::format("Request is not valid JSON: {}", pe.what()))
            .dump();
    }

    return this->handle_request(request).dump();
}

auto ControlListener::handle_request(const nlohmann::json& request)
    -> nlohmann::json
{
    try
    {
        if (!request.is_object() || !request.contains("command"))
        {
            return reply("invalid", "Request needs a command");
        }

        const auto command = request.at("command").get<std::string>();
        spdlog::debug("Control request: {}", command);

        auto response = ok();

        if (command == "sync")
        {
            return this->sync(request);
        }

        if (command == "sync_all")
        {
            return this->sync_all(request);
        }

        if (command == "health")
        {
            const auto runningJobs  = m_Engine.running_jobs();
            response["running"]      = m_Engine.is_running();
            response["syncing"]      = runningJobs > 0;
            response["running_jobs"] = runningJobs;
            return response;
        }

        if (command == "targets")
        {
            response["targets"] = m_Engine.list_targets();
            return response;
        }

        if (command == "target")
        {
            response["target"] = m_Engine.get_target(this->resolve_target(request));
            return response;
        }

        if (command == "update_target")
        {
            return this->update_target(request);
        }

        if (command == "jobs")
        {
            response["jobs"] = m_Engine.list_jobs(
                this->resolve_target(request),
                job_limit(request)
            );
            return response;
        }

        if (command == "recent_jobs")
        {
            response["jobs"] = m_Engine.list_recent_jobs(job_limit(request));
            return response;
        }

        if (command == "job")
        {
            response["job"] = m_Engine.get_job(request.at("id").get<JobId>());
            return response;
        }

        if (command == "settings")
        {
            response["settings"] = m_Engine.get_settings();
            return response;
        }

        if (command == "update_settings")
        {
            return this->update_settings(request);
        }

        return reply("invalid", std::format("Unknown command `{}`", command));
    }
    catch (target_busy& tb)
    {
        return reply("busy", tb.what());
    }
    catch (target_disabled& td)
    {
        return reply("disabled", td.what());
    }
    catch (target_not_found& tnf)
    {
        return reply("not_found", tnf.what());
    }
    catch (job_not_found& jnf)
    {
        return reply("not_found", jnf.what());
    }
    catch (validation_error& ve)
    {
        return reply("invalid", ve.what());
    }
    catch (nlohmann::json::exception& je)
    {
        return reply("invalid", je.what());
    }
    catch (std::exception& e)
    {
        spdlog::error("Control request failed: {}", e.what());
        return reply("error", e.what());
    }
}

auto ControlListener::sync(const nlohmann::json& request) -> nlohmann::json
{
    const auto id  = this->resolve_target(request);
    const auto job = m_Engine.trigger_sync(id, request.at("actor").get<std::string>());

    auto response   = ok();
    response["job"] = job;

    return response;
}

auto ControlListener::sync_all(const nlohmann::json& request) -> nlohmann::json
{
    const auto actor = request.at("actor").get<std::string>();

    auto started = nlohmann::json::array();
    auto skipped = nlohmann::json::array();

    for (const auto& target : m_Engine.list_targets())
    {
        try
        {
            started.push_back(
                nlohmann::json(m_Engine.trigger_sync(target.id, actor))
            );
        }
        catch (target_busy&)
        {
            skipped.push_back(
                nlohmann::json { { "target", target.name }, { "reason", "busy" } }
            );
        }
        catch (target_disabled&)
        {
            skipped.push_back(
                nlohmann::json { { "target", target.name },
                                 { "reason", "disabled" } }
            );
        }
    }

    spdlog::info(
        "Started {} of {} mirrors for {}",
        started.size(),
        started.size() + skipped.size(),
        actor
    );

    auto response       = ok();
    response["started"] = std::move(started);
    response["skipped"] = std::move(skipped);

    return response;
}

auto ControlListener::update_target(const nlohmann::json& request) -> nlohmann::json
{
    const auto id = this->resolve_target(request);

    TargetUpdate update;

    if (request.contains("upstream_url"))
    {
        update.upstreamUrl = request.at("upstream_url").get<std::string>();
    }

    if (request.contains("enabled"))
    {
        update.enabled = request.at("enabled").get<bool>();
    }

    if (!update.upstreamUrl.has_value() && !update.enabled.has_value())
    {
        throw validation_error("Nothing to update");
    }

    auto response      = ok();
    response["target"] = m_Engine.update_target(id, update);

    return response;
}

auto ControlListener::update_settings(const nlohmann::json& request)
    -> nlohmann::json
{
    const auto& settings = request.at("settings");

    if (!settings.is_object() || settings.empty())
    {
        throw validation_error("settings must be a non-empty object");
    }

    SettingsStore::SettingMap values;
    for (const auto& [key, value] : settings.items())
    {
        values.emplace(key, setting_value(value));
    }

    auto response        = ok();
    response["settings"] = m_Engine.update_settings(values);

    return response;
}

auto ControlListener::resolve_target(const nlohmann::json& request) const
    -> TargetId
{
    const auto name   = request.at("target").get<std::string>();
    const auto target = m_Engine.find_target(name);

    if (!target.has_value())
    {
        throw target_not_found(std::format("Mirror {} not found", name));
    }

    return target->id;
}
} // namespace bsdmirrors::sync_engine
