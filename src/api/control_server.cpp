#define CPPHTTPLIB_NO_OPENSSL 1

#include "../../include/api/control_server.hpp"

#include <httplib.h>

#include <stdexcept>

namespace zonetrader {
namespace api {

namespace {

void reply(httplib::Response& res, const ApiResponse& response) {
    res.status = response.status;
    res.set_content(response.body, "application/json");
}

std::string param_or_empty(const httplib::Request& req, const char* name) {
    return req.has_param(name) ? req.get_param_value(name) : std::string();
}

} // namespace

ControlServer::ControlServer(ControlApi& api, const ControlConfig& config, logging::AsyncLogger* logger)
    : api_(api), config_(config), logger_(logger), server_(std::make_unique<httplib::Server>()) {
    setup_routes();
}

ControlServer::~ControlServer() { stop(); }

void ControlServer::start() {
    if (listen_thread_.joinable())
        return;
    if (!server_->bind_to_port(config_.host, config_.port))
        throw std::runtime_error("Failed to bind control server to " + config_.host + ":" +
                                 std::to_string(config_.port));

    listen_thread_ = std::thread([this] { server_->listen_after_bind(); });
    LOGF_INFO(logger_, logging::LogCategory::Api, "Control API listening on %s:%d", config_.host.c_str(),
              config_.port);
}

void ControlServer::stop() {
    if (!listen_thread_.joinable())
        return;
    server_->stop();
    listen_thread_.join();
    LOG_INFO(logger_, logging::LogCategory::Api, "Control API stopped");
}

bool ControlServer::is_running() const { return server_->is_running(); }

void ControlServer::setup_routes() {
    if (config_.enable_cors) {
        server_->set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, PUT, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_->Options(".*", [](const httplib::Request&, httplib::Response& res) { res.status = 204; });
    }

    server_->Put("/phase/start", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, api_.start_phase(req.body));
    });

    server_->Put("/phase/stop",
                 [this](const httplib::Request&, httplib::Response& res) { reply(res, api_.stop_phase()); });

    server_->Get("/events", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, api_.events(param_or_empty(req, "date"), param_or_empty(req, "phase")));
    });

    server_->Get("/report", [this](const httplib::Request& req, httplib::Response& res) {
        reply(res, api_.report(param_or_empty(req, "date")));
    });

    server_->Get("/dates", [this](const httplib::Request&, httplib::Response& res) { reply(res, api_.dates()); });

    server_->Get("/status", [this](const httplib::Request&, httplib::Response& res) { reply(res, api_.status()); });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) { reply(res, api_.health()); });

    server_->set_exception_handler([this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            if (ep)
                std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        }
        LOGF_ERROR(logger_, logging::LogCategory::Api, "%s %s failed: %s", req.method.c_str(), req.path.c_str(),
                   what.c_str());
        reply(res, ApiResponse::error(500, what));
    });
}

} // namespace api
} // namespace zonetrader
