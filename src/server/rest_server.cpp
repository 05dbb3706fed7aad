#include "voice_bridge/server/rest_server.hpp"

#include <algorithm>
#include <stdexcept>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge {

namespace {

bool is_form_request(const httplib::Request& request) {
    const auto content_type = request.get_header_value("Content-Type");
    return content_type.rfind("application/x-www-form-urlencoded", 0) == 0;
}

}

nlohmann::json request_body_json(const httplib::Request& request) {
    if (is_form_request(request)) {
        nlohmann::json body = nlohmann::json::object();
        for (const auto& param : request.params) {
            body[param.first] = param.second;
        }
        return body;
    }
    if (request.body.empty()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(request.body);
}

RestServer::RestServer(const Config& config,
                       OutboundCallHandler on_outbound_call,
                       TwimlHandler on_twiml)
    : config_(config),
      on_outbound_call_(std::move(on_outbound_call)),
      on_twiml_(std::move(on_twiml)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->set_post_routing_handler([this](const httplib::Request& req,
                                             httplib::Response& res) {
        apply_cors(req, res);
    });

    server_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    server_->Get("/", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"message", "Server is running"}};
        res.set_content(payload.dump(), "application/json");
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/outbound-call", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        nlohmann::json body;
        try {
            body = request_body_json(req);
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to parse /outbound-call request",
                {kv("error", ex.what())});
            write_json(res, {400, {{"success", false}, {"error", "invalid request body"}}});
            return;
        }
        try {
            write_json(res, on_outbound_call_(body, req.get_header_value("Host")));
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to handle /outbound-call request",
                {kv("error", ex.what())});
            write_json(res, {500, {{"success", false}, {"error", "Failed to initiate call"}}});
        }
    });

    server_->Get("/outbound-call-twiml", [this](const httplib::Request& req,
                                                httplib::Response& res) {
        handle_twiml(req, res);
    });
    server_->Post("/outbound-call-twiml", [this](const httplib::Request& req,
                                                 httplib::Response& res) {
        handle_twiml(req, res);
    });

    if (!server_->bind_to_port("0.0.0.0", config_.http_port)) {
        throw std::runtime_error("REST server failed to bind port " +
                                 std::to_string(config_.http_port));
    }
    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.http_port)});
        server_->listen_after_bind();
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        write_json(response, {401, {{"success", false}, {"error", "missing authorization"}}});
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        write_json(response, {403, {{"success", false}, {"error", "invalid authorization"}}});
        return false;
    }
    return true;
}

void RestServer::apply_cors(const httplib::Request& request, httplib::Response& response) const {
    const auto origin = request.get_header_value("Origin");
    if (origin.empty()) {
        return;
    }
    const auto& allowed = config_.cors_allowed_origins;
    if (std::find(allowed.begin(), allowed.end(), origin) == allowed.end()) {
        return;
    }
    response.set_header("Access-Control-Allow-Origin", origin);
    response.set_header("Vary", "Origin");
    response.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    response.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

void RestServer::handle_twiml(const httplib::Request& request,
                              httplib::Response& response) const {
    const auto prompt = request.get_param_value("prompt");
    const auto first_message = request.get_param_value("first_message");
    try {
        response.set_content(on_twiml_(prompt, first_message, request.get_header_value("Host")),
                             "text/xml");
    } catch (const ValidationError& ex) {
        logging::warn(
            "TwiML request rejected",
            {kv("error", ex.what())});
        write_json(response, {400, {{"success", false}, {"error", ex.what()}}});
    }
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
