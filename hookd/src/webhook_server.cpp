#include "webhook_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace {

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

}

WebhookServer::WebhookServer(const Config& config, WebhookHandler& handler,
                             const RestartCoordinator& coordinator)
    : config_(config), handler_(handler), coordinator_(coordinator), running_(false) {
    server_ = std::make_unique<httplib::Server>();
    setup_routes();
}

WebhookServer::~WebhookServer() {
    stop();
}

void WebhookServer::start() {
    if (!server_->bind_to_port(config_.listen_addr, config_.listen_port)) {
        throw std::runtime_error("Cannot bind " + config_.listen_addr + ":" +
                                 std::to_string(config_.listen_port));
    }
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting server on {}:{}", config_.listen_addr, config_.listen_port);
        if (!server_->listen_after_bind()) {
            spdlog::error("Webhook server stopped unexpectedly");
        }
        running_ = false;
    });
}

void WebhookServer::stop() {
    // httplib ignores stop() until the listen loop is up
    if (server_thread_.joinable() && !wait_until_ready()) {
        spdlog::warn("Webhook server did not come up before stop");
    }
    server_->stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    running_ = false;
}

bool WebhookServer::is_running() const {
    return running_;
}

bool WebhookServer::wait_until_ready(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (running_ && !server_->is_running()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return running_;
}

void WebhookServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json health = {
            {"status", "ok"},
            {"service", config_.service_name},
            {"restart_pending", coordinator_.restart_pending()},
            {"timestamp", util::current_iso8601()}
        };
        send_json(res, 200, health);
    });

    // The path is already percent-decoded; everything after the prefix is the subpath
    server_->Post(R"(/webhook/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        WebhookRequest request;
        request.subpath = req.matches[1];
        if (req.has_header("X-Security-Token")) {
            request.token = req.get_header_value("X-Security-Token");
        }

        auto response = handler_.handle(request);
        send_json(res, response.status, response.body);
    });

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                      std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            spdlog::error("Non-standard exception while handling {}", req.path);
        }
        spdlog::error("Error handling {} {}: {}", req.method, req.path, what);
        send_json(res, 500, {{"status", "error"}, {"message", "Internal server error"}});
    });

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        // Handler responses already carry a JSON body
        if (res.body.empty()) {
            auto message = res.status == 404 ? "Not found" : httplib::status_message(res.status);
            send_json(res, res.status, {{"status", "error"}, {"message", message}});
        }
    });
}
