#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

struct GatewayOptions {
    std::string base_url{"http://localhost:18789"};
    std::string auth_token;      // sent as X-Auth-Token
    std::string slack_channel{"C0AFE4QHKH7"};
    long timeout_sec{10};
};

// Service boundary the built-in jobs read from.
class GatewayClient {
public:
    virtual ~GatewayClient() = default;
    // nullopt on transport errors, non-2xx responses and unparsable bodies.
    virtual std::optional<nlohmann::json> get_json(const std::string &path, long timeout_sec) = 0;
    virtual bool post_json(const std::string &path, const nlohmann::json &body, long timeout_sec) = 0;
};

// Where alert and report text goes.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void post(const std::string &text) = 0;
};

class HttpGatewayClient : public GatewayClient {
public:
    explicit HttpGatewayClient(GatewayOptions opts);

    std::optional<nlohmann::json> get_json(const std::string &path, long timeout_sec) override;
    bool post_json(const std::string &path, const nlohmann::json &body, long timeout_sec) override;

private:
    struct Response {
        bool transport_ok{false};
        long status{0};
        std::string body;
        std::string error;
    };

    Response perform(const std::string &method, const std::string &path, const std::string *body, long timeout_sec);

    GatewayOptions opts_;
};

// Posts notification text to the gateway's Slack relay. Failures are logged, not thrown.
class GatewayNotifier : public Notifier {
public:
    GatewayNotifier(GatewayClient &client, std::string channel);
    void post(const std::string &text) override;

private:
    GatewayClient &client_;
    std::string channel_;
};
