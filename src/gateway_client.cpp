#include "gateway_client.h"

#include "NanoLogCpp17.h"

#include <curl/curl.h>

#include <mutex>

using namespace NanoLog::LogLevels;

namespace {
constexpr long kNotifyTimeoutSec = 5;

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *out = static_cast<std::string *>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}
}

HttpGatewayClient::HttpGatewayClient(GatewayOptions opts) : opts_(std::move(opts)) {
    opts_.base_url = trim_trailing_slash(opts_.base_url);
    ensure_curl_global_init();
}

HttpGatewayClient::Response HttpGatewayClient::perform(const std::string &method, const std::string &path,
                                                       const std::string *body, long timeout_sec) {
    Response resp;
    CURL *curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return resp;
    }

    std::string url = opts_.base_url + path;
    curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, ("X-Auth-Token: " + opts_.auth_token).c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body ? body->c_str() : "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body ? body->size() : 0));
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    resp.transport_ok = res == CURLE_OK;
    if (!resp.transport_ok) resp.error = curl_easy_strerror(res);
    return resp;
}

std::optional<nlohmann::json> HttpGatewayClient::get_json(const std::string &path, long timeout_sec) {
    auto resp = perform("GET", path, nullptr, timeout_sec);
    if (!resp.transport_ok || resp.status < 200 || resp.status >= 300) {
        auto why = resp.transport_ok ? "HTTP " + std::to_string(resp.status) : resp.error;
        NANO_LOG(WARNING, "GET %s failed: %s", path.c_str(), why.c_str());
        return std::nullopt;
    }
    auto parsed = nlohmann::json::parse(resp.body, nullptr, false);
    if (parsed.is_discarded()) {
        NANO_LOG(WARNING, "GET %s returned invalid JSON", path.c_str());
        return std::nullopt;
    }
    return parsed;
}

bool HttpGatewayClient::post_json(const std::string &path, const nlohmann::json &body, long timeout_sec) {
    auto payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto resp = perform("POST", path, &payload, timeout_sec);
    if (!resp.transport_ok || resp.status < 200 || resp.status >= 300) {
        auto why = resp.transport_ok ? "HTTP " + std::to_string(resp.status) : resp.error;
        NANO_LOG(WARNING, "POST %s failed: %s", path.c_str(), why.c_str());
        return false;
    }
    return true;
}

GatewayNotifier::GatewayNotifier(GatewayClient &client, std::string channel)
    : client_(client), channel_(std::move(channel)) {}

void GatewayNotifier::post(const std::string &text) {
    nlohmann::json body{{"text", text}, {"channel", channel_}};
    if (!client_.post_json("/slack/report/send", body, kNotifyTimeoutSec)) {
        NANO_LOG(WARNING, "%s", "notification post failed");
    }
}
