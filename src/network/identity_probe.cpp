#include "network/identity_probe.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <mutex>
#include <nlohmann/json.hpp>

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

IdentityProbe::IdentityProbe(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
}

bool IdentityProbe::parseIdentity(const std::string& body, IdentityInfo& info) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("MediaContainer")) {
        return false;
    }

    const auto& container = parsed.at("MediaContainer");
    if (!container.is_object()) {
        return false;
    }
    info.machineIdentifier = container.value("machineIdentifier", "");
    info.version = container.value("version", "");
    info.friendlyName = container.value("friendlyName", "");
    return !info.machineIdentifier.empty();
}

bool IdentityProbe::probe(const std::string& ip, int port, IdentityInfo& info) const {
    ensureCurlInitialized();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return false;
    }

    std::string url = "http://" + ip + ":" + std::to_string(port) + "/identity";
    std::string body;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        Logger::debug("Identity probe of " + url + " failed: " + curl_easy_strerror(res));
        return false;
    }
    if (httpCode != 200) {
        Logger::debug("Identity probe of " + url + " returned HTTP " + std::to_string(httpCode));
        return false;
    }
    return parseIdentity(body, info);
}

bool IdentityProbe::confirm(NetworkPeer& peer) const {
    IdentityInfo info;
    if (!probe(peer.ip, peer.effectivePort(), info)) {
        return false;
    }

    peer.machineId = info.machineIdentifier;
    peer.version = info.version;
    if (!info.friendlyName.empty()) {
        peer.serverName = info.friendlyName;
    }
    peer.confirmed = true;
    return true;
}
