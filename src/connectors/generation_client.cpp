#include "connectors/generation_client.hpp"

#include <cstdlib>
#include <curl/curl.h>
#include <mutex>
#include "util/json_text.hpp"
#include "util/logger.hpp"

namespace keystone {
namespace connectors {

GenerationClient::GenerationClient(const keystone::config::RedactorConfig& config)
    : m_url(config.generationEndpoint + "/" + config.generationModel + ":generateContent"),
      m_timeoutSeconds(static_cast<long>(config.requestTimeoutSeconds)),
      m_maxRetries(config.maxRetries) {
    const char* key = std::getenv(config.apiKeyEnv.c_str());
    if (key) {
        m_apiKey = key;
    }
    if (m_apiKey.empty()) {
        keystone::util::logger::warn("[GenerationClient] " + config.apiKeyEnv +
                                     " is not set; requests will not be sent.");
    }
    initCurl();
}

std::string GenerationClient::Generate(const std::string& prompt) {
    using keystone::util::logger::Logger;
    Logger& logger = Logger::getInstance();

    if (!IsConfigured()) {
        throw GenerationError("GenerationClient: no API key configured");
    }

    const std::string body = BuildRequestBody(prompt);
    std::string lastError;
    for (unsigned attempt = 0; attempt <= m_maxRetries; ++attempt) {
        long status = 0;
        std::string response;
        std::string transportError;
        if (!httpPost(m_url, body, status, response, transportError)) {
            lastError = "transport error: " + transportError;
            logger.warn("[GenerationClient] Attempt " + std::to_string(attempt + 1) + " failed, " +
                        lastError);
            continue;
        }
        if (status >= 500) {
            lastError = "HTTP " + std::to_string(status);
            logger.warn("[GenerationClient] Attempt " + std::to_string(attempt + 1) +
                        " failed, " + lastError);
            continue;
        }
        if (status != 200) {
            std::string message;
            std::string detail;
            if (util::json::extractStringValue(response, "message", message)) {
                detail = ": " + message;
            }
            throw GenerationError("GenerationClient: HTTP " + std::to_string(status) + detail);
        }
        logger.debug("[GenerationClient] Reply received on attempt " + std::to_string(attempt + 1));
        return ParseResponseText(response);
    }
    throw GenerationError("GenerationClient: giving up after " + std::to_string(m_maxRetries + 1) +
                          " attempts, " + lastError);
}

std::string GenerationClient::BuildRequestBody(const std::string& prompt) {
    return "{\"contents\":[{\"role\":\"user\",\"parts\":[{\"text\":\"" +
           util::json::escapeString(prompt) + "\"}]}]}";
}

std::string GenerationClient::ParseResponseText(const std::string& body) {
    std::string text;
    if (util::json::extractStringValue(body, "text", text)) {
        return text;
    }
    std::string message;
    if (util::json::extractStringValue(body, "message", message)) {
        throw GenerationError("GenerationClient: service error: " + message);
    }
    throw GenerationError("GenerationClient: reply contains no text part");
}

void GenerationClient::initCurl() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t GenerationClient::writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    if (!userdata)
        return 0;
    std::string* resp = reinterpret_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    resp->append(ptr, total);
    return total;
}

bool GenerationClient::httpPost(const std::string& url, const std::string& body, long& statusOut,
                                std::string& responseOut, std::string& errorOut) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        errorOut = "curl_easy_init failed";
        return false;
    }

    const std::string keyHeader = "x-goog-api-key: " + m_apiKey;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, keyHeader.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseOut);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusOut);
    } else {
        errorOut = curl_easy_strerror(res);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    return res == CURLE_OK;
}

} // namespace connectors
} // namespace keystone
