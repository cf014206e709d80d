#ifndef KEYSTONE_CONNECTORS_GENERATION_CLIENT_HPP
#define KEYSTONE_CONNECTORS_GENERATION_CLIENT_HPP

#include <stdexcept>
#include <string>
#include "config/redactor_config.hpp"

namespace keystone {
namespace connectors {

class GenerationError : public std::runtime_error
{
public:
    explicit GenerationError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief libcurl client for a Gemini-style generateContent endpoint.
 *
 * Sends one prompt, returns the first text part of the reply. Transport
 * errors and HTTP 5xx are retried up to maxRetries times; anything else that
 * is not a 200 with a text part throws GenerationError.
 *
 * The client only ever sees text that has been through a RedactionSession.
 * It does not log prompts or replies.
 */
class GenerationClient {
  public:
    explicit GenerationClient(const keystone::config::RedactorConfig& config);

    // True when the API key environment variable is set and non-empty.
    bool IsConfigured() const { return !m_apiKey.empty(); }

    std::string Generate(const std::string& prompt);

    // Request body for a single-turn prompt.
    static std::string BuildRequestBody(const std::string& prompt);

    // Extracts the reply text; throws GenerationError with the service's
    // error message when there is none.
    static std::string ParseResponseText(const std::string& body);

  private:
    static void initCurl();
    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata);

    // One POST. Returns false on a transport error, otherwise fills the
    // status code and body.
    bool httpPost(const std::string& url, const std::string& body, long& statusOut,
                  std::string& responseOut, std::string& errorOut);

    std::string m_url;
    std::string m_apiKey;
    long m_timeoutSeconds;
    unsigned m_maxRetries;
};

} // namespace connectors
} // namespace keystone

#endif // KEYSTONE_CONNECTORS_GENERATION_CLIENT_HPP
