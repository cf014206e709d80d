#ifndef KEYSTONE_CONFIG_REDACTOR_CONFIG_HPP
#define KEYSTONE_CONFIG_REDACTOR_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file redactor_config.hpp
 * @brief Settings for one Keystone redactor process.
 *
 * USAGE:
 *   - Populated manually or through util/config_parser.hpp.
 *   - Engine settings (confidence threshold, category filter, slot budget)
 *     are copied into each RedactionSession; nothing here is per-session state.
 */

namespace keystone {
namespace config {

/**
 * @struct RedactorConfig
 * @brief Engine, generation-client, audit and logging settings.
 */
struct RedactorConfig
{
    /**
     * @brief Defaults:
     *   logLevel = "INFO", no log file
     *   minConfidence = 0.0 (every span is redacted)
     *   maxSlotsPerCategory = 18278 (all one to three letter slots)
     *   auditDatabase = "" (audit disabled)
     *   generationModel = "gemini-2.5-flash", apiKeyEnv = "GEMINI_API_KEY"
     *   requestTimeoutSeconds = 30, maxRetries = 2
     */
    RedactorConfig()
        : logLevel("INFO"),
          logFile(),
          minConfidence(0.0),
          maxSlotsPerCategory(18278),
          labelsToRedact(),
          extraCategories(),
          auditDatabase(),
          generationEndpoint("https://generativelanguage.googleapis.com/v1beta/models"),
          generationModel("gemini-2.5-flash"),
          apiKeyEnv("GEMINI_API_KEY"),
          requestTimeoutSeconds(30),
          maxRetries(2),
          promptPrefix()
    {
    }

    /// Minimum log level name (DEBUG, INFO, WARN, ERROR, CRITICAL).
    std::string logLevel;

    /// Optional file that mirrors console log output.
    std::string logFile;

    /// Spans with a lower detector confidence are not redacted.
    double minConfidence;

    /// Upper bound on distinct placeholders per category in one session.
    uint64_t maxSlotsPerCategory;

    /// If non-empty, only these category names are redacted.
    std::vector<std::string> labelsToRedact;

    /// Custom category tags accepted as well-formed during restoration.
    std::vector<std::string> extraCategories;

    /// SQLite file for audit records; empty disables auditing.
    std::string auditDatabase;

    /// Base URL of the generation service; the model name is appended.
    std::string generationEndpoint;

    std::string generationModel;

    /// Name of the environment variable holding the API key.
    std::string apiKeyEnv;

    uint32_t requestTimeoutSeconds;

    /// Extra attempts after a transport error or HTTP 5xx.
    uint32_t maxRetries;

    /// Instruction text placed in front of the redacted prompt.
    std::string promptPrefix;
};

} // namespace config
} // namespace keystone

#endif // KEYSTONE_CONFIG_REDACTOR_CONFIG_HPP
