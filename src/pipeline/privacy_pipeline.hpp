#ifndef KEYSTONE_PIPELINE_PRIVACY_PIPELINE_HPP
#define KEYSTONE_PIPELINE_PRIVACY_PIPELINE_HPP

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "config/redactor_config.hpp"
#include "core/audit_sink.hpp"
#include "core/entity.hpp"
#include "core/redaction_engine.hpp"
#include "core/redaction_session.hpp"
#include "core/restoration_engine.hpp"
#include "util/logger.hpp"

/**
 * @file privacy_pipeline.hpp
 * @brief The full detect -> redact -> generate -> restore cycle.
 *
 * The detector and the generation service are single-method capabilities,
 * so any callable fits: a PatternDetector, a statistical model bridge, a
 * libcurl GenerationClient, or a lambda in a test.
 *
 * USAGE EXAMPLE:
 *   @code
 *   keystone::detection::PatternDetector detector;
 *   keystone::connectors::GenerationClient client(cfg);
 *   keystone::pipeline::PrivacyPipeline pipeline(
 *       [&](const std::string &t) { return detector.Detect(t); },
 *       [&](const std::string &p) { return client.Generate(p); },
 *       cfg);
 *   keystone::pipeline::PipelineResult r = pipeline.Run(text);
 *   @endcode
 */

namespace keystone {
namespace pipeline {

using DetectFn = std::function<std::vector<core::EntitySpan>(const std::string&)>;

// Returns the model's reply or throws on failure.
using GenerateFn = std::function<std::string(const std::string&)>;

struct PipelineResult
{
    std::string sessionId;
    std::string redactedText;     // what the generator was given, before promptPrefix
    std::string modelOutput;      // raw reply, still with placeholders
    core::RedactionStats redactionStats;
    core::RestorationResult restoration;
};

inline core::RedactionOptions MakeRedactionOptions(const config::RedactorConfig &cfg)
{
    core::RedactionOptions options;
    options.minConfidence = cfg.minConfidence;
    options.maxSlotsPerCategory = cfg.maxSlotsPerCategory;
    options.labelsToRedact = cfg.labelsToRedact;
    return options;
}

/*
  PrivacyPipeline
  --------------------------------
  Runs one RedactionSession per call to Run(). The session, and with it the
  map, is destroyed before Run() returns; only redacted text, the raw reply
  and the restored result leave.

  Error behaviour:
    - RedactionError from the redaction pass propagates before the
      generator is called.
    - Whatever the generator throws propagates unchanged.
    - Restoration anomalies are returned in the result, never thrown.
*/
class PrivacyPipeline
{
public:
    PrivacyPipeline(DetectFn detect, GenerateFn generate, const config::RedactorConfig &cfg)
        : m_detect(std::move(detect)),
          m_generate(std::move(generate)),
          m_options(MakeRedactionOptions(cfg)),
          m_extraCategories(cfg.extraCategories),
          m_promptPrefix(cfg.promptPrefix),
          m_audit(nullptr)
    {
        if (!m_detect || !m_generate) {
            throw std::invalid_argument("PrivacyPipeline: detector and generator are required");
        }
    }

    void SetAuditSink(core::AuditSink *sink) { m_audit = sink; }

    PipelineResult Run(const std::string &inputText)
    {
        using keystone::util::logger::Logger;
        Logger &logger = Logger::getInstance();

        core::RedactionSession session(inputText, m_options, m_extraCategories);
        session.SetAuditSink(m_audit);

        std::vector<core::EntitySpan> spans = m_detect(inputText);
        logger.info("[PrivacyPipeline] Session " + session.GetSessionId() + ": " +
                    std::to_string(spans.size()) + " spans detected");

        const core::RedactionResult &redaction = session.Redact(spans);

        PipelineResult result;
        result.sessionId = session.GetSessionId();
        result.redactedText = redaction.redactedText;
        result.redactionStats = redaction.stats;

        logger.info("[PrivacyPipeline] Session " + result.sessionId + ": sending redacted prompt");
        result.modelOutput = m_generate(m_promptPrefix + result.redactedText);

        result.restoration = session.Restore(result.modelOutput);
        if (!result.restoration.Clean()) {
            logger.warn("[PrivacyPipeline] Session " + result.sessionId + ": " +
                        std::to_string(result.restoration.anomalies.size()) +
                        " anomalies need review");
        }
        return result;
    }

private:
    DetectFn m_detect;
    GenerateFn m_generate;
    core::RedactionOptions m_options;
    std::vector<std::string> m_extraCategories;
    std::string m_promptPrefix;
    core::AuditSink *m_audit;
};

} // namespace pipeline
} // namespace keystone

#endif // KEYSTONE_PIPELINE_PRIVACY_PIPELINE_HPP
