#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

#include "audit/audit_log.hpp"
#include "config/redactor_config.hpp"
#include "connectors/generation_client.hpp"
#include "core/errors.hpp"
#include "core/restoration_engine.hpp"
#include "detection/pattern_detector.hpp"
#include "pipeline/privacy_pipeline.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

bool readInput(const std::string& path, std::string& out) {
    if (path.empty()) {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

} // namespace

int main(int argc, char** argv) {
    using keystone::util::logger::Logger;
    Logger& logger = Logger::getInstance();
    // stdout carries the results only
    logger.setConsoleToStderr(true);

    // 1. Parse configuration
    keystone::config::RedactorConfig config;
    std::string configPath = "keystone.conf";
    if (argc > 1) {
        configPath = argv[1];
    }
    std::string inputPath;
    if (argc > 2) {
        inputPath = argv[2];
    }

    try {
        keystone::util::ConfigParser parser(config);
        parser.loadFromFile(configPath);
        logger.setLogLevel(keystone::util::logger::parseLogLevel(config.logLevel));
    } catch (const std::exception& ex) {
        logger.critical(std::string("[main] Invalid configuration: ") + ex.what());
        return 1;
    }
    if (!config.logFile.empty()) {
        logger.enableFileOutput(config.logFile, true);
    }

    std::string input;
    if (!readInput(inputPath, input)) {
        logger.critical("[main] Cannot read input file: " + inputPath);
        return 1;
    }

    // 2. Collaborators
    keystone::detection::PatternDetector detector;
    keystone::connectors::GenerationClient client(config);

    std::unique_ptr<keystone::audit::AuditLog> audit;
    if (!config.auditDatabase.empty()) {
        try {
            audit = std::make_unique<keystone::audit::AuditLog>(config.auditDatabase);
        } catch (const keystone::audit::AuditError& ex) {
            logger.error(std::string("[main] Audit disabled: ") + ex.what());
        }
    }

    const bool dryRun = !client.IsConfigured();
    if (dryRun) {
        logger.warn("[main] No generation credentials; the redacted prompt is echoed back.");
    }

    keystone::pipeline::PrivacyPipeline pipeline(
        [&detector](const std::string& text) { return detector.Detect(text); },
        [&client, dryRun](const std::string& prompt) {
            return dryRun ? prompt : client.Generate(prompt);
        },
        config);
    pipeline.SetAuditSink(audit.get());

    // 3. Run one session
    keystone::pipeline::PipelineResult result;
    try {
        result = pipeline.Run(input);
    } catch (const keystone::core::RedactionError& ex) {
        logger.critical(std::string("[main] Redaction aborted, nothing was sent: ") + ex.what());
        return 1;
    } catch (const keystone::connectors::GenerationError& ex) {
        logger.critical(std::string("[main] Generation failed: ") + ex.what());
        return 1;
    }

    std::cout << "=== REDACTED ===\n" << result.redactedText << "\n";
    std::cout << "=== RESTORED ===\n" << result.restoration.restoredText << "\n";
    if (!result.restoration.anomalies.empty()) {
        std::cout << "=== ANOMALIES ===\n";
        for (const auto& anomaly : result.restoration.anomalies) {
            std::cout << keystone::core::ToString(anomaly.reason) << " " << anomaly.token
                      << " @" << anomaly.offset << "\n";
        }
    }

    logger.info("[main] Session " + result.sessionId + " complete.");
    return 0;
}
