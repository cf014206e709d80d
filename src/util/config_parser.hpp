#ifndef KEYSTONE_UTIL_CONFIG_PARSER_HPP
#define KEYSTONE_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <fstream>
#include <istream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "config/redactor_config.hpp"
#include "core/entity.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Parser for Keystone's plain-text redactor configuration.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file.
 *   - Populate keystone::config::RedactorConfig fields.
 *   - Lists (labelsToRedact, extraCategories) are comma separated.
 *   - A missing file is not an error: defaults stay in place.
 *
 * USAGE:
 *   @code
 *   keystone::config::RedactorConfig cfg;
 *   keystone::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("keystone.conf");
 *   @endcode
 */

namespace keystone {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads key=value lines into a RedactorConfig.
 */
class ConfigParser
{
public:
    explicit ConfigParser(keystone::config::RedactorConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Read the given file, parse line by line, storing recognized keys.
     * @throw std::runtime_error if lines or values are malformed.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            keystone::util::logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return;
        }

        keystone::util::logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        keystone::util::logger::info("ConfigParser: Config loaded.");
    }

    /**
     * @brief Parse configuration text from any stream.
     * @throw std::runtime_error if lines or values are malformed.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo) +
                                         " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

private:
    keystone::config::RedactorConfig &config_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        using keystone::util::logger::debug;

        if (key == "logLevel") {
            // validate now so a typo fails at load time
            keystone::util::logger::parseLogLevel(val);
            config_.logLevel = val;
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else if (key == "minConfidence") {
            config_.minConfidence = parseDouble(val);
            if (config_.minConfidence < 0.0 || config_.minConfidence > 1.0) {
                throw std::runtime_error("ConfigParser: minConfidence must be within [0, 1]: " + val);
            }
        }
        else if (key == "maxSlotsPerCategory") {
            config_.maxSlotsPerCategory = parseUInt(val);
            if (config_.maxSlotsPerCategory == 0) {
                throw std::runtime_error("ConfigParser: maxSlotsPerCategory must be positive");
            }
        }
        else if (key == "labelsToRedact") {
            config_.labelsToRedact = parseCategoryList(key, val);
        }
        else if (key == "extraCategories") {
            config_.extraCategories = parseCategoryList(key, val);
        }
        else if (key == "auditDatabase") {
            config_.auditDatabase = val;
        }
        else if (key == "generationEndpoint") {
            config_.generationEndpoint = val;
        }
        else if (key == "generationModel") {
            config_.generationModel = val;
        }
        else if (key == "apiKeyEnv") {
            config_.apiKeyEnv = val;
        }
        else if (key == "requestTimeoutSeconds") {
            config_.requestTimeoutSeconds = static_cast<uint32_t>(parseUInt(val));
        }
        else if (key == "maxRetries") {
            config_.maxRetries = static_cast<uint32_t>(parseUInt(val));
        }
        else if (key == "promptPrefix") {
            config_.promptPrefix = unescapeNewlines(val);
        }
        else {
            keystone::util::logger::warn("ConfigParser: Unrecognized key '" + key + "'");
            return;
        }
        debug("ConfigParser: " + key + " set");
    }

    inline void trim(std::string &s) const
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    inline uint64_t parseUInt(const std::string &val) const
    {
        if (val.empty() || val[0] == '-') {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    inline double parseDouble(const std::string &val) const
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return d;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseDouble failed on '" + val + "': " + ex.what());
        }
    }

    inline std::vector<std::string> parseList(const std::string &val) const
    {
        std::vector<std::string> out;
        std::istringstream iss(val);
        std::string item;
        while (std::getline(iss, item, ',')) {
            trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
        }
        return out;
    }

    // A misspelt label would silently filter every span, so each entry must
    // be a category tag (upper case, digits, single underscores).
    inline std::vector<std::string> parseCategoryList(const std::string &key,
                                                      const std::string &val) const
    {
        std::vector<std::string> out = parseList(val);
        for (const auto &item : out) {
            if (!keystone::core::EntityCategory::IsValidTag(item)) {
                throw std::runtime_error("ConfigParser: invalid category '" + item + "' in " + key);
            }
        }
        return out;
    }

    // "\n" in a value becomes a newline; everything else is literal
    inline std::string unescapeNewlines(const std::string &val) const
    {
        std::string out;
        out.reserve(val.size());
        for (size_t i = 0; i < val.size(); ++i) {
            if (val[i] == '\\' && i + 1 < val.size() && val[i + 1] == 'n') {
                out.push_back('\n');
                ++i;
            } else {
                out.push_back(val[i]);
            }
        }
        return out;
    }
};

} // namespace util
} // namespace keystone

#endif // KEYSTONE_UTIL_CONFIG_PARSER_HPP
