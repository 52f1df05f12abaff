#include "signal_rule_factory.hpp"
#include "crossover_rule.hpp"
#include "threshold_rule.hpp"
#include "band_breakout_rule.hpp"
#include "common_types.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <string>

namespace strategy_engine {

    using json = nlohmann::json;

    namespace {

        std::string requireString(const json& config, const char* key, const std::string& type) {
            if (!config.contains(key) || !config[key].is_string()) {
                throw std::invalid_argument(fmt::format("{} rule requires '{}' (string).", type, key));
            }
            return config[key].get<std::string>();
        }

        double requireNumber(const json& config, const char* key, const std::string& type) {
            if (!config.contains(key) || !config[key].is_number()) {
                throw std::invalid_argument(fmt::format("{} rule requires '{}' (number).", type, key));
            }
            return config[key].get<double>();
        }

    } // end anonymous namespace

    std::unique_ptr<ISignalRule> SignalRuleFactory::createRule(const json& config,
                                                               std::shared_ptr<spdlog::logger> logger) {
        logger = core::logging::orNull(std::move(logger));
        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
            throw core::ConfigException("Rule config must be an object with a 'type' (string).");
        }
        std::string type = config["type"].get<std::string>();
        logger->trace("Parsing signal rule of type: {}", type);

        try {
            core::SignalFamily family = core::utils::signalFamilyFromString(requireString(config, "family", type));

            if (type == "crossover") {
                return std::make_unique<CrossoverRule>(family,
                                                       resolveLine(requireString(config, "fast", type)),
                                                       resolveLine(requireString(config, "slow", type)),
                                                       logger);
            } else if (type == "threshold") {
                return std::make_unique<ThresholdRule>(family,
                                                       resolveLine(requireString(config, "line", type)),
                                                       requireNumber(config, "lower", type),
                                                       requireNumber(config, "upper", type),
                                                       logger);
            } else if (type == "band_breakout") {
                std::string price = config.contains("price") ? requireString(config, "price", type) : "CLOSE";
                return std::make_unique<BandBreakoutRule>(family,
                                                          resolveLine(price),
                                                          resolveLine(requireString(config, "upper", type)),
                                                          resolveLine(requireString(config, "lower", type)),
                                                          logger);
            }
            throw std::invalid_argument(fmt::format("Unknown rule type '{}' in config.", type));
        } catch (const json::exception& e) {
            logger->error("JSON error parsing rule type '{}': {}", type, e.what());
            throw core::ConfigException(fmt::format("Invalid JSON structure for rule type '{}': {}", type, e.what()));
        } catch (const std::invalid_argument& e) {
            logger->error("Invalid config for rule type '{}': {}", type, e.what());
            throw core::ConfigException(e.what());
        }
    }

    json SignalRuleFactory::standardRuleConfigs(const SignalConfig& config) {
        return json::array({
            {{"family", "macd"}, {"type", "crossover"}, {"fast", "MACD_DIF"}, {"slow", "MACD_DEA"}},
            {{"family", "rsi"}, {"type", "threshold"}, {"line", fmt::format("RSI({})", config.rsi_period)},
             {"lower", config.rsi_oversold}, {"upper", config.rsi_overbought}},
            {{"family", "kdj"}, {"type", "crossover"}, {"fast", "KDJ_K"}, {"slow", "KDJ_D"}},
            {{"family", "bollinger"}, {"type", "band_breakout"}, {"price", "CLOSE"},
             {"upper", "BOLL_UPPER"}, {"lower", "BOLL_LOWER"}},
            {{"family", "ma"}, {"type", "crossover"},
             {"fast", fmt::format("MA({})", config.ma_short_period)},
             {"slow", fmt::format("MA({})", config.ma_long_period)}}
        });
    }

    std::vector<std::unique_ptr<ISignalRule>> SignalRuleFactory::createRules(const SignalConfig& config,
                                                                            std::shared_ptr<spdlog::logger> logger) {
        logger = core::logging::orNull(std::move(logger));
        config.validate();

        std::vector<std::unique_ptr<ISignalRule>> rules;
        for (const auto& rule_config : standardRuleConfigs(config)) {
            rules.push_back(createRule(rule_config, logger));
            logger->debug("Created signal rule: {}", rules.back()->describe());
        }
        return rules;
    }

} // namespace strategy_engine
