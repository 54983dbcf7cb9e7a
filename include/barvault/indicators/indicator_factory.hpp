// indicator_factory.hpp
// Indicator Factory
// Builds indicators from compact text specs such as "sma:close:20" or "macd:12:26:9"

#pragma once

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "../core/bar_types.hpp"
#include "../core/exceptions.hpp"
#include "../interfaces/indicator.hpp"
#include "moving_average.hpp"
#include "oscillators.hpp"
#include "volatility.hpp"

namespace barvault {

// ============================================================================
// Indicator Factory
// ============================================================================

class IndicatorFactory {
public:
    // Largest window a text spec may ask for; each window slot is allocated up front
    static constexpr std::size_t kMaxPeriod = 1000000;

private:
    static std::vector<std::string> splitSpec(const std::string& spec, char delimiter) {
        std::vector<std::string> tokens;
        std::stringstream ss(spec);
        std::string token;
        while (std::getline(ss, token, delimiter)) {
            token.erase(0, token.find_first_not_of(" \t\r\n"));
            token.erase(token.find_last_not_of(" \t\r\n") + 1);
            tokens.push_back(token);
        }
        return tokens;
    }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static void requireArity(const std::vector<std::string>& tokens, std::size_t args,
                             const std::string& spec, const char* usage) {
        if (tokens.size() != args + 1) {
            throw InvalidArgumentException("indicator spec '" + spec + "' malformed, expected " +
                                           usage);
        }
    }

    static std::size_t parsePeriod(const std::string& token, const std::string& spec) {
        if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos) {
            throw InvalidArgumentException("indicator spec '" + spec + "': period '" + token +
                                           "' is not a positive integer");
        }
        std::size_t period = 0;
        try {
            period = static_cast<std::size_t>(std::stoull(token));
        } catch (const std::exception& e) {
            throw InvalidArgumentException("indicator spec '" + spec + "': period '" + token +
                                           "' out of range (" + e.what() + ")");
        }
        if (period == 0 || period > kMaxPeriod) {
            throw InvalidArgumentException("indicator spec '" + spec + "': period must be in [1, " +
                                           std::to_string(kMaxPeriod) + "]");
        }
        return period;
    }

    static double parseMultiplier(const std::string& token, const std::string& spec) {
        std::size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(token, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (token.empty() || consumed != token.size()) {
            throw InvalidArgumentException("indicator spec '" + spec + "': multiplier '" + token +
                                           "' is not a number");
        }
        return value;
    }

    static BarField parseInputField(const std::string& token, const std::string& spec) {
        const BarField field = parseBarField(toLower(token));
        if (field == BarField::Timestamp) {
            throw InvalidArgumentException("indicator spec '" + spec +
                                           "': timestamp is not an indicator input");
        }
        return field;
    }

public:
    // Throws InvalidArgumentException for unknown names, wrong arity or bad numbers
    static std::unique_ptr<IIndicator> create(const std::string& spec) {
        const auto tokens = splitSpec(spec, ':');
        if (tokens.empty() || tokens[0].empty()) {
            throw InvalidArgumentException("empty indicator spec");
        }
        const std::string name = toLower(tokens[0]);

        if (name == "sma") {
            requireArity(tokens, 2, spec, "sma:<field>:<period>");
            return std::make_unique<SimpleMovingAverage>(parseInputField(tokens[1], spec),
                                                         parsePeriod(tokens[2], spec));
        }
        if (name == "ema") {
            requireArity(tokens, 2, spec, "ema:<field>:<period>");
            return std::make_unique<ExponentialMovingAverage>(parseInputField(tokens[1], spec),
                                                              parsePeriod(tokens[2], spec));
        }
        if (name == "stddev" || name == "std") {
            requireArity(tokens, 2, spec, "stddev:<field>:<period>");
            return std::make_unique<StandardDeviation>(parseInputField(tokens[1], spec),
                                                       parsePeriod(tokens[2], spec));
        }
        if (name == "boll" || name == "bollinger") {
            requireArity(tokens, 2, spec, "boll:<period>:<k>");
            return std::make_unique<BollingerBands>(parsePeriod(tokens[1], spec),
                                                    parseMultiplier(tokens[2], spec));
        }
        if (name == "rsi") {
            requireArity(tokens, 1, spec, "rsi:<period>");
            return std::make_unique<RelativeStrengthIndex>(parsePeriod(tokens[1], spec));
        }
        if (name == "macd") {
            requireArity(tokens, 3, spec, "macd:<fast>:<slow>:<signal>");
            return std::make_unique<MovingAverageConvergenceDivergence>(
                parsePeriod(tokens[1], spec), parsePeriod(tokens[2], spec),
                parsePeriod(tokens[3], spec));
        }
        if (name == "atr") {
            requireArity(tokens, 1, spec, "atr:<period>");
            return std::make_unique<AverageTrueRange>(parsePeriod(tokens[1], spec));
        }
        if (name == "vri") {
            requireArity(tokens, 1, spec, "vri:<period>");
            return std::make_unique<VolumeRatio>(parsePeriod(tokens[1], spec));
        }

        throw InvalidArgumentException("unknown indicator '" + tokens[0] + "' in spec '" +
                                       spec + "'");
    }

    static std::vector<std::string> supportedNames() {
        return {"sma", "ema", "stddev", "boll", "rsi", "macd", "atr", "vri"};
    }
};

} // namespace barvault
