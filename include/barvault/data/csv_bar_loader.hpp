// csv_bar_loader.hpp
// CSV Bar Loader
// Reads timestamp,open,high,low,close,volume[,buy_volume] rows for replay

#pragma once

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/bar_types.hpp"
#include "../core/exceptions.hpp"

namespace barvault {

// ============================================================================
// CSV Bar Loader
// ============================================================================

class CsvBarLoader {
public:
    struct CsvConfig {
        bool has_header;
        char delimiter;
        bool same_timestamp_amends;  // consecutive equal timestamps revise the forming bar

        CsvConfig()
            : has_header(true)
            , delimiter(',')
            , same_timestamp_amends(false) {}

        static CsvConfig getDefault() {
            return CsvConfig();
        }
    };

    // One replay step; amends_previous marks a row repeating the previous row's timestamp
    struct BarRecord {
        Bar bar;
        bool amends_previous = false;
        std::size_t line = 0;
    };

private:
    CsvConfig config_;
    std::size_t rows_loaded_ = 0;

    std::vector<std::string> splitLine(const std::string& line, char delimiter) const {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, delimiter)) {
            token.erase(0, token.find_first_not_of(" \t\r\n"));
            token.erase(token.find_last_not_of(" \t\r\n") + 1);
            tokens.push_back(token);
        }
        return tokens;
    }

    static bool isBlank(const std::string& line) {
        return line.find_first_not_of(" \t\r\n") == std::string::npos;
    }

    static std::int64_t parseTimestamp(const std::string& token) {
        std::size_t consumed = 0;
        const long long value = std::stoll(token, &consumed);
        if (consumed != token.size()) {
            throw std::invalid_argument("timestamp '" + token + "' is not an integer");
        }
        return static_cast<std::int64_t>(value);
    }

    static double parseNumber(const std::string& token, const char* column) {
        std::size_t consumed = 0;
        const double value = std::stod(token, &consumed);
        if (consumed != token.size()) {
            throw std::invalid_argument(std::string(column) + " '" + token + "' is not a number");
        }
        return value;
    }

public:
    CsvBarLoader() : config_(CsvConfig::getDefault()) {}

    explicit CsvBarLoader(const CsvConfig& config) : config_(config) {}

    std::vector<BarRecord> parse(std::istream& in, const std::string& source = "<stream>") {
        std::vector<BarRecord> records;
        std::string line;
        std::size_t line_num = 0;

        if (config_.has_header) {
            if (!std::getline(in, line)) {
                throw DataException("Empty CSV input: " + source);
            }
            ++line_num;
        }

        while (std::getline(in, line)) {
            ++line_num;
            if (isBlank(line)) continue;

            auto tokens = splitLine(line, config_.delimiter);
            if (tokens.size() < 6) {
                throw DataException("Invalid CSV format at line " + std::to_string(line_num) +
                                    " of " + source + ": expected at least 6 columns, got " +
                                    std::to_string(tokens.size()));
            }

            BarRecord record;
            record.line = line_num;
            try {
                record.bar.timestamp = parseTimestamp(tokens[0]);
                record.bar.open = parseNumber(tokens[1], "open");
                record.bar.high = parseNumber(tokens[2], "high");
                record.bar.low = parseNumber(tokens[3], "low");
                record.bar.close = parseNumber(tokens[4], "close");
                record.bar.volume = parseNumber(tokens[5], "volume");
                record.bar.buy_volume =
                    (tokens.size() > 6 && !tokens[6].empty()) ? parseNumber(tokens[6], "buy_volume") : 0.0;
            } catch (const std::exception& e) {
                throw DataException("Error parsing line " + std::to_string(line_num) + " of " +
                                    source + ": " + e.what());
            }

            record.amends_previous = config_.same_timestamp_amends && !records.empty() &&
                                     records.back().bar.timestamp == record.bar.timestamp;
            records.push_back(record);
        }

        rows_loaded_ += records.size();
        return records;
    }

    std::vector<BarRecord> loadFile(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw DataException("Failed to open CSV file: " + filepath);
        }
        return parse(file, filepath);
    }

    std::size_t rowsLoaded() const { return rows_loaded_; }
    const CsvConfig& config() const { return config_; }
};

} // namespace barvault
