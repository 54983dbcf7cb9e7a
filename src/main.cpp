// main.cpp
// barvault_replay
// Replays a CSV bar file through a BarSeries and prints the retained tail with indicator readings

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "barvault/core/bar_types.hpp"
#include "barvault/core/exceptions.hpp"
#include "barvault/data/csv_bar_loader.hpp"
#include "barvault/engine/bar_aggregator.hpp"
#include "barvault/engine/bar_replayer.hpp"
#include "barvault/engine/bar_series.hpp"
#include "barvault/engine/multi_period_series.hpp"
#include "barvault/export/zero_copy_exporter.hpp"

using namespace barvault;

// ============================================================================
// Configuration Structure
// ============================================================================

struct ReplayConfig {
    std::string data_file;
    std::int64_t capacity = 120;

    // id -> spec, in registration order
    std::vector<std::pair<std::string, std::string>> indicators;

    // Aggregation periods; empty replays the rows as they are
    std::vector<std::string> periods;

    // CSV configuration
    bool has_header = true;
    char delimiter = ',';
    bool same_timestamp_amends = false;

    // Store validation
    bool validate_ohlc = false;
    bool skip_invalid = false;

    // Output configuration
    std::size_t tail = 10;
    bool verbose = false;
};

// ============================================================================
// Command Line Argument Parser
// ============================================================================

void printUsage(const char* program_name) {
    std::cout << "barvault replay\n";
    std::cout << "===============\n\n";
    std::cout << "Usage: " << program_name << " --data FILE [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --data FILE          CSV file: timestamp,open,high,low,close,volume[,buy_volume]\n";
    std::cout << "  -c, --capacity N         Retained bars (default: 120)\n";
    std::cout << "  -i, --indicator ID=SPEC  Register an indicator, repeatable (e.g. ma20=sma:close:20)\n";
    std::cout << "  -p, --period P           Aggregate rows into P candles, repeatable (e.g. 15m, 1h, 500ms)\n";
    std::cout << "  -t, --tail N             Rows printed from the end of the window (default: 10)\n";
    std::cout << "  --delimiter C            Field delimiter (default: ',')\n";
    std::cout << "  --no-header              First line is data\n";
    std::cout << "  --amend-same-ts          Rows repeating the previous timestamp amend the forming bar\n";
    std::cout << "  --strict-ohlc            Reject bars whose high/low do not bound open/close\n";
    std::cout << "  --skip-invalid           Count and skip rejected bars instead of stopping\n";
    std::cout << "  --verbose                Enable verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\nIndicator specs:\n";
    std::cout << "  sma:<field>:<p>  ema:<field>:<p>  stddev:<field>:<p>  boll:<p>:<k>\n";
    std::cout << "  rsi:<p>  macd:<fast>:<slow>:<signal>  atr:<p>  vri:<p>\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " --data bars.csv -i ma20=sma:close:20 -i rsi=rsi:14\n";
    std::cout << "  " << program_name << " -d ticks.csv -c 500 --amend-same-ts -i bb=boll:20:2 --verbose\n";
    std::cout << "  " << program_name << " -d bars_1m.csv -p 15m -p 1h -i atr=atr:14\n";
}

bool parseArguments(int argc, char* argv[], ReplayConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            return false;
        }
        else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            config.data_file = argv[++i];
        }
        else if ((arg == "-c" || arg == "--capacity") && i + 1 < argc) {
            config.capacity = std::stoll(argv[++i]);
        }
        else if ((arg == "-i" || arg == "--indicator") && i + 1 < argc) {
            std::string entry = argv[++i];
            const std::size_t eq = entry.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Indicator must be ID=SPEC: " << entry << std::endl;
                return false;
            }
            config.indicators.emplace_back(entry.substr(0, eq), entry.substr(eq + 1));
        }
        else if ((arg == "-p" || arg == "--period") && i + 1 < argc) {
            config.periods.push_back(argv[++i]);
        }
        else if ((arg == "-t" || arg == "--tail") && i + 1 < argc) {
            config.tail = std::stoull(argv[++i]);
        }
        else if (arg == "--delimiter" && i + 1 < argc) {
            std::string d = argv[++i];
            if (d.size() != 1) {
                std::cerr << "Delimiter must be a single character" << std::endl;
                return false;
            }
            config.delimiter = d[0];
        }
        else if (arg == "--no-header") {
            config.has_header = false;
        }
        else if (arg == "--amend-same-ts") {
            config.same_timestamp_amends = true;
        }
        else if (arg == "--strict-ohlc") {
            config.validate_ohlc = true;
        }
        else if (arg == "--skip-invalid") {
            config.skip_invalid = true;
        }
        else if (arg == "--verbose") {
            config.verbose = true;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }

    if (config.data_file.empty()) {
        std::cerr << "Missing --data FILE" << std::endl;
        return false;
    }

    if (!config.periods.empty() && config.same_timestamp_amends) {
        std::cerr << "--amend-same-ts cannot be combined with --period" << std::endl;
        return false;
    }

    if (config.indicators.empty()) {
        config.indicators = {{"sma20", "sma:close:20"}, {"rsi14", "rsi:14"}};
    }

    return true;
}

// ============================================================================
// Reporting
// ============================================================================

void printReading(const IndicatorValue& v) {
    if (v.available) {
        std::cout << std::setw(12) << std::fixed << std::setprecision(4) << v.value;
    } else {
        std::cout << std::setw(12) << "-";
    }
}

void printTail(const BarSeries& series, const ReplayConfig& config) {
    const std::size_t count = series.size();
    const std::size_t rows = std::min(config.tail, count);
    const std::vector<std::string> ids = series.indicatorIds();

    const std::vector<std::size_t> outputs = series.withReadLock(
        [&ids](const ColumnStore&, const IndicatorHost& host) {
            std::vector<std::size_t> counts;
            for (const auto& id : ids) counts.push_back(host.indicator(id).outputCount());
            return counts;
        });

    std::cout << std::setw(15) << "timestamp" << std::setw(12) << "close" << std::setw(12) << "volume";
    for (std::size_t n = 0; n < ids.size(); ++n) {
        for (std::size_t k = 0; k < outputs[n]; ++k) {
            std::cout << std::setw(12) << (outputs[n] > 1 ? ids[n] + "." + std::to_string(k) : ids[n]);
        }
    }
    std::cout << "\n";

    for (std::size_t i = count - rows; i < count; ++i) {
        const Bar bar = series.get(static_cast<std::int64_t>(i));
        std::cout << std::setw(15) << bar.timestamp
                  << std::setw(12) << std::fixed << std::setprecision(4) << bar.close
                  << std::setw(12) << std::fixed << std::setprecision(2) << bar.volume;
        for (std::size_t n = 0; n < ids.size(); ++n) {
            for (std::size_t k = 0; k < outputs[n]; ++k) {
                printReading(series.getValue(ids[n], i, k));
            }
        }
        std::cout << "\n";
    }
}

void printSummary(const BarSeries& series, std::size_t rows_read, std::uint64_t skipped,
                  double elapsed_seconds) {
    const auto stats = series.getStats();
    const StoreMetadata meta = series.metadata();

    std::cout << "\nReplay Summary:\n";
    std::cout << "  Rows Read:       " << rows_read << "\n";
    std::cout << "  Pushes:          " << stats.store.total_pushes << "\n";
    std::cout << "  Amends:          " << stats.store.total_amends << "\n";
    std::cout << "  Evictions:       " << stats.store.total_evictions << "\n";
    std::cout << "  Rejected:        " << stats.store.rejected_writes << " (" << skipped << " skipped)\n";
    std::cout << "  Retained:        " << meta.count << " / " << meta.capacity
              << " (" << std::fixed << std::setprecision(1) << stats.store.utilization_pct << "%)\n";
    std::cout << "  Generation:      " << meta.generation << "\n";
    std::cout << "  Indicators:      " << stats.indicator_count << "\n";
    std::cout << "  Time Elapsed:    " << std::fixed << std::setprecision(3) << elapsed_seconds
              << " seconds\n";
}

// ============================================================================
// Main Function
// ============================================================================

int main(int argc, char* argv[]) {
    ReplayConfig config;
    try {
        if (!parseArguments(argc, argv, config)) {
            printUsage(argv[0]);
            return (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))
                   ? 0 : 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << std::endl;
        return 1;
    }

    if (config.verbose) {
        std::cout << "Loaded configuration:\n";
        std::cout << "  Data file:  " << config.data_file << "\n";
        std::cout << "  Capacity:   " << config.capacity << "\n";
        for (const auto& entry : config.indicators) {
            std::cout << "  Indicator:  " << entry.first << " = " << entry.second << "\n";
        }
        for (const auto& period : config.periods) {
            std::cout << "  Period:     " << period << "\n";
        }
        std::cout << "\n";
    }

    try {
        auto start_time = std::chrono::high_resolution_clock::now();

        CsvBarLoader::CsvConfig csv;
        csv.has_header = config.has_header;
        csv.delimiter = config.delimiter;
        csv.same_timestamp_amends = config.same_timestamp_amends;
        CsvBarLoader loader(csv);
        const auto records = loader.loadFile(config.data_file);

        if (config.verbose) {
            std::cout << "Loaded " << records.size() << " rows from " << config.data_file << "\n";
        }

        BarSeries::Config series_config;
        series_config.capacity = config.capacity;
        series_config.store.validate_ohlc = config.validate_ohlc;

        BarReplayer::Config replay_config;
        replay_config.skip_invalid = config.skip_invalid;
        BarReplayer replayer(replay_config,
            [&config](const CsvBarLoader::BarRecord& record, const InvalidBarException& e) {
                if (config.verbose) {
                    std::cerr << "Skipped line " << record.line << ": " << e.what() << std::endl;
                }
            });

        if (!config.periods.empty()) {
            std::vector<Period> periods;
            for (const auto& text : config.periods) periods.push_back(Period::parse(text));

            MultiPeriodSeries::Config multi_config;
            multi_config.series = series_config;
            MultiPeriodSeries multi(periods, multi_config);
            for (const auto& entry : config.indicators) {
                multi.addIndicator(entry.first, entry.second);
            }

            const auto stats = replayer.replay(multi, records);
            multi.flush();

            auto end_time = std::chrono::high_resolution_clock::now();
            const double elapsed = std::chrono::duration<double>(end_time - start_time).count();

            for (const Period& period : multi.periods()) {
                std::cout << "\n[" << period.toString() << "]\n";
                printTail(multi.series(period), config);
                printSummary(multi.series(period), records.size(), stats.skipped, elapsed);
            }
            const auto routing = multi.getStats();
            const auto agg = multi.aggregator().getStats();
            std::cout << "\nAggregation:\n";
            std::cout << "  Bars In:         " << agg.bars_in << "\n";
            std::cout << "  Candles Closed:  " << agg.candles_closed << "\n";
            std::cout << "  Series Pushes:   " << routing.pushes << "\n";
            std::cout << "  Series Amends:   " << routing.amends << "\n";
            return 0;
        }

        BarSeries series(series_config);

        for (const auto& entry : config.indicators) {
            const IIndicator& indicator = series.addIndicator(entry.first, entry.second);
            if (config.verbose) {
                std::cout << "Registered " << entry.first << ": " << indicator.getName()
                          << " (warm-up " << indicator.warmupPeriod() << ")\n";
            }
        }

        const auto stats = replayer.replay(series, records);

        auto end_time = std::chrono::high_resolution_clock::now();
        const double elapsed = std::chrono::duration<double>(end_time - start_time).count();

        std::cout << "\n";
        printTail(series, config);
        printSummary(series, records.size(), stats.skipped, elapsed);

        if (config.verbose) {
            ZeroCopyExporter exporter(series.store());
            const ColumnView close = exporter.exportColumn(BarField::Close);
            std::cout << "  Close Column:    " << close.slices[0].length << " + "
                      << close.slices[1].length << " elements, stride "
                      << close.slices[0].stride << " bytes"
                      << (exporter.isCurrent(close) ? "" : " (stale)") << "\n";
        }

    } catch (const BarVaultException& e) {
        std::cerr << "Error [" << errorCodeName(e.code()) << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
