#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "md_types.hpp"
#include "timeframe.hpp"
#include "util/logger.hpp"

enum class IssueSeverity : std::uint8_t
{
    Info,
    Warning,
    Critical
};

enum class IssueKind : std::uint8_t
{
    NoData,
    MissingBars,
    StaleData,
    PriceOutlier,
    VolumeAnomaly
};

const char *to_string(IssueSeverity severity);
const char *to_string(IssueKind kind);

struct QualityIssue
{
    IssueSeverity severity{IssueSeverity::Info};
    IssueKind kind{IssueKind::NoData};
    std::string symbol;
    Timestamp timestamp{}; // offending bar; check time for StaleData, epoch for an empty series
    std::string description;
};

struct QualityThresholds
{
    double gap_tolerance = 1.5;              // gap > nominal interval * tolerance
    std::chrono::seconds max_age{std::chrono::hours(1)};
    double outlier_z = 5.0;                  // |z-score| of the close-to-close return
    std::size_t min_bars = 10;               // outlier/volume checks need this many bars
    std::size_t volume_window = 20;          // rolling mean, current bar included
    double volume_multiplier = 3.0;
};

// Checks over one symbol's bar sequence. Input order does not matter;
// bars are examined in timestamp order.
class DataQualityMonitor
{
public:
    explicit DataQualityMonitor(QualityThresholds thresholds = {}, std::shared_ptr<ILogger> logger = nullptr);

    // NoData (critical) when empty, one MissingBars warning per oversized gap.
    std::vector<QualityIssue> check_missing_bars(const std::string &symbol,
                                                 const std::vector<MarketData> &bars,
                                                 Timeframe tf) const;

    std::optional<QualityIssue> check_stale_data(const std::string &symbol,
                                                 const std::vector<MarketData> &bars,
                                                 Timestamp now) const;

    std::vector<QualityIssue> check_price_outliers(const std::string &symbol,
                                                   const std::vector<MarketData> &bars) const;

    std::vector<QualityIssue> check_volume_anomalies(const std::string &symbol,
                                                     const std::vector<MarketData> &bars) const;

    // All four checks; critical issues are logged as errors, warnings as warnings.
    std::vector<QualityIssue> run_all(const std::string &symbol,
                                      const std::vector<MarketData> &bars,
                                      Timeframe tf,
                                      Timestamp now) const;

    const QualityThresholds &thresholds() const { return t_; }

private:
    QualityThresholds t_;
    std::shared_ptr<ILogger> log_;
};

// Markdown summary: counts per severity, then issues per symbol (sorted).
std::string quality_report(const std::map<std::string, std::vector<QualityIssue>> &issues, Timestamp generated);
