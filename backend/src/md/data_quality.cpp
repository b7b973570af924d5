#include "data_quality.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#include "time_codec.hpp"

namespace {

constexpr const char *kTag = "quality";

std::vector<const MarketData *> by_time(const std::vector<MarketData> &bars)
{
    std::vector<const MarketData *> out;
    out.reserve(bars.size());
    for (const auto &b : bars) out.push_back(&b);
    std::stable_sort(out.begin(), out.end(), [](const MarketData *a, const MarketData *b) {
        return a->timestamp < b->timestamp;
    });
    return out;
}

// "2d 03:00:00" / "00:07:30"
std::string format_span(std::chrono::seconds span)
{
    const bool negative = span.count() < 0;
    long long s = negative ? -span.count() : span.count();
    const long long days = s / 86400;
    s %= 86400;
    char buf[64];
    if (days > 0)
        std::snprintf(buf, sizeof buf, "%s%lldd %02lld:%02lld:%02lld", negative ? "-" : "", days, s / 3600, (s / 60) % 60, s % 60);
    else
        std::snprintf(buf, sizeof buf, "%s%02lld:%02lld:%02lld", negative ? "-" : "", s / 3600, (s / 60) % 60, s % 60);
    return buf;
}

std::string fixed(double v, const char *fmt)
{
    char buf[64];
    std::snprintf(buf, sizeof buf, fmt, v);
    return buf;
}

std::string upper(const char *s)
{
    std::string out(s);
    for (auto &c : out) c = static_cast<char>(c >= 'a' && c <= 'z' ? c - 'a' + 'A' : c);
    return out;
}

QualityIssue no_data(const std::string &symbol, Timestamp at, std::string description)
{
    return QualityIssue{IssueSeverity::Critical, IssueKind::NoData, symbol, at, std::move(description)};
}

} // namespace

const char *to_string(IssueSeverity severity)
{
    switch (severity)
    {
        case IssueSeverity::Info:     return "info";
        case IssueSeverity::Warning:  return "warning";
        case IssueSeverity::Critical: return "critical";
    }
    return "unknown";
}

const char *to_string(IssueKind kind)
{
    switch (kind)
    {
        case IssueKind::NoData:        return "no_data";
        case IssueKind::MissingBars:   return "missing_bars";
        case IssueKind::StaleData:     return "stale_data";
        case IssueKind::PriceOutlier:  return "price_outlier";
        case IssueKind::VolumeAnomaly: return "volume_anomaly";
    }
    return "unknown";
}

DataQualityMonitor::DataQualityMonitor(QualityThresholds thresholds, std::shared_ptr<ILogger> logger)
    : t_(thresholds)
    , log_(logger ? std::move(logger) : default_logger())
{
}

std::vector<QualityIssue> DataQualityMonitor::check_missing_bars(const std::string &symbol,
                                                                 const std::vector<MarketData> &bars,
                                                                 Timeframe tf) const
{
    std::vector<QualityIssue> issues;
    if (bars.empty())
    {
        issues.push_back(no_data(symbol, Timestamp{}, "no " + std::string(to_string(tf)) + " bars for " + symbol));
        return issues;
    }

    const auto expected = nominal_duration(tf);
    const auto limit = std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::duration<double>(expected) * t_.gap_tolerance);

    const auto sorted = by_time(bars);
    for (std::size_t i = 1; i < sorted.size(); ++i)
    {
        const auto gap = sorted[i]->timestamp - sorted[i - 1]->timestamp;
        if (gap <= limit) continue;
        issues.push_back(QualityIssue{
            IssueSeverity::Warning, IssueKind::MissingBars, symbol, sorted[i]->timestamp,
            "gap of " + format_span(std::chrono::duration_cast<std::chrono::seconds>(gap)) + " after " +
                TimeCodec::to_iso8601(sorted[i - 1]->timestamp) + " (expected " + format_span(expected) + ")"});
    }
    return issues;
}

std::optional<QualityIssue> DataQualityMonitor::check_stale_data(const std::string &symbol,
                                                                 const std::vector<MarketData> &bars,
                                                                 Timestamp now) const
{
    if (bars.empty()) return no_data(symbol, now, "no data for " + symbol);

    const auto last = std::max_element(bars.begin(), bars.end(), [](const MarketData &a, const MarketData &b) {
        return a.timestamp < b.timestamp;
    })->timestamp;
    const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - last);
    if (age <= t_.max_age) return std::nullopt;

    return QualityIssue{IssueSeverity::Warning, IssueKind::StaleData, symbol, now,
                        "last bar " + TimeCodec::to_iso8601(last) + " is " + format_span(age) +
                            " old (threshold " + format_span(t_.max_age) + ")"};
}

std::vector<QualityIssue> DataQualityMonitor::check_price_outliers(const std::string &symbol,
                                                                   const std::vector<MarketData> &bars) const
{
    std::vector<QualityIssue> issues;
    if (bars.size() < t_.min_bars) return issues;

    const auto sorted = by_time(bars);
    // close-to-close returns; a zero previous close has none
    std::vector<std::pair<const MarketData *, double>> returns;
    for (std::size_t i = 1; i < sorted.size(); ++i)
    {
        const double prev = sorted[i - 1]->close.to_double();
        if (prev == 0.0) continue;
        returns.emplace_back(sorted[i], sorted[i]->close.to_double() / prev - 1.0);
    }
    if (returns.size() < 2) return issues;

    double mean = 0.0;
    for (const auto &r : returns) mean += r.second;
    mean /= static_cast<double>(returns.size());
    double var = 0.0;
    for (const auto &r : returns) var += (r.second - mean) * (r.second - mean);
    const double stddev = std::sqrt(var / static_cast<double>(returns.size() - 1));
    if (stddev == 0.0) return issues;

    for (const auto &[bar, ret] : returns)
    {
        const double z = (ret - mean) / stddev;
        if (std::fabs(z) <= t_.outlier_z) continue;
        issues.push_back(QualityIssue{
            IssueSeverity::Warning, IssueKind::PriceOutlier, symbol, bar->timestamp,
            "abnormal return " + fixed(ret * 100.0, "%+.2f") + "% (z-score " + fixed(z, "%.2f") + ", close " +
                bar->close.to_string() + ")"});
    }
    return issues;
}

std::vector<QualityIssue> DataQualityMonitor::check_volume_anomalies(const std::string &symbol,
                                                                     const std::vector<MarketData> &bars) const
{
    std::vector<QualityIssue> issues;
    if (bars.size() < t_.min_bars || t_.volume_window == 0) return issues;

    const auto sorted = by_time(bars);
    double window_sum = 0.0;
    for (std::size_t i = 0; i < sorted.size(); ++i)
    {
        window_sum += static_cast<double>(sorted[i]->volume);
        if (i >= t_.volume_window) window_sum -= static_cast<double>(sorted[i - t_.volume_window]->volume);
        if (i + 1 < t_.volume_window) continue;

        const double avg = window_sum / static_cast<double>(t_.volume_window);
        if (avg <= 0.0) continue;
        const double ratio = static_cast<double>(sorted[i]->volume) / avg;
        if (ratio <= t_.volume_multiplier) continue;
        issues.push_back(QualityIssue{
            IssueSeverity::Info, IssueKind::VolumeAnomaly, symbol, sorted[i]->timestamp,
            "volume " + std::to_string(sorted[i]->volume) + " is " + fixed(ratio, "%.1f") + "x the " +
                std::to_string(t_.volume_window) + "-bar average"});
    }
    return issues;
}

std::vector<QualityIssue> DataQualityMonitor::run_all(const std::string &symbol,
                                                      const std::vector<MarketData> &bars,
                                                      Timeframe tf,
                                                      Timestamp now) const
{
    std::vector<QualityIssue> issues = check_missing_bars(symbol, bars, tf);
    if (!bars.empty())
    {
        if (auto stale = check_stale_data(symbol, bars, now)) issues.push_back(std::move(*stale));
        auto outliers = check_price_outliers(symbol, bars);
        issues.insert(issues.end(), std::make_move_iterator(outliers.begin()), std::make_move_iterator(outliers.end()));
        auto volume = check_volume_anomalies(symbol, bars);
        issues.insert(issues.end(), std::make_move_iterator(volume.begin()), std::make_move_iterator(volume.end()));
    }

    for (const auto &issue : issues)
    {
        if (issue.severity == IssueSeverity::Critical)
            log_->error(kTag, symbol + ": " + issue.description);
        else if (issue.severity == IssueSeverity::Warning)
            log_->warn(kTag, symbol + ": " + issue.description);
    }
    return issues;
}

std::string quality_report(const std::map<std::string, std::vector<QualityIssue>> &issues, Timestamp generated)
{
    std::size_t counts[3] = {0, 0, 0};
    for (const auto &[symbol, list] : issues)
        for (const auto &issue : list) ++counts[static_cast<std::size_t>(issue.severity)];

    std::string out = "# Market Data Quality Report\n\n";
    out += "Generated: " + TimeCodec::to_iso8601(generated) + "\n";
    out += "Symbols checked: " + std::to_string(issues.size()) + "\n\n";

    out += "## Summary\n";
    for (auto sev : {IssueSeverity::Critical, IssueSeverity::Warning, IssueSeverity::Info})
    {
        const auto n = counts[static_cast<std::size_t>(sev)];
        if (n > 0) out += "- " + upper(to_string(sev)) + ": " + std::to_string(n) + "\n";
    }

    out += "\n## Details\n";
    for (const auto &[symbol, list] : issues)
    {
        out += "\n### " + symbol + "\n";
        if (list.empty()) out += "- no issues\n";
        for (const auto &issue : list)
            out += "- [" + upper(to_string(issue.severity)) + "] " + to_string(issue.kind) + ": " + issue.description + "\n";
    }
    return out;
}
