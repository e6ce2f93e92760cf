#include "arsc/summary_stats.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <string>
#include <utility>

namespace arsc {

namespace {

MetricSummary summarize_values(const std::vector<double>& values) {
    MetricSummary s;
    if (values.empty()) return s;

    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    s.min = *lo;
    s.max = *hi;

    double sum = 0.0;
    for (double v : values) sum += v;
    s.mean = sum / static_cast<double>(values.size());

    if (values.size() > 1) {
        double ss = 0.0;
        for (double v : values) ss += (v - s.mean) * (v - s.mean);
        s.stdev = std::sqrt(ss / static_cast<double>(values.size() - 1));
    }
    return s;
}

}  // anonymous namespace

SummaryStats summarize(const std::vector<JobResult>& results) {
    std::vector<double> n, c, s, mw;
    for (const auto& r : results) {
        if (!r.ok()) continue;
        n.push_back(r.metrics->n_arsc);
        c.push_back(r.metrics->c_arsc);
        s.push_back(r.metrics->s_arsc);
        mw.push_back(r.metrics->avg_res_mw);
    }

    SummaryStats stats;
    stats.n_arsc = summarize_values(n);
    stats.c_arsc = summarize_values(c);
    stats.s_arsc = summarize_values(s);
    stats.avg_res_mw = summarize_values(mw);
    stats.count = n.size();
    return stats;
}

void print_summary(std::ostream& os, const SummaryStats& stats, int decimal_places) {
    const auto old_flags = os.flags();
    const auto old_precision = os.precision();
    const std::string rule(70, '=');
    const std::string thin(70, '-');

    os << "\n" << rule << "\n";
    os << std::setw(44) << "SUMMARY STATISTICS" << "\n";
    os << rule << "\n";
    os << std::left
       << std::setw(13) << "Metric"
       << std::setw(17) << "Mean"
       << std::setw(17) << "Stdev"
       << std::setw(17) << "Min"
       << "Max" << "\n";
    os << thin << "\n";

    const std::pair<const char*, const MetricSummary*> rows[] = {
        {"N_ARSC", &stats.n_arsc},
        {"C_ARSC", &stats.c_arsc},
        {"S_ARSC", &stats.s_arsc},
        {"AvgResMW", &stats.avg_res_mw},
    };
    os << std::fixed << std::setprecision(decimal_places);
    for (const auto& [name, m] : rows) {
        os << std::setw(13) << name
           << std::setw(17) << m->mean
           << std::setw(17) << m->stdev
           << std::setw(17) << m->min
           << m->max << "\n";
    }
    os << thin << "\n";
    os << std::setw(13) << "Count" << stats.count << "\n";
    os << rule << "\n\n";
    os.flags(old_flags);
    os.precision(old_precision);
}

}  // namespace arsc
