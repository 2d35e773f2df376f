#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// In-process counters, gauges and histograms, rendered in the Prometheus text
// exposition format (version 0.0.4) for GET /metrics.
// Families are declared once by the component that owns them; declaring the
// same family again with the same kind is a no-op.
class MetricsRegistry {
public:
    using Labels = std::vector<std::pair<std::string, std::string>>;

    enum class Kind { Counter, Gauge, Histogram };

    void add_counter(const std::string &name, const std::string &help);
    void add_gauge(const std::string &name, const std::string &help);
    void add_histogram(const std::string &name, const std::string &help, std::vector<double> bounds);

    // Counters and gauges. Throws std::logic_error for undeclared families
    // and for dec()/set() on a counter.
    void inc(const std::string &name, const Labels &labels = {}, double by = 1);
    void dec(const std::string &name, const Labels &labels = {}, double by = 1);
    void set(const std::string &name, const Labels &labels, double value);
    void observe(const std::string &name, const Labels &labels, double value);

    // Current value of a counter or gauge series; 0 when never touched.
    double value(const std::string &name, const Labels &labels = {}) const;
    // Observations recorded by a histogram series.
    std::uint64_t count(const std::string &name, const Labels &labels = {}) const;

    std::string to_prometheus() const;

private:
    struct Series {
        double value{0};
        std::vector<std::uint64_t> buckets; // per bound, not cumulative
        double sum{0};
        std::uint64_t count{0};
    };

    struct Family {
        Kind kind{Kind::Counter};
        std::string help;
        std::vector<double> bounds;
        std::map<Labels, Series> series;
    };

    void declare(const std::string &name, Kind kind, const std::string &help, std::vector<double> bounds);
    Family &family(const std::string &name, Kind expected);

    mutable std::mutex mtx_;
    std::map<std::string, Family> families_;
};
