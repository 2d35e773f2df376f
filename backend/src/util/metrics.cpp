#include "util/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace
{
    const char *kind_name(MetricsRegistry::Kind k)
    {
        switch (k) {
        case MetricsRegistry::Kind::Counter:   return "counter";
        case MetricsRegistry::Kind::Gauge:     return "gauge";
        case MetricsRegistry::Kind::Histogram: return "histogram";
        }
        return "untyped";
    }

    std::string escape_label(const std::string &v)
    {
        std::string out;
        out.reserve(v.size());
        for (char ch : v) {
            if (ch == '\\') out += "\\\\";
            else if (ch == '"') out += "\\\"";
            else if (ch == '\n') out += "\\n";
            else out += ch;
        }
        return out;
    }

    // {a="1",b="2"} with an optional trailing le label for histogram buckets.
    std::string label_block(const MetricsRegistry::Labels &labels, const std::string &le = "")
    {
        if (labels.empty() && le.empty()) return "";
        std::ostringstream os;
        os << '{';
        bool first = true;
        for (const auto &kv : labels) {
            if (!first) os << ',';
            os << kv.first << "=\"" << escape_label(kv.second) << '"';
            first = false;
        }
        if (!le.empty()) {
            if (!first) os << ',';
            os << "le=\"" << le << '"';
        }
        os << '}';
        return os.str();
    }

    std::string number(double v)
    {
        if (v == std::floor(v) && std::fabs(v) < 9007199254740992.0) {
            return std::to_string(static_cast<long long>(v));
        }
        std::ostringstream os;
        os << std::setprecision(15) << v;
        return os.str();
    }
}

void MetricsRegistry::add_counter(const std::string &name, const std::string &help)
{
    declare(name, Kind::Counter, help, {});
}

void MetricsRegistry::add_gauge(const std::string &name, const std::string &help)
{
    declare(name, Kind::Gauge, help, {});
}

void MetricsRegistry::add_histogram(const std::string &name, const std::string &help, std::vector<double> bounds)
{
    std::sort(bounds.begin(), bounds.end());
    declare(name, Kind::Histogram, help, std::move(bounds));
}

void MetricsRegistry::declare(const std::string &name, Kind kind, const std::string &help, std::vector<double> bounds)
{
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = families_.find(name);
    if (it != families_.end()) {
        if (it->second.kind != kind) {
            throw std::logic_error("metric " + name + " already declared as " + kind_name(it->second.kind));
        }
        return;
    }
    Family f;
    f.kind = kind;
    f.help = help;
    f.bounds = std::move(bounds);
    families_.emplace(name, std::move(f));
}

MetricsRegistry::Family &MetricsRegistry::family(const std::string &name, Kind expected)
{
    auto it = families_.find(name);
    if (it == families_.end()) throw std::logic_error("metric " + name + " is not declared");
    if (it->second.kind != expected) {
        throw std::logic_error("metric " + name + " is a " + kind_name(it->second.kind));
    }
    return it->second;
}

void MetricsRegistry::inc(const std::string &name, const Labels &labels, double by)
{
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = families_.find(name);
    if (it == families_.end()) throw std::logic_error("metric " + name + " is not declared");
    if (it->second.kind == Kind::Histogram) throw std::logic_error("metric " + name + " is a histogram");
    if (it->second.kind == Kind::Counter && by < 0) throw std::logic_error("counter " + name + " cannot decrease");
    it->second.series[labels].value += by;
}

void MetricsRegistry::dec(const std::string &name, const Labels &labels, double by)
{
    std::lock_guard<std::mutex> lk(mtx_);
    family(name, Kind::Gauge).series[labels].value -= by;
}

void MetricsRegistry::set(const std::string &name, const Labels &labels, double value)
{
    std::lock_guard<std::mutex> lk(mtx_);
    family(name, Kind::Gauge).series[labels].value = value;
}

void MetricsRegistry::observe(const std::string &name, const Labels &labels, double value)
{
    std::lock_guard<std::mutex> lk(mtx_);
    Family &f = family(name, Kind::Histogram);
    Series &s = f.series[labels];
    if (s.buckets.size() != f.bounds.size()) s.buckets.assign(f.bounds.size(), 0);
    for (std::size_t i = 0; i < f.bounds.size(); ++i) {
        if (value <= f.bounds[i]) {
            ++s.buckets[i];
            break;
        }
    }
    s.sum += value;
    ++s.count;
}

double MetricsRegistry::value(const std::string &name, const Labels &labels) const
{
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = families_.find(name);
    if (it == families_.end()) return 0;
    auto s = it->second.series.find(labels);
    return s == it->second.series.end() ? 0 : s->second.value;
}

std::uint64_t MetricsRegistry::count(const std::string &name, const Labels &labels) const
{
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = families_.find(name);
    if (it == families_.end()) return 0;
    auto s = it->second.series.find(labels);
    return s == it->second.series.end() ? 0 : s->second.count;
}

std::string MetricsRegistry::to_prometheus() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    std::ostringstream out;
    for (const auto &[name, f] : families_) {
        out << "# HELP " << name << ' ' << f.help << '\n'
            << "# TYPE " << name << ' ' << kind_name(f.kind) << '\n';
        if (f.kind != Kind::Histogram) {
            for (const auto &[labels, s] : f.series) {
                out << name << label_block(labels) << ' ' << number(s.value) << '\n';
            }
            continue;
        }
        for (const auto &[labels, s] : f.series) {
            std::uint64_t cumulative = 0;
            for (std::size_t i = 0; i < f.bounds.size(); ++i) {
                cumulative += i < s.buckets.size() ? s.buckets[i] : 0;
                out << name << "_bucket" << label_block(labels, number(f.bounds[i])) << ' ' << cumulative << '\n';
            }
            out << name << "_bucket" << label_block(labels, "+Inf") << ' ' << s.count << '\n'
                << name << "_sum" << label_block(labels) << ' ' << number(s.sum) << '\n'
                << name << "_count" << label_block(labels) << ' ' << s.count << '\n';
        }
    }
    return out.str();
}
