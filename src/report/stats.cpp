// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "report/stats.h"

#include <algorithm>
#include <cstdio>
#include <map>
#include <string>

namespace report {

namespace {

/// Running mean; zero when nothing was added.
class Mean {
public:
    void add(double v) { sum_ += v; ++n_; }
    [[nodiscard]] double value() const {
        return n_ == 0 ? 0.0 : sum_ / static_cast<double>(n_);
    }
    [[nodiscard]] uint64_t count() const { return n_; }

private:
    double   sum_ = 0.0;
    uint64_t n_   = 0;
};

double ratio(uint64_t num, uint64_t den) {
    return den == 0 ? 0.0
                    : static_cast<double>(num) / static_cast<double>(den);
}

std::string fmt2(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

std::string pct(double rate) { return fmt2(rate * 100.0) + "%"; }

std::string frac(uint64_t num, uint64_t den) {
    return std::to_string(num) + "/" + std::to_string(den);
}

bool prefill_fits(const SentRow& r) {
    return r.prefill_size <= static_cast<int64_t>(r.window_bytes_available);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Received
// ---------------------------------------------------------------------------

ReceivedStats compute_received_stats(const std::vector<ReceivedRow>& rows) {
    ReceivedStats s;
    s.total = rows.size();

    Mean size, missing, missing_failed, reco_us;
    for (const auto& r : rows) {
        size.add(static_cast<double>(r.received_size));
        missing.add(static_cast<double>(r.bytes_missing));
        if (r.tx_missing_count > 0) {
            ++s.failed;
            missing_failed.add(static_cast<double>(r.bytes_missing));
        }
        if (r.reconstruction_time_us) {
            reco_us.add(static_cast<double>(*r.reconstruction_time_us));
        }
    }

    s.fail_rate                = ratio(s.failed, s.total);
    s.success_rate             = s.total == 0 ? 0.0 : 1.0 - s.fail_rate;
    s.avg_received_size        = size.value();
    s.avg_bytes_missing        = missing.value();
    s.avg_bytes_missing_failed = missing_failed.value();
    s.timed                    = reco_us.count();
    s.avg_reconstruction_ms    = reco_us.value() / 1000.0;
    return s;
}

void print_received_stats(std::ostream& out, const ReceivedStats& s) {
    out << "Received compact blocks\n"
        << "  " << frac(s.failed, s.total)
        << " blocks received failed reconstruction (" << pct(s.fail_rate)
        << ")\n"
        << "  Reconstruction rate: " << pct(s.success_rate) << "\n"
        << "  Avg received size: " << fmt2(s.avg_received_size) << " bytes\n"
        << "  Avg bytes missing: " << fmt2(s.avg_bytes_missing) << " bytes\n"
        << "  Avg bytes missing (failed): "
        << fmt2(s.avg_bytes_missing_failed) << " bytes\n"
        << "  Avg reconstruction time: " << fmt2(s.avg_reconstruction_ms)
        << " ms over " << s.timed << " blocks\n";
}

// ---------------------------------------------------------------------------
// Sent
// ---------------------------------------------------------------------------

SentStats compute_sent_stats(const std::vector<SentRow>& rows) {
    SentStats s;
    s.total = rows.size();

    Mean send_all, send_prefilled, send_plain;
    Mean avail_all, avail_prefilled, prefill;
    for (const auto& r : rows) {
        send_all.add(static_cast<double>(r.send_size));
        avail_all.add(static_cast<double>(r.window_bytes_available));

        if (r.prefill_size > 0) {
            ++s.prefilled;
            send_prefilled.add(static_cast<double>(r.send_size));
            avail_prefilled.add(static_cast<double>(r.window_bytes_available));
            prefill.add(static_cast<double>(r.prefill_size));
            if (prefill_fits(r)) ++s.prefills_fit;
        } else {
            send_plain.add(static_cast<double>(r.send_size));
        }
    }

    s.prefilled_share         = ratio(s.prefilled, s.total);
    s.avg_send_size           = send_all.value();
    s.avg_send_size_prefilled = send_prefilled.value();
    s.avg_send_size_plain     = send_plain.value();
    s.avg_available_all       = avail_all.value();
    s.avg_available_prefilled = avail_prefilled.value();
    s.avg_prefill_size        = prefill.value();
    s.prefill_fit_rate        = ratio(s.prefills_fit, s.prefilled);
    return s;
}

void print_sent_stats(std::ostream& out, const SentStats& s) {
    out << "Sent compact blocks\n"
        << "  Avg send size: " << fmt2(s.avg_send_size) << " bytes\n"
        << "  Avg send size (prefilled): " << fmt2(s.avg_send_size_prefilled)
        << " bytes\n"
        << "  Avg send size (not prefilled): " << fmt2(s.avg_send_size_plain)
        << " bytes\n"
        << "  " << frac(s.prefilled, s.total)
        << " blocks were sent with prefills (" << pct(s.prefilled_share)
        << ")\n"
        << "  Avg available prefill bytes (all): "
        << fmt2(s.avg_available_all) << " bytes\n";

    // Nothing more to say about a node that never prefilled.
    if (s.prefilled == 0) return;

    out << "  Avg available prefill bytes (prefilled): "
        << fmt2(s.avg_available_prefilled) << " bytes\n"
        << "  Avg prefill size: " << fmt2(s.avg_prefill_size) << " bytes\n"
        << "  " << frac(s.prefills_fit, s.prefilled)
        << " prefilled blocks fit in the available bytes ("
        << pct(s.prefill_fit_rate) << ")\n";
}

// ---------------------------------------------------------------------------
// TCP window
// ---------------------------------------------------------------------------

WindowStats compute_window_stats(const std::vector<SentRow>& rows) {
    WindowStats s;
    s.count = rows.size();
    if (rows.empty()) return s;

    std::vector<uint64_t> windows;
    windows.reserve(rows.size());
    std::map<uint64_t, uint64_t> freq;
    Mean window, used, avail;
    for (const auto& r : rows) {
        windows.push_back(r.tcp_window_size);
        ++freq[r.tcp_window_size];
        window.add(static_cast<double>(r.tcp_window_size));
        used.add(static_cast<double>(r.window_bytes_used));
        avail.add(static_cast<double>(r.window_bytes_available));
    }

    std::sort(windows.begin(), windows.end());
    size_t mid = windows.size() / 2;
    s.median_window = windows.size() % 2 == 1
        ? static_cast<double>(windows[mid])
        : (static_cast<double>(windows[mid - 1]) +
           static_cast<double>(windows[mid])) / 2.0;

    // std::map iterates ascending, so strict '>' keeps the smallest mode.
    for (const auto& [value, n] : freq) {
        if (n > s.mode_frequency) {
            s.mode_window    = value;
            s.mode_frequency = n;
        }
    }

    s.avg_window          = window.value();
    s.mode_share          = ratio(s.mode_frequency, s.count);
    s.avg_bytes_used      = used.value();
    s.avg_bytes_available = avail.value();
    return s;
}

void print_window_stats(std::ostream& out, const WindowStats& s) {
    out << "TCP window\n"
        << "  Avg: " << fmt2(s.avg_window) << " bytes, median: "
        << fmt2(s.median_window) << ", mode: " << s.mode_window << "\n"
        << "  The mode represented " << frac(s.mode_frequency, s.count)
        << " windows (" << pct(s.mode_share) << ")\n"
        << "  Avg window bytes used: " << fmt2(s.avg_bytes_used)
        << " bytes\n"
        << "  Avg window bytes available: " << fmt2(s.avg_bytes_available)
        << " bytes\n";
}

// ---------------------------------------------------------------------------
// Already over one round trip
// ---------------------------------------------------------------------------

AlreadyOverStats compute_already_over_stats(const std::vector<SentRow>& rows) {
    AlreadyOverStats s;
    s.total = rows.size();

    Mean avail;
    for (const auto& r : rows) {
        if (r.rtts_without_prefill <= 1) continue;
        ++s.over;
        avail.add(static_cast<double>(r.window_bytes_available));
        if (prefill_fits(r)) ++s.over_prefills_fit;
    }

    s.over_rate             = ratio(s.over, s.total);
    s.avg_available_over    = avail.value();
    s.over_prefill_fit_rate = ratio(s.over_prefills_fit, s.over);
    return s;
}

void print_already_over_stats(std::ostream& out, const AlreadyOverStats& s) {
    out << "Blocks over one round trip before prefilling\n"
        << "  " << frac(s.over, s.total)
        << " compact blocks sent were already over the window for a single"
           " RTT (" << pct(s.over_rate) << ")\n"
        << "  Avg available prefill bytes among them: "
        << fmt2(s.avg_available_over) << " bytes\n"
        << "  " << frac(s.over_prefills_fit, s.over)
        << " of them had prefills that fit ("
        << pct(s.over_prefill_fit_rate) << ")\n";
}

} // namespace report
