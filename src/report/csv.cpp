// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "report/csv.h"

#include "core/fs.h"
#include "core/logging.h"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <utility>

namespace report {

namespace {

/// Accumulates one CSV record at a time.
class CsvWriter {
public:
    void field(std::string_view v) {
        if (!first_) out_ += ',';
        out_ += csv_escape(v);
        first_ = false;
    }
    void field(uint64_t v) { field(std::to_string(v)); }
    void field(int64_t v)  { field(std::to_string(v)); }

    template <typename T>
    void field(const std::optional<T>& v) {
        if (v) {
            field(*v);
        } else {
            field(std::string_view{});
        }
    }

    void header(std::initializer_list<std::string_view> names) {
        for (std::string_view n : names) field(n);
        end_row();
    }

    void end_row() {
        out_ += "\r\n";
        first_ = true;
    }

    [[nodiscard]] std::string take() { return std::move(out_); }

private:
    std::string out_;
    bool        first_ = true;
};

core::Result<void> write_csv(const std::filesystem::path& path,
                             const std::string& text, size_t rows) {
    CBT_TRY_VOID(core::fs::write_file(path, text));
    LOG_INFO(core::LogCategory::REPORT,
             "wrote " + std::to_string(rows) + " rows to " + path.string());
    return core::make_ok();
}

} // anonymous namespace

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string render_received_csv(const std::vector<ReceivedRow>& rows) {
    CsvWriter w;
    w.header({"blockhash", "time_received", "time_reconstructed",
              "received_size", "bytes_missing", "received_tx_missing",
              "prefilled_txns", "mempool_txns", "extra_pool_txns",
              "reconstruction_time_us"});
    for (const auto& r : rows) {
        w.field(r.block_hash);
        w.field(r.time_received);
        w.field(r.time_reconstructed);
        w.field(r.received_size);
        w.field(r.bytes_missing);
        w.field(r.tx_missing_count);
        w.field(r.prefilled_tx_count);
        w.field(r.mempool_tx_count);
        w.field(r.extra_pool_tx_count);
        w.field(r.reconstruction_time_us);
        w.end_row();
    }
    return w.take();
}

std::string render_sent_csv(const std::vector<SentRow>& rows) {
    CsvWriter w;
    w.header({"blockhash", "time_sent", "peer_id", "trigger",
              "tcp_window_size", "received_size", "received_bytes_missing",
              "received_tx_missing", "send_size", "prefill_size",
              "window_bytes_used", "window_bytes_available",
              "rtts_without_prefill"});
    for (const auto& r : rows) {
        w.field(r.block_hash);
        w.field(r.time_sent);
        w.field(r.peer_id);
        w.field(relay::send_trigger_name(r.trigger));
        w.field(r.tcp_window_size);
        w.field(r.received_size);
        w.field(r.received_bytes_missing);
        w.field(r.received_tx_missing);
        w.field(r.send_size);
        w.field(r.prefill_size);
        w.field(r.window_bytes_used);
        w.field(r.window_bytes_available);
        w.field(r.rtts_without_prefill);
        w.end_row();
    }
    return w.take();
}

core::Result<void> write_received_csv(const std::filesystem::path& path,
                                      const std::vector<ReceivedRow>& rows) {
    return write_csv(path, render_received_csv(rows), rows.size());
}

core::Result<void> write_sent_csv(const std::filesystem::path& path,
                                  const std::vector<SentRow>& rows) {
    return write_csv(path, render_sent_csv(rows), rows.size());
}

} // namespace report
