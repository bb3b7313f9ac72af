// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the report module: rows, statistics and CSV export.

#include "test_framework.h"

#include "report/csv.h"
#include "report/rows.h"
#include "report/stats.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace {

relay::BlockReceiveRecord receive(const std::string& t, uint64_t size,
                                  uint64_t tx_missing = 0,
                                  uint64_t bytes_missing = 0) {
    relay::BlockReceiveRecord r;
    r.time_received    = t;
    r.received_size    = size;
    r.tx_missing_count = tx_missing;
    r.bytes_missing    = bytes_missing;
    return r;
}

relay::BlockSendRecord send(const std::string& hash, uint64_t peer,
                            const std::string& t, uint64_t size,
                            uint64_t window) {
    relay::BlockSendRecord s;
    s.block_hash      = hash;
    s.peer_id         = peer;
    s.time_sent       = t;
    s.send_size       = size;
    s.tcp_window_size = window;
    return s;
}

report::SentRow row(int64_t prefill, uint64_t available, uint64_t rtts,
                    uint64_t window = 1000, uint64_t send_size = 0) {
    report::SentRow r;
    r.prefill_size           = prefill;
    r.window_bytes_available = available;
    r.window_bytes_used      = window - available;
    r.rtts_without_prefill   = rtts;
    r.tcp_window_size        = window;
    r.send_size              = send_size;
    return r;
}

std::string slurp(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

} // anonymous namespace

// ============================================================================
// Rows
// ============================================================================

TEST_CASE(Rows, sent_row_window_columns) {
    relay::CorrelationResult res;
    res.receive_records["aa"] = receive("T1", 2500);
    res.send_records["aa"] = {send("aa", 7, "T3", 2700, 1000)};

    auto rows = report::build_sent_rows(res);
    CHECK_EQ(rows.size(), 1u);
    if (rows.empty()) return;
    const auto& r = rows[0];
    CHECK_EQ(r.prefill_size, 200);
    CHECK_EQ(r.window_bytes_used, 500u);
    CHECK_EQ(r.window_bytes_available, 500u);
    CHECK_EQ(r.rtts_without_prefill, 2u);
    CHECK_EQ(r.received_size, 2500u);
    CHECK(r.trigger == relay::SendTrigger::ANNOUNCED);
}

TEST_CASE(Rows, zero_window_leaves_window_columns_zero) {
    relay::CorrelationResult res;
    res.receive_records["aa"] = receive("T1", 100);
    res.send_records["aa"] = {send("aa", 1, "T2", 90, 0)};

    auto rows = report::build_sent_rows(res);
    CHECK_EQ(rows.size(), 1u);
    if (rows.empty()) return;
    CHECK_EQ(rows[0].prefill_size, -10);
    CHECK_EQ(rows[0].window_bytes_used, 0u);
    CHECK_EQ(rows[0].window_bytes_available, 0u);
    CHECK_EQ(rows[0].rtts_without_prefill, 0u);
}

TEST_CASE(Rows, sends_without_receive_are_left_out) {
    relay::CorrelationResult res;
    res.receive_records["aa"] = receive("T1", 100);
    res.send_records["aa"] = {send("aa", 1, "T2", 100, 1000)};
    res.send_records["bb"] = {send("bb", 1, "T3", 100, 1000),
                              send("bb", 2, "T4", 100, 1000)};

    auto rows = report::build_sent_rows(res);
    CHECK_EQ(rows.size(), 1u);
    if (!rows.empty()) CHECK_EQ(rows[0].block_hash, "aa");
}

TEST_CASE(Rows, sent_rows_are_ordered) {
    relay::CorrelationResult res;
    res.receive_records["aa"] = receive("T1", 100);
    res.receive_records["bb"] = receive("T1", 100);
    res.send_records["bb"] = {send("bb", 9, "T5", 100, 0),
                              send("bb", 3, "T5", 100, 0)};
    res.send_records["aa"] = {send("aa", 4, "T5", 100, 0),
                              send("aa", 1, "T9", 100, 0)};
    relay::BlockSendRecord unsent;
    unsent.block_hash = "aa";
    unsent.peer_id    = 2;
    res.send_records["aa"].push_back(unsent);

    auto rows = report::build_sent_rows(res);
    CHECK_EQ(rows.size(), 5u);
    if (rows.size() != 5) return;
    CHECK(!rows[0].time_sent.has_value());
    CHECK_EQ(rows[1].block_hash, "aa");
    CHECK_EQ(rows[1].peer_id, 4u);
    CHECK_EQ(rows[2].peer_id, 3u);
    CHECK_EQ(rows[3].peer_id, 9u);
    CHECK_EQ(rows[4].peer_id, 1u);
}

TEST_CASE(Rows, received_rows_ordered_and_timed) {
    relay::CorrelationResult res;
    auto late = receive("2025-06-25T20:15:38.000000Z", 300);
    auto early = receive("2025-06-25T20:15:37.000000Z", 200);
    early.time_reconstructed = "2025-06-25T20:15:37.250000Z";
    early.prefilled_tx_count = 1;
    early.mempool_tx_count   = 1200;
    res.receive_records["bb"] = late;
    res.receive_records["aa"] = early;
    // Placeholder timestamps still produce a row, just no timing.
    auto odd = receive("T9", 100);
    odd.time_reconstructed = "T10";
    res.receive_records["cc"] = odd;

    auto rows = report::build_received_rows(res);
    CHECK_EQ(rows.size(), 3u);
    if (rows.size() != 3) return;
    CHECK_EQ(rows[0].block_hash, "aa");
    CHECK_EQ(rows[1].block_hash, "bb");
    CHECK_EQ(rows[2].block_hash, "cc");
    CHECK(rows[0].reconstruction_time_us == int64_t{250000});
    CHECK(!rows[1].reconstruction_time_us.has_value());
    CHECK(!rows[2].reconstruction_time_us.has_value());
    CHECK_EQ(rows[0].mempool_tx_count, 1200u);
}

// ============================================================================
// Statistics
// ============================================================================

TEST_CASE(Stats, empty_inputs_report_zeros) {
    auto rs = report::compute_received_stats({});
    CHECK_EQ(rs.total, 0u);
    CHECK_NEAR(rs.fail_rate, 0.0, 1e-12);
    CHECK_NEAR(rs.success_rate, 0.0, 1e-12);

    auto ss = report::compute_sent_stats({});
    CHECK_EQ(ss.total, 0u);
    CHECK_NEAR(ss.prefill_fit_rate, 0.0, 1e-12);

    auto ws = report::compute_window_stats({});
    CHECK_EQ(ws.count, 0u);
    CHECK_EQ(ws.mode_window, 0u);

    auto os = report::compute_already_over_stats({});
    CHECK_EQ(os.over, 0u);
    CHECK_NEAR(os.over_prefill_fit_rate, 0.0, 1e-12);

    std::ostringstream out;
    CHECK_NOTHROW(report::print_received_stats(out, rs));
    CHECK_NOTHROW(report::print_sent_stats(out, ss));
    CHECK_NOTHROW(report::print_window_stats(out, ws));
    CHECK_NOTHROW(report::print_already_over_stats(out, os));
    CHECK(out.str().find("0/0") != std::string::npos);
}

TEST_CASE(Stats, received_failure_rate) {
    std::vector<report::ReceivedRow> rows(4);
    rows[0].received_size = 100;
    rows[1].received_size = 300;
    rows[2].received_size = 200;
    rows[2].tx_missing_count = 2;
    rows[2].bytes_missing    = 800;
    rows[3].received_size = 400;
    rows[3].reconstruction_time_us = 3000;

    auto s = report::compute_received_stats(rows);
    CHECK_EQ(s.total, 4u);
    CHECK_EQ(s.failed, 1u);
    CHECK_NEAR(s.fail_rate, 0.25, 1e-12);
    CHECK_NEAR(s.success_rate, 0.75, 1e-12);
    CHECK_NEAR(s.avg_received_size, 250.0, 1e-9);
    CHECK_NEAR(s.avg_bytes_missing, 200.0, 1e-9);
    CHECK_NEAR(s.avg_bytes_missing_failed, 800.0, 1e-9);
    CHECK_EQ(s.timed, 1u);
    CHECK_NEAR(s.avg_reconstruction_ms, 3.0, 1e-9);

    std::ostringstream out;
    report::print_received_stats(out, s);
    CHECK(out.str().find("1/4") != std::string::npos);
    CHECK(out.str().find("25.00%") != std::string::npos);
}

TEST_CASE(Stats, sent_prefill_fit) {
    std::vector<report::SentRow> rows = {
        row(0, 400, 1, 1000, 100),      // not prefilled
        row(-5, 400, 1, 1000, 200),     // not prefilled
        row(300, 400, 1, 1000, 300),    // fits
        row(500, 400, 1, 1000, 400),    // does not fit
    };
    auto s = report::compute_sent_stats(rows);
    CHECK_EQ(s.prefilled, 2u);
    CHECK_NEAR(s.prefilled_share, 0.5, 1e-12);
    CHECK_NEAR(s.avg_send_size, 250.0, 1e-9);
    CHECK_NEAR(s.avg_send_size_prefilled, 350.0, 1e-9);
    CHECK_NEAR(s.avg_send_size_plain, 150.0, 1e-9);
    CHECK_NEAR(s.avg_prefill_size, 400.0, 1e-9);
    CHECK_EQ(s.prefills_fit, 1u);
    CHECK_NEAR(s.prefill_fit_rate, 0.5, 1e-12);
}

TEST_CASE(Stats, sent_without_prefills_prints_short_block) {
    std::vector<report::SentRow> rows = {row(0, 100, 1)};
    std::ostringstream out;
    report::print_sent_stats(out, report::compute_sent_stats(rows));
    CHECK(out.str().find("Avg prefill size") == std::string::npos);
}

TEST_CASE(Stats, window_median_and_mode) {
    std::vector<report::SentRow> rows = {
        row(0, 0, 0, 3000), row(0, 0, 0, 1000), row(0, 0, 0, 3000),
        row(0, 0, 0, 1000), row(0, 0, 0, 2000), row(0, 0, 0, 4000),
    };
    auto s = report::compute_window_stats(rows);
    CHECK_EQ(s.count, 6u);
    CHECK_NEAR(s.avg_window, 14000.0 / 6.0, 1e-9);
    // sorted: 1000 1000 2000 3000 3000 4000
    CHECK_NEAR(s.median_window, 2500.0, 1e-9);
    // 1000 and 3000 tie; the smaller value wins
    CHECK_EQ(s.mode_window, 1000u);
    CHECK_EQ(s.mode_frequency, 2u);
    CHECK_NEAR(s.mode_share, 2.0 / 6.0, 1e-12);

    rows.pop_back();
    CHECK_NEAR(report::compute_window_stats(rows).median_window, 2000.0, 1e-9);
}

TEST_CASE(Stats, already_over_one_rtt) {
    std::vector<report::SentRow> rows = {
        row(100, 200, 1),
        row(100, 200, 2),    // over, fits
        row(300, 200, 3),    // over, does not fit
        row(0, 50, 5),       // over, nothing to prefill
    };
    auto s = report::compute_already_over_stats(rows);
    CHECK_EQ(s.total, 4u);
    CHECK_EQ(s.over, 3u);
    CHECK_NEAR(s.over_rate, 0.75, 1e-12);
    CHECK_NEAR(s.avg_available_over, 150.0, 1e-9);
    CHECK_EQ(s.over_prefills_fit, 2u);
    CHECK_NEAR(s.over_prefill_fit_rate, 2.0 / 3.0, 1e-12);
}

// ============================================================================
// CSV
// ============================================================================

TEST_CASE(Csv, escape_quotes_only_when_needed) {
    CHECK_EQ(report::csv_escape("plain"), "plain");
    CHECK_EQ(report::csv_escape(""), "");
    CHECK_EQ(report::csv_escape("a,b"), "\"a,b\"");
    CHECK_EQ(report::csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
    CHECK_EQ(report::csv_escape("two\nlines"), "\"two\nlines\"");
}

TEST_CASE(Csv, received_render) {
    report::ReceivedRow r;
    r.block_hash    = "aa";
    r.time_received = "T1";
    r.received_size = 100;
    std::string csv = report::render_received_csv({r});

    CHECK(csv.starts_with("blockhash,time_received,time_reconstructed,"));
    CHECK(csv.find("aa,T1,,100,0,0,0,0,0,\r\n") != std::string::npos);
    CHECK(csv.ends_with("\r\n"));
}

TEST_CASE(Csv, sent_render) {
    report::SentRow r;
    r.block_hash      = "aa";
    r.time_sent       = "T3";
    r.peer_id         = 7;
    r.trigger         = relay::SendTrigger::REQUESTED;
    r.tcp_window_size = 1500;
    r.received_size   = 100;
    r.send_size       = 120;
    r.prefill_size    = 20;
    r.window_bytes_used      = 100;
    r.window_bytes_available = 1400;
    std::string csv = report::render_sent_csv({r});

    CHECK(csv.starts_with("blockhash,time_sent,peer_id,trigger,"));
    CHECK(csv.find("\r\naa,T3,7,requested,1500,100,0,0,120,20,100,1400,0\r\n")
          != std::string::npos);
}

TEST_CASE(Csv, header_only_for_no_rows) {
    std::string csv = report::render_sent_csv({});
    CHECK_EQ(csv.find("\r\n"), csv.size() - 2);
}

TEST_CASE(Csv, write_files) {
    auto dir = std::filesystem::temp_directory_path() / "cbtrace_test_report";
    std::filesystem::remove_all(dir);

    report::ReceivedRow r;
    r.block_hash    = "aa";
    r.time_received = "T1";
    CHECK_OK(report::write_received_csv(dir / "run_received.csv", {r}));
    CHECK_OK(report::write_sent_csv(dir / "run_sent.csv", {}));

    CHECK_EQ(slurp(dir / "run_received.csv"), report::render_received_csv({r}));
    CHECK_EQ(slurp(dir / "run_sent.csv"), report::render_sent_csv({}));

    // A regular file where a directory is expected.
    CHECK_ERR_CODE(report::write_sent_csv(dir / "run_sent.csv" / "x.csv", {}),
                   core::ErrorCode::STORAGE_WRITE_FAIL);
}
