#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <set>
#include <nlohmann/json.hpp>
#include "persistence/records.hpp"

namespace pbot {

/**
 * Four append-only JSON-lines streams under one data directory:
 * decisions.jsonl, trades.jsonl, resolutions.jsonl, snapshots.jsonl.
 *
 * Each append writes one complete line and flushes. Loading skips
 * malformed lines with a warning; a missing file reads as empty.
 */
class RecordStore {
public:
    static constexpr const char* DECISIONS_FILE = "decisions.jsonl";
    static constexpr const char* TRADES_FILE = "trades.jsonl";
    static constexpr const char* RESOLUTIONS_FILE = "resolutions.jsonl";
    static constexpr const char* SNAPSHOTS_FILE = "snapshots.jsonl";

    explicit RecordStore(const std::string& data_dir);

    void append_decision(const DecisionRecord& r);
    void append_execution(const ExecutionRecord& r);
    void append_resolution(const ResolutionRecord& r);
    void append_snapshot(const PositionSnapshot& r);

    std::vector<DecisionRecord> load_decisions() const;
    std::vector<ExecutionRecord> load_executions() const;
    std::vector<ResolutionRecord> load_resolutions() const;
    std::vector<PositionSnapshot> load_snapshots() const;

    // Trace ids already present in the resolution log
    std::set<std::string> resolved_trace_ids() const;

    const std::string& data_dir() const { return data_dir_; }
    std::string path_for(const char* file) const;

private:
    std::string data_dir_;
    mutable std::mutex mutex_;

    void append_line(const char* file, const nlohmann::json& j);

    template <typename T>
    std::vector<T> load_stream(const char* file) const;
};

} // namespace pbot
