#include "persistence/record_store.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace pbot {

RecordStore::RecordStore(const std::string& data_dir)
    : data_dir_(data_dir)
{
    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create data directory " + data_dir_ + ": " + ec.message());
    }
}

std::string RecordStore::path_for(const char* file) const {
    return (std::filesystem::path(data_dir_) / file).string();
}

void RecordStore::append_line(const char* file, const nlohmann::json& j) {
    std::string line = j.dump() + "\n";
    std::string path = path_for(file);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open record stream: " + path);
    }
    out << line;
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write record stream: " + path);
    }
}

void RecordStore::append_decision(const DecisionRecord& r) {
    append_line(DECISIONS_FILE, r);
}

void RecordStore::append_execution(const ExecutionRecord& r) {
    append_line(TRADES_FILE, r);
}

void RecordStore::append_resolution(const ResolutionRecord& r) {
    append_line(RESOLUTIONS_FILE, r);
}

void RecordStore::append_snapshot(const PositionSnapshot& r) {
    append_line(SNAPSHOTS_FILE, r);
}

template <typename T>
std::vector<T> RecordStore::load_stream(const char* file) const {
    std::vector<T> records;
    std::string path = path_for(file);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.is_open()) {
        return records;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            auto j = nlohmann::json::parse(line);
            records.push_back(j.get<T>());
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Skipping malformed line {} in {}: {}", line_no, path, e.what());
        } catch (const std::invalid_argument& e) {
            spdlog::warn("Skipping malformed line {} in {}: {}", line_no, path, e.what());
        }
    }

    return records;
}

std::vector<DecisionRecord> RecordStore::load_decisions() const {
    return load_stream<DecisionRecord>(DECISIONS_FILE);
}

std::vector<ExecutionRecord> RecordStore::load_executions() const {
    return load_stream<ExecutionRecord>(TRADES_FILE);
}

std::vector<ResolutionRecord> RecordStore::load_resolutions() const {
    return load_stream<ResolutionRecord>(RESOLUTIONS_FILE);
}

std::vector<PositionSnapshot> RecordStore::load_snapshots() const {
    return load_stream<PositionSnapshot>(SNAPSHOTS_FILE);
}

std::set<std::string> RecordStore::resolved_trace_ids() const {
    std::set<std::string> ids;
    for (const auto& r : load_resolutions()) {
        ids.insert(r.trace_id);
    }
    return ids;
}

} // namespace pbot
