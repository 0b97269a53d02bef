#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct RunRecord {
    int64_t id = 0;
    std::string timestamp;
    std::string input_path;
    std::string model;
    std::optional<double> load;
    std::optional<double> confidence;
    std::string text;
    std::string error;
    double processing_time = 0.0;
};

// Append-only log of finished runs. Nothing on the transcription path reads it.
class RunHistory {
public:
    RunHistory();
    ~RunHistory();

    RunHistory(const RunHistory&) = delete;
    RunHistory& operator=(const RunHistory&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // id and timestamp of `record` are ignored; the database assigns them.
    bool insert(const RunRecord& record);

    std::vector<RunRecord> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
