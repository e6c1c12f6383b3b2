#pragma once

#include "transcription/result.hpp"

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string text;
    std::optional<std::string> enhanced_text;
    double audio_duration;
    double transcription_duration;
    std::optional<double> enhancement_duration;
    std::string model_name;
    std::optional<std::string> prompt_name;
    std::string audio_path;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();

    bool insert(const TranscriptionResult& result);

    // Newest first.
    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
