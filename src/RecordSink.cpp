/**
 * @file RecordSink.cpp
 * @brief Puits JSON Lines
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/RecordSink.hpp"
#include "biomirror/Serialization.hpp"
#include <iostream>

namespace biomirror {

JsonLinesRecordSink::JsonLinesRecordSink(std::string path)
    : path_(std::move(path))
{
}

JsonLinesRecordSink::~JsonLinesRecordSink() {
    flush();
}

bool JsonLinesRecordSink::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.open(path_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "[RecordSink] Impossible d'ouvrir " << path_ << "\n";
        return false;
    }
    std::cout << "[RecordSink] Enregistrement vers " << path_ << "\n";
    return true;
}

bool JsonLinesRecordSink::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void JsonLinesRecordSink::recordState(const IntegratedState& state) {
    nlohmann::json line = {{"record", "state"}, {"data", toJson(state)}};
    writeLine(line.dump());
}

void JsonLinesRecordSink::recordEpisode(const DissociationEpisode& episode) {
    nlohmann::json line = {{"record", "episode"}, {"data", toJson(episode)}};
    writeLine(line.dump());
}

void JsonLinesRecordSink::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) return;
    file_ << line << '\n';
    if (!file_) {
        std::cerr << "[RecordSink] Erreur d'écriture dans " << path_ << "\n";
        file_.clear();
        return;
    }
    record_count_++;
}

void JsonLinesRecordSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.flush();
}

size_t JsonLinesRecordSink::getRecordCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_count_;
}

} // namespace biomirror
