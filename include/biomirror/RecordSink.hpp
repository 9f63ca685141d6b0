/**
 * @file RecordSink.hpp
 * @brief Puits d'enregistrement des états et épisodes (synchronisation ultérieure)
 * @version 1.0
 * @date 2026-10-19
 */

#ifndef BIOMIRROR_RECORD_SINK_HPP
#define BIOMIRROR_RECORD_SINK_HPP

#include "Types.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace biomirror {

/**
 * @brief Collaborateur de persistance (stockage local, synchronisation distante)
 */
class RecordSink {
public:
    virtual ~RecordSink() = default;

    virtual void recordState(const IntegratedState& state) = 0;
    virtual void recordEpisode(const DissociationEpisode& episode) = 0;
    virtual void flush() {}
};

/**
 * @brief Écrit un objet JSON par ligne dans un fichier
 */
class JsonLinesRecordSink : public RecordSink {
public:
    explicit JsonLinesRecordSink(std::string path);
    ~JsonLinesRecordSink() override;

    JsonLinesRecordSink(const JsonLinesRecordSink&) = delete;
    JsonLinesRecordSink& operator=(const JsonLinesRecordSink&) = delete;

    /**
     * @brief Ouvre le fichier en ajout
     * @return false si le fichier ne peut pas être ouvert
     */
    bool open();
    [[nodiscard]] bool isOpen() const;

    void recordState(const IntegratedState& state) override;
    void recordEpisode(const DissociationEpisode& episode) override;
    void flush() override;

    [[nodiscard]] size_t getRecordCount() const;

private:
    void writeLine(const std::string& line);

    std::string path_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t record_count_{0};
};

} // namespace biomirror

#endif // BIOMIRROR_RECORD_SINK_HPP
