#pragma once
#include <string>

namespace pullfeed {

// Sink for ingest progress messages, injected into Ingestor.
class IngestLogger {
public:
    virtual ~IngestLogger() = default;
    virtual void info(const std::string& msg) = 0;
    virtual void warning(const std::string& msg) = 0;
};

// Forwards to the "pullfeed.ingest" Qt logging category.
class QtIngestLogger : public IngestLogger {
public:
    void info(const std::string& msg) override;
    void warning(const std::string& msg) override;
};

// Process-wide default used when no logger is injected.
IngestLogger& defaultIngestLogger();

} // namespace pullfeed
