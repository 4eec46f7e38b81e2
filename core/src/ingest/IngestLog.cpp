#include "pullfeed/IngestLog.hpp"

#include <QLoggingCategory>
#include <QString>

Q_LOGGING_CATEGORY(pfIngest, "pullfeed.ingest")

namespace pullfeed {

void QtIngestLogger::info(const std::string& msg) {
    qCInfo(pfIngest).noquote() << QString::fromStdString(msg);
}

void QtIngestLogger::warning(const std::string& msg) {
    qCWarning(pfIngest).noquote() << QString::fromStdString(msg);
}

IngestLogger& defaultIngestLogger() {
    static QtIngestLogger logger;
    return logger;
}

} // namespace pullfeed
