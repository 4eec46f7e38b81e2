#include "pullfeed/Hashing.hpp"

#include <QCryptographicHash>
#include <QFile>
#include <QString>

#include <algorithm>
#include <cctype>

namespace pullfeed {

bool md5OfFile(const std::string& path, std::string& hexDigest, std::string& err) {
    QFile f(QString::fromStdString(path));
    if (!f.open(QIODevice::ReadOnly)) {
        err = "cannot open " + path + ": " + f.errorString().toStdString();
        return false;
    }
    QCryptographicHash hash(QCryptographicHash::Md5);
    const qint64 chunk = 1 << 20;
    while (!f.atEnd()) {
        const QByteArray block = f.read(chunk);
        if (block.isEmpty() && f.error() != QFileDevice::NoError) {
            err = "read error on " + path + ": " + f.errorString().toStdString();
            return false;
        }
        hash.addData(block);
    }
    hexDigest = hash.result().toHex().toStdString();
    return true;
}

bool sameDigest(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace pullfeed
