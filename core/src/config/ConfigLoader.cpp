#include "pullfeed/ConfigLoader.hpp"

#include <QFileInfo>
#include <QSettings>
#include <QStringList>
#include <QVariant>

#include <cstdlib>

namespace pullfeed {

namespace {

// QSettings splits unquoted INI values at commas; join them back.
QString raw(const QSettings& s, const char* key, const QString& def = {}) {
    const QVariant v = s.value(key, def);
    if (v.userType() == QMetaType::QStringList)
        return v.toStringList().join(',');
    return v.toString();
}

std::string text(const QSettings& s, const char* key, const std::string& def = {}) {
    return raw(s, key, QString::fromStdString(def)).trimmed().toStdString();
}

bool readBool(const QSettings& s, const char* key, bool def, bool& out, std::string& err) {
    const QString v = raw(s, key).trimmed().toLower();
    if (v.isEmpty()) {
        out = def;
        return true;
    }
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    err = std::string("Invalid boolean for ") + key + ": " + v.toStdString();
    return false;
}

bool readLong(const QSettings& s, const char* key, long minValue, long maxValue,
              long& out, std::string& err) {
    const QString v = raw(s, key).trimmed();
    if (v.isEmpty()) return true;
    bool ok = false;
    const long n = v.toLong(&ok);
    if (!ok || n < minValue || n > maxValue) {
        err = std::string("Invalid value for ") + key + ": " + v.toStdString();
        return false;
    }
    out = n;
    return true;
}

} // namespace

bool parseTransport(const std::string& t, Transport& out) {
    const QString v = QString::fromStdString(t).trimmed().toLower();
    if (v == "sftp") {
        out = Transport::Sftp;
        return true;
    }
    if (v == "ftp") {
        out = Transport::Ftp;
        return true;
    }
    return false;
}

bool parseKnownHostsPolicy(const std::string& t, KnownHostsPolicy& out) {
    const QString v = QString::fromStdString(t).trimmed().toLower();
    if (v == "strict") {
        out = KnownHostsPolicy::Strict;
    } else if (v == "accept-new" || v == "acceptnew") {
        out = KnownHostsPolicy::AcceptNew;
    } else if (v == "off") {
        out = KnownHostsPolicy::Off;
    } else {
        return false;
    }
    return true;
}

bool loadIngestorConfig(const std::string& iniPath, IngestorConfig& out, std::string& err) {
    const QString path = QString::fromStdString(iniPath);
    if (!QFileInfo(path).isReadable()) {
        err = "Config file not readable: " + iniPath;
        return false;
    }
    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        err = "Config file is malformed: " + iniPath;
        return false;
    }

    IngestorConfig cfg;
    const std::string transport = text(s, "remote/transport", "sftp");
    if (!parseTransport(transport, cfg.transport)) {
        err = "Unknown transport: " + transport;
        return false;
    }
    cfg.host = text(s, "remote/host");
    cfg.username = text(s, "remote/username");
    cfg.password = raw(s, "remote/password").toStdString();
    cfg.remote_dir = text(s, "remote/dir");
    cfg.local_dir = text(s, "local/dir");
    cfg.filename_glob = text(s, "remote/glob", "*");
    if (cfg.filename_glob.empty()) cfg.filename_glob = "*";

    long port = 0;
    if (!readLong(s, "remote/port", 1, 65535, port, err)) return false;
    if (port > 0) cfg.port = static_cast<std::uint16_t>(port);

    if (!readBool(s, "validation/enforce_size", false, cfg.enforce_size_match, err)) return false;
    if (!readBool(s, "validation/enforce_md5", false, cfg.enforce_md5_match, err)) return false;

    s.beginGroup("expected_md5");
    for (const QString& key : s.childKeys()) {
        const std::string digest = s.value(key).toString().trimmed().toStdString();
        if (!digest.empty()) cfg.expected_md5[key.toStdString()] = digest;
    }
    s.endGroup();

    if (!readLong(s, "transfer/timeout_ms", 1, 24L * 3600 * 1000, cfg.timeout_ms, err)) return false;
    long maxConcurrent = cfg.max_concurrent;
    if (!readLong(s, "transfer/max_concurrent", 1, 64, maxConcurrent, err)) return false;
    cfg.max_concurrent = static_cast<int>(maxConcurrent);

    const std::string policy = text(s, "ssh/known_hosts_policy", "strict");
    if (!parseKnownHostsPolicy(policy, cfg.known_hosts_policy)) {
        err = "Unknown known_hosts_policy: " + policy;
        return false;
    }
    const std::string khPath = text(s, "ssh/known_hosts_path");
    if (!khPath.empty()) cfg.known_hosts_path = khPath;
    const std::string key = text(s, "ssh/private_key");
    if (!key.empty()) cfg.private_key_path = key;

    if (const char* envPass = std::getenv("PULLFEED_PASSWORD"))
        cfg.password = envPass;

    const char* missing = cfg.host.empty()       ? "remote/host"
                          : cfg.username.empty() ? "remote/username"
                          : cfg.remote_dir.empty() ? "remote/dir"
                          : cfg.local_dir.empty()  ? "local/dir"
                                                   : nullptr;
    if (missing) {
        err = std::string("Missing required setting: ") + missing;
        return false;
    }

    out = std::move(cfg);
    return true;
}

} // namespace pullfeed
