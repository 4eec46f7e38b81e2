#include "pullfeed/MetricsQuery.hpp"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <yaml-cpp/yaml.h>

namespace pullfeed {

namespace {

// Numbers and booleans are rendered as written, like YAML scalars.
bool isScalar(const QJsonValue& v) {
    return v.isString() || v.isDouble() || v.isBool();
}

std::string scalarText(const QJsonValue& v) {
    return v.toVariant().toString().toStdString();
}

} // namespace

bool parseMetricsYaml(const std::string& text, std::vector<MetricDefinition>& out, std::string& err) {
    out.clear();
    try {
        const YAML::Node root = YAML::Load(text);
        if (root.IsNull()) return true;
        if (!root.IsMap()) {
            err = "metrics config must be a mapping";
            return false;
        }
        const YAML::Node metrics = root["metrics"];
        if (!metrics || metrics.IsNull()) return true;
        if (!metrics.IsSequence()) {
            err = "'metrics' must be a list";
            return false;
        }
        for (std::size_t i = 0; i < metrics.size(); ++i) {
            const YAML::Node m = metrics[i];
            if (!m.IsMap() || !m["name"] || !m["expression"]) {
                err = "metric #" + std::to_string(i) + " needs 'name' and 'expression'";
                return false;
            }
            out.push_back({m["name"].as<std::string>(), m["expression"].as<std::string>()});
        }
    } catch (const YAML::Exception& e) {
        err = std::string("YAML error: ") + e.what();
        return false;
    }
    return true;
}

bool parseMetricsJson(const std::string& text, std::vector<MetricDefinition>& out, std::string& err) {
    out.clear();
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(text), &perr);
    if (perr.error != QJsonParseError::NoError) {
        err = "JSON error at offset " + std::to_string(perr.offset) + ": " +
              perr.errorString().toStdString();
        return false;
    }
    if (!doc.isObject()) {
        err = "metrics config must be an object";
        return false;
    }
    const QJsonValue metrics = doc.object().value("metrics");
    if (metrics.isUndefined() || metrics.isNull()) return true;
    if (!metrics.isArray()) {
        err = "'metrics' must be a list";
        return false;
    }
    const QJsonArray arr = metrics.toArray();
    for (int i = 0; i < arr.size(); ++i) {
        const QJsonObject m = arr.at(i).toObject();
        const QJsonValue name = m.value("name");
        const QJsonValue expr = m.value("expression");
        if (!isScalar(name) || !isScalar(expr)) {
            err = "metric #" + std::to_string(i) + " needs 'name' and 'expression'";
            return false;
        }
        out.push_back({scalarText(name), scalarText(expr)});
    }
    return true;
}

bool loadMetricsConfig(const std::string& path,
                       std::vector<MetricDefinition>& out,
                       std::string& err) {
    QFile f(QString::fromStdString(path));
    if (!f.open(QIODevice::ReadOnly)) {
        err = "cannot open " + path + ": " + f.errorString().toStdString();
        return false;
    }
    const std::string text = f.readAll().toStdString();
    const QString suffix = QFileInfo(f.fileName()).suffix().toLower();
    if (suffix == "yml" || suffix == "yaml")
        return parseMetricsYaml(text, out, err);
    return parseMetricsJson(text, out, err);
}

std::string renderSqlSelect(const std::vector<MetricDefinition>& metrics) {
    std::string selectList;
    for (const auto& m : metrics) {
        if (!selectList.empty()) selectList += ",\n";
        selectList += "    " + m.expression + " AS " + m.name;
    }
    if (selectList.empty()) selectList = "    1 AS no_metrics_configured";
    return "SELECT\n" + selectList + "\nFROM fact_cost;";
}

} // namespace pullfeed
