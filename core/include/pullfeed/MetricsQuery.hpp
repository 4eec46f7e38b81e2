// Metric definitions (YAML or JSON) rendered into a SELECT over fact_cost.
// Stateless; unrelated to the ingest core.
#pragma once
#include <string>
#include <vector>

namespace pullfeed {

struct MetricDefinition {
    std::string name;
    std::string expression;
};

// .yml/.yaml files are parsed as YAML, anything else as JSON. The document is
// a map whose optional "metrics" key lists {name, expression} entries.
bool loadMetricsConfig(const std::string& path,
                       std::vector<MetricDefinition>& out,
                       std::string& err);

bool parseMetricsYaml(const std::string& text, std::vector<MetricDefinition>& out, std::string& err);
bool parseMetricsJson(const std::string& text, std::vector<MetricDefinition>& out, std::string& err);

std::string renderSqlSelect(const std::vector<MetricDefinition>& metrics);

} // namespace pullfeed
