// pullfeed-metrics: render a metrics definition file as a SELECT statement.
#include "pullfeed/MetricsQuery.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: pullfeed-metrics <metrics.yml|json>\n";
        return EXIT_FAILURE;
    }
    std::vector<pullfeed::MetricDefinition> metrics;
    std::string err;
    if (!pullfeed::loadMetricsConfig(argv[1], metrics, err)) {
        std::cerr << "pullfeed-metrics: " << err << "\n";
        return EXIT_FAILURE;
    }
    std::cout << pullfeed::renderSqlSelect(metrics) << "\n";
    return EXIT_SUCCESS;
}
