#include <fstream>
#include <iostream>
#include <string>

#include <json/json.h>

#include "regen.hpp"

using namespace regen;

/**
 * \brief Computes return metrics for the trajectories of a JSON request file.
 *
 * The request holds either {"trajectory_data": ..., "options": {...}} for a single
 * trajectory or {"trajectories": [...], "options": {...}} for a batch. The metrics
 * are printed to stdout as JSON.
 */
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <request.json> [--verbose]" << std::endl;
        return 1;
    }

    std::ifstream file(argv[1]);
    if (!file) {
        std::cerr << "Cannot open " << argv[1] << std::endl;
        return 1;
    }

    Json::CharReaderBuilder reader;
    Json::Value request;
    std::string errors;
    if (!Json::parseFromStream(reader, file, &request, &errors)) {
        std::cerr << "Invalid JSON: " << errors << std::endl;
        return 1;
    }

    const bool verbose = (argc > 2 && std::string(argv[2]) == "--verbose");

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";

    try {
        service::MetricsOptions defaults;
        defaults.verbose = verbose;
        defaults.log_stream = &std::cerr;
        const auto options = service::MetricsOptions::FromJson(request["options"], defaults);
        const service::MetricsService metrics_service(options);

        Json::Value response;
        if (request.isMember("trajectories")) {
            response = service::toJson(metrics_service.computeBatch(request["trajectories"]));
        } else if (request.isMember("trajectory_data")) {
            response = service::toJson(metrics_service.computeMetrics(request["trajectory_data"]));
        } else {
            std::cerr << "Request must contain 'trajectory_data' or 'trajectories'" << std::endl;
            return 1;
        }
        std::cout << Json::writeString(writer, response) << std::endl;
    } catch (const Error& e) {
        Json::Value response(Json::objectValue);
        response["error"] = e.what();
        response["error_kind"] = toString(e.kind());
        std::cout << Json::writeString(writer, response) << std::endl;
        return 2;
    }
    return 0;
}
