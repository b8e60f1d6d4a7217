/**
 * @file astchart_cli.cpp
 * @brief Command line front end: request JSON in, result JSON out
 * @author AstChart Team
 * @date 2026-02-24
 *
 * Usage:
 *   astchart_cli [--config <config.json>] <request.json | ->
 *   astchart_cli --list
 *
 * Request format:
 *   {"analysis": "birth-chart",
 *    "subject": {"birth_date": "1990-06-15", "birth_time": "12:00",
 *                "latitude": 51.48, "longitude": 0.0, "timezone_offset": 0},
 *    "as_of": "2026-01-01", "params": {}}
 */

#include "astchart/AstChart.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace astchart;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <config.json>] <request.json | ->" << std::endl;
    std::cerr << "       " << argv0 << " --list" << std::endl;
}

nlohmann::json readRequest(const std::string& path) {
    nlohmann::json j;
    if (path == "-") {
        std::cin >> j;
        return j;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open request file: " + path);
    }
    f >> j;
    return j;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string request_path;
    bool list = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--list") {
            list = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            request_path = arg;
        }
    }

    if (!list && request_path.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        io::AstChartConfig config;
        if (!config_path.empty()) {
            if (!std::filesystem::exists(config_path)) {
                std::cerr << "Error: Config file not found: " << config_path << std::endl;
                return 1;
            }
            config = io::loadAstChartConfig(config_path);
        }

        if (list) {
            for (const auto& d : service::AnalysisCatalog::standard().entries()) {
                std::cout << d.id << "\t" << service::pipelineName(d.pipeline) << "\t"
                          << d.title << std::endl;
            }
            return 0;
        }

        auto context = std::make_shared<service::CalculationContext>(config);
        service::ServiceDispatcher dispatcher(context);

        const auto request = io::requestFromJson(readRequest(request_path));
        const auto result = dispatcher.invoke(request);
        std::cout << io::toJson(result).dump(2) << std::endl;
        return 0;
    } catch (const AstChartError& e) {
        std::cout << io::errorToJson(e).dump(2) << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
