/**
 * @file main.cpp
 * @brief backscan_clean: classify scan vertices and faces for cleaning
 *
 * Loads a PLY scan, obtains per-vertex curvature (file property, text
 * file or estimator), runs the cleaning pipeline and writes the mesh
 * annotated with removal reasons.
 *
 * Exit codes: 0 success, 1 unexpected error, 2 usage, 3 file error,
 * 4 invalid input mesh/curvature, 5 invalid configuration.
 */

#include "backscan/cleaning/CleaningConfig.hpp"
#include "backscan/cleaning/CleaningPipeline.hpp"
#include "backscan/cleaning/ReasonExporter.hpp"
#include "backscan/core/Configuration.hpp"
#include "backscan/core/Logger.hpp"
#include "backscan/core/exception.h"
#include "backscan/mesh/CurvatureEstimator.hpp"
#include "backscan/mesh/PlyReader.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <string>

using namespace backscan;

namespace {

void usage() {
    std::cerr << "Usage: backscan_clean --input scan.ply [--output reasons.ply] [--config file.yaml]\n"
              << "                      [--curvature-property name | --curvature-file path]\n"
              << "                      [--log-dir dir] [--log-level level] [--<option> value ...]\n"
              << "\nCleaning options (override the 'cleaning' section of the config file):\n"
              << "  --clean-by-curvature BOOL   --curv-high-thresh X   --curv-low-thresh X\n"
              << "  --clean-by-variance BOOL    --variance-thresh X\n"
              << "  --clean-borders BOOL        --border-rings N\n"
              << "  --remove-islands BOOL\n"
              << "  --curvature-type mean|gaussian\n";
}

// "--border-rings" -> "border_rings"
std::string optionName(const std::string& flag) {
    std::string name = flag.substr(2);
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

int exitCode(core::ExitStatus status) {
    return static_cast<int>(status);
}

} // namespace

int main(int argc, char** argv) {
    std::string inputPath;
    std::string outputPath;
    std::string configPath;
    std::string curvatureProperty;
    std::string curvatureFile;
    std::string curvatureType;
    std::string logDir;
    std::string logLevel = "info";
    std::map<std::string, std::string> overrides;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--help" || arg == "-h") { usage(); return exitCode(core::ExitStatus::OK); }
        else if (arg == "--input" && hasValue) inputPath = argv[++i];
        else if (arg == "--output" && hasValue) outputPath = argv[++i];
        else if (arg == "--config" && hasValue) configPath = argv[++i];
        else if (arg == "--curvature-property" && hasValue) curvatureProperty = argv[++i];
        else if (arg == "--curvature-file" && hasValue) curvatureFile = argv[++i];
        else if (arg == "--curvature-type" && hasValue) curvatureType = argv[++i];
        else if (arg == "--log-dir" && hasValue) logDir = argv[++i];
        else if (arg == "--log-level" && hasValue) logLevel = argv[++i];
        else if (arg.compare(0, 2, "--") == 0 && cleaning::CleaningConfig::isOption(optionName(arg)) && hasValue) {
            overrides[optionName(arg)] = argv[++i];
        }
        else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            usage();
            return exitCode(core::ExitStatus::USAGE);
        }
    }

    if (inputPath.empty()) {
        usage();
        return exitCode(core::ExitStatus::USAGE);
    }
    if (!curvatureProperty.empty() && !curvatureFile.empty()) {
        std::cerr << "--curvature-property and --curvature-file are mutually exclusive" << std::endl;
        return exitCode(core::ExitStatus::USAGE);
    }

    auto& logger = core::Logger::getInstance();

    try {
        logger.setLevel(core::logLevelFromString(logLevel));
        if (!logDir.empty()) {
            if (logger.initializeWithTimestamp(logDir, logger.getLevel())) {
                logger.info("Log file: " + logger.getCurrentLogFile());
            } else {
                std::cerr << "Warning: file logging initialization failed, using console only" << std::endl;
            }
        }

        // Configuration: YAML file, then command-line overrides
        core::Configuration& configuration = core::Configuration::getInstance();
        if (!configPath.empty()) {
            configuration.load(configPath);
            LOG_INFO("Loaded configuration from " + configPath);
        }
        cleaning::CleaningConfig cleaningConfig = cleaning::CleaningConfig::fromConfiguration(configuration);
        cleaningConfig.applyOverrides(overrides);

        if (curvatureProperty.empty() && curvatureFile.empty()) {
            curvatureProperty = configuration.get<std::string>("curvature.property", "");
        }
        if (curvatureType.empty()) {
            curvatureType = configuration.get<std::string>("curvature.type", "mean");
        }
        const mesh::CurvatureType estimatorType = mesh::curvatureTypeFromString(curvatureType);

        // Fails here, before the mesh is loaded, on an invalid override
        cleaning::CleaningPipeline pipeline(cleaningConfig);

        mesh::PlyReader reader;
        const mesh::TriangleMesh scan = reader.read(inputPath);
        BACKSCAN_LOG_INFO("backscan_clean") << "Loaded " << inputPath << ": "
                                            << scan.numVertices() << " vertices, "
                                            << scan.numFaces() << " faces";

        std::vector<double> curvature;
        if (!curvatureFile.empty()) {
            curvature = mesh::loadCurvatureFile(curvatureFile, scan.numVertices());
            LOG_INFO("Curvature read from " + curvatureFile);
        } else if (!curvatureProperty.empty()) {
            curvature = mesh::curvatureFromProperty(scan, curvatureProperty);
            LOG_INFO("Curvature taken from vertex property '" + curvatureProperty + "'");
        } else {
            mesh::CurvatureEstimator estimator(estimatorType);
            curvature = estimator.compute(scan);
        }

        pipeline.setProgressCallback([](int progress) {
            LOG_DEBUG("Cleaning progress: " + std::to_string(progress) + "%");
        });
        const cleaning::CleaningResult result = pipeline.run(scan, curvature);
        LOG_INFO(result.toString());

        if (!outputPath.empty()) {
            cleaning::ReasonExporter exporter;
            exporter.exportPLY(scan, result, outputPath);
        }

        std::cout << "faces kept: " << result.facesKept() << "/" << result.faceReasons.size()
                  << "\nvertices kept: " << result.verticesKept() << "/" << result.vertexReasons.size()
                  << std::endl;

        logger.flush();
        return exitCode(core::ExitStatus::OK);

    } catch (const core::FileException& e) {
        BACKSCAN_LOG_ERROR("backscan_clean") << "File error (" << core::resultCodeToString(e.getResultCode())
                                             << "): " << e.getMessage();
        return exitCode(core::exitStatusFor(e));
    } catch (const core::InputException& e) {
        LOG_ERROR("Invalid input: " + e.getMessage());
        return exitCode(core::exitStatusFor(e));
    } catch (const core::ConfigException& e) {
        LOG_ERROR("Invalid configuration: " + e.getMessage());
        return exitCode(core::exitStatusFor(e));
    } catch (const std::exception& e) {
        LOG_CRITICAL(std::string("Unexpected error: ") + e.what());
        return exitCode(core::exitStatusFor(e));
    }
}
