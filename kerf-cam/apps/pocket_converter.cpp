#include "core/job.h"
#include "core/polygon_ops.h"
#include "kerf-cam/config.h"
#include "kerf-cam/utils.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kerf::cam;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <faces.csv> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>         Job configuration file (default: kerf-cam.cfg if present)" << std::endl;
    std::cout << "  --output <file>         Output G-code file (default: input.nc)" << std::endl;
    std::cout << "  --name <job>            Job name written in the program header" << std::endl;
    std::cout << "  --tool-diameter <d>     Tool diameter in job units" << std::endl;
    std::cout << "  --stepover <m>          Stepover in tool radii, or m,d (default: 1.5)" << std::endl;
    std::cout << "  --stepdown <d>          Depth per pass (default: full depth in one pass)" << std::endl;
    std::cout << "  --sequences <file>      Save the pocket fill contours to a CSV file" << std::endl;
    std::cout << "  --profile               Cut around the faces instead of clearing them" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    // Parse command line arguments
    std::string facesFile = argv[1];
    std::string outputFile = Utils::replaceExtension(facesFile, "nc");
    std::string configFile = "kerf-cam.cfg";
    bool explicitConfig = false;
    std::string sequencesFile;
    std::string jobName;
    std::optional<double> toolDiameter;
    std::optional<OffsetInput> stepover;
    std::optional<double> stepdown;
    bool profile = false;

    try {
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
                explicitConfig = true;
            }
            else if (arg == "--output" && i + 1 < argc) {
                outputFile = argv[++i];
            }
            else if (arg == "--name" && i + 1 < argc) {
                jobName = argv[++i];
            }
            else if (arg == "--tool-diameter" && i + 1 < argc) {
                toolDiameter = std::stod(argv[++i]);
            }
            else if (arg == "--stepover" && i + 1 < argc) {
                stepover = JobConfig::parseOffset(argv[++i]);
            }
            else if (arg == "--stepdown" && i + 1 < argc) {
                stepdown = std::stod(argv[++i]);
            }
            else if (arg == "--sequences" && i + 1 < argc) {
                sequencesFile = argv[++i];
            }
            else if (arg == "--profile") {
                profile = true;
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid option value (" << e.what() << ")" << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    // Load configuration, falling back to defaults
    JobConfig config;
    if (explicitConfig || !JobConfig::isFirstRun(configFile)) {
        if (!config.loadFromFile(configFile)) {
            std::cerr << "Error: Failed to load configuration from: " << configFile << std::endl;
            return 1;
        }
        std::cout << "Configuration loaded from: " << configFile << std::endl;
    } else {
        std::cout << "No configuration file found, using defaults" << std::endl;
    }

    if (!jobName.empty()) config.setJobName(jobName);
    if (toolDiameter) config.setToolDiameter(*toolDiameter);
    if (stepover) config.setStepover(stepover);
    if (stepdown) config.setStepdown(stepdown);

    // Load faces
    std::cout << "Loading faces: " << facesFile << std::endl;
    std::vector<PathFace> opFaces;
    std::vector<PathFace> avoidFaces;
    if (!Utils::loadFacesFromCSV(facesFile, opFaces, avoidFaces)) {
        std::cerr << "Error: Failed to load faces." << std::endl;
        return 1;
    }
    std::cout << "Found " << opFaces.size() << " operation faces and "
              << avoidFaces.size() << " avoid faces" << std::endl;

    // Print job settings
    JobSettings settings = config.toJobSettings();
    std::cout << "Job settings:" << std::endl;
    std::cout << "  Name: " << settings.name << std::endl;
    std::cout << "  Tool diameter: " << Utils::formatNumber(*settings.toolDiameter, 3)
              << " " << config.getUnitsString() << std::endl;
    std::cout << "  Feed: " << Utils::formatNumber(settings.feed, 1)
              << ", plunge: " << Utils::formatNumber(settings.getPlungeFeed(), 1) << std::endl;
    if (config.getStepdown()) {
        std::cout << "  Stepdown: " << Utils::formatNumber(*config.getStepdown(), 3) << std::endl;
    } else {
        std::cout << "  Stepdown: full depth" << std::endl;
    }

    // Build the job
    Job job(settings);
    try {
        if (profile) {
            ProfileParams params;
            params.stepdown = config.getStepdown();
            job = job.profile(opFaces, params);
        } else {
            PocketResult result;
            job = job.pocket(opFaces, avoidFaces, config.toPocketParams(), std::nullopt, &result);

            std::cout << "\nPocket summary:" << std::endl;
            std::cout << "  Pockets: " << result.pockets.size() << std::endl;
            std::cout << "  Fill sequences: " << result.sequences.size() << std::endl;
            std::cout << "  Depth passes: " << result.layers << std::endl;
            std::cout << "  Commands: " << result.commands.size() << std::endl;

            if (!sequencesFile.empty()) {
                std::cout << "Saving fill contours to: " << sequencesFile << std::endl;
                if (Utils::saveSequencesToCSV(result.sequences, sequencesFile)) {
                    std::cout << "CSV file created successfully." << std::endl;
                }
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid job configuration: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: Toolpath generation failed: " << e.what() << std::endl;
        return 1;
    }

    // Pocket results carry their own warnings
    if (profile && PolygonOps::failedOffsetCount() > 0) {
        std::cerr << "Warning: " << PolygonOps::failedOffsetCount()
                  << " offsets failed and their features were dropped" << std::endl;
    }

    // Save G-code
    std::cout << "\nSaving G-code to: " << outputFile << std::endl;
    if (!job.saveGcode(outputFile)) {
        std::cerr << "Error: Failed to save G-code." << std::endl;
        return 1;
    }
    std::cout << "G-code file created successfully." << std::endl;

    return 0;
}
