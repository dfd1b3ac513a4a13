#include "kerf-cam/config.h"
#include "kerf-cam/utils.h"
#include <iostream>
#include <limits>
#include <string>

using namespace kerf::cam;

// Helper function to get numeric input with validation
template<typename T>
T getNumericInput(const std::string& prompt, T minValue, T maxValue) {
    T value;
    while (true) {
        std::cout << prompt;

        if (std::cin >> value) {
            if (value >= minValue && value <= maxValue) {
                break;
            } else {
                std::cout << "Error: Value must be between " << minValue << " and " << maxValue << std::endl;
            }
        } else {
            std::cin.clear();
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            std::cout << "Error: Invalid input. Please enter a number." << std::endl;
        }
    }

    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return value;
}

// Helper function to get yes/no input
bool getYesNoInput(const std::string& prompt, bool defaultValue) {
    std::string input;
    std::string defaultStr = defaultValue ? "Y/n" : "y/N";

    std::cout << prompt << " [" << defaultStr << "]: ";
    std::getline(std::cin, input);

    if (input.empty()) {
        return defaultValue;
    }

    return (input[0] == 'Y' || input[0] == 'y');
}

// Helper function to get string input with default value
std::string getStringInput(const std::string& prompt, const std::string& defaultValue) {
    std::string input;

    std::cout << prompt << " [" << defaultValue << "]: ";
    std::getline(std::cin, input);

    if (input.empty()) {
        return defaultValue;
    }

    return input;
}

// Offset prompt that repeats until the answer parses
std::optional<OffsetInput> getOffsetInput(const std::string& prompt, const std::optional<OffsetInput>& current) {
    while (true) {
        std::string input = getStringInput(prompt, JobConfig::formatOffset(current));
        try {
            return JobConfig::parseOffset(input);
        } catch (const std::exception&) {
            std::cout << "Error: Enter a radius multiplier or multiplier,distance (for example -1 or -1,0.05)." << std::endl;
        }
    }
}

void runConfigWizard(JobConfig& config) {
    std::cout << "\n====================================" << std::endl;
    std::cout << "kerf-cam Configuration Wizard" << std::endl;
    std::cout << "====================================" << std::endl;
    std::cout << "This wizard will help you set up your job and tool configuration." << std::endl;
    std::cout << "Press Enter to accept default values shown in brackets." << std::endl;
    std::cout << "------------------------------------" << std::endl;

    // Units selection first since it affects other measurements
    std::string unitStr = getStringInput("Select measurement units (mm/in)", config.getUnitsString());
    config.setUnitsFromString(unitStr);
    bool isMetric = (config.getUnits() == Unit::Metric);

    // Job settings
    std::cout << "\n--- Job Settings ---" << std::endl;
    config.setJobName(getStringInput("Enter job name", config.getJobName()));
    config.setFeedRate(getNumericInput<double>("Enter feed rate (" + config.getUnitsString() + "/min): ",
                                               1.0, isMetric ? 10000.0 : 400.0));
    config.setPlungeRate(getNumericInput<double>("Enter plunge rate (" + config.getUnitsString() + "/min): ",
                                                 1.0, isMetric ? 5000.0 : 200.0));
    config.setSpindleSpeed(getNumericInput<int>("Enter spindle speed (RPM): ", 1000, 30000));
    config.setCoolantFromString(getStringInput("Select coolant (none/flood/mist)", config.getCoolantString()));

    // Tool settings
    std::cout << "\n--- Tool Settings ---" << std::endl;
    config.setToolDiameter(getNumericInput<double>("Enter tool diameter (" + config.getUnitsString() + "): ",
                                                   0.01, isMetric ? 50.0 : 2.0));
    if (getYesNoInput("Does the machine have a tool changer?", config.getToolNumber().has_value())) {
        config.setToolNumber(getNumericInput<int>("Enter tool number: ", 0, 999));
    } else {
        config.setToolNumber(std::nullopt);
    }

    // Pocket settings
    std::cout << "\n--- Pocket Settings ---" << std::endl;
    config.setStepover(getOffsetInput("Enter stepover in tool radii (empty for 1.5)", config.getStepover()));
    double stepdown = getNumericInput<double>("Enter stepdown per layer, 0 for full depth (" +
                                              config.getUnitsString() + "): ",
                                              0.0, isMetric ? 20.0 : 0.8);
    config.setStepdown(stepdown > 0.0 ? std::optional<double>(stepdown) : std::nullopt);

    if (getYesNoInput("Would you like to change the offsets?", false)) {
        config.setOuterOffset(getOffsetInput("Enter outer offset (empty for -1)", config.getOuterOffset()));
        config.setInnerOffset(getOffsetInput("Enter inner offset (empty for 1)", config.getInnerOffset()));
        config.setAvoidOuterOffset(getOffsetInput("Enter avoid outer offset (empty for 1)", config.getAvoidOuterOffset()));
        config.setAvoidInnerOffset(getOffsetInput("Enter avoid inner offset (empty for -1)", config.getAvoidInnerOffset()));
    }

    std::cout << "\nConfiguration complete!" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configFile = "kerf-cam.cfg";

    // Check for custom config file path
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        }
    }

    JobConfig config;

    // Check if this is the first run
    bool firstRun = JobConfig::isFirstRun(configFile);

    if (firstRun) {
        std::cout << "No configuration file found. Starting setup wizard..." << std::endl;
        runConfigWizard(config);

        // Save the configuration
        if (config.saveToFile(configFile)) {
            std::cout << "Configuration saved to: " << configFile << std::endl;
        } else {
            std::cerr << "Error: Failed to save configuration." << std::endl;
            return 1;
        }
    } else {
        // Load existing configuration
        if (!config.loadFromFile(configFile)) {
            std::cerr << "Error: Failed to load configuration from: " << configFile << std::endl;
            return 1;
        }

        std::cout << "Configuration loaded from: " << configFile << std::endl;

        // Ask if the user wants to modify the configuration
        if (getYesNoInput("Would you like to modify the configuration?", false)) {
            runConfigWizard(config);

            // Save the updated configuration
            if (config.saveToFile(configFile)) {
                std::cout << "Configuration updated and saved to: " << configFile << std::endl;
            } else {
                std::cerr << "Error: Failed to save configuration." << std::endl;
                return 1;
            }
        }
    }

    // Display the current configuration
    std::cout << "\n====================================" << std::endl;
    std::cout << "Current Configuration" << std::endl;
    std::cout << "====================================" << std::endl;
    std::cout << "Job: " << config.getJobName() << std::endl;
    std::cout << "  Feed Rate: " << config.getFeedRate() << " " << config.getUnitsString() << "/min" << std::endl;
    std::cout << "  Plunge Rate: " << config.getPlungeRate() << " " << config.getUnitsString() << "/min" << std::endl;
    std::cout << "  Spindle Speed: " << config.getSpindleSpeed() << " RPM" << std::endl;
    std::cout << "  Coolant: " << config.getCoolantString() << std::endl;
    std::cout << "Tool:" << std::endl;
    std::cout << "  Diameter: " << config.getToolDiameter() << " " << config.getUnitsString() << std::endl;
    if (config.getToolNumber()) {
        std::cout << "  Number: T" << *config.getToolNumber() << std::endl;
    }
    std::cout << "Pocket:" << std::endl;
    std::cout << "  Stepover: "
              << (config.getStepover() ? JobConfig::formatOffset(config.getStepover()) : std::string("1.5"))
              << " x tool radius" << std::endl;
    if (config.getStepdown()) {
        std::cout << "  Stepdown: " << Utils::formatNumber(*config.getStepdown(), 3)
                  << " " << config.getUnitsString() << std::endl;
    } else {
        std::cout << "  Stepdown: full depth" << std::endl;
    }

    return 0;
}
