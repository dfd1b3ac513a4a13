#include "kerf-cam/utils.h"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace kerf {
namespace cam {

namespace {

struct FaceLoops {
    std::string kind;
    std::map<int, std::vector<Point3D>> loops;
};

} // namespace

bool Utils::loadFacesFromCSV(const std::string& filename,
                             std::vector<PathFace>& opFaces,
                             std::vector<PathFace>& avoidFaces) {
    std::ifstream inFile(filename);
    if (!inFile.is_open()) {
        std::cerr << "Error: Could not open faces file: " << filename << std::endl;
        return false;
    }

    // Faces keep the order in which they first appear in the file
    std::vector<std::pair<std::string, int>> faceOrder;
    std::map<std::pair<std::string, int>, FaceLoops> faces;

    std::string line;
    int lineNumber = 0;
    while (std::getline(inFile, line)) {
        lineNumber++;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ',')) {
            fields.push_back(trim(field));
        }

        if (fields.size() != 6) {
            std::cerr << "Error: Expected 6 fields on line " << lineNumber << " of " << filename << std::endl;
            return false;
        }

        const std::string& kind = fields[0];
        if (kind != "op" && kind != "avoid") {
            std::cerr << "Error: Unknown face kind '" << kind << "' on line " << lineNumber << std::endl;
            return false;
        }

        try {
            int faceIndex = std::stoi(fields[1]);
            int loopIndex = std::stoi(fields[2]);
            Point3D vertex(std::stod(fields[3]), std::stod(fields[4]), std::stod(fields[5]));

            auto key = std::make_pair(kind, faceIndex);
            if (faces.find(key) == faces.end()) {
                faceOrder.push_back(key);
                faces[key].kind = kind;
            }
            faces[key].loops[loopIndex].push_back(vertex);
        } catch (const std::exception& e) {
            std::cerr << "Error: Invalid number on line " << lineNumber << " of " << filename
                      << ": " << e.what() << std::endl;
            return false;
        }
    }

    for (const auto& key : faceOrder) {
        const FaceLoops& face = faces[key];

        // Loop 0 is the outer boundary, std::map keeps the holes in index order
        std::vector<std::vector<Point3D>> loops;
        for (const auto& loop : face.loops) {
            loops.push_back(loop.second);
        }

        try {
            PathFace pathFace = PathFace::fromLoops(loops);
            if (face.kind == "op") {
                opFaces.push_back(pathFace);
            } else {
                avoidFaces.push_back(pathFace);
            }
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: Face " << key.second << " in " << filename << ": " << e.what() << std::endl;
            return false;
        }
    }

    std::cout << "DEBUG: Loaded " << opFaces.size() << " operation faces and "
              << avoidFaces.size() << " avoid faces from " << filename << std::endl;
    return true;
}

bool Utils::saveSequencesToCSV(const std::vector<FillSequence>& sequences, const std::string& filename) {
    std::ofstream outFile(filename);
    if (!outFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    outFile << "# Fill contours" << std::endl;
    outFile << "# Format: sequence_index,contour_index,point_index,x,y,z" << std::endl;

    for (size_t sequenceIndex = 0; sequenceIndex < sequences.size(); sequenceIndex++) {
        const auto& sequence = sequences[sequenceIndex];
        outFile << "# Sequence " << sequenceIndex << " (" << sequence.polygons.size() << " contours)" << std::endl;

        for (size_t contourIndex = 0; contourIndex < sequence.polygons.size(); contourIndex++) {
            const auto& points = sequence.polygons[contourIndex].getPoints();
            for (size_t pointIndex = 0; pointIndex < points.size(); pointIndex++) {
                outFile << sequenceIndex << "," << contourIndex << "," << pointIndex << ","
                        << points[pointIndex].x << "," << points[pointIndex].y << ","
                        << sequence.depth << std::endl;
            }
        }

        outFile << std::endl; // Empty line between sequences
    }

    outFile.close();
    return true;
}

std::string Utils::formatNumber(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    std::string text = ss.str();

    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
    }

    // Values that round to zero from below print as "-0"
    if (text == "-0") {
        text = "0";
    }
    return text;
}

std::string Utils::getFileExtension(const std::string& path) {
    size_t pos = path.find_last_of('.');
    if (pos == std::string::npos) {
        return "";
    }
    return path.substr(pos + 1);
}

std::string Utils::getBaseName(const std::string& path) {
    // Find the last directory separator
    size_t lastSeparator = path.find_last_of("/\\");
    std::string fileName = (lastSeparator == std::string::npos) ? path : path.substr(lastSeparator + 1);

    // Remove extension
    size_t lastDot = fileName.find_last_of('.');
    if (lastDot != std::string::npos) {
        fileName = fileName.substr(0, lastDot);
    }

    return fileName;
}

std::string Utils::replaceExtension(const std::string& path, const std::string& newExtension) {
    size_t pos = path.find_last_of('.');
    if (pos == std::string::npos) {
        return path + "." + newExtension;
    }
    return path.substr(0, pos + 1) + newExtension;
}

std::string Utils::trim(const std::string& str) {
    const std::string whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

} // namespace cam
} // namespace kerf
