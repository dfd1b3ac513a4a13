#ifndef KERF_CAM_UTILS_HPP
#define KERF_CAM_UTILS_HPP

#include <string>
#include <vector>
#include "core/geometry.h"
#include "core/contour_fill.h"

namespace kerf {
namespace cam {

class Utils {
public:
    // Load operation and avoid faces from a kind,face,loop,x,y,z CSV file
    static bool loadFacesFromCSV(const std::string& filename,
                                 std::vector<PathFace>& opFaces,
                                 std::vector<PathFace>& avoidFaces);

    // Save fill contours to a CSV file
    static bool saveSequencesToCSV(const std::vector<FillSequence>& sequences, const std::string& filename);

    // Round to precision and drop trailing zeros ("1.500" -> "1.5", "2.000" -> "2")
    static std::string formatNumber(double value, int precision = 3);

    // Get the file extension from a path
    static std::string getFileExtension(const std::string& path);

    // Get the filename without extension
    static std::string getBaseName(const std::string& path);

    // Generate a filename with a different extension
    static std::string replaceExtension(const std::string& path, const std::string& newExtension);

    // Remove leading and trailing whitespace
    static std::string trim(const std::string& str);
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_UTILS_HPP
