#include <colorscript/types.hpp>
#include <colorscript/errors.hpp>
#include <cstdio>

namespace colorscript {

std::string Rgb::to_string() const {
    return "RGB(" + std::to_string(red) + "," + std::to_string(green) + "," +
           std::to_string(blue) + ")";
}

std::string Rgb::to_hex() const {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", red, green, blue);
    return std::string(buffer);
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MalformedDocument:  return "MalformedDocument";
        case ErrorKind::InvalidLabelMap:    return "InvalidLabelMap";
        case ErrorKind::NoSafeMarkerChar:   return "NoSafeMarkerChar";
        case ErrorKind::UnresolvedColor:    return "UnresolvedColor";
        case ErrorKind::UnparsableFilename: return "UnparsableFilename";
        case ErrorKind::DocumentIO:         return "DocumentIO";
    }
    return "Unknown";
}

} // namespace colorscript
