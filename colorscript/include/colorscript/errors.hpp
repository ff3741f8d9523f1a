#ifndef COLORSCRIPT_ERRORS_HPP
#define COLORSCRIPT_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace colorscript {

enum class ErrorKind {
    MalformedDocument,
    InvalidLabelMap,
    NoSafeMarkerChar,
    UnresolvedColor,
    UnparsableFilename,
    DocumentIO
};

const char* to_string(ErrorKind kind) noexcept;

// Base for every failure raised by the library
class ColorScriptError : public std::runtime_error {
public:
    ColorScriptError(ErrorKind kind, const std::string& message, std::size_t position = 0)
        : std::runtime_error(message), kind_(kind), position_(position) {}

    ErrorKind kind() const noexcept { return kind_; }
    std::size_t position() const noexcept { return position_; }

private:
    ErrorKind kind_;
    std::size_t position_;
};

// No color table in the document, or the table cannot be read
class MalformedDocument : public ColorScriptError {
public:
    MalformedDocument(const std::string& message, std::size_t position = 0)
        : ColorScriptError(ErrorKind::MalformedDocument, "Malformed document: " + message, position) {}
};

class InvalidLabelMap : public ColorScriptError {
public:
    InvalidLabelMap(const std::string& entry, const std::string& reason)
        : ColorScriptError(ErrorKind::InvalidLabelMap,
                           "Invalid label map entry '" + entry + "': " + reason)
        , entry_(entry) {}

    const std::string& entry() const noexcept { return entry_; }

private:
    std::string entry_;
};

// Every marker candidate byte already occurs in the document
class NoSafeMarkerChar : public ColorScriptError {
public:
    explicit NoSafeMarkerChar(const std::string& message)
        : ColorScriptError(ErrorKind::NoSafeMarkerChar, "No safe marker character: " + message) {}
};

/**
 * A color-change marker whose color has no label. The position is the
 * marker's offset in the cleaned text; the RGB text is empty when the
 * palette slot itself does not exist.
 */
class UnresolvedColor : public ColorScriptError {
public:
    UnresolvedColor(std::size_t offset, std::size_t slot, const std::string& rgb)
        : ColorScriptError(ErrorKind::UnresolvedColor, make_message(offset, slot, rgb), offset)
        , slot_(slot)
        , rgb_(rgb) {}

    std::size_t slot() const noexcept { return slot_; }
    const std::string& rgb() const noexcept { return rgb_; }

private:
    static std::string make_message(std::size_t offset, std::size_t slot, const std::string& rgb) {
        std::string message = "Unresolved color at offset " + std::to_string(offset) +
                              ": palette slot " + std::to_string(slot);
        if (rgb.empty()) {
            message += " is not declared in the color table";
        } else {
            message += " (" + rgb + ") has no label";
        }
        return message;
    }

    std::size_t slot_;
    std::string rgb_;
};

class UnparsableFilename : public ColorScriptError {
public:
    explicit UnparsableFilename(const std::string& filename)
        : ColorScriptError(ErrorKind::UnparsableFilename,
                           "File name " + filename + " is not partitionable into client name and category")
        , filename_(filename) {}

    const std::string& filename() const noexcept { return filename_; }

private:
    std::string filename_;
};

class DocumentIOError : public ColorScriptError {
public:
    DocumentIOError(const std::string& path, const std::string& reason)
        : ColorScriptError(ErrorKind::DocumentIO, "I/O error on " + path + ": " + reason) {}
};

/**
 * Per-document failure rethrown by the aggregator when the batch is
 * aborted. Keeps the kind of the original error and names the file.
 */
class DocumentError : public ColorScriptError {
public:
    DocumentError(const std::string& path, const ColorScriptError& cause)
        : ColorScriptError(cause.kind(), path + ": " + cause.what(), cause.position())
        , path_(path) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace colorscript

#endif // COLORSCRIPT_ERRORS_HPP
