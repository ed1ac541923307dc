// Exceptions thrown across the Quill API. Every error keeps a stack of document positions; the first frame is where it was
// raised, and a frame is pushed each time the error crosses an include (or in-flow) boundary on its way out.
#pragma once
#include <stdexcept>
#include <string>
#include <vector>


struct StackFrame {
    std::string documentName;
    int line = -1; // -1 when unknown
    int column = -1;

    std::string toString() const;
};


struct QuillError : std::runtime_error {
    std::vector<StackFrame> stack;
    bool crossedInclude = false; // left an included document and still needs the includer's frame

    QuillError(std::string message);

    QuillError(std::string documentName, int line, int column, std::string message);

    void pushFrame(std::string documentName, int line = -1, int column = -1);

    std::string describe() const; // message followed by one indented line per frame
};


struct ParsingError : QuillError { // segmentation and resolution failures: the compilation attempt is discarded
    using QuillError::QuillError;

    static ParsingError adapterNotFound(std::string documentName, int line, int column, std::string languageTag);

    static ParsingError missingEndDelimiter(std::string documentName, int line, int column);
};


struct ExecutionError : QuillError {
    using QuillError::QuillError;

    static ExecutionError notEnterable(std::string documentName);
};


struct NoSuchEntryPointError : ExecutionError { // callers may retry with a different name
    std::string entryPointName;

    NoSuchEntryPointError(std::string documentName, std::string entryPoint);
};


struct DocumentError : QuillError {
    using QuillError::QuillError;
};


struct DocumentNotFoundError : DocumentError {
    DocumentNotFoundError(std::string documentName);
};
