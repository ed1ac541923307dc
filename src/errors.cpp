#include <errors.hpp>


std::string StackFrame::toString() const {
    std::string ret = documentName;
    if (line >= 0) {
        ret += ":" + std::to_string(line);
        if (column >= 0) {
            ret += ":" + std::to_string(column);
        }
    }
    return ret;
}


QuillError::QuillError(std::string message) : std::runtime_error(message) {}

QuillError::QuillError(std::string documentName, int line, int column, std::string message) : std::runtime_error(message) {
    stack.push_back(StackFrame{documentName, line, column});
}

void QuillError::pushFrame(std::string documentName, int line, int column) {
    stack.push_back(StackFrame{documentName, line, column});
}

std::string QuillError::describe() const {
    std::string ret = what();
    for (const StackFrame& frame : stack) {
        ret += "\n\tat " + frame.toString();
    }
    return ret;
}


ParsingError ParsingError::adapterNotFound(std::string documentName, int line, int column, std::string languageTag) {
    return ParsingError(documentName, line, column, "adapter not found: " + languageTag);
}

ParsingError ParsingError::missingEndDelimiter(std::string documentName, int line, int column) {
    return ParsingError(documentName, line, column, "scriptlet missing closing delimiter");
}


ExecutionError ExecutionError::notEnterable(std::string documentName) {
    return ExecutionError(documentName, -1, -1, "no enterable context: " + documentName + " must be made enterable before entering it");
}


NoSuchEntryPointError::NoSuchEntryPointError(std::string documentName, std::string entryPoint) :
    ExecutionError(documentName, -1, -1, "no such entry point: " + entryPoint), entryPointName(entryPoint) {}


DocumentNotFoundError::DocumentNotFoundError(std::string documentName) : DocumentError(documentName, -1, -1, "document not found: " + documentName) {}
