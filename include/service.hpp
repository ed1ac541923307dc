// DocumentService is the Container that running programs call back into: include() and execute() another document
// from the session's sources, inline, in the caller's context.
#pragma once
#include <defs.h>
#include <context.hpp>
#include <memory>
#include <string>

#define EXECUTED_ATTRIBUTE "quill.executed" // context attribute: the set of names executeOnce has run


struct DocumentService : Container {
    Session* session;

    DocumentService(Session* s);

    void include(std::string documentName, ExecutionContext* context); // compile as text-with-scriptlets and run

    void execute(std::string documentName, ExecutionContext* context); // compile as pure source and run

    bool executeOnce(std::string documentName, ExecutionContext* context);
    // execute, unless this context has already executed (or been told it executed) the document. returns whether it ran

    void markExecuted(std::string documentName, ExecutionContext* context, bool executed);

    std::shared_ptr<DocumentDescriptor> getDocumentDescriptor(std::string documentName, bool isText);
    // compiled descriptor from the primary source, or from the first library source that has it.
    // throws DocumentNotFoundError if none does

private:
    void run(std::string documentName, ExecutionContext* context, bool isText);
};
