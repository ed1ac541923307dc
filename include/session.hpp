// Session holds the whole configuration: the language registry, where documents come from, and how they're compiled.
// Sessions should not be mutated except at the start by whoever builds them (the main function, or a test).
#pragma once
#include <defs.h>
#include <registry.hpp>
#include <segmenter.hpp>
#include <service.hpp>
#include <document.hpp>
#include <memory>
#include <string>
#include <vector>


struct Session {
    LanguageRegistry registry;
    std::shared_ptr<DocumentSource> source; // the primary source
    std::vector<std::shared_ptr<DocumentSource>> librarySources; // searched in order when the primary source doesn't have a document
    std::string defaultLanguageTag;
    bool prepare = false;
    std::string exposedName = DEFAULT_EXPOSED_NAME;
    Delimiters delimiters;
    ExecutionController* controller = NULL;
    DocumentService documents;

    Session(std::shared_ptr<DocumentSource> primary, std::string defaultTag);

    Session(const Session&) = delete;

    ParsingContext parsingContext(DocumentSource* documentSource); // compile settings for documents out of documentSource

    std::vector<DocumentSource*> sources(); // primary first, then the libraries

    void run(std::string documentName, ExecutionContext* context, bool isText = true);
    // compile (or fetch) the document and execute it in context. throws QuillError
};
