#include <session.hpp>
#include <executable.hpp>


Session::Session(std::shared_ptr<DocumentSource> primary, std::string defaultTag) : source(primary), defaultLanguageTag(defaultTag), documents(this) {}

ParsingContext Session::parsingContext(DocumentSource* documentSource) {
    ParsingContext context;
    context.registry = &registry;
    context.defaultLanguageTag = defaultLanguageTag;
    context.prepare = prepare;
    context.documentSource = documentSource;
    context.exposedExecutableName = exposedName;
    context.delimiters = delimiters;
    return context;
}

std::vector<DocumentSource*> Session::sources() {
    std::vector<DocumentSource*> ret;
    if (source != NULL) {
        ret.push_back(source.get());
    }
    for (std::shared_ptr<DocumentSource>& library : librarySources) {
        ret.push_back(library.get());
    }
    return ret;
}

void Session::run(std::string documentName, ExecutionContext* context, bool isText) {
    if (isText) {
        documents.include(documentName, context);
    }
    else {
        documents.execute(documentName, context);
    }
}
