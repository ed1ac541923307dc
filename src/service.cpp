#include <service.hpp>
#include <session.hpp>
#include <executable.hpp>
#include <document.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <set>


typedef std::shared_ptr<std::set<std::string>> ExecutedSet;


DocumentService::DocumentService(Session* s) : session(s) {}

std::shared_ptr<DocumentDescriptor> DocumentService::getDocumentDescriptor(std::string documentName, bool isText) {
    std::vector<DocumentSource*> sources = session -> sources();
    for (size_t i = 0; i < sources.size(); i ++) {
        try {
            return Executable::createOnce(documentName, isText, session -> parsingContext(sources[i]));
        }
        catch (DocumentNotFoundError&) {
            if (i + 1 == sources.size()) { // nobody has it
                throw;
            }
        }
    }
    throw DocumentNotFoundError(documentName);
}

void DocumentService::run(std::string documentName, ExecutionContext* context, bool isText) {
    try {
        std::shared_ptr<DocumentDescriptor> descriptor = getDocumentDescriptor(documentName, isText);
        std::shared_ptr<Executable> executable = descriptor -> getExecutable(); // keep it alive even if the cache drops it mid-run
        executable -> execute(context, this, session -> controller);
    }
    catch (QuillError& e) { // whoever asked for this document adds its own frame
        e.crossedInclude = true;
        throw;
    }
}

void DocumentService::include(std::string documentName, ExecutionContext* context) {
    run(documentName, context, true);
}

void DocumentService::execute(std::string documentName, ExecutionContext* context) {
    run(documentName, context, false);
}

static ExecutedSet executedSetOf(ExecutionContext* context) {
    auto it = context -> attributes.find(EXECUTED_ATTRIBUTE);
    if (it != context -> attributes.end()) {
        return std::any_cast<ExecutedSet>(it -> second);
    }
    ExecutedSet executed = std::make_shared<std::set<std::string>>();
    context -> attributes[EXECUTED_ATTRIBUTE] = executed;
    return executed;
}

bool DocumentService::executeOnce(std::string documentName, ExecutionContext* context) {
    ExecutedSet executed = executedSetOf(context);
    if (executed -> contains(documentName)) {
        return false;
    }
    executed -> insert(documentName); // before running, so a document that includes itself once doesn't loop
    run(documentName, context, false);
    return true;
}

void DocumentService::markExecuted(std::string documentName, ExecutionContext* context, bool executed) {
    ExecutedSet set = executedSetOf(context);
    if (executed) {
        set -> insert(documentName);
    }
    else {
        set -> erase(documentName);
    }
}
