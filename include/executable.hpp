// Executable is a compiled document: an ordered list of literal and program segments, plus the state machine that
// runs it (Constructed -> Executed -> Enterable -> Released). A failed construction throws, so there's no Failed object to
// speak of; nothing half-built ever reaches a cache.
#pragma once
#include <defs.h>
#include <segment.hpp>
#include <segmenter.hpp>
#include <context.hpp>
#include <concurrentmap.hpp>
#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <vector>


struct InFlowDocument { // an in-flow scriptlet compiled as a document of its own, waiting to be registered
    std::string name;
    std::string sourceCode;
    std::string tag;
    std::shared_ptr<Executable> executable;
};


struct Executable {
    enum State {
        Constructed, // resolved, never executed
        Executed,    // executed at least once
        Enterable,   // owns an enterable context; enter() works
        Released     // the enterable context was given back; makeEnterable() may claim a new one
    };

    const std::string documentName;
    const std::string partition; // identifier of the document source this came from
    const int64_t documentTimestamp;
    const bool isTextWithScriptlets;
    const std::string exposedName; // the name the "current executable" service is installed under
    std::string delimiterStart; // "" if the document used none
    std::string delimiterEnd;
    std::set<std::string> dependencies; // documents synthesized while compiling this one (in-flow). fixed after construction
    std::vector<InFlowDocument> inFlowDocuments; // the same documents, not yet visible in any source
    std::vector<Segment> segments; // never empty
    ConcurrentMap<std::string, Value> attributes;

    Executable(std::string name, std::string partitionName, int64_t timestamp, std::string sourceCode, bool textWithScriptlets, const ParsingContext& context);
    // throws ParsingError

    Executable(const Executable&) = delete;

    static std::shared_ptr<DocumentDescriptor> createOnce(std::string documentName, bool textWithScriptlets, const ParsingContext& context);
    // look the document up in context.documentSource and compile it unless someone already has. however many threads race
    // here, they all come back with the same executable inside the returned descriptor.

    void registerInFlowDocuments(DocumentSource* source); // make the in-flow documents includable from source

    void withdrawInFlowDocuments(DocumentSource* source); // undo registerInFlowDocuments

    bool isPureText();

    std::string getAsPureText(); // the whole document if it has no scriptlets, "" otherwise. check isPureText() first

    void execute(ExecutionContext* context, Container* container = NULL, ExecutionController* controller = NULL);
    // throws ExecutionError. the controller is skipped for immutable (enterable) contexts

    bool executeIfExpired(ExecutionContext* context, Container* container = NULL, ExecutionController* controller = NULL);
    // like execute, but returns false without running if the last run is younger than cacheDuration

    bool makeEnterable(ExecutionContext* context, Container* container = NULL, ExecutionController* controller = NULL);
    // execute once and claim context for later enter() calls. false (and nothing happens) if a context is already claimed.
    // the context must outlive the claim

    Value enter(std::string entryPointName, std::vector<Value> args = {}); // throws ExecutionError / NoSuchEntryPointError

    void release(); // give the enterable context back. idempotent

    State getState();

    ExecutionContext* getEnterableContext();

    int64_t getLastExecutedTimestamp(); // 0 if never executed

    void setCacheDuration(int64_t milliseconds);

    int64_t getCacheDuration();

    int64_t getExpiration(); // last run + cache duration, 0 if there's no cache duration

private:
    LanguageRegistry* registry;
    std::atomic<State> state = Constructed;
    std::atomic<ExecutionContext*> enterableContext = NULL;
    std::atomic<int64_t> lastExecutedTimestamp = 0;
    std::atomic<int64_t> cacheDuration = 0;

    void executeSegment(Segment& segment, ExecutionContext* context, Container* container);
};
