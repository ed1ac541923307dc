#include <executable.hpp>
#include <registry.hpp>
#include <document.hpp>
#include <writer.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <mutex>


struct ServiceSwap { // installs the "current executable" service for one segment, and puts the old one back no matter how we leave
    ExecutionContext* context;
    std::string name;
    Value previous;
    bool active;

    ServiceSwap(ExecutionContext* ctx, std::string serviceName, Value service, bool enabled) : context(ctx), name(serviceName), active(enabled) {
        if (active) {
            previous = context -> swapService(name, service);
        }
    }

    ~ServiceSwap() {
        if (active) {
            context -> restoreService(name, previous);
        }
    }
};


struct ControllerScope { // initialize/release hooks around a whole run
    ExecutionController* controller;
    ExecutionContext* context;

    ControllerScope(ExecutionController* c, ExecutionContext* ctx) : controller(c), context(ctx) {
        if (controller != NULL) {
            controller -> initialize(context);
        }
    }

    ~ControllerScope() {
        if (controller != NULL) {
            controller -> release(context);
        }
    }
};


Executable::Executable(std::string name, std::string partitionName, int64_t timestamp, std::string sourceCode, bool textWithScriptlets, const ParsingContext& context) :
    documentName(name), partition(partitionName), documentTimestamp(timestamp), isTextWithScriptlets(textWithScriptlets),
    exposedName(context.exposedExecutableName), registry(context.registry) {
    if (registry == NULL) {
        throw ParsingError(documentName, -1, -1, "no language registry to compile against");
    }
    if (!isTextWithScriptlets) { // pure source: one program, no delimiters
        Segment segment;
        segment.kind = Segment::Scriptlet;
        segment.sourceText = sourceCode;
        segment.languageTag = context.defaultLanguageTag;
        segments.push_back(segment);
        resolveSegments(*this, segments, context);
        return;
    }
    segments = segmentDocument(*this, sourceCode, context);
    if (isPureText()) {
        return; // the trivial case needs no adapter at all
    }
    materializeSegments(*this, segments, context);
    collapseSegments(*this, segments, context);
    resolveSegments(*this, segments, context);
}

std::shared_ptr<DocumentDescriptor> Executable::createOnce(std::string documentName, bool textWithScriptlets, const ParsingContext& context) {
    if (context.documentSource == NULL) {
        throw DocumentError(documentName, -1, -1, "no document source to look " + documentName + " up in");
    }
    std::shared_ptr<DocumentDescriptor> descriptor = context.documentSource -> getDocument(documentName);
    if (descriptor -> getExecutable() != NULL) {
        return descriptor;
    }

    ParsingContext documentContext = context;
    if (extensionOf(documentName).size() > 0 || descriptor -> tag.size() > 0) {
        std::string tag = context.registry -> getLanguageTagByExtension(documentName, descriptor -> tag, context.defaultLanguageTag);
        if (tag.size() > 0) {
            documentContext.defaultLanguageTag = tag;
        }
    }
    std::shared_ptr<Executable> executable = std::make_shared<Executable>(descriptor -> name, context.documentSource -> getIdentifier(),
        descriptor -> timestamp, descriptor -> sourceCode, textWithScriptlets, documentContext);
    executable -> registerInFlowDocuments(context.documentSource);
    if (descriptor -> setExecutableIfAbsent(executable) != NULL) {
        executable -> withdrawInFlowDocuments(context.documentSource);
        LOG_INFO("%s was compiled concurrently; keeping the other copy.\n", documentName.c_str());
        return descriptor;
    }
    for (const std::string& dependency : executable -> dependencies) {
        descriptor -> addDependency(dependency);
    }
    return descriptor;
}

void Executable::registerInFlowDocuments(DocumentSource* source) {
    for (InFlowDocument& inFlow : inFlowDocuments) {
        inFlow.executable -> registerInFlowDocuments(source);
        source -> setDocument(inFlow.name, inFlow.sourceCode, inFlow.tag, inFlow.executable);
    }
}

void Executable::withdrawInFlowDocuments(DocumentSource* source) {
    for (InFlowDocument& inFlow : inFlowDocuments) {
        source -> removeDocument(inFlow.name);
        inFlow.executable -> withdrawInFlowDocuments(source);
    }
}

bool Executable::isPureText() {
    return segments.size() == 1 && !segments[0].isProgram();
}

std::string Executable::getAsPureText() {
    if (isPureText()) {
        return segments[0].sourceText;
    }
    return "";
}

void Executable::executeSegment(Segment& segment, ExecutionContext* context, Container* container) {
    LanguageAdapter* adapter = segment.adapter;
    context -> activeAdapter = adapter;
    std::unique_lock<std::recursive_mutex> lock;
    if (!adapter -> isThreadSafe()) {
        lock = std::unique_lock<std::recursive_mutex>(registry -> lockFor(adapter));
    }
    ServiceSwap swap(context, exposedName, ExposedExecutable{this, context, container}, !context -> immutable);
    try {
        segment.program -> execute(context);
    }
    catch (QuillError& e) {
        if (e.stack.size() == 0 || e.crossedInclude) {
            e.pushFrame(documentName, segment.startLine, segment.startColumn);
            e.crossedInclude = false;
        }
        throw;
    }
    catch (std::exception& e) { // whatever the adapter let through gets our stack frame model
        throw ExecutionError(documentName, segment.startLine, segment.startColumn, e.what());
    }
}

void Executable::execute(ExecutionContext* context, Container* container, ExecutionController* controller) {
    {
        ControllerScope hooks(context -> immutable ? NULL : controller, context);
        for (Segment& segment : segments) {
            if (segment.isProgram()) {
                executeSegment(segment, context, container);
            }
            else {
                context -> writer -> write(segment.sourceText);
            }
        }
    }
    lastExecutedTimestamp = nowMillis();
    State expected = Constructed;
    state.compare_exchange_strong(expected, Executed);
}

bool Executable::executeIfExpired(ExecutionContext* context, Container* container, ExecutionController* controller) {
    int64_t duration = cacheDuration;
    if (duration > 0 && nowMillis() - lastExecutedTimestamp < duration) {
        return false;
    }
    execute(context, container, controller);
    return true;
}

bool Executable::makeEnterable(ExecutionContext* context, Container* container, ExecutionController* controller) {
    if (context -> immutable || enterableContext.load() != NULL) { // one enterable executable per context
        return false;
    }
    execute(context, container, controller);
    ExecutionContext* expected = NULL;
    if (!enterableContext.compare_exchange_strong(expected, context)) { // somebody else claimed one while we were running
        return false;
    }
    // from here on, the context belongs to us: our service stays installed and nobody swaps it out
    context -> services[exposedName] = ExposedExecutable{this, context, container};
    context -> immutable = true;
    state = Enterable;
    return true;
}

Value Executable::enter(std::string entryPointName, std::vector<Value> args) {
    ExecutionContext* context = enterableContext.load();
    if (context == NULL) {
        throw ExecutionError::notEnterable(documentName);
    }
    LanguageAdapter* adapter = context -> activeAdapter;
    if (adapter == NULL) { // a pure text document defines nothing to enter
        throw NoSuchEntryPointError(documentName, entryPointName);
    }
    std::unique_lock<std::recursive_mutex> lock;
    if (!adapter -> isThreadSafe()) {
        lock = std::unique_lock<std::recursive_mutex>(registry -> lockFor(adapter));
    }
    try {
        return adapter -> enter(entryPointName, context, args);
    }
    catch (QuillError&) {
        throw;
    }
    catch (std::exception& e) {
        throw ExecutionError(documentName, -1, -1, e.what());
    }
}

void Executable::release() {
    ExecutionContext* context = enterableContext.exchange(NULL);
    if (context == NULL) {
        return;
    }
    context -> services.erase(exposedName);
    context -> immutable = false;
    std::set<LanguageAdapter*> released;
    for (Segment& segment : segments) {
        if (segment.adapter == NULL || released.contains(segment.adapter)) {
            continue;
        }
        released.insert(segment.adapter);
        std::unique_lock<std::recursive_mutex> lock;
        if (!segment.adapter -> isThreadSafe()) {
            lock = std::unique_lock<std::recursive_mutex>(registry -> lockFor(segment.adapter));
        }
        segment.adapter -> releaseContext(context);
    }
    state = Released;
}

Executable::State Executable::getState() {
    return state;
}

ExecutionContext* Executable::getEnterableContext() {
    return enterableContext;
}

int64_t Executable::getLastExecutedTimestamp() {
    return lastExecutedTimestamp;
}

void Executable::setCacheDuration(int64_t milliseconds) {
    cacheDuration = milliseconds;
}

int64_t Executable::getCacheDuration() {
    return cacheDuration;
}

int64_t Executable::getExpiration() {
    int64_t duration = cacheDuration;
    return duration > 0 ? lastExecutedTimestamp + duration : 0;
}
