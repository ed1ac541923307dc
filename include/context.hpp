// ExecutionContext is the mutable per-call state handed to every program: where output goes, what's exposed to the
// scriptlets, and which adapter ran last. Contexts are not locked; one thread at a time, please.
#pragma once
#include <defs.h>
#include <adapter.hpp>
#include <map>
#include <string>


struct Container { // the include/execute service that running programs call back into
    virtual ~Container();

    virtual void include(std::string documentName, ExecutionContext* context) = 0; // run a text-with-scriptlets document inline

    virtual void execute(std::string documentName, ExecutionContext* context) = 0; // run a pure source document inline
};


struct ExecutionController { // hooks run around a whole execution, not around each segment
    virtual ~ExecutionController();

    virtual void initialize(ExecutionContext* context); // expose extra variables, install services, etc.

    virtual void release(ExecutionContext* context); // called on every exit path, errors included
};


struct ExposedExecutable { // the "current executable" service, installed under the executable's exposed name
    Executable* executable;
    ExecutionContext* context;
    Container* container; // may be NULL
};


struct ExecutionContext {
    Writer* writer;
    Writer* errorWriter;
    std::map<std::string, Value> exposedVariables; // published to programs by their adapters
    std::map<std::string, Value> services;
    std::map<std::string, Value> attributes; // adapter-private state lives here
    LanguageAdapter* activeAdapter = NULL; // the adapter that executed most recently in this context
    bool immutable = false; // set once an executable claims this context as its enterable context

    ExecutionContext(Writer* out, Writer* err = NULL);

    ExposedExecutable* exposedExecutable(std::string name); // NULL if nothing is installed under that name

    Value swapService(std::string name, Value service); // install service, returning whatever was there

    void restoreService(std::string name, Value previous); // put back what swapService returned (empty: remove it)
};
