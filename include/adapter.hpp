// The language adapter contract. Quill never looks inside a scriptlet; everything language-specific goes through a LanguageAdapter,
// and every compiled scriptlet is a Program produced by one.
#pragma once
#include <defs.h>
#include <any>
#include <memory>
#include <string>
#include <vector>


typedef std::any Value; // entry point arguments and results: std::string, double, bool, or empty


struct AdapterInfo {
    std::string name;
    std::string version;
    std::string languageName;
    std::string languageVersion;
    std::vector<std::string> extensions;
    std::string defaultExtension;
    std::vector<std::string> tags;
    std::string defaultTag;
};


struct Program { // superclass
    Executable* executable; // the executable this program is a segment of
    std::string sourceCode;
    bool isScriptlet; // false for pure source documents
    int position; // index of the owning segment
    int startLine;
    int startColumn;

    Program(Executable* exe, std::string code, bool scriptlet, int pos, int line, int column);

    virtual ~Program();

    virtual void prepare(); // compile ahead of the first execution. throws ParsingError on bad source. optional

    virtual void execute(ExecutionContext* context) = 0; // throws ExecutionError
};


struct LanguageAdapter { // superclass
    AdapterInfo info;

    virtual ~LanguageAdapter();

    virtual bool isThreadSafe() = 0; // false: the registry serializes every use of this adapter process-wide

    virtual std::string getSourceCodeForLiteralOutput(std::string text, Executable* executable) = 0;

    virtual std::string getSourceCodeForExpressionOutput(std::string expression, Executable* executable) = 0;

    virtual std::string getSourceCodeForExpressionInclude(std::string expression, Executable* executable) = 0;

    virtual std::shared_ptr<Program> createProgram(std::string sourceCode, bool isScriptlet, int position, int startLine, int startColumn, Executable* executable) = 0;

    virtual Value enter(std::string entryPointName, ExecutionContext* context, std::vector<Value> args);
    // call a function/closure/method defined by an earlier execution in this context.
    // throws NoSuchEntryPointError if it's not there. The default implementation supports no entry points at all.

    virtual void releaseContext(ExecutionContext* context); // drop whatever state this adapter keeps for the context. optional
};
