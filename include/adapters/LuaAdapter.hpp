// LuaAdapter runs scriptlets on LuaJIT. Every ExecutionContext gets its own lua_State (kept in the context's attributes),
// so globals defined by one scriptlet are visible to the next scriptlet, and to included documents, in the same context.
#pragma once
#include <adapter.hpp>
#include <luajit-2.1/lua.hpp>
#include <exception>

#define LUA_STATE_ATTRIBUTE "quill.lua.state"


struct LuaState { // one interpreter, bound to one context
    lua_State* L;
    ExecutionContext* context;
    std::string documentName; // the document that ran in here last (for error messages from enter())
    std::exception_ptr pending; // a C++ exception that had to cross a lua_error

    LuaState(ExecutionContext* ctx);

    LuaState(const LuaState&) = delete;

    ~LuaState();

    void publish(std::string exposedName); // exposed variables as globals, plus the exposed executable table

    void rethrowPending(); // if a callback failed with a C++ exception, throw it again here
};


struct LuaProgram : Program {
    std::string chunkName;
    std::string bytecode; // filled by prepare(); the source is compiled on every run otherwise

    LuaProgram(Executable* exe, std::string code, bool scriptlet, int pos, int line, int column);

    void prepare();

    void execute(ExecutionContext* context);
};


struct LuaAdapter : LanguageAdapter {
    LuaAdapter();

    bool isThreadSafe();

    std::string getSourceCodeForLiteralOutput(std::string text, Executable* executable);

    std::string getSourceCodeForExpressionOutput(std::string expression, Executable* executable);

    std::string getSourceCodeForExpressionInclude(std::string expression, Executable* executable);

    std::shared_ptr<Program> createProgram(std::string sourceCode, bool isScriptlet, int position, int startLine, int startColumn, Executable* executable);

    Value enter(std::string entryPointName, ExecutionContext* context, std::vector<Value> args);

    void releaseContext(ExecutionContext* context);

    static std::shared_ptr<LuaState> stateFor(ExecutionContext* context, bool create = true); // NULL if there's none and create is false
};
