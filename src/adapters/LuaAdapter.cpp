#include <adapters/LuaAdapter.hpp>
#include <executable.hpp>
#include <context.hpp>
#include <writer.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <typeinfo>


// C functions handed to Lua. They must not leave C++ objects with destructors on the stack when they lua_error, so
// anything that can throw happens in a helper that reports failure by pushing the message instead.

static LuaState* upvalueState(lua_State* L) {
    return (LuaState*)lua_touserdata(L, lua_upvalueindex(1));
}

static int quill_write(lua_State* L) { // io.write, and the exposed table's write
    LuaState* state = upvalueState(L);
    int n = lua_gettop(L);
    for (int i = 1; i <= n; i ++) {
        size_t length;
        const char* data = luaL_checklstring(L, i, &length);
        state -> context -> writer -> write(data, length);
    }
    return 0;
}

static int quill_print(lua_State* L) {
    LuaState* state = upvalueState(L);
    int n = lua_gettop(L);
    lua_getglobal(L, "tostring");
    for (int i = 1; i <= n; i ++) {
        lua_pushvalue(L, -1);
        lua_pushvalue(L, i);
        lua_call(L, 1, 1);
        size_t length;
        const char* data = lua_tolstring(L, -1, &length);
        if (data == NULL) {
            return luaL_error(L, "'tostring' must return a string to 'print'");
        }
        if (i > 1) {
            state -> context -> writer -> write("\t", 1);
        }
        state -> context -> writer -> write(data, length);
        lua_pop(L, 1);
    }
    state -> context -> writer -> write("\n", 1);
    return 0;
}

static bool callContainer(lua_State* L, LuaState* state, const char* serviceName, const char* documentName, bool isText) {
    try {
        ExposedExecutable* exposed = state -> context -> exposedExecutable(serviceName);
        if (exposed == NULL || exposed -> container == NULL) {
            lua_pushfstring(L, "%s: nothing to load %s from", serviceName, documentName);
            return false;
        }
        if (isText) {
            exposed -> container -> include(documentName, state -> context);
        }
        else {
            exposed -> container -> execute(documentName, state -> context);
        }
        return true;
    }
    catch (QuillError& e) { // keep the real thing (stack frames and all) for whoever called lua_pcall
        state -> pending = std::current_exception();
        lua_pushstring(L, e.what());
        return false;
    }
    catch (std::exception& e) {
        lua_pushstring(L, e.what());
        return false;
    }
}

static int quill_include(lua_State* L) {
    const char* documentName = luaL_checkstring(L, 1);
    if (!callContainer(L, upvalueState(L), lua_tostring(L, lua_upvalueindex(2)), documentName, true)) {
        return lua_error(L);
    }
    return 0;
}

static int quill_execute(lua_State* L) {
    const char* documentName = luaL_checkstring(L, 1);
    if (!callContainer(L, upvalueState(L), lua_tostring(L, lua_upvalueindex(2)), documentName, false)) {
        return lua_error(L);
    }
    return 0;
}

static int dumpWriter(lua_State* L, const void* data, size_t size, void* userdata) {
    ((std::string*)userdata) -> append((const char*)data, size);
    return 0;
}


static bool pushValue(lua_State* L, const Value& value) { // false if there's no Lua equivalent
    if (!value.has_value()) {
        lua_pushnil(L);
    }
    else if (value.type() == typeid(std::string)) {
        const std::string& s = std::any_cast<const std::string&>(value);
        lua_pushlstring(L, s.data(), s.size());
    }
    else if (value.type() == typeid(const char*)) {
        lua_pushstring(L, std::any_cast<const char*>(value));
    }
    else if (value.type() == typeid(double)) {
        lua_pushnumber(L, std::any_cast<double>(value));
    }
    else if (value.type() == typeid(int)) {
        lua_pushnumber(L, std::any_cast<int>(value));
    }
    else if (value.type() == typeid(bool)) {
        lua_pushboolean(L, std::any_cast<bool>(value));
    }
    else {
        return false;
    }
    return true;
}

static Value toValue(lua_State* L, int index) {
    switch (lua_type(L, index)) {
        case LUA_TSTRING: {
            size_t length;
            const char* data = lua_tolstring(L, index, &length);
            return std::string(data, length);
        }
        case LUA_TNUMBER:
            return (double)lua_tonumber(L, index);
        case LUA_TBOOLEAN:
            return (bool)lua_toboolean(L, index);
        default: // nil, and anything that can't leave the interpreter
            return Value();
    }
}

static std::string errorMessage(lua_State* L) { // pops the error object
    std::string message = lua_isstring(L, -1) ? lua_tostring(L, -1) : "(error object is not a string)";
    lua_pop(L, 1);
    return message;
}

static std::string quoted(std::string text) { // a Lua string literal that evaluates to text
    std::string ret = "\"";
    for (unsigned char c : text) {
        if (c == '\\') {
            ret += "\\\\";
        }
        else if (c == '"') {
            ret += "\\\"";
        }
        else if (c == '\n') {
            ret += "\\n";
        }
        else if (c == '\r') {
            ret += "\\r";
        }
        else if (c == '\t') {
            ret += "\\t";
        }
        else if (c < 32 || c == 127) {
            char escape[5];
            snprintf(escape, sizeof(escape), "\\%03d", c); // always three digits, so a following digit can't join in
            ret += escape;
        }
        else {
            ret += c;
        }
    }
    return ret + "\"";
}


LuaState::LuaState(ExecutionContext* ctx) : context(ctx) {
    L = luaL_newstate();
    if (L == NULL) {
        throw ExecutionError("could not allocate a Lua state");
    }
    luaL_openlibs(L);
    lua_getglobal(L, "io");
    lua_pushlightuserdata(L, this);
    lua_pushcclosure(L, quill_write, 1);
    lua_setfield(L, -2, "write");
    lua_pop(L, 1);
    lua_pushlightuserdata(L, this);
    lua_pushcclosure(L, quill_print, 1);
    lua_setglobal(L, "print");
}

LuaState::~LuaState() {
    lua_close(L);
}

void LuaState::publish(std::string exposedName) {
    for (auto& variable : context -> exposedVariables) {
        if (pushValue(L, variable.second)) {
            lua_setglobal(L, variable.first.c_str());
        }
    }
    lua_getglobal(L, exposedName.c_str());
    bool present = lua_istable(L, -1);
    lua_pop(L, 1);
    if (present) {
        return;
    }
    lua_newtable(L);
    lua_pushlightuserdata(L, this);
    lua_pushstring(L, exposedName.c_str());
    lua_pushcclosure(L, quill_include, 2);
    lua_setfield(L, -2, "include");
    lua_pushlightuserdata(L, this);
    lua_pushstring(L, exposedName.c_str());
    lua_pushcclosure(L, quill_execute, 2);
    lua_setfield(L, -2, "execute");
    lua_pushlightuserdata(L, this);
    lua_pushcclosure(L, quill_write, 1);
    lua_setfield(L, -2, "write");
    lua_setglobal(L, exposedName.c_str());
}

void LuaState::rethrowPending() {
    if (pending) {
        std::exception_ptr e = pending;
        pending = std::exception_ptr();
        std::rethrow_exception(e);
    }
}


LuaProgram::LuaProgram(Executable* exe, std::string code, bool scriptlet, int pos, int line, int column) : Program(exe, code, scriptlet, pos, line, column) {
    chunkName = "=" + (exe == NULL ? std::string("lua") : exe -> documentName);
}

void LuaProgram::prepare() {
    lua_State* L = luaL_newstate();
    if (L == NULL) {
        throw ParsingError(chunkName.substr(1), startLine, startColumn, "could not allocate a Lua state");
    }
    if (luaL_loadbuffer(L, sourceCode.data(), sourceCode.size(), chunkName.c_str()) != 0) {
        std::string message = errorMessage(L);
        lua_close(L);
        throw ParsingError(chunkName.substr(1), startLine, startColumn, message);
    }
    bytecode.clear();
    lua_dump(L, dumpWriter, &bytecode);
    lua_close(L);
}

void LuaProgram::execute(ExecutionContext* context) {
    std::shared_ptr<LuaState> state = LuaAdapter::stateFor(context); // held for the whole run, even if the context is released under us
    state -> documentName = chunkName.substr(1);
    state -> publish(executable -> exposedName);
    lua_State* L = state -> L;
    int status;
    if (bytecode.size() > 0) {
        status = luaL_loadbuffer(L, bytecode.data(), bytecode.size(), chunkName.c_str());
    }
    else {
        status = luaL_loadbuffer(L, sourceCode.data(), sourceCode.size(), chunkName.c_str());
    }
    if (status == 0) {
        status = lua_pcall(L, 0, 0, 0);
    }
    if (status != 0) {
        std::string message = errorMessage(L);
        state -> rethrowPending();
        throw ExecutionError(chunkName.substr(1), startLine, startColumn, message);
    }
}


LuaAdapter::LuaAdapter() {
    info.name = "Quill LuaJIT Adapter";
    info.version = "1.0";
    info.languageName = "Lua";
    info.languageVersion = LUAJIT_VERSION;
    info.extensions = {"lua"};
    info.defaultExtension = "lua";
    info.tags = {"lua", "luajit"};
    info.defaultTag = "lua";
}

bool LuaAdapter::isThreadSafe() {
    return true; // states are never shared between contexts
}

// generated snippets are padded with spaces so they can be glued onto whatever scriptlet comes before or after
std::string LuaAdapter::getSourceCodeForLiteralOutput(std::string text, Executable* executable) {
    return " io.write(" + quoted(text) + ") ";
}

std::string LuaAdapter::getSourceCodeForExpressionOutput(std::string expression, Executable* executable) {
    return " io.write(tostring(" + expression + ")) ";
}

std::string LuaAdapter::getSourceCodeForExpressionInclude(std::string expression, Executable* executable) {
    return " " + executable -> exposedName + ".include(" + expression + ") ";
}

std::shared_ptr<Program> LuaAdapter::createProgram(std::string sourceCode, bool isScriptlet, int position, int startLine, int startColumn, Executable* executable) {
    return std::make_shared<LuaProgram>(executable, sourceCode, isScriptlet, position, startLine, startColumn);
}

std::shared_ptr<LuaState> LuaAdapter::stateFor(ExecutionContext* context, bool create) {
    auto it = context -> attributes.find(LUA_STATE_ATTRIBUTE);
    if (it != context -> attributes.end()) {
        return std::any_cast<std::shared_ptr<LuaState>>(it -> second);
    }
    if (!create) {
        return NULL;
    }
    std::shared_ptr<LuaState> state = std::make_shared<LuaState>(context);
    context -> attributes[LUA_STATE_ATTRIBUTE] = state;
    return state;
}

Value LuaAdapter::enter(std::string entryPointName, ExecutionContext* context, std::vector<Value> args) {
    std::shared_ptr<LuaState> state = stateFor(context, false);
    if (state == NULL) { // nothing ever ran here, so nothing was defined
        throw NoSuchEntryPointError("lua", entryPointName);
    }
    lua_State* L = state -> L;
    int top = lua_gettop(L);
    lua_getglobal(L, entryPointName.c_str());
    if (!lua_isfunction(L, -1)) {
        lua_settop(L, top);
        throw NoSuchEntryPointError(state -> documentName, entryPointName);
    }
    for (Value& arg : args) {
        if (!pushValue(L, arg)) {
            lua_settop(L, top);
            throw ExecutionError(state -> documentName, -1, -1, std::string("can't pass a ") + arg.type().name() + " to " + entryPointName);
        }
    }
    if (lua_pcall(L, args.size(), 1, 0) != 0) {
        std::string message = errorMessage(L);
        state -> rethrowPending();
        throw ExecutionError(state -> documentName, -1, -1, message);
    }
    Value result = toValue(L, -1);
    lua_settop(L, top);
    return result;
}

void LuaAdapter::releaseContext(ExecutionContext* context) {
    context -> attributes.erase(LUA_STATE_ATTRIBUTE);
}
