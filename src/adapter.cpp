#include <adapter.hpp>
#include <errors.hpp>


Program::Program(Executable* exe, std::string code, bool scriptlet, int pos, int line, int column) :
    executable(exe), sourceCode(code), isScriptlet(scriptlet), position(pos), startLine(line), startColumn(column) {}

Program::~Program() {}

void Program::prepare() {}


LanguageAdapter::~LanguageAdapter() {}

Value LanguageAdapter::enter(std::string entryPointName, ExecutionContext* context, std::vector<Value> args) {
    throw NoSuchEntryPointError(info.name, entryPointName);
}

void LanguageAdapter::releaseContext(ExecutionContext* context) {}
