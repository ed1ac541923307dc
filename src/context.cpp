#include <context.hpp>


Container::~Container() {}


ExecutionController::~ExecutionController() {}

void ExecutionController::initialize(ExecutionContext* context) {}

void ExecutionController::release(ExecutionContext* context) {}


ExecutionContext::ExecutionContext(Writer* out, Writer* err) : writer(out), errorWriter(err == NULL ? out : err) {}

ExposedExecutable* ExecutionContext::exposedExecutable(std::string name) {
    auto it = services.find(name);
    if (it == services.end()) {
        return NULL;
    }
    return std::any_cast<ExposedExecutable>(&it -> second);
}

Value ExecutionContext::swapService(std::string name, Value service) {
    Value previous;
    auto it = services.find(name);
    if (it != services.end()) {
        previous = it -> second;
    }
    services[name] = service;
    return previous;
}

void ExecutionContext::restoreService(std::string name, Value previous) {
    if (previous.has_value()) {
        services[name] = previous;
    }
    else {
        services.erase(name);
    }
}
