#include <document.hpp>
#include <mapview.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <sys/stat.h>


DocumentDescriptor::DocumentDescriptor(DocumentSource* src, std::string documentName, std::string code, std::string languageTag, std::shared_ptr<Executable> exe) :
    source(src), name(documentName), sourceCode(code), tag(languageTag), timestamp(nowMillis()), executable(exe) {}

DocumentDescriptor::DocumentDescriptor(DocumentSource* src, std::string documentName, std::string path) : source(src), name(documentName), file(path) {
    struct stat sb;
    if (stat(path.c_str(), &sb) != 0 || !S_ISREG(sb.st_mode)) {
        throw DocumentNotFoundError(documentName);
    }
    MapView map(path);
    if (!map.isValid()) {
        throw DocumentError(documentName, -1, -1, "could not read " + path);
    }
    timestamp = map.mtime();
    sourceCode = map.toString();
    tag = extensionOf(path);
}

bool DocumentDescriptor::isValid() {
    Validity known = validity;
    if (known != Unknown) {
        return known == Valid;
    }
    for (const std::string& dependencyName : getDependencies()) {
        std::shared_ptr<DocumentDescriptor> dependency = source -> getCachedDescriptor(dependencyName);
        if (dependency != NULL && !dependency -> isValid()) {
            validity = Invalid;
            return false;
        }
    }
    if (file.size() == 0) {
        validity = Valid;
        return true;
    }
    int64_t interval = source -> getMinimumTimeBetweenValidityChecks();
    if (interval == VALIDITY_CHECKS_DISABLED) {
        return true;
    }
    int64_t now = nowMillis();
    if (interval > 0 && now - lastValidityCheck <= interval) {
        return true; // checked recently enough; assume nothing changed
    }
    lastValidityCheck = now;
    int64_t modified = modificationTime(file);
    if (modified == -1 || modified > timestamp) { // gone, or touched since we read it
        validity = Invalid;
        return false;
    }
    return true;
}

std::shared_ptr<Executable> DocumentDescriptor::getExecutable() {
    std::shared_lock<std::shared_mutex> lock(executableLock);
    return executable;
}

std::shared_ptr<Executable> DocumentDescriptor::setExecutable(std::shared_ptr<Executable> exe) {
    std::unique_lock<std::shared_mutex> lock(executableLock);
    std::shared_ptr<Executable> previous = executable;
    executable = exe;
    return previous;
}

std::shared_ptr<Executable> DocumentDescriptor::setExecutableIfAbsent(std::shared_ptr<Executable> exe) {
    std::unique_lock<std::shared_mutex> lock(executableLock);
    if (executable != NULL) {
        return executable;
    }
    executable = exe;
    return NULL;
}

void DocumentDescriptor::addDependency(std::string documentName) {
    std::lock_guard<std::mutex> lock(dependencyLock);
    dependencies.insert(documentName);
}

std::set<std::string> DocumentDescriptor::getDependencies() {
    std::lock_guard<std::mutex> lock(dependencyLock);
    return dependencies;
}


DocumentSource::~DocumentSource() {}

int64_t DocumentSource::getMinimumTimeBetweenValidityChecks() {
    return VALIDITY_CHECKS_DISABLED;
}

void DocumentSource::removeInFlowDependencies(std::shared_ptr<DocumentDescriptor> descriptor) {
    for (const std::string& dependency : descriptor -> getDependencies()) {
        if (dependency.rfind(IN_FLOW_PREFIX, 0) != 0) {
            continue;
        }
        std::shared_ptr<DocumentDescriptor> inFlow = removeDocument(dependency);
        if (inFlow != NULL) {
            removeInFlowDependencies(inFlow);
        }
    }
}
