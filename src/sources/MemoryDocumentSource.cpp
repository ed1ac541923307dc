#include <sources/MemoryDocumentSource.hpp>
#include <errors.hpp>
#include <util.hpp>


MemoryDocumentSource::MemoryDocumentSource(std::string id) : identifier(id) {}

std::shared_ptr<DocumentDescriptor> MemoryDocumentSource::getDocument(std::string documentName) {
    std::shared_ptr<DocumentDescriptor> descriptor = documents.get(documentName);
    if (descriptor == NULL) {
        throw DocumentNotFoundError(documentName);
    }
    if (!descriptor -> isValid()) { // only a dependency going bad can do this
        if (documents.remove(documentName, descriptor)) {
            printf(CACHE "%s depends on a stale document; dropped.\n", documentName.c_str());
            removeInFlowDependencies(descriptor);
        }
        throw DocumentNotFoundError(documentName);
    }
    return descriptor;
}

std::shared_ptr<DocumentDescriptor> MemoryDocumentSource::setDocument(std::string documentName, std::string sourceCode, std::string tag, std::shared_ptr<Executable> executable) {
    std::shared_ptr<DocumentDescriptor> replaced = documents.put(documentName, std::make_shared<DocumentDescriptor>(this, documentName, sourceCode, tag, executable));
    if (replaced != NULL) {
        removeInFlowDependencies(replaced);
    }
    return replaced;
}

std::shared_ptr<DocumentDescriptor> MemoryDocumentSource::setDocumentIfAbsent(std::string documentName, std::string sourceCode, std::string tag, std::shared_ptr<Executable> executable) {
    return documents.putIfAbsent(documentName, std::make_shared<DocumentDescriptor>(this, documentName, sourceCode, tag, executable));
}

std::shared_ptr<DocumentDescriptor> MemoryDocumentSource::removeDocument(std::string documentName) {
    return documents.remove(documentName);
}

std::vector<std::shared_ptr<DocumentDescriptor>> MemoryDocumentSource::getDocuments() {
    return documents.values();
}

std::string MemoryDocumentSource::getIdentifier() {
    return identifier;
}

std::shared_ptr<DocumentDescriptor> MemoryDocumentSource::getCachedDescriptor(std::string documentName) {
    return documents.get(documentName);
}
