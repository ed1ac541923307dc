// Documents that only exist in memory. Useful for embedding and for tests; nothing here ever goes stale on its own.
#pragma once
#include <document.hpp>
#include <concurrentmap.hpp>


struct MemoryDocumentSource : DocumentSource {
    const std::string identifier;

    MemoryDocumentSource(std::string id = "memory");

    std::shared_ptr<DocumentDescriptor> getDocument(std::string documentName);

    std::shared_ptr<DocumentDescriptor> setDocument(std::string documentName, std::string sourceCode, std::string tag, std::shared_ptr<Executable> executable);

    std::shared_ptr<DocumentDescriptor> setDocumentIfAbsent(std::string documentName, std::string sourceCode, std::string tag, std::shared_ptr<Executable> executable);

    std::shared_ptr<DocumentDescriptor> removeDocument(std::string documentName);

    std::vector<std::shared_ptr<DocumentDescriptor>> getDocuments();

    std::string getIdentifier();

    std::shared_ptr<DocumentDescriptor> getCachedDescriptor(std::string documentName);

private:
    ConcurrentMap<std::string, std::shared_ptr<DocumentDescriptor>> documents;
};
