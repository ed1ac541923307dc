// Documents, as the cache sees them. A DocumentSource hands out DocumentDescriptors by name; each descriptor holds the
// source text, where it came from, and (once somebody compiled it) the Executable built from it.
#pragma once
#include <defs.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>


struct DocumentDescriptor {
    enum Validity {
        Unknown, // not decided yet, or only decided "valid for now"
        Valid,   // valid forever (in-memory documents)
        Invalid  // sticky: once invalid, always invalid
    };

    DocumentSource* source;
    std::string name;
    std::string file; // "" for documents that only exist in memory
    std::string sourceCode;
    std::string tag; // file extension, or the language tag an in-memory document was registered with
    int64_t timestamp; // mtime of the file when it was read, or the registration time

    DocumentDescriptor(DocumentSource* src, std::string documentName, std::string code, std::string languageTag, std::shared_ptr<Executable> executable);
    // an in-memory document, optionally with its executable already compiled

    DocumentDescriptor(DocumentSource* src, std::string documentName, std::string path);
    // read path. throws DocumentNotFoundError if it doesn't exist, DocumentError if it can't be read

    bool isValid();
    // false if the backing file changed since it was read, or if any document this one depends on is invalid.
    // the file is stat'd at most once per source->getMinimumTimeBetweenValidityChecks() milliseconds

    std::shared_ptr<Executable> getExecutable(); // NULL until compiled

    std::shared_ptr<Executable> setExecutable(std::shared_ptr<Executable> executable); // returns the previous one

    std::shared_ptr<Executable> setExecutableIfAbsent(std::shared_ptr<Executable> executable);
    // returns the executable that was already there (and keeps it), or NULL if ours went in

    void addDependency(std::string documentName);

    std::set<std::string> getDependencies();

private:
    std::shared_ptr<Executable> executable;
    std::shared_mutex executableLock;
    std::set<std::string> dependencies;
    std::mutex dependencyLock;
    std::atomic<Validity> validity = Unknown;
    std::atomic<int64_t> lastValidityCheck = 0;
};


struct DocumentSource { // superclass
    virtual ~DocumentSource();

    virtual std::shared_ptr<DocumentDescriptor> getDocument(std::string documentName) = 0;
    // a valid descriptor for the name, built and cached if necessary. throws DocumentNotFoundError / DocumentError

    virtual std::shared_ptr<DocumentDescriptor> setDocument(std::string documentName, std::string sourceCode, std::string tag, std::shared_ptr<Executable> executable) = 0;
    // register an in-memory document, replacing whatever had the name. returns the replaced descriptor or NULL

    virtual std::shared_ptr<DocumentDescriptor> setDocumentIfAbsent(std::string documentName, std::string sourceCode, std::string tag, std::shared_ptr<Executable> executable) = 0;
    // returns the existing descriptor (and registers nothing) or NULL

    virtual std::shared_ptr<DocumentDescriptor> removeDocument(std::string documentName) = 0;
    // forget whatever is registered or cached under the name. returns it, or NULL

    virtual std::vector<std::shared_ptr<DocumentDescriptor>> getDocuments() = 0;

    virtual std::string getIdentifier() = 0; // distinguishes the caches of several sources

    virtual std::shared_ptr<DocumentDescriptor> getCachedDescriptor(std::string documentName) = 0;
    // whatever is cached under the name, valid or not, without touching the disk. NULL if nothing is

    virtual int64_t getMinimumTimeBetweenValidityChecks(); // VALIDITY_CHECKS_DISABLED unless the source has files to check

    void removeInFlowDependencies(std::shared_ptr<DocumentDescriptor> descriptor);
    // in-flow documents only exist for the descriptor that compiled them; when it goes, so do they
};
