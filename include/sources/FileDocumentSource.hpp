// Documents read from a directory tree. Names are paths relative to the base directory, with the extension optional:
// "blog/post" finds blog/post.lua (or blog/post.html, preferring the preferred extension), and a directory name finds
// the default-named file inside it.
#pragma once
#include <document.hpp>
#include <concurrentmap.hpp>


struct FileDocumentSource : DocumentSource {
    enum PathState {
        CNEP,      // Ce n'existe pas
        Directory, // it's a directory
        File,      // it's a file
        Other,     // it's something else (socket, fifo...)
        Error      // an error occurred when stat'ing it
    };

    const std::string basePath;
    const std::string defaultName; // the file that stands for a directory, minus extension
    const std::string preferredExtension; // "" for no preference
    const int64_t minimumTimeBetweenValidityChecks; // milliseconds, or VALIDITY_CHECKS_DISABLED

    FileDocumentSource(std::string base, std::string defaultFile = "index", std::string preferred = "", int64_t throttle = 0);

    std::shared_ptr<DocumentDescriptor> getDocument(std::string documentName);

    std::shared_ptr<DocumentDescriptor> setDocument(std::string documentName, std::string sourceCode, std::string tag, std::shared_ptr<Executable> executable);

    std::shared_ptr<DocumentDescriptor> setDocumentIfAbsent(std::string documentName, std::string sourceCode, std::string tag, std::shared_ptr<Executable> executable);

    std::shared_ptr<DocumentDescriptor> removeDocument(std::string documentName);

    std::vector<std::shared_ptr<DocumentDescriptor>> getDocuments(); // every visible file under the base directory, plus the in-memory documents

    std::string getIdentifier();

    std::shared_ptr<DocumentDescriptor> getCachedDescriptor(std::string documentName);

    int64_t getMinimumTimeBetweenValidityChecks();

    PathState checkPath(std::string path); // path is relative to basePath

    std::string fileForDocumentName(std::string documentName); // the absolute-ish (basePath-prefixed) file a name resolves to

private:
    ConcurrentMap<std::string, std::shared_ptr<DocumentDescriptor>> byName;
    ConcurrentMap<std::string, std::shared_ptr<DocumentDescriptor>> byFile;

    std::shared_ptr<DocumentDescriptor> removeIfInvalid(std::string documentName, std::shared_ptr<DocumentDescriptor> descriptor);
    // evict descriptor (from both maps) if it went stale. returns descriptor if it's still good, NULL otherwise

    std::string pickByStem(std::string directory, std::string stem); // "" if no file in directory has that stem
};
