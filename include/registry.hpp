// LanguageRegistry maps language tags and file extensions to adapters. It's built once at startup by whoever owns the
// Session, and is read-only (apart from attributes) afterwards.
#pragma once
#include <defs.h>
#include <adapter.hpp>
#include <concurrentmap.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>


struct LanguageRegistry {
    struct Entry {
        std::shared_ptr<LanguageAdapter> adapter;
        std::recursive_mutex lock; // the critical section for a non-thread-safe adapter. recursive, because an
        // include inside a scriptlet re-enters the same adapter on the same thread.
    };

    ConcurrentMap<std::string, Value> attributes; // shared by every executable compiled against this registry

    void addAdapter(std::shared_ptr<LanguageAdapter> adapter);

    LanguageAdapter* getAdapterByTag(std::string tag); // NULL if there isn't one

    LanguageAdapter* getAdapterByExtension(std::string documentName, std::string defaultExtension);
    // uses the extension of the last path component, falling back to defaultExtension. throws ParsingError if there's neither

    std::string getLanguageTagByExtension(std::string documentName, std::string defaultExtension, std::string defaultTag);
    // the default tag of whichever adapter handles the document's extension (or defaultTag's adapter). "" if none does

    std::vector<LanguageAdapter*> getAdapters();

    std::recursive_mutex& lockFor(LanguageAdapter* adapter);

private:
    std::vector<std::unique_ptr<Entry>> entries;
    std::map<std::string, Entry*> byTag;
    std::map<std::string, Entry*> byExtension;
    std::mutex m_mutex; // guards the three containers above while adapters are being added

    Entry* entryFor(LanguageAdapter* adapter);
};
