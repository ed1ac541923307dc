#include <registry.hpp>
#include <errors.hpp>
#include <util.hpp>


void LanguageRegistry::addAdapter(std::shared_ptr<LanguageAdapter> adapter) {
    std::lock_guard<std::mutex> lock(m_mutex);
    entries.push_back(std::make_unique<Entry>());
    Entry* entry = entries.back().get();
    entry -> adapter = adapter;
    for (std::string& tag : adapter -> info.tags) {
        if (byTag.contains(tag)) {
            printf(WARNING "Language tag '%s' was claimed by %s; %s takes it over.\n", tag.c_str(), byTag[tag] -> adapter -> info.name.c_str(), adapter -> info.name.c_str());
        }
        byTag[tag] = entry;
    }
    for (std::string& extension : adapter -> info.extensions) {
        byExtension[extension] = entry;
    }
    LOG_INFO("Registered language adapter %s %s (%s).\n", adapter -> info.name.c_str(), adapter -> info.version.c_str(), adapter -> info.languageName.c_str());
}

LanguageAdapter* LanguageRegistry::getAdapterByTag(std::string tag) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = byTag.find(tag);
    if (it == byTag.end()) {
        return NULL;
    }
    return it -> second -> adapter.get();
}

LanguageAdapter* LanguageRegistry::getAdapterByExtension(std::string documentName, std::string defaultExtension) {
    size_t slash = documentName.rfind('/');
    if (slash != std::string::npos) {
        documentName = documentName.substr(slash + 1);
    }
    std::string extension = extensionOf(documentName);
    if (extension.size() == 0) {
        extension = defaultExtension;
    }
    if (extension.size() == 0) {
        throw ParsingError(documentName, -1, -1, "Name must have an extension");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = byExtension.find(extension);
    if (it == byExtension.end()) {
        return NULL;
    }
    return it -> second -> adapter.get();
}

std::string LanguageRegistry::getLanguageTagByExtension(std::string documentName, std::string defaultExtension, std::string defaultTag) {
    LanguageAdapter* adapter = getAdapterByExtension(documentName, defaultExtension);
    if (adapter == NULL) {
        adapter = getAdapterByTag(defaultTag);
    }
    if (adapter == NULL) {
        return "";
    }
    return adapter -> info.defaultTag;
}

std::vector<LanguageAdapter*> LanguageRegistry::getAdapters() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<LanguageAdapter*> ret;
    for (auto& entry : entries) {
        ret.push_back(entry -> adapter.get());
    }
    return ret;
}

LanguageRegistry::Entry* LanguageRegistry::entryFor(LanguageAdapter* adapter) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& entry : entries) {
        if (entry -> adapter.get() == adapter) {
            return entry.get();
        }
    }
    return NULL;
}

std::recursive_mutex& LanguageRegistry::lockFor(LanguageAdapter* adapter) {
    Entry* entry = entryFor(adapter);
    if (entry == NULL) { // only happens if someone hands us an adapter from another registry
        throw ExecutionError(adapter -> info.name, -1, -1, "adapter " + adapter -> info.name + " is not registered");
    }
    return entry -> lock;
}
