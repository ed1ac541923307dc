#include <sources/FileDocumentSource.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <algorithm>
#include <cerrno>
#include <sys/stat.h>
#include <dirent.h>
#include <fts.h>


FileDocumentSource::FileDocumentSource(std::string base, std::string defaultFile, std::string preferred, int64_t throttle) :
    basePath(base), defaultName(defaultFile), preferredExtension(preferred), minimumTimeBetweenValidityChecks(throttle) {
    if (checkPath("") != Directory) {
        printf(WARNING "%s is not a directory; every lookup in it will fail.\n", basePath.c_str());
    }
}

FileDocumentSource::PathState FileDocumentSource::checkPath(std::string path) {
    struct stat sb;
    if (stat(fconcat(basePath, path).c_str(), &sb) == 0) {
        if (S_ISDIR(sb.st_mode)) {
            return PathState::Directory;
        }
        else if (S_ISREG(sb.st_mode)) {
            return PathState::File;
        }
        else {
            return PathState::Other;
        }
    }
    else if (errno == ENOENT || errno == ENOTDIR) {
        return PathState::CNEP;
    }
    else {
        return PathState::Error;
    }
}

std::string FileDocumentSource::pickByStem(std::string directory, std::string stem) {
    DIR* dir = opendir(directory.size() == 0 ? "." : directory.c_str());
    if (dir == NULL) {
        return "";
    }
    std::vector<std::string> candidates;
    struct dirent* entry;
    while ((entry = readdir(dir)) != NULL) {
        std::string name = entry -> d_name;
        if (name == stem || stemOf(name) == stem) {
            candidates.push_back(name);
        }
    }
    closedir(dir);
    if (candidates.size() == 0) {
        return "";
    }
    std::sort(candidates.begin(), candidates.end()); // readdir order is whatever the filesystem likes
    if (preferredExtension.size() > 0) {
        for (std::string& candidate : candidates) {
            if (extensionOf(candidate) == preferredExtension) {
                return fconcat(directory, candidate);
            }
        }
    }
    return fconcat(directory, candidates[0]);
}

std::string FileDocumentSource::fileForDocumentName(std::string documentName) {
    std::string path = fconcat(basePath, documentName);
    PathState state = checkPath(documentName);
    if (state == Directory && defaultName.size() > 0) {
        std::string found = pickByStem(path, defaultName);
        return found.size() > 0 ? found : fconcat(path, defaultName);
    }
    if (state == CNEP) { // maybe it was named without its extension
        size_t slash = path.rfind('/');
        std::string found = pickByStem(trim2dir(path), slash == std::string::npos ? path : path.substr(slash + 1));
        if (found.size() > 0) {
            return found;
        }
    }
    return path;
}

std::shared_ptr<DocumentDescriptor> FileDocumentSource::removeIfInvalid(std::string documentName, std::shared_ptr<DocumentDescriptor> descriptor) {
    if (descriptor -> isValid()) {
        return descriptor;
    }
    bool removed = byName.remove(descriptor -> name, descriptor);
    if (descriptor -> file.size() > 0) {
        removed = byFile.remove(descriptor -> file, descriptor) || removed;
    }
    if (removed) {
        printf(CACHE "%s is stale; it will be reloaded.\n", documentName.c_str());
        removeInFlowDependencies(descriptor);
    }
    return NULL;
}

std::shared_ptr<DocumentDescriptor> FileDocumentSource::getDocument(std::string documentName) {
    std::shared_ptr<DocumentDescriptor> descriptor = byName.get(documentName);
    if (descriptor != NULL) {
        descriptor = removeIfInvalid(documentName, descriptor);
    }
    if (descriptor != NULL) {
        return descriptor;
    }
    std::string file = fileForDocumentName(documentName);
    descriptor = byFile.get(file);
    if (descriptor != NULL) {
        descriptor = removeIfInvalid(documentName, descriptor);
    }
    if (descriptor != NULL) {
        return descriptor;
    }
    std::shared_ptr<DocumentDescriptor> fresh = std::make_shared<DocumentDescriptor>(this, documentName, file);
    std::shared_ptr<DocumentDescriptor> existing = byName.putIfAbsent(documentName, fresh);
    if (existing != NULL) { // somebody beat us to it; theirs wins
        return existing;
    }
    byFile.put(file, fresh);
    LOG_INFO("Loaded %s from %s.\n", documentName.c_str(), file.c_str());
    return fresh;
}

std::shared_ptr<DocumentDescriptor> FileDocumentSource::setDocument(std::string documentName, std::string sourceCode, std::string tag, std::shared_ptr<Executable> executable) {
    std::shared_ptr<DocumentDescriptor> replaced = byName.put(documentName, std::make_shared<DocumentDescriptor>(this, documentName, sourceCode, tag, executable));
    if (replaced != NULL) {
        if (replaced -> file.size() > 0) {
            byFile.remove(replaced -> file, replaced);
        }
        removeInFlowDependencies(replaced);
    }
    return replaced;
}

std::shared_ptr<DocumentDescriptor> FileDocumentSource::setDocumentIfAbsent(std::string documentName, std::string sourceCode, std::string tag, std::shared_ptr<Executable> executable) {
    return byName.putIfAbsent(documentName, std::make_shared<DocumentDescriptor>(this, documentName, sourceCode, tag, executable));
}

std::shared_ptr<DocumentDescriptor> FileDocumentSource::removeDocument(std::string documentName) {
    std::shared_ptr<DocumentDescriptor> removed = byName.remove(documentName);
    if (removed != NULL && removed -> file.size() > 0) {
        byFile.remove(removed -> file, removed);
    }
    return removed;
}

std::vector<std::shared_ptr<DocumentDescriptor>> FileDocumentSource::getDocuments() {
    std::vector<std::shared_ptr<DocumentDescriptor>> ret;
    char* paths[] = {(char*)basePath.c_str(), NULL};
    FTS* ftsp = fts_open(paths, FTS_PHYSICAL | FTS_NOCHDIR, NULL);
    if (ftsp == NULL) {
        printf(ERROR "Can't walk %s.\n", basePath.c_str());
        perror("\tfts_open");
        return ret;
    }
    FTSENT* ent;
    while ((ent = fts_read(ftsp)) != NULL) {
        if (ent -> fts_level > 0 && ent -> fts_name[0] == '.') { // hidden
            if (ent -> fts_info == FTS_D) {
                fts_set(ftsp, ent, FTS_SKIP);
            }
            continue;
        }
        if (ent -> fts_info != FTS_F) {
            continue;
        }
        std::string file = ent -> fts_path;
        std::shared_ptr<DocumentDescriptor> descriptor = byFile.get(file);
        if (descriptor == NULL) {
            std::string relative = file.substr(std::min(file.size(), basePath.size()));
            while (relative.size() > 0 && relative[0] == '/') {
                relative = relative.substr(1);
            }
            try {
                std::shared_ptr<DocumentDescriptor> fresh = std::make_shared<DocumentDescriptor>(this, relative, file);
                descriptor = byFile.putIfAbsent(file, fresh);
                if (descriptor == NULL) {
                    descriptor = fresh;
                }
            }
            catch (DocumentError& e) { // vanished or unreadable halfway through the walk
                printf(WARNING "Skipping %s: %s\n", file.c_str(), e.what());
                continue;
            }
        }
        ret.push_back(descriptor);
    }
    fts_close(ftsp);
    for (std::shared_ptr<DocumentDescriptor>& descriptor : byName.values()) {
        if (descriptor -> file.size() == 0) {
            ret.push_back(descriptor);
        }
    }
    return ret;
}

std::string FileDocumentSource::getIdentifier() {
    return basePath;
}

std::shared_ptr<DocumentDescriptor> FileDocumentSource::getCachedDescriptor(std::string documentName) {
    return byName.get(documentName);
}

int64_t FileDocumentSource::getMinimumTimeBetweenValidityChecks() {
    return minimumTimeBetweenValidityChecks;
}
