/* Quill runner
    quill-run [options] document...
    Compiles every named document out of a directory and executes it to standard output.

    -d <dir>   base directory to load documents from (default: the current directory)
    -l <tag>   default language tag (default: lua)
    -e <ext>   preferred extension when several files share a name
    -t <ms>    minimum time between validity checks, -1 to never check
    -L <dir>   library directory, searched when the base directory doesn't have a document. repeatable
    -p         compile every scriptlet ahead of its first execution
    -s         documents are pure source, not text with scriptlets
    -n <name>  name the current executable is exposed under (default: executable)
    -r <count> execute every document this many times
    -v         verbose
*/
#include <defs.h>
#include <session.hpp>
#include <context.hpp>
#include <writer.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <sources/FileDocumentSource.hpp>
#include <adapters/LuaAdapter.hpp>
#include <cstring>
#include <cstdlib>
#include <string>
#include <vector>


static const char* argumentFor(int& i, int argc, char** argv) { // the value of the flag at argv[i]
    if (i + 1 >= argc) {
        fprintf(stderr, ERROR "%s needs an argument\n", argv[i]);
        exit(2);
    }
    i ++;
    return argv[i];
}

int main(int argc, char** argv) {
    std::string baseDir = ".";
    std::string defaultTag = "lua";
    std::string preferredExtension = "";
    int64_t throttle = 0;
    std::vector<std::string> libraries;
    bool prepare = false;
    bool isText = true;
    std::string exposedName = DEFAULT_EXPOSED_NAME;
    int repeat = 1;
    std::vector<std::string> documents;
    for (int i = 1; i < argc; i ++) {
        if (strcmp(argv[i], "-d") == 0) {
            baseDir = argumentFor(i, argc, argv);
        }
        else if (strcmp(argv[i], "-l") == 0) {
            defaultTag = argumentFor(i, argc, argv);
        }
        else if (strcmp(argv[i], "-e") == 0) {
            preferredExtension = argumentFor(i, argc, argv);
        }
        else if (strcmp(argv[i], "-t") == 0) {
            throttle = atoll(argumentFor(i, argc, argv));
        }
        else if (strcmp(argv[i], "-L") == 0) {
            libraries.push_back(argumentFor(i, argc, argv));
        }
        else if (strcmp(argv[i], "-p") == 0) {
            prepare = true;
        }
        else if (strcmp(argv[i], "-s") == 0) {
            isText = false;
        }
        else if (strcmp(argv[i], "-n") == 0) {
            exposedName = argumentFor(i, argc, argv);
        }
        else if (strcmp(argv[i], "-r") == 0) {
            repeat = atoi(argumentFor(i, argc, argv));
        }
        else if (strcmp(argv[i], "-v") == 0) {
            setVerbose(true);
        }
        else if (argv[i][0] == '-') {
            fprintf(stderr, ERROR "Unexpected argument %s\n", argv[i]);
            return 2;
        }
        else {
            documents.push_back(argv[i]);
        }
    }
    if (documents.size() == 0) {
        fprintf(stderr, "usage: %s [-d dir] [-l tag] [-e ext] [-t ms] [-L dir]... [-p] [-s] [-n name] [-r count] [-v] document...\n", argv[0]);
        return 2;
    }

    Session session(std::make_shared<FileDocumentSource>(baseDir, "index", preferredExtension, throttle), defaultTag);
    for (std::string& library : libraries) {
        session.librarySources.push_back(std::make_shared<FileDocumentSource>(library, "index", preferredExtension, throttle));
    }
    session.prepare = prepare;
    session.exposedName = exposedName;
    session.registry.addAdapter(std::make_shared<LuaAdapter>());

    FileWriteOutput out(1, false);
    FileWriteOutput err(2, false);
    Writer writer(out);
    Writer errorWriter(err, true);
    int status = 0;
    for (std::string& document : documents) {
        for (int run = 0; run < repeat; run ++) {
            ExecutionContext context(&writer, &errorWriter);
            LOG_INFO("Executing %s (%d/%d).\n", document.c_str(), run + 1, repeat);
            try {
                session.run(document, &context, isText);
            }
            catch (QuillError& e) {
                writer.flush();
                fprintf(stderr, ERROR "%s\n", e.describe().c_str());
                status = 1;
                break;
            }
        }
    }
    writer.flush();
    return status;
}
