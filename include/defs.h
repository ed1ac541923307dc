#pragma once
#include <cstdio>

#define INFO      "\033[32m[   INFO   ]\033[0m "
#define ERROR     "\033[1;31m[   ERROR  ]\033[0m "
#define WARNING   "\033[33m[  WARNING ]\033[0m "
#define CACHE     "\033[34m[   CACHE  ]\033[0m "
#define PARSER    "\033[35m[  PARSER  ]\033[0m "

#define IN_FLOW_PREFIX "_IN_FLOW_"
#define DEFAULT_EXPOSED_NAME "executable"

// checks disabled: every document is considered valid forever
#define VALIDITY_CHECKS_DISABLED -1


struct Segment; // forward-declarations for everything, so headers that only pass pointers around
struct Program; // don't have to pull in the whole dependency web
struct LanguageAdapter;
struct LanguageRegistry;
struct ExecutionContext;
struct ExecutionController;
struct Container;
struct Executable;
struct DocumentDescriptor;
struct DocumentSource;
struct ParsingContext;
struct WriteOutput;
struct Writer;
struct Session;
class MapView;
