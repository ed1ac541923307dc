// The compiler pipeline: raw text -> segmentDocument -> materializeSegments -> collapseSegments -> resolveSegments.
// Executable's constructor is the only caller in the library; the stages are public so they can be tested one at a time.
#pragma once
#include <defs.h>
#include <segment.hpp>
#include <string>
#include <vector>


struct Delimiters {
    std::string start1 = "<%"; // style A
    std::string end1 = "%>";
    std::string start2 = "<?"; // style B
    std::string end2 = "?>";
    std::string expression = "=";
    std::string include = "&";
    std::string inFlow = ":";
};


struct ParsingContext {
    LanguageRegistry* registry = NULL;
    std::string defaultLanguageTag;
    bool prepare = false; // compile programs ahead of their first execution
    DocumentSource* documentSource = NULL; // where in-flow sub-documents get registered. in-flow is disabled without one
    std::string exposedExecutableName = DEFAULT_EXPOSED_NAME;
    Delimiters delimiters;
};


std::vector<Segment> segmentDocument(Executable& executable, const std::string& sourceCode, const ParsingContext& context);
// split the text into literal and scriptlet spans. Records the delimiter style (and in-flow documents, unregistered) on executable.
// throws ParsingError if a scriptlet is never closed.

void materializeSegments(Executable& executable, std::vector<Segment>& segments, const ParsingContext& context);
// turn expression and include shorthands into plain scriptlets through their adapters. throws ParsingError for unknown tags

void collapseSegments(Executable& executable, std::vector<Segment>& segments, const ParsingContext& context);
// merge neighbors so that as few programs as possible are created. never turns the first segment into a program

void resolveSegments(Executable& executable, std::vector<Segment>& segments, const ParsingContext& context);
// create (and optionally prepare) a Program for every program segment
