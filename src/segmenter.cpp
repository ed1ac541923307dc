#include <segmenter.hpp>
#include <executable.hpp>
#include <registry.hpp>
#include <document.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <atomic>


static std::atomic<int> inFlowCounter = 0; // process-wide, so synthesized names never collide between sources


static bool startsWithAt(const std::string& text, size_t at, size_t limit, const std::string& marker) { // does marker sit at `at`, ending before limit?
    if (marker.size() == 0 || at + marker.size() > limit) {
        return false;
    }
    return text.compare(at, marker.size(), marker) == 0;
}


static Segment makeSegment(Segment::Kind kind, std::string text, std::string tag, int line, int column) {
    Segment seg;
    seg.kind = kind;
    seg.sourceText = text;
    seg.languageTag = tag;
    seg.startLine = line;
    seg.startColumn = column;
    return seg;
}


static std::string compileInFlow(Executable& executable, const ParsingContext& context, std::string tag, std::string body) {
    // the in-flow body becomes a document of its own; all the enclosing document keeps is an include of it.
    // it only reaches the document source once the enclosing document has compiled (see Executable::createOnce)
    std::string inFlowCode = executable.delimiterStart + tag + " " + trim(body) + executable.delimiterEnd;
    std::string inFlowName = IN_FLOW_PREFIX + std::to_string(inFlowCounter ++);
    ParsingContext inFlowContext = context;
    inFlowContext.defaultLanguageTag = tag;
    std::shared_ptr<Executable> inFlowExecutable = std::make_shared<Executable>(inFlowName, executable.partition, nowMillis(), inFlowCode, true, inFlowContext);
    executable.inFlowDocuments.push_back(InFlowDocument{inFlowName, inFlowCode, tag, inFlowExecutable});
    executable.dependencies.insert(inFlowName);
    if (isVerbose()) {
        printf(PARSER "In-flow scriptlet in %s compiled as %s (%s).\n", executable.documentName.c_str(), inFlowName.c_str(), tag.c_str());
    }
    return inFlowName;
}


std::vector<Segment> segmentDocument(Executable& executable, const std::string& sourceCode, const ParsingContext& context) {
    const Delimiters& delimiters = context.delimiters;
    std::vector<Segment> segments;
    std::string lastLanguageTag = context.defaultLanguageTag;

    // whichever style opens first is the style for the whole document
    size_t start1 = sourceCode.find(delimiters.start1);
    size_t start2 = sourceCode.find(delimiters.start2);
    size_t start = std::string::npos;
    if (start1 != std::string::npos && (start2 == std::string::npos || start1 <= start2)) {
        executable.delimiterStart = delimiters.start1;
        executable.delimiterEnd = delimiters.end1;
        start = start1;
    }
    else if (start2 != std::string::npos) {
        executable.delimiterStart = delimiters.start2;
        executable.delimiterEnd = delimiters.end2;
        start = start2;
    }
    else { // trivial document: pure text
        executable.delimiterStart = "";
        executable.delimiterEnd = "";
        segments.push_back(makeSegment(Segment::Literal, sourceCode, lastLanguageTag, 1, 1));
        return segments;
    }
    const std::string& delimiterStart = executable.delimiterStart;
    const std::string& delimiterEnd = executable.delimiterEnd;

    size_t last = 0;
    size_t cursor = 0; // line counting position; every byte before it has been counted
    int line = 1;
    int column = 1;
    while (start != std::string::npos) {
        if (start != last) { // text since the last scriptlet
            lineColumnAt(sourceCode, last, cursor, line, column);
            segments.push_back(makeSegment(Segment::Literal, sourceCode.substr(last, start - last), lastLanguageTag, line, column));
        }
        lineColumnAt(sourceCode, start, cursor, line, column);
        int scriptletLine = line;
        int scriptletColumn = column;

        size_t bodyStart = start + delimiterStart.size();
        size_t end = sourceCode.find(delimiterEnd, bodyStart);
        if (end == std::string::npos) {
            throw ParsingError::missingEndDelimiter(executable.documentName, scriptletLine, scriptletColumn);
        }

        Segment::Kind kind = Segment::Scriptlet;
        bool isInFlow = false;
        if (startsWithAt(sourceCode, bodyStart, end, delimiters.expression)) {
            kind = Segment::Expression;
            bodyStart += delimiters.expression.size();
        }
        else if (startsWithAt(sourceCode, bodyStart, end, delimiters.include)) {
            kind = Segment::Include;
            bodyStart += delimiters.include.size();
        }
        else if (startsWithAt(sourceCode, bodyStart, end, delimiters.inFlow)) {
            isInFlow = true;
            bodyStart += delimiters.inFlow.size();
            while (bodyStart < end && isWhitespace(sourceCode[bodyStart])) { // an in-flow without a tag is pointless, so "<%: py" means py
                bodyStart ++;
            }
        }

        std::string languageTag = lastLanguageTag;
        if (bodyStart < end && !isWhitespace(sourceCode[bodyStart])) {
            size_t tagEnd = bodyStart;
            while (tagEnd < end && !isWhitespace(sourceCode[tagEnd])) {
                tagEnd ++;
            }
            languageTag = sourceCode.substr(bodyStart, tagEnd - bodyStart);
            bodyStart = tagEnd < end ? tagEnd + 1 : tagEnd; // the whitespace that ended the tag belongs to neither
        }
        if (isInFlow && languageTag == lastLanguageTag) { // no indirection needed inside the same language
            isInFlow = false;
        }

        std::string body = sourceCode.substr(bodyStart, end - bodyStart);
        if (trim(body).size() > 0) {
            if (isInFlow && context.documentSource != NULL) {
                std::string inFlowName;
                try {
                    inFlowName = compileInFlow(executable, context, languageTag, body);
                }
                catch (ParsingError& e) { // the trace should name the file somebody actually wrote
                    e.pushFrame(executable.documentName, scriptletLine, scriptletColumn);
                    throw;
                }
                // our include is in the language we were already speaking
                segments.push_back(makeSegment(Segment::Include, "'" + inFlowName + "'", lastLanguageTag, scriptletLine, scriptletColumn));
            }
            else {
                segments.push_back(makeSegment(kind, body, languageTag, scriptletLine, scriptletColumn));
            }
        }

        if (!isInFlow) {
            lastLanguageTag = languageTag;
        }

        last = end + delimiterEnd.size();
        start = sourceCode.find(delimiterStart, last);
    }

    if (last < sourceCode.size()) {
        lineColumnAt(sourceCode, last, cursor, line, column);
        segments.push_back(makeSegment(Segment::Literal, sourceCode.substr(last), lastLanguageTag, line, column));
    }
    if (segments.size() == 0) { // nothing but empty scriptlets; keep the executable non-empty
        segments.push_back(makeSegment(Segment::Literal, "", lastLanguageTag, 1, 1));
    }
    return segments;
}


static LanguageAdapter* adapterFor(Executable& executable, const Segment& segment, const ParsingContext& context) {
    LanguageAdapter* adapter = context.registry -> getAdapterByTag(segment.languageTag);
    if (adapter == NULL) {
        throw ParsingError::adapterNotFound(executable.documentName, segment.startLine, segment.startColumn, segment.languageTag);
    }
    return adapter;
}


void materializeSegments(Executable& executable, std::vector<Segment>& segments, const ParsingContext& context) {
    for (Segment& segment : segments) {
        if (segment.kind == Segment::Expression) {
            segment.sourceText = adapterFor(executable, segment, context) -> getSourceCodeForExpressionOutput(segment.sourceText, &executable);
            segment.kind = Segment::Scriptlet;
        }
        else if (segment.kind == Segment::Include) {
            segment.sourceText = adapterFor(executable, segment, context) -> getSourceCodeForExpressionInclude(segment.sourceText, &executable);
            segment.kind = Segment::Scriptlet;
        }
    }
}


void collapseSegments(Executable& executable, std::vector<Segment>& segments, const ParsingContext& context) {
    if (segments.size() < 2) {
        return;
    }
    // pass 1: neighbors of the same kind and language become one
    std::vector<Segment> merged;
    merged.reserve(segments.size());
    for (Segment& current : segments) {
        if (merged.size() > 0) {
            Segment& previous = merged.back();
            if (previous.isProgram() == current.isProgram() && previous.languageTag == current.languageTag) {
                previous.sourceText += current.sourceText;
                continue;
            }
        }
        merged.push_back(current);
    }

    // pass 2: literals following a program of the same language are folded into it as output statements.
    // a literal is only ever folded backwards, so a leading literal stays a literal
    std::vector<Segment> folded;
    folded.reserve(merged.size());
    for (Segment& current : merged) {
        if (folded.size() > 0) {
            Segment& previous = folded.back();
            if (previous.isProgram() && previous.languageTag == current.languageTag) {
                if (current.isProgram()) {
                    previous.sourceText += current.sourceText;
                }
                else {
                    previous.sourceText += adapterFor(executable, current, context) -> getSourceCodeForLiteralOutput(current.sourceText, &executable);
                }
                continue;
            }
        }
        folded.push_back(current);
    }
    segments.swap(folded);
}


void resolveSegments(Executable& executable, std::vector<Segment>& segments, const ParsingContext& context) {
    for (size_t i = 0; i < segments.size(); i ++) {
        Segment& segment = segments[i];
        segment.position = i;
        if (!segment.isProgram()) {
            continue;
        }
        LanguageAdapter* adapter = adapterFor(executable, segment, context);
        segment.adapter = adapter;
        segment.program = adapter -> createProgram(segment.sourceText, executable.isTextWithScriptlets, segment.position, segment.startLine, segment.startColumn, &executable);
        if (context.prepare) {
            segment.program -> prepare();
        }
    }
}
