#pragma once
#include <defs.h>
#include <adapter.hpp>
#include <memory>
#include <string>


struct Segment {
    enum Kind {
        Literal,    // text written out verbatim
        Scriptlet,  // code, handed to the adapter as-is
        Expression, // <%= ... %>: becomes "output this expression" once materialized
        Include     // <%& ... %>: becomes "include this document" once materialized
    } kind = Literal; // Expression and Include only exist between segmentation and materialization

    std::string sourceText;
    std::string languageTag; // never empty for a program segment
    int startLine = 1;
    int startColumn = 1;
    int position = 0; // index in the owning executable, assigned after collapsing

    std::shared_ptr<Program> program; // set exactly once, by resolution
    LanguageAdapter* adapter = NULL; // the adapter that created program

    bool isProgram() const {
        return kind != Literal;
    }
};
