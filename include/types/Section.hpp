#pragma once

#include <vector>
#include <string>
#include <types/Value.hpp>
#include <defs.h>


struct Param { // a declared parameter (on a block definition) or a call-site argument (on a slot or function content)
    std::string name; // empty for call-site arguments, which bind by position
    Value value; // the argument itself, or the declared default
    bool required = false; // declared with no default
};


struct Span { // half-open [start, end)
    size_t start = 0;
    size_t end = 0;
};


struct Operation { // arithmetic applied to a numeric slot after it resolves
    enum Operator {
        Add,
        Subtract,
        Multiply,
        Divide
    } op = Add;

    double value = 0;

    char symbol();
};


struct Content { // what a variable definition binds its name to
    enum Type {
        Number,
        String,
        Function // value holds the function name, params the arguments it'll be called with
    } type = String;

    Value value;
    std::vector<Param> params;
};


struct Section { // one unit of a parsed template. The parser produces them in document order.
    enum Kind {
        Text,
        VariableDefinition, // span is into the comment-stripped source; the whole span is gone from the parse result text
        Slot // span is into the parse result text, which is what the slot resolver rewrites
    } kind = Text;

    Span span;
    std::string variableName;
    Content content;
    std::vector<Param> params;
    bool hasOperation = false;
    Operation operation;
    bool raw = false; // raw slots substitute strings literally, without evaluating them as templates

    void pTree(int tabLevel = 0);
};


struct ParseResult {
    std::vector<Section> parsed;
    std::string text; // the template with every variable definition cut out
};
