// ShaperError is how failures travel back up the call chain: anything that can fail returns a bool and fills one of these in.
#pragma once
#include <string>


struct ShaperError {
    enum Kind {
        None,
        NameConflict,             // a definition reuses a variable name
        NameConflictWithFunction, // a definition reuses a built-in function name
        UnknownSectionKind,       // the parser handed over something that isn't text, a definition or a slot
        MissingRequiredParameter, // a template was invoked without one of its required arguments
        UnknownFunction,          // a function-typed variable names something that isn't registered
        DivisionByZero,
        InvariantViolation,       // an unknown-typed variable reached the resolver, or a span fell outside the text
        ParseError,
        FunctionFailed            // a built-in ran and reported a failure of its own
    } kind = None;

    std::string name; // the offending identifier, if there is one
    std::string detail;

    bool fail(Kind k, std::string n, std::string d = ""); // fill in and return false, so callers can `return err.fail(...)`

    const char* kindName();

    std::string message();
};
