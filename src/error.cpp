#include <error.hpp>


bool ShaperError::fail(Kind k, std::string n, std::string d) {
    kind = k;
    name = n;
    detail = d;
    return false;
}

const char* ShaperError::kindName() {
    switch (kind) {
        case Kind::None:
            return "None";
        case Kind::NameConflict:
            return "NameConflict";
        case Kind::NameConflictWithFunction:
            return "NameConflictWithFunction";
        case Kind::UnknownSectionKind:
            return "UnknownSectionKind";
        case Kind::MissingRequiredParameter:
            return "MissingRequiredParameter";
        case Kind::UnknownFunction:
            return "UnknownFunction";
        case Kind::DivisionByZero:
            return "DivisionByZero";
        case Kind::InvariantViolation:
            return "InvariantViolation";
        case Kind::ParseError:
            return "ParseError";
        case Kind::FunctionFailed:
            return "FunctionFailed";
    }
    return "Unknown";
}

std::string ShaperError::message() {
    std::string ret;
    switch (kind) {
        case Kind::None:
            return "No error";
        case Kind::NameConflict:
            ret = "Variable name conflict: " + name;
            break;
        case Kind::NameConflictWithFunction:
            ret = "Variable name conflicts with function: " + name;
            break;
        case Kind::UnknownSectionKind:
            ret = "Unknown section kind";
            break;
        case Kind::MissingRequiredParameter:
            ret = "Required param not found: " + name;
            break;
        case Kind::UnknownFunction:
            ret = "Unknown function: " + name;
            break;
        case Kind::DivisionByZero:
            ret = "Division by zero in " + name;
            break;
        case Kind::InvariantViolation:
            ret = "Invariant violated by " + name;
            break;
        case Kind::ParseError:
            ret = "Parse error";
            if (name.size() > 0) {
                ret += " at " + name;
            }
            break;
        case Kind::FunctionFailed:
            ret = "Function " + name + " failed";
            break;
    }
    if (detail.size() > 0) {
        ret += " (" + detail + ")";
    }
    return ret;
}
