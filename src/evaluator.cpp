#include <evaluator.hpp>
#include <parser.hpp>
#include <session.hpp>
#include <writer.hpp>
#include <util.hpp>
#include <algorithm>
#include <cstdio>


bool bindVariables(std::vector<Section>& sections, Environment& variables, Session* session, ShaperError& err) {
    for (Section& section : sections) {
        switch (section.kind) {
            case Section::Kind::VariableDefinition:
                if (session -> isFunction(section.variableName)) {
                    return err.fail(ShaperError::Kind::NameConflictWithFunction, section.variableName);
                }
                if (variables.contains(section.variableName)) {
                    return err.fail(ShaperError::Kind::NameConflict, section.variableName);
                }
                variables[section.variableName] = Variable::fromDefinition(section);
                break;
            case Section::Kind::Slot: // slots and text are the resolver's business
            case Section::Kind::Text:
                break;
            default:
                return err.fail(ShaperError::Kind::UnknownSectionKind, section.variableName, "section kind " + std::to_string((int)section.kind));
        }
    }
    return true;
}


static bool bindParams(Section& slot, Variable& variable, Environment& callEnv, ShaperError& err) { // positional: declared param i takes argument i
    for (size_t i = 0; i < variable.params.size(); i ++) {
        Param& declared = variable.params[i];
        Value bound;
        if (i < slot.params.size()) {
            bound = slot.params[i].value;
        }
        else if (declared.required) {
            return err.fail(ShaperError::Kind::MissingRequiredParameter, declared.name, "required by " + slot.variableName);
        }
        else {
            bound = declared.value;
        }
        callEnv[declared.name] = Variable::fromValue(declared.name, bound); // the argument's own type decides the variable's
    }
    return true;
}


static bool resolveSlot(Section& slot, Environment& variables, Session* session, Value& result, bool& found, ShaperError& err, int depth) {
    Variable inlineCall;
    Variable* variable;
    auto entry = variables.find(slot.variableName);
    if (entry != variables.end()) {
        variable = &entry -> second;
    }
    else if (session -> isFunction(slot.variableName)) { // inline function call, no definition needed
        inlineCall = Variable(slot.variableName, Variable::Type::Function, Value(slot.variableName), slot.params);
        variable = &inlineCall;
    }
    else {
        found = false; // unresolved slots stay in the text as they are
        return true;
    }
    found = true;
    if (session -> debug) {
        printf(DEBUG "Slot %s resolves to a %s variable\n", slot.variableName.c_str(), variable -> typeName());
    }
    switch (variable -> type) {
        case Variable::Type::Number:
            result = variable -> value;
            break;
        case Variable::Type::String: {
            if (slot.raw) {
                result = variable -> value;
                break;
            }
            Environment callEnv = variables;
            if (!bindParams(slot, *variable, callEnv, err)) {
                return false;
            }
            std::string rendered;
            if (!renderTemplate(variable -> value.toString(), callEnv, session, rendered, err, depth + 1)) {
                return false;
            }
            result = Value(rendered);
            break;
        }
        case Variable::Type::Function: {
            std::string name = variable -> value.toString();
            ShaperFunction* function = session -> functionLookup(name);
            if (function == NULL) {
                return err.fail(ShaperError::Kind::UnknownFunction, name);
            }
            std::vector<Value> args;
            for (Param& p : variable -> params) {
                args.push_back(p.value);
            }
            if (!(*function)(session, args, result, err)) {
                return false;
            }
            break;
        }
        case Variable::Type::Unknown:
            return err.fail(ShaperError::Kind::InvariantViolation, slot.variableName, "variable should never be unknown type, only params can be");
        default:
            return err.fail(ShaperError::Kind::InvariantViolation, slot.variableName, "unrecognized variable type");
    }
    return true;
}


static bool applyOperation(Section& slot, Value& value, ShaperError& err) { // arithmetic only touches numbers
    if (!slot.hasOperation) {
        return true;
    }
    if (slot.operation.op == Operation::Operator::Divide && slot.operation.value == 0) {
        return err.fail(ShaperError::Kind::DivisionByZero, slot.variableName);
    }
    if (!value.isNumber()) {
        return true;
    }
    switch (slot.operation.op) {
        case Operation::Operator::Add:
            value.number += slot.operation.value;
            break;
        case Operation::Operator::Subtract:
            value.number -= slot.operation.value;
            break;
        case Operation::Operator::Multiply:
            value.number *= slot.operation.value;
            break;
        case Operation::Operator::Divide:
            value.number /= slot.operation.value;
            break;
    }
    return true;
}


bool renderParsed(ParseResult& parsed, Environment variables, Session* session, std::string& out, ShaperError& err, int depth) {
    if (!bindVariables(parsed.parsed, variables, session, err)) {
        return false;
    }
    if (session -> debug) {
        printf(DEBUG "Bound %zu variables at depth %d\n", variables.size(), depth);
    }

    std::vector<Section*> slots;
    for (Section& section : parsed.parsed) {
        if (section.kind == Section::Kind::Slot) {
            slots.push_back(&section);
        }
    }
    std::stable_sort(slots.begin(), slots.end(), [](Section* a, Section* b) { // bottom-up, so a rewrite never moves a span we haven't reached yet
        return a -> span.start > b -> span.start;
    });

    std::string current = parsed.text;
    for (Section* slot : slots) {
        Value value;
        bool found;
        if (!resolveSlot(*slot, variables, session, value, found, err, depth)) {
            return false;
        }
        if (!found) {
            continue;
        }
        if (!applyOperation(*slot, value, err)) {
            return false;
        }
        if (slot -> span.start > slot -> span.end || slot -> span.end > current.size()) {
            return err.fail(ShaperError::Kind::InvariantViolation, slot -> variableName, "slot span lies outside the text");
        }
        current = replaceAt(current, value.toString(), slot -> span.start, slot -> span.end);
    }

    StringWriteOutput result;
    ShaperWriter writer(result);
    writer.normalize = true;
    writer.write(current);
    writer.finish();
    out = result.content;
    return true;
}


bool renderTemplate(const std::string& templ, Environment variables, Session* session, std::string& out, ShaperError& err, int depth) {
    if (depth == 0) { // the caller's variables get the same name check definitions do
        for (auto& entry : variables) {
            if (session -> isFunction(entry.first)) {
                return err.fail(ShaperError::Kind::NameConflictWithFunction, entry.first);
            }
        }
    }
    if (isBlank(templ)) {
        out = templ;
        return true;
    }
    if (depth > session -> maxRecursionDepth) {
        if (session -> debug) {
            printf(DEBUG "Depth %d is past the limit of %d, passing the template through unevaluated\n", depth, session -> maxRecursionDepth);
        }
        out = templ;
        return true;
    }
    std::string withoutComments = stripComments(templ);
    if (session -> debug) {
        printf(DEBUG "Parsing template at depth %d:\n%s\n", depth, withoutComments.c_str());
    }
    ParseResult parsed;
    if (!parseTemplate(withoutComments, parsed, err)) {
        return false;
    }
    return renderParsed(parsed, variables, session, out, err, depth);
}


bool parseSections(const std::string& templ, std::vector<Section>& sections, ShaperError& err) {
    ParseResult parsed;
    if (!parseTemplate(stripComments(templ), parsed, err)) {
        return false;
    }
    sections = parsed.parsed;
    return true;
}
