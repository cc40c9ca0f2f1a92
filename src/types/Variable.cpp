#include <types/Variable.hpp>


Variable::Variable() {}

Variable::Variable(std::string n, Type t, Value v, std::vector<Param> p) : type(t), name(n), value(v), params(p) {}

Variable Variable::fromDefinition(Section& definition) {
    Variable ret;
    ret.name = definition.variableName;
    ret.value = definition.content.value;
    switch (definition.content.type) {
        case Content::Type::Number:
            ret.type = Type::Number;
            ret.params = definition.params;
            break;
        case Content::Type::String:
            ret.type = Type::String;
            ret.params = definition.params;
            break;
        case Content::Type::Function: // function definitions carry the call's arguments, not the section's params
            ret.type = Type::Function;
            ret.params = definition.content.params;
            break;
    }
    return ret;
}

Variable Variable::fromValue(std::string n, Value v) {
    return Variable(n, v.isNumber() ? Type::Number : Type::String, v);
}

const char* Variable::typeName() {
    switch (type) {
        case Type::Number:
            return "number";
        case Type::String:
            return "string";
        case Type::Function:
            return "function";
        default:
            return "unknown";
    }
}
