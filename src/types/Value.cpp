#include <types/Value.hpp>
#include <util.hpp>


Value::Value() {}

Value::Value(double data) {
    type = Type::Number;
    number = data;
}

Value::Value(std::string data) {
    type = Type::String;
    string = data;
}

bool Value::isNumber() {
    return type == Type::Number;
}

std::string Value::toString() {
    if (type == Type::Number) {
        return formatNumber(number);
    }
    return string;
}
