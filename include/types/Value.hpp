// the scalar that flows through Shaper: slots resolve to one, variables hold one, functions take and return them
#pragma once
#include <string>


struct Value {
    enum Type {
        Number,
        String
    } type = String;

    double number = 0;
    std::string string;

    Value();

    Value(double data);

    Value(std::string data);

    bool isNumber();

    std::string toString(); // numbers print like 12, -2 or 0.7142857142857143
};
