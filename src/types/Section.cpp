#include <types/Section.hpp>
#include <util.hpp>
#include <cstdio>


char Operation::symbol() {
    switch (op) {
        case Operator::Add:
            return '+';
        case Operator::Subtract:
            return '-';
        case Operator::Multiply:
            return '*';
        case Operator::Divide:
            return '/';
    }
    return '?';
}

static void printParams(std::vector<Param>& params, int tabLevel) {
    for (Param& p : params) {
        for (int x = 0; x < tabLevel; x ++) {printf("\t");}
        if (p.name.size() > 0) {
            printf("Param %s", p.name.c_str());
            if (p.required) {
                printf(" (required)\n");
                continue;
            }
            printf(" = ");
        }
        else {
            printf("Argument ");
        }
        if (p.value.isNumber()) {
            printf("%s\n", p.value.toString().c_str());
        }
        else {
            printf("\"%s\"\n", p.value.string.c_str());
        }
    }
}

void Section::pTree(int tabLevel) {
    for (int x = 0; x < tabLevel; x ++) {printf("\t");}
    switch (kind) {
        case Kind::Text:
            printf("Text [%zu, %zu)\n", span.start, span.end);
            break;
        case Kind::VariableDefinition:
            if (content.type == Content::Type::Function) {
                printf("Definition %s = %s(...) [%zu, %zu)\n", variableName.c_str(), content.value.string.c_str(), span.start, span.end);
                printParams(content.params, tabLevel + 1);
            }
            else {
                printf("Definition %s (%s) [%zu, %zu)\n", variableName.c_str(), content.type == Content::Type::Number ? "number" : "string", span.start, span.end);
            }
            printParams(params, tabLevel + 1);
            break;
        case Kind::Slot:
            printf("Slot %s%s [%zu, %zu)", raw ? "@" : "", variableName.c_str(), span.start, span.end);
            if (hasOperation) {
                printf(" %c %s", operation.symbol(), formatNumber(operation.value).c_str());
            }
            printf("\n");
            printParams(params, tabLevel + 1);
            break;
        default:
            printf("Unknown section kind %d\n", (int)kind);
            break;
    }
}
