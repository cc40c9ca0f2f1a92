#include <parser.hpp>
#include <mapview.hpp>
#include <util.hpp>
#include <cstdlib>


static bool isIdentStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

static bool isIdentChar(char c) {
    return isIdentStart(c) || (c >= '0' && c <= '9');
}

static std::string parseIdentifier(MapView& m) {
    std::string ret;
    while (m.len() > 0 && isIdentChar(m[0])) {
        ret += m[0];
        m ++;
    }
    return ret;
}

static std::string where(MapView& m) {
    return "offset " + std::to_string(m.offset());
}


static bool parseLiteral(MapView& m, Value& out, ShaperError& err) {
    if (m[0] == '"' || m[0] == '\'') {
        char quote = m[0];
        m ++;
        MapView string = m.consume(quote); // .consume stops *before* the quote, and skips over escaped ones
        if (m.len() == 0) {
            return err.fail(ShaperError::Kind::ParseError, where(m), "unterminated string");
        }
        m ++;
        out = Value(unescapeString(string.toString()));
        return true;
    }
    if (m[0] == '-' || m[0] == '.' || (m[0] >= '0' && m[0] <= '9')) {
        std::string number;
        if (m[0] == '-') {
            number += '-';
            m ++;
        }
        while (m.len() > 0 && ((m[0] >= '0' && m[0] <= '9') || m[0] == '.')) {
            number += m[0];
            m ++;
        }
        if (!isNumber(number.c_str())) {
            return err.fail(ShaperError::Kind::ParseError, where(m), "bad number '" + number + "'");
        }
        out = Value(strtod(number.c_str(), NULL));
        return true;
    }
    return err.fail(ShaperError::Kind::ParseError, where(m), "expected a string or number");
}


static bool parseParams(MapView& m, std::vector<Param>& params, ShaperError& err) { // expects the ( to be consumed already, consumes the closing )
    // each entry is a literal (a call-site argument), a name (a required declared param) or name = literal (an optional one)
    while (true) {
        m.trim();
        if (m.len() == 0) {
            return err.fail(ShaperError::Kind::ParseError, where(m), "unterminated parameter list");
        }
        if (m[0] == ')') {
            m ++;
            return true;
        }
        Param p;
        if (isIdentStart(m[0])) {
            p.name = parseIdentifier(m);
            m.trim();
            if (m[0] == '=') {
                m ++;
                m.trim();
                if (!parseLiteral(m, p.value, err)) {
                    return false;
                }
            }
            else {
                p.required = true;
            }
        }
        else if (!parseLiteral(m, p.value, err)) {
            return false;
        }
        params.push_back(p);
        m.trim();
        if (m[0] == ',') {
            m ++;
        }
        else if (m[0] != ')') {
            return err.fail(ShaperError::Kind::ParseError, where(m), "expected , or ) in parameter list");
        }
    }
}


static bool literalsOnly(std::vector<Param>& params, std::string& name, ShaperError& err) {
    for (Param& p : params) {
        if (p.required) {
            return err.fail(ShaperError::Kind::ParseError, name, "argument '" + p.name + "' is not a literal");
        }
    }
    return true;
}


static bool namedOnly(std::vector<Param>& params) { // a call passes literals, a block header declares names
    for (Param& p : params) {
        if (p.name.size() == 0) {
            return false;
        }
    }
    return true;
}


static bool findTagEnd(MapView& m, size_t& tagEnd) { // looks for the }} closing a tag, skipping over quoted strings. leaves m alone.
    MapView scan = m;
    char quote = 0;
    while (scan.len() > 0) {
        if (quote != 0) {
            if (scan[0] == '\\') {
                scan ++;
            }
            else if (scan[0] == quote) {
                quote = 0;
            }
        }
        else if (scan[0] == '"' || scan[0] == '\'') {
            quote = scan[0];
        }
        else if (scan.cmp("}}")) {
            tagEnd = scan.offset();
            return true;
        }
        scan ++;
    }
    return false;
}


bool parseTemplate(const std::string& source, ParseResult& result, ShaperError& err) {
    MapView map = MapView::fromString(source);
    std::vector<Section>& sections = result.parsed;
    std::string& text = result.text;
    bool inText = false; // is there an open Text section at the back of `sections`?
    auto addText = [&](std::string chunk) {
        if (!inText) {
            Section t;
            t.kind = Section::Kind::Text;
            t.span.start = text.size();
            sections.push_back(t);
            inText = true;
        }
        text += chunk;
        sections.back().span.end = text.size();
    };
    while (map.len() > 0) {
        if (map[0] == '\\' && map.cmp("{{", 1)) {
            addText("{{");
            map += 3;
            continue;
        }
        if (!map.cmp("{{")) {
            size_t from = map.offset();
            while (map.len() > 0 && !map.cmp("{{") && !(map[0] == '\\' && map.cmp("{{", 1))) {
                map ++;
            }
            addText(source.substr(from, map.offset() - from));
            continue;
        }
        size_t tagStart = map.offset();
        map += 2;
        size_t tagEnd;
        if (!findTagEnd(map, tagEnd)) {
            return err.fail(ShaperError::Kind::ParseError, "offset " + std::to_string(tagStart), "unterminated tag");
        }
        MapView tag = map.slice(0, tagEnd - map.offset());
        map += (tagEnd + 2) - map.offset(); // past the }}
        tagEnd += 2;
        tag.trim();
        if (tag[0] == '/') {
            tag ++;
            return err.fail(ShaperError::Kind::ParseError, tag.toString(), "closing tag without a matching block");
        }
        bool raw = false;
        if (tag[0] == '@') {
            raw = true;
            tag ++;
        }
        if (!isIdentStart(tag[0])) {
            return err.fail(ShaperError::Kind::ParseError, "offset " + std::to_string(tagStart), "expected a variable name");
        }
        std::string name = parseIdentifier(tag);
        tag.trim();

        if (!raw && tag[0] == '=') { // single-line definition
            tag ++;
            tag.trim();
            Section def;
            def.kind = Section::Kind::VariableDefinition;
            def.variableName = name;
            if (isIdentStart(tag[0])) {
                def.content.type = Content::Type::Function;
                def.content.value = Value(parseIdentifier(tag));
                tag.trim();
                if (tag[0] != '(') {
                    return err.fail(ShaperError::Kind::ParseError, name, "expected ( after function name");
                }
                tag ++;
                if (!parseParams(tag, def.content.params, err) || !literalsOnly(def.content.params, name, err)) {
                    return false;
                }
            }
            else {
                if (!parseLiteral(tag, def.content.value, err)) {
                    return false;
                }
                def.content.type = def.content.value.isNumber() ? Content::Type::Number : Content::Type::String;
            }
            tag.trim();
            if (tag.len() > 0) {
                return err.fail(ShaperError::Kind::ParseError, name, "unexpected characters after definition");
            }
            def.span = Span{tagStart, tagEnd};
            sections.push_back(def);
            inText = false;
            continue;
        }

        std::vector<Param> params;
        if (tag[0] == '(') {
            tag ++;
            if (!parseParams(tag, params, err)) {
                return false;
            }
            tag.trim();
        }
        bool hasOperation = false;
        Operation operation;
        if (tag.len() > 0 && (tag[0] == '+' || tag[0] == '-' || tag[0] == '*' || tag[0] == '/')) {
            switch (tag[0]) {
                case '+': operation.op = Operation::Operator::Add; break;
                case '-': operation.op = Operation::Operator::Subtract; break;
                case '*': operation.op = Operation::Operator::Multiply; break;
                default: operation.op = Operation::Operator::Divide; break;
            }
            tag ++;
            tag.trim();
            Value operand;
            if (!parseLiteral(tag, operand, err)) {
                return false;
            }
            if (!operand.isNumber()) {
                return err.fail(ShaperError::Kind::ParseError, name, "arithmetic needs a number");
            }
            if (operation.op == Operation::Operator::Divide && operand.number == 0) { // whatever the slot turns out to hold
                return err.fail(ShaperError::Kind::DivisionByZero, name);
            }
            operation.value = operand.number;
            hasOperation = true;
            tag.trim();
        }
        if (tag.len() > 0) {
            return err.fail(ShaperError::Kind::ParseError, name, "unexpected characters in tag");
        }

        if (!raw && !hasOperation && namedOnly(params)) { // a closing {{/name}} further on makes this a block definition rather than a slot
            std::string closer = "{{/" + name + "}}";
            size_t close = source.find(closer, tagEnd);
            if (close != std::string::npos) {
                size_t bodyStart = tagEnd;
                size_t bodyEnd = close;
                if (bodyStart < bodyEnd && source[bodyStart] == '\n') { // the newline straight after the opener and the one before the closer belong to the tags
                    bodyStart ++;
                }
                if (bodyEnd > bodyStart && source[bodyEnd - 1] == '\n') {
                    bodyEnd --;
                }
                Section def;
                def.kind = Section::Kind::VariableDefinition;
                def.variableName = name;
                def.content.type = Content::Type::String;
                def.content.value = Value(source.substr(bodyStart, bodyEnd - bodyStart));
                def.params = params;
                def.span = Span{tagStart, close + closer.size()};
                sections.push_back(def);
                map += def.span.end - map.offset();
                inText = false;
                continue;
            }
        }

        if (!literalsOnly(params, name, err)) {
            return false;
        }
        Section slot;
        slot.kind = Section::Kind::Slot;
        slot.variableName = name;
        slot.params = params;
        slot.raw = raw;
        slot.hasOperation = hasOperation;
        slot.operation = operation;
        slot.span = Span{text.size(), text.size() + (tagEnd - tagStart)};
        text += source.substr(tagStart, tagEnd - tagStart);
        sections.push_back(slot);
        inText = false;
    }
    return true;
}
