#include <util.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>
// definitions for util functions


void mkdirR(std::string filename) { // recursively create the directories before a file
    // expects syntax like directory/directory/directory/file or directory/directory/directory/. directory/directory/directory is not supported.
    struct stat sb;
    size_t blobend = 0;
    while (blobend < filename.size()) {
        if (filename[blobend] == '/' && blobend > 0) {
            std::string dirname = filename.substr(0, blobend);
            if (stat(dirname.c_str(), &sb) == -1) {
                if (mkdir(dirname.c_str(), 0) != 0) {
                    printf(ERROR "Couldn't create %s!\n", dirname.c_str());
                    perror("\tmkdir");
                }
                chmod(dirname.c_str(), 0755);
            }
            else if (!S_ISDIR(sb.st_mode)) {
                printf(ERROR "%s exists and is not a directory. Aborting recursive mkdir operation.\n", dirname.c_str());
                return;
            }
        }
        blobend++;
    }
}


std::string unescapeString(std::string thing) {
    std::string ret;
    ret.reserve(thing.size());
    for (size_t i = 0; i < thing.size(); i ++) {
        if (thing[i] == '\\' && i + 1 < thing.size()) {
            i ++;
        }
        ret += thing[i];
    }
    return ret;
}


bool isNumber(const char* data) {
    size_t s = strlen(data);
    size_t i = 0;
    bool digits = false;
    bool point = false;
    if (s > 0 && data[0] == '-') {
        i ++;
    }
    for (; i < s; i ++) {
        if (data[i] >= '0' && data[i] <= '9') {
            digits = true;
        }
        else if (data[i] == '.' && !point) {
            point = true;
        }
        else {
            return false;
        }
    }
    return digits;
}


std::string formatNumber(double number) { // same text a javascript Number would turn into
    if (std::isnan(number)) {
        return "NaN";
    }
    if (std::isinf(number)) {
        return number > 0 ? "Infinity" : "-Infinity";
    }
    if (number == 0) {
        return "0"; // also catches -0
    }
    if (number < 0) {
        return "-" + formatNumber(-number);
    }
    char buffer[64];
    for (int precision = 1; precision <= 17; precision ++) { // the first precision that survives a round trip gives the shortest digits
        snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, number);
        if (strtod(buffer, NULL) == number) {
            break;
        }
    }
    // buffer is d.ddde[+-]xx: pull out the significant digits and the decimal exponent
    std::string digits;
    char* at = buffer;
    while (*at != 'e') {
        if (*at != '.') {
            digits += *at;
        }
        at ++;
    }
    int exponent = atoi(at + 1);
    while (digits.size() > 1 && digits[digits.size() - 1] == '0') {
        digits.pop_back();
    }
    int k = digits.size();
    int n = exponent + 1; // the decimal point sits after n digits
    if (k <= n && n <= 21) {
        return digits + std::string(n - k, '0');
    }
    if (0 < n && n <= 21) {
        return digits.substr(0, n) + "." + digits.substr(n);
    }
    if (-6 < n && n <= 0) {
        return "0." + std::string(-n, '0') + digits;
    }
    std::string ret = digits.substr(0, 1);
    if (k > 1) {
        ret += "." + digits.substr(1);
    }
    ret += (n - 1 < 0) ? "e-" : "e+";
    ret += std::to_string(std::abs(n - 1));
    return ret;
}


bool isWhitespace(char thing) {
    return thing == ' ' || thing == '\t' || thing == '\n' || thing == '\r' || thing == '\v' || thing == '\f';
}


bool isBlank(const std::string& thing) {
    for (char c : thing) {
        if (!isWhitespace(c)) {
            return false;
        }
    }
    return true;
}


std::string stripComments(std::string text) {
    std::string ret;
    ret.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            while (i < text.size() && text[i] != '\n') { i ++; } // the newline itself survives
            continue;
        }
        ret += text[i];
        i ++;
    }
    return ret;
}


std::string replaceAt(const std::string& text, const std::string& with, size_t start, size_t end) {
    return text.substr(0, start) + with + text.substr(end);
}

