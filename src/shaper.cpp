/* Shaper

    A template-directive language for prompts and other text: define variables, drop slots in, call built-in functions inline,
    and do a bit of arithmetic on the way out. Templates can hold templates, with parameters, to a bounded depth.

    shaper [-s] [-js json | -jf file] [-v name value]... [-b dir] [-o file] [-m depth] [-p] [-d] input
*/

#include <defs.h>
#include <stdio.h>
#include <unistd.h>
#include <string>
#include <vector>
#include <cli.hpp>
#include <mapview.hpp>
#include <writer.hpp>
#include <session.hpp>
#include <evaluator.hpp>
#include <types/Section.hpp>
#include <types/Variable.hpp>
#include <error.hpp>


int main(int argc, char** argv) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printf("\tusage: %s [-s] [-js json | -jf file] [-v name value]... [-b dir] [-o file] [-m depth] [-p] [-d] input\n", argv[0]);
        return 1;
    }

    Session session(options.baseDir, options.debug);
    session.maxRecursionDepth = options.maxDepth;

    std::string templ;
    if (options.isString) {
        templ = options.input;
    }
    else {
        MapView map(options.input);
        if (!map.isValid()) {
            return 1; // MapView already said what went wrong
        }
        templ = map.toString();
    }

    ShaperError err;
    if (options.printSections) {
        std::vector<Section> sections;
        if (!parseSections(templ, sections, err)) {
            printf(ERROR "%s: %s\n", err.kindName(), err.message().c_str());
            return 1;
        }
        for (Section& section : sections) {
            section.pTree();
        }
        return 0;
    }

    Environment variables;
    if (!buildVariables(options, variables, err)) {
        printf(ERROR "%s: %s\n", err.kindName(), err.message().c_str());
        return 1;
    }

    std::string rendered;
    if (!renderTemplate(templ, variables, &session, rendered, err)) {
        printf(ERROR "%s: %s\n", err.kindName(), err.message().c_str());
        return 1;
    }

    if (options.outputFile.size() > 0) {
        FileMan output("");
        FileWriteOutput fOut = output.create(options.outputFile);
        if (!fOut.isValid()) {
            return 1;
        }
        fOut.write(rendered.c_str(), rendered.size());
        printf(INFO "Rendered to %s.\n", options.outputFile.c_str());
    }
    else {
        fflush(stdout); // debug output went through stdio, keep it ahead of the render
        FileWriteOutput fOut(STDOUT_FILENO);
        fOut.write(rendered.c_str(), rendered.size());
        fOut.write("\n", 1);
    }
    return 0;
}
