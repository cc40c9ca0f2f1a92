// The evaluator: takes a template and a variable Environment and renders it down to plain text.
// Definitions are bound first, then slots are resolved bottom-up (last slot first) so every rewrite leaves the spans of
// the slots still waiting untouched. String variables are templates themselves and get rendered recursively, one level
// deeper each time; past Session::maxRecursionDepth the text comes back as-is instead.
#pragma once
#include <defs.h>
#include <string>
#include <vector>
#include <types/Section.hpp>
#include <types/Variable.hpp>
#include <error.hpp>


// Render a template. `variables` is copied, the caller's Environment is never touched. Blank templates, and any template
// past the depth limit, are handed back unchanged. On failure `out` is left alone and `err` says why.
bool renderTemplate(const std::string& templ, Environment variables, Session* session, std::string& out, ShaperError& err, int depth = 0);

// Same, for a template that's already been parsed.
bool renderParsed(ParseResult& parsed, Environment variables, Session* session, std::string& out, ShaperError& err, int depth = 0);

// Parse without rendering, for tooling that wants to look at the sections.
bool parseSections(const std::string& templ, std::vector<Section>& sections, ShaperError& err);

// Add every definition in `sections` to `variables`. Fails on names that are taken, by a variable or by a built-in.
bool bindVariables(std::vector<Section>& sections, Environment& variables, Session* session, ShaperError& err);
