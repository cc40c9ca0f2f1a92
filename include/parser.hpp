// The tag parser: turns template text into the typed Section sequence the evaluator works on.
//
//  {{name = "text"}}  {{name = 4.5}}  {{name = load("file")}}    single-line definitions
//  {{name(a, b = "x")}} ... {{/name}}                           block definition, with declared params
//  {{name}}  {{name("arg", 2)}}  {{@name}}  {{name * 3}}        slots: plain, with arguments, raw, with arithmetic
//  \{{                                                          a literal {{
#pragma once
#include <defs.h>
#include <string>
#include <types/Section.hpp>
#include <error.hpp>


bool parseTemplate(const std::string& source, ParseResult& result, ShaperError& err); // source is expected to have been through stripComments already
