#include <gtest/gtest.h>
#include <cli.hpp>
#include <fileman.hpp>
#include <types/Variable.hpp>
#include <error.hpp>
#include <cstdio>
#include <string>
#include <vector>

// Test suite for command line parsing and caller variable input

static bool parse(std::vector<std::string> args, Options& options) {
    std::vector<char*> argv;
    args.insert(args.begin(), "shaper");
    for (std::string& arg : args) {
        argv.push_back(&arg[0]);
    }
    return parseArguments(argv.size(), argv.data(), options);
}


TEST(CliTest, ParsesFlagsAndInput) {
    Options options;
    ASSERT_TRUE(parse({ "-s", "-d", "-b", "templates", "-o", "out.txt", "-m", "3", "Hello {{name}}" }, options));
    EXPECT_TRUE(options.isString);
    EXPECT_TRUE(options.debug);
    EXPECT_FALSE(options.printSections);
    EXPECT_EQ(options.baseDir, "templates");
    EXPECT_EQ(options.outputFile, "out.txt");
    EXPECT_EQ(options.maxDepth, 3);
    EXPECT_EQ(options.input, "Hello {{name}}");
}

TEST(CliTest, CollectsVariables) {
    Options options;
    ASSERT_TRUE(parse({ "-v", "name", "Bob", "-v", "count", "4", "-p", "template.txt" }, options));
    ASSERT_EQ(options.definitions.size(), 2u);
    EXPECT_EQ(options.definitions[0].name, "name");
    EXPECT_EQ(options.definitions[0].content, "Bob");
    EXPECT_EQ(options.definitions[1].name, "count");
    EXPECT_EQ(options.definitions[1].content, "4");
    EXPECT_TRUE(options.printSections);
    EXPECT_EQ(options.input, "template.txt");
    EXPECT_EQ(options.maxDepth, SHAPER_MAX_RECURSION_DEPTH);
}

TEST(CliTest, RejectsBadCommandLines) {
    Options missingInput;
    EXPECT_FALSE(parse({ "-s" }, missingInput));
    Options twoInputs;
    EXPECT_FALSE(parse({ "one.txt", "two.txt" }, twoInputs));
    Options bothJson;
    EXPECT_FALSE(parse({ "-js", "{}", "-jf", "vars.json", "in.txt" }, bothJson));
}

TEST(CliTest, JsonKeepsTypes) {
    Environment variables;
    ShaperError err;
    ASSERT_TRUE(jsonToVariables("{\"name\": \"Ada\", \"age\": 36, \"ratio\": 0.5, \"number\": \"12\", \"ok\": true, \"tags\": [1, 2]}", variables, err)) << err.message();
    EXPECT_EQ(variables["name"].type, Variable::Type::String);
    EXPECT_EQ(variables["name"].value.toString(), "Ada");
    EXPECT_EQ(variables["age"].type, Variable::Type::Number);
    EXPECT_EQ(variables["age"].value.number, 36);
    EXPECT_EQ(variables["ratio"].value.toString(), "0.5");
    EXPECT_EQ(variables["number"].type, Variable::Type::String); // quoted numbers are strings
    EXPECT_EQ(variables["ok"].value.toString(), "true");
    EXPECT_EQ(variables["tags"].value.toString(), "[1,2]");
}

TEST(CliTest, JsonMustBeAnObject) {
    Environment variables;
    ShaperError bad;
    EXPECT_FALSE(jsonToVariables("{\"name\": ", variables, bad));
    EXPECT_EQ(bad.kind, ShaperError::Kind::ParseError);
    ShaperError array;
    EXPECT_FALSE(jsonToVariables("[1, 2, 3]", variables, array));
    EXPECT_EQ(array.kind, ShaperError::Kind::ParseError);
}

TEST(CliTest, CommandLineVariablesOverrideJson) {
    Options options;
    ASSERT_TRUE(parse({ "-js", "{\"name\": \"Ada\", \"count\": 1}", "-v", "count", "7", "-v", "mood", "calm", "in.txt" }, options));
    Environment variables;
    ShaperError err;
    ASSERT_TRUE(buildVariables(options, variables, err)) << err.message();
    EXPECT_EQ(variables.size(), 3u);
    EXPECT_EQ(variables["name"].value.toString(), "Ada");
    EXPECT_EQ(variables["count"].type, Variable::Type::Number);
    EXPECT_EQ(variables["count"].value.number, 7);
    EXPECT_EQ(variables["mood"].value.toString(), "calm");
}

TEST(CliTest, JsonFromFile) {
    char tmpl[] = "/tmp/shaper_cli_XXXXXX";
    char* made = mkdtemp(tmpl);
    ASSERT_NE(made, nullptr);
    std::string path = std::string(made) + "/vars.json";
    {
        FileMan files("");
        FileWriteOutput out = files.create(path);
        ASSERT_TRUE(out.isValid());
        std::string content = "{\"topic\": \"tides\", \"level\": 2}";
        out.write(content.c_str(), content.size());
    }
    Options options;
    ASSERT_TRUE(parse({ "-jf", path, "in.txt" }, options));
    Environment variables;
    ShaperError err;
    EXPECT_TRUE(buildVariables(options, variables, err)) << err.message();
    EXPECT_EQ(variables["topic"].value.toString(), "tides");
    EXPECT_EQ(variables["level"].value.toString(), "2");

    Options missing;
    ASSERT_TRUE(parse({ "-jf", std::string(made) + "/nope.json", "in.txt" }, missing));
    Environment none;
    ShaperError missingErr;
    EXPECT_FALSE(buildVariables(missing, none, missingErr));

    remove(path.c_str());
    remove(made);
}
