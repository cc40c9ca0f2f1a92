#include <gtest/gtest.h>
#include <functions.hpp>
#include <session.hpp>
#include <evaluator.hpp>
#include <fileman.hpp>
#include <error.hpp>
#include <cstdlib>
#include <cstdio>
#include <string>
#include <vector>
#include <set>
#include <thread>

// Test suite for the built-in functions and the registry that holds them

class FunctionsTest : public ::testing::Test {
protected:
    std::string root;
    std::vector<std::string> created;

    void SetUp() override {
        char tmpl[] = "/tmp/shaper_functions_XXXXXX";
        char* made = mkdtemp(tmpl);
        ASSERT_NE(made, nullptr);
        root = made;
        writeFile("a.txt", "alpha");
        writeFile("b.txt", "beta {{x}}");
        writeFile("notes/one.md", "first note");
        writeFile("notes/two.txt", "second note");
        writeFile("notes/three.md", "third note");
    }

    void TearDown() override {
        for (auto it = created.rbegin(); it != created.rend(); it ++) {
            remove(it -> c_str());
        }
        remove((root + "/notes").c_str());
        remove(root.c_str());
    }

    void writeFile(const std::string& name, const std::string& content) {
        FileMan files(root);
        {
            FileWriteOutput out = files.create(name);
            ASSERT_TRUE(out.isValid());
            out.write(content.c_str(), content.size());
        } // flushed and closed here
        created.push_back(root + "/" + name);
    }

    bool call(Session& session, const std::string& name, std::vector<Value> args, Value& result, ShaperError& err) {
        ShaperFunction* function = session.functionLookup(name);
        EXPECT_NE(function, nullptr);
        if (function == NULL) {
            return false;
        }
        return (*function)(&session, args, result, err);
    }
};


TEST_F(FunctionsTest, BuiltinsAreRegistered) {
    Session session(root);
    EXPECT_TRUE(session.isFunction("load"));
    EXPECT_TRUE(session.isFunction("loadDir"));
    EXPECT_TRUE(session.isFunction("random"));
    EXPECT_FALSE(session.isFunction("print"));
    EXPECT_EQ(session.functionLookup("print"), nullptr);
}

TEST_F(FunctionsTest, RegistryAcceptsCustomFunctions) {
    FunctionRegistry registry;
    EXPECT_FALSE(registry.contains("twice"));
    registry.add("twice", [](Session*, std::vector<Value>& args, Value& result, ShaperError&) {
        result = Value(args[0].number * 2);
        return true;
    });
    ASSERT_TRUE(registry.contains("twice"));
    std::vector<Value> args = { Value(21.0) };
    Value result;
    ShaperError err;
    EXPECT_TRUE((*registry.lookup("twice"))(NULL, args, result, err));
    EXPECT_EQ(result.toString(), "42");
}

TEST_F(FunctionsTest, LoadReadsOneFile) {
    Session session(root);
    Value result;
    ShaperError err;
    ASSERT_TRUE(call(session, "load", { Value(std::string("a.txt")) }, result, err)) << err.message();
    EXPECT_EQ(result.toString(), "alpha");
}

TEST_F(FunctionsTest, LoadJoinsSeveralFiles) {
    Session session(root);
    Value result;
    ShaperError err;
    ASSERT_TRUE(call(session, "load", { Value(std::string("a.txt")), Value(std::string("notes/one.md")) }, result, err));
    EXPECT_EQ(result.toString(), "alpha\n\nfirst note");
}

TEST_F(FunctionsTest, LoadFailures) {
    Session session(root);
    Value result;
    ShaperError err;
    EXPECT_FALSE(call(session, "load", { Value(std::string("missing.txt")) }, result, err));
    EXPECT_EQ(err.kind, ShaperError::Kind::FunctionFailed);

    ShaperError dirErr;
    EXPECT_FALSE(call(session, "load", { Value(std::string("notes")) }, result, dirErr));
    EXPECT_EQ(dirErr.kind, ShaperError::Kind::FunctionFailed);

    ShaperError emptyErr;
    EXPECT_FALSE(call(session, "load", {}, result, emptyErr));
    EXPECT_EQ(emptyErr.kind, ShaperError::Kind::FunctionFailed);
}

TEST_F(FunctionsTest, LoadDirListsFilesByName) {
    Session session(root);
    Value result;
    ShaperError err;
    ASSERT_TRUE(call(session, "loadDir", { Value(std::string("notes")) }, result, err)) << err.message();
    EXPECT_EQ(result.toString(), "one.md\nfirst note\n\nthree.md\nthird note\n\ntwo.txt\nsecond note");
}

TEST_F(FunctionsTest, LoadDirFiltersByExtension) {
    Session session(root);
    Value result;
    ShaperError err;
    ASSERT_TRUE(call(session, "loadDir", { Value(std::string("notes")), Value(std::string(".md")) }, result, err));
    EXPECT_EQ(result.toString(), "one.md\nfirst note\n\nthree.md\nthird note");

    ShaperError missing;
    EXPECT_FALSE(call(session, "loadDir", { Value(std::string("nowhere")) }, result, missing));
    EXPECT_EQ(missing.kind, ShaperError::Kind::FunctionFailed);
}

TEST_F(FunctionsTest, RandomPicksOneArgument) {
    Session session(root);
    std::set<std::string> seen;
    for (int i = 0; i < 200; i ++) {
        Value result;
        ShaperError err;
        ASSERT_TRUE(call(session, "random", { Value(std::string("red")), Value(std::string("green")), Value(std::string("blue")) }, result, err));
        seen.insert(result.toString());
    }
    for (const std::string& colour : seen) {
        EXPECT_TRUE(colour == "red" || colour == "green" || colour == "blue") << colour;
    }
}

TEST_F(FunctionsTest, RandomKeepsTheArgumentType) {
    Session session(root);
    Value result;
    ShaperError err;
    ASSERT_TRUE(call(session, "random", { Value(3.0) }, result, err));
    EXPECT_TRUE(result.isNumber());
    EXPECT_EQ(result.number, 3.0);

    ShaperError empty;
    EXPECT_FALSE(call(session, "random", {}, result, empty));
    EXPECT_EQ(empty.kind, ShaperError::Kind::FunctionFailed);
}

TEST_F(FunctionsTest, LoadedTextIsNotExpanded) {
    Session session(root);
    Environment vars;
    vars["x"] = Variable::fromValue("x", Value(std::string("expanded")));
    std::string out;
    ShaperError err;
    ASSERT_TRUE(renderTemplate("{{load(\"b.txt\")}}", vars, &session, out, err)) << err.message();
    EXPECT_EQ(out, "beta {{x}}");
}

TEST_F(FunctionsTest, FunctionBoundToVariable) {
    Session session(root);
    std::string out;
    ShaperError err;
    ASSERT_TRUE(renderTemplate("{{text = load(\"a.txt\")}}[{{text}}]", Environment(), &session, out, err)) << err.message();
    EXPECT_EQ(out, "[alpha]");
}

TEST_F(FunctionsTest, SessionIsSharedAcrossThreads) {
    Session session(root);
    int failures[2] = { 0, 0 };
    auto worker = [&session, &failures](int id, std::string templ, std::string expected) {
        for (int i = 0; i < 200; i ++) {
            std::string out;
            ShaperError err;
            if (!renderTemplate(templ, Environment(), &session, out, err) || out != expected) {
                failures[id] ++;
            }
        }
    };
    std::thread first(worker, 0, "{{load(\"a.txt\")}} {{random(\"x\")}}", "alpha x");
    std::thread second(worker, 1, "{{load(\"notes/one.md\", \"a.txt\")}}", "first note\n\nalpha");
    first.join();
    second.join();
    EXPECT_EQ(failures[0], 0);
    EXPECT_EQ(failures[1], 0);
}
