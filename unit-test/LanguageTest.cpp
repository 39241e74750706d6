#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/language.hpp"

using namespace std;
using namespace runbox;

TEST(LanguageTest, FindIsCaseInsensitive) {
    language_table table;
    EXPECT_EQ(table.find("python").name, "python");
    EXPECT_EQ(table.find("Python").name, "python");
    EXPECT_EQ(table.find("JAVASCRIPT").name, "javascript");
    EXPECT_EQ(table.find("c++").name, "cpp");
    EXPECT_EQ(table.find("C++").name, "cpp");
}

TEST(LanguageTest, UnsupportedLanguage) {
    language_table table;
    EXPECT_FALSE(table.supports("ruby"));
    EXPECT_FALSE(table.supports(""));
    try {
        table.find("ruby");
        FAIL() << "ruby should not be supported";
    } catch (unsupported_language &ex) {
        EXPECT_EQ(ex.language, "ruby");
        EXPECT_STREQ(ex.what(), "Unsupported language: ruby");
    }
}

TEST(LanguageTest, Names) {
    language_table table;
    EXPECT_EQ(table.names(), vector<string>({"cpp", "java", "javascript", "python"}));
}

TEST(LanguageTest, DefaultImages) {
    language_table table;
    EXPECT_EQ(table.find("python").image, "python:3.10-slim");
    EXPECT_EQ(table.find("javascript").image, "node:18-alpine");
    EXPECT_EQ(table.find("java").image, "eclipse-temurin:17-jdk");
    EXPECT_EQ(table.find("cpp").image, "gcc:13");
}

TEST(LanguageTest, ImageOverride) {
    language_table table({{"python", "python:3.12-alpine"}, {"haskell", "haskell:9"}});
    EXPECT_EQ(table.find("python").image, "python:3.12-alpine");
    EXPECT_EQ(table.find("cpp").image, "gcc:13");
    EXPECT_FALSE(table.supports("haskell"));
}

TEST(LanguageTest, DetectJavaClass) {
    EXPECT_EQ(detect_java_class("public class HelloWorld {\n}"), "HelloWorld");
    EXPECT_EQ(detect_java_class("import java.util.*;\n\npublic   class  Solution{ }"), "Solution");
    EXPECT_EQ(detect_java_class("class Hidden {}"), "Main");
    EXPECT_EQ(detect_java_class(""), "Main");
}

TEST(LanguageTest, FileNames) {
    language_table table;
    EXPECT_EQ(table.find("python").file_name("print(1)"), "main.py");
    EXPECT_EQ(table.find("javascript").file_name("console.log(1)"), "main.js");
    EXPECT_EQ(table.find("cpp").file_name("int main() {}"), "main.cpp");
    EXPECT_EQ(table.find("java").file_name("public class Greeter { }"), "Greeter.java");
    EXPECT_EQ(table.find("java").file_name("class A { }"), "Main.java");
}

TEST(LanguageTest, InterpretedCommands) {
    language_table table;
    EXPECT_EQ(table.find("python").build_command("/tmp", "main.py"), "python3 -u '/tmp/main.py'");
    EXPECT_EQ(table.find("javascript").build_command("/app", "main.js"), "node '/app/main.js'");
    EXPECT_TRUE(table.find("python").artifacts("main.py").empty());
}

TEST(LanguageTest, CompiledCommands) {
    language_table table;
    EXPECT_EQ(table.find("cpp").build_command("/tmp", "main.cpp"),
              "cd '/tmp' && g++ -std=c++20 -O2 -o 'main' 'main.cpp' && ./'main'");
    EXPECT_EQ(table.find("cpp").artifacts("main.cpp"), vector<string>({"'main'"}));

    EXPECT_EQ(table.find("java").build_command("/app", "Solution.java"),
              "cd '/app' && javac 'Solution.java' && java -cp '/app' 'Solution'");
    EXPECT_EQ(table.find("java").artifacts("Solution.java"), vector<string>({"*.class"}));
}
