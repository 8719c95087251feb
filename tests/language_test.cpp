/**
 * @file language_test.cpp
 * @brief 语言插件与注册表测试
 */

#include <gtest/gtest.h>
#include <filesystem>
#include "sjudge.h"

using namespace sjudge;

class LanguageTest : public ::testing::Test {
protected:
    std::string work_dir = "/tmp/sjudge_language_test";

    void SetUp() override {
        std::filesystem::remove_all(work_dir);
        std::filesystem::create_directories(work_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(work_dir);
    }

    PrepareContext context(const std::string &code) {
        PrepareContext ctx;
        ctx.code = code;
        ctx.work_dir = work_dir;
        ctx.timeout_ms = 2500;
        ctx.memory_limit_mb = 128;
        return ctx;
    }
};

TEST(JavaClassNameTest, FirstPublicClassOrMain) {
    EXPECT_EQ(languages::detect_java_class_name("public class Foo { }"), "Foo");
    EXPECT_EQ(languages::detect_java_class_name("class Helper {}\npublic   class\tSolution {}"), "Solution");
    EXPECT_EQ(languages::detect_java_class_name("class Main {}"), "Main");
    EXPECT_EQ(languages::detect_java_class_name("public class A {}\npublic class B {}"), "A");
    EXPECT_EQ(languages::detect_java_class_name("public classic Foo {}\npublic class Bar_1{}"), "Bar_1");
    EXPECT_EQ(languages::detect_java_class_name("public class {\npublic class Real {}"), "Real");
    EXPECT_EQ(languages::detect_java_class_name("publicclass Foo {}"), "Main");
    EXPECT_EQ(languages::detect_java_class_name("public class"), "Main");
    EXPECT_EQ(languages::detect_java_class_name(""), "Main");
}

TEST(JavaClassNameTest, LongIdentifier) {
    std::string name(100000, 'A');
    EXPECT_EQ(languages::detect_java_class_name("public class " + name + " {}"), name);
    EXPECT_EQ(languages::detect_java_class_name("public" + std::string(100000, ' ') + "class X"), "X");
}

TEST(RegistryTest, BuiltinLanguages) {
    LanguageRegistry registry = languages::make_builtin_registry();
    EXPECT_EQ(registry.count(), 3u);
    ASSERT_NE(registry.get(Language::PYTHON), nullptr);
    EXPECT_EQ(registry.get(Language::PYTHON)->id(), "python");
    EXPECT_EQ(registry.get("javascript")->language(), Language::JAVASCRIPT);
    EXPECT_TRUE(registry.get(Language::JAVA)->needs_compile());
    EXPECT_EQ(registry.get("ruby"), nullptr);
}

TEST(RegistryTest, EmptyRegistry) {
    LanguageRegistry registry;
    EXPECT_FALSE(registry.has(Language::PYTHON));
    EXPECT_EQ(registry.get(Language::PYTHON), nullptr);
}

TEST_F(LanguageTest, PythonWritesProgramAndWrapper) {
    languages::PythonLanguage python("python3");
    auto spec = python.prepare(context("print('hi')\n"));
    ASSERT_TRUE(spec.ok()) << spec.error().to_string();

    std::vector<std::string> expected = {"python3", "-I", "-u", work_dir + "/_wrapper.py"};
    EXPECT_EQ(spec.value().command, expected);
    EXPECT_EQ(spec.value().cwd, work_dir);

    EXPECT_EQ(read_file(work_dir + "/main.py").value(), "print('hi')\n");
    std::string wrapper = read_file(work_dir + "/_wrapper.py").value();
    EXPECT_NE(wrapper.find("RLIMIT_AS, (134217728, 134217728)"), std::string::npos);
    EXPECT_NE(wrapper.find("_cpu_seconds = 2\n"), std::string::npos);
    EXPECT_NE(wrapper.find("RLIMIT_CPU, (_cpu_seconds, _cpu_seconds)"), std::string::npos);
    EXPECT_NE(wrapper.find("'__name__': '__main__'"), std::string::npos);
}

TEST_F(LanguageTest, PythonCpuLimitIsAtLeastOneSecond) {
    languages::PythonLanguage python;
    PrepareContext ctx = context("pass\n");
    ctx.timeout_ms = 300;
    ASSERT_TRUE(python.prepare(ctx).ok());
    std::string wrapper = read_file(work_dir + "/_wrapper.py").value();
    EXPECT_NE(wrapper.find("_cpu_seconds = 1\n"), std::string::npos);
}

TEST_F(LanguageTest, PythonPassesCpuSecondsPerCase) {
    languages::PythonLanguage python("python3");
    auto spec = python.prepare(context("pass\n"));
    ASSERT_TRUE(spec.ok());

    LaunchSpec longer = python.launch_for_case(spec.value(), 8000);
    std::vector<std::string> expected = {"python3", "-I", "-u", work_dir + "/_wrapper.py", "8"};
    EXPECT_EQ(longer.command, expected);
    EXPECT_EQ(longer.cwd, work_dir);

    EXPECT_EQ(python.launch_for_case(spec.value(), 200).command.back(), "1");
    EXPECT_EQ(spec.value().command.size(), 4u);
}

TEST_F(LanguageTest, OtherLanguagesIgnoreCaseTimeout) {
    languages::JavaScriptLanguage js("node");
    auto spec = js.prepare(context("console.log(1)\n"));
    ASSERT_TRUE(spec.ok());
    EXPECT_EQ(js.launch_for_case(spec.value(), 8000).command, spec.value().command);
}

TEST_F(LanguageTest, JavaScriptLaunchesNode) {
    languages::JavaScriptLanguage js("node");
    auto spec = js.prepare(context("console.log(1)\n"));
    ASSERT_TRUE(spec.ok());
    std::vector<std::string> expected = {"node", work_dir + "/main.js"};
    EXPECT_EQ(spec.value().command, expected);
    EXPECT_TRUE(file_exists(work_dir + "/main.js"));
}

TEST_F(LanguageTest, PrepareFailsInMissingDirectory) {
    languages::JavaScriptLanguage js;
    PrepareContext ctx = context("console.log(1)\n");
    ctx.work_dir = work_dir + "/missing";
    auto spec = js.prepare(ctx);
    ASSERT_FALSE(spec.ok());
    EXPECT_EQ(spec.error().code(), ErrorCode::FILE_WRITE_ERROR);
}

TEST_F(LanguageTest, JavaCompilesPublicClassName) {
    if (find_in_path("javac").empty()) {
        GTEST_SKIP() << "javac not available";
    }
    languages::JavaLanguage java;
    auto spec = java.prepare(context(
        "public class Foo {\n"
        "    public static void main(String[] args) { System.out.println(\"foo\"); }\n"
        "}\n"));
    ASSERT_TRUE(spec.ok()) << spec.error().to_string();
    EXPECT_TRUE(file_exists(work_dir + "/Foo.java"));
    EXPECT_TRUE(file_exists(work_dir + "/Foo.class"));
    EXPECT_FALSE(file_exists(work_dir + "/Main.class"));
    EXPECT_EQ(spec.value().command.back(), "Foo");
}

TEST_F(LanguageTest, JavaCompileErrorIsReported) {
    if (find_in_path("javac").empty()) {
        GTEST_SKIP() << "javac not available";
    }
    languages::JavaLanguage java;
    auto spec = java.prepare(context("public class Broken { void f() { int x = } }\n"));
    ASSERT_FALSE(spec.ok());
    EXPECT_EQ(spec.error().code(), ErrorCode::COMPILATION_FAILED);
    EXPECT_EQ(spec.error().message().rfind("Compilation failed: ", 0), 0u);
}

TEST_F(LanguageTest, MissingCompilerIsCompilationFailure) {
    languages::JavaLanguage java("sjudge-no-such-javac", "java", 5000);
    auto spec = java.prepare(context("public class Main {}\n"));
    ASSERT_FALSE(spec.ok());
    EXPECT_EQ(spec.error().code(), ErrorCode::COMPILATION_FAILED);
    EXPECT_NE(spec.error().message().find("sjudge-no-such-javac"), std::string::npos);
}
