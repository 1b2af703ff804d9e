#include <thread>
#include "../common.hpp"
#include "stlaunch/runner/run_configuration.hpp"

CATCH_TEST_CASE("Defaults", "[run_configuration]") {
    ConfigGuard guard;
    g_config.color_output = false;

    RunConfiguration config = RunConfiguration::parse("", "/project");
    CATCH_REQUIRE(config.max_parallel_forks == std::max(1u, std::thread::hardware_concurrency()));
    CATCH_REQUIRE(!config.color_output);
    CATCH_REQUIRE(!config.ignore_failures);
    CATCH_REQUIRE(config.environment.empty());
    CATCH_REQUIRE(config.suites.empty());
    CATCH_REQUIRE(!config.reports.html_enabled);
    CATCH_REQUIRE(!config.reports.junit_xml_enabled);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("FullConfiguration", "[run_configuration]") {
    const char* toml = R"(
classpath = ["build/classes", "/lib/scalatest.jar"]
jvm_args = ["-XX:+UseG1GC"]
min_heap_size = "64m"
max_heap_size = "1g"
working_directory = "work"
max_parallel_forks = 0
color_output = true
test_root = "build/classes/scala/test"
include_patterns = ["*Spec"]
suites = ["a", "a", "b"]
result_file = "build/result.txt"
output_file = ""
ignore_failures = true

[environment]
a = "b"

[system_properties]
bob = "rita"
answer = 42

[config]
a = "b"
c = 1

[tags]
include = ["bob", "rita"]
exclude = ["jane", "sue"]

[reports.junit_xml]
enabled = true
destination = "build/test-results"

[reports.html]
enabled = true
destination = "build/reports/tests"
)";

    RunConfiguration config = RunConfiguration::parse(toml, "/project");
    CATCH_REQUIRE(config.classpath == std::vector<std::string>{"build/classes", "/lib/scalatest.jar"});
    CATCH_REQUIRE(config.jvm_args == std::vector<std::string>{"-XX:+UseG1GC"});
    CATCH_REQUIRE(config.min_heap_size == "64m");
    CATCH_REQUIRE(config.max_heap_size == "1g");
    CATCH_REQUIRE(config.working_directory == "/project/work");
    CATCH_REQUIRE(config.max_parallel_forks == 0);
    CATCH_REQUIRE(config.color_output);
    CATCH_REQUIRE(config.test_root == "/project/build/classes/scala/test");
    CATCH_REQUIRE(config.include_patterns == std::vector<std::string>{"*Spec"});
    CATCH_REQUIRE(config.suites == std::vector<std::string>{"a", "a", "b"});
    CATCH_REQUIRE(config.result_file == "/project/build/result.txt");
    CATCH_REQUIRE(config.output_file.empty());
    CATCH_REQUIRE(config.ignore_failures);
    CATCH_REQUIRE(config.environment.at("a") == "b");
    CATCH_REQUIRE(config.system_properties.at("bob") == "rita");
    CATCH_REQUIRE(config.system_properties.at("answer") == "42");
    CATCH_REQUIRE(display_text(config.config_entries.at("a")) == "b");
    CATCH_REQUIRE(std::get<i64>(config.config_entries.at("c")) == 1);
    CATCH_REQUIRE(config.tag_includes == std::vector<std::string>{"bob", "rita"});
    CATCH_REQUIRE(config.tag_excludes == std::vector<std::string>{"jane", "sue"});
    CATCH_REQUIRE(config.reports.junit_xml_enabled);
    CATCH_REQUIRE(config.reports.junit_xml_entry_point == "/project/build/test-results");
    CATCH_REQUIRE(config.reports.html_enabled);
    CATCH_REQUIRE(config.reports.html_destination == "/project/build/reports/tests");
    CATCH_REQUIRE(config.reports.html_entry_point == "/project/build/reports/tests/index.html");
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("ClasspathString", "[run_configuration]") {
    RunConfiguration config = RunConfiguration::parse(R"(classpath = "a.jar:b.jar::c")", "/project");
    CATCH_REQUIRE(config.classpath == std::vector<std::string>{"a.jar", "b.jar", "c"});
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("ExplicitEntryPoint", "[run_configuration]") {
    const char* toml = R"(
[reports.html]
enabled = true
destination = "/reports"
entry_point = "/reports/overview.html"
)";
    RunConfiguration config = RunConfiguration::parse(toml, "/project");
    CATCH_REQUIRE(config.reports.html_entry_point == "/reports/overview.html");
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("InheritEnvironment", "[run_configuration]") {
    setenv("STLAUNCH_TEST_INHERITED", "yes", 1);
    const char* toml = R"(
inherit_environment = true
[environment]
STLAUNCH_TEST_OVERRIDE = "mine"
)";
    RunConfiguration config = RunConfiguration::parse(toml, "/project");
    unsetenv("STLAUNCH_TEST_INHERITED");
    CATCH_REQUIRE(config.environment.at("STLAUNCH_TEST_INHERITED") == "yes");
    CATCH_REQUIRE(config.environment.at("STLAUNCH_TEST_OVERRIDE") == "mine");
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("WrongTypesAreRejected", "[run_configuration]") {
    CATCH_REQUIRE_THROWS_AS(RunConfiguration::parse("suites = \"a\"", "/"), ConfigurationError);
    CATCH_REQUIRE_THROWS_AS(RunConfiguration::parse("color_output = \"yes\"", "/"), ConfigurationError);
    CATCH_REQUIRE_THROWS_AS(RunConfiguration::parse("max_parallel_forks = -1", "/"), ConfigurationError);
    CATCH_REQUIRE_THROWS_AS(RunConfiguration::parse("include_patterns = [1]", "/"), ConfigurationError);
    CATCH_REQUIRE_THROWS_AS(RunConfiguration::parse("tags = 1", "/"), ConfigurationError);
    CATCH_REQUIRE_THROWS_AS(RunConfiguration::parse("config = { a = [1] }", "/"), ConfigurationError);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("EnabledReportNeedsDestination", "[run_configuration]") {
    CATCH_REQUIRE_THROWS_AS(RunConfiguration::parse("[reports.html]\nenabled = true", "/"), ConfigurationError);
    CATCH_REQUIRE_THROWS_AS(RunConfiguration::parse("[reports.junit_xml]\nenabled = true", "/"), ConfigurationError);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("InvalidToml", "[run_configuration]") {
    CATCH_REQUIRE_THROWS_AS(RunConfiguration::parse("suites = [", "/"), ConfigurationError);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("LoadResolvesAgainstFile", "[run_configuration]") {
    TempDirectory tmp;
    write_file(tmp.path / "run.toml", "test_root = \"classes\"\nresult_file = \"/abs/result.txt\"\n");

    RunConfiguration config = RunConfiguration::load(tmp.path / "run.toml");
    CATCH_REQUIRE(config.test_root == tmp.path / "classes");
    CATCH_REQUIRE(config.result_file == "/abs/result.txt");
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("LoadMissingFile", "[run_configuration]") {
    CATCH_REQUIRE_THROWS_AS(RunConfiguration::load("/nonexistent/run.toml"), ConfigurationError);
    SUCCESS_MESSAGE();
}

CATCH_TEST_CASE("AllJvmArgs", "[run_configuration]") {
    RunConfiguration config{};
    config.system_properties["bob"] = "rita";
    config.min_heap_size = "123m";
    config.max_heap_size = "456m";
    config.jvm_args = {"-XX:MaxPermSize=256m"};

    std::vector<std::string> expected = {"-Dbob=rita", "-Xms123m", "-Xmx456m", "-XX:MaxPermSize=256m"};
    CATCH_REQUIRE(config.allJvmArgs() == expected);
    SUCCESS_MESSAGE();
}
