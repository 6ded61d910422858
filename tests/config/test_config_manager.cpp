#include <catch2/catch_test_macros.hpp>
#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/temp_dir.hpp"

#include <toml++/toml.h>

using test_utils::TempDir;

namespace {

struct Demo {
    std::string name = "default";
    int loads = 0;
};

ConfigSection demoSection(Demo& demo) {
    return {"demo",
            [&demo](const toml::table& table) {
                ++demo.loads;
                if (auto v = table["name"].value<std::string>()) {
                    demo.name = *v;
                }
            },
            [&demo]() {
                toml::table table;
                table.insert("name", demo.name);
                return table;
            }};
}

}  // namespace

TEST_CASE("ConfigManager load", "[config]") {
    TempDir dir;
    const std::string path = (dir.path() / "config.toml").string();
    Demo demo;

    SECTION("Missing file hands defaults to every section") {
        ConfigManager config(path);
        REQUIRE(config.addSection(demoSection(demo)));
        REQUIRE(config.load());
        REQUIRE(demo.loads == 1);
        REQUIRE(demo.name == "default");
    }

    SECTION("A section only sees its own table") {
        dir.write("config.toml", "name = \"top level\"\n\n[demo]\nname = \"from file\"\n");
        ConfigManager config(path);
        REQUIRE(config.addSection(demoSection(demo)));
        REQUIRE(config.load());
        REQUIRE(demo.name == "from file");
    }

    SECTION("A key where a table belongs leaves the defaults") {
        dir.write("config.toml", "demo = 3\n");
        ConfigManager config(path);
        REQUIRE(config.addSection(demoSection(demo)));
        REQUIRE(config.load());
        REQUIRE(demo.loads == 1);
        REQUIRE(demo.name == "default");
    }

    SECTION("Parse errors fall back to defaults and are reported") {
        dir.write("config.toml", "[demo\nname = ");
        ConfigManager config(path);
        REQUIRE(config.addSection(demoSection(demo)));

        REQUIRE_FALSE(config.load());
        REQUIRE(demo.loads == 1);
        REQUIRE(demo.name == "default");
        REQUIRE(config.lastError().find("parse error") != std::string::npos);

        auto reports = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 1);
        REQUIRE(reports[0].category == utils::ErrorCategory::Configuration);
        REQUIRE_FALSE(reports[0].countsAsFailure());
    }

    SECTION("A table has one owner") {
        ConfigManager config(path);
        REQUIRE(config.addSection(demoSection(demo)));
        Demo other;
        REQUIRE_FALSE(config.addSection(demoSection(other)));
        REQUIRE_FALSE(config.addSection({"", [](const toml::table&) {}, []() { return toml::table{}; }}));
    }
}

TEST_CASE("ConfigManager save", "[config]") {
    TempDir dir;
    const std::string path = (dir.path() / "config.toml").string();
    dir.write("config.toml", "[unrelated]\nkeep = true\n\n[demo]\nname = \"old\"\nstale = 1\n");

    Demo demo;
    ConfigManager config(path);
    REQUIRE(config.addSection(demoSection(demo)));
    REQUIRE(config.load());

    demo.name = "new";
    REQUIRE(config.save());

    toml::table written = toml::parse_file(path);
    REQUIRE(written["demo"]["name"].value<std::string>() == "new");
    REQUIRE(written["unrelated"]["keep"].value<bool>() == true);

    // The saved table replaces the one read from disk
    REQUIRE_FALSE(written["demo"].as_table()->contains("stale"));
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));
    REQUIRE(config.root()["demo"]["name"].value<std::string>() == "new");
}
