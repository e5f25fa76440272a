#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"
#include "core/types/Failure.hpp"
#include "infrastructure/config/TargetListReader.hpp"

#include <cstdlib>

using namespace uptimegrid::core;
using namespace uptimegrid::infra;
using uptimegrid::test::TempDir;

TEST_CASE("TargetListReader entry grammar", "[TargetListReader]") {
    SECTION("Bare address uses the address as display name") {
        auto target = TargetListReader::parseEntry("example.com");
        REQUIRE(target.has_value());
        REQUIRE(target->address == "example.com");
        REQUIRE(target->displayName == "example.com");
    }

    SECTION("Name=address") {
        auto target = TargetListReader::parseEntry("  Google = google.com ");
        REQUIRE(target.has_value());
        REQUIRE(target->displayName == "Google");
        REQUIRE(target->address == "google.com");
    }

    SECTION("Splits at the first equals sign only") {
        auto target = TargetListReader::parseEntry("Search=https://example.com/?q=1");
        REQUIRE(target->displayName == "Search");
        REQUIRE(target->address == "https://example.com/?q=1");
    }

    SECTION("URL with a query string is not split") {
        auto target = TargetListReader::parseEntry("https://example.com/health?probe=1");
        REQUIRE(target->address == "https://example.com/health?probe=1");
        REQUIRE(target->displayName == target->address);
    }

    SECTION("Empty display name falls back to the address") {
        auto target = TargetListReader::parseEntry("=github.com");
        REQUIRE(target->displayName == "github.com");
    }

    SECTION("Blank, comment and address-less entries are skipped") {
        REQUIRE_FALSE(TargetListReader::parseEntry("").has_value());
        REQUIRE_FALSE(TargetListReader::parseEntry("   ").has_value());
        REQUIRE_FALSE(TargetListReader::parseEntry("# comment").has_value());
        REQUIRE_FALSE(TargetListReader::parseEntry("Broken=").has_value());
    }
}

TEST_CASE("TargetListReader parses files and lists", "[TargetListReader]") {
    uptimegrid::test::CapturedLog log;
    TargetListReader reader(true, log.logger());

    SECTION("Lines with comments, blanks and Windows line endings") {
        auto targets = reader.parseLines("# targets\nGoogle=google.com\r\n\ngithub.com\n");
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0] == Target{"google.com", "Google"});
        REQUIRE(targets[1] == Target{"github.com", "github.com"});
    }

    SECTION("Duplicate addresses keep the first entry") {
        auto targets = reader.parseLines("A=a.example\nB=a.example\nc.example\n");
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0].displayName == "A");
        REQUIRE(log.contains("duplicate"));
    }

    SECTION("Entries without address are reported") {
        auto targets = reader.parseLines("Broken=\nok.example\n");
        REQUIRE(targets.size() == 1);
        REQUIRE(log.contains("Broken="));
    }

    SECTION("Comma-separated list") {
        auto targets = reader.parseList("Google=google.com, github.com ,,");
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0].displayName == "Google");
        REQUIRE(targets[1].address == "github.com");
    }
}

TEST_CASE("TargetListReader source precedence", "[TargetListReader]") {
    TempDir dir("targets");
    dir.write("targets.txt", "File=file.example\n");
    uptimegrid::test::CapturedLog log;
    TargetListReader reader(true, log.logger());

    SECTION("File is used without an override") {
        auto targets = reader.read(dir.file("targets.txt"), std::nullopt);
        REQUIRE(targets == std::vector<Target>{{"file.example", "File"}});
    }

    SECTION("Environment override wins") {
        auto targets = reader.read(dir.file("targets.txt"), std::string("Env=env.example"));
        REQUIRE(targets == std::vector<Target>{{"env.example", "Env"}});
    }

    SECTION("Blank override is ignored") {
        auto targets = reader.read(dir.file("targets.txt"), std::string("  "));
        REQUIRE(targets.front().address == "file.example");
    }

    SECTION("Missing file falls back to the defaults") {
        auto targets = reader.read(dir.file("absent.txt"), std::nullopt);
        REQUIRE(targets == TargetListReader::defaultTargets());
        REQUIRE(log.contains("ConfigurationMissing"));
    }

    SECTION("File with only comments falls back to the defaults") {
        dir.write("comments.txt", "# nothing here\n\n");
        auto targets = reader.read(dir.file("comments.txt"), std::nullopt);
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0].address == "google.com");
        REQUIRE(targets[1].displayName == "GitHub");
    }
}

TEST_CASE("TargetListReader without fallback", "[TargetListReader]") {
    TempDir dir("targets_strict");
    TargetListReader reader(false, makeNullLogger());

    REQUIRE_THROWS_AS(reader.read(dir.file("absent.txt"), std::nullopt), ConfigurationError);

    dir.write("empty.txt", "");
    REQUIRE_THROWS_AS(reader.read(dir.file("empty.txt"), std::nullopt), ConfigurationError);
}

TEST_CASE("TargetListReader environment lookup", "[TargetListReader]") {
    REQUIRE_FALSE(TargetListReader::environmentValue("").has_value());
    REQUIRE_FALSE(
        TargetListReader::environmentValue("UPTIMEGRID_TEST_SURELY_UNSET_VARIABLE").has_value());

    ::setenv("UPTIMEGRID_TEST_TARGETS", "a.example,b.example", 1);
    REQUIRE(TargetListReader::environmentValue("UPTIMEGRID_TEST_TARGETS") ==
            std::string("a.example,b.example"));
    ::unsetenv("UPTIMEGRID_TEST_TARGETS");
}
