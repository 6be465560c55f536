#include "catch2_custom.hpp"

#include "exceptions.hpp"
#include "model/assessment.hpp"
#include "orchestrator/definition_registry.hpp"
#include "serialization/json_codec.hpp"
#include "test_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace assessgrader;

namespace {

/// Fresh directory under the system temp dir, removed on destruction
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : path_{std::filesystem::temp_directory_path() / name} {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code err;
        std::filesystem::remove_all(path_, err);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::filesystem::path write(const std::string& file_name, const std::string& contents) const {
        auto file = path_ / file_name;
        std::ofstream{file} << contents;
        return file;
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("Published definitions can be looked up") {
    DefinitionRegistry registry;

    auto published = registry.publish(testing::sample_definition("quiz"));

    REQUIRE(registry.size() == 1);
    REQUIRE(registry.get("quiz") == published);
    REQUIRE(registry.find("other") == nullptr);
    REQUIRE_THROWS_AS(registry.get("other"), AssessmentNotFoundError);
    REQUIRE(registry.ids() == std::vector<std::string>{"quiz"});
}

TEST_CASE("Publishing sorts questions by display order") {
    DefinitionRegistry registry;
    auto def = testing::sample_definition();
    std::swap(def.questions[0], def.questions[3]);

    auto published = registry.publish(def);

    REQUIRE(published->questions.front().id == "q1");
    REQUIRE(published->questions.back().id == "q4");
}

TEST_CASE("Invalid definitions are not published") {
    DefinitionRegistry registry;
    auto def = testing::sample_definition();
    def.questions.clear();

    REQUIRE_THROWS_AS(registry.publish(def), InvalidDefinitionError);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("Frozen definitions cannot change") {
    DefinitionRegistry registry;
    registry.publish(testing::sample_definition());

    auto changed = testing::sample_definition();
    changed.title = "Renamed";

    SECTION("unfrozen definitions are replaced") {
        auto replaced = registry.publish(changed);
        REQUIRE(replaced->title == "Renamed");
        REQUIRE(registry.get("quiz")->title == "Renamed");
    }

    SECTION("frozen definitions are kept") {
        registry.freeze("quiz");
        REQUIRE(registry.is_frozen("quiz"));

        REQUIRE_THROWS_AS(registry.publish(changed), DefinitionFrozenError);
        REQUIRE(registry.get("quiz")->title == "Sample");

        // Unchanged republishing is harmless
        REQUIRE_NOTHROW(registry.publish(testing::sample_definition()));
    }
}

TEST_CASE("Definitions load from a directory of JSON files") {
    TempDir dir{"assessgrader-registry-test"};

    dir.write("b.json", nlohmann::json(testing::sample_definition("second")).dump());
    dir.write("a.json", nlohmann::json(testing::sample_definition("first")).dump());
    dir.write("broken.json", "{ not json");
    dir.write("notes.txt", "ignored");

    DefinitionRegistry registry;

    REQUIRE(registry.load_directory(dir.path()) == 2);
    REQUIRE(registry.ids() == std::vector<std::string>{"first", "second"});
}

TEST_CASE("Loading a single bad file reports it") {
    TempDir dir{"assessgrader-registry-file-test"};
    auto file = dir.write("bad.json", R"({"id": "x", "questions": []})");

    DefinitionRegistry registry;

    REQUIRE_THROWS_AS(registry.load_file(file), InvalidDefinitionError);
    REQUIRE_THROWS_AS(registry.load_file(dir.path() / "missing.json"), InvalidDefinitionError);
}

TEST_CASE("A missing definitions directory is an error") {
    DefinitionRegistry registry;

    REQUIRE_THROWS_AS(registry.load_directory("/nonexistent/assessgrader-definitions"), InvalidDefinitionError);
}
