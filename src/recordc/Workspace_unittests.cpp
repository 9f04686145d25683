#include "recordc/Workspace.hpp"

#include "recordc/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <string>
#include <system_error>
#include <type_traits>

namespace recordc {

TEST_CASE("Workspace lifecycle") {
    std::string reason;
    auto base = makeUniqueDirectory(defaultWorkspaceBase(), "recordc-workspace-test-", reason);
    REQUIRE(!base.empty());
    ErrorReporter errorReporter(true);

    SUBCASE("removed on destruction") {
        fs::path path;
        {
            auto workspace = Workspace::create(base, "recordc-Person-", &errorReporter);
            REQUIRE(workspace);
            path = workspace->path();
            CHECK(fs::is_directory(path));
            CHECK_EQ(path.parent_path(), base);
            CHECK_EQ(path.filename().string().rfind("recordc-Person-", 0), 0);

            CHECK(workspace->writeFile("Person.h", "#ifndef Person_H\n", &errorReporter));
            CHECK(fs::exists(workspace->filePath("Person.h")));
            std::string contents;
            REQUIRE(readFile(workspace->filePath("Person.h"), contents));
            CHECK_EQ(contents, "#ifndef Person_H\n");
            CHECK_EQ(workspace->files().size(), 1);
        }
        CHECK_FALSE(fs::exists(path));
        CHECK(errorReporter.ok());
    }

    SUBCASE("remove is idempotent") {
        auto workspace = Workspace::create(base, "recordc-Person-", &errorReporter);
        REQUIRE(workspace);
        CHECK(workspace->remove());
        CHECK(workspace->isRemoved());
        CHECK_FALSE(fs::exists(workspace->path()));
        CHECK(workspace->remove());
    }

    SUBCASE("kept workspace survives") {
        fs::path path;
        {
            auto workspace = Workspace::create(base, "recordc-Person-", &errorReporter);
            REQUIRE(workspace);
            workspace->setKeep(true);
            path = workspace->path();
        }
        CHECK(fs::is_directory(path));
    }

    SUBCASE("unique directories") {
        auto first = Workspace::create(base, "recordc-Person-", &errorReporter);
        auto second = Workspace::create(base, "recordc-Person-", &errorReporter);
        REQUIRE(first);
        REQUIRE(second);
        CHECK_NE(first->path(), second->path());
    }

    SUBCASE("base is not a directory") {
        auto blocker = base / "not-a-directory";
        REQUIRE(writeFile(blocker, "x"));
        auto workspace = Workspace::create(blocker, "recordc-Person-", &errorReporter);
        CHECK_FALSE(workspace);
        CHECK_EQ(errorReporter.lastError().code, Error::kWorkspaceCreateFailed);
    }

    SUBCASE("write failure") {
        auto workspace = Workspace::create(base, "recordc-Person-", &errorReporter);
        REQUIRE(workspace);
        CHECK_FALSE(workspace->writeFile("missing/Person.h", "", &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kSourceWriteFailed);
    }

    std::error_code ec;
    fs::remove_all(base, ec);
}

TEST_CASE("Workspace construction") {
    static_assert(!std::is_default_constructible_v<Workspace>);
    static_assert(!std::is_constructible_v<Workspace, fs::path>);
    static_assert(!std::is_copy_constructible_v<Workspace>);

    ErrorReporter errorReporter(true);
    auto workspace = Workspace::create(defaultWorkspaceBase(), "recordc-construction-test-", &errorReporter);
    REQUIRE(workspace);
    CHECK(errorReporter.ok());
    CHECK(fs::is_directory(workspace->path()));
    CHECK_FALSE(workspace->keep());
    CHECK_FALSE(workspace->isRemoved());
    CHECK(workspace->files().empty());
}

} // namespace recordc
