// ==============================================================================
// test_discovery_gtest.cpp - Тесты модуля File Discovery (GoogleTest)
// ==============================================================================
//
// Проверяет:
// - Порядок обхода (побайтовая сортировка имён)
// - Скрытые файлы и директории
// - Область действия .gitignore (поддерево, без утечки между соседями)
// - --ignore-gitignore, --ignore, --ignore-files-only, -e
// - seed_rules: .gitignore родителя входной директории
// - Порядок фильтров и причины отказа
//
// ==============================================================================

#include "fileprompt/discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fileprompt::io::test {

// ==============================================================================
// Test Fixture: создаёт временную структуру директорий для тестов
// ==============================================================================

class DiscoveryTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        // Имя теста + PID: параллельный ctest -j не конфликтует
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("fileprompt_discovery_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& rel, const std::string& content = "test content") {
        auto path = test_dir_ / rel;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    std::vector<std::filesystem::path> expected(
        std::initializer_list<std::filesystem::path> rels) const {
        std::vector<std::filesystem::path> result;
        for (const auto& rel : rels) {
            result.push_back(test_dir_ / rel);
        }
        return result;
    }
};

// ==============================================================================
// Порядок обхода
// ==============================================================================

TEST_F(DiscoveryTest, SortedByteWise) {
    // Arrange
    create_file("z.txt");
    create_file("a.txt");
    create_file("B.txt");
    create_file("m/b.txt");

    // Act
    auto files = discover_files(test_dir_, WalkOptions{});

    // Assert: заглавные раньше строчных, директории среди файлов по имени
    EXPECT_EQ(files, expected({"B.txt", "a.txt", "m/b.txt", "z.txt"}));
}

TEST_F(DiscoveryTest, DepthFirstOrder) {
    create_file("a/z.txt");
    create_file("a/b/c.txt");
    create_file("b.txt");

    auto files = discover_files(test_dir_, WalkOptions{});

    EXPECT_EQ(files, expected({"a/b/c.txt", "a/z.txt", "b.txt"}));
}

TEST_F(DiscoveryTest, EmptyDirectory) {
    std::filesystem::create_directories(test_dir_ / "empty");

    EXPECT_TRUE(discover_files(test_dir_, WalkOptions{}).empty());
}

TEST_F(DiscoveryTest, MissingRootThrows) {
    EXPECT_THROW(discover_files(test_dir_ / "does_not_exist", WalkOptions{}),
                 std::runtime_error);
}

TEST_F(DiscoveryTest, SubdirectoryVanishingDuringWalkThrows) {
    // Arrange: b_dir исчезает после того, как уровень уже прочитан
    create_file("a.txt");
    create_file("b_dir/c.txt");

    std::vector<std::filesystem::path> seen;
    auto on_candidate = [&](const std::filesystem::path& path) {
        seen.push_back(path);
        if (path.filename() == "a.txt") {
            std::filesystem::remove_all(test_dir_ / "b_dir");
        }
    };

    // Act & Assert
    EXPECT_THROW(walk_directory(test_dir_, WalkOptions{}, IgnoreRuleSet{}, on_candidate),
                 std::runtime_error);
    EXPECT_EQ(seen, expected({"a.txt"}));
}

TEST_F(DiscoveryTest, WalkErrorMessageNamesDirectory) {
    create_file("a.txt");
    create_file("b_dir/c.txt");

    std::string message;
    try {
        walk_directory(test_dir_, WalkOptions{}, IgnoreRuleSet{},
                       [&](const std::filesystem::path&) {
                           std::filesystem::remove_all(test_dir_ / "b_dir");
                       });
    } catch (const std::runtime_error& e) {
        message = e.what();
    }

    EXPECT_EQ(message.rfind("failed to read directory - ", 0), 0u);
    EXPECT_NE(message.find("b_dir"), std::string::npos);
}

// ==============================================================================
// Скрытые файлы
// ==============================================================================

TEST_F(DiscoveryTest, HiddenExcludedByDefault) {
    create_file(".hidden.txt");
    create_file(".hiddendir/x.txt");
    create_file("visible/.nested_hidden.txt");
    create_file("visible/shown.txt");

    auto files = discover_files(test_dir_, WalkOptions{});

    EXPECT_EQ(files, expected({"visible/shown.txt"}));
}

TEST_F(DiscoveryTest, IncludeHidden) {
    create_file(".hidden.txt");
    create_file(".hiddendir/x.txt");
    create_file("visible.txt");

    WalkOptions opt;
    opt.include_hidden = true;
    auto files = discover_files(test_dir_, opt);

    EXPECT_EQ(files, expected({".hidden.txt", ".hiddendir/x.txt", "visible.txt"}));
}

// ==============================================================================
// .gitignore
// ==============================================================================

TEST_F(DiscoveryTest, GitignoreRootAndNested) {
    create_file(".gitignore", "ignored.txt\n");
    create_file("ignored.txt");
    create_file("included.txt");
    create_file("ignored_dir/.gitignore", "*\n");
    create_file("ignored_dir/file.txt");
    create_file("nested_include/included2.txt");
    create_file("nested_ignore/.gitignore", "nested_ignore.txt\n");
    create_file("nested_ignore/nested_ignore.txt");
    create_file("nested_ignore/actually_include.txt");

    auto files = discover_files(test_dir_, WalkOptions{});

    EXPECT_EQ(files, expected({"included.txt", "nested_ignore/actually_include.txt",
                               "nested_include/included2.txt"}));
}

TEST_F(DiscoveryTest, GitignoreDoesNotLeakToSiblings) {
    create_file("a/.gitignore", "secret.txt\n");
    create_file("a/secret.txt");
    create_file("a/public.txt");
    create_file("b/secret.txt");
    create_file("secret.txt");

    auto files = discover_files(test_dir_, WalkOptions{});

    // Правило из a/ не действует ни на соседа b/, ни на предка
    EXPECT_EQ(files, expected({"a/public.txt", "b/secret.txt", "secret.txt"}));
}

TEST_F(DiscoveryTest, GitignoreAppliesToDescendants) {
    create_file(".gitignore", "*.log\n");
    create_file("deep/x/y.log");
    create_file("deep/x/y.txt");

    auto files = discover_files(test_dir_, WalkOptions{});

    EXPECT_EQ(files, expected({"deep/x/y.txt"}));
}

TEST_F(DiscoveryTest, GitignoreDirectoryRule) {
    create_file(".gitignore", "logs/\n");
    create_file("logs/today.txt");
    create_file("src/logs.txt");

    auto files = discover_files(test_dir_, WalkOptions{});

    EXPECT_EQ(files, expected({"src/logs.txt"}));
}

TEST_F(DiscoveryTest, IgnoreGitignore) {
    create_file(".gitignore", "ignored.txt\n");
    create_file("ignored.txt");
    create_file("included.txt");
    create_file("sub/.gitignore", "*\n");
    create_file("sub/kept.txt");

    WalkOptions opt;
    opt.ignore_gitignore = true;
    auto files = discover_files(test_dir_, opt);

    EXPECT_EQ(files, expected({"ignored.txt", "included.txt", "sub/kept.txt"}));
}

TEST_F(DiscoveryTest, InheritedRulesApply) {
    create_file("a.txt");
    create_file("b.md");

    auto files = discover_files(test_dir_, WalkOptions{}, IgnoreRuleSet({"*.txt"}));

    EXPECT_EQ(files, expected({"b.md"}));
}

// ==============================================================================
// --ignore
// ==============================================================================

TEST_F(DiscoveryTest, IgnorePatterns) {
    create_file("keep.md");
    create_file("skip.txt");
    create_file("nested/skip2.txt");

    WalkOptions opt;
    opt.ignore_patterns = {"*.txt"};
    auto files = discover_files(test_dir_, opt);

    EXPECT_EQ(files, expected({"keep.md"}));
}

TEST_F(DiscoveryTest, IgnorePatternPrunesDirectories) {
    create_file("test_subdir/any_file.txt");
    create_file("test_subdir/my_subdir_file.txt");
    create_file("other.txt");

    WalkOptions opt;
    opt.ignore_patterns = {"*subdir*"};
    auto files = discover_files(test_dir_, opt);

    EXPECT_EQ(files, expected({"other.txt"}));
}

TEST_F(DiscoveryTest, IgnoreFilesOnlyKeepsDirectories) {
    create_file("test_subdir/any_file.txt");
    create_file("test_subdir/my_subdir_file.txt");
    create_file("other.txt");

    WalkOptions opt;
    opt.ignore_patterns = {"*subdir*"};
    opt.ignore_files_only = true;
    auto files = discover_files(test_dir_, opt);

    EXPECT_EQ(files, expected({"other.txt", "test_subdir/any_file.txt"}));
}

// ==============================================================================
// Расширения
// ==============================================================================

TEST_F(DiscoveryTest, ExtensionFilter) {
    create_file("a.py");
    create_file("b.md");
    create_file("c.txt");
    create_file("sub/d.py");

    WalkOptions opt;
    opt.extensions = {"py", "md"};
    auto files = discover_files(test_dir_, opt);

    EXPECT_EQ(files, expected({"a.py", "b.md", "sub/d.py"}));
}

TEST_F(DiscoveryTest, ExtensionFilterIsCaseSensitive) {
    create_file("upper.PY");
    create_file("lower.py");

    WalkOptions opt;
    opt.extensions = {"py"};
    auto files = discover_files(test_dir_, opt);

    EXPECT_EQ(files, expected({"lower.py"}));
}

TEST(MatchesExtensionsTest, Basics) {
    EXPECT_TRUE(matches_extensions("a.py", {}));
    EXPECT_TRUE(matches_extensions("dir/a.py", {"py"}));
    EXPECT_FALSE(matches_extensions("a.pyc", {"py"}));
    EXPECT_TRUE(matches_extensions("archive.tar.gz", {"gz"}));
    EXPECT_FALSE(matches_extensions("archive.tar.gz", {"tar.gz"}));
}

TEST(MatchesExtensionsTest, ExtensionlessMatchesEmptyEntry) {
    EXPECT_FALSE(matches_extensions("Makefile", {"py"}));
    EXPECT_TRUE(matches_extensions("Makefile", {""}));
}

// ==============================================================================
// seed_rules
// ==============================================================================

TEST_F(DiscoveryTest, SeedRulesReadsParentGitignore) {
    create_file(".gitignore", "*.log\n");
    create_file("project/app.log");
    create_file("project/app.txt");

    IgnoreRuleSet seed = seed_rules(test_dir_ / "project", WalkOptions{});
    auto files = discover_files(test_dir_ / "project", WalkOptions{}, seed);

    EXPECT_EQ(seed.rules(), (std::vector<std::string>{"*.log"}));
    EXPECT_EQ(files, expected({"project/app.txt"}));
}

TEST_F(DiscoveryTest, SeedRulesHandlesTrailingSlash) {
    create_file(".gitignore", "*.log\n");
    create_file("project/app.txt");

    IgnoreRuleSet seed = seed_rules(test_dir_ / "project" / "", WalkOptions{});

    EXPECT_EQ(seed.rules(), (std::vector<std::string>{"*.log"}));
}

TEST(SeedRulesTest, FilesystemRootHasNoSeed) {
    // "/" не имеет родителя: /.gitignore не читается как правила родителя
    std::filesystem::path root = std::filesystem::temp_directory_path().root_path();

    EXPECT_TRUE(seed_rules(root, WalkOptions{}).empty());
}

TEST_F(DiscoveryTest, SeedRulesEmptyWithIgnoreGitignore) {
    create_file(".gitignore", "*.log\n");
    create_file("project/app.log");

    WalkOptions opt;
    opt.ignore_gitignore = true;

    EXPECT_TRUE(seed_rules(test_dir_ / "project", opt).empty());
}

// ==============================================================================
// Причины отказа
// ==============================================================================

TEST_F(DiscoveryTest, RejectReasonsFollowFilterOrder) {
    // Arrange
    create_file(".gitignore", ".env\nboth.txt\n");
    create_file(".env");
    create_file("both.txt");
    create_file("pattern.txt");
    create_file("wrong.ext");
    create_file("ok.md");

    WalkOptions opt;
    opt.ignore_patterns = {"*.txt"};
    opt.extensions = {"md"};

    std::vector<std::pair<std::string, RejectReason>> rejected;
    std::vector<std::filesystem::path> accepted;

    // Act
    walk_directory(
        test_dir_, opt, IgnoreRuleSet{},
        [&accepted](const std::filesystem::path& p) { accepted.push_back(p); },
        [&rejected](const std::filesystem::path& p, RejectReason r) {
            rejected.emplace_back(p.filename().string(), r);
        });

    // Assert: скрытость раньше .gitignore, .gitignore раньше --ignore
    EXPECT_EQ(accepted, expected({"ok.md"}));

    // Отказы уровня директории приходят в порядке перечисления ФС
    std::sort(rejected.begin(), rejected.end());
    std::vector<std::pair<std::string, RejectReason>> want = {
        {".env", RejectReason::Hidden},
        {".gitignore", RejectReason::Hidden},
        {"both.txt", RejectReason::Gitignore},
        {"pattern.txt", RejectReason::IgnorePattern},
        {"wrong.ext", RejectReason::Extension},
    };
    EXPECT_EQ(rejected, want);
}

TEST(RejectReasonTest, ToString) {
    EXPECT_STREQ(reject_reason_to_string(RejectReason::Hidden), "hidden");
    EXPECT_STREQ(reject_reason_to_string(RejectReason::Gitignore), "gitignore");
    EXPECT_STREQ(reject_reason_to_string(RejectReason::IgnorePattern), "ignore pattern");
    EXPECT_STREQ(reject_reason_to_string(RejectReason::Extension), "extension");
}

}  // namespace fileprompt::io::test
