#include <gtest/gtest.h>

#include "commands/command_store.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace termpanel;
using namespace termpanel::commands;

namespace fs = std::filesystem;

namespace
{

class CommandStoreTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        std::string tmpl = (fs::temp_directory_path() / "termpanel-cmds-XXXXXX").string();
        dir_             = ::mkdtemp(tmpl.data());
        path_            = (dir_ / "nested" / "commands.json").string();
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string read_file()
    {
        std::ifstream f(path_);
        return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    }

    fs::path    dir_;
    std::string path_;
};

}   // namespace

TEST_F(CommandStoreTest, MissingFileLoadsEmpty)
{
    CommandStore store(path_);
    store.load();
    EXPECT_TRUE(store.all().empty());
    EXPECT_TRUE(store.get("term-main").empty());
}

TEST_F(CommandStoreTest, AddPersistsAndReloads)
{
    {
        CommandStore store(path_);
        ASSERT_TRUE(store.add("term-main", "build", "make -j8").ok());
        ASSERT_TRUE(store.add("term-main", "test", "ctest").ok());
        ASSERT_TRUE(store.add("term-ops", "logs", "journalctl -f").ok());
    }
    EXPECT_TRUE(fs::exists(path_));

    CommandStore reloaded(path_);
    reloaded.load();
    auto main = reloaded.get("term-main");
    ASSERT_EQ(main.size(), 2u);
    EXPECT_EQ(main[0], (QuickCommand{"build", "make -j8"}));
    EXPECT_EQ(main[1], (QuickCommand{"test", "ctest"}));
    EXPECT_EQ(reloaded.all().size(), 2u);
}

TEST_F(CommandStoreTest, AddRequiresLabelAndCommand)
{
    CommandStore store(path_);
    auto         status = store.add("term-main", "", "ls");
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(store.add("term-main", "ls", "").error().kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(store.all().empty());
}

TEST_F(CommandStoreTest, RemoveByIndex)
{
    CommandStore store(path_);
    ASSERT_TRUE(store.add("term-main", "a", "echo a").ok());
    ASSERT_TRUE(store.add("term-main", "b", "echo b").ok());

    ASSERT_TRUE(store.remove("term-main", 0).ok());
    auto left = store.get("term-main");
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].label, "b");

    auto bad = store.remove("term-main", 5);
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(store.remove("term-other", 0).error().kind, ErrorKind::NotFound);

    // Removing the last entry drops the session key from the file.
    ASSERT_TRUE(store.remove("term-main", 0).ok());
    EXPECT_TRUE(store.all().empty());
    EXPECT_EQ(read_file().find("term-main"), std::string::npos);
}

TEST_F(CommandStoreTest, ClearDropsSession)
{
    CommandStore store(path_);
    ASSERT_TRUE(store.add("term-main", "a", "echo a").ok());
    ASSERT_TRUE(store.add("term-ops", "b", "echo b").ok());
    store.clear("term-main");
    store.clear("term-unknown");
    EXPECT_TRUE(store.get("term-main").empty());
    EXPECT_EQ(store.get("term-ops").size(), 1u);

    CommandStore reloaded(path_);
    reloaded.load();
    EXPECT_TRUE(reloaded.get("term-main").empty());
}

TEST_F(CommandStoreTest, MalformedFileLeavesStoreEmpty)
{
    fs::create_directories(fs::path(path_).parent_path());
    std::ofstream(path_) << "{ not json";
    CommandStore store(path_);
    store.load();
    EXPECT_TRUE(store.all().empty());
}

TEST_F(CommandStoreTest, DeserializeSkipsIncompleteEntries)
{
    CommandStore store(path_);
    ASSERT_TRUE(store.deserialize(R"({
        "term-main": [ {"label": "ok", "command": "true"}, {"label": "no command"} ],
        "term-bad": "not a list"
    })"));
    auto main = store.get("term-main");
    ASSERT_EQ(main.size(), 1u);
    EXPECT_EQ(main[0].label, "ok");
    EXPECT_TRUE(store.get("term-bad").empty());
    EXPECT_FALSE(store.deserialize("[]"));
}

TEST_F(CommandStoreTest, UnwritablePathReportsInternal)
{
    std::ofstream(dir_ / "file") << "x";
    CommandStore store((dir_ / "file" / "commands.json").string());
    auto         status = store.add("term-main", "a", "b");
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::Internal);
}

TEST_F(CommandStoreTest, ConcurrentAddsAreAllKept)
{
    CommandStore             store(path_);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [&store, t]
            {
                for (int i = 0; i < 10; ++i)
                    (void)store.add("term-main", "c" + std::to_string(t * 10 + i), "true");
            });
    }
    for (auto& th : threads)
        th.join();
    EXPECT_EQ(store.get("term-main").size(), 40u);

    CommandStore reloaded(path_);
    reloaded.load();
    EXPECT_EQ(reloaded.get("term-main").size(), 40u);
}
