#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "cli_history.hpp"
#include "host_config.hpp"
#include "test_support.hpp"

TEST(HostConfigTest, SavedConfigLoadsBack) {
  nb_test::TempDir dir;
  const std::string path = (dir.path() / "host.yaml").string();

  HostConfig saved;
  saved.module_dirs = {"natives", "plugins/**"};
  saved.library_search_dirs = {"lib"};
  saved.event_channel = "bridge-events";
  saved.stream_workers = 3;
  saved.strict_signatures = true;
  saved.default_mode = "external";
  saved.history_size = 50;
  ASSERT_TRUE(write_config_to_file(saved, path));

  HostConfig loaded;
  load_or_create_config(path, loaded);
  EXPECT_EQ(loaded.module_dirs, saved.module_dirs);
  EXPECT_EQ(loaded.library_search_dirs, saved.library_search_dirs);
  EXPECT_EQ(loaded.event_channel, "bridge-events");
  EXPECT_EQ(loaded.stream_workers, 3);
  EXPECT_TRUE(loaded.strict_signatures);
  EXPECT_EQ(loaded.default_mode, "external");
  EXPECT_EQ(loaded.history_size, 50);
  EXPECT_FALSE(loaded.loaded_config_path.empty());
}

TEST(HostConfigTest, SingleModuleDirIsAccepted) {
  nb_test::TempDir dir;
  const auto path = dir.path() / "host.yaml";
  std::ofstream(path) << "module_dir: addins\n";

  HostConfig config;
  load_or_create_config(path.string(), config);
  ASSERT_EQ(config.module_dirs.size(), 1u);
  EXPECT_EQ(config.module_dirs[0], "addins");
  EXPECT_EQ(config.event_channel, "native-stream");
}

TEST(HostConfigTest, MissingOrBrokenFileKeepsDefaults) {
  nb_test::TempDir dir;
  HostConfig missing;
  load_or_create_config((dir.path() / "absent.yaml").string(), missing);
  EXPECT_EQ(missing.module_dirs, std::vector<std::string>{"natives"});
  EXPECT_TRUE(missing.loaded_config_path.empty());
  EXPECT_FALSE(nb::fs::exists(dir.path() / "absent.yaml"));

  const auto broken_path = dir.path() / "broken.yaml";
  std::ofstream(broken_path) << "stream_workers: [unterminated\n";
  HostConfig broken;
  load_or_create_config(broken_path.string(), broken);
  EXPECT_EQ(broken.stream_workers, 0);
  EXPECT_EQ(broken.default_mode, "sync");
}

TEST(HostConfigTest, BridgeOptionsFollowConfig) {
  HostConfig config;
  config.module_dirs = {"a", "b/**"};
  config.stream_workers = -4;
  config.strict_signatures = true;
  auto opts = to_bridge_options(config);
  EXPECT_EQ(opts.module_dirs, config.module_dirs);
  EXPECT_EQ(opts.stream_workers, 0u);
  EXPECT_TRUE(opts.strict_signatures);
  EXPECT_EQ(opts.event_channel, "native-stream");
  EXPECT_EQ(opts.gate, nullptr);
}

TEST(CliHistoryTest, PersistsAndTrims) {
  nb_test::TempDir dir;
  const auto file = dir.path() / "history";
  {
    nb::CliHistory history(file);
    history.Add("modules");
    history.Add("modules");
    history.Add("sync sample {}");
    history.Add("");
    EXPECT_EQ(history.Entries().size(), 2u);
    history.Save();
  }
  nb::CliHistory reloaded(file);
  ASSERT_EQ(reloaded.Entries().size(), 2u);
  EXPECT_EQ(reloaded.Entries()[1], "sync sample {}");

  reloaded.SetMaxSize(1);
  ASSERT_EQ(reloaded.Entries().size(), 1u);
  EXPECT_EQ(reloaded.Entries()[0], "sync sample {}");
  EXPECT_EQ(reloaded.Path(), file);
}
