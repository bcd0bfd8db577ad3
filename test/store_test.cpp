#include <gtest/gtest.h>
#include <codebox/store.h>
#include <codebox/sandbox.h>

#include "utils.h"

TEST(WipeStore, RemovesEverything) {
  fs::path store = MakeScratchDir("wipe_store");
  fs::create_directories(store / "old-sandbox" / "venv" / "bin");
  WriteBinary(store / "old-sandbox" / "script.py", "print(1)");
  ASSERT_EQ(LiveSandboxCount(), 0);
  EXPECT_TRUE(WipeStore(store));
  EXPECT_FALSE(fs::exists(store));
}

TEST(WipeStore, NonexistentStore) {
  EXPECT_TRUE(WipeStore(kStoreRoot / "never_created"));
}

TEST(WipeStore, RefusesWithLiveSandbox) {
  fs::path store = MakeScratchDir("wipe_live");
  WriteBinary(store / "keep", "1");
  {
    Sandbox sandbox("live", store, false);
    EXPECT_EQ(LiveSandboxCount(), 1);
    EXPECT_FALSE(WipeStore(store));
    EXPECT_TRUE(fs::exists(store / "keep"));
  }
  EXPECT_EQ(LiveSandboxCount(), 0);
  EXPECT_TRUE(WipeStore(store));
}
