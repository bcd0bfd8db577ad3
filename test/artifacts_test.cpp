#include <algorithm>
#include <gtest/gtest.h>
#include <codebox/utils.h>

#include "codebox/artifacts.h"
#include "utils.h"

TEST(Artifacts, IsImageFile) {
  EXPECT_TRUE(IsImageFile("plot.png"));
  EXPECT_TRUE(IsImageFile("a/b/PHOTO.JPeG"));
  EXPECT_TRUE(IsImageFile("chart.svg"));
  EXPECT_FALSE(IsImageFile("data.csv"));
  EXPECT_FALSE(IsImageFile("png"));
  EXPECT_FALSE(IsImageFile("plot.png.txt"));
}

TEST(Artifacts, Collect) {
  fs::path dir = MakeScratchDir("artifacts_collect");
  WriteBinary(dir / "a.PNG", kTinyPng);
  WriteBinary(dir / "b.gif", "GIF89a");
  WriteBinary(dir / "notes.txt", "hello");
  fs::create_directories(dir / "nested");
  WriteBinary(dir / "nested" / "c.png", kTinyPng);
  fs::create_directories(dir / "dir.png");

  auto images = CollectImages(dir);
  std::sort(images.begin(), images.end());
  std::vector<std::string> expected = {Base64Encode(kTinyPng), Base64Encode("GIF89a")};
  std::sort(expected.begin(), expected.end());
  EXPECT_EQ(images, expected);
}

TEST(Artifacts, CollectCustomExtensions) {
  ScopedSetting<std::vector<std::string>> exts(kImageExtensions, {".webp"});
  fs::path dir = MakeScratchDir("artifacts_custom");
  WriteBinary(dir / "a.png", kTinyPng);
  WriteBinary(dir / "b.webp", "RIFF");
  EXPECT_EQ(CollectImages(dir), std::vector<std::string>{Base64Encode("RIFF")});
}

TEST(Artifacts, CollectMissingDir) {
  EXPECT_TRUE(CollectImages(kStoreRoot / "does_not_exist").empty());
}
