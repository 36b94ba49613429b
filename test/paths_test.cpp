#include <set>
#include <gtest/gtest.h>
#include <evobox/paths.h>

TEST(Paths, ImplementationIds) {
  EXPECT_TRUE(IsValidImplementationId("impl_a"));
  EXPECT_TRUE(IsValidImplementationId("0_17"));
  EXPECT_TRUE(IsValidImplementationId("v1.2-rc"));
  EXPECT_FALSE(IsValidImplementationId(""));
  EXPECT_FALSE(IsValidImplementationId("."));
  EXPECT_FALSE(IsValidImplementationId(".."));
  EXPECT_FALSE(IsValidImplementationId("a/b"));
  EXPECT_FALSE(IsValidImplementationId("a b"));
  EXPECT_FALSE(IsValidImplementationId("a;rm"));
  EXPECT_FALSE(IsValidImplementationId("$(id)"));
}

TEST(Paths, Layout) {
  EXPECT_EQ(InputFileName(7), "7.json");
  EXPECT_EQ(ContainerInputPath(7).string(), "/home/inputs/7.json");
  EXPECT_EQ(ContainerOutputPath("impl_a", 1).string(), "/home/outputs/impl_a/output_1.json");
  EXPECT_EQ(ContainerLogDir("impl_a", 1).string(), "/home/logs/impl_a/test_1");
  EXPECT_EQ(ContainerStdoutPath("impl_a", 1).string(), "/home/logs/impl_a/test_1/stdout.txt");
  EXPECT_EQ(ContainerStderrPath("impl_a", 1).string(), "/home/logs/impl_a/test_1/stderr.txt");
  EXPECT_EQ(ImplementationPath("/srv/imps", "0_3").string(), "/srv/imps/0_3");
}

TEST(Paths, DoNotCollide) {
  std::set<std::string> paths;
  for (std::string impl : {"impl_a", "impl_b", "impl_a1", "1", "1_1"}) {
    for (int test = 0; test < 12; test++) {
      EXPECT_TRUE(paths.insert(ContainerOutputPath(impl, test).string()).second);
      EXPECT_TRUE(paths.insert(ContainerLogDir(impl, test).string()).second);
      EXPECT_TRUE(paths.insert(ContainerStdoutPath(impl, test).string()).second);
      EXPECT_TRUE(paths.insert(ContainerStderrPath(impl, test).string()).second);
    }
  }
}

TEST(Paths, DataFiles) {
  EXPECT_TRUE(fs::is_regular_file(DockerfilePath()));
  EXPECT_TRUE(fs::is_regular_file(DriverScriptPath()));
}
