#include <ansiviz/role_resolver.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_repository.h"

namespace ansiviz {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class RoleResolverTest : public ::testing::Test {
protected:
  void AddRole(const std::string &name, const std::string &tasks,
               const std::string &meta = "") {
    repository_.AddFile("roles/" + name + "/tasks/main.yml", tasks);
    if (!meta.empty()) {
      repository_.AddFile("roles/" + name + "/meta/main.yml", meta);
    }
  }

  test::TemporaryRepository repository_;
  std::shared_ptr<DiagnosticsLogger> logger_ =
      std::make_shared<DiagnosticsLogger>();
};

TEST_F(RoleResolverTest, ResolvesTransitiveDependencies) {
  AddRole("X", "- name: x task\n", "dependencies:\n  - Y\n");
  AddRole("Y", "- name: y task\n", "dependencies:\n  - role: Z\n");
  AddRole("Z", "- name: z task\n");

  RoleResolver resolver(repository_.root(), logger_);
  const auto resolution = resolver.Resolve({"X"});

  EXPECT_THAT(resolution.role_names, ElementsAre("X", "Y", "Z"));
  ASSERT_EQ(3u, resolution.roles.size());
  for (const auto &name : {"X", "Y", "Z"}) {
    const auto found = resolution.roles.find(name);
    ASSERT_NE(resolution.roles.end(), found) << name;
    EXPECT_EQ(1u, found->second.tasks.size()) << name;
  }
  EXPECT_THAT(resolution.roles.at("X").dependencies, ElementsAre("Y"));
  EXPECT_THAT(resolution.roles.at("Y").dependencies, ElementsAre("Z"));
}

TEST_F(RoleResolverTest, DependencyCycleTerminates) {
  AddRole("X", "- name: x task\n", "dependencies: [Y]\n");
  AddRole("Y", "- name: y task\n", "dependencies: [X]\n");

  RoleResolver resolver(repository_.root(), logger_);
  const auto resolution = resolver.Resolve({"X"});

  EXPECT_THAT(resolution.role_names, ElementsAre("X", "Y"));
  EXPECT_EQ(2u, resolution.roles.size());
}

TEST_F(RoleResolverTest, MissingRoleIsSoftMiss) {
  RoleResolver resolver(repository_.root(), logger_);
  const auto resolution = resolver.Resolve({"ghost"});

  ASSERT_EQ(1u, resolution.roles.size());
  EXPECT_THAT(resolution.roles.at("ghost").tasks, IsEmpty());
  EXPECT_THAT(resolution.roles.at("ghost").dependencies, IsEmpty());
  ASSERT_EQ(1u, logger_->Diagnostics().size());
  EXPECT_THAT(logger_->Diagnostics().front(), HasSubstr("role.tasks.missing"));
}

TEST_F(RoleResolverTest, FindsRolesInNestedRolesDirectories) {
  repository_.AddFile("playbooks/roles/web/tasks/main.yml",
                      "- name: nested\n");

  RoleResolver resolver(repository_.root(), logger_);
  const auto tasks = resolver.LoadTasks("web");

  ASSERT_EQ(1u, tasks.size());
  EXPECT_EQ("nested", tasks.front().metadata.name);
}

TEST_F(RoleResolverTest, PrefersYmlOverYaml) {
  repository_.AddFile("roles/web/tasks/main.yaml", "- name: from yaml\n");
  repository_.AddFile("roles/web/tasks/main.yml", "- name: from yml\n");

  RoleResolver resolver(repository_.root(), logger_);
  const auto tasks = resolver.LoadTasks("web");

  ASSERT_EQ(1u, tasks.size());
  EXPECT_EQ("from yml", tasks.front().metadata.name);
}

TEST_F(RoleResolverTest, FallsBackToYamlWhenYmlIsEmpty) {
  repository_.AddFile("roles/web/tasks/main.yml", "");
  repository_.AddFile("roles/web/tasks/main.yaml", "- name: from yaml\n");

  RoleResolver resolver(repository_.root(), logger_);
  const auto tasks = resolver.LoadTasks("web");

  ASSERT_EQ(1u, tasks.size());
  EXPECT_EQ("from yaml", tasks.front().metadata.name);
}

TEST_F(RoleResolverTest, RoleTasksExpandIncludesFromRoleDirectory) {
  repository_.AddFile("roles/web/tasks/main.yml",
                      "- include_tasks: install.yml\n");
  repository_.AddFile("roles/web/tasks/install.yml", "- name: install\n");

  RoleResolver resolver(repository_.root(), logger_);
  const auto tasks = resolver.LoadTasks("web");

  ASSERT_EQ(1u, tasks.size());
  const auto *include = std::get_if<IncludeTasks>(&tasks.front().body);
  ASSERT_NE(nullptr, include);
  ASSERT_EQ(1u, include->included.size());
  EXPECT_EQ("install", include->included.front().metadata.name);
}

TEST_F(RoleResolverTest, ResolvesRolesIncludedFromRoleTasks) {
  AddRole("A", "- name: a task\n"
               "- block:\n"
               "    - include_role: {name: B}\n");
  AddRole("B", "- name: b task\n");

  RoleResolver resolver(repository_.root(), logger_);
  const auto resolution = resolver.Resolve({"A"});

  EXPECT_THAT(resolution.role_names, ElementsAre("A", "B"));
  ASSERT_EQ(1u, resolution.roles.count("B"));
  ASSERT_EQ(1u, resolution.roles.at("B").tasks.size());
  EXPECT_EQ("b task", resolution.roles.at("B").tasks.front().metadata.name);
  EXPECT_THAT(resolution.roles.at("A").dependencies, IsEmpty());
  EXPECT_THAT(logger_->Diagnostics(), IsEmpty());
}

TEST_F(RoleResolverTest, SelfIncludingRoleTerminates) {
  AddRole("A", "- include_role: {name: A}\n");

  RoleResolver resolver(repository_.root(), logger_);
  const auto resolution = resolver.Resolve({"A"});

  EXPECT_THAT(resolution.role_names, ElementsAre("A"));
  EXPECT_EQ(1u, resolution.roles.size());
}

TEST(RoleLocatorTest, SkipsHiddenDirectories) {
  test::TemporaryRepository repository;
  repository.AddFile(".git/roles/web/tasks/main.yml", "- name: hidden\n");
  repository.AddFile(".cache/deep/roles/web/tasks/main.yml",
                     "- name: hidden too\n");
  repository.AddFile("roles/web/tasks/main.yml", "- name: visible\n");

  RoleLocator locator(repository.root());
  const auto candidates = locator.Candidates("web", "tasks");

  ASSERT_EQ(1u, locator.RolesDirectories().size());
  ASSERT_EQ(1u, candidates.size());
  EXPECT_EQ(
      (repository.root() / "roles" / "web" / "tasks" / "main.yml")
          .lexically_normal(),
      candidates[0]);
}

TEST(RoleLocatorTest, ListsYmlCandidatesBeforeYaml) {
  test::TemporaryRepository repository;
  repository.AddFile("a/roles/web/meta/main.yaml", "dependencies: []\n");
  repository.AddFile("b/roles/web/meta/main.yml", "dependencies: []\n");
  repository.AddFile("a/roles/web/meta/main.yml", "dependencies: []\n");

  RoleLocator locator(repository.root());
  const auto candidates = locator.Candidates("web", "meta");

  ASSERT_EQ(3u, candidates.size());
  EXPECT_EQ("main.yml", candidates[0].filename().string());
  EXPECT_EQ("main.yml", candidates[1].filename().string());
  EXPECT_EQ("main.yaml", candidates[2].filename().string());
  EXPECT_THAT(candidates[0].generic_string(), HasSubstr("/a/roles/"));
  EXPECT_THAT(candidates[1].generic_string(), HasSubstr("/b/roles/"));
}

} // namespace
} // namespace ansiviz
