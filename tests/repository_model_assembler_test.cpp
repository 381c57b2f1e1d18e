#include <ansiviz/errors.h>
#include <ansiviz/playbook_parser.h>
#include <ansiviz/repository_model_assembler.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

#include "test_support/temporary_repository.h"

namespace ansiviz {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class RepositoryModelAssemblerTest : public ::testing::Test {
protected:
  GenerationRequest Request(std::vector<std::string> inventories,
                            std::vector<std::string> playbooks) const {
    GenerationRequest request;
    request.repository_root = repository_.root().string();
    for (const auto &inventory : inventories) {
      request.inventory_paths.push_back(
          (repository_.root() / inventory).string());
    }
    for (const auto &playbook : playbooks) {
      request.playbook_paths.push_back(
          (repository_.root() / playbook).string());
    }
    return request;
  }

  test::TemporaryRepository repository_;
};

TEST_F(RepositoryModelAssemblerTest, SharedImportIsParsedOnce) {
  repository_.AddFile("shared.yml", "- hosts: all\n  roles: [common]\n");
  repository_.AddFile("a.yml",
                      "- import_playbook: shared.yml\n- hosts: web\n");
  repository_.AddFile("b.yml",
                      "- import_playbook: shared.yml\n- hosts: db\n");
  repository_.AddFile("roles/common/tasks/main.yml", "- name: ping\n");

  RepositoryModelAssembler assembler;
  const auto model = assembler.Build(Request({}, {"a.yml", "b.yml"}));

  std::vector<std::string> names;
  for (const auto &playbook : model.playbooks) {
    names.push_back(playbook.name);
  }
  EXPECT_THAT(names, ElementsAre("a.yml", "b.yml", "shared.yml"));
  EXPECT_EQ(1, std::count(names.begin(), names.end(), "shared.yml"));
  EXPECT_NE(nullptr,
            FindPlaybook(model, PlaybookKey(repository_.root() / "shared.yml")));
  EXPECT_THAT(model.role_names, ElementsAre("common"));
  EXPECT_THAT(model.diagnostics, IsEmpty());
}

TEST_F(RepositoryModelAssemblerTest, MergesInventoriesInOrder) {
  repository_.AddFile("hosts.ini", "[web]\nweb1\n");
  repository_.AddFile("more.yml", "db:\n  hosts:\n    db1:\n");
  repository_.AddFile("site.yml", "- hosts: web\n");

  RepositoryModelAssembler assembler;
  const auto model =
      assembler.Build(Request({"hosts.ini", "more.yml"}, {"site.yml"}));

  ASSERT_EQ(2u, model.groups.size());
  EXPECT_EQ("web", model.groups[0].name);
  EXPECT_EQ("db", model.groups[1].name);
  EXPECT_THAT(model.groups[1].hosts, ElementsAre("db1"));
}

TEST_F(RepositoryModelAssemblerTest, CollectsRolesFromTasksBlocksAndIncludes) {
  repository_.AddFile("site.yml",
                      "- hosts: all\n"
                      "  roles: [base]\n"
                      "  tasks:\n"
                      "    - include_role: {name: direct}\n"
                      "    - block:\n"
                      "        - import_role: {name: blocked}\n"
                      "    - include_tasks: extra.yml\n");
  repository_.AddFile("extra.yml", "- include_role: {name: included}\n");
  repository_.AddFile("roles/included/tasks/main.yml", "- name: t\n");
  repository_.AddFile("roles/included/meta/main.yml",
                      "dependencies: [transitive]\n");

  RepositoryModelAssembler assembler;
  const auto model = assembler.Build(Request({}, {"site.yml"}));

  EXPECT_THAT(model.role_names, ElementsAre("base", "blocked", "direct",
                                            "included", "transitive"));
  EXPECT_EQ(5u, model.roles.size());
}

TEST_F(RepositoryModelAssemblerTest, SoftMissesBecomeDiagnostics) {
  repository_.AddFile("site.yml",
                      "- import_playbook: missing.yml\n"
                      "- hosts: all\n"
                      "  roles: [ghost]\n"
                      "  tasks:\n"
                      "    - include_tasks: nowhere.yml\n");

  RepositoryModelAssembler assembler;
  const auto model = assembler.Build(Request({}, {"site.yml"}));

  ASSERT_EQ(3u, model.diagnostics.size());
  EXPECT_THAT(model.diagnostics,
              Contains(HasSubstr("playbook.import.missing")));
  EXPECT_THAT(model.diagnostics, Contains(HasSubstr("include.missing")));
  EXPECT_THAT(model.diagnostics, Contains(HasSubstr("role.tasks.missing")));
}

TEST_F(RepositoryModelAssemblerTest, DiagnosticsDoNotLeakBetweenBuilds) {
  repository_.AddFile("site.yml", "- hosts: all\n  roles: [ghost]\n");

  RepositoryModelAssembler assembler;
  const auto first = assembler.Build(Request({}, {"site.yml"}));
  const auto second = assembler.Build(Request({}, {"site.yml"}));

  EXPECT_EQ(first.diagnostics, second.diagnostics);
  EXPECT_EQ(1u, second.diagnostics.size());
}

TEST_F(RepositoryModelAssemblerTest, MissingPlaybookPropagates) {
  RepositoryModelAssembler assembler;

  EXPECT_THROW(assembler.Build(Request({}, {"absent.yml"})),
               MissingResourceError);
}

TEST_F(RepositoryModelAssemblerTest, MalformedPlaybookPropagates) {
  repository_.AddFile("site.yml", "- hosts: [web\n");
  RepositoryModelAssembler assembler;

  EXPECT_THROW(assembler.Build(Request({}, {"site.yml"})), FormatError);
}

} // namespace
} // namespace ansiviz
