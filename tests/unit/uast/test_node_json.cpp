#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "uast_bridge/test_support/tree_helpers.hpp"
#include "uast_bridge/uast/node_json.hpp"

using namespace uast_bridge;
using json = nlohmann::json;

namespace
{

std::filesystem::path write_temp(const std::string & name, const std::string & content)
{
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

}  // namespace

TEST(NodeJson, SerializesFields)
{
  const auto t = test_support::make_sample_tree();
  const json j = to_json(*t.function_def);

  EXPECT_EQ(j["InternalType"], "FunctionDef");
  EXPECT_EQ(j["Token"], "main");
  EXPECT_EQ(j["Roles"], json::array({1}));
  EXPECT_EQ(j["Properties"], (json{{"a", "1"}, {"b", "2"}}));
  EXPECT_EQ(j["StartPosition"], (json{{"Offset", 0}, {"Line", 1}, {"Col", 1}}));
  EXPECT_EQ(j["EndPosition"]["Offset"], 38);
  ASSERT_TRUE(j["Children"].is_array());
  EXPECT_EQ(j["Children"].size(), 2U);
  EXPECT_EQ(j["Children"][1]["Children"][0]["Token"], "y");
}

TEST(NodeJson, OmitsEmptyFields)
{
  const auto t = test_support::make_sample_tree();
  const json j = to_json(*t.comment);

  EXPECT_EQ(j["InternalType"], "Comment");
  EXPECT_FALSE(j.contains("Roles"));
  EXPECT_FALSE(j.contains("Properties"));
  EXPECT_FALSE(j.contains("StartPosition"));
  EXPECT_FALSE(j.contains("Children"));

  EXPECT_FALSE(to_json(*t.root).contains("Token"));
}

TEST(NodeJson, SummaryReplacesChildrenWithCount)
{
  const auto t = test_support::make_sample_tree();
  const json j = to_json_summary(*t.root);

  EXPECT_FALSE(j.contains("Children"));
  EXPECT_EQ(j["ChildrenCount"], 2);
  EXPECT_EQ(to_json_summary(*t.ident_y)["ChildrenCount"], 0);
}

TEST(NodeJson, ParsesTree)
{
  const json j = json::parse(R"({
    "InternalType": "Module",
    "Children": [
      {
        "InternalType": "Assign",
        "Token": "=",
        "Roles": [3, 4],
        "Properties": {"op": "eq"},
        "StartPosition": {"Offset": 4, "Line": 2, "Col": 1},
        "Children": [{"InternalType": "Name", "Token": "v"}]
      },
      {"InternalType": "Pass", "EndPosition": null}
    ]
  })");

  const NodePtr root = node_from_json(j);
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->internal_type, "Module");
  EXPECT_EQ(count_nodes(*root), 4U);

  const NodePtr & assign = root->children[0];
  EXPECT_EQ(assign->token, "=");
  EXPECT_EQ(assign->roles, (std::vector<Role>{3, 4}));
  EXPECT_EQ(assign->properties.at("op"), "eq");
  ASSERT_TRUE(assign->start_position.has_value());
  EXPECT_EQ(*assign->start_position, (Position{4, 2, 1}));
  EXPECT_FALSE(assign->end_position.has_value());
  EXPECT_EQ(assign->children[0]->token, "v");

  EXPECT_FALSE(root->children[1]->end_position.has_value());
}

TEST(NodeJson, SerializedTreeParsesBack)
{
  const auto t = test_support::make_sample_tree();
  const NodePtr copy = node_from_json(to_json(*t.root));
  EXPECT_EQ(to_json(*copy), to_json(*t.root));
}

TEST(NodeJson, RejectsMalformedNodes)
{
  EXPECT_THROW((void)node_from_json(json::array()), std::runtime_error);
  EXPECT_THROW((void)node_from_json(json{{"Children", "nope"}}), std::runtime_error);
  EXPECT_THROW((void)node_from_json(json{{"Children", json::array({1})}}), std::runtime_error);
  EXPECT_THROW((void)node_from_json(json{{"Token", 5}}), json::exception);
}

TEST(NodeJson, LoadTreeFromFile)
{
  const auto path = write_temp(
    "uast_bridge_test_tree.json", R"({"InternalType": "File", "Children": [{"InternalType": "X"}]})");
  const NodePtr root = load_tree(path);
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(count_nodes(*root), 2U);
  std::filesystem::remove(path);
}

TEST(NodeJson, LoadTreeErrors)
{
  EXPECT_THROW((void)load_tree("/nonexistent/uast_bridge/tree.json"), std::runtime_error);

  const auto path = write_temp("uast_bridge_test_bad.json", "{ not json");
  try {
    (void)load_tree(path);
    FAIL() << "expected std::runtime_error";
  } catch (const std::runtime_error & e) {
    EXPECT_NE(std::string(e.what()).find("failed to load tree"), std::string::npos) << e.what();
  }
  std::filesystem::remove(path);
}
