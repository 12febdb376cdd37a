//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Facet/Testing/GTest.h>

#include <Facet/Writer/IndexRegistry.h>
#include <Facet/Writer/NativeDocument.h>
#include <Facet/Writer/Property.h>

namespace {

using facet::writer::DefinitionKind;
using facet::writer::IndexRegistry;
using facet::writer::Mesh;
using facet::writer::NativeDocument;
using facet::writer::Node;

class IndexRegistryTest : public testing::Test {
protected:
  NativeDocument document_;
  IndexRegistry registry_ { document_ };
};

//! Registering the same object twice returns one index and one definition.
NOLINT_TEST_F(IndexRegistryTest, Register_Twice_ReturnsSameIndex)
{
  // Arrange
  const Node node("root");

  // Act
  const auto first = registry_.Register(DefinitionKind::kNode, node);
  const auto second = registry_.Register(DefinitionKind::kNode, node);

  // Assert
  EXPECT_EQ(first, 0U);
  EXPECT_EQ(second, first);
  EXPECT_EQ(document_.DefinitionCount(DefinitionKind::kNode), 1U);
  EXPECT_EQ(registry_.Count(DefinitionKind::kNode), 1U);
}

//! Distinct objects get consecutive indices in visit order.
NOLINT_TEST_F(IndexRegistryTest, Register_DistinctObjects_AppendInOrder)
{
  const Node a("a");
  const Node b("b");
  const Node c("c");

  EXPECT_EQ(registry_.Register(DefinitionKind::kNode, a), 0U);
  EXPECT_EQ(registry_.Register(DefinitionKind::kNode, b), 1U);
  EXPECT_EQ(registry_.Register(DefinitionKind::kNode, c), 2U);
  EXPECT_EQ(registry_.Register(DefinitionKind::kNode, b), 1U);
  EXPECT_EQ(document_.DefinitionCount(DefinitionKind::kNode), 3U);
}

//! Each kind has its own index space.
NOLINT_TEST_F(IndexRegistryTest, Register_DifferentKinds_IndependentIndices)
{
  const Node node("node");
  const Mesh mesh("mesh");

  EXPECT_EQ(registry_.Register(DefinitionKind::kNode, node), 0U);
  EXPECT_EQ(registry_.Register(DefinitionKind::kMesh, mesh), 0U);
  EXPECT_FALSE(registry_.Contains(DefinitionKind::kMesh, node));
  EXPECT_FALSE(registry_.Contains(DefinitionKind::kNode, mesh));
}

//! The same object may be registered under several kinds.
NOLINT_TEST_F(IndexRegistryTest, Register_SameObjectTwoKinds_TracksBoth)
{
  const Node other("other");
  const Node node("node");
  registry_.Register(DefinitionKind::kNode, other);

  EXPECT_EQ(registry_.Register(DefinitionKind::kNode, node), 1U);
  EXPECT_EQ(registry_.Register(DefinitionKind::kCamera, node), 0U);
  EXPECT_EQ(registry_.IndexOf(DefinitionKind::kNode, node), 1U);
  EXPECT_EQ(registry_.IndexOf(DefinitionKind::kCamera, node), 0U);
}

//! Unregistered objects have no index.
NOLINT_TEST_F(IndexRegistryTest, IndexOf_Unregistered_ReturnsNullopt)
{
  const Node node("node");

  EXPECT_FALSE(registry_.IndexOf(DefinitionKind::kNode, node).has_value());
  EXPECT_EQ(document_.DefinitionCount(DefinitionKind::kNode), 0U);
}

//! New indices follow the current array length, including foreign entries.
NOLINT_TEST_F(IndexRegistryTest, Register_AfterForeignAppend_UsesArrayLength)
{
  // Arrange
  document_.Definitions(DefinitionKind::kNode)
    .push_back(nlohmann::json { { "name", "appended by driver" } });
  const Node node("node");

  // Act
  const auto index = registry_.Register(DefinitionKind::kNode, node);

  // Assert
  EXPECT_EQ(index, 1U);
  EXPECT_EQ(document_.DefinitionCount(DefinitionKind::kNode), 2U);
}

//! Placeholders are empty objects the caller fills in later.
NOLINT_TEST_F(IndexRegistryTest, Register_AppendsEmptyPlaceholder)
{
  const Mesh mesh("mesh");

  const auto index = registry_.Register(DefinitionKind::kMesh, mesh);
  auto& def = document_.Definitions(DefinitionKind::kMesh).at(index);
  EXPECT_TRUE(def.is_object());
  EXPECT_TRUE(def.empty());

  def["name"] = mesh.Name();
  EXPECT_EQ(registry_.Register(DefinitionKind::kMesh, mesh), index);
  EXPECT_EQ(document_.Definitions(DefinitionKind::kMesh).at(index)["name"],
    "mesh");
}

} // namespace
