/**
 * @file test_symbol_registry.cpp
 * @brief Unit tests for collision-free symbol generation
 */

#include <cadence/core/Error.hpp>
#include <cadence/symbolic/Algebra.hpp>
#include <cadence/symbolic/SymbolRegistry.hpp>

#include <gtest/gtest.h>

#include <set>

namespace cadence {
namespace {

TEST(SymbolRegistry, RepeatedGenerateReturnsSameSymbol) {
    SymbolRegistry registry;
    const Symbol &a = registry.Generate("bicycle.front_wheel", "r", SymbolKind::Constant);
    const Symbol &b = registry.Generate("bicycle.front_wheel", "r", SymbolKind::Constant);

    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.identifier, "bicycle.front_wheel.r");
    EXPECT_TRUE(algebra::IsSameSymbol(a.value, b.value));
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(SymbolRegistry, TriplesDifferingInAnyFieldNeverCollide) {
    SymbolRegistry registry;
    std::set<std::string> identifiers;
    identifiers.insert(registry.Generate("bicycle.front_wheel", "q", SymbolKind::Coordinate).identifier);
    identifiers.insert(registry.Generate("bicycle.rear_wheel", "q", SymbolKind::Coordinate).identifier);
    identifiers.insert(registry.Generate("bicycle.front_wheel", "u", SymbolKind::Coordinate).identifier);
    identifiers.insert(registry.Generate("bicycle.front_wheel", "q", SymbolKind::Speed).identifier);
    identifiers.insert(registry.Generate("bicycle.front_wheel", "q", SymbolKind::Constant).identifier);
    identifiers.insert(registry.Generate("bicycle.front_wheel", "q", SymbolKind::Auxiliary).identifier);

    EXPECT_EQ(identifiers.size(), 6u);
    EXPECT_EQ(registry.Size(), 6u);
}

TEST(SymbolRegistry, SameNameUnderTwoKindsStaysApart) {
    SymbolRegistry registry;
    const Symbol &coordinate = registry.Generate("disc", "x", SymbolKind::Coordinate);
    const Symbol &constant = registry.Generate("disc", "x", SymbolKind::Constant);

    EXPECT_NE(&coordinate, &constant);
    EXPECT_FALSE(algebra::IsSameSymbol(coordinate.value, constant.value));
    EXPECT_EQ(coordinate.identifier, "disc.x[q]");
    EXPECT_EQ(constant.identifier, "disc.x");
    EXPECT_TRUE(registry.Has("disc", "x", SymbolKind::Coordinate));
    EXPECT_TRUE(registry.Has("disc", "x", SymbolKind::Constant));
    EXPECT_FALSE(registry.Has("disc", "x", SymbolKind::Speed));
}

TEST(SymbolRegistry, IdentifierCarriesKindSuffix) {
    EXPECT_EQ(SymbolRegistry::MakeIdentifier("disc", "q1", SymbolKind::Coordinate), "disc.q1[q]");
    EXPECT_EQ(SymbolRegistry::MakeIdentifier("disc", "u1", SymbolKind::Speed), "disc.u1[u]");
    EXPECT_EQ(SymbolRegistry::MakeIdentifier("disc", "T", SymbolKind::Auxiliary), "disc.T[aux]");
    EXPECT_EQ(SymbolRegistry::MakeIdentifier("disc", "r", SymbolKind::Constant), "disc.r");
}

TEST(SymbolRegistry, TimeVaryingSymbolsGetDerivatives) {
    SymbolRegistry registry;
    const Symbol &q = registry.Generate("pendulum.joint", "q", SymbolKind::Coordinate);
    const Symbol &m = registry.Generate("pendulum.link", "m", SymbolKind::Constant);

    EXPECT_TRUE(q.IsTimeVarying());
    EXPECT_FALSE(m.IsTimeVarying());
    ASSERT_EQ(registry.Derivatives().Size(), 1u);
    EXPECT_TRUE(algebra::IsSameSymbol(registry.Derivatives().Values()[0], q.value));

    // d/dt (m * q^2) = 2 m q q'
    SymbolicScalar expr = m.value * q.value * q.value;
    SymbolicScalar expected = 2.0 * m.value * q.value * q.rate;
    EXPECT_TRUE(algebra::IsZeroAt(registry.Derivatives().Dt(expr) - expected));
}

TEST(SymbolRegistry, InvalidIdentifiersRejected) {
    SymbolRegistry registry;
    EXPECT_THROW(registry.Generate("bicycle", "front wheel", SymbolKind::Constant), DefinitionError);
    EXPECT_THROW(registry.Generate("bicycle", "1r", SymbolKind::Constant), DefinitionError);
    EXPECT_THROW(registry.Generate("bicycle..wheel", "r", SymbolKind::Constant), DefinitionError);
    EXPECT_THROW(registry.Generate("", "r", SymbolKind::Constant), DefinitionError);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(SymbolRegistry, DescriptionFilledInLater) {
    SymbolRegistry registry;
    registry.Generate("disc", "q1", SymbolKind::Coordinate);
    const Symbol &q = registry.Generate("disc", "q1", SymbolKind::Coordinate, "contact x");
    EXPECT_EQ(q.description, "contact x");

    registry.Generate("disc", "q1", SymbolKind::Coordinate, "something else");
    EXPECT_EQ(q.description, "contact x");
}

TEST(SymbolRegistry, KindViewsKeepCreationOrder) {
    SymbolRegistry registry;
    registry.Generate("a", "q2", SymbolKind::Coordinate);
    registry.Generate("a", "m", SymbolKind::Constant);
    registry.Generate("b", "q1", SymbolKind::Coordinate);

    auto coordinates = registry.OfKind(SymbolKind::Coordinate);
    ASSERT_EQ(coordinates.size(), 2u);
    EXPECT_EQ(coordinates[0]->identifier, "a.q2[q]");
    EXPECT_EQ(coordinates[1]->identifier, "b.q1[q]");
    EXPECT_EQ(coordinates[1]->owner_path, "b");

    EXPECT_TRUE(registry.Has("a", "m", SymbolKind::Constant));
    EXPECT_FALSE(registry.Has("a", "m", SymbolKind::Auxiliary));
    EXPECT_THROW(static_cast<void>(registry.Get("a", "m", SymbolKind::Auxiliary)),
                 DefinitionError);
}

} // namespace
} // namespace cadence
