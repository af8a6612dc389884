#include "Semantic/ConceptGraph.h"
#include <gtest/gtest.h>

using namespace schemasub::semantic;

static const char *QK = "http://qudt.org/vocab/quantitykind/";

static Triple broader(const std::string &N, const std::string &B) {
  return Triple{N, vocab::SkosBroader, B};
}

TEST(ConceptGraph, NormalizeIRI) {
  EXPECT_EQ(normalizeIRI("quantitykind:Length"),
            std::string(QK) + "Length");
  EXPECT_EQ(normalizeIRI("foaf:Person"), "http://xmlns.com/foaf/0.1/Person");
  EXPECT_EQ(normalizeIRI("ex:Employee"), "http://example.org/Employee");
  EXPECT_EQ(normalizeIRI("http://example.org/x"), "http://example.org/x");
  EXPECT_EQ(normalizeIRI("unknown:Thing"), "unknown:Thing");
  EXPECT_EQ(normalizeIRI("Plain"), "Plain");
}

TEST(ConceptGraph, NamespaceOf) {
  EXPECT_EQ(namespaceOf(std::string(QK) + "Length"), QK);
  EXPECT_EQ(namespaceOf("http://www.w3.org/2004/02/skos/core#broader"),
            "http://www.w3.org/2004/02/skos/core#");
  EXPECT_EQ(namespaceOf("Plain"), "");
}

TEST(ConceptGraph, IndexesTriples) {
  TripleStore G;
  G.add(broader("a", "b"));
  G.add(broader("a", "c"));
  G.add(broader("a", "b"));
  EXPECT_EQ(G.size(), 2u);
  EXPECT_TRUE(G.contains(broader("a", "c")));
  EXPECT_EQ(G.objects("a", vocab::SkosBroader),
            (std::vector<std::string>{"b", "c"}));
  EXPECT_EQ(G.subjects(vocab::SkosBroader, "b"),
            (std::vector<std::string>{"a"}));
  EXPECT_TRUE(G.objects("b", vocab::SkosBroader).empty());
  EXPECT_TRUE(G.objects("a", vocab::RdfType).empty());
}

TEST(ConceptGraph, PathQueryFollowsHierarchyEdges) {
  TripleStore G;
  G.add(broader("Length", "Extent"));
  G.add(Triple{"Extent", vocab::RdfsSubClassOf, "Quantity"});
  G.add(Triple{"Thing", vocab::SkosNarrower, "Quantity"});
  G.add(Triple{"Length", vocab::RdfType, "Concept"});

  EXPECT_EQ(G.queryPath("Length", "Extent"), std::optional<bool>(true));
  EXPECT_EQ(G.queryPath("Length", "Quantity"), std::optional<bool>(true));
  EXPECT_EQ(G.queryPath("Length", "Thing"), std::optional<bool>(true));
  EXPECT_EQ(G.queryPath("Length", "Length"), std::optional<bool>(true));
  EXPECT_EQ(G.queryPath("Quantity", "Length"), std::optional<bool>(false));
  // rdf:type is not a hierarchy edge.
  EXPECT_EQ(G.queryPath("Length", "Concept"), std::optional<bool>(false));
}

TEST(ConceptGraph, CyclesAndUpdates) {
  TripleStore G;
  G.add(broader("a", "b"));
  G.add(broader("b", "c"));
  G.add(broader("c", "a"));
  EXPECT_EQ(G.queryPath("a", "c"), std::optional<bool>(true));
  EXPECT_EQ(G.queryPath("c", "b"), std::optional<bool>(true));
  EXPECT_EQ(G.queryPath("a", "d"), std::optional<bool>(false));

  // a memoized closure is recomputed after an insertion.
  G.add(broader("c", "d"));
  EXPECT_EQ(G.queryPath("a", "d"), std::optional<bool>(true));
}
