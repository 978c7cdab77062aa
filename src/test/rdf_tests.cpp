// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

/**
 * RDF Tests
 *
 * Terms, triples, graphs and the N-Triples reader/writer
 */

#include <boost/test/unit_test.hpp>

#include <core/errors.h>
#include <rdf/graph.h>
#include <rdf/ntriples.h>
#include <rdf/term.h>

#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(rdf_tests)

/**
 * Test Suite 1: Terms
 */
BOOST_AUTO_TEST_SUITE(term_tests)

BOOST_AUTO_TEST_CASE(term_serialization) {
    BOOST_CHECK_EQUAL(CTerm::Iri("http://example.org/a").ToNTriples(), "<http://example.org/a>");
    BOOST_CHECK_EQUAL(CTerm::Blank("b0").ToNTriples(), "_:b0");
    BOOST_CHECK_EQUAL(CTerm::Literal("plain").ToNTriples(), "\"plain\"");
    BOOST_CHECK_EQUAL(CTerm::LangLiteral("chat", "fr").ToNTriples(), "\"chat\"@fr");
    BOOST_CHECK_EQUAL(CTerm::TypedLiteral("42", "http://www.w3.org/2001/XMLSchema#integer").ToNTriples(),
                      "\"42\"^^<http://www.w3.org/2001/XMLSchema#integer>");
}

BOOST_AUTO_TEST_CASE(xsd_string_is_implicit) {
    // A literal typed xsd:string is the same term as a plain literal
    CTerm typed = CTerm::TypedLiteral("x", XSD_STRING);
    BOOST_CHECK(typed == CTerm::Literal("x"));
    BOOST_CHECK_EQUAL(typed.ToNTriples(), "\"x\"");
}

BOOST_AUTO_TEST_CASE(literal_escaping) {
    BOOST_CHECK_EQUAL(CTerm::Literal("a\"b\\c\nd\re").ToNTriples(), "\"a\\\"b\\\\c\\nd\\re\"");
    // Tabs are left as-is
    BOOST_CHECK_EQUAL(EscapeLiteral("a\tb"), "a\tb");
}

BOOST_AUTO_TEST_CASE(malformed_terms_throw) {
    BOOST_CHECK_THROW(CTerm::Iri("has space").ToNTriples(), SerializationError);
    BOOST_CHECK_THROW(CTerm::Iri("").ToNTriples(), SerializationError);
    BOOST_CHECK_THROW(CTerm::Blank("bad id").ToNTriples(), SerializationError);
    BOOST_CHECK_THROW(CTerm::Blank("trailing.").ToNTriples(), SerializationError);
    BOOST_CHECK_THROW(CTerm::LangLiteral("x", "en-").ToNTriples(), SerializationError);
    BOOST_CHECK_THROW(CTerm::TypedLiteral("x", "not an iri").ToNTriples(), SerializationError);
    BOOST_CHECK_THROW(CTerm::LangLiteral("x", "").ToNTriples(), SerializationError);
    BOOST_CHECK_THROW(CTerm::TypedLiteral("x", RDF_LANGSTRING).ToNTriples(), SerializationError);
}

BOOST_AUTO_TEST_CASE(term_ordering_distinguishes_kinds) {
    CTerm iri = CTerm::Iri("x");
    CTerm blank = CTerm::Blank("x");
    CTerm literal = CTerm::Literal("x");

    BOOST_CHECK(iri != blank);
    BOOST_CHECK(blank != literal);
    BOOST_CHECK((iri < blank) != (blank < iri));
    BOOST_CHECK(CTerm::LangLiteral("x", "en") != CTerm::LangLiteral("x", "de"));
}

BOOST_AUTO_TEST_CASE(triple_validity) {
    CTerm s = CTerm::Iri("http://example.org/s");
    CTerm p = CTerm::Iri("http://example.org/p");

    BOOST_CHECK(CTriple(s, p, CTerm::Literal("o")).IsValid());
    BOOST_CHECK(CTriple(CTerm::Blank("b"), p, s).IsValid());
    BOOST_CHECK(!CTriple(CTerm::Literal("s"), p, s).IsValid());
    BOOST_CHECK(!CTriple(s, CTerm::Blank("p"), s).IsValid());
    BOOST_CHECK_THROW(CTriple(s, CTerm::Literal("p"), s).ToNTriples(), SerializationError);

    BOOST_CHECK_EQUAL(CTriple(s, p, CTerm::Literal("o")).ToNTriples(),
                      "<http://example.org/s> <http://example.org/p> \"o\" .");
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 2: Graphs
 */
BOOST_AUTO_TEST_SUITE(graph_tests)

BOOST_AUTO_TEST_CASE(graph_is_a_set) {
    CTriple t(CTerm::Iri("http://example.org/s"), CTerm::Iri("http://example.org/p"), CTerm::Literal("o"));

    CGraph graph;
    BOOST_CHECK(graph.Empty());
    BOOST_CHECK(graph.Insert(t));
    BOOST_CHECK(!graph.Insert(t));
    BOOST_CHECK_EQUAL(graph.Size(), 1U);
    BOOST_CHECK(graph.Contains(t));

    graph.Clear();
    BOOST_CHECK(graph.Empty());
}

BOOST_AUTO_TEST_CASE(graph_rejects_invalid_triples) {
    CGraph graph;
    CTriple bad(CTerm::Literal("s"), CTerm::Iri("http://example.org/p"), CTerm::Literal("o"));
    BOOST_CHECK_THROW(graph.Insert(bad), SerializationError);
    BOOST_CHECK(graph.Empty());
}

BOOST_AUTO_TEST_CASE(graph_blank_nodes) {
    CTerm p = CTerm::Iri("http://example.org/p");
    CGraph graph({CTriple(CTerm::Blank("x"), p, CTerm::Blank("y")),
                  CTriple(CTerm::Blank("y"), p, CTerm::Literal("v")),
                  CTriple(CTerm::Iri("http://example.org/s"), p, CTerm::Blank("x"))});

    std::set<std::string> blanks = graph.BlankNodes();
    BOOST_CHECK_EQUAL(blanks.size(), 2U);
    BOOST_CHECK(blanks.count("x") == 1);
    BOOST_CHECK(blanks.count("y") == 1);
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 3: N-Triples
 */
BOOST_AUTO_TEST_SUITE(ntriples_tests)

BOOST_AUTO_TEST_CASE(parse_basic_document) {
    const std::string text =
        "# provenance record\n"
        "<http://example.org/a> <http://example.org/p> \"hello\"@en .\n"
        "\n"
        "_:b1 <http://example.org/p> <http://example.org/a> . # trailing comment\n"
        "<http://example.org/a> <http://example.org/n> \"7\"^^<http://www.w3.org/2001/XMLSchema#integer> .\r\n";

    std::vector<CTriple> triples;
    std::string error;
    BOOST_REQUIRE_MESSAGE(ParseNTriples(text, triples, error), error);
    BOOST_REQUIRE_EQUAL(triples.size(), 3U);

    BOOST_CHECK(triples[0].object == CTerm::LangLiteral("hello", "en"));
    BOOST_CHECK(triples[1].subject == CTerm::Blank("b1"));
    BOOST_CHECK(triples[2].object ==
                CTerm::TypedLiteral("7", "http://www.w3.org/2001/XMLSchema#integer"));
}

BOOST_AUTO_TEST_CASE(parse_escapes) {
    const std::string text =
        "<http://example.org/a> <http://example.org/p> \"tab\\tquote\\\"nl\\n\\u00e9\" .\n";

    std::vector<CTriple> triples;
    std::string error;
    BOOST_REQUIRE_MESSAGE(ParseNTriples(text, triples, error), error);
    BOOST_REQUIRE_EQUAL(triples.size(), 1U);
    BOOST_CHECK_EQUAL(triples[0].object.GetValue(), "tab\tquote\"nl\n\xc3\xa9");
}

BOOST_AUTO_TEST_CASE(parse_blank_node_before_dot) {
    std::vector<CTriple> triples;
    std::string error;
    BOOST_REQUIRE_MESSAGE(ParseNTriples("_:a <http://example.org/p> _:b.\n", triples, error), error);
    BOOST_REQUIRE_EQUAL(triples.size(), 1U);
    BOOST_CHECK(triples[0].object == CTerm::Blank("b"));
}

BOOST_AUTO_TEST_CASE(parse_errors_report_line) {
    std::vector<CTriple> triples;
    std::string error;

    BOOST_CHECK(!ParseNTriples("<http://example.org/a> <http://example.org/p> \"x\" .\n"
                               "<http://example.org/a> <http://example.org/p> \"x\"\n",
                               triples, error));
    BOOST_CHECK(error.find("line 2") == 0);

    BOOST_CHECK(!ParseNTriples("\"lit\" <http://example.org/p> <http://example.org/o> .", triples, error));
    BOOST_CHECK(!ParseNTriples("<http://example.org/a> _:p <http://example.org/o> .", triples, error));
    BOOST_CHECK(!ParseNTriples("<http://example.org/a> <http://example.org/p> \"open .", triples, error));
    BOOST_CHECK(!ParseNTriples("<http://example.org/a> <http://example.org/p> <bad iri> .", triples, error));
    BOOST_CHECK(!ParseNTriples("<http://example.org/a> <http://example.org/p> \"x\" . junk", triples, error));
}

BOOST_AUTO_TEST_CASE(parse_rejects_bad_language_tags) {
    std::vector<CTriple> triples;
    std::string error;

    BOOST_CHECK(!ParseNTriples("<http://example.org/a> <http://example.org/p> \"x\"@ .\n", triples, error));
    BOOST_CHECK(error.find("line 1") == 0);
    BOOST_CHECK(error.find("language tag") != std::string::npos);

    BOOST_CHECK(!ParseNTriples("<http://example.org/a> <http://example.org/p> \"x\"@en- .\n", triples, error));
    BOOST_CHECK(!ParseNTriples("<http://example.org/a> <http://example.org/p> "
                               "\"x\"^^<http://www.w3.org/1999/02/22-rdf-syntax-ns#langString> .\n",
                               triples, error));

    BOOST_REQUIRE_MESSAGE(ParseNTriples("<http://example.org/a> <http://example.org/p> \"x\"@en-GB .\n",
                                        triples, error), error);
    BOOST_CHECK(triples[0].object == CTerm::LangLiteral("x", "en-GB"));
}

BOOST_AUTO_TEST_CASE(serialize_then_parse_preserves_graph) {
    CTerm p = CTerm::Iri("http://example.org/p");
    CGraph graph({CTriple(CTerm::Blank("x"), p, CTerm::Literal("line\nbreak \"quoted\"")),
                  CTriple(CTerm::Iri("http://example.org/s"), p, CTerm::LangLiteral("v", "en-GB"))});

    std::string text = SerializeNTriples(graph);
    CGraph parsed;
    std::string error;
    BOOST_REQUIRE_MESSAGE(ParseNTriples(text, parsed, error), error);
    BOOST_CHECK(parsed == graph);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
