#include <gtest/gtest.h>

#include <string>

#include "excite.hh"

using excite::CitationStyle;
using excite::ReferenceStyle;
using excite::Renderer;
using excite::markup::Node;

namespace {

  excite::Reference make_reference() {
    // <sf:p>\bibitem{a} Knuth, <sf:span>The Art</sf:span>, 1968.</sf:p>
    excite::Reference r;
    r.text = "Knuth, The Art, 1968.";
    r.fragment = Node( "sf:p" );
    r.fragment.text = "\\bibitem{a} Knuth, ";
    r.fragment.tail = "\n";
    Node& span = r.fragment.append( Node("sf:span") );
    span.set_attribute( "sf:style", "italic" );
    span.text = "The Art";
    span.tail = ", 1968.";
    return r;
  }

} // namespace

TEST( RendererTest, SquareBraceCitation ) {
  Renderer renderer;
  excite::RenderedCitation r = renderer.render_citation(
    CitationStyle::SquareBrace, 3 );
  EXPECT_EQ( r.text, "[3]" );
  EXPECT_FALSE( r.element.has_value() );
}

TEST( RendererTest, ParensCitation ) {
  Renderer renderer;
  excite::RenderedCitation r = renderer.render_citation(
    CitationStyle::Parens, 12 );
  EXPECT_EQ( r.text, "(12)" );
  EXPECT_FALSE( r.element.has_value() );
}

TEST( RendererTest, SuperscriptCitationIsStyledSpan ) {
  excite::markup::Vocabulary vocab;
  vocab.superscript_style = "CharStyle-7";
  Renderer renderer( vocab );

  excite::RenderedCitation r = renderer.render_citation(
    CitationStyle::Superscript, 2 );
  EXPECT_EQ( r.text, "2" );
  ASSERT_TRUE( r.element.has_value() );
  EXPECT_EQ( r.element->tag, "sf:span" );
  EXPECT_EQ( r.element->text, "2" );
  ASSERT_NE( r.element->attribute("sf:style"), nullptr );
  EXPECT_EQ( *r.element->attribute("sf:style"), "CharStyle-7" );
  EXPECT_TRUE( r.element->children.empty() );
}

TEST( RendererTest, ReferencePrefixes ) {
  EXPECT_EQ( Renderer::reference_prefix(ReferenceStyle::DigitDot, 1), "1. " );
  EXPECT_EQ( Renderer::reference_prefix(ReferenceStyle::SquareBrace, 10),
    "[10] " );
}

TEST( RendererTest, ReferenceKeepsNestedStructure ) {
  Renderer renderer;
  excite::Reference content = make_reference();
  excite::BibEntry entry{ "a", 4, &content };

  Node out = renderer.render_reference( ReferenceStyle::DigitDot, entry );
  EXPECT_EQ( out.tag, "sf:p" );
  EXPECT_EQ( out.text, "4. Knuth, " );
  EXPECT_EQ( out.tail, "\n" );
  ASSERT_EQ( out.children.size(), 1u );
  EXPECT_EQ( out.children[0]->text, "The Art" );
  EXPECT_EQ( out.children[0]->tail, ", 1968." );
  ASSERT_NE( out.children[0]->attribute("sf:style"), nullptr );
  EXPECT_EQ( excite::markup::full_text(out), "4. Knuth, The Art, 1968." );

  // The stored fragment is not modified
  EXPECT_EQ( content.fragment.text, "\\bibitem{a} Knuth, " );
}

TEST( RendererTest, SquareBraceReference ) {
  Renderer renderer;
  excite::Reference content = make_reference();
  excite::BibEntry entry{ "a", 2, &content };

  Node out = renderer.render_reference( ReferenceStyle::SquareBrace, entry );
  EXPECT_EQ( out.text, "[2] Knuth, " );
}

TEST( RendererTest, ReferenceMarkerInsideChild ) {
  excite::Reference content;
  content.fragment = Node( "sf:p" );
  Node& span = content.fragment.append( Node("sf:span") );
  span.text = "\\bibitem{b}Text B";
  excite::BibEntry entry{ "b", 1, &content };

  Node out = Renderer().render_reference( ReferenceStyle::DigitDot, entry );
  EXPECT_EQ( out.children[0]->text, "1. Text B" );
}

TEST( RendererTest, ReferenceOnlyReplacesItsOwnLabel ) {
  excite::Reference content;
  content.fragment = Node( "sf:p" );
  content.fragment.text = "\\bibitem{ab} see \\bibitem{a}";
  excite::BibEntry entry{ "a", 1, &content };

  Node out = Renderer().render_reference( ReferenceStyle::DigitDot, entry );
  EXPECT_EQ( out.text, "\\bibitem{ab} see 1. " );
}

TEST( RendererTest, ReferenceText ) {
  excite::Reference content = make_reference();
  excite::BibEntry entry{ "a", 1, &content };
  EXPECT_EQ( Renderer().render_reference_text(ReferenceStyle::DigitDot, entry),
    "1. Knuth, The Art, 1968." );
}

TEST( RendererTest, EntryWithoutReferenceIsRejected ) {
  excite::BibEntry entry{ "a", 1, nullptr };
  EXPECT_THROW( Renderer().render_reference(ReferenceStyle::DigitDot, entry),
    std::invalid_argument );
}

TEST( RendererTest, StyleNames ) {
  EXPECT_EQ( excite::parse_citation_style("square-brace"),
    CitationStyle::SquareBrace );
  EXPECT_EQ( excite::parse_citation_style("superscript"),
    CitationStyle::Superscript );
  EXPECT_EQ( excite::parse_citation_style("parens"), CitationStyle::Parens );
  EXPECT_EQ( excite::parse_reference_style("digit-dot"),
    ReferenceStyle::DigitDot );
  EXPECT_EQ( excite::parse_order_policy("reference-first"),
    excite::OrderPolicy::ReferenceFirst );
  EXPECT_STREQ( excite::to_string(CitationStyle::Parens), "parens" );
  EXPECT_STREQ( excite::to_string(excite::OrderPolicy::CitationFirst),
    "citation-first" );

  EXPECT_THROW( excite::parse_citation_style("digit-dot"),
    std::invalid_argument );
  EXPECT_THROW( excite::parse_reference_style("parens"),
    std::invalid_argument );
  EXPECT_THROW( excite::parse_order_policy("alphabetical"),
    std::invalid_argument );
}
