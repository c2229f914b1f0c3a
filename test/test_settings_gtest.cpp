#include <gtest/gtest.h>

#include <string>

#include "excite.hh"

TEST( SettingsTest, DefaultsMatchPages ) {
  excite::Settings s;
  EXPECT_EQ( s.citation_style, excite::CitationStyle::SquareBrace );
  EXPECT_EQ( s.reference_style, excite::ReferenceStyle::DigitDot );
  EXPECT_EQ( s.order, excite::OrderPolicy::CitationFirst );
  EXPECT_EQ( s.vocabulary.paragraph_tag, "sf:p" );
  EXPECT_EQ( s.vocabulary.body_tag, "sf:text-body" );
  EXPECT_EQ( s.vocabulary.superscript_style, "SFWPCharacterStyle-50000" );
}

TEST( SettingsTest, LoadsStylesAndOrder ) {
  excite::Settings s = excite::load_settings(
    "citation style: superscript\n"
    "reference style: square-brace\n"
    "order: reference-first\n" );
  EXPECT_EQ( s.citation_style, excite::CitationStyle::Superscript );
  EXPECT_EQ( s.reference_style, excite::ReferenceStyle::SquareBrace );
  EXPECT_EQ( s.order, excite::OrderPolicy::ReferenceFirst );
}

TEST( SettingsTest, LoadsMarkupVocabulary ) {
  excite::Settings s = excite::load_settings(
    "markup:\n"
    "  body tag: body\n"
    "  paragraph tag: p\n"
    "  span tag: span\n"
    "  style attribute: class\n"
    "  superscript style: sup\n" );
  EXPECT_EQ( s.vocabulary.body_tag, "body" );
  EXPECT_EQ( s.vocabulary.paragraph_tag, "p" );
  EXPECT_EQ( s.vocabulary.span_tag, "span" );
  EXPECT_EQ( s.vocabulary.style_attribute, "class" );
  EXPECT_EQ( s.vocabulary.superscript_style, "sup" );
  // Untouched keys keep their defaults
  EXPECT_EQ( s.vocabulary.styles_tag, "sf:anon-styles" );
  EXPECT_EQ( s.citation_style, excite::CitationStyle::SquareBrace );
}

TEST( SettingsTest, AbsentKeysKeepBase ) {
  excite::Settings base;
  base.order = excite::OrderPolicy::ReferenceFirst;
  excite::Settings s = excite::load_settings( "citation style: parens\n",
    base );
  EXPECT_EQ( s.citation_style, excite::CitationStyle::Parens );
  EXPECT_EQ( s.order, excite::OrderPolicy::ReferenceFirst );
}

TEST( SettingsTest, UnsupportedStyleIsInvalidArgument ) {
  EXPECT_THROW( excite::load_settings("citation style: footnote\n"),
    std::invalid_argument );
  EXPECT_THROW( excite::load_settings("reference style: parens\n"),
    std::invalid_argument );
  EXPECT_THROW( excite::load_settings("order: alphabetical\n"),
    std::invalid_argument );
}

TEST( SettingsTest, UnknownKeysAreRejected ) {
  EXPECT_THROW( excite::load_settings("colour: red\n"), std::runtime_error );
  EXPECT_THROW( excite::load_settings("markup:\n  footer tag: f\n"),
    std::runtime_error );
  EXPECT_THROW( excite::load_settings("markup: 3\n"), std::runtime_error );
  EXPECT_THROW( excite::load_settings("- a\n- b\n"), std::runtime_error );
}
