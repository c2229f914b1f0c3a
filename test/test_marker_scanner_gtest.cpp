#include <gtest/gtest.h>

#include <string>

#include "excite.hh"

TEST( MarkerScannerTest, FindsEveryCitationInOrder ) {
  auto found = excite::find_citations(
    R"(See \cite{b} and \cite{a}, then \cite{b} again.)" );

  ASSERT_EQ( found.size(), 3u );
  EXPECT_EQ( found[0].label, "b" );
  EXPECT_EQ( found[1].label, "a" );
  EXPECT_EQ( found[2].label, "b" );
  EXPECT_EQ( found[0].span, R"(\cite{b})" );
  EXPECT_EQ( found[0].position, 4u );
}

TEST( MarkerScannerTest, AdjacentCitations ) {
  auto found = excite::find_citations( R"(\cite{one}\cite{two_2})" );
  ASSERT_EQ( found.size(), 2u );
  EXPECT_EQ( found[0].label, "one" );
  EXPECT_EQ( found[1].label, "two_2" );
}

TEST( MarkerScannerTest, IgnoresMalformedCitations ) {
  EXPECT_TRUE( excite::find_citations(R"(\cite{})").empty() );
  EXPECT_TRUE( excite::find_citations(R"(\cite{a b})").empty() );
  EXPECT_TRUE( excite::find_citations(R"(\cite{a-b})").empty() );
  EXPECT_TRUE( excite::find_citations(R"(cite{a})").empty() );
  EXPECT_TRUE( excite::find_citations(R"(\cite[p. 4]{a})").empty() );
  EXPECT_TRUE( excite::find_citations("no markers here").empty() );
}

TEST( MarkerScannerTest, BibItemCapturesTrimmedText ) {
  auto hit = excite::find_bibitem( "\\bibitem{smith2020}   Smith, J. 2020.  " );
  ASSERT_TRUE( hit.has_value() );
  EXPECT_EQ( hit->marker.label, "smith2020" );
  EXPECT_EQ( hit->text, "Smith, J. 2020." );
  EXPECT_EQ( hit->marker.position, 0u );
}

TEST( MarkerScannerTest, BibItemWithoutText ) {
  auto hit = excite::find_bibitem( R"(\bibitem{a})" );
  ASSERT_TRUE( hit.has_value() );
  EXPECT_EQ( hit->marker.label, "a" );
  EXPECT_EQ( hit->text, "" );
}

TEST( MarkerScannerTest, BibItemTextStopsAtEndOfLine ) {
  auto hit = excite::find_bibitem( "\\bibitem{a} First line\nsecond line" );
  ASSERT_TRUE( hit.has_value() );
  EXPECT_EQ( hit->text, "First line" );
}

TEST( MarkerScannerTest, LongBibItemText ) {
  const std::string entry( 100000, 'x' );
  auto hit = excite::find_bibitem( "\\bibitem{a} " + entry + "\nnext" );
  ASSERT_TRUE( hit.has_value() );
  EXPECT_EQ( hit->marker.span, "\\bibitem{a}" );
  EXPECT_EQ( hit->text, entry );
}

TEST( MarkerScannerTest, OnlyFirstBibItemIsHonored ) {
  auto hit = excite::find_bibitem(
    "\\bibitem{first} One\n\\bibitem{second} Two" );
  ASSERT_TRUE( hit.has_value() );
  EXPECT_EQ( hit->marker.label, "first" );
}

TEST( MarkerScannerTest, ScanReportsBothKinds ) {
  excite::MarkerScan scan = excite::scan_markers(
    R"(\bibitem{a} As argued in \cite{b}.)" );
  ASSERT_EQ( scan.citations.size(), 1u );
  EXPECT_EQ( scan.citations[0].label, "b" );
  ASSERT_TRUE( scan.bibitem.has_value() );
  EXPECT_EQ( scan.bibitem->marker.label, "a" );
}

TEST( MarkerScannerTest, ScanOfPlainText ) {
  excite::MarkerScan scan = excite::scan_markers( "Plain paragraph." );
  EXPECT_TRUE( scan.citations.empty() );
  EXPECT_FALSE( scan.bibitem.has_value() );
}
