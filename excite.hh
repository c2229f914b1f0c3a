//  excite: external citation processor
//
//  Rewrites LaTeX-style citation markers (\cite{label}) and bibliography
//  entry markers (\bibitem{label} text) embedded in the paragraphs of a
//  markup document into numbered citations and a numbered bibliography.
//
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "markup.hh"

namespace excite {

  // Rendering of an inline citation
  enum class CitationStyle { SquareBrace, Superscript, Parens };

  // Rendering of the marker that opens a bibliography entry
  enum class ReferenceStyle { SquareBrace, DigitDot };

  // Whether sequence numbers follow the first citation or the first
  // reference of each label
  enum class OrderPolicy { CitationFirst, ReferenceFirst };

  const char* to_string( CitationStyle style );
  const char* to_string( ReferenceStyle style );
  const char* to_string( OrderPolicy order );

  // Name lookups; unsupported names throw std::invalid_argument
  CitationStyle parse_citation_style( const std::string& name );
  ReferenceStyle parse_reference_style( const std::string& name );
  OrderPolicy parse_order_policy( const std::string& name );

  // A label was given a bibliography entry more than once
  class DuplicateReferenceError : public std::runtime_error {
  public:
    explicit DuplicateReferenceError( const std::string& label );
    const std::string& label() const { return label_; }

  private:
    std::string label_;
  };

  // Cited labels without a bibliography entry (and bibliography entries
  // that are never cited) after a full scan
  class MissingReferenceError : public std::runtime_error {
  public:
    MissingReferenceError( std::set< std::string > missing,
      std::set< std::string > uncited );
    const std::set< std::string >& missing_labels() const { return missing_; }
    const std::set< std::string >& uncited_labels() const { return uncited_; }

  private:
    static std::string describe( const std::set< std::string >& missing,
      const std::set< std::string >& uncited );

    std::set< std::string > missing_;
    std::set< std::string > uncited_;
  };

  // Content of one bibliography entry
  struct Reference {
    // Text following the marker, with surrounding whitespace trimmed
    std::string text;
    // Copy of the whole paragraph that carried the marker
    markup::Node fragment;
  };

  struct BibEntry {
    std::string label;
    std::size_t index = 0;
    const Reference* reference = nullptr;
  };

  // Ordering table and reference store. Sequence numbers start at 1, are
  // assigned on first sighting of a label under the order policy, and are
  // never reassigned.
  class Bibliography {
  public:
    explicit Bibliography( OrderPolicy order = OrderPolicy::CitationFirst )
      : order_policy_( order ) {}

    void add_citation( const std::string& label );

    // Throws DuplicateReferenceError if label already has a reference
    void add_reference( const std::string& label, Reference content );

    // Throws std::out_of_range for a label that was never ordered
    std::size_t index_of( const std::string& label ) const;

    // Throws std::out_of_range unless 1 <= index <= count()
    BibEntry entry_by_index( std::size_t index ) const;

    // True iff the set of cited labels equals the set of referenced labels
    bool is_consistent() const;

    // max(ordered labels, referenced labels); the two agree when consistent
    std::size_t count() const;

    std::set< std::string > missing_references() const;
    std::set< std::string > uncited_references() const;

    const std::vector< std::string >& citations() const { return citations_; }
    OrderPolicy order_policy() const { return order_policy_; }

  private:
    void maybe_update_order( const std::string& label );

    OrderPolicy order_policy_;

    // label -> sequence number, and sequence number - 1 -> label
    std::unordered_map< std::string, std::size_t > order_;
    std::vector< std::string > ordered_labels_;

    // Every citation occurrence in scan order, duplicates included
    std::vector< std::string > citations_;

    std::unordered_map< std::string, Reference > references_;
  };

  // A marker found in a paragraph's text
  struct MarkerOccurrence {
    std::string label;
    std::string span; // full matched text
    std::size_t position = 0;
  };

  struct BibItemOccurrence {
    MarkerOccurrence marker;
    std::string text; // trimmed text after the marker, up to end of line
  };

  struct MarkerScan {
    std::vector< MarkerOccurrence > citations;
    std::optional< BibItemOccurrence > bibitem;
  };

  // All \cite{label} markers, in order
  std::vector< MarkerOccurrence > find_citations( const std::string& text );

  // The first \bibitem{label} marker, if any
  std::optional< BibItemOccurrence > find_bibitem( const std::string& text );

  MarkerScan scan_markers( const std::string& text );

  // A rendered citation: plain text, or an inline element carrying the
  // citation when the style needs markup
  struct RenderedCitation {
    std::string text;
    std::optional< markup::Node > element;
  };

  // Pure rendering functions. The vocabulary supplies the span tag and the
  // character style used by superscript citations.
  class Renderer {
  public:
    explicit Renderer( markup::Vocabulary vocab = markup::Vocabulary() )
      : vocab_( std::move(vocab) ) {}

    RenderedCitation render_citation( CitationStyle style,
      std::size_t index ) const;

    // Copy of the entry's fragment with its \bibitem marker replaced by the
    // numbered prefix. The rest of the fragment's structure is untouched.
    markup::Node render_reference( ReferenceStyle style,
      const BibEntry& entry ) const;

    // Plain-text form: prefix followed by the trimmed reference text
    std::string render_reference_text( ReferenceStyle style,
      const BibEntry& entry ) const;

    static std::string reference_prefix( ReferenceStyle style,
      std::size_t index );

    const markup::Vocabulary& vocabulary() const { return vocab_; }

  private:
    markup::Vocabulary vocab_;
  };

  // Counts reported by a successful run
  struct Summary {
    std::size_t citations = 0; // citation occurrences
    std::size_t references = 0; // bibliography entries
    std::size_t citation_nodes = 0; // paragraphs rewritten for citations
  };

  class DocumentProcessor {
  public:
    enum class Stage {
      Idle,
      Scanning,
      Validating,
      RewritingCitations,
      RewritingReferences,
      Done,
      Failed
    };

    // nodes: the document's text-bearing nodes in document order
    explicit DocumentProcessor( std::vector< markup::Node* > nodes,
      markup::Vocabulary vocab = markup::Vocabulary() )
      : nodes_( std::move(nodes) ), renderer_( std::move(vocab) ) {}

    // Scan, validate, then rewrite citations and bibliography entries in
    // place. On failure the nodes are left untouched.
    Summary process_citations( CitationStyle citation_style,
      ReferenceStyle reference_style, OrderPolicy order );

    // Same as above with style names. Unsupported names throw
    // std::invalid_argument before anything is scanned.
    Summary process_citations( const std::string& citation_style,
      const std::string& reference_style, const std::string& order );

    Stage stage() const { return stage_; }

  private:
    // State rebuilt on each call to process_citations(...)
    struct ProcessSession {
      explicit ProcessSession( OrderPolicy order ) : bibliography( order ) {}

      Bibliography bibliography;
      std::vector< markup::Node* > citation_nodes;
      std::vector< markup::Node* > reference_nodes;
    };

    // Processing stages
    void scan( ProcessSession& session );
    void validate( const ProcessSession& session );
    void rewrite_citations( ProcessSession& session, CitationStyle style );
    void rewrite_references( ProcessSession& session,
      ReferenceStyle reference_style, CitationStyle citation_style );

    std::vector< markup::Node* > nodes_;
    Renderer renderer_;
    Stage stage_ = Stage::Idle;
  };

  const char* to_string( DocumentProcessor::Stage stage );

  // Processing options, loadable from a YAML settings document
  struct Settings {
    CitationStyle citation_style = CitationStyle::SquareBrace;
    ReferenceStyle reference_style = ReferenceStyle::DigitDot;
    OrderPolicy order = OrderPolicy::CitationFirst;
    markup::Vocabulary vocabulary;
  };

  // Keys absent from the document keep the values of base
  Settings load_settings( const std::string& yaml_text,
    Settings base = Settings() );

namespace internal {

  // Constants defining the settings keys. This block provides a single
  // location for easy editing to allow for future changes.
  inline const std::string CITATION_STYLE = "citation style";
  inline const std::string REFERENCE_STYLE = "reference style";
  inline const std::string ORDER = "order";
  inline const std::string MARKUP = "markup";
  inline const std::string BODY_TAG = "body tag";
  inline const std::string PARAGRAPH_TAG = "paragraph tag";
  inline const std::string SPAN_TAG = "span tag";
  inline const std::string STYLE_ATTRIBUTE = "style attribute";
  inline const std::string SUPERSCRIPT_STYLE = "superscript style";
  inline const std::string STYLES_TAG = "styles tag";
  inline const std::string INSERTION_POINT_TAG = "insertion point tag";

  // Marker grammar
  inline const std::regex& citation_pattern() {
    static const std::regex re( R"(\\cite\{(\w+)\})" );
    return re;
  }

  inline const std::regex& bibitem_pattern() {
    static const std::regex re( R"(\\bibitem\{(\w+)\})" );
    return re;
  }

  // Matches one specific entry marker and a single following space.
  // Labels are \w+, so they need no escaping.
  inline std::regex bibitem_pattern_for( const std::string& label ) {
    return std::regex( R"(\\bibitem\{)" + label + R"(\} ?)" );
  }

  inline std::string trim( const std::string& s ) {
    static const char* WS = " \t\r\n\f\v";
    const std::size_t first = s.find_first_not_of( WS );
    if ( first == std::string::npos ) return std::string();
    const std::size_t last = s.find_last_not_of( WS );
    return s.substr( first, last - first + 1 );
  }

  // Apply a string transformation to the text and tail of a node and of
  // every descendant
  template < typename Fn >
  inline void transform_text( markup::Node& node, const Fn& fn ) {
    node.text = fn( node.text );
    node.tail = fn( node.tail );
    for ( auto& child : node.children ) transform_text( *child, fn );
  }

  template < typename Enum, std::size_t N >
  inline Enum parse_named( const std::pair< Enum, const char* > (&names)[ N ],
    const std::string& name, const char* what )
  {
    for ( const auto& [value, text] : names ) {
      if ( name == text ) return value;
    }
    std::ostringstream oss;
    oss << "'" << name << "' is not a supported " << what << " (expected ";
    for ( std::size_t i = 0; i < N; ++i ) {
      if ( i ) oss << ", ";
      oss << names[ i ].second;
    }
    oss << ")";
    throw std::invalid_argument( oss.str() );
  }

  inline constexpr std::pair< CitationStyle, const char* >
    CITATION_STYLE_NAMES[] = {
      { CitationStyle::SquareBrace, "square-brace" },
      { CitationStyle::Superscript, "superscript" },
      { CitationStyle::Parens, "parens" },
    };

  inline constexpr std::pair< ReferenceStyle, const char* >
    REFERENCE_STYLE_NAMES[] = {
      { ReferenceStyle::SquareBrace, "square-brace" },
      { ReferenceStyle::DigitDot, "digit-dot" },
    };

  inline constexpr std::pair< OrderPolicy, const char* >
    ORDER_POLICY_NAMES[] = {
      { OrderPolicy::CitationFirst, "citation-first" },
      { OrderPolicy::ReferenceFirst, "reference-first" },
    };

} // namespace excite::internal

} // namespace excite

// Style and policy names
inline const char* excite::to_string( CitationStyle style ) {
  switch ( style ) {
    case CitationStyle::SquareBrace: return "square-brace";
    case CitationStyle::Superscript: return "superscript";
    case CitationStyle::Parens: return "parens";
  }
  throw std::invalid_argument( "unknown citation style" );
}

inline const char* excite::to_string( ReferenceStyle style ) {
  switch ( style ) {
    case ReferenceStyle::SquareBrace: return "square-brace";
    case ReferenceStyle::DigitDot: return "digit-dot";
  }
  throw std::invalid_argument( "unknown reference style" );
}

inline const char* excite::to_string( OrderPolicy order ) {
  switch ( order ) {
    case OrderPolicy::CitationFirst: return "citation-first";
    case OrderPolicy::ReferenceFirst: return "reference-first";
  }
  throw std::invalid_argument( "unknown order policy" );
}

inline const char* excite::to_string( DocumentProcessor::Stage stage ) {
  using Stage = DocumentProcessor::Stage;
  switch ( stage ) {
    case Stage::Idle: return "Idle";
    case Stage::Scanning: return "Scanning";
    case Stage::Validating: return "Validating";
    case Stage::RewritingCitations: return "RewritingCitations";
    case Stage::RewritingReferences: return "RewritingReferences";
    case Stage::Done: return "Done";
    case Stage::Failed: return "Failed";
  }
  return "?";
}

inline excite::CitationStyle excite::parse_citation_style(
  const std::string& name )
{
  return internal::parse_named( internal::CITATION_STYLE_NAMES, name,
    "citation style" );
}

inline excite::ReferenceStyle excite::parse_reference_style(
  const std::string& name )
{
  return internal::parse_named( internal::REFERENCE_STYLE_NAMES, name,
    "reference style" );
}

inline excite::OrderPolicy excite::parse_order_policy(
  const std::string& name )
{
  return internal::parse_named( internal::ORDER_POLICY_NAMES, name,
    "ordering" );
}

// Error types
inline excite::DuplicateReferenceError::DuplicateReferenceError(
  const std::string& label )
  : std::runtime_error( "Duplicate reference found for label '" + label
    + "'" ), label_( label ) {}

inline excite::MissingReferenceError::MissingReferenceError(
  std::set< std::string > missing, std::set< std::string > uncited )
  : std::runtime_error( describe(missing, uncited) ),
    missing_( std::move(missing) ), uncited_( std::move(uncited) ) {}

inline std::string excite::MissingReferenceError::describe(
  const std::set< std::string >& missing,
  const std::set< std::string >& uncited )
{
  auto list = []( std::ostringstream& oss,
    const std::set< std::string >& labels )
  {
    bool first = true;
    for ( const auto& label : labels ) {
      if ( !first ) oss << ", ";
      oss << label;
      first = false;
    }
  };

  std::ostringstream oss;
  if ( !missing.empty() ) {
    oss << "Encountered citations that do not have a corresponding"
      << " reference: ";
    list( oss, missing );
  }
  if ( !uncited.empty() ) {
    if ( !missing.empty() ) oss << "; ";
    oss << "Encountered references that are never cited: ";
    list( oss, uncited );
  }
  return oss.str();
}

// Bibliography member function definitions
inline void excite::Bibliography::add_citation( const std::string& label ) {
  citations_.push_back( label );
  if ( order_policy_ == OrderPolicy::CitationFirst ) {
    maybe_update_order( label );
  }
}

inline void excite::Bibliography::add_reference( const std::string& label,
  Reference content )
{
  if ( references_.count(label) ) throw DuplicateReferenceError( label );
  references_.emplace( label, std::move(content) );
  if ( order_policy_ == OrderPolicy::ReferenceFirst ) {
    maybe_update_order( label );
  }
}

// Associate the label with the next sequence number unless it already has
// one
inline void excite::Bibliography::maybe_update_order(
  const std::string& label )
{
  if ( order_.count(label) ) return;
  ordered_labels_.push_back( label );
  order_[ label ] = ordered_labels_.size();
}

inline std::size_t excite::Bibliography::index_of(
  const std::string& label ) const
{
  auto it = order_.find( label );
  if ( it == order_.end() ) {
    throw std::out_of_range( "No sequence number assigned to label '"
      + label + "'" );
  }
  return it->second;
}

inline excite::BibEntry excite::Bibliography::entry_by_index(
  std::size_t index ) const
{
  if ( index < 1 || index > count() || index > ordered_labels_.size() ) {
    std::ostringstream oss;
    oss << "Reference index " << index << " is outside [1, " << count()
      << "]";
    throw std::out_of_range( oss.str() );
  }

  const std::string& label = ordered_labels_[ index - 1 ];
  auto it = references_.find( label );
  if ( it == references_.end() ) {
    throw std::out_of_range( "No reference recorded for label '" + label
      + "'" );
  }
  return BibEntry{ label, index, &it->second };
}

inline bool excite::Bibliography::is_consistent() const {
  return missing_references().empty() && uncited_references().empty();
}

inline std::size_t excite::Bibliography::count() const {
  return std::max( order_.size(), references_.size() );
}

inline std::set< std::string >
  excite::Bibliography::missing_references() const
{
  std::set< std::string > missing;
  for ( const auto& label : citations_ ) {
    if ( !references_.count(label) ) missing.insert( label );
  }
  return missing;
}

inline std::set< std::string >
  excite::Bibliography::uncited_references() const
{
  std::unordered_set< std::string > cited( citations_.begin(),
    citations_.end() );
  std::set< std::string > uncited;
  for ( const auto& [label, ref] : references_ ) {
    if ( !cited.count(label) ) uncited.insert( label );
  }
  return uncited;
}

// Marker scanning
inline std::vector< excite::MarkerOccurrence > excite::find_citations(
  const std::string& text )
{
  std::vector< MarkerOccurrence > found;
  const std::regex& re = internal::citation_pattern();
  for ( auto it = std::sregex_iterator( text.begin(), text.end(), re );
    it != std::sregex_iterator(); ++it )
  {
    const std::smatch& m = *it;
    found.push_back( MarkerOccurrence{ m[1].str(), m[0].str(),
      static_cast< std::size_t >( m.position(0) ) } );
  }
  return found;
}

inline std::optional< excite::BibItemOccurrence > excite::find_bibitem(
  const std::string& text )
{
  std::smatch m;
  if ( !std::regex_search(text, m, internal::bibitem_pattern()) ) {
    return std::nullopt;
  }
  BibItemOccurrence hit;
  hit.marker = MarkerOccurrence{ m[1].str(), m[0].str(),
    static_cast< std::size_t >( m.position(0) ) };

  // Entry text: one optional space after the marker, then up to end of line
  std::size_t start = static_cast< std::size_t >( m.position(0) + m.length(0) );
  if ( start < text.size() && text[ start ] == ' ' ) ++start;
  const std::size_t stop = text.find_first_of( "\r\n", start );
  hit.text = internal::trim( text.substr(start, stop == std::string::npos
    ? std::string::npos : stop - start) );
  return hit;
}

inline excite::MarkerScan excite::scan_markers( const std::string& text ) {
  MarkerScan scan;
  scan.citations = find_citations( text );
  scan.bibitem = find_bibitem( text );
  return scan;
}

// Renderer member function definitions
inline excite::RenderedCitation excite::Renderer::render_citation(
  CitationStyle style, std::size_t index ) const
{
  const std::string number = std::to_string( index );
  RenderedCitation out;
  switch ( style ) {
    case CitationStyle::SquareBrace:
      out.text = "[" + number + "]";
      return out;
    case CitationStyle::Parens:
      out.text = "(" + number + ")";
      return out;
    case CitationStyle::Superscript: {
      out.text = number;
      markup::Node span( vocab_.span_tag );
      span.set_attribute( vocab_.style_attribute, vocab_.superscript_style );
      span.text = number;
      out.element = std::move( span );
      return out;
    }
  }
  throw std::invalid_argument( "unknown citation style" );
}

inline std::string excite::Renderer::reference_prefix( ReferenceStyle style,
  std::size_t index )
{
  switch ( style ) {
    case ReferenceStyle::DigitDot:
      return std::to_string( index ) + ". ";
    case ReferenceStyle::SquareBrace:
      return "[" + std::to_string( index ) + "] ";
  }
  throw std::invalid_argument( "unknown reference style" );
}

inline excite::markup::Node excite::Renderer::render_reference(
  ReferenceStyle style, const BibEntry& entry ) const
{
  if ( !entry.reference ) {
    throw std::invalid_argument( "Bibliography entry for label '"
      + entry.label + "' has no reference" );
  }

  const std::string prefix = reference_prefix( style, entry.index );
  const std::regex marker = internal::bibitem_pattern_for( entry.label );

  markup::Node out = entry.reference->fragment;
  internal::transform_text( out, [&]( const std::string& s ) {
    return std::regex_replace( s, marker, prefix );
  } );
  return out;
}

inline std::string excite::Renderer::render_reference_text(
  ReferenceStyle style, const BibEntry& entry ) const
{
  if ( !entry.reference ) {
    throw std::invalid_argument( "Bibliography entry for label '"
      + entry.label + "' has no reference" );
  }
  return reference_prefix( style, entry.index ) + entry.reference->text;
}

// DocumentProcessor member function definitions
inline excite::Summary excite::DocumentProcessor::process_citations(
  const std::string& citation_style, const std::string& reference_style,
  const std::string& order )
{
  // Validate every name before any scanning occurs
  const CitationStyle cs = parse_citation_style( citation_style );
  const ReferenceStyle rs = parse_reference_style( reference_style );
  const OrderPolicy op = parse_order_policy( order );
  return process_citations( cs, rs, op );
}

inline excite::Summary excite::DocumentProcessor::process_citations(
  CitationStyle citation_style, ReferenceStyle reference_style,
  OrderPolicy order )
{
  ProcessSession session( order );
  Summary summary;

  try {
    // 1) Collect citations and references, build the ordering table
    stage_ = Stage::Scanning;
    this->scan( session );

    // 2) Every citation needs a reference and vice versa
    stage_ = Stage::Validating;
    this->validate( session );

    // 3) Replace citation markers inside the citing paragraphs
    stage_ = Stage::RewritingCitations;
    this->rewrite_citations( session, citation_style );

    // 4) Re-render bibliography entries in sequence-number order
    stage_ = Stage::RewritingReferences;
    this->rewrite_references( session, reference_style, citation_style );
  } catch ( const std::exception& ) {
    stage_ = Stage::Failed;
    throw;
  }

  stage_ = Stage::Done;
  summary.citations = session.bibliography.citations().size();
  summary.references = session.bibliography.count();
  summary.citation_nodes = session.citation_nodes.size();
  return summary;
}

inline void excite::DocumentProcessor::scan( ProcessSession& session ) {
  for ( markup::Node* node : nodes_ ) {
    const MarkerScan found = scan_markers( markup::full_text(*node) );

    if ( !found.citations.empty() ) {
      session.citation_nodes.push_back( node );
      for ( const auto& cite : found.citations ) {
        session.bibliography.add_citation( cite.label );
      }
    }

    if ( found.bibitem ) {
      session.reference_nodes.push_back( node );
      session.bibliography.add_reference( found.bibitem->marker.label,
        Reference{ found.bibitem->text, *node } );
    }
  }
}

inline void excite::DocumentProcessor::validate(
  const ProcessSession& session )
{
  const Bibliography& bib = session.bibliography;
  if ( !bib.is_consistent() ) {
    throw MissingReferenceError( bib.missing_references(),
      bib.uncited_references() );
  }

  // Splicing an entry onto a paragraph replaces its subtree, so no
  // reference paragraph may hold another
  const auto& refs = session.reference_nodes;
  for ( const markup::Node* outer : refs ) {
    for ( const markup::Node* inner : refs ) {
      if ( markup::is_descendant(*inner, *outer) ) {
        std::ostringstream oss;
        oss << "Validating: reference paragraph for \\bibitem{"
          << find_bibitem( markup::full_text(*inner) )->marker.label
          << "} is nested inside another reference paragraph";
        throw std::invalid_argument( oss.str() );
      }
    }
  }

  // Each reference node contributed exactly one reference
  if ( bib.count() != session.reference_nodes.size() ) {
    std::ostringstream oss;
    oss << "Validating: " << bib.count() << " bibliography entries for "
      << session.reference_nodes.size() << " reference paragraphs";
    throw std::logic_error( oss.str() );
  }
}

namespace excite::internal {

  // Rewrites the citation markers found in the text fields of a subtree.
  // Rendered inline elements are inserted as siblings at the position of
  // their marker; the text that followed the marker becomes their tail.
  struct CitationRewriter {
    const Bibliography& bibliography;
    const Renderer& renderer;
    CitationStyle style;

    // Substitute markers in one text field. Returns the inline elements to
    // insert right after the field's position, in order.
    std::vector< markup::NodePtr > substitute( std::string& field ) const {
      std::vector< markup::NodePtr > inserted;
      if ( field.find("\\cite{") == std::string::npos ) return inserted;

      std::string lead;
      std::string* out = &lead;
      std::size_t last = 0;

      const std::regex& re = citation_pattern();
      for ( auto it = std::sregex_iterator( field.begin(), field.end(), re );
        it != std::sregex_iterator(); ++it )
      {
        const std::smatch& m = *it;
        const std::size_t pos = static_cast< std::size_t >( m.position(0) );
        out->append( field, last, pos - last );
        last = pos + static_cast< std::size_t >( m.length(0) );

        RenderedCitation r = renderer.render_citation( style,
          bibliography.index_of(m[1].str()) );
        if ( r.element ) {
          inserted.push_back(
            std::make_unique< markup::Node >(std::move(*r.element)) );
          out = &inserted.back()->tail;
        }
        else {
          out->append( r.text );
        }
      }
      out->append( field, last, std::string::npos );

      field = std::move( lead );
      return inserted;
    }

    // The node's own tail is outside the scanned text and stays as is
    void rewrite( markup::Node& node ) const {
      auto leading = substitute( node.text );
      const std::size_t n_leading = leading.size();
      node.children.insert( node.children.begin(),
        std::make_move_iterator(leading.begin()),
        std::make_move_iterator(leading.end()) );

      std::size_t i = n_leading;
      while ( i < node.children.size() ) {
        markup::Node& child = *node.children[ i ];
        rewrite( child );
        auto after = substitute( child.tail );
        const std::size_t n_after = after.size();
        node.children.insert( node.children.begin() + i + 1,
          std::make_move_iterator(after.begin()),
          std::make_move_iterator(after.end()) );
        i += 1 + n_after;
      }
    }
  };

} // namespace excite::internal

inline void excite::DocumentProcessor::rewrite_citations(
  ProcessSession& session, CitationStyle style )
{
  internal::CitationRewriter rewriter{ session.bibliography, renderer_,
    style };
  for ( markup::Node* node : session.citation_nodes ) {
    rewriter.rewrite( *node );
  }
}

inline void excite::DocumentProcessor::rewrite_references(
  ProcessSession& session, ReferenceStyle reference_style,
  CitationStyle citation_style )
{
  const Bibliography& bib = session.bibliography;

  // Render every entry before touching the document. Entry i goes to the
  // i-th reference paragraph in document order, so the printed order of
  // the bibliography follows the sequence numbers.
  std::vector< markup::Node > rendered;
  rendered.reserve( bib.count() );
  for ( std::size_t index = 1; index <= bib.count(); ++index ) {
    rendered.push_back(
      renderer_.render_reference(reference_style, bib.entry_by_index(index))
    );
  }

  // Fragments were copied before citations were rewritten; a reference that
  // also cites gets its markers replaced here
  internal::CitationRewriter rewriter{ bib, renderer_, citation_style };
  for ( std::size_t i = 0; i < rendered.size(); ++i ) {
    rewriter.rewrite( rendered[ i ] );
    markup::splice( rendered[ i ], *session.reference_nodes[ i ] );
  }
}

// Settings
namespace excite::internal {

  inline std::string settings_scalar( const ordered_node& n,
    const std::string& key )
  {
    if ( !n.is_scalar() || n.is_null() ) {
      throw std::runtime_error( "settings: '" + key
        + "' must be a non-null scalar" );
    }
    return to_string_any( n );
  }

  inline void load_vocabulary( const ordered_node& n,
    markup::Vocabulary& vocab )
  {
    if ( n.is_null() ) return;
    if ( !n.is_mapping() ) {
      throw std::runtime_error( "settings: '" + MARKUP
        + "' must be a mapping" );
    }

    const std::pair< const std::string*, std::string* > fields[] = {
      { &BODY_TAG, &vocab.body_tag },
      { &PARAGRAPH_TAG, &vocab.paragraph_tag },
      { &SPAN_TAG, &vocab.span_tag },
      { &STYLE_ATTRIBUTE, &vocab.style_attribute },
      { &SUPERSCRIPT_STYLE, &vocab.superscript_style },
      { &STYLES_TAG, &vocab.styles_tag },
      { &INSERTION_POINT_TAG, &vocab.insertion_point_tag },
    };

    for ( const auto& [mk, mv] : n.map_items() ) {
      const std::string k = to_string_any( mk );
      bool known = false;
      for ( const auto& [name, target] : fields ) {
        if ( k == *name ) {
          *target = settings_scalar( mv, MARKUP + "." + k );
          known = true;
          break;
        }
      }
      if ( !known ) {
        throw std::runtime_error( "settings: unknown key '" + MARKUP + "."
          + k + "'" );
      }
    }
  }

} // namespace excite::internal

inline excite::Settings excite::load_settings( const std::string& yaml_text,
  Settings base )
{
  using namespace internal;

  ordered_node dom = ordered_node::deserialize( yaml_text );
  if ( dom.is_null() ) return base;
  if ( !dom.is_mapping() ) {
    throw std::runtime_error( "settings: document must be a mapping" );
  }

  for ( const auto& [mk, mv] : dom.map_items() ) {
    const std::string k = to_string_any( mk );
    if ( k == CITATION_STYLE ) {
      base.citation_style = parse_citation_style( settings_scalar(mv, k) );
    }
    else if ( k == REFERENCE_STYLE ) {
      base.reference_style = parse_reference_style( settings_scalar(mv, k) );
    }
    else if ( k == ORDER ) {
      base.order = parse_order_policy( settings_scalar(mv, k) );
    }
    else if ( k == MARKUP ) {
      load_vocabulary( mv, base.vocabulary );
    }
    else {
      throw std::runtime_error( "settings: unknown key '" + k + "'" );
    }
  }
  return base;
}
