//  excite: markup tree model and document adapter
//
//  The document is an ordered tree of elements in the ElementTree style:
//  every node has a tag, attributes, leading text, children and a tail (the
//  text that follows the node inside its parent). Documents are exchanged
//  as YAML, one mapping per node.
//
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cstdint>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace excite {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the lexical order of the input, which
  // keeps attribute order stable across a load/serialize cycle
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

namespace internal {

  // Keys of a node mapping in the YAML document form
  inline const std::string TAG = "tag";
  inline const std::string ATTRIBUTES = "attributes";
  inline const std::string TEXT = "text";
  inline const std::string TAIL = "tail";
  inline const std::string CHILDREN = "children";
  inline const std::string DOC_ROOT = "root";

  // Connects path segments into a full path string for error messages
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += '.';
      s += segs[ i ];
    }
    return s;
  }

  // Append a numerical index to the end of a base path string
  inline std::string seq_indexed( const std::string& base, size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_null() ) return std::string();
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return std::to_string(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

} // namespace excite::internal

namespace markup {

  struct Node;
  using NodePtr = std::unique_ptr< Node >;

  // One element of the markup tree. Children are heap-owned so that
  // pointers to a node stay valid while its siblings are inserted or
  // removed. Copying a node copies the whole subtree.
  struct Node {
    std::string tag;
    std::vector< std::pair< std::string, std::string > > attributes;
    std::string text;
    std::string tail;
    std::vector< NodePtr > children;

    Node() = default;
    explicit Node( std::string node_tag ) : tag( std::move(node_tag) ) {}

    Node( const Node& other );
    Node& operator=( const Node& other );
    Node( Node&& ) = default;
    Node& operator=( Node&& ) = default;

    // Appends a child and returns a reference to it
    Node& append( Node child );

    // Returns nullptr if the attribute is absent
    const std::string* attribute( const std::string& name ) const;
    void set_attribute( const std::string& name, const std::string& value );
  };

  // Tag and attribute names used by the document adapter and the renderer.
  // Defaults follow the Apple Pages (iWork) XML vocabulary.
  struct Vocabulary {
    std::string body_tag = "sf:text-body";
    std::string paragraph_tag = "sf:p";
    std::string span_tag = "sf:span";
    std::string style_attribute = "sf:style";
    // Identifier of the character style applied to superscript citations.
    // A high ordinal avoids collisions with the styles an editor generates.
    std::string superscript_style = "SFWPCharacterStyle-50000";
    std::string styles_tag = "sf:anon-styles";
    std::string insertion_point_tag = "sf:insertion-point";
  };

  // Text of a node and all of its descendants (text and tails) in document
  // order. The node's own tail belongs to its parent and is not included.
  std::string full_text( const Node& node );

  // Replace the tag, attributes, text, tail and children of target with
  // those of source. References to target held elsewhere (by its parent,
  // for instance) observe the new content; source is left empty.
  void splice( Node& source, Node& target );

  // Every paragraph located beneath a body element, in document order.
  // The walk does not descend into a collected paragraph.
  std::vector< Node* > text_bearing_nodes( Node& root,
    const Vocabulary& vocab );

  // True if node lies strictly beneath ancestor
  bool is_descendant( const Node& node, const Node& ancestor );

  // YAML document form
  Node load_document( const std::string& yaml_text );
  Node node_from_yaml( const ordered_node& n );
  std::string serialize_document( const Node& root );

  // The editor's insertion point splits the text run it sits in, which can
  // break a marker apart. Removes the first insertion point element and
  // joins its text and tail onto the preceding content. Returns false if
  // the document has none.
  bool merge_insertion_point( Node& root, const Vocabulary& vocab );

  // Declares the superscript character style in the document's styles
  // container. Returns false if the document has no styles container.
  bool add_superscript_style( Node& root, const Vocabulary& vocab );

} // namespace excite::markup

} // namespace excite

// Node member function definitions
inline excite::markup::Node::Node( const Node& other )
  : tag( other.tag ), attributes( other.attributes ), text( other.text ),
    tail( other.tail )
{
  children.reserve( other.children.size() );
  for ( const auto& child : other.children ) {
    children.push_back( std::make_unique< Node >(*child) );
  }
}

inline excite::markup::Node& excite::markup::Node::operator=(
  const Node& other )
{
  if ( this != &other ) {
    Node copy( other );
    *this = std::move( copy );
  }
  return *this;
}

inline excite::markup::Node& excite::markup::Node::append( Node child ) {
  children.push_back( std::make_unique< Node >(std::move(child)) );
  return *children.back();
}

inline const std::string* excite::markup::Node::attribute(
  const std::string& name ) const
{
  for ( const auto& [k, v] : attributes ) {
    if ( k == name ) return &v;
  }
  return nullptr;
}

inline void excite::markup::Node::set_attribute( const std::string& name,
  const std::string& value )
{
  for ( auto& [k, v] : attributes ) {
    if ( k == name ) { v = value; return; }
  }
  attributes.emplace_back( name, value );
}

inline std::string excite::markup::full_text( const Node& node ) {
  std::string out = node.text;
  for ( const auto& child : node.children ) {
    out += full_text( *child );
    out += child->tail;
  }
  return out;
}

inline void excite::markup::splice( Node& source, Node& target ) {
  if ( &source == &target ) return;

  // Detach the children first: source may itself live beneath target
  std::vector< NodePtr > kids = std::move( source.children );
  source.children.clear();

  target.tag = std::move( source.tag );
  target.attributes = std::move( source.attributes );
  target.text = std::move( source.text );
  target.tail = std::move( source.tail );
  target.children = std::move( kids );

  source.tag.clear();
  source.attributes.clear();
  source.text.clear();
  source.tail.clear();
}

inline bool excite::markup::is_descendant( const Node& node,
  const Node& ancestor )
{
  for ( const auto& child : ancestor.children ) {
    if ( child.get() == &node || is_descendant(node, *child) ) return true;
  }
  return false;
}

inline std::vector< excite::markup::Node* >
  excite::markup::text_bearing_nodes( Node& root, const Vocabulary& vocab )
{
  std::vector< Node* > out;

  std::function< void( Node&, bool ) > walk
    = [&]( Node& node, bool below_body ) -> void
  {
    // A paragraph's subtree belongs to it; nested paragraphs are not
    // collected separately
    if ( below_body && node.tag == vocab.paragraph_tag ) {
      out.push_back( &node );
      return;
    }
    const bool child_below_body = below_body || node.tag == vocab.body_tag;
    for ( auto& child : node.children ) walk( *child, child_below_body );
  };

  walk( root, false );
  return out;
}

namespace excite::markup::internal {

  using excite::internal::join_path;
  using excite::internal::seq_indexed;
  using excite::internal::to_string_any;

  [[noreturn]] inline void throw_error_at(
    const std::vector< std::string >& path, const std::string& msg )
  {
    std::ostringstream oss;
    oss << join_path( path ) << ": " << msg;
    throw std::runtime_error( oss.str() );
  }

  inline std::string scalar_at( const ordered_node& n,
    const std::vector< std::string >& path )
  {
    if ( !n.is_scalar() ) throw_error_at( path, "expected a scalar value" );
    return to_string_any( n );
  }

  inline Node parse_node( const ordered_node& n,
    std::vector< std::string >& path )
  {
    using excite::internal::ATTRIBUTES;
    using excite::internal::CHILDREN;
    using excite::internal::TAG;
    using excite::internal::TAIL;
    using excite::internal::TEXT;

    if ( !n.is_mapping() ) throw_error_at( path, "node must be a mapping" );
    if ( !n.contains(TAG) ) {
      throw_error_at( path, "node is missing its '" + TAG + "'" );
    }

    Node node;
    for ( const auto& [mk, mv] : n.map_items() ) {
      const std::string k = to_string_any( mk );
      path.push_back( k );

      if ( k == TAG ) {
        node.tag = scalar_at( mv, path );
        if ( node.tag.empty() ) throw_error_at( path, "tag must not be empty" );
      }
      else if ( k == TEXT ) {
        node.text = scalar_at( mv, path );
      }
      else if ( k == TAIL ) {
        node.tail = scalar_at( mv, path );
      }
      else if ( k == ATTRIBUTES ) {
        if ( !mv.is_null() ) {
          if ( !mv.is_mapping() ) {
            throw_error_at( path, "attributes must be a mapping" );
          }
          for ( const auto& [ak, av] : mv.map_items() ) {
            const std::string name = to_string_any( ak );
            path.push_back( name );
            node.attributes.emplace_back( name, scalar_at(av, path) );
            path.pop_back();
          }
        }
      }
      else if ( k == CHILDREN ) {
        if ( !mv.is_null() ) {
          if ( !mv.is_sequence() ) {
            throw_error_at( path, "children must be a sequence" );
          }
          const std::string base = path.back();
          for ( size_t i = 0; i < mv.size(); ++i ) {
            path.back() = seq_indexed( base, i );
            node.append( parse_node(mv.at(i), path) );
          }
          path.back() = base;
        }
      }
      else {
        throw_error_at( path, "unknown node field" );
      }
      path.pop_back();
    }
    return node;
  }

} // namespace excite::markup::internal

inline excite::markup::Node excite::markup::node_from_yaml(
  const ordered_node& n )
{
  std::vector< std::string > path = { excite::internal::DOC_ROOT };
  return internal::parse_node( n, path );
}

inline excite::markup::Node excite::markup::load_document(
  const std::string& yaml_text )
{
  ordered_node dom = ordered_node::deserialize( yaml_text );
  return node_from_yaml( dom );
}

namespace excite::markup::internal {

  // Double-quoted YAML scalar. Plain scalars would lose the leading and
  // trailing whitespace that text runs routinely carry.
  inline std::string quoted( const std::string& s ) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out = "\"";
    for ( char ch : s ) {
      const unsigned char c = static_cast< unsigned char >( ch );
      switch ( ch ) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
          if ( c < 0x20 || c == 0x7F ) {
            out += "\\x";
            out += HEX[ c >> 4 ];
            out += HEX[ c & 0xF ];
          }
          else {
            out += ch;
          }
      }
    }
    out += '"';
    return out;
  }

  // first: prefix of the node's first line ("- " inside a sequence);
  // rest: indentation of its remaining lines
  inline void emit_node( std::ostringstream& out, const Node& node,
    const std::string& first, const std::string& rest )
  {
    using excite::internal::ATTRIBUTES;
    using excite::internal::CHILDREN;
    using excite::internal::TAG;
    using excite::internal::TAIL;
    using excite::internal::TEXT;

    out << first << TAG << ": " << quoted( node.tag ) << '\n';
    if ( !node.attributes.empty() ) {
      out << rest << ATTRIBUTES << ":\n";
      for ( const auto& [k, v] : node.attributes ) {
        out << rest << "  " << quoted( k ) << ": " << quoted( v ) << '\n';
      }
    }
    if ( !node.text.empty() ) {
      out << rest << TEXT << ": " << quoted( node.text ) << '\n';
    }
    if ( !node.tail.empty() ) {
      out << rest << TAIL << ": " << quoted( node.tail ) << '\n';
    }
    if ( !node.children.empty() ) {
      out << rest << CHILDREN << ":\n";
      for ( const auto& child : node.children ) {
        emit_node( out, *child, rest + "  - ", rest + "    " );
      }
    }
  }

} // namespace excite::markup::internal

inline std::string excite::markup::serialize_document( const Node& root ) {
  std::ostringstream out;
  internal::emit_node( out, root, "", "" );
  return out.str();
}

inline bool excite::markup::merge_insertion_point( Node& root,
  const Vocabulary& vocab )
{
  std::function< bool( Node& ) > visit = [&]( Node& parent ) -> bool {
    for ( size_t i = 0; i < parent.children.size(); ++i ) {
      Node& child = *parent.children[ i ];
      if ( child.tag == vocab.insertion_point_tag ) {
        // Text held by the marker rejoins the run it interrupted
        std::string carried = child.text + child.tail;
        if ( i == 0 ) parent.text += carried;
        else parent.children[ i - 1 ]->tail += carried;
        parent.children.erase( parent.children.begin() + i );
        return true;
      }
      if ( visit(child) ) return true;
    }
    return false;
  };
  return visit( root );
}

inline bool excite::markup::add_superscript_style( Node& root,
  const Vocabulary& vocab )
{
  // Example of the declared style:
  // <sf:characterstyle sf:parent-ident="character-style-null"
  //     sfa:ID="SFWPCharacterStyle-50000">
  //   <sf:property-map>
  //     <sf:superscript>
  //       <sf:number sfa:number="1" sfa:type="i"/>
  //     </sf:superscript>
  //   </sf:property-map>
  // </sf:characterstyle>
  static const std::string STYLE_TAG = "sf:characterstyle";
  static const std::string ID_ATTRIBUTE = "sfa:ID";

  std::function< Node*( Node& ) > find = [&]( Node& node ) -> Node* {
    if ( node.tag == vocab.styles_tag ) return &node;
    for ( auto& child : node.children ) {
      if ( Node* hit = find(*child) ) return hit;
    }
    return nullptr;
  };

  Node* styles = find( root );
  if ( !styles ) return false;

  for ( const auto& child : styles->children ) {
    const std::string* id = child->attribute( ID_ATTRIBUTE );
    if ( child->tag == STYLE_TAG && id && *id == vocab.superscript_style ) {
      return true;
    }
  }

  Node style( STYLE_TAG );
  style.set_attribute( "sf:parent-ident", "character-style-null" );
  style.set_attribute( ID_ATTRIBUTE, vocab.superscript_style );
  Node& pmap = style.append( Node("sf:property-map") );
  Node& superscript = pmap.append( Node("sf:superscript") );
  Node& number = superscript.append( Node("sf:number") );
  number.set_attribute( "sfa:number", "1" );
  number.set_attribute( "sfa:type", "i" );

  styles->append( std::move(style) );
  return true;
}
