#include <fstream>
#include <iostream>
#include <sstream>

#include "excite.hh"

namespace {

  const char* USAGE =
    "usage: excite [options] [input.yaml [output.yaml]]\n"
    "\n"
    "Replaces \\cite{label} and \\bibitem{label} markers in a markup\n"
    "document with numbered citations and a numbered bibliography.\n"
    "Reads stdin and writes stdout when no files are given.\n"
    "\n"
    "options:\n"
    "  --config FILE            YAML settings file\n"
    "  --citation-style STYLE   square-brace | superscript | parens\n"
    "  --reference-style STYLE  square-brace | digit-dot\n"
    "  --order POLICY           citation-first | reference-first\n"
    "  --verbose                report progress on stderr\n"
    "  --help                   show this message\n";

  struct Options {
    std::string config_path;
    std::string citation_style;
    std::string reference_style;
    std::string order;
    std::string input_path;
    std::string output_path;
    bool verbose = false;
    bool help = false;
  };

  // Thrown for malformed command lines (exit status 2)
  struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  Options parse_options( int argc, char** argv ) {
    Options opts;
    std::vector< std::string > positional;

    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      auto value = [&]() -> std::string {
        if ( i + 1 >= argc ) throw UsageError( arg + " requires a value" );
        return argv[ ++i ];
      };

      if ( arg == "--config" ) opts.config_path = value();
      else if ( arg == "--citation-style" ) opts.citation_style = value();
      else if ( arg == "--reference-style" ) opts.reference_style = value();
      else if ( arg == "--order" ) opts.order = value();
      else if ( arg == "--verbose" || arg == "-v" ) opts.verbose = true;
      else if ( arg == "--help" || arg == "-h" ) opts.help = true;
      else if ( arg.size() > 1 && arg[0] == '-' ) {
        throw UsageError( "unknown option '" + arg + "'" );
      }
      else positional.push_back( arg );
    }

    if ( positional.size() > 2 ) throw UsageError( "too many arguments" );
    if ( positional.size() > 0 ) opts.input_path = positional[ 0 ];
    if ( positional.size() > 1 ) opts.output_path = positional[ 1 ];
    return opts;
  }

  std::string read_all( const std::string& path ) {
    std::ostringstream oss;
    if ( path.empty() || path == "-" ) {
      oss << std::cin.rdbuf();
      return oss.str();
    }
    std::ifstream in( path, std::ios::binary );
    if ( !in ) throw std::runtime_error( "cannot open '" + path + "'" );
    oss << in.rdbuf();
    return oss.str();
  }

  void write_all( const std::string& path, const std::string& text ) {
    if ( path.empty() || path == "-" ) {
      std::cout << text;
      return;
    }
    std::ofstream out( path, std::ios::binary | std::ios::trunc );
    if ( !out ) throw std::runtime_error( "cannot write '" + path + "'" );
    out << text;
    if ( !out ) throw std::runtime_error( "failed writing '" + path + "'" );
  }

  void note( bool verbose, const std::string& msg ) {
    if ( verbose ) std::cerr << "[excite] " << msg << "\n";
  }

} // namespace

int main( int argc, char** argv ) {
  Options opts;
  try {
    opts = parse_options( argc, argv );
  } catch ( const UsageError& ex ) {
    std::cerr << "[excite] " << ex.what() << "\n" << USAGE;
    return 2;
  }
  if ( opts.help ) {
    std::cout << USAGE;
    return 0;
  }

  try {
    excite::Settings settings;
    if ( !opts.config_path.empty() ) {
      settings = excite::load_settings( read_all(opts.config_path) );
    }

    // Command-line flags override the settings file
    if ( !opts.citation_style.empty() ) {
      settings.citation_style
        = excite::parse_citation_style( opts.citation_style );
    }
    if ( !opts.reference_style.empty() ) {
      settings.reference_style
        = excite::parse_reference_style( opts.reference_style );
    }
    if ( !opts.order.empty() ) {
      settings.order = excite::parse_order_policy( opts.order );
    }

    excite::markup::Node doc
      = excite::markup::load_document( read_all(opts.input_path) );

    if ( excite::markup::merge_insertion_point(doc, settings.vocabulary) ) {
      note( opts.verbose, "merged editor insertion point" );
    }

    if ( settings.citation_style == excite::CitationStyle::Superscript
      && !excite::markup::add_superscript_style(doc, settings.vocabulary) )
    {
      note( opts.verbose, "warning: no '" + settings.vocabulary.styles_tag
        + "' element; superscript style not declared" );
    }

    std::vector< excite::markup::Node* > nodes
      = excite::markup::text_bearing_nodes( doc, settings.vocabulary );
    note( opts.verbose, std::to_string(nodes.size())
      + " text-bearing node(s)" );

    excite::DocumentProcessor processor( std::move(nodes),
      settings.vocabulary );
    excite::Summary summary = processor.process_citations(
      settings.citation_style, settings.reference_style, settings.order );

    std::ostringstream oss;
    oss << summary.citations << " citation(s) in " << summary.citation_nodes
      << " paragraph(s), " << summary.references << " reference(s), "
      << excite::to_string( settings.order ) << " order";
    note( opts.verbose, oss.str() );

    write_all( opts.output_path,
      excite::markup::serialize_document(doc) );
    return 0;
  } catch ( const std::exception& ex ) {
    std::cerr << "[excite] error: " << ex.what() << "\n";
    return 1;
  }
}
