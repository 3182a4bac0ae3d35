#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "bibref.hh"

// Table used when neither --metadata nor BIBREF_METADATA is given
#ifndef BIBREF_DEFAULT_METADATA
#define BIBREF_DEFAULT_METADATA "metadata.yml"
#endif

namespace {

  const char* const USAGE =
    "usage: bibref [--metadata FILE] [--max-range N] [--clean] [PASSAGE...]\n"
    "\n"
    "Parses each PASSAGE (or each non-empty line of standard input) and\n"
    "writes the books, chapters and verses it cites as YAML.\n"
    "\n"
    "  --metadata FILE  book metadata table (default: $BIBREF_METADATA, or\n"
    "                   the metadata.yml bibref was built with)\n"
    "  --max-range N    largest number of chapters or verses a single range\n"
    "                   may expand into\n"
    "  --clean          drop invalid references before writing\n";

  // Keys of the output document
  const std::string PASSAGE = "passage";
  const std::string BOOKS = "books";
  const std::string BOOK = "book";
  const std::string SHORT_NAME = "short name";
  const std::string CHAPTERS = "chapters";
  const std::string CHAPTER = "chapter";
  const std::string VERSES = "verses";
  const std::string ERRORS = "errors";

  struct Options {
    std::string metadata_path;
    std::size_t max_range_size = bibref::Parser::DEFAULT_MAX_RANGE_SIZE;
    bool clean = false;
    bool help = false;
    std::vector< std::string > passages;
  };

  std::size_t parse_positive( const std::string& flag,
    const std::string& value )
  {
    std::size_t used = 0;
    unsigned long long n = 0;
    try {
      n = std::stoull( value, &used );
    }
    catch ( const std::exception& ) {
      used = 0;
    }
    if ( used != value.size() || n == 0 ) {
      throw std::runtime_error( flag + " expects a positive integer (got '"
        + value + "')" );
    }
    return static_cast< std::size_t >( n );
  }

  Options parse_arguments( int argc, char** argv ) {
    Options opts;
    if ( const char* env = std::getenv("BIBREF_METADATA") ) {
      opts.metadata_path = env;
    }
    if ( opts.metadata_path.empty() ) {
      opts.metadata_path = BIBREF_DEFAULT_METADATA;
    }

    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      auto value_of = [&]() -> std::string {
        if ( i + 1 >= argc ) {
          throw std::runtime_error( arg + " requires a value" );
        }
        return argv[ ++i ];
      };

      if ( arg == "--help" || arg == "-h" ) opts.help = true;
      else if ( arg == "--clean" ) opts.clean = true;
      else if ( arg == "--metadata" ) opts.metadata_path = value_of();
      else if ( arg == "--max-range" ) {
        opts.max_range_size = parse_positive( arg, value_of() );
      }
      else if ( arg.size() > 1 && arg[0] == '-' && arg[1] == '-' ) {
        throw std::runtime_error( "unknown option '" + arg + "'" );
      }
      else opts.passages.push_back( arg );
    }
    return opts;
  }

  // Valid references only: invalid ones are reported through the error list
  bibref::ordered_node render( const std::string& passage,
    const bibref::BookCollection& books )
  {
    using bibref::internal::make_node_from;

    std::vector< bibref::ordered_node > book_nodes;
    for ( const auto& book : books ) {
      if ( !book->is_valid() ) continue;

      std::vector< bibref::ordered_node > chapter_nodes;
      for ( const auto& chapter : *book->chapters() ) {
        if ( !chapter->is_valid() ) continue;
        std::vector< bibref::ordered_node > verse_nodes;
        for ( std::int64_t v : chapter->verse_numbers() ) {
          verse_nodes.push_back( make_node_from(v) );
        }
        bibref::ordered_node c = bibref::ordered_node::mapping();
        c[ CHAPTER ] = make_node_from( *chapter->number() );
        c[ VERSES ] = make_node_from( verse_nodes );
        chapter_nodes.push_back( c );
      }

      bibref::ordered_node b = bibref::ordered_node::mapping();
      b[ BOOK ] = make_node_from( *book->name() );
      b[ SHORT_NAME ] = make_node_from( *book->short_name() );
      b[ CHAPTERS ] = make_node_from( chapter_nodes );
      book_nodes.push_back( b );
    }

    std::vector< bibref::ordered_node > error_nodes;
    for ( const auto& msg : books.errors() ) {
      error_nodes.push_back( make_node_from(msg) );
    }

    bibref::ordered_node doc = bibref::ordered_node::mapping();
    doc[ PASSAGE ] = make_node_from( passage );
    doc[ BOOKS ] = make_node_from( book_nodes );
    doc[ ERRORS ] = make_node_from( error_nodes );
    return doc;
  }

} // namespace

int main( int argc, char** argv ) {
  try {
    Options opts = parse_arguments( argc, argv );
    if ( opts.help ) {
      std::cout << USAGE;
      return 0;
    }

    const bibref::MetadataTable table
      = bibref::MetadataTable::from_file( opts.metadata_path );
    const bibref::Parser parser( table, opts.max_range_size );

    if ( opts.passages.empty() ) {
      std::string line;
      while ( std::getline(std::cin, line) ) {
        if ( line.find_first_not_of(" \t\r") == std::string::npos ) continue;
        opts.passages.push_back( line );
      }
    }

    bool any_errors = false;
    for ( const auto& passage : opts.passages ) {
      bibref::BookCollection books = parser.parse_books( passage );
      if ( opts.clean ) books.clean();
      any_errors = any_errors || books.has_errors();

      std::cout << "---\n"
        << bibref::ordered_node::serialize( render(passage, books) );
    }
    return any_errors ? 2 : 0;
  } catch (const std::exception& ex) {
    std::cerr << "[bibref] error: " << ex.what() << "\n";
    return 1;
  }
}
