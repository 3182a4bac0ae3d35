// ┏┓ ╻┏┓ ┏━┓┏━╸┏━╸
// ┣┻┓┃┣┻┓┣┳┛┣╸ ┣╸
// ┗━┛╹┗━┛╹┗╸┗━╸╹
//  BIBle REFerence parsing & validation
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace bibref {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
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

  // Keys used by the metadata document. This block provides a single
  // location for easy editing to allow for future changes.
  inline constexpr char PATH_DELIMITER = '.';

  inline const std::string DOC_ROOT = "root";
  inline const std::string BOOKS = "books";
  inline const std::string NAME = "name";
  inline const std::string SHORT_NAME = "short name";
  inline const std::string ABBREVIATIONS = "abbreviations";
  inline const std::string CHAPTER_VERSES = "chapter verses";

} // namespace bibref::internal

  // Immutable description of a single book
  struct BookMetadata {
    std::string name;
    std::string short_name;
    // Element i holds the number of verses in chapter i + 1
    std::vector< std::int64_t > chapter_verse_counts;

    inline std::int64_t chapter_count() const {
      return static_cast< std::int64_t >( chapter_verse_counts.size() );
    }
  };

  using MetadataPtr = std::shared_ptr< const BookMetadata >;

  // Lookup of book metadata by name or abbreviation. Implementations are
  // responsible for normalizing the key.
  class MetadataProvider {
  public:
    virtual ~MetadataProvider() = default;

    // Returns nullptr if the key does not name a known book
    virtual MetadataPtr lookup( const std::string& key ) const = 0;
  };

  // MetadataProvider backed by a YAML document of the form
  //
  //   books:
  //     - name: Genesis
  //       short name: Gen.
  //       abbreviations: [ge, gn]
  //       chapter verses: [31, 25, 24, ...]
  //
  // The name, short name and every abbreviation are registered under their
  // normalized key (see normalize_key).
  class MetadataTable : public MetadataProvider {
  public:
    MetadataTable() = default;

    static MetadataTable load( std::istream& in );
    static MetadataTable from_string( const std::string& yaml_text );
    static MetadataTable from_file( const std::string& path );

    // Lowercase, with whitespace and periods removed
    static std::string normalize_key( const std::string& key );

    MetadataPtr lookup( const std::string& key ) const override;

    // Registers a book under its name, short name and abbreviations. Throws
    // if one of the keys is already registered for a different book.
    void insert( BookMetadata book,
      const std::vector< std::string >& abbreviations = {} );

    inline std::size_t size() const { return books_.size(); }
    inline const std::vector< MetadataPtr >& books() const { return books_; }

  private:
    // Books in insertion order
    std::vector< MetadataPtr > books_;

    // normalized key -> book
    std::unordered_map< std::string, MetadataPtr > index_;
  };

  using ErrorMessages = std::vector< std::string >;

  // Ordered list of error messages. Composed into every node and collection.
  class ErrorList {
  public:
    inline void add( const std::string& message ) {
      messages_.push_back( message );
    }
    inline void clear() { messages_.clear(); }
    inline bool empty() const { return messages_.empty(); }
    inline const ErrorMessages& messages() const { return messages_; }

  private:
    ErrorMessages messages_;
  };

  // Error tracking capability shared by references and collections
  class TracksErrors {
  public:
    virtual ~TracksErrors() = default;

    virtual void add_error( const std::string& message ) = 0;
    virtual void clear_errors() = 0;

    // Own errors, followed by those of the child collection (if any) when
    // include_children is set
    virtual ErrorMessages errors( bool include_children = true ) const = 0;

    virtual bool has_errors() const = 0;
    virtual bool no_errors() const = 0;
  };

  class Reference;
  using ReferencePtr = std::shared_ptr< Reference >;
  using RemovedReferences = std::vector< ReferencePtr >;

  // A parsed book, chapter or verse. Valid if its identifying field is set.
  class Reference : public TracksErrors {
  public:
    virtual bool is_valid() const = 0;

    // Moves invalid descendants out of the child collection and returns them
    virtual RemovedReferences clean( bool chain = true ) = 0;
  };

  // Ordered container that partitions references into valid items and
  // invalid items. Invalid items are only ever produced by clean(), which
  // moves references between the two sequences without deleting any.
  template < typename T >
  class ReferenceCollection : public TracksErrors {
  public:
    using value_type = std::shared_ptr< T >;
    using const_iterator = typename std::vector< value_type >::const_iterator;

    ReferenceCollection() = default;

    explicit ReferenceCollection( std::vector< value_type > items,
      RemovedReferences invalid_items = {} )
      : items_( std::move(items) ), invalid_items_( std::move(invalid_items) )
    {}

    // Appends regardless of validity
    void append( value_type item );
    inline ReferenceCollection& operator<<( value_type item ) {
      this->append( std::move(item) );
      return *this;
    }

    inline const std::vector< value_type >& items() const { return items_; }
    inline const RemovedReferences& invalid_items() const {
      return invalid_items_;
    }

    // Sequence access over the valid items
    inline T& operator[]( std::size_t index ) { return *items_[ index ]; }
    inline const T& operator[]( std::size_t index ) const {
      return *items_[ index ];
    }
    T& first();
    const T& first() const;
    T& last();
    const T& last() const;
    inline std::size_t length() const { return items_.size(); }
    inline std::size_t size() const { return items_.size(); }
    inline bool empty() const { return items_.empty(); }
    inline const_iterator begin() const { return items_.cbegin(); }
    inline const_iterator end() const { return items_.cend(); }

    // Sequence (not set) semantics on the valid items. The result keeps the
    // invalid items of the left operand.
    ReferenceCollection operator+( const ReferenceCollection& other ) const;
    ReferenceCollection operator+( const std::vector< value_type >& other ) const;
    ReferenceCollection operator-( const ReferenceCollection& other ) const;
    ReferenceCollection operator-( const std::vector< value_type >& other ) const;

    // Moves invalid items to invalid_items. With chain set, valid items are
    // cleaned as well and whatever they remove is recorded here too.
    // Returns the references removed at this level followed by those
    // removed further down.
    RemovedReferences clean( bool chain = true );

    void add_error( const std::string& message ) override;
    void clear_errors() override;
    // Own errors, then those of the invalid items, then those of the valid
    // items. Duplicate messages are reported once.
    ErrorMessages errors( bool include_children = true ) const override;
    bool has_errors() const override;
    bool no_errors() const override;

  private:
    std::vector< value_type > items_;
    RemovedReferences invalid_items_;
    ErrorList errors_;
  };

  class Parser;
  class VerseReference;
  class ChapterReference;
  class BookReference;

  using VerseCollection = ReferenceCollection< VerseReference >;
  using ChapterCollection = ReferenceCollection< ChapterReference >;
  using BookCollection = ReferenceCollection< BookReference >;

  // Passed to the node constructors so that only Parser can build nodes,
  // while still going through std::make_shared
  class ParserKey {
  private:
    friend class Parser;
    ParserKey() {}
  };

  class VerseReference : public Reference {
  public:
    inline explicit VerseReference( ParserKey ) {}

    inline const std::optional< std::int64_t >& number() const {
      return number_;
    }

    inline bool is_valid() const override { return number_.has_value(); }

    // Verses have no children, so nothing is ever removed
    RemovedReferences clean( bool chain = true ) override;

    void add_error( const std::string& message ) override;
    void clear_errors() override;
    ErrorMessages errors( bool include_children = true ) const override;
    bool has_errors() const override;
    bool no_errors() const override;

  private:
    friend class Parser;

    std::optional< std::int64_t > number_;
    ErrorList errors_;
  };

  class ChapterReference : public Reference {
  public:
    inline explicit ChapterReference( ParserKey ) {}

    inline const std::optional< std::int64_t >& number() const {
      return number_;
    }
    inline const std::optional< std::string >& raw_remainder() const {
      return raw_remainder_;
    }
    inline const MetadataPtr& metadata() const { return metadata_; }
    inline const std::optional< VerseCollection >& verses() const {
      return verses_;
    }
    inline std::optional< VerseCollection >& verses() { return verses_; }

    // Numbers of the valid verses, in order
    std::vector< std::int64_t > verse_numbers() const;

    inline bool is_valid() const override { return number_.has_value(); }
    RemovedReferences clean( bool chain = true ) override;

    void add_error( const std::string& message ) override;
    void clear_errors() override;
    ErrorMessages errors( bool include_children = true ) const override;
    bool has_errors() const override;
    bool no_errors() const override;

  private:
    friend class Parser;

    std::optional< std::int64_t > number_;
    std::optional< std::string > raw_remainder_;
    MetadataPtr metadata_;
    std::optional< VerseCollection > verses_;
    ErrorList errors_;
  };

  class BookReference : public Reference {
  public:
    inline explicit BookReference( ParserKey ) {}

    inline const std::optional< std::string >& name() const { return name_; }
    inline const std::optional< std::string >& short_name() const {
      return short_name_;
    }
    inline const std::optional< std::string >& raw_remainder() const {
      return raw_remainder_;
    }
    inline const MetadataPtr& metadata() const { return metadata_; }
    inline const std::optional< ChapterCollection >& chapters() const {
      return chapters_;
    }
    inline std::optional< ChapterCollection >& chapters() { return chapters_; }

    inline bool is_valid() const override { return name_.has_value(); }
    RemovedReferences clean( bool chain = true ) override;

    void add_error( const std::string& message ) override;
    void clear_errors() override;
    ErrorMessages errors( bool include_children = true ) const override;
    bool has_errors() const override;
    bool no_errors() const override;

  private:
    friend class Parser;

    std::optional< std::string > name_;
    std::optional< std::string > short_name_;
    std::optional< std::string > raw_remainder_;
    MetadataPtr metadata_;
    std::optional< ChapterCollection > chapters_;
    ErrorList errors_;
  };

  // Turns passage text into books, chapters and verses. Malformed input never
  // throws: problems are recorded as error messages on the references and
  // collections that are returned.
  class Parser {
  public:

    // Default limit on the number of references a single "A-B" range
    // may expand into
    static constexpr std::size_t DEFAULT_MAX_RANGE_SIZE = 1000;

    // The provider must outlive the parser
    explicit Parser( const MetadataProvider& metadata,
      std::size_t max_range_size = DEFAULT_MAX_RANGE_SIZE );

    inline std::size_t max_range_size() const { return max_range_size_; }

    // Same as parse_books
    BookCollection parse( const std::string& passage ) const;

    BookCollection parse_books( const std::string& passage ) const;

    ChapterCollection parse_chapters( const std::string& passage,
      MetadataPtr metadata = nullptr ) const;
    ChapterCollection parse_chapters( std::int64_t chapter,
      MetadataPtr metadata = nullptr ) const;

    // Assumes chapter 1 for a book cited without a remainder. An empty
    // remainder cites no chapters.
    ChapterCollection parse_chapters_for( const BookReference& book ) const;

    VerseCollection parse_verses( const std::string& text,
      MetadataPtr metadata = nullptr,
      std::optional< std::int64_t > chapter_number = std::nullopt ) const;
    VerseCollection parse_verses( std::int64_t verse,
      MetadataPtr metadata = nullptr,
      std::optional< std::int64_t > chapter_number = std::nullopt ) const;

    // Without a remainder, every verse of the chapter is assumed when the
    // book is known, and only the first verse otherwise
    VerseCollection parse_verses_for( const ChapterReference& chapter ) const;

    // Construct a single validated reference. Valid books and chapters
    // parse their remainder immediately.
    std::shared_ptr< BookReference > make_book( const std::string& name,
      std::optional< std::string > raw_remainder = std::nullopt ) const;

    std::shared_ptr< ChapterReference > make_chapter( std::int64_t number,
      std::optional< std::string > raw_remainder = std::nullopt,
      MetadataPtr metadata = nullptr ) const;
    std::shared_ptr< ChapterReference > make_chapter(
      const std::string& number,
      std::optional< std::string > raw_remainder = std::nullopt,
      MetadataPtr metadata = nullptr ) const;

    std::shared_ptr< VerseReference > make_verse( std::int64_t number,
      MetadataPtr metadata = nullptr,
      std::optional< std::int64_t > chapter_number = std::nullopt ) const;
    std::shared_ptr< VerseReference > make_verse( const std::string& number,
      MetadataPtr metadata = nullptr,
      std::optional< std::int64_t > chapter_number = std::nullopt ) const;

  private:

    // Records an error on the collection and returns false if the range
    // first-last would expand into more than max_range_size_ references
    bool check_range_size( TracksErrors& collection, const std::string& token,
      std::int64_t first, std::int64_t last ) const;

    const MetadataProvider& metadata_;
    std::size_t max_range_size_;

  }; // class Parser

namespace internal {

  // Connects path segments into a single string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
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

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  // Compose "books[3].chapter verses: message" and throw
  [[noreturn]] inline void throw_metadata_error(
    const std::vector< std::string >& path, const std::string& msg )
  {
    std::ostringstream oss;
    oss << join_path( path ) << ": " << msg;
    throw std::runtime_error( oss.str() );
  }

  inline std::string required_string( const ordered_node& entry,
    const std::string& key, std::vector< std::string > path )
  {
    path.push_back( key );
    if ( !entry.contains(key) ) {
      throw_metadata_error( path, "missing required field" );
    }
    const ordered_node& value = entry.at( key );
    if ( !value.is_string() ) {
      throw_metadata_error( path, "must be a string" );
    }
    return to_native_checked< std::string >( value );
  }

  // Leading integer of the text (after optional whitespace and sign),
  // or 0 if there is none. Out-of-range values saturate.
  inline std::int64_t to_integer( const std::string& text ) {
    return static_cast< std::int64_t >(
      std::strtoll( text.c_str(), nullptr, 10 ) );
  }

  // Drops incidental punctuation after the last digit. Text without any
  // digits becomes empty.
  inline std::string strip_trailing_non_digits( const std::string& text ) {
    const std::size_t pos = text.find_last_of( "0123456789" );
    if ( pos == std::string::npos ) return std::string();
    return text.substr( 0, pos + 1 );
  }

  // Character classes used by the passage scanners. Only ASCII letters
  // can form a book name.
  inline bool is_digit( char ch ) { return ch >= '0' && ch <= '9'; }

  inline bool is_letter( char ch ) {
    return ( ch >= 'a' && ch <= 'z' ) || ( ch >= 'A' && ch <= 'Z' );
  }

  inline bool is_not_letter( char ch ) { return !is_letter( ch ); }

  inline bool is_verse_list_char( char ch ) {
    return is_digit( ch ) || ch == ',' || ch == '-';
  }

  // One past the run of characters starting at pos that satisfy pred
  template < typename Pred >
  inline std::size_t run_end( const std::string& s, std::size_t pos,
    Pred pred )
  {
    while ( pos < s.size() && pred(s[pos]) ) ++pos;
    return pos;
  }

  // Either "A-B" or a bare "A", scanned from a digit
  struct NumberToken {
    std::size_t begin;
    std::size_t end;
    std::string first;
    std::optional< std::string > last;
  };

  inline NumberToken scan_number_token( const std::string& s,
    std::size_t pos )
  {
    const std::size_t first_end = run_end( s, pos, is_digit );
    NumberToken tok{ pos, first_end, s.substr(pos, first_end - pos),
      std::nullopt };

    if ( first_end < s.size() && s[ first_end ] == '-' ) {
      const std::size_t last_end = run_end( s, first_end + 1, is_digit );
      if ( last_end > first_end + 1 ) {
        tok.end = last_end;
        tok.last = s.substr( first_end + 1, last_end - first_end - 1 );
      }
    }
    return tok;
  }

  inline std::string token_text( const std::string& s,
    const NumberToken& tok )
  {
    return s.substr( tok.begin, tok.end - tok.begin );
  }

  // Number of verses in a chapter, or nothing if the book has no
  // such chapter
  inline std::optional< std::int64_t > verse_count( const BookMetadata& book,
    std::int64_t chapter )
  {
    if ( chapter < 1 || chapter > book.chapter_count() ) return std::nullopt;
    return book.chapter_verse_counts[
      static_cast< std::size_t >( chapter - 1 ) ];
  }

  // Concatenate the messages of b onto a
  inline void append_errors( ErrorMessages& a, const ErrorMessages& b ) {
    a.insert( a.end(), b.begin(), b.end() );
  }

} // namespace bibref::internal

} // namespace bibref

// MetadataTable member function definitions

inline std::string bibref::MetadataTable::normalize_key(
  const std::string& key )
{
  std::string out;
  out.reserve( key.size() );
  for ( char ch : key ) {
    unsigned char c = static_cast< unsigned char >( ch );
    if ( std::isspace(c) || c == '.' ) continue;
    out += static_cast< char >( std::tolower(c) );
  }
  return out;
}

inline bibref::MetadataPtr bibref::MetadataTable::lookup(
  const std::string& key ) const
{
  auto it = index_.find( normalize_key(key) );
  if ( it == index_.end() ) return nullptr;
  return it->second;
}

inline void bibref::MetadataTable::insert( BookMetadata book,
  const std::vector< std::string >& abbreviations )
{
  if ( book.name.empty() ) {
    throw std::runtime_error( "Book metadata requires a name" );
  }
  if ( book.chapter_verse_counts.empty() ) {
    throw std::runtime_error( "Book '" + book.name
      + "' must have at least one chapter" );
  }
  for ( std::size_t i = 0; i < book.chapter_verse_counts.size(); ++i ) {
    if ( book.chapter_verse_counts[ i ] < 1 ) {
      std::ostringstream oss;
      oss << "Book '" << book.name << "' chapter " << ( i + 1 )
        << " must have at least one verse";
      throw std::runtime_error( oss.str() );
    }
  }

  // Validate every key before touching the index so that a failed insert
  // leaves the table unchanged
  std::vector< std::string > keys = { book.name, book.short_name };
  keys.insert( keys.end(), abbreviations.begin(), abbreviations.end() );

  std::vector< std::string > normalized;
  normalized.reserve( keys.size() );
  for ( const auto& k : keys ) {
    const std::string nk = normalize_key( k );
    if ( nk.empty() ) {
      throw std::runtime_error( "Book '" + book.name
        + "' has an empty name or abbreviation" );
    }
    auto it = index_.find( nk );
    if ( it != index_.end() ) {
      std::ostringstream oss;
      oss << "Duplicate key '" << nk << "' for book '" << book.name
        << "' (already registered for '" << it->second->name << "')";
      throw std::runtime_error( oss.str() );
    }
    normalized.push_back( nk );
  }

  MetadataPtr record = std::make_shared< const BookMetadata >(
    std::move(book) );
  for ( const auto& nk : normalized ) {
    // Abbreviations may repeat the name or short name
    index_.emplace( nk, record );
  }
  books_.push_back( record );
}

// Read from an input stream until end-of-file, then load the resulting string
inline bibref::MetadataTable bibref::MetadataTable::load( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return from_string( ss.str() );
}

inline bibref::MetadataTable bibref::MetadataTable::from_file(
  const std::string& path )
{
  std::ifstream in( path );
  if ( !in ) {
    throw std::runtime_error( "Unable to open metadata file '" + path + "'" );
  }
  return load( in );
}

inline bibref::MetadataTable bibref::MetadataTable::from_string(
  const std::string& yaml_text )
{
  using internal::ABBREVIATIONS;
  using internal::BOOKS;
  using internal::CHAPTER_VERSES;
  using internal::NAME;
  using internal::SHORT_NAME;

  ordered_node doc;
  try {
    doc = ordered_node::deserialize( yaml_text );
  }
  catch ( const fkyaml::exception& ex ) {
    throw std::runtime_error( std::string("Invalid metadata document: ")
      + ex.what() );
  }

  const std::vector< std::string > root_path = { internal::DOC_ROOT };
  if ( !doc.is_mapping() || !doc.contains(BOOKS) ) {
    internal::throw_metadata_error( root_path,
      "missing required '" + BOOKS + "' sequence" );
  }

  const ordered_node& books = doc.at( BOOKS );
  if ( !books.is_sequence() || books.size() == 0 ) {
    internal::throw_metadata_error( { BOOKS }, "must be a non-empty sequence" );
  }

  MetadataTable table;
  for ( std::size_t i = 0; i < books.size(); ++i ) {
    const std::vector< std::string > path = {
      internal::seq_indexed( BOOKS, i ) };
    const ordered_node& entry = books.at( i );
    if ( !entry.is_mapping() ) {
      internal::throw_metadata_error( path, "must be a mapping" );
    }

    BookMetadata book;
    book.name = internal::required_string( entry, NAME, path );
    book.short_name = internal::required_string( entry, SHORT_NAME, path );

    std::vector< std::string > abbreviations;
    if ( entry.contains(ABBREVIATIONS) ) {
      const ordered_node& abbrs = entry.at( ABBREVIATIONS );
      if ( !abbrs.is_sequence() ) {
        internal::throw_metadata_error( { path[0], ABBREVIATIONS },
          "must be a sequence" );
      }
      for ( std::size_t j = 0; j < abbrs.size(); ++j ) {
        const ordered_node& a = abbrs.at( j );
        if ( !a.is_string() ) {
          internal::throw_metadata_error(
            { path[0], internal::seq_indexed(ABBREVIATIONS, j) },
            "must be a string" );
        }
        abbreviations.push_back(
          internal::to_native_checked< std::string >(a) );
      }
    }

    if ( !entry.contains(CHAPTER_VERSES) ) {
      internal::throw_metadata_error( { path[0], CHAPTER_VERSES },
        "missing required field" );
    }
    const ordered_node& counts = entry.at( CHAPTER_VERSES );
    if ( !counts.is_sequence() || counts.size() == 0 ) {
      internal::throw_metadata_error( { path[0], CHAPTER_VERSES },
        "must be a non-empty sequence" );
    }
    for ( std::size_t j = 0; j < counts.size(); ++j ) {
      const ordered_node& c = counts.at( j );
      if ( !c.is_integer() || c.get_value< std::int64_t >() < 1 ) {
        internal::throw_metadata_error(
          { path[0], internal::seq_indexed(CHAPTER_VERSES, j) },
          "must be a positive integer" );
      }
      book.chapter_verse_counts.push_back( c.get_value< std::int64_t >() );
    }

    try {
      table.insert( std::move(book), abbreviations );
    }
    catch ( const std::runtime_error& ex ) {
      internal::throw_metadata_error( path, ex.what() );
    }
  }
  return table;
}

// ReferenceCollection member function definitions

template < typename T >
inline void bibref::ReferenceCollection< T >::append( value_type item ) {
  items_.push_back( std::move(item) );
}

template < typename T >
inline T& bibref::ReferenceCollection< T >::first() {
  if ( items_.empty() ) throw std::out_of_range( "first() on empty collection" );
  return *items_.front();
}

template < typename T >
inline const T& bibref::ReferenceCollection< T >::first() const {
  if ( items_.empty() ) throw std::out_of_range( "first() on empty collection" );
  return *items_.front();
}

template < typename T >
inline T& bibref::ReferenceCollection< T >::last() {
  if ( items_.empty() ) throw std::out_of_range( "last() on empty collection" );
  return *items_.back();
}

template < typename T >
inline const T& bibref::ReferenceCollection< T >::last() const {
  if ( items_.empty() ) throw std::out_of_range( "last() on empty collection" );
  return *items_.back();
}

template < typename T >
inline bibref::ReferenceCollection< T >
  bibref::ReferenceCollection< T >::operator+(
    const std::vector< value_type >& other ) const
{
  std::vector< value_type > combined = items_;
  combined.insert( combined.end(), other.begin(), other.end() );
  return ReferenceCollection( std::move(combined), invalid_items_ );
}

template < typename T >
inline bibref::ReferenceCollection< T >
  bibref::ReferenceCollection< T >::operator+(
    const ReferenceCollection& other ) const
{
  return *this + other.items();
}

// Removes by identity: every occurrence of a reference held by other
template < typename T >
inline bibref::ReferenceCollection< T >
  bibref::ReferenceCollection< T >::operator-(
    const std::vector< value_type >& other ) const
{
  std::vector< value_type > kept;
  kept.reserve( items_.size() );
  for ( const auto& item : items_ ) {
    if ( std::find(other.begin(), other.end(), item) != other.end() ) continue;
    kept.push_back( item );
  }
  return ReferenceCollection( std::move(kept), invalid_items_ );
}

template < typename T >
inline bibref::ReferenceCollection< T >
  bibref::ReferenceCollection< T >::operator-(
    const ReferenceCollection& other ) const
{
  return *this - other.items();
}

template < typename T >
inline bibref::RemovedReferences
  bibref::ReferenceCollection< T >::clean( bool chain )
{
  RemovedReferences removed;
  RemovedReferences removed_through_chain;
  std::vector< value_type > kept;
  kept.reserve( items_.size() );

  for ( const auto& item : items_ ) {
    if ( !item->is_valid() ) {
      removed.push_back( item );
      continue;
    }
    kept.push_back( item );
    if ( chain ) {
      RemovedReferences below = item->clean( true );
      removed_through_chain.insert( removed_through_chain.end(),
        below.begin(), below.end() );
    }
  }

  items_ = std::move( kept );
  removed.insert( removed.end(), removed_through_chain.begin(),
    removed_through_chain.end() );
  invalid_items_.insert( invalid_items_.end(), removed.begin(),
    removed.end() );
  return removed;
}

template < typename T >
inline void bibref::ReferenceCollection< T >::add_error(
  const std::string& message )
{
  errors_.add( message );
}

template < typename T >
inline void bibref::ReferenceCollection< T >::clear_errors() {
  errors_.clear();
}

template < typename T >
inline bibref::ErrorMessages bibref::ReferenceCollection< T >::errors(
  bool include_children ) const
{
  ErrorMessages all = errors_.messages();
  for ( const auto& ref : invalid_items_ ) {
    internal::append_errors( all, ref->errors(include_children) );
  }
  for ( const auto& item : items_ ) {
    internal::append_errors( all, item->errors(include_children) );
  }

  // First occurrence wins
  ErrorMessages unique;
  std::unordered_set< std::string > seen;
  for ( auto& msg : all ) {
    if ( seen.insert(msg).second ) unique.push_back( std::move(msg) );
  }
  return unique;
}

template < typename T >
inline bool bibref::ReferenceCollection< T >::has_errors() const {
  return !this->errors().empty();
}

template < typename T >
inline bool bibref::ReferenceCollection< T >::no_errors() const {
  return this->errors().empty();
}

// VerseReference member function definitions

inline bibref::RemovedReferences bibref::VerseReference::clean( bool ) {
  return {};
}

inline void bibref::VerseReference::add_error( const std::string& message ) {
  errors_.add( message );
}

inline void bibref::VerseReference::clear_errors() { errors_.clear(); }

inline bibref::ErrorMessages bibref::VerseReference::errors( bool ) const {
  return errors_.messages();
}

inline bool bibref::VerseReference::has_errors() const {
  return !errors_.empty();
}

inline bool bibref::VerseReference::no_errors() const {
  return errors_.empty();
}

// ChapterReference member function definitions

inline std::vector< std::int64_t >
  bibref::ChapterReference::verse_numbers() const
{
  std::vector< std::int64_t > numbers;
  if ( !verses_ ) return numbers;
  for ( const auto& verse : *verses_ ) {
    if ( verse->number() ) numbers.push_back( *verse->number() );
  }
  return numbers;
}

inline bibref::RemovedReferences bibref::ChapterReference::clean(
  bool chain )
{
  if ( !verses_ ) return {};
  return verses_->clean( chain );
}

inline void bibref::ChapterReference::add_error( const std::string& message ) {
  errors_.add( message );
}

inline void bibref::ChapterReference::clear_errors() { errors_.clear(); }

inline bibref::ErrorMessages bibref::ChapterReference::errors(
  bool include_children ) const
{
  ErrorMessages all = errors_.messages();
  if ( include_children && verses_ ) {
    internal::append_errors( all, verses_->errors(true) );
  }
  return all;
}

inline bool bibref::ChapterReference::has_errors() const {
  return !this->errors().empty();
}

inline bool bibref::ChapterReference::no_errors() const {
  return this->errors().empty();
}

// BookReference member function definitions

inline bibref::RemovedReferences bibref::BookReference::clean( bool chain ) {
  if ( !chapters_ ) return {};
  return chapters_->clean( chain );
}

inline void bibref::BookReference::add_error( const std::string& message ) {
  errors_.add( message );
}

inline void bibref::BookReference::clear_errors() { errors_.clear(); }

inline bibref::ErrorMessages bibref::BookReference::errors(
  bool include_children ) const
{
  ErrorMessages all = errors_.messages();
  if ( include_children && chapters_ ) {
    internal::append_errors( all, chapters_->errors(true) );
  }
  return all;
}

inline bool bibref::BookReference::has_errors() const {
  return !this->errors().empty();
}

inline bool bibref::BookReference::no_errors() const {
  return this->errors().empty();
}

// Parser member function definitions

inline bibref::Parser::Parser( const MetadataProvider& metadata,
  std::size_t max_range_size )
  : metadata_( metadata ), max_range_size_( max_range_size )
{
  if ( max_range_size_ == 0 ) {
    throw std::invalid_argument( "The maximum range size must be positive" );
  }
}

inline bool bibref::Parser::check_range_size( TracksErrors& collection,
  const std::string& token, std::int64_t first, std::int64_t last ) const
{
  // Both ends come from digit runs, so neither is negative
  if ( last < first ) return true;
  if ( static_cast< std::uint64_t >( last - first )
    < static_cast< std::uint64_t >( max_range_size_ ) ) return true;

  std::ostringstream oss;
  oss << "'" << token << "' exceeds the maximum range size of "
    << max_range_size_;
  collection.add_error( oss.str() );
  return false;
}

inline bibref::BookCollection bibref::Parser::parse(
  const std::string& passage ) const
{
  return this->parse_books( passage );
}

// A book token is an optional leading digit followed by letters
// ("1samuel"). Its remainder runs up to, but not into, the next book token,
// so a digit that starts the next book's name is left for that book.
inline bibref::BookCollection bibref::Parser::parse_books(
  const std::string& passage ) const
{
  static const std::regex unwanted( "[^0-9a-zA-Z:;,-]" );

  BookCollection books;
  const std::string slim = std::regex_replace( passage, unwanted, "" );

  std::size_t pos = 0;
  while ( pos < slim.size() ) {
    const bool leading_digit = internal::is_digit( slim[pos] )
      && pos + 1 < slim.size() && internal::is_letter( slim[pos + 1] );
    if ( !leading_digit && !internal::is_letter(slim[pos]) ) {
      ++pos;
      continue;
    }

    const std::size_t name_end = internal::run_end( slim,
      leading_digit ? pos + 1 : pos, internal::is_letter );

    // Give back the last character of the remainder when a letter follows
    // it, since it may be the leading digit of the next book
    std::size_t rest_end = internal::run_end( slim, name_end,
      internal::is_not_letter );
    if ( rest_end < slim.size() ) --rest_end;

    std::optional< std::string > contents;
    if ( rest_end > name_end ) {
      contents = internal::strip_trailing_non_digits(
        slim.substr(name_end, rest_end - name_end) );
    }
    books << this->make_book( slim.substr(pos, name_end - pos), contents );
    pos = std::max( rest_end, name_end );
  }

  if ( books.empty() ) {
    books.add_error( "'" + passage + "' does not contain any books" );
  }
  return books;
}

inline bibref::ChapterCollection bibref::Parser::parse_chapters(
  std::int64_t chapter, MetadataPtr metadata ) const
{
  return this->parse_chapters( std::to_string(chapter), std::move(metadata) );
}

inline bibref::ChapterCollection bibref::Parser::parse_chapters(
  const std::string& passage, MetadataPtr metadata ) const
{
  // Book names left in the passage separate chapters
  std::string slim;
  slim.reserve( passage.size() );
  for ( std::size_t i = 0; i < passage.size(); ) {
    const char ch = passage[i];
    if ( internal::is_letter(ch) ) {
      slim += ';';
      i = internal::run_end( passage, i, internal::is_letter );
      continue;
    }
    if ( internal::is_digit(ch) || ch == ':' || ch == ';' || ch == ','
      || ch == '-' ) slim += ch;
    ++i;
  }

  // Separate every "N:" from what precedes it, so that "1:5,10,5:10" is read
  // as two chapters rather than chapter 1 with verses 5, 10 and 5
  std::string text;
  text.reserve( slim.size() * 2 );
  for ( std::size_t i = 0; i < slim.size(); ) {
    if ( !internal::is_digit(slim[i]) ) {
      text += slim[ i++ ];
      continue;
    }
    const std::size_t end = internal::run_end( slim, i, internal::is_digit );
    if ( end < slim.size() && slim[end] == ':' ) text += ';';
    text.append( slim, i, end - i );
    i = end;
  }

  // Alternatives in priority order: chapter with verses, chapter range,
  // single chapter
  ChapterCollection chapters;
  std::size_t pos = 0;
  while ( pos < text.size() ) {
    if ( !internal::is_digit(text[pos]) ) {
      ++pos;
      continue;
    }

    const std::size_t number_end
      = internal::run_end( text, pos, internal::is_digit );
    if ( number_end + 1 < text.size() && text[number_end] == ':'
      && internal::is_verse_list_char(text[number_end + 1]) )
    {
      const std::size_t tail_end = internal::run_end( text, number_end + 1,
        internal::is_verse_list_char );
      chapters << this->make_chapter( text.substr(pos, number_end - pos),
        internal::strip_trailing_non_digits(
          text.substr(number_end + 1, tail_end - number_end - 1) ),
        metadata );
      pos = tail_end;
      continue;
    }

    const internal::NumberToken tok = internal::scan_number_token( text, pos );
    pos = tok.end;
    if ( !tok.last ) {
      chapters << this->make_chapter( tok.first, std::nullopt, metadata );
      continue;
    }

    const std::int64_t first = internal::to_integer( tok.first );
    const std::int64_t last = internal::to_integer( *tok.last );

    // A reversed range expands to nothing
    if ( !this->check_range_size(chapters, internal::token_text(text, tok),
      first, last) ) continue;
    for ( std::int64_t i = 0; i <= last - first; ++i ) {
      chapters << this->make_chapter( first + i, std::nullopt, metadata );
    }
  }
  return chapters;
}

inline bibref::ChapterCollection bibref::Parser::parse_chapters_for(
  const BookReference& book ) const
{
  if ( !book.raw_remainder() ) {
    return this->parse_chapters( 1, book.metadata() );
  }
  return this->parse_chapters( *book.raw_remainder(), book.metadata() );
}

inline bibref::VerseCollection bibref::Parser::parse_verses(
  std::int64_t verse, MetadataPtr metadata,
  std::optional< std::int64_t > chapter_number ) const
{
  return this->parse_verses( std::to_string(verse), std::move(metadata),
    chapter_number );
}

inline bibref::VerseCollection bibref::Parser::parse_verses(
  const std::string& text, MetadataPtr metadata,
  std::optional< std::int64_t > chapter_number ) const
{
  static const std::regex unwanted( "[^0-9:;,-]" );

  const std::string slim = std::regex_replace( text, unwanted, "" );

  // A range takes priority over a single verse
  VerseCollection verses;
  std::size_t pos = 0;
  while ( pos < slim.size() ) {
    if ( !internal::is_digit(slim[pos]) ) {
      ++pos;
      continue;
    }

    const internal::NumberToken tok = internal::scan_number_token( slim, pos );
    pos = tok.end;
    if ( !tok.last ) {
      verses << this->make_verse( tok.first, metadata, chapter_number );
      continue;
    }

    const std::string token = internal::token_text( slim, tok );
    const std::int64_t first = internal::to_integer( tok.first );
    const std::int64_t last = internal::to_integer( *tok.last );
    if ( last < first ) {
      verses.add_error( "'" + token + "' is an invalid range of verses" );
      continue;
    }
    if ( !this->check_range_size(verses, token, first, last) ) continue;
    for ( std::int64_t i = 0; i <= last - first; ++i ) {
      verses << this->make_verse( first + i, metadata, chapter_number );
    }
  }
  return verses;
}

inline bibref::VerseCollection bibref::Parser::parse_verses_for(
  const ChapterReference& chapter ) const
{
  if ( chapter.raw_remainder() ) {
    return this->parse_verses( *chapter.raw_remainder(), chapter.metadata(),
      chapter.number() );
  }

  if ( chapter.metadata() && chapter.number() ) {
    if ( auto count = internal::verse_count(*chapter.metadata(),
      *chapter.number()) )
    {
      return this->parse_verses( "1-" + std::to_string(*count),
        chapter.metadata(), chapter.number() );
    }
  }

  return this->parse_verses( 1 );
}

inline std::shared_ptr< bibref::BookReference > bibref::Parser::make_book(
  const std::string& name, std::optional< std::string > raw_remainder ) const
{
  auto book = std::make_shared< BookReference >( ParserKey() );

  MetadataPtr metadata = metadata_.lookup( name );
  if ( !metadata ) {
    book->add_error( "The book '" + name + "' could not be found" );
    return book;
  }

  book->metadata_ = metadata;
  book->name_ = metadata->name;
  book->short_name_ = metadata->short_name;
  book->raw_remainder_ = std::move( raw_remainder );
  book->chapters_ = this->parse_chapters_for( *book );
  return book;
}

inline std::shared_ptr< bibref::ChapterReference >
  bibref::Parser::make_chapter( const std::string& number,
    std::optional< std::string > raw_remainder, MetadataPtr metadata ) const
{
  return this->make_chapter( internal::to_integer(number),
    std::move(raw_remainder), std::move(metadata) );
}

inline std::shared_ptr< bibref::ChapterReference >
  bibref::Parser::make_chapter( std::int64_t number,
    std::optional< std::string > raw_remainder, MetadataPtr metadata ) const
{
  auto chapter = std::make_shared< ChapterReference >( ParserKey() );

  if ( number < 1 ) {
    chapter->add_error( "The chapter number '" + std::to_string(number)
      + "' is not valid" );
    return chapter;
  }

  chapter->metadata_ = metadata;
  if ( metadata && number > metadata->chapter_count() ) {
    chapter->add_error( "Chapter '" + std::to_string(number)
      + "' does not exist for the book " + metadata->name );
    return chapter;
  }

  chapter->number_ = number;
  chapter->raw_remainder_ = std::move( raw_remainder );
  chapter->verses_ = this->parse_verses_for( *chapter );
  return chapter;
}

inline std::shared_ptr< bibref::VerseReference > bibref::Parser::make_verse(
  const std::string& number, MetadataPtr metadata,
  std::optional< std::int64_t > chapter_number ) const
{
  return this->make_verse( internal::to_integer(number), std::move(metadata),
    chapter_number );
}

inline std::shared_ptr< bibref::VerseReference > bibref::Parser::make_verse(
  std::int64_t number, MetadataPtr metadata,
  std::optional< std::int64_t > chapter_number ) const
{
  auto verse = std::make_shared< VerseReference >( ParserKey() );

  if ( number < 1 ) {
    verse->add_error( "The verse number '" + std::to_string(number)
      + "' is not valid" );
    return verse;
  }

  if ( metadata && chapter_number ) {
    auto count = internal::verse_count( *metadata, *chapter_number );
    if ( !count ) {
      verse->add_error( "Chapter '" + std::to_string(*chapter_number)
        + "' does not exist for the book " + metadata->name );
      return verse;
    }
    if ( number > *count ) {
      verse->add_error( "The verse '" + std::to_string(number)
        + "' does not exist for " + metadata->name + " "
        + std::to_string(*chapter_number) );
      return verse;
    }
  }

  verse->number_ = number;
  return verse;
}
