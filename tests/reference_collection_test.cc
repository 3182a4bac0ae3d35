#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include "test_support.hh"

using bibref::VerseCollection;
using bibref::VerseReference;
using bibref_test::parser;

namespace {

  using Verses = std::vector< std::shared_ptr< VerseReference > >;

  // Number of times ref appears in the collection, valid or not
  template < typename T, typename U >
  long occurrences( const bibref::ReferenceCollection< T >& c,
    const std::shared_ptr< U >& ref )
  {
    return std::count( c.items().begin(), c.items().end(), ref )
      + std::count( c.invalid_items().begin(), c.invalid_items().end(), ref );
  }

} // namespace

TEST(ReferenceCollection, AppendsValidAndInvalidItems) {
  VerseCollection verses;
  EXPECT_TRUE( verses.empty() );

  verses << parser().make_verse( 1 ) << parser().make_verse( 0 );
  verses.append( parser().make_verse( 7 ) );

  EXPECT_EQ( verses.length(), 3u );
  EXPECT_EQ( verses.size(), 3u );
  EXPECT_TRUE( verses.invalid_items().empty() );
  EXPECT_EQ( verses.first().number(), 1 );
  EXPECT_FALSE( verses[1].is_valid() );
  EXPECT_EQ( verses.last().number(), 7 );

  std::vector< std::int64_t > seen;
  for ( const auto& v : verses ) seen.push_back( v->number().value_or(-1) );
  EXPECT_EQ( seen, std::vector< std::int64_t >({ 1, -1, 7 }) );
}

TEST(ReferenceCollection, FirstAndLastThrowWhenEmpty) {
  const VerseCollection verses;
  EXPECT_THROW( verses.first(), std::out_of_range );
  EXPECT_THROW( verses.last(), std::out_of_range );
}

TEST(ReferenceCollection, ConstructsFromItemsAndInvalidItems) {
  auto one = parser().make_verse( 1 );
  auto bad = parser().make_verse( 0 );
  VerseCollection verses( Verses{ one }, bibref::RemovedReferences{ bad } );

  EXPECT_EQ( verses.size(), 1u );
  ASSERT_EQ( verses.invalid_items().size(), 1u );
  EXPECT_EQ( verses.invalid_items().front(), bad );
  EXPECT_EQ( verses.errors(),
    bibref::ErrorMessages({ "The verse number '0' is not valid" }) );
}

TEST(ReferenceCollection, UnionConcatenatesAndKeepsLeftInvalidItems) {
  auto a1 = parser().make_verse( 1 );
  auto a2 = parser().make_verse( 2 );
  auto bad = parser().make_verse( 0 );
  VerseCollection left( Verses{ a1, a2, bad } );
  left.clean();

  auto b1 = parser().make_verse( 3 );
  VerseCollection right( Verses{ b1 },
    bibref::RemovedReferences{ parser().make_verse(-4) } );

  VerseCollection sum = left + right;
  EXPECT_EQ( sum.items(), Verses({ a1, a2, b1 }) );
  ASSERT_EQ( sum.invalid_items().size(), 1u );
  EXPECT_EQ( sum.invalid_items().front(), bad );

  VerseCollection from_vector = left + Verses{ b1, a1 };
  EXPECT_EQ( from_vector.items(), Verses({ a1, a2, b1, a1 }) );
  EXPECT_EQ( from_vector.invalid_items().size(), 1u );

  // Operands are untouched
  EXPECT_EQ( left.size(), 2u );
  EXPECT_EQ( right.size(), 1u );
}

TEST(ReferenceCollection, UnionKeepsDuplicates) {
  auto v = parser().make_verse( 5 );
  VerseCollection verses( Verses{ v } );
  EXPECT_EQ( ( verses + verses ).items(), Verses({ v, v }) );
}

TEST(ReferenceCollection, DifferenceRemovesByIdentity) {
  auto a1 = parser().make_verse( 1 );
  auto a2 = parser().make_verse( 2 );
  auto also_two = parser().make_verse( 2 );
  VerseCollection verses( Verses{ a1, a2, a1 },
    bibref::RemovedReferences{ parser().make_verse(0) } );

  VerseCollection without_one = verses - Verses{ a1, also_two };
  EXPECT_EQ( without_one.items(), Verses({ a2 }) );
  EXPECT_EQ( without_one.invalid_items().size(), 1u );

  VerseCollection nothing_left = verses - verses;
  EXPECT_TRUE( nothing_left.empty() );
  EXPECT_EQ( nothing_left.invalid_items().size(), 1u );
}

TEST(ReferenceCollection, ErrorsComeFromItselfThenInvalidThenValidItems) {
  auto low = parser().make_verse( 0 );
  auto negative = parser().make_verse( -3 );
  VerseCollection verses( Verses{ parser().make_verse(1), negative } );
  verses.add_error( "collection" );
  verses << low;

  EXPECT_EQ( verses.errors(), bibref::ErrorMessages({
    "collection",
    "The verse number '-3' is not valid",
    "The verse number '0' is not valid" }) );

  // Moving items to invalid_items changes the order, not the content
  verses.clean();
  EXPECT_EQ( verses.errors(), bibref::ErrorMessages({
    "collection",
    "The verse number '-3' is not valid",
    "The verse number '0' is not valid" }) );

  verses.clear_errors();
  EXPECT_EQ( verses.errors().size(), 2u );
  EXPECT_TRUE( verses.has_errors() );
}

TEST(ReferenceCollection, ErrorsAreReportedOnce) {
  VerseCollection verses;
  verses << parser().make_verse( 0 ) << parser().make_verse( 0 );
  verses.add_error( "The verse number '0' is not valid" );

  EXPECT_EQ( verses.errors(),
    bibref::ErrorMessages({ "The verse number '0' is not valid" }) );
}

TEST(ReferenceCollection, CleanMovesInvalidItems) {
  auto one = parser().make_verse( 1 );
  auto zero = parser().make_verse( 0 );
  auto two = parser().make_verse( 2 );
  auto negative = parser().make_verse( -1 );
  VerseCollection verses( Verses{ one, zero, two, negative } );

  bibref::RemovedReferences removed = verses.clean();
  EXPECT_EQ( removed, bibref::RemovedReferences({ zero, negative }) );
  EXPECT_EQ( verses.items(), Verses({ one, two }) );
  EXPECT_EQ( verses.invalid_items(),
    bibref::RemovedReferences({ zero, negative }) );
}

TEST(ReferenceCollection, CleanIsIdempotent) {
  bibref::BookCollection books
    = parser().parse_books( "Exoduth 1:1, Numbers 100" );

  EXPECT_EQ( books.clean().size(), 2u );
  const auto items = books.items();
  const auto invalid = books.invalid_items();

  EXPECT_TRUE( books.clean().empty() );
  EXPECT_EQ( books.items(), items );
  EXPECT_EQ( books.invalid_items(), invalid );
}

TEST(ReferenceCollection, CleanKeepsEveryReferenceExactlyOnce) {
  Verses all;
  for ( std::int64_t n : { 3, 0, 4, -2, 5, 0 } ) {
    all.push_back( parser().make_verse(n) );
  }
  VerseCollection verses( all );

  verses.clean();
  verses.clean( false );
  for ( const auto& v : all ) {
    EXPECT_EQ( occurrences(verses, v), 1 );
  }
  EXPECT_EQ( verses.size(), 3u );
  EXPECT_EQ( verses.invalid_items().size(), 3u );
}

TEST(ReferenceCollection, CleanWithoutChainLeavesChildrenAlone) {
  bibref::BookCollection books
    = parser().parse_books( "Matthew 1:26, Exoduth" );
  ASSERT_EQ( books.size(), 2u );

  bibref::RemovedReferences removed = books.clean( false );
  ASSERT_EQ( removed.size(), 1u );
  EXPECT_EQ( removed.front()->errors(),
    bibref::ErrorMessages({ "The book 'Exoduth' could not be found" }) );

  ASSERT_EQ( books.size(), 1u );
  const bibref::ChapterReference& chapter = books.first().chapters()->first();
  EXPECT_EQ( chapter.verses()->size(), 1u );
  EXPECT_TRUE( chapter.verses()->invalid_items().empty() );
}

TEST(ReferenceCollection, CleanWithChainCollectsRemovedDescendants) {
  bibref::BookCollection books
    = parser().parse_books( "Matthew 1:26, Exoduth" );

  bibref::RemovedReferences removed = books.clean();
  ASSERT_EQ( removed.size(), 2u );

  // This level first, then what the chain removed below
  EXPECT_NE( std::dynamic_pointer_cast< bibref::BookReference >(removed[0]),
    nullptr );
  auto verse = std::dynamic_pointer_cast< VerseReference >( removed[1] );
  ASSERT_NE( verse, nullptr );
  EXPECT_EQ( verse->errors(), bibref::ErrorMessages({
    "The verse '26' does not exist for Matthew 1" }) );

  EXPECT_EQ( books.invalid_items(), removed );
  ASSERT_EQ( books.size(), 1u );
  EXPECT_TRUE( books.first().chapters()->first().verses()->empty() );

  EXPECT_EQ( books.errors(), bibref::ErrorMessages({
    "The book 'Exoduth' could not be found",
    "The verse '26' does not exist for Matthew 1" }) );
}

TEST(ReferenceCollection, CleanCascadesInvalidChaptersToTheBooks) {
  bibref::BookCollection books = parser().parse_books( "Numbers 100" );
  ASSERT_EQ( books.size(), 1u );

  bibref::RemovedReferences removed = books.clean();
  ASSERT_EQ( removed.size(), 1u );
  auto chapter
    = std::dynamic_pointer_cast< bibref::ChapterReference >( removed[0] );
  ASSERT_NE( chapter, nullptr );
  EXPECT_FALSE( chapter->is_valid() );

  // The book itself is still valid, only emptied
  ASSERT_EQ( books.size(), 1u );
  EXPECT_TRUE( books.first().chapters()->empty() );
  EXPECT_EQ( books.first().chapters()->invalid_items().size(), 1u );
  EXPECT_EQ( books.invalid_items().size(), 1u );
}
