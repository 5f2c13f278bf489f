#include "fitscodec/file/exceptions.hpp"
#include "fitscodec/file/hdu.hpp"
#include "fitscodec/file/header.hpp"
#include "fitscodec/logging/logger.hpp"

#include "testsuite.hpp"

#include <sstream>
#include <stdexcept>

#include <boost/lexical_cast.hpp>
#include <boost/test/unit_test.hpp>

using namespace fitscodec::file;
using namespace fitscodec::image;
using namespace fitscodec::logging;
using namespace fitscodec::table;
using namespace fitscodec::util;
using namespace fitscodec;
using namespace testsuite;

using namespace std;
using namespace boost::unit_test;


namespace testsuite {

    namespace file {

        void testFitsCards( void ) {
            
            BOOST_TEST( Header::makeKey( "naxis1" ) == "NAXIS1  " );
            BOOST_TEST( Header::makeKey( "  date-obs " ) == "DATE-OBS" );
            BOOST_TEST( Header::makeKey( "averyverylongkey" ) == "AVERYVER" );
            BOOST_TEST( Header::makeKey( "" ) == "        " );
            BOOST_CHECK_THROW( Header::makeKey( "bad key" ), std::domain_error );
            BOOST_CHECK_THROW( Header::makeKey( "key=" ), std::domain_error );
            
            string card = Header::makeCard( "NAXIS", 2 );
            BOOST_TEST( card.size() == Header::CARD_SIZE );
            BOOST_TEST( compare_strings( card.substr( 0, 30 ), "NAXIS   = " + string( 19, ' ' ) + "2" ) );
            BOOST_TEST( compare_strings( card.substr( 30 ), string( 50, ' ' ) ) );

            string key, value, comment;
            Header::splitCard( card, key, value, comment );
            BOOST_TEST( key == "NAXIS" );
            BOOST_TEST( value == "2" );
            BOOST_TEST( comment == "" );
            BOOST_TEST( Header::getValue<int32_t>( value ) == 2 );

            // strings are quoted, embedded quotes are doubled
            card = Header::makeCard( "OBJECT", "it's", "target" );
            BOOST_TEST( card.size() == Header::CARD_SIZE );
            BOOST_TEST( compare_strings( card.substr( 0, 17 ), "OBJECT  = 'it''s'" ) );
            BOOST_TEST( card.substr( 30, 10 ) == " / target " );
            Header::splitCard( card, key, value, comment );
            BOOST_TEST( key == "OBJECT" );
            BOOST_TEST( value == "'it''s'" );
            BOOST_TEST( comment == "target" );
            BOOST_TEST( Header::getValue<string>( value ) == "it's" );

            // a slash inside a string is not the start of a comment
            card = Header::makeCard( "PATH", "a/b", "where" );
            Header::splitCard( card, key, value, comment );
            BOOST_TEST( Header::getValue<string>( value ) == "a/b" );
            BOOST_TEST( comment == "where" );

            const double d( -1234.567890123456789 );
            card = Header::makeCard( "DVAL", d, "double" );
            Header::splitCard( card, key, value, comment );
            BOOST_TEST( Header::getValue<double>( value ) == d );
            BOOST_TEST( comment == "double" );
            
            const float f( 1.5e-20f );
            card = Header::makeCard( "FVAL", f );
            Header::splitCard( card, key, value, comment );
            BOOST_TEST( Header::getValue<float>( value ) == f );

            card = Header::makeCard( "SIMPLE", true );
            BOOST_TEST( card[29] == 'T' );
            Header::splitCard( card, key, value, comment );
            BOOST_TEST( Header::getValue<bool>( value ) );
            BOOST_TEST( !Header::getValue<bool>( "F" ) );
            BOOST_CHECK_THROW( Header::getValue<bool>( "X" ), boost::bad_lexical_cast );

            card = Header::makeCommentCard( "HISTORY", "processed twice" );
            BOOST_TEST( card.size() == Header::CARD_SIZE );
            BOOST_TEST( card.substr( 0, 23 ) == "HISTORY processed twice" );
            Header::splitCard( card, key, value, comment );
            BOOST_TEST( key == "HISTORY" );
            BOOST_TEST( value == "" );
            BOOST_TEST( comment == "processed twice" );

            BOOST_CHECK_THROW( Header::makeCard( "KEY", string( "a\tb" ) ), std::domain_error );
            BOOST_CHECK_THROW( Header::makeCard( "KEY", string( 75, 'x' ) ), std::domain_error );

        }


        void testHeaderCards( void ) {

            Header hdr;
            hdr.add( Header::makeCard( "NAXIS", 2 ) );
            hdr.add( Header::makeCard( "NAXIS", 3 ) );          // single-valued keys are not duplicated
            BOOST_TEST( hdr.cards.size() == 1 );
            BOOST_TEST( hdr.get<int32_t>( "NAXIS" ) == 2 );
            BOOST_TEST( hdr.has( "naxis" ) );
            BOOST_TEST( !hdr.has( "NAXIS1" ) );

            BOOST_TEST( !hdr.emplace( Header::makeCard( "NAXIS", 3 ) ) );
            BOOST_TEST( hdr.get<int32_t>( "NAXIS" ) == 3 );
            BOOST_TEST( hdr.emplace( Header::makeCard( "TELESCOP", "SST" ) ) );
            BOOST_TEST( hdr.get<string>( "TELESCOP" ) == "SST" );

            hdr.add( Header::makeCommentCard( "COMMENT", "first" ) );
            hdr.add( Header::makeCommentCard( "COMMENT", "second" ) );
            BOOST_TEST( hdr.cards.size() == 4 );
            hdr.remove( "comment" );
            BOOST_TEST( hdr.cards.size() == 2 );

            BOOST_CHECK_THROW( hdr.get<int32_t>( "MISSING" ), FormatError );
            BOOST_TEST( hdr.get<int32_t>( "MISSING", 7 ) == 7 );
            BOOST_TEST( hdr.get<int32_t>( "NAXIS", 7 ) == 3 );
            BOOST_CHECK_THROW( hdr.get<int32_t>( "TELESCOP" ), FormatError );
            BOOST_TEST( hdr.getCard( "MISSING" ) == "" );

        }


        void testHeaderIO( void ) {

            Header hdr;
            for( int i = 0; i < 40; ++i ) {                     // more than fits in one block
                hdr.add( Header::makeCard( "KEY" + to_string(i), i ) );
            }

            ostringstream oss;
            BlockWriter writer( oss );
            hdr.write( writer );
            string bytes = oss.str();
            BOOST_TEST( bytes.size() == 2*BLOCK_SIZE );
            BOOST_TEST( bytes.substr( 40*80, 3 ) == "END" );
            BOOST_TEST( bytes.find_first_not_of( ' ', 40*80+3 ) == string::npos );

            istringstream iss( bytes );
            BlockReader reader( iss );
            Header hdr2 = Header::read( reader );
            BOOST_TEST( reader.cursor() == 2*BLOCK_SIZE );
            BOOST_TEST( hdr2.cards == hdr.cards );
            BOOST_TEST( hdr2.get<int32_t>( "KEY39" ) == 39 );

            // non-ASCII byte in a card
            string bad = blockPadded( Header::makeCard( "SIMPLE", true ) + "END" );
            bad[20] = char( 0x80 );
            istringstream iss2( bad );
            BlockReader reader2( iss2 );
            BOOST_CHECK_THROW( Header::read( reader2 ), FormatError );

            // no END card before the stream ends
            istringstream iss3( blockPadded( Header::makeCard( "SIMPLE", true ) ) );
            BlockReader reader3( iss3 );
            BOOST_CHECK_THROW( Header::read( reader3 ), DataIOException );

        }


        template <typename T>
        const T& payload( const Hdu& hdu ) {
            BOOST_REQUIRE( hdu.data );
            return boost::get<T>( *hdu.data );
        }


        void testImageHdu( void ) {

            Logger logger;
            HduCodec codec( logger );

            Array<int16_t> arr( 4, 5 );
            for( int j = 0; j < 5; ++j ) {
                for( int i = 0; i < 4; ++i ) {
                    arr( i, j ) = i + 10*j - 7;
                }
            }

            Hdu hdu;
            hdu.header.add( Header::makeCard( "OBJECT", "sun" ) );
            hdu.header.add( Header::makeCard( "NAXIS", 9 ) );       // structural keys are regenerated
            hdu.header.add( Header::makeCard( "BITPIX", -64 ) );
            hdu.data = Extension( TypedImage( arr ) );

            ostringstream oss;
            BlockWriter writer( oss );
            codec.write( writer, hdu, true );
            string bytes = oss.str();
            BOOST_TEST( bytes.size() == 2*BLOCK_SIZE );
            BOOST_TEST( bytes.substr( 0, 6 ) == "SIMPLE" );
            // first element (-7) as big-endian int16
            BOOST_TEST( (uint8_t)bytes[BLOCK_SIZE] == 0xFF );
            BOOST_TEST( (uint8_t)bytes[BLOCK_SIZE+1] == 0xF9 );

            istringstream iss( bytes );
            BlockReader reader( iss );
            Hdu hdu2 = codec.read( reader );
            BOOST_TEST( reader.cursor() == 2*BLOCK_SIZE );
            BOOST_CHECK( reader.atEnd() );
            BOOST_TEST( hdu2.header.get<bool>( "SIMPLE" ) );
            BOOST_TEST( hdu2.header.get<int32_t>( "BITPIX" ) == 16 );
            BOOST_TEST( hdu2.header.get<int32_t>( "NAXIS" ) == 2 );
            BOOST_TEST( hdu2.header.get<int32_t>( "NAXIS1" ) == 4 );
            BOOST_TEST( hdu2.header.get<int32_t>( "NAXIS2" ) == 5 );
            BOOST_TEST( hdu2.header.get<string>( "OBJECT" ) == "sun" );
            BOOST_REQUIRE( hdu2.data );
            BOOST_CHECK( extensionType( *hdu2.data ) == EXT_IMAGE );
            BOOST_CHECK( payload<TypedImage>( hdu2 ).get<int16_t>() == arr );

        }


        void testMultipleHdus( void ) {

            Logger logger;
            HduCodec codec( logger );

            Column<string> names( string( "NAME" ) );
            names.push_back( "Vega" );
            names.push_back( "Altair" );
            Column<double> mags( string( "MAG" ), TableEntryFormat::floatFormat( 6, 2 ) );
            mags.push_back( 0.03 );
            mags.push_back( 0.77 );
            AsciiTable tbl;
            tbl.addColumn( names );
            tbl.addColumn( mags );

            Array<float> img( 3, 2 );
            float v(0.5);
            for( auto& f: img ) f = (v *= -2);

            BinTable bin;
            bin.rowWidth = 8;
            bin.nRows = 3;
            bin.heapSize = 4;
            bin.formats = { "1J", "1E" };
            bin.labels = { string( "ID" ), boost::none };
            for( size_t i = 0; i < bin.dataSize(); ++i ) bin.data.push_back( char(i) );

            vector<Hdu> hdus( 4 );
            hdus[0].header.add( Header::makeCard( "ORIGIN", "testsuite" ) );
            hdus[1].data = Extension( tbl );
            hdus[2].data = Extension( TypedImage( img ) );
            hdus[2].header.add( Header::makeCard( "EXTNAME", "FLUX" ) );
            hdus[3].data = Extension( bin );

            ostringstream oss;
            BlockWriter writer( oss );
            for( size_t i = 0; i < hdus.size(); ++i ) {
                codec.write( writer, hdus[i], (i == 0) );
            }
            BOOST_TEST( oss.str().size() % BLOCK_SIZE == 0 );

            istringstream iss( oss.str() );
            BlockReader reader( iss );
            vector<Hdu> hdus2 = codec.readAll( reader );
            BOOST_REQUIRE( hdus2.size() == 4 );

            BOOST_CHECK( !hdus2[0].data );
            BOOST_TEST( hdus2[0].header.get<int32_t>( "NAXIS" ) == 0 );
            BOOST_TEST( hdus2[0].header.get<string>( "ORIGIN" ) == "testsuite" );

            BOOST_TEST( hdus2[1].header.get<string>( "XTENSION" ) == "TABLE" );
            BOOST_TEST( hdus2[1].header.get<string>( "TTYPE2" ) == "MAG" );
            const AsciiTable& tbl2 = payload<AsciiTable>( hdus2[1] );
            BOOST_REQUIRE( tbl2.nColumns() == 2 );
            BOOST_TEST( tbl2.nRows() == 2 );
            BOOST_TEST( tbl2.column<string>( 0 ).data() == names.data() );
            BOOST_TEST( tbl2.column<double>( 1 )[1] == 0.77 );
            BOOST_CHECK( tbl2.column( 0 ).label() == string( "NAME" ) );

            BOOST_TEST( hdus2[2].header.get<string>( "EXTNAME" ) == "FLUX" );
            BOOST_CHECK( payload<TypedImage>( hdus2[2] ).get<float>() == img );

            const BinTable& bin2 = payload<BinTable>( hdus2[3] );
            BOOST_TEST( bin2.rowWidth == 8 );
            BOOST_TEST( bin2.nRows == 3 );
            BOOST_TEST( bin2.heapSize == 4 );
            BOOST_TEST( bin2.formats == bin.formats );
            BOOST_CHECK( bin2.labels[0] == string( "ID" ) );
            BOOST_CHECK( !bin2.labels[1] );
            BOOST_CHECK( bin2.data == bin.data );

        }


        void testRandomGroups( void ) {

            Logger logger;
            HduCodec codec( logger );

            RandomGroups rg;
            rg.bitpix = BITPIX_FLOAT;
            rg.axes = { 3, 2 };
            rg.nParameters = 2;
            rg.nGroups = 4;
            BOOST_TEST( rg.dataSize() == 4*4*(2+6) );
            for( size_t i = 0; i < rg.dataSize(); ++i ) rg.data.push_back( char(i) );

            Hdu hdu;
            hdu.data = Extension( rg );

            ostringstream oss;
            BlockWriter writer( oss );
            BOOST_CHECK_THROW( codec.write( writer, hdu, false ), BadArgument );
            codec.write( writer, hdu, true );

            istringstream iss( oss.str() );
            BlockReader reader( iss );
            Hdu hdu2 = codec.read( reader );
            BOOST_TEST( hdu2.header.get<int32_t>( "NAXIS1" ) == 0 );
            BOOST_TEST( hdu2.header.get<bool>( "GROUPS" ) );
            const RandomGroups& rg2 = payload<RandomGroups>( hdu2 );
            BOOST_CHECK( rg2.bitpix == BITPIX_FLOAT );
            BOOST_CHECK( rg2.axes == rg.axes );
            BOOST_TEST( rg2.nParameters == 2 );
            BOOST_TEST( rg2.nGroups == 4 );
            BOOST_CHECK( rg2.data == rg.data );

        }


        void testBadHdus( void ) {

            Logger logger;
            HduCodec codec( logger );

            {   // tables can not be primary
                AsciiTable tbl;
                Column<int64_t> col;
                col.push_back( 1 );
                tbl.addColumn( col );
                Hdu hdu;
                hdu.data = Extension( tbl );
                ostringstream oss;
                BlockWriter writer( oss );
                BOOST_CHECK_THROW( codec.write( writer, hdu, true ), BadArgument );
                BOOST_CHECK_NO_THROW( codec.write( writer, hdu, false ) );
            }

            auto readHeaderOnly = [&]( const Header& hdr ) -> Hdu {
                ostringstream oss;
                BlockWriter writer( oss );
                hdr.write( writer );
                istringstream iss( oss.str() );
                BlockReader reader( iss );
                return codec.read( reader );
            };

            Header hdr;
            hdr.add( Header::makeCard( "XTENSION", "FOO" ) );
            hdr.add( Header::makeCard( "BITPIX", 8 ) );
            hdr.add( Header::makeCard( "NAXIS", 0 ) );
            BOOST_CHECK_THROW( readHeaderOnly( hdr ), FormatError );

            hdr.cards.clear();
            hdr.add( Header::makeCard( "SIMPLE", true ) );
            hdr.add( Header::makeCard( "BITPIX", 12 ) );
            hdr.add( Header::makeCard( "NAXIS", 0 ) );
            BOOST_CHECK_THROW( readHeaderOnly( hdr ), FormatError );

            hdr.cards.clear();
            hdr.add( Header::makeCard( "SIMPLE", true ) );
            hdr.add( Header::makeCard( "BITPIX", 8 ) );
            BOOST_CHECK_THROW( readHeaderOnly( hdr ), FormatError );     // no NAXIS

            hdr.cards.clear();
            hdr.add( Header::makeCard( "BITPIX", 8 ) );
            hdr.add( Header::makeCard( "NAXIS", 0 ) );
            BOOST_CHECK_THROW( readHeaderOnly( hdr ), FormatError );     // neither SIMPLE nor XTENSION

            hdr.cards.clear();
            hdr.add( Header::makeCard( "SIMPLE", true ) );
            hdr.add( Header::makeCard( "BITPIX", 8 ) );
            hdr.add( Header::makeCard( "NAXIS", 0 ) );
            Hdu empty = readHeaderOnly( hdr );
            BOOST_CHECK( !empty.data );

            hdr.cards.clear();
            hdr.add( Header::makeCard( "XTENSION", "TABLE" ) );
            hdr.add( Header::makeCard( "BITPIX", 8 ) );
            hdr.add( Header::makeCard( "NAXIS", 2 ) );
            hdr.add( Header::makeCard( "NAXIS1", 10 ) );
            hdr.add( Header::makeCard( "NAXIS2", 1 ) );
            hdr.add( Header::makeCard( "TFIELDS", 1 ) );
            hdr.add( Header::makeCard( "TFORM1", "X10" ) );
            BOOST_CHECK_THROW( readHeaderOnly( hdr ), SetupError );

            // data sizes that overflow must not be taken for empty HDUs
            const int64_t big = int64_t(1) << 32;
            hdr.cards.clear();
            hdr.add( Header::makeCard( "SIMPLE", true ) );
            hdr.add( Header::makeCard( "BITPIX", 16 ) );
            hdr.add( Header::makeCard( "NAXIS", 2 ) );
            hdr.add( Header::makeCard( "NAXIS1", big ) );
            hdr.add( Header::makeCard( "NAXIS2", big ) );
            BOOST_CHECK_THROW( readHeaderOnly( hdr ), FormatError );

            hdr.cards.clear();
            hdr.add( Header::makeCard( "XTENSION", "BINTABLE" ) );
            hdr.add( Header::makeCard( "BITPIX", 8 ) );
            hdr.add( Header::makeCard( "NAXIS", 2 ) );
            hdr.add( Header::makeCard( "NAXIS1", big ) );
            hdr.add( Header::makeCard( "NAXIS2", big ) );
            hdr.add( Header::makeCard( "PCOUNT", 0 ) );
            hdr.add( Header::makeCard( "GCOUNT", 1 ) );
            hdr.add( Header::makeCard( "TFIELDS", 0 ) );
            BOOST_CHECK_THROW( readHeaderOnly( hdr ), FormatError );

            hdr.cards.clear();
            hdr.add( Header::makeCard( "XTENSION", "TABLE" ) );
            hdr.add( Header::makeCard( "BITPIX", 8 ) );
            hdr.add( Header::makeCard( "NAXIS", 2 ) );
            hdr.add( Header::makeCard( "NAXIS1", big ) );
            hdr.add( Header::makeCard( "NAXIS2", big ) );
            hdr.add( Header::makeCard( "TFIELDS", 1 ) );
            hdr.add( Header::makeCard( "TFORM1", "A10" ) );
            BOOST_CHECK_THROW( readHeaderOnly( hdr ), FormatError );

            // a zero axis is an empty image, whatever the other axes are
            hdr.cards.clear();
            hdr.add( Header::makeCard( "SIMPLE", true ) );
            hdr.add( Header::makeCard( "BITPIX", 16 ) );
            hdr.add( Header::makeCard( "NAXIS", 3 ) );
            hdr.add( Header::makeCard( "NAXIS1", big ) );
            hdr.add( Header::makeCard( "NAXIS2", big ) );
            hdr.add( Header::makeCard( "NAXIS3", 0 ) );
            BOOST_CHECK( !readHeaderOnly( hdr ).data );

        }


        void add_fits_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &testFitsCards, "Cards" ) );
            ts->add( BOOST_TEST_CASE_NAME( &testHeaderCards, "Header keywords" ) );
            ts->add( BOOST_TEST_CASE_NAME( &testHeaderIO, "Header I/O" ) );
            ts->add( BOOST_TEST_CASE_NAME( &testImageHdu, "Image HDU" ) );
            ts->add( BOOST_TEST_CASE_NAME( &testMultipleHdus, "Multiple HDUs" ) );
            ts->add( BOOST_TEST_CASE_NAME( &testRandomGroups, "Random groups" ) );
            ts->add( BOOST_TEST_CASE_NAME( &testBadHdus, "Malformed HDUs" ) );

        }

    }

}
