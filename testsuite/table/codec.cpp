#include "fitscodec/file/exceptions.hpp"
#include "fitscodec/logging/logger.hpp"
#include "fitscodec/table/asciitablecodec.hpp"

#include "testsuite.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

#include <boost/test/unit_test.hpp>

using namespace fitscodec::file;
using namespace fitscodec::logging;
using namespace fitscodec::table;
using namespace fitscodec;
using namespace testsuite;

using namespace std;
using namespace boost::unit_test;


namespace testsuite {

    namespace table {

        namespace {

            TableLayout makeLayout( size_t rowWidth, size_t nRows, const vector<string>& formats ) {
                TableLayout layout;
                layout.rowWidth = rowWidth;
                layout.nRows = nRows;
                layout.formats = formats;
                return layout;
            }

            // rows of "A6 I4 F7.2", the integer field holds the row number
            string numberedRows( size_t nRows ) {
                string ret;
                for( size_t r = 0; r < nRows; ++r ) {
                    ostringstream row;
                    row << "row" << (r%10) << "  " << setw(4) << r << setw(7) << fixed << setprecision(2) << (r*0.25);
                    ret += row.str();
                }
                return ret;
            }

            AsciiTable decodeString( const AsciiTableCodec& codec, const string& data, const TableLayout& layout ) {
                istringstream iss( data );
                BlockReader reader( iss );
                return codec.decodeTable( reader, layout );
            }

        }


        void decodeTest( void ) {

            Logger logger;
            AsciiTableCodec codec( logger );

            string rows = "alpha   12   3.50"
                          "beta  -300 -12.25"
                          "gamma    71000.00";
            TableLayout layout = makeLayout( 17, 3, { "A6", "I4", "F7.2" } );
            layout.labels = { string( "NAME" ), boost::none };

            istringstream iss( blockPadded( rows, ' ' ) );
            BlockReader reader( iss );
            AsciiTable tbl = codec.decodeTable( reader, layout );
            BOOST_TEST( reader.cursor() == BLOCK_SIZE );

            BOOST_REQUIRE( tbl.nColumns() == 3 );
            BOOST_TEST( tbl.maxColumnLength() == 3 );
            BOOST_TEST( tbl.column<string>( 0 )[0] == "alpha" );
            BOOST_TEST( tbl.column<string>( 0 )[1] == "beta" );
            BOOST_TEST( tbl.column<int64_t>( 1 )[0] == 12 );
            BOOST_TEST( tbl.column<int64_t>( 1 )[1] == -300 );
            BOOST_TEST( tbl.column<int64_t>( 1 )[2] == 7 );
            BOOST_TEST( tbl.column<double>( 2 )[1] == -12.25 );
            BOOST_TEST( tbl.column<double>( 2 )[2] == 1000.0 );

            BOOST_CHECK( tbl.column( 0 ).label() == string( "NAME" ) );
            BOOST_CHECK( !tbl.column( 1 ).label() );
            BOOST_CHECK( !tbl.column( 2 ).label() );
            BOOST_CHECK( tbl.column( 2 ).format() == TableEntryFormat::floatFormat( 7, 2 ) );

            // decode() gives the same table wrapped as an Extension
            istringstream iss2( blockPadded( rows, 0 ) );
            BlockReader reader2( iss2 );
            Extension ext = codec.decode( reader2, layout );
            BOOST_CHECK( extensionType( ext ) == EXT_ASCII_TABLE );
            BOOST_TEST( boost::get<AsciiTable>( ext ).column<int64_t>( 1 ).data() == tbl.column<int64_t>( 1 ).data() );

        }


        void columnStartTest( void ) {

            Logger logger;
            AsciiTableCodec codec( logger );

            // fields listed in another order than they appear in the row
            TableLayout layout = makeLayout( 16, 2, { "I4", "A10" } );
            layout.columnStarts = { 13, 1 };
            AsciiTable tbl = decodeString( codec, blockPadded( "abcdefghij    42"
                                                               "klm       " "    -1" ), layout );
            BOOST_TEST( tbl.column<int64_t>( 0 )[0] == 42 );
            BOOST_TEST( tbl.column<int64_t>( 0 )[1] == -1 );
            BOOST_TEST( tbl.column<string>( 1 )[0] == "abcdefghij" );
            BOOST_TEST( tbl.column<string>( 1 )[1] == "klm" );

            layout.columnStarts = { 13 };
            BOOST_CHECK_THROW( decodeString( codec, blockPadded( "" ), layout ), FormatError );
            layout.columnStarts = { 14, 1 };
            BOOST_CHECK_THROW( decodeString( codec, blockPadded( "" ), layout ), FormatError );
            layout.columnStarts = { 0, 1 };
            BOOST_CHECK_THROW( decodeString( codec, blockPadded( "" ), layout ), FormatError );

            // the cumulative widths do not fit in the row
            BOOST_CHECK_THROW( decodeString( codec, blockPadded( "" ), makeLayout( 10, 1, { "A6", "I5" } ) ), FormatError );

        }


        void exactRowsTest( void ) {

            Logger logger;
            AsciiTableCodec codec( logger );

            // 2880/17 is not an integer, so the last block always holds a partial row of padding.
            for( size_t nRows: { 0, 1, 169, 170, 171, 500 } ) {
                string rows = numberedRows( nRows );
                BOOST_REQUIRE( rows.size() == 17*nRows );
                istringstream iss( blockPadded( rows, ' ' ) + string( BLOCK_SIZE, '#' ) );
                BlockReader reader( iss );
                AsciiTable tbl = codec.decodeTable( reader, makeLayout( 17, nRows, { "A6", "I4", "F7.2" } ) );
                BOOST_TEST( tbl.maxColumnLength() == nRows );
                BOOST_TEST( tbl.column( 0 ).length() == nRows );
                BOOST_TEST( tbl.column( 2 ).length() == nRows );
                BOOST_TEST( reader.cursor() == paddedSize( 17*nRows ) );
                if( nRows ) {
                    BOOST_TEST( tbl.column<int64_t>( 1 )[nRows-1] == int64_t(nRows-1) );
                }
            }

        }


        void deterministicTest( void ) {

            Logger logger;
            CodecSettings settings;
            settings.nThreads = 4;
            AsciiTableCodec codec( logger, settings );

            const size_t nRows = 1000;
            string data = blockPadded( numberedRows( nRows ) );
            TableLayout layout = makeLayout( 17, nRows, { "A6", "I4", "F7.2" } );

            AsciiTable tbl1 = decodeString( codec, data, layout );
            AsciiTable tbl2 = decodeString( codec, data, layout );
            for( size_t c = 0; c < 3; ++c ) {
                BOOST_CHECK( tbl1.column( c ).renderAll() == tbl2.column( c ).renderAll() );
            }
            const vector<int64_t>& numbers = tbl1.column<int64_t>( 1 ).data();
            for( size_t r = 0; r < nRows; ++r ) {
                BOOST_REQUIRE( numbers[r] == int64_t(r) );
                BOOST_REQUIRE( tbl1.column<double>( 2 )[r] == r*0.25 );
            }

        }


        void decodeErrorTest( void ) {

            Logger logger;
            CodecSettings settings;
            settings.nThreads = 4;
            AsciiTableCodec codec( logger, settings );

            // a bad format is reported before anything is read
            {
                istringstream iss( blockPadded( numberedRows( 3 ) ) );
                BlockReader reader( iss );
                try {
                    codec.decodeTable( reader, makeLayout( 17, 3, { "A6", "X4", "F7.2" } ) );
                    BOOST_ERROR( "X4 should not be accepted" );
                } catch( const SetupError& e ) {
                    BOOST_TEST( e.code() == "X4" );
                }
                BOOST_TEST( reader.cursor() == 0 );
            }

            // the first failing row, in file order, is reported
            string rows = numberedRows( 200 );
            rows.replace( 17*150 + 6, 4, "  x1" );
            rows.replace( 17*40 + 6, 4, "4 4 " );
            try {
                decodeString( codec, blockPadded( rows ), makeLayout( 17, 200, { "A6", "I4", "F7.2" } ) );
                BOOST_ERROR( "should not parse" );
            } catch( const ParseError& e ) {
                BOOST_TEST( e.row() == 40 );
                BOOST_TEST( e.field() == 1 );
                BOOST_TEST( e.text() == "4 4 " );
                BOOST_TEST( string( e.what() ).find( "field 2 of row 40" ) != string::npos );
            }

            // non-ASCII text, fields are numbered from 1 in the message like TFORMn
            rows = numberedRows( 2 );
            rows[17+7] = char( 0xE5 );
            try {
                decodeString( codec, blockPadded( rows ), makeLayout( 17, 2, { "A6", "I4", "F7.2" } ) );
                BOOST_ERROR( "non-ASCII text should not be accepted" );
            } catch( const ParseError& ) {
                BOOST_ERROR( "non-ASCII text should be a format error, not a parse error" );
            } catch( const FormatError& e ) {
                BOOST_TEST( string( e.what() ).find( "field 2 of row 1" ) != string::npos );
            }

            // a row count that does not fit in memory is refused before reading
            {
                istringstream iss( blockPadded( numberedRows( 3 ) ) );
                BlockReader reader( iss );
                TableLayout huge = makeLayout( numeric_limits<size_t>::max()/2, 3, { "A6", "I4", "F7.2" } );
                BOOST_CHECK_THROW( codec.decodeTable( reader, huge ), FormatError );
                BOOST_TEST( reader.cursor() == 0 );
            }

            // blank numeric fields
            rows = numberedRows( 2 );
            rows.replace( 17 + 6, 4, "    " );
            AsciiTable tbl = decodeString( codec, blockPadded( rows ), makeLayout( 17, 2, { "A6", "I4", "F7.2" } ) );
            BOOST_TEST( tbl.column<int64_t>( 1 )[1] == 0 );
            settings.blankAsZero = false;
            AsciiTableCodec strictCodec( logger, settings );
            BOOST_CHECK_THROW( decodeString( strictCodec, blockPadded( rows ), makeLayout( 17, 2, { "A6", "I4", "F7.2" } ) ),
                               ParseError );

            // data ends before the table does
            BOOST_CHECK_THROW( decodeString( codec, numberedRows( 2 ), makeLayout( 17, 2, { "A6", "I4", "F7.2" } ) ),
                               DataIOException );

        }


        void encodeTest( void ) {

            Logger logger;
            AsciiTableCodec codec( logger );

            AsciiTable tbl;
            Column<string> names( string( "NAME" ) );
            names.push_back( "a" );
            names.push_back( "bb" );
            names.push_back( "ccc" );
            Column<int64_t> numbers;
            numbers.push_back( 1 );
            numbers.push_back( 2 );
            tbl.addColumn( names );
            tbl.addColumn( numbers );

            ostringstream oss;
            BlockWriter writer( oss );
            TableLayout layout = codec.encode( tbl, writer );

            // the short column is padded with an empty entry
            BOOST_TEST( layout.nRows == 3 );
            BOOST_TEST( layout.rowWidth == 4 );
            BOOST_TEST( layout.formats == vector<string>( { "A3", "I1" } ) );
            BOOST_TEST( layout.columnStarts == vector<size_t>( { 1, 4 } ) );
            BOOST_REQUIRE( layout.labels.size() == 2 );
            BOOST_CHECK( layout.labels[0] == string( "NAME" ) );
            BOOST_CHECK( !layout.labels[1] );

            string bytes = oss.str();
            BOOST_TEST( bytes.size() == BLOCK_SIZE );
            BOOST_TEST( compare_strings( bytes.substr( 0, 12 ), "a  1bb 2ccc " ) );
            BOOST_CHECK( bytes.find_first_not_of( '\0', 12 ) == string::npos );

            // and decodes as zero
            AsciiTable tbl2 = decodeString( codec, bytes, layout );
            BOOST_TEST( tbl2.column<string>( 0 ).data() == names.data() );
            BOOST_TEST( tbl2.column<int64_t>( 1 )[2] == 0 );

            // the declared width is kept when it is wider than the data
            AsciiTable wide;
            Column<double> x( boost::none, TableEntryFormat::floatFormat( 10, 3 ) );
            x.push_back( -1.5 );
            wide.addColumn( x );
            CodecSettings settings;
            settings.tableFill = ' ';
            AsciiTableCodec blankCodec( logger, settings );
            ostringstream oss2;
            BlockWriter writer2( oss2 );
            layout = blankCodec.encode( wide, writer2 );
            BOOST_TEST( layout.formats[0] == "F10.3" );
            BOOST_TEST( compare_strings( oss2.str(), blockPadded( "    -1.500", ' ' ) ) );

            // unprintable entries and invalid formats are refused
            AsciiTable bad;
            Column<string> ctrl;
            ctrl.push_back( "tab\there" );
            bad.addColumn( ctrl );
            BOOST_CHECK_THROW( codec.encode( bad, writer ), FormatError );

            AsciiTable invalid;
            invalid.addColumn( Column<string>( boost::none, TableEntryFormat::parse( "Q3" ) ) );
            BOOST_CHECK_THROW( codec.encode( invalid, writer ), SetupError );
            BOOST_TEST( writer.cursor() == BLOCK_SIZE );

        }


        void roundTripTest( void ) {

            Logger logger;
            AsciiTableCodec codec( logger );

            string rows = "alpha   12   3.50"
                          "beta  -300 -12.25"
                          "gamma    71000.00";
            TableLayout layout = makeLayout( 17, 3, { "A6", "I4", "F7.2" } );
            AsciiTable tbl = decodeString( codec, blockPadded( rows ), layout );

            ostringstream oss;
            BlockWriter writer( oss );
            TableLayout layout2 = codec.encode( tbl, writer );
            BOOST_TEST( layout2.formats == layout.formats );
            BOOST_TEST( layout2.rowWidth == 17 );

            AsciiTable tbl2 = decodeString( codec, oss.str(), layout2 );
            BOOST_REQUIRE( tbl2.nColumns() == 3 );
            BOOST_TEST( tbl2.column<string>( 0 ).data() == tbl.column<string>( 0 ).data() );
            BOOST_TEST( tbl2.column<int64_t>( 1 ).data() == tbl.column<int64_t>( 1 ).data() );
            BOOST_TEST( tbl2.column<double>( 2 ).data() == tbl.column<double>( 2 ).data() );

            // an explicit decimal point overrides the declared precision, values must survive encoding
            string precise = " 0.00001"
                             "1.234567"
                             "  1.5D2 ";
            layout = makeLayout( 8, 3, { "F8.3" } );
            tbl = decodeString( codec, blockPadded( precise ), layout );
            vector<double> values = tbl.column<double>( 0 ).data();
            BOOST_REQUIRE( values.size() == 3 );
            BOOST_CHECK_EQUAL( values[0], 0.00001 );
            BOOST_CHECK_EQUAL( values[1], 1.234567 );
            BOOST_CHECK_EQUAL( values[2], 150.0 );

            ostringstream oss2;
            BlockWriter writer2( oss2 );
            layout2 = codec.encode( tbl, writer2 );
            BOOST_TEST( layout2.formats == vector<string>( { "F8.6" } ) );
            BOOST_TEST( layout2.rowWidth == 8 );
            BOOST_TEST( compare_strings( oss2.str().substr( 0, 24 ), "   1E-051.234567 150.000" ) );

            tbl2 = decodeString( codec, oss2.str(), layout2 );
            BOOST_TEST( tbl2.column<double>( 0 ).data() == values );

        }


        void add_codec_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &decodeTest, "Decode" ) );
            ts->add( BOOST_TEST_CASE_NAME( &columnStartTest, "Decode with TBCOL" ) );
            ts->add( BOOST_TEST_CASE_NAME( &exactRowsTest, "Decode exact row count" ) );
            ts->add( BOOST_TEST_CASE_NAME( &deterministicTest, "Decode is deterministic" ) );
            ts->add( BOOST_TEST_CASE_NAME( &decodeErrorTest, "Decode errors" ) );
            ts->add( BOOST_TEST_CASE_NAME( &encodeTest, "Encode" ) );
            ts->add( BOOST_TEST_CASE_NAME( &roundTripTest, "Decode/encode" ) );

        }

    }

}
