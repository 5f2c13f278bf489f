#include "fitscodec/file/exceptions.hpp"
#include "fitscodec/table/asciitable.hpp"
#include "fitscodec/table/tableentry.hpp"
#include "fitscodec/table/tableentryformat.hpp"

#include <sstream>

#include <boost/test/unit_test.hpp>

using namespace fitscodec::file;
using namespace fitscodec::table;
using namespace fitscodec;

using namespace std;
using namespace boost::unit_test;


namespace testsuite {

    namespace table {

        string printed( const TableEntryFormat& fmt ) {
            ostringstream oss;
            oss << fmt;
            return oss.str();
        }


        void formatTest( void ) {

            TableEntryFormat fmt = TableEntryFormat::parse( "A10" );
            BOOST_CHECK( fmt.kind() == TableEntryFormat::CHAR );
            BOOST_TEST( fmt.width() == 10 );
            BOOST_TEST( printed( fmt ) == "Char(10)" );

            fmt = TableEntryFormat::parse( "I5" );
            BOOST_CHECK( fmt.kind() == TableEntryFormat::INT );
            BOOST_TEST( fmt.width() == 5 );
            BOOST_TEST( printed( fmt ) == "Int(5)" );
            BOOST_CHECK( fmt.numeric() );

            fmt = TableEntryFormat::parse( "F8.3" );
            BOOST_CHECK( fmt.kind() == TableEntryFormat::FLOAT );
            BOOST_TEST( fmt.width() == 8 );
            BOOST_TEST( fmt.precision() == 3 );
            BOOST_TEST( printed( fmt ) == "Float(8,3)" );
            BOOST_TEST( fmt.code() == "F8.3" );

            BOOST_CHECK( TableEntryFormat::parse( " I12 " ) == TableEntryFormat::intFormat( 12 ) );
            BOOST_CHECK( TableEntryFormat::parse( "F7" ) == TableEntryFormat::floatFormat( 7, 0 ) );
            BOOST_CHECK( TableEntryFormat::parse( "A3" ) != TableEntryFormat::parse( "A4" ) );

            // anything else is Invalid, keeping the text as it was
            const char* bad[] = { "", "A", "X5", "a10", "A0", "I5.2", "F8.", "F.3", "A-1", "I 5", "E12.4",
                                  "F8.3.1", "A1234567890", "10A" };
            for( const char* code: bad ) {
                fmt = TableEntryFormat::parse( code );
                BOOST_CHECK_MESSAGE( !fmt.valid(), "\"" << code << "\" should be invalid" );
                BOOST_TEST( fmt.text() == code );
                BOOST_TEST( fmt.code() == code );
                BOOST_TEST( fmt.fieldWidth() == 0 );
                BOOST_TEST( printed( fmt ) == "Invalid(\"" + string( code ) + "\")" );
            }

            BOOST_TEST( TableEntryFormat::parse( "F8.3" ).withWidth( 12 ).code() == "F12.3" );
            BOOST_TEST( TableEntryFormat::parse( "Q8" ).withWidth( 12 ).code() == "Q8" );

        }


        void entryTest( void ) {

            TableEntryFormat a8 = TableEntryFormat::charFormat( 8 );
            TableEntryFormat i5 = TableEntryFormat::intFormat( 5 );
            TableEntryFormat f6 = TableEntryFormat::floatFormat( 6, 2 );

            BOOST_TEST( boost::get<string>( makeEntry( "  hello ", a8 ) ) == "  hello" );
            BOOST_TEST( boost::get<string>( makeEntry( "        ", a8 ) ) == "" );
            BOOST_TEST( boost::get<int64_t>( makeEntry( "  42 ", i5 ) ) == 42 );
            BOOST_TEST( boost::get<int64_t>( makeEntry( "-1234", i5 ) ) == -1234 );
            BOOST_TEST( boost::get<double>( makeEntry( "  3.25", f6 ) ) == 3.25 );
            BOOST_TEST( boost::get<double>( makeEntry( "1.5E2", f6 ) ) == 150.0 );
            BOOST_TEST( boost::get<double>( makeEntry( "  1234", f6 ) ) == 12.34 );      // implied decimal point
            BOOST_TEST( boost::get<double>( makeEntry( " 1.5D2", f6 ) ) == 150.0 );
            BOOST_TEST( boost::get<double>( makeEntry( "-25d-1", f6 ) ) == -2.5 );

            // blank numeric fields
            BOOST_TEST( boost::get<int64_t>( makeEntry( "     ", i5 ) ) == 0 );
            BOOST_TEST( boost::get<double>( makeEntry( "      ", f6 ) ) == 0.0 );
            BOOST_CHECK_THROW( makeEntry( "     ", i5, 0, 0, false ), ParseError );

            try {
                makeEntry( " 4x2 ", i5, 7, 3 );
                BOOST_ERROR( "\" 4x2 \" should not parse as an integer" );
            } catch( const ParseError& e ) {
                BOOST_TEST( e.row() == 7 );
                BOOST_TEST( e.field() == 3 );
                BOOST_TEST( e.text() == " 4x2 " );
            }
            BOOST_CHECK_THROW( makeEntry( "1.5", i5 ), ParseError );
            BOOST_CHECK_THROW( makeEntry( "abc", f6 ), FormatError );
            BOOST_CHECK_THROW( makeEntry( "abc", TableEntryFormat::parse( "Z3" ) ), SetupError );

            BOOST_TEST( renderEntry( TableEntry( int64_t(42) ), i5 ) == "42" );
            TableEntryFormat f83 = TableEntryFormat::floatFormat( 8, 3 );
            BOOST_TEST( renderEntry( TableEntry( 3.25 ), f83 ) == "3.250" );
            BOOST_TEST( renderEntry( TableEntry( -2.0 ), f83 ) == "-2.000" );
            // more digits than declared when the value needs them, or the exponent form if shorter
            BOOST_TEST( renderEntry( TableEntry( 3.14159 ), f83 ) == "3.14159" );
            BOOST_TEST( renderEntry( TableEntry( 1e-20 ), f83 ) == "1E-20" );
            BOOST_TEST( renderEntry( TableEntry( string( "text" ) ), a8 ) == "text" );

        }


        void columnTest( void ) {

            Column<int64_t> col( string( "N" ) );
            BOOST_TEST( col.length() == 0 );
            BOOST_TEST( *col.label() == "N" );
            BOOST_CHECK( col.format() == TableEntryFormat::intFormat( 1 ) );
            col.push_back( 5 );
            col.append( TableEntry( int64_t(-6) ) );
            BOOST_TEST( col.length() == 2 );
            BOOST_TEST( col[1] == -6 );
            BOOST_TEST( col.render( 1 ) == "-6" );
            BOOST_CHECK_THROW( col.append( TableEntry( string( "x" ) ) ), BadArgument );
            BOOST_CHECK_THROW( col.append( TableEntry( 1.0 ) ), BadArgument );
            BOOST_CHECK_THROW( col.render( 2 ), IndexOutOfBounds );

            vector<string> all = col.renderAll();
            BOOST_REQUIRE( all.size() == 2 );
            BOOST_TEST( all[0] == "5" );

            Column<double> dcol;
            BOOST_CHECK( !dcol.label() );
            dcol.push_back( 0.5 );
            BOOST_TEST( dcol.render( 0 ) == "0.500000" );

        }


        void tableTest( void ) {

            AsciiTable tbl( 2 );
            tbl.addColumn( Column<string>( string( "NAME" ), TableEntryFormat::charFormat( 6 ) ) );
            tbl.addColumn( Column<double>( string( "X" ), TableEntryFormat::floatFormat( 8, 2 ) ) );
            BOOST_TEST( tbl.nColumns() == 2 );
            BOOST_TEST( tbl.nRows() == 2 );
            BOOST_TEST( tbl.maxColumnLength() == 0 );

            tbl.addRow( { string( "one" ), 1.5 } );
            BOOST_CHECK_THROW( tbl.addRow( { string( "two" ) } ), BadArgument );
            BOOST_CHECK_THROW( tbl.addRow( { 2.5, string( "two" ) } ), BadArgument );
            BOOST_CHECK_THROW( tbl.addColumn( ColumnBase::Ptr() ), BadArgument );

            // copies are deep
            AsciiTable copy( tbl );
            copy.addRow( { string( "two" ), 2.5 } );
            BOOST_TEST( copy.maxColumnLength() == 2 );
            BOOST_TEST( tbl.maxColumnLength() == 1 );

            AsciiTable assigned;
            assigned = copy;
            BOOST_TEST( assigned.column<string>( 0 )[1] == "two" );
            BOOST_TEST( assigned.column<double>( 1 )[1] == 2.5 );

            BOOST_CHECK_THROW( tbl.column( 2 ), IndexOutOfBounds );
            BOOST_CHECK_THROW( tbl.column<int64_t>( 1 ), BadArgument );

            vector<TableEntryFormat> fmts = tbl.formats();
            BOOST_REQUIRE( fmts.size() == 2 );
            BOOST_TEST( fmts[1].code() == "F8.2" );

            vector<ColumnBase::Ptr> cols = tbl.release();
            BOOST_TEST( cols.size() == 2 );
            BOOST_TEST( tbl.nColumns() == 0 );

        }


        void add_codec_tests( test_suite* ts );     // defined in codec.cpp

        void add_tests( test_suite* ts ) {

            ts->add( BOOST_TEST_CASE_NAME( &formatTest, "Field formats" ) );
            ts->add( BOOST_TEST_CASE_NAME( &entryTest, "Table entries" ) );
            ts->add( BOOST_TEST_CASE_NAME( &columnTest, "Columns" ) );
            ts->add( BOOST_TEST_CASE_NAME( &tableTest, "Tables" ) );

            add_codec_tests( ts );

        }

    }

}
