#include "fitscodec/table/asciitablecodec.hpp"

#include "fitscodec/file/exceptions.hpp"
#include "fitscodec/util/stringutil.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <exception>
#include <limits>
#include <thread>

using namespace fitscodec::file;
using namespace fitscodec::logging;
using namespace fitscodec::table;
using namespace fitscodec::util;
using namespace fitscodec;
using namespace std;

namespace {

    /*  Call f(i) for i in [0,n) using up to nThreads threads. Any exception thrown for index i
     *  is stored in slot i of the returned vector, the caller decides in which order to raise them.
     */
    template <typename Func>
    vector<exception_ptr> forEachRow( size_t n, unsigned int nThreads, Func f ) {

        vector<exception_ptr> errors( n );
        atomic<size_t> rowIndex(0);
        auto worker = [&](){
            size_t myIndex;
            while( (myIndex=rowIndex.fetch_add(1)) < n ) {
                try {
                    f( myIndex );
                } catch( ... ) {
                    errors[myIndex] = current_exception();
                }
            }
        };

        nThreads = std::min<size_t>( std::max( 1U, nThreads ), n );
        if( nThreads < 2 ) {
            worker();
            return errors;
        }

        vector<thread> threads;
        for( unsigned int i=0; i<nThreads; ++i ) {
            threads.push_back( std::thread( worker ) );
        }
        for (auto& th : threads) th.join();

        return errors;

    }


    void rethrowFirst( const vector<exception_ptr>& errors ) {
        for( const auto& e: errors ) {
            if( e ) rethrow_exception( e );
        }
    }


    // Digits after the decimal point of a rendered number, 0 for the exponent form.
    size_t decimals( const string& s ) {
        size_t dot = s.find( '.' );
        if( (dot == string::npos) || (s.find_first_of( "eE" ) != string::npos) ) {
            return 0;
        }
        return s.size() - dot - 1;
    }


    ColumnBase::Ptr makeColumn( const TableEntryFormat& fmt, const boost::optional<string>& label ) {
        switch( fmt.kind() ) {
            case TableEntryFormat::CHAR:  return ColumnBase::Ptr( new Column<string>( label, fmt ) );
            case TableEntryFormat::INT:   return ColumnBase::Ptr( new Column<int64_t>( label, fmt ) );
            case TableEntryFormat::FLOAT: return ColumnBase::Ptr( new Column<double>( label, fmt ) );
            default: throw SetupError( fmt.text() );
        }
    }

}


AsciiTableCodec::AsciiTableCodec( Logger& logger, const CodecSettings& settings ) : logger(logger), settings(settings) {

}


Extension AsciiTableCodec::decode( BlockReader& reader, const TableLayout& layout ) const {

    return Extension( decodeTable( reader, layout ) );

}


AsciiTable AsciiTableCodec::decodeTable( BlockReader& reader, const TableLayout& layout ) const {

    const size_t rowWidth = layout.rowWidth;
    const size_t nRows = layout.nRows;
    const size_t nFields = layout.formats.size();

    // Formats are checked before anything is read.
    vector<TableEntryFormat> fmts;
    for( const auto& code: layout.formats ) {
        TableEntryFormat fmt = TableEntryFormat::parse( code );
        if( !fmt.valid() ) {
            throw SetupError( code );
        }
        fmts.push_back( fmt );
    }

    if( nRows && (rowWidth > (numeric_limits<size_t>::max() - BLOCK_SIZE) / nRows) ) {
        throw FormatError( "ASCII table: " + to_string(nRows) + " rows of " + to_string(rowWidth)
                           + " characters is too large." );
    }

    vector<size_t> starts, widths;
    size_t offset(0);
    if( !layout.columnStarts.empty() && layout.columnStarts.size() != nFields ) {
        throw FormatError( "ASCII table: " + to_string(layout.columnStarts.size()) + " field positions given for "
                           + to_string(nFields) + " fields" );
    }
    for( size_t i = 0; i < nFields; ++i ) {
        widths.push_back( fmts[i].fieldWidth() );
        if( layout.columnStarts.empty() ) {
            starts.push_back( offset );
            offset += widths[i];
        } else {
            if( layout.columnStarts[i] < 1 ) {
                throw FormatError( "ASCII table: TBCOL" + to_string(i+1) + " must be at least 1" );
            }
            starts.push_back( layout.columnStarts[i]-1 );
        }
        if( starts[i]+widths[i] > rowWidth ) {
            throw FormatError( "ASCII table: field " + to_string(i+1) + " (" + fmts[i].code() + ") ends at character "
                               + to_string(starts[i]+widths[i]) + ", beyond the row width " + to_string(rowWidth) );
        }
    }

    AsciiTable tbl( nRows );
    for( size_t i = 0; i < nFields; ++i ) {
        tbl.addColumn( makeColumn( fmts[i], (i < layout.labels.size()) ? layout.labels[i] : boost::none ) );
    }

    LOG_DEBUG << "ASCII table: " << nFields << " fields, " << nRows << " rows of " << rowWidth << " characters." << ende;

    // Tables are assumed to fit in memory, read the whole thing in one go.
    vector<char> raw( paddedSize( rowWidth*nRows ) );
    reader.readBlocks( raw );

    // Only the first nRows rows are used, whatever follows is block padding.
    vector< vector<string> > fields( nRows );
    rethrowFirst( forEachRow( nRows, settings.nThreads,
        [&]( size_t r ) {
            const char* rowPtr = raw.data() + r*rowWidth;
            vector<string>& rowFields = fields[r];
            rowFields.reserve( nFields );
            for( size_t i = 0; i < nFields; ++i ) {
                string text( rowPtr+starts[i], widths[i] );
                if( !isPrintable( text ) ) {
                    throw FormatError( "ASCII table: field " + to_string(i+1) + " of row " + to_string(r)
                                       + " is not ASCII text" );
                }
                rowFields.push_back( std::move(text) );
            }
        } ) );

    vector< vector<TableEntry> > rows( nRows );
    const bool blankAsZero = settings.blankAsZero;
    rethrowFirst( forEachRow( nRows, settings.nThreads,
        [&]( size_t r ) {
            vector<TableEntry>& entries = rows[r];
            entries.reserve( nFields );
            for( size_t i = 0; i < nFields; ++i ) {
                entries.push_back( makeEntry( fields[r][i], fmts[i], r, i, blankAsZero ) );
            }
        } ) );

    for( const auto& row: rows ) {
        tbl.addRow( row );
    }

    LOG_DETAIL << "Decoded ASCII table with " << tbl.nColumns() << " columns and " << nRows << " rows." << ende;

    return tbl;

}


TableLayout AsciiTableCodec::encode( AsciiTable table, BlockWriter& writer ) const {

    vector<TableEntryFormat> fmts = table.formats();
    for( const auto& fmt: fmts ) {
        if( !fmt.valid() ) {
            throw SetupError( fmt.text() );
        }
    }

    TableLayout layout;
    layout.nRows = table.maxColumnLength();
    const size_t nFields = fmts.size();
    const size_t nRows = layout.nRows;

    vector<ColumnBase::Ptr> cols = table.release();
    vector< vector<string> > cells;
    for( const auto& col: cols ) {
        cells.push_back( col->renderAll() );
        layout.labels.push_back( col->label() );
    }
    cols.clear();

    // All columns must have the same length.
    for( auto& col: cells ) {
        col.resize( nRows, "" );
    }

    // ...and every entry in a column must have the same width.
    size_t start(1);
    for( size_t c = 0; c < nFields; ++c ) {
        size_t width = std::max<size_t>( fmts[c].fieldWidth(), 1 );
        size_t precision = fmts[c].precision();
        for( size_t r = 0; r < nRows; ++r ) {
            if( !isPrintable( cells[c][r] ) ) {
                throw FormatError( "ASCII table: entry " + to_string(r) + " of field " + to_string(c+1)
                                   + " is not printable ASCII" );
            }
            width = std::max( width, cells[c][r].size() );
            precision = std::max( precision, decimals( cells[c][r] ) );
        }
        const bool leftAlign = ( fmts[c].kind() == TableEntryFormat::CHAR );
        for( auto& cell: cells[c] ) {
            cell = leftAlign ? alignLeft( cell, width ) : alignRight( cell, width );
        }
        if( fmts[c].kind() == TableEntryFormat::FLOAT ) {
            layout.formats.push_back( TableEntryFormat::floatFormat( width, precision ).code() );
        } else {
            layout.formats.push_back( fmts[c].withWidth( width ).code() );
        }
        layout.columnStarts.push_back( start );
        start += width;
    }
    layout.rowWidth = start - 1;

    vector<char> buf( paddedSize( layout.rowWidth*nRows ), settings.tableFill );
    char* ptr = buf.data();
    for( size_t r = 0; r < nRows; ++r ) {
        for( size_t c = 0; c < nFields; ++c ) {
            const string& cell = cells[c][r];
            memcpy( ptr, cell.data(), cell.size() );
            ptr += cell.size();
        }
    }

    writer.writeBlocks( buf );

    LOG_DETAIL << "Encoded ASCII table with " << nFields << " columns and " << nRows << " rows ("
               << layout.rowWidth << " characters per row)." << ende;

    return layout;

}
