#include "fitscodec/file/hdu.hpp"

#include "fitscodec/file/exceptions.hpp"
#include "fitscodec/image/imagecodec.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <set>
#include <sstream>

#include <boost/algorithm/string.hpp>

using namespace fitscodec::file;
using namespace fitscodec::image;
using namespace fitscodec::logging;
using namespace fitscodec::table;
using namespace fitscodec;
using namespace std;

namespace {

    const set<string> structuralKeys = { "SIMPLE", "XTENSION", "BITPIX", "NAXIS", "PCOUNT", "GCOUNT",
                                         "GROUPS", "TFIELDS", "EXTEND", "END" };
    const vector<string> indexedKeys = { "NAXIS", "TBCOL", "TFORM", "TTYPE" };

    /*  True for keywords that are generated from the data when writing, i.e. the ones
     *  the caller is not allowed to set.
     */
    bool isStructural( const string& card ) {
        string key = boost::trim_copy( card.substr( 0, 8 ) );
        boost::to_upper( key );
        if( structuralKeys.count( key ) ) return true;
        for( const auto& ik: indexedKeys ) {
            if( boost::starts_with( key, ik ) && key.size() > ik.size()
                && key.find_first_not_of( "0123456789", ik.size() ) == string::npos ) {
                return true;
            }
        }
        return false;
    }

    size_t getSize( const Header& hdr, const string& key ) {
        int64_t val = hdr.get<int64_t>( key );
        if( val < 0 ) {
            throw FormatError( "Keyword " + key + " must not be negative (" + to_string(val) + ")" );
        }
        return val;
    }

    size_t getSize( const Header& hdr, const string& key, size_t defaultValue ) {
        if( !hdr.has( key ) ) return defaultValue;
        return getSize( hdr, key );
    }

    vector<size_t> getAxes( const Header& hdr ) {
        size_t nAxes = getSize( hdr, "NAXIS" );
        if( nAxes > 999 ) {
            throw FormatError( "NAXIS = " + to_string(nAxes) + " is out of range." );
        }
        vector<size_t> axes;
        for( size_t i = 1; i <= nAxes; ++i ) {
            axes.push_back( getSize( hdr, "NAXIS" + to_string(i) ) );
        }
        return axes;
    }

    // Sizes from the header must leave room for the block padding.
    const size_t maxDataSize = numeric_limits<size_t>::max() - BLOCK_SIZE;

    size_t multiply( size_t a, size_t b ) {
        if( b && (a > maxDataSize / b) ) {
            throw FormatError( "Data size " + to_string(a) + " x " + to_string(b) + " is too large." );
        }
        return a*b;
    }

    size_t addSizes( size_t a, size_t b ) {
        if( a > maxDataSize - b ) {
            throw FormatError( "Data size " + to_string(a) + " + " + to_string(b) + " is too large." );
        }
        return a+b;
    }

    size_t product( const vector<size_t>& v ) {
        if( v.empty() || (std::find( v.begin(), v.end(), 0 ) != v.end()) ) return 0;
        size_t ret(1);
        for( const auto& n: v ) ret = multiply( ret, n );
        return ret;
    }

    vector<char> readRaw( BlockReader& reader, size_t nBytes ) {
        vector<char> data( paddedSize( nBytes ) );
        reader.readBlocks( data );
        data.resize( nBytes );
        return data;
    }

    void writeRaw( BlockWriter& writer, const vector<char>& data ) {
        vector<char> buf( paddedSize( data.size() ), 0 );
        if( !data.empty() ) {
            memcpy( buf.data(), data.data(), data.size() );
        }
        writer.writeBlocks( buf );
    }

    vector<boost::optional<string>> getLabels( const Header& hdr, size_t nFields ) {
        vector<boost::optional<string>> labels;
        for( size_t i = 1; i <= nFields; ++i ) {
            string key = "TTYPE" + to_string(i);
            if( hdr.has( key ) ) labels.push_back( hdr.get<string>( key ) );
            else labels.push_back( boost::none );
        }
        return labels;
    }

    void addLabels( Header& hdr, const vector<boost::optional<string>>& labels ) {
        for( size_t i = 0; i < labels.size(); ++i ) {
            if( labels[i] ) {
                hdr.add( Header::makeCard( "TTYPE" + to_string(i+1), *labels[i] ) );
            }
        }
    }


    /*  Emits the structural keywords of an Extension into a header, and its data into a writer.
     */
    struct PayloadVisitor : public boost::static_visitor<> {

        PayloadVisitor( Header& hdr, BlockWriter& writer, const AsciiTableCodec& codec, bool primary )
            : hdr(hdr), writer(writer), codec(codec), primary(primary) {}

        void operator()( const AsciiTable& tbl ) const {
            if( primary ) {
                throw BadArgument( "An ASCII table can not be written as the primary HDU." );
            }
            TableLayout layout = codec.encode( tbl, writer );
            hdr.add( Header::makeCard( "XTENSION", "TABLE", "ASCII table extension" ) );
            hdr.add( Header::makeCard<int32_t>( "BITPIX", 8 ) );
            hdr.add( Header::makeCard<int32_t>( "NAXIS", 2 ) );
            hdr.add( Header::makeCard( "NAXIS1", layout.rowWidth, "characters per row" ) );
            hdr.add( Header::makeCard( "NAXIS2", layout.nRows, "number of rows" ) );
            hdr.add( Header::makeCard<int32_t>( "PCOUNT", 0 ) );
            hdr.add( Header::makeCard<int32_t>( "GCOUNT", 1 ) );
            hdr.add( Header::makeCard( "TFIELDS", layout.formats.size() ) );
            for( size_t i = 0; i < layout.formats.size(); ++i ) {
                hdr.add( Header::makeCard( "TBCOL" + to_string(i+1), layout.columnStarts[i] ) );
                hdr.add( Header::makeCard( "TFORM" + to_string(i+1), layout.formats[i] ) );
            }
            addLabels( hdr, layout.labels );
        }

        void operator()( const BinTable& tbl ) const {
            if( primary ) {
                throw BadArgument( "A binary table can not be written as the primary HDU." );
            }
            if( tbl.data.size() != tbl.dataSize() ) {
                throw BadArgument( "BinTable: " + to_string(tbl.data.size()) + " bytes of data, expected "
                                   + to_string(tbl.dataSize()) );
            }
            hdr.add( Header::makeCard( "XTENSION", "BINTABLE", "binary table extension" ) );
            hdr.add( Header::makeCard<int32_t>( "BITPIX", 8 ) );
            hdr.add( Header::makeCard<int32_t>( "NAXIS", 2 ) );
            hdr.add( Header::makeCard( "NAXIS1", tbl.rowWidth, "bytes per row" ) );
            hdr.add( Header::makeCard( "NAXIS2", tbl.nRows, "number of rows" ) );
            hdr.add( Header::makeCard( "PCOUNT", tbl.heapSize ) );
            hdr.add( Header::makeCard<int32_t>( "GCOUNT", 1 ) );
            hdr.add( Header::makeCard( "TFIELDS", tbl.formats.size() ) );
            for( size_t i = 0; i < tbl.formats.size(); ++i ) {
                hdr.add( Header::makeCard( "TFORM" + to_string(i+1), tbl.formats[i] ) );
            }
            addLabels( hdr, tbl.labels );
            writeRaw( writer, tbl.data );
        }

        void operator()( const TypedImage& img ) const {
            const vector<size_t>& dims = img.dimensions();
            if( primary ) {
                hdr.add( Header::makeCard( "SIMPLE", true, "conforms to FITS standard" ) );
            } else {
                hdr.add( Header::makeCard( "XTENSION", "IMAGE", "image extension" ) );
            }
            hdr.add( Header::makeCard<int32_t>( "BITPIX", img.bitpix(), bitpixName( img.bitpix() ) ) );
            hdr.add( Header::makeCard( "NAXIS", dims.size() ) );
            for( size_t i = 0; i < dims.size(); ++i ) {
                hdr.add( Header::makeCard( "NAXIS" + to_string(i+1), dims[i] ) );
            }
            if( primary ) {
                hdr.add( Header::makeCard( "EXTEND", true ) );
            } else {
                hdr.add( Header::makeCard<int32_t>( "PCOUNT", 0 ) );
                hdr.add( Header::makeCard<int32_t>( "GCOUNT", 1 ) );
            }
            encodeImage( writer, img );
        }

        void operator()( const RandomGroups& rg ) const {
            if( !primary ) {
                throw BadArgument( "Random groups can only be written as the primary HDU." );
            }
            if( rg.data.size() != rg.dataSize() ) {
                throw BadArgument( "RandomGroups: " + to_string(rg.data.size()) + " bytes of data, expected "
                                   + to_string(rg.dataSize()) );
            }
            hdr.add( Header::makeCard( "SIMPLE", true, "conforms to FITS standard" ) );
            hdr.add( Header::makeCard<int32_t>( "BITPIX", rg.bitpix, bitpixName( rg.bitpix ) ) );
            hdr.add( Header::makeCard( "NAXIS", rg.axes.size()+1 ) );
            hdr.add( Header::makeCard<int32_t>( "NAXIS1", 0, "random groups" ) );
            for( size_t i = 0; i < rg.axes.size(); ++i ) {
                hdr.add( Header::makeCard( "NAXIS" + to_string(i+2), rg.axes[i] ) );
            }
            hdr.add( Header::makeCard( "GROUPS", true ) );
            hdr.add( Header::makeCard( "PCOUNT", rg.nParameters ) );
            hdr.add( Header::makeCard( "GCOUNT", rg.nGroups ) );
            hdr.add( Header::makeCard( "EXTEND", true ) );
            writeRaw( writer, rg.data );
        }

        Header& hdr;
        BlockWriter& writer;
        const AsciiTableCodec& codec;
        bool primary;

    };

}


size_t RandomGroups::dataSize( void ) const {
    return multiply( multiply( byteWidth( bitpix ), nGroups ), addSizes( nParameters, product( axes ) ) );
}


HduCodec::HduCodec( Logger& logger, const CodecSettings& settings )
    : logger(logger), settings(settings), tableCodec( logger, settings ) {

}


Hdu HduCodec::read( BlockReader& reader ) const {

    size_t start = reader.cursor();
    Hdu hdu;
    hdu.header = Header::read( reader );
    const Header& hdr = hdu.header;

    if( hdr.cards.empty() ) {
        throw FormatError( "Empty header at offset " + to_string(start) + " in " + reader.name() );
    }

    string firstKey = boost::trim_copy( hdr.cards[0].substr( 0, 8 ) );
    if( firstKey == "SIMPLE" ) {
        Bitpix bitpix = bitpixFromCode( hdr.get<int32_t>( "BITPIX" ) );
        vector<size_t> axes = getAxes( hdr );
        if( !axes.empty() && axes[0] == 0 && hdr.get<bool>( "GROUPS", false ) ) {
            RandomGroups rg;
            rg.bitpix = bitpix;
            rg.axes.assign( axes.begin()+1, axes.end() );
            rg.nParameters = getSize( hdr, "PCOUNT", 0 );
            rg.nGroups = getSize( hdr, "GCOUNT", 1 );
            rg.data = readRaw( reader, rg.dataSize() );
            LOG_DEBUG << "Read random groups: " << rg.nGroups << " groups, " << rg.nParameters << " parameters." << ende;
            hdu.data = Extension( std::move(rg) );
        } else if( multiply( product( axes ), byteWidth( bitpix ) ) ) {
            hdu.data = Extension( decodeImage( reader, bitpix, axes ) );
            LOG_DEBUG << "Read primary image: " << boost::get<TypedImage>( *hdu.data ) << ende;
        }
        return hdu;
    }

    if( firstKey != "XTENSION" ) {
        throw FormatError( "Header at offset " + to_string(start) + " in " + reader.name()
                           + " starts with " + firstKey + ", expected SIMPLE or XTENSION" );
    }

    string xtension = boost::to_upper_copy( hdr.get<string>( "XTENSION" ) );
    if( xtension == "IMAGE" ) {
        Bitpix bitpix = bitpixFromCode( hdr.get<int32_t>( "BITPIX" ) );
        vector<size_t> axes = getAxes( hdr );
        if( multiply( product( axes ), byteWidth( bitpix ) ) ) {
            hdu.data = Extension( decodeImage( reader, bitpix, axes ) );
            LOG_DEBUG << "Read image extension: " << boost::get<TypedImage>( *hdu.data ) << ende;
        }
    } else if( xtension == "TABLE" ) {
        vector<size_t> axes = getAxes( hdr );
        if( axes.size() != 2 ) {
            throw FormatError( "ASCII table extension with NAXIS = " + to_string(axes.size()) + ", expected 2" );
        }
        TableLayout layout;
        layout.rowWidth = axes[0];
        layout.nRows = axes[1];
        size_t nFields = getSize( hdr, "TFIELDS" );
        size_t nStarts(0);
        for( size_t i = 1; i <= nFields; ++i ) {
            layout.formats.push_back( hdr.get<string>( "TFORM" + to_string(i) ) );
            string key = "TBCOL" + to_string(i);
            if( hdr.has( key ) ) {
                layout.columnStarts.push_back( getSize( hdr, key ) );
                nStarts++;
            }
        }
        if( nStarts && nStarts != nFields ) {
            throw FormatError( "ASCII table: TBCOL given for " + to_string(nStarts) + " of " + to_string(nFields) + " fields" );
        }
        layout.labels = getLabels( hdr, nFields );
        hdu.data = tableCodec.decode( reader, layout );
    } else if( xtension == "BINTABLE" || xtension == "A3DTABLE" ) {
        vector<size_t> axes = getAxes( hdr );
        if( axes.size() != 2 ) {
            throw FormatError( "Binary table extension with NAXIS = " + to_string(axes.size()) + ", expected 2" );
        }
        BinTable tbl;
        tbl.rowWidth = axes[0];
        tbl.nRows = axes[1];
        tbl.heapSize = getSize( hdr, "PCOUNT", 0 );
        size_t nFields = getSize( hdr, "TFIELDS" );
        for( size_t i = 1; i <= nFields; ++i ) {
            tbl.formats.push_back( hdr.get<string>( "TFORM" + to_string(i) ) );
        }
        tbl.labels = getLabels( hdr, nFields );
        tbl.data = readRaw( reader, addSizes( multiply( tbl.rowWidth, tbl.nRows ), tbl.heapSize ) );
        LOG_DEBUG << "Read binary table: " << nFields << " fields, " << tbl.nRows << " rows." << ende;
        hdu.data = Extension( std::move(tbl) );
    } else {
        throw FormatError( "Unknown extension type: XTENSION = '" + xtension + "'" );
    }

    return hdu;

}


vector<Hdu> HduCodec::readAll( BlockReader& reader ) const {

    vector<Hdu> hdus;
    while( !reader.atEnd() ) {
        hdus.push_back( read( reader ) );
    }
    LOG_DETAIL << "Read " << hdus.size() << " HDUs from " << reader.name() << ende;
    return hdus;

}


void HduCodec::write( BlockWriter& writer, const Hdu& hdu, bool primary ) const {

    Header hdr;
    ostringstream payload;
    BlockWriter payloadWriter( payload );

    if( hdu.data ) {
        // the data is encoded first, the structural keywords of a table depend on its contents.
        boost::apply_visitor( PayloadVisitor( hdr, payloadWriter, tableCodec, primary ), *hdu.data );
    } else if( primary ) {
        hdr.add( Header::makeCard( "SIMPLE", true, "conforms to FITS standard" ) );
        hdr.add( Header::makeCard<int32_t>( "BITPIX", 8 ) );
        hdr.add( Header::makeCard<int32_t>( "NAXIS", 0 ) );
        hdr.add( Header::makeCard( "EXTEND", true ) );
    } else {
        hdr.add( Header::makeCard( "XTENSION", "IMAGE", "image extension" ) );
        hdr.add( Header::makeCard<int32_t>( "BITPIX", 8 ) );
        hdr.add( Header::makeCard<int32_t>( "NAXIS", 0 ) );
        hdr.add( Header::makeCard<int32_t>( "PCOUNT", 0 ) );
        hdr.add( Header::makeCard<int32_t>( "GCOUNT", 1 ) );
    }

    for( const auto& card: hdu.header.cards ) {
        if( !isStructural( card ) ) {
            hdr.add( card );
        }
    }

    hdr.write( writer );
    string data = payload.str();
    writer.writeBlocks( data.data(), data.size() );

    LOG_DEBUG << "Wrote HDU with " << hdr.cards.size() << " cards and " << data.size() << " bytes of data." << ende;

}
