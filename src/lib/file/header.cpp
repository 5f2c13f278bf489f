#include "fitscodec/file/header.hpp"

#include "fitscodec/file/exceptions.hpp"
#include "fitscodec/util/stringutil.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

using namespace fitscodec::file;
using namespace fitscodec::util;
using namespace std;

namespace {

    const string allowed_key_chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_";
    const char end_card[] = "END                                                                             ";

    struct cicomp {  // case-insensitive comparator for the set below.
        bool operator() ( const std::string& a, const std::string& b ) const { return nocaseLess(a,b); }
    };
    const std::set<string, cicomp> multiKeys = { "        ", "COMMENT ", "HISTORY ", "CONTINUE" };

    template <typename T>
    string formatReal( const T& t ) {
        ostringstream ss;
        ss << uppercase << setprecision( numeric_limits<T>::max_digits10 ) << t;
        string ret = ss.str();
        if( ret.find_first_of( ".EN" ) == string::npos ) {      // make it look like a real number
            ret += ".0";
        }
        return ret;
    }

}


namespace fitscodec {
    namespace file {

        const size_t Header::CARD_SIZE;

        template <typename T>
        string Header::makeValue( const T& t, bool ) {
            return alignRight( to_string(t), 20 );
        }
        template <>
        string Header::makeValue( const float& t, bool ) {
            return alignRight( formatReal(t), 20 );
        }
        template <>
        string Header::makeValue( const double& t, bool ) {
            return alignRight( formatReal(t), 20 );
        }
        template <>
        string Header::makeValue( const string& str, bool quote ) {
            string ret = boost::trim_right_copy( str );                         // remove trailing spaces
            if( !isPrintable( ret ) ) {
                throw std::domain_error("Header::makeValue: \""+ret+"\" contains illegal characters.");
            }
            if( quote ) ret = "'" + boost::replace_all_copy( ret, "'", "''" ) + "'";
            return ret;
        }
        template <>
        string Header::makeValue( const bool& b, bool ) {
            return alignRight( (b?"T":"F"), 20 );
        }
        
        string Header::makeValue( const char* s, bool quote ) {
            return makeValue( string(s), quote );
        }

        template <typename T>
        T Header::getValue( const std::string& v ) {
            return boost::lexical_cast<T>( boost::trim_copy( v ) );
        }
        template <>
        bool Header::getValue( const std::string& v ) {
            string tmp = boost::trim_copy( v );
            if( tmp == "T" ) return true;
            if( tmp == "F" ) return false;
            throw boost::bad_lexical_cast();
        }
        template <>
        string Header::getValue( const std::string& v ) {
            string ret = boost::trim_copy( v );
            size_t first = ret.find_first_of("'");
            if( first != string::npos ) {
                string::const_iterator vBeg = ret.cbegin()+first;
                string::const_iterator vEnd = vBeg;
                while( ++vEnd != ret.cend() ) {
                    if( *vEnd == '\'' ) {
                        if( ((vEnd+1) != ret.cend()) && *(vEnd+1) == '\'' ) {
                            vEnd++;
                            continue;
                        }
                        break;
                    }
                }
                if( vEnd == ret.cend() ) {                  // no closing quote
                    throw boost::bad_lexical_cast();
                }
                ret = string( vBeg+1, vEnd );
                boost::trim_right( ret );                   // trailing spaces are not significant
            }
            boost::replace_all( ret, "''",  "'" );          // replace double occurances with single ones
            return ret;
        }

        template <typename T>
        string Header::makeCard( const string& key, const T& v, const string& comment ) {
            string ret = makeKey(key) + "= " + makeValue( v );
            if( comment != "" ) {
                ret += " / " + makeValue( comment, false );
            }
            ret.resize( CARD_SIZE, ' ' );       // pad with spaces, or truncate, to 80 characters
            return ret;
        }
        template <>
        string Header::makeCard( const string& key, const string& v, const string& comment ) {
            string ret = makeKey(key) + "= " + makeValue( v );
            if( ret.size() > CARD_SIZE ) {
                throw std::domain_error( "Header::makeCard: value of " + key + " does not fit in one card." );
            }
            if( ret.size() < 30 ) ret.resize( 30, ' ' );                        // pad with spaces
            if( comment != "" ) {
                ret += " / " + makeValue( comment, false );
            }
            ret.resize( CARD_SIZE, ' ' );
            return ret;
        }

    }
}

template string Header::makeValue<int32_t>( const int32_t&, bool );
template string Header::makeValue<int64_t>( const int64_t&, bool );
template string Header::makeValue<uint64_t>( const uint64_t&, bool );

template int32_t Header::getValue<int32_t>( const string& );
template int64_t Header::getValue<int64_t>( const string& );
template uint64_t Header::getValue<uint64_t>( const string& );
template float Header::getValue<float>( const string& );
template double Header::getValue<double>( const string& );

template string Header::makeCard( const string&, const int32_t&, const string& );
template string Header::makeCard( const string&, const int64_t&, const string& );
template string Header::makeCard( const string&, const uint64_t&, const string& );
template string Header::makeCard( const string&, const float&, const string& );
template string Header::makeCard( const string&, const double&, const string& );
template string Header::makeCard( const string&, const bool&, const string& );


string Header::makeKey( string key ) {

    boost::trim( key );                                                 // remove leading/trailing spaces
    boost::to_upper( key );                                             // make uppercase
    size_t found = key.find_first_not_of( allowed_key_chars );          // look for illegal characters
    if( (found != string::npos) && (found < 8) ) {
        throw std::domain_error("makeKey: \""+key+"\" contains illegal characters.");
    }
    key.resize( 8, ' ' );                                               // pad with spaces, or truncate, to 8 characters
    return key;

}


string Header::makeCard( const string& key, const char* v, const string& comment ) {
    return makeCard( key, string(v), comment );
}


string Header::makeCommentCard( const string& key, const string& text ) {
    string ret = makeKey(key) + makeValue( text, false );
    ret.resize( CARD_SIZE, ' ' );
    return ret;
}


void Header::splitCard( const std::string& card, std::string& key, std::string& value, std::string& comment ) {
    
    key = card.substr( 0, 8 );
    
    if( (card.size() > 9) && (card[8] == '=') && (card[9] == ' ') ) { // Value field exists
        size_t pos = card.find_first_not_of( " ", 10 );
        if( (pos != string::npos) && (card[pos] == '\'') ) {    // it's a string value, find beginning & end
            string::const_iterator vBeg = card.cbegin()+pos;
            string::const_iterator vEnd = vBeg;
            while( ++vEnd != card.cend() ) {
                if( *vEnd == '\'' ) {
                    if( ((vEnd+1) != card.cend()) && *(vEnd+1) == '\'' ) {
                        vEnd++;
                        continue;
                    }
                    break;
                }
            }
            if( vEnd != card.cend() ) vEnd++;
            value = string( vBeg, vEnd );
            comment = string( vEnd, card.cend() );
        } else {
            size_t slash = card.find( '/', 10 );
            if( slash == string::npos ) {
                value = card.substr( 10 );
                comment.clear();
            } else {
                value = card.substr( 10, slash-10 );
                comment = card.substr( slash );
            }
        }
    } else if( card.size() > 8 ) {    // all after the key is comment
        value.clear();
        comment = card.substr( 8 );
    } else {
        value.clear();
        comment.clear();
    }
    
    size_t pos = comment.find_first_not_of( " /" );
    if( pos != string::npos ) comment = comment.substr(pos);
    else comment.clear();
    
    boost::trim( key );
    boost::trim( value );
    boost::trim( comment );
    
}


string Header::getCard( string key ) const {
    
    key = makeKey( key );
    for( const auto& c: cards ) {
        if( boost::iequals( c.substr( 0, 8 ), key ) ) {
            return c;
        }
    }
    return "";
    
}


namespace fitscodec {
    namespace file {

        template <typename T>
        T Header::get( const std::string& key ) const {
            string card = getCard( key );
            if( card.empty() ) {
                throw FormatError( "Mandatory keyword " + boost::trim_copy(makeKey(key)) + " is missing." );
            }
            string k, v, c;
            splitCard( card, k, v, c );
            try {
                return getValue<T>( v );
            } catch( const boost::bad_lexical_cast& ) {
                throw FormatError( "Malformed value for keyword " + k + ": \"" + v + "\"" );
            }
        }

        template <typename T>
        T Header::get( const std::string& key, const T& defaultValue ) const {
            if( !has( key ) ) return defaultValue;
            return get<T>( key );
        }

    }
}

template bool Header::get<bool>( const string& ) const;
template int32_t Header::get<int32_t>( const string& ) const;
template int64_t Header::get<int64_t>( const string& ) const;
template uint64_t Header::get<uint64_t>( const string& ) const;
template double Header::get<double>( const string& ) const;
template string Header::get<string>( const string& ) const;

template bool Header::get<bool>( const string&, const bool& ) const;
template int32_t Header::get<int32_t>( const string&, const int32_t& ) const;
template int64_t Header::get<int64_t>( const string&, const int64_t& ) const;
template uint64_t Header::get<uint64_t>( const string&, const uint64_t& ) const;
template double Header::get<double>( const string&, const double& ) const;
template string Header::get<string>( const string&, const string& ) const;


void Header::add( const std::string& card ) {

    string key = makeKey( card.substr(0,8) );
    if( multiKeys.count(key) == 0 ) {   // only allow single occurrances for non-multikeys
        for( auto& k: cards ) {
            if( key.compare( k.substr(0,8) ) == 0 ) {
                return;
            }
        }
    }
    cards.push_back( card );

}


bool Header::emplace( const std::string& card ) {

    string key = makeKey( card.substr(0,8) );
    if( multiKeys.count(key) == 0 ) {   // never overwrite keywords which might have multiple entries
        for( auto& c: cards ) {
            if( key.compare( c.substr(0,8) ) == 0 ) {
                c = card;
                return false;
            }
        }
    }
    cards.push_back( card );
    return true;

}


void Header::remove( const std::string& k ) {

    string key = makeKey( k );
    cards.erase( std::remove_if( cards.begin(), cards.end(), [&](const string& a) { return key.compare( a.substr(0,8) ) == 0; }),
                 cards.end() );

}


Header Header::read( BlockReader& reader ) {

    Header hdr;
    vector<char> block( BLOCK_SIZE );
    while( true ) {
        reader.readBlocks( block );
        for( size_t i = 0; i < BLOCK_SIZE; i += CARD_SIZE ) {
            string card( block.data()+i, CARD_SIZE );
            if( !isPrintable( card ) ) {
                throw FormatError( "Header card " + to_string(hdr.cards.size()+1) + " contains non-ASCII characters." );
            }
            if( card.compare( 0, 8, end_card, 8 ) == 0 ) {
                return hdr;
            }
            hdr.cards.push_back( card );
        }
    }

}


void Header::write( BlockWriter& writer ) const {

    string buf;
    buf.reserve( paddedSize( (cards.size()+1)*CARD_SIZE ) );
    for( const auto& c: cards ) {
        if( c.size() > CARD_SIZE ) {
            throw fitscodec::BadArgument( "Header card longer than 80 characters: \"" + c + "\"" );
        }
        buf += c;
        buf.append( CARD_SIZE-c.size(), ' ' );
    }
    buf += end_card;
    buf.resize( paddedSize( buf.size() ), ' ' );
    writer.writeBlocks( buf.data(), buf.size() );

}
