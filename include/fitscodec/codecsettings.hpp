#ifndef FITSCODEC_CODECSETTINGS_HPP
#define FITSCODEC_CODECSETTINGS_HPP

#include <string>

#include <boost/program_options.hpp>
#include <boost/property_tree/ptree.hpp>

namespace bpo = boost::program_options;
namespace bpt = boost::property_tree;

namespace fitscodec {

    /*! Tunables of the decode/encode paths.
     *
     *  Can be set from the command-line (see getOptions) or from a property tree:
     *  @code
     *  THREADS       4
     *  TABLE_FILL    blank       ; or "zero"
     *  BLANK_AS_ZERO true
     *  @endcode
     */
    struct CodecSettings {

        CodecSettings( void );
        explicit CodecSettings( const bpo::variables_map& );

        unsigned int nThreads;          //!< Workers used for the per-row stage of table decoding.
        char tableFill;                 //!< Padding byte after the last row of an ASCII table.
        bool blankAsZero;               //!< Blank numeric table fields decode to 0, otherwise they are a parse error.

        static unsigned int defaultThreads( void );
        static bpo::options_description getOptions( void );

        void parseProperties( const bpt::ptree& tree, const CodecSettings& defaults=CodecSettings() );
        void getProperties( bpt::ptree& tree, const CodecSettings& defaults=CodecSettings(), bool showAll=false ) const;

        operator std::string() const;

    };

}

#endif // FITSCODEC_CODECSETTINGS_HPP
