#include <recast/core/Exception.h>

#include <signal.h>
#include <stdlib.h>

#include <iostream>
#include <memory>

#ifndef WIN32
#include <cxxabi.h>
#include <execinfo.h>
#endif

namespace recast
{

namespace
{

constexpr int MAX_FRAMES = 64;

std::vector<std::string> captureFrames()
{
    std::vector<std::string> frames;
#ifndef WIN32
    void * addresses[ MAX_FRAMES ];
    int count = ::backtrace( addresses, MAX_FRAMES );
    std::unique_ptr<char *, decltype( &free )> symbols( backtrace_symbols( addresses, count ), &free );
    if( symbols )
    {
        frames.reserve( count );
        for( int i = 0; i < count; ++i )
            frames.emplace_back( symbols.get()[ i ] );
    }
#endif
    return frames;
}

//frames look like "./module(function+0x15c) [0x8048a6d]", the mangled function is swapped for its demangled form
std::string demangleFrame( const std::string & frame )
{
#ifndef WIN32
    size_t open = frame.find( '(' );
    if( open == std::string::npos )
        return frame;

    size_t plus = frame.find( '+', open );
    if( plus == std::string::npos || plus == open + 1 )
        return frame;

    std::string symbol = frame.substr( open + 1, plus - open - 1 );
    int status = 0;
    std::unique_ptr<char, decltype( &free )> demangled( abi::__cxa_demangle( symbol.c_str(), nullptr, nullptr, &status ), &free );
    if( status == 0 && demangled )
        return demangled.get();
#endif
    return frame;
}

void writeFrames( const std::vector<std::string> & frames, std::ostream & dest )
{
    if( frames.empty() )
    {
        dest << "Backtrace unavailable" << std::endl;
        return;
    }

    for( size_t i = 0; i < frames.size(); ++i )
        dest << "[bt]: (" << i << ") " << demangleFrame( frames[ i ] ) << '\n';
    dest << std::endl;
}

void recast_terminate()
{
    static int s_rethrown = 0;

    try
    {
        if( !s_rethrown++ )
            throw;
    }
    catch( const Exception & ex )
    {
        std::cerr << __FUNCTION__ << " caught unhandled recast::Exception. what(): " << ex.what() << std::endl;
        ex.writeBacktrace( std::cerr );
    }
    catch( const std::exception & ex )
    {
        std::cerr << __FUNCTION__ << " caught unhandled std::exception. what(): " << ex.what() << std::endl;
    }
    catch( ... )
    {
        std::cerr << __FUNCTION__ << " caught unknown unhandled exception" << std::endl;
    }

    writeFrames( captureFrames(), std::cerr );

    signal( SIGABRT, SIG_DFL );
    abort();
}

//installed at load time, exceptions escaping noexcept casts end up here
const bool s_terminateInstalled = ( std::set_terminate( recast_terminate ), true );

}

Exception::Exception( const char * exType, const std::string & description, const char * file, const char * func, int line ) :
    m_exType( exType ),
    m_description( description ),
    m_file( file ),
    m_function( func ),
    m_line( line ),
    m_backtrace( captureFrames() )
{
    if( m_line >= 0 )
        m_what = m_file + ":" + m_function + ":" + std::to_string( m_line ) + ":";
    m_what += m_exType + ": " + m_description;
}

void Exception::writeBacktrace( std::ostream & dest ) const
{
    writeFrames( m_backtrace, dest );
}

std::string Exception::backtraceString() const
{
    std::stringstream out;
    writeBacktrace( out );
    return out.str();
}

}
