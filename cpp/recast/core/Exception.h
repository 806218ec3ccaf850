#ifndef _IN_RECAST_CORE_EXCEPTION_H
#define _IN_RECAST_CORE_EXCEPTION_H

#include <recast/core/Platform.h>
#include <exception>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>
#include <string.h>

namespace recast
{

//Base of every error raised by the library.  Carries the throwing site and the raw call stack captured at
//construction, what() reads "file:function:line:ExType: description"
class Exception : public std::exception
{
public:
    Exception( const char * exType, const std::string & description, const char * file, const char * func, int line );
    Exception( const char * exType, const std::string & description ) : Exception( exType, description, "", "", -1 )
    {}

    const char * what() const noexcept override { return m_what.c_str(); }

    const std::string & exType() const noexcept      { return m_exType; }
    const std::string & description() const noexcept { return m_description; }
    const std::string & file() const noexcept        { return m_file; }
    const std::string & function() const noexcept    { return m_function; }
    int line() const noexcept                        { return m_line; }

    //raw frames as reported by the platform, demangled only when written
    const std::vector<std::string> & backtrace() const { return m_backtrace; }

    void writeBacktrace( std::ostream & dest ) const;
    std::string backtraceString() const;

private:
    std::string              m_exType;
    std::string              m_description;
    std::string              m_file;
    std::string              m_function;
    int                      m_line;
    std::string              m_what;
    std::vector<std::string> m_backtrace;
};

#define __RECAST_FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)
#define RECAST_DECLARE_EXCEPTION( DerivedException, BaseException ) class DerivedException : public BaseException { public: DerivedException( const char * exType, const std::string &r, const char * file, const char * func, int line ) : BaseException( exType, r, file, func, line ) {} };

RECAST_DECLARE_EXCEPTION( AssertionError,   Exception )
RECAST_DECLARE_EXCEPTION( RuntimeException, Exception )
RECAST_DECLARE_EXCEPTION( InvalidArgument,  RuntimeException )
RECAST_DECLARE_EXCEPTION( NotImplemented,   RuntimeException )
RECAST_DECLARE_EXCEPTION( ValueError,       RuntimeException )
RECAST_DECLARE_EXCEPTION( KeyError,         RuntimeException )
RECAST_DECLARE_EXCEPTION( TypeError,        RuntimeException )
RECAST_DECLARE_EXCEPTION( RangeError,       RuntimeException )
RECAST_DECLARE_EXCEPTION( RecursionError,   RuntimeException )

//kept out of line so the throw site stays small
template<typename T>
[[noreturn]] NO_INLINE void throw_exc( T && e );

template<typename T>
[[noreturn]] inline void throw_exc( T && e ) { throw e; }

#define RECAST_THROW( EX_TYPE, MSG )         do { std::stringstream desc; desc << MSG ;  recast::throw_exc(EX_TYPE( #EX_TYPE, desc.str(), __RECAST_FILENAME__ , __FUNCTION__ , __LINE__  )); } while( 0 )
#define RECAST_THROW_EX( EX_TYPE, MSG, ... ) do { std::stringstream desc; desc << MSG ;  recast::throw_exc(EX_TYPE( #EX_TYPE, desc.str(), __RECAST_FILENAME__ , __FUNCTION__ , __LINE__ , __VA_ARGS__ )); } while( 0 )

#define RECAST_TRUE_OR_THROW( EXPR, EXCEPTION_TYPE, MESSAGE ) do {if( unlikely(!((EXPR))) ) { RECAST_THROW( EXCEPTION_TYPE, MESSAGE ); }} while(false)
#define RECAST_TRUE_OR_THROW_RUNTIME(EXPR, MESSAGE) RECAST_TRUE_OR_THROW(EXPR, recast::RuntimeException, MESSAGE)

//checked in both debug and release builds
#define RECAST_ENSURE_TRUE(EXPR) RECAST_TRUE_OR_THROW_RUNTIME(EXPR, #EXPR)

#ifdef NDEBUG
#define RECAST_ASSERT( EXPR ) ( (void ) (0))
#else
#define RECAST_ASSERT( EXPR ) RECAST_TRUE_OR_THROW(EXPR, recast::AssertionError, #EXPR)
#endif

}

#endif
