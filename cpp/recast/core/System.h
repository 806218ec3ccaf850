#ifndef _IN_RECAST_CORE_SYSTEM_H
#define _IN_RECAST_CORE_SYSTEM_H

#include <recast/core/Platform.h>
#include <string>
#include <typeinfo>
#include <stdint.h>
#include <stdlib.h>

#ifndef WIN32
#include <cxxabi.h>
#endif

namespace recast
{

//demangled name of T, used in type-mismatch messages
template<typename T>
std::string cpp_type_name()
{
    std::string result = typeid( T ).name();
#ifndef WIN32
    int status = 0;
    char * demangled = abi::__cxa_demangle( result.c_str(), NULL, NULL, &status );
    if( demangled )
    {
        result = demangled;
        free( demangled );
    }
#endif
    return result;
}

}

#endif
