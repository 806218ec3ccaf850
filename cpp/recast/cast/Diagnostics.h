#ifndef _IN_RECAST_CAST_DIAGNOSTICS_H
#define _IN_RECAST_CAST_DIAGNOSTICS_H

#include <recast/cast/CastPolicy.h>
#include <functional>
#include <ostream>
#include <string>

namespace recast
{

//non-fatal notice raised while casting, never thrown
struct CastDiagnostic
{
    CastDiagnosticCode code;
    std::string        fieldName;
    std::string        sourceType;
    std::string        targetType;
    std::string        message;
};

std::ostream & operator<<( std::ostream & o, const CastDiagnostic & diag );

using DiagnosticSink = std::function<void( const CastDiagnostic & )>;

//writes one line per diagnostic to std::cerr
const DiagnosticSink & defaultDiagnosticSink();

}

#endif
