#include <recast/cast/Diagnostics.h>
#include <iostream>

namespace recast
{

std::ostream & operator<<( std::ostream & o, const CastDiagnostic & diag )
{
    o << "recast " << diag.code << ": field \"" << diag.fieldName << "\" of " << diag.sourceType
      << " -> " << diag.targetType;
    if( !diag.message.empty() )
        o << ": " << diag.message;
    return o;
}

const DiagnosticSink & defaultDiagnosticSink()
{
    static DiagnosticSink s_sink = []( const CastDiagnostic & diag )
    {
        std::cerr << diag << std::endl;
    };
    return s_sink;
}

}
