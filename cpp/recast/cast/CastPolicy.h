#ifndef _IN_RECAST_CAST_CASTPOLICY_H
#define _IN_RECAST_CAST_CASTPOLICY_H

#include <recast/core/Enum.h>

namespace recast
{

//how the recursive caster treats source fields the target does not declare
struct CastPolicyTraits
{
    enum _enum : unsigned char
    {
        UNKNOWN        = 0,
        THROW          = 1,
        IGNORE         = 2,
        //struct layouts are fixed, behaves as IGNORE and reports a diagnostic
        DYNAMIC_ASSIGN = 3,

        NUM_TYPES
    };
};

using CastPolicy = recast::Enum<CastPolicyTraits>;

struct CastDiagnosticCodeTraits
{
    enum _enum : unsigned char
    {
        UNKNOWN                    = 0,
        DYNAMIC_ASSIGN_UNSUPPORTED = 1,

        NUM_TYPES
    };
};

using CastDiagnosticCode = recast::Enum<CastDiagnosticCodeTraits>;

}

#endif
