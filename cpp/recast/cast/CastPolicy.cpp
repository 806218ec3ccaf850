#include <recast/cast/CastPolicy.h>

namespace recast
{

INIT_RECAST_ENUM( recast::CastPolicy,
                  "UNKNOWN",
                  "THROW",
                  "IGNORE",
                  "DYNAMIC_ASSIGN"
);

INIT_RECAST_ENUM( recast::CastDiagnosticCode,
                  "UNKNOWN",
                  "DYNAMIC_ASSIGN_UNSUPPORTED"
);

}
