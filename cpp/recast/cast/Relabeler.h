#ifndef _IN_RECAST_CAST_RELABELER_H
#define _IN_RECAST_CAST_RELABELER_H

#include <recast/cast/AllowedTypes.h>
#include <recast/engine/CastExceptions.h>
#include <recast/engine/Struct.h>
#include <recast/engine/StructMetaRegistry.h>
#include <string>

namespace recast
{

//Reclassifies a struct by serializing it, rewriting the top-level type tag to targetType and reconstructing it.
//No per-field matching happens: stored fields must be declared by the target under the same names and types.
//targetType is always allowed, every other type met while reconstructing ( nested values included ) must be in
//allowedTypes.  Throws TargetTypeNotFound for unregistered target or allowed names, RelabelFailed otherwise
StructPtr relabelCast( const Struct * source, const std::string & targetType,
                       const AllowedTypes & allowedTypes = AllowedTypes(),
                       const StructMetaRegistry & registry = StructMetaRegistry::instance() );

}

#endif
