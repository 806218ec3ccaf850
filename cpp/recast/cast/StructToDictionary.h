#ifndef _IN_RECAST_CAST_STRUCTTODICTIONARY_H
#define _IN_RECAST_CAST_STRUCTTODICTIONARY_H

#include <recast/engine/Dictionary.h>
#include <recast/engine/Struct.h>

namespace recast
{

//Coerces a struct instance into source shape.  Only set fields are emitted, in declaration order.
//Nested structs become nested dictionaries, arrays become vectors and generic values are deep-copied.
//Throws CyclicGraph if a struct is reachable from itself
DictionaryPtr structToDictionary( const Struct * s );

}

#endif
