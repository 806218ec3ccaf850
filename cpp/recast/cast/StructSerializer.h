#ifndef _IN_RECAST_CAST_STRUCTSERIALIZER_H
#define _IN_RECAST_CAST_STRUCTSERIALIZER_H

#include <recast/cast/AllowedTypes.h>
#include <recast/engine/CastExceptions.h>
#include <recast/engine/Struct.h>
#include <recast/engine/StructMetaRegistry.h>
#include <cstdint>
#include <string>

namespace recast
{

/*
Canonical byte form of a struct instance, built on protobuf ( see StructRecord.proto ).

The bytes are a serialized google.protobuf.Any.  Its type_url is TYPE_URL_PREFIX followed by the struct type
name and its value is a serialized recast.pb.StructBody holding the set fields in declaration order.
Nested instances are StructRecords and keep their own type name.  Relabeling only rewrites the type_url,
the body bytes are carried over untouched.

Deserialization checks each type name against the allow-list before it is looked up or instantiated.
Any violation or malformed input raises RelabelFailed.
*/
class StructSerializer
{
public:
    static constexpr uint8_t VERSION = 1;
    static constexpr char TYPE_URL_PREFIX[] = "recast/struct/v1/";

    //throws CyclicGraph if an instance is reachable from itself
    static std::string serialize( const Struct * s );

    static StructPtr deserialize( const std::string & bytes, const AllowedTypes & allowedTypes,
                                  const StructMetaRegistry & registry = StructMetaRegistry::instance() );

    static std::string topLevelTypeName( const std::string & bytes );

    static std::string relabel( const std::string & bytes, const std::string & typeName );
};

}

#endif
