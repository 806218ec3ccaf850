#include <recast/cast/Relabeler.h>
#include <recast/cast/StructSerializer.h>

namespace recast
{

StructPtr relabelCast( const Struct * source, const std::string & targetType,
                       const AllowedTypes & allowedTypes, const StructMetaRegistry & registry )
{
    RECAST_TRUE_OR_THROW( source != nullptr, InvalidArgument, "relabelCast called with a null source" );

    auto target = registry.get( targetType );
    allowedTypes.validate( registry );

    std::string bytes = StructSerializer::relabel( StructSerializer::serialize( source ), targetType );
    StructPtr out = StructSerializer::deserialize( bytes, allowedTypes.with( targetType ), registry );

    if( !StructMeta::isDerivedType( out -> meta(), target.get() ) )
        RECAST_THROW( RelabelFailed, "Reconstructed " << out -> meta() -> name() << " is not an instance of " << targetType );

    return out;
}

}
