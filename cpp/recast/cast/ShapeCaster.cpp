#include <recast/cast/ShapeCaster.h>
#include <recast/engine/TypeSwitch.h>

namespace recast
{

ShapeCaster::ShapeCaster( const StructMetaPtr & target, bool useConstructorPath ) : m_target( target ),
                                                                                  m_useConstructorPath( useConstructorPath )
{
    RECAST_TRUE_OR_THROW( m_target != nullptr, InvalidArgument, "ShapeCaster requires a target type" );

    m_fields.reserve( m_target -> fields().size() );
    for( auto & field : m_target -> fields() )
        m_fields.emplace_back( field.get() );
}

StructPtr ShapeCaster::cast( const Struct * source ) const noexcept
{
    if( unlikely( source == nullptr ) )
        RECAST_THROW( ShapeMismatch, "ShapeCaster for " << m_target -> name() << " received a null source" );

    auto & sourceFields = resolve( source );

    StructPtr out = m_useConstructorPath ? m_target -> create() : m_target -> createUninitialized();
    for( size_t idx = 0; idx < m_fields.size(); ++idx )
    {
        const StructField * sourceField = sourceFields[ idx ];
        const StructField * targetField = m_fields[ idx ];
        if( !sourceField -> isSet( source ) )
            continue;

        switchRecastType( targetField -> type(), [ source, &out, sourceField, targetField ]( auto tag )
            {
                using CType = typename decltype( tag )::type;
                targetField -> setValue<CType>( out.get(), sourceField -> template value<CType>( source ) );
            } );
    }
    return out;
}

size_t ShapeCaster::numResolvedSources() const
{
    std::lock_guard<std::mutex> guard( m_mutex );
    return m_resolved.size();
}

const ShapeCaster::SourceFields & ShapeCaster::resolve( const Struct * source ) const
{
    const StructMeta * sourceMeta = source -> meta();
    if( StructMeta::isDerivedType( sourceMeta, m_target.get() ) )
        return m_fields;

    std::lock_guard<std::mutex> guard( m_mutex );
    auto it = m_resolved.find( sourceMeta );
    if( it == m_resolved.end() )
        it = m_resolved.emplace( sourceMeta, Resolved{ source -> metaPtr(), matchFields( *sourceMeta ) } ).first;
    return it -> second.fields;
}

ShapeCaster::SourceFields ShapeCaster::matchFields( const StructMeta & source ) const
{
    SourceFields out;
    out.reserve( m_fields.size() );
    for( auto * targetField : m_fields )
    {
        auto & sourceField = source.field( targetField -> fieldname() );
        if( unlikely( !sourceField ) )
            RECAST_THROW( ShapeMismatch, "Source of type " << source.name() << " is missing field \"" << targetField -> fieldname()
                          << "\" required by " << m_target -> name() );

        if( unlikely( !sourceField -> type() -> isSameType( *targetField -> type() ) ) )
            RECAST_THROW( ShapeMismatch, "Source of type " << source.name() << " holds field \"" << targetField -> fieldname()
                          << "\" as " << sourceField -> type() -> typeName() << " but " << m_target -> name() << " declares "
                          << targetField -> type() -> typeName() );

        out.emplace_back( sourceField.get() );
    }
    return out;
}

}
