#include <recast/cast/RecursiveCaster.h>
#include <recast/cast/StructToDictionary.h>
#include <recast/engine/TypeSwitch.h>
#include <limits>
#include <type_traits>

namespace recast
{

namespace
{

//the name reported for dictionary sources, struct sources report their type name at the top level
const std::string SOURCE_DICTIONARY_TYPE = "Dictionary";

class CircularRefCheck
{
public:
    CircularRefCheck( std::unordered_set<const Dictionary *> & visited, const Dictionary * ptr, bool enabled ) :
        m_visited( visited ), m_ptr( enabled ? ptr : nullptr )
    {
        if( !m_ptr )
            return;

        auto [_, inserted] = m_visited.insert( m_ptr );
        if( !inserted )
        {
            m_ptr = nullptr;
            RECAST_THROW( CyclicGraph, "Source dictionary is reachable from itself, cannot cast cyclic data" );
        }
    }

    ~CircularRefCheck()
    {
        if( m_ptr )
            m_visited.erase( m_ptr );
    }

private:
    std::unordered_set<const Dictionary *> & m_visited;
    const Dictionary * m_ptr;
};

}

RecursiveCaster::RecursiveCaster( CastPolicy policy, bool useConstructorPath, DiagnosticSink sink ) :
    m_policy( policy ),
    m_useConstructorPath( useConstructorPath ),
    m_detectCycles( true ),
    m_sink( std::move( sink ) )
{
    if( m_policy.isUnknown() )
        RECAST_THROW( ValueError, "RecursiveCaster requires a known cast policy" );
}

RecursiveCaster::RecursiveCaster( const Dictionary & properties, DiagnosticSink sink ) :
    RecursiveCaster( CastPolicy( properties.get<std::string>( "policy", std::string( "THROW" ) ) ),
                     properties.get<bool>( "use_constructor", false ),
                     std::move( sink ) )
{
    m_detectCycles = properties.get<bool>( "detect_cycles", true );
}

StructPtr RecursiveCaster::cast( const Dictionary & source, const StructMetaPtr & target ) const
{
    RECAST_TRUE_OR_THROW( target != nullptr, InvalidArgument, "RecursiveCaster::cast called with a null target type" );

    Visited visited;
    return castImpl( source, SOURCE_DICTIONARY_TYPE, target, visited );
}

StructPtr RecursiveCaster::cast( const Struct * source, const StructMetaPtr & target ) const
{
    RECAST_TRUE_OR_THROW( source != nullptr, InvalidArgument, "RecursiveCaster::cast called with a null source" );
    RECAST_TRUE_OR_THROW( target != nullptr, InvalidArgument, "RecursiveCaster::cast called with a null target type" );

    auto dict = structToDictionary( source );
    Visited visited;
    return castImpl( *dict, source -> meta() -> name(), target, visited );
}

StructPtr RecursiveCaster::cast( const Dictionary & source, const std::string & targetType, const StructMetaRegistry & registry ) const
{
    return cast( source, registry.get( targetType ) );
}

StructPtr RecursiveCaster::cast( const Struct * source, const std::string & targetType, const StructMetaRegistry & registry ) const
{
    return cast( source, registry.get( targetType ) );
}

StructPtr RecursiveCaster::castImpl( const Dictionary & source, const std::string & sourceType, const StructMetaPtr & target, Visited & visited ) const
{
    CircularRefCheck checker( visited, &source, m_detectCycles );

    StructPtr out = m_useConstructorPath ? target -> create() : target -> createUninitialized();

    for( auto it = source.begin(); it != source.end(); ++it )
    {
        const std::string & name = it.key();
        if( name.empty() )
            RECAST_THROW( MalformedSource, "Source " << sourceType << " has a field with an empty name, cannot cast to " << target -> name() );

        auto & field = target -> field( name );
        if( field )
        {
            assignField( out.get(), *field, *target, it.getUntypedValue(), visited );
            continue;
        }

        if( target -> isStaticField( name ) )
            continue;

        switch( m_policy )
        {
            case CastPolicy::THROW:
                RECAST_THROW_EX( UnknownFieldRejected, "Field \"" << name << "\" of " << sourceType << " has no counterpart on " << target -> name(),
                                 name, sourceType, target -> name() );
            case CastPolicy::IGNORE:
                break;
            case CastPolicy::DYNAMIC_ASSIGN:
                emit( CastDiagnostic{ CastDiagnosticCode::DYNAMIC_ASSIGN_UNSUPPORTED, name, sourceType, target -> name(),
                                      "struct types have a fixed layout, field dropped" } );
                break;
            default:
                RECAST_THROW( ValueError, "Unexpected cast policy " << m_policy );
        }
    }

    return out;
}

void RecursiveCaster::assignField( Struct * s, const StructField & field, const StructMeta & target,
                                   const Dictionary::Value & value, Visited & visited ) const
{
    //none leaves the field unset, except for generic fields which hold it as-is
    if( std::holds_alternative<std::monostate>( value ) && field.type() -> type() != RecastType::Type::GENERIC )
        return;

    switchRecastType( field.type(), [ this, s, &field, &target, &value, &visited ]( auto tag )
        {
            using CType = typename decltype( tag )::type;
            field.setValue<CType>( s, convertValue<CType>( value, *field.type(), field.fieldname(), target, visited ) );
        } );
}

template<typename T>
T RecursiveCaster::convertValue( const Dictionary::Value & value, const RecastType & type, const std::string & fieldName,
                                 const StructMeta & target, Visited & visited ) const
{
    try
    {
        //generic fields own their value, nested dictionaries are not shared with the source
        if constexpr( std::is_same_v<T, GenericValue> )
            return GenericValue( Dictionary::deepcopy( value ) );
        else if constexpr( std::is_same_v<T, StructPtr> )
        {
            if( std::holds_alternative<std::monostate>( value ) )
                return StructPtr();

            auto * nested = std::get_if<DictionaryPtr>( &value );
            if( !nested || !*nested )
                RECAST_THROW( FieldTypeMismatch, "Field \"" << fieldName << "\" on " << target.name() << " expects nested " << type.typeName()
                              << " but source holds " << Dictionary::valueTypeName( value ) );

            auto & nestedMeta = static_cast<const RecastStructType &>( type ).meta();
            return castImpl( **nested, SOURCE_DICTIONARY_TYPE, nestedMeta, visited );
        }
        else if constexpr( IsArrayStorage<T>::value )
        {
            using StorageT = typename T::value_type;

            auto * vec = std::get_if<Dictionary::Vector>( &value );
            if( !vec )
                RECAST_THROW( FieldTypeMismatch, "Field \"" << fieldName << "\" on " << target.name() << " expects " << type.typeName()
                              << " but source holds " << Dictionary::valueTypeName( value ) );

            auto & elemType = *static_cast<const RecastArrayType &>( type ).elemType();

            T out;
            out.reserve( vec -> size() );
            for( auto & elem : *vec )
            {
                if constexpr( std::is_same_v<StorageT, uint8_t> )
                {
                    //bool arrays are held as uint8_t
                    if( elemType.type() == RecastType::Type::BOOL )
                    {
                        out.emplace_back( convertValue<bool>( elem._data, elemType, fieldName, target, visited ) );
                        continue;
                    }
                }
                out.emplace_back( convertValue<StorageT>( elem._data, elemType, fieldName, target, visited ) );
            }
            return out;
        }
        else if constexpr( std::is_same_v<T, std::string> || std::is_same_v<T, bool> || std::is_same_v<T, double> ||
                           std::is_same_v<T, int32_t> || std::is_same_v<T, uint32_t> ||
                           std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t> )
            return Dictionary::extractValue<T>( fieldName, value );
        else
        {
            //small integrals go through the widest type of the same signedness and are range checked
            using WideT = std::conditional_t<std::is_signed_v<T>, int64_t, uint64_t>;
            WideT wide = Dictionary::extractValue<WideT>( fieldName, value );
            if( wide < ( WideT ) std::numeric_limits<T>::min() || wide > ( WideT ) std::numeric_limits<T>::max() )
                RECAST_THROW( FieldTypeMismatch, "Field \"" << fieldName << "\" on " << target.name() << " value " << wide
                              << " is out of range for " << type.typeName() );
            return ( T ) wide;
        }
    }
    catch( const TypeError & err )
    {
        RECAST_THROW( FieldTypeMismatch, "Field \"" << fieldName << "\" on " << target.name() << " cannot hold source value: " << err.description() );
    }
    catch( const RangeError & err )
    {
        RECAST_THROW( FieldTypeMismatch, "Field \"" << fieldName << "\" on " << target.name() << " cannot hold source value: " << err.description() );
    }
}

void RecursiveCaster::emit( const CastDiagnostic & diag ) const
{
    if( m_sink )
        m_sink( diag );
    else
        defaultDiagnosticSink()( diag );
}

StructPtr recursiveCast( const Dictionary & source, const StructMetaPtr & target, bool useConstructorPath,
                         CastPolicy policy, const DiagnosticSink & sink )
{
    return RecursiveCaster( policy, useConstructorPath, sink ).cast( source, target );
}

StructPtr recursiveCast( const Dictionary & source, const std::string & targetType, bool useConstructorPath,
                         CastPolicy policy, const DiagnosticSink & sink )
{
    return RecursiveCaster( policy, useConstructorPath, sink ).cast( source, targetType );
}

StructPtr recursiveCast( const Struct * source, const StructMetaPtr & target, bool useConstructorPath,
                         CastPolicy policy, const DiagnosticSink & sink )
{
    return RecursiveCaster( policy, useConstructorPath, sink ).cast( source, target );
}

StructPtr recursiveCast( const Struct * source, const std::string & targetType, bool useConstructorPath,
                         CastPolicy policy, const DiagnosticSink & sink )
{
    return RecursiveCaster( policy, useConstructorPath, sink ).cast( source, targetType );
}

}
