#include <recast/cast/StructToDictionary.h>
#include <recast/engine/CastExceptions.h>
#include <recast/engine/TypeSwitch.h>
#include <unordered_set>

namespace recast
{

namespace
{

class StructToDictionaryHelper
{
public:
    DictionaryPtr toDictionary( const Struct * s );

private:
    static Dictionary::Value toValue( bool v )                { return Dictionary::Value( v ); }
    static Dictionary::Value toValue( int8_t v )              { return Dictionary::Value( ( int32_t ) v ); }
    static Dictionary::Value toValue( uint8_t v )             { return Dictionary::Value( ( uint32_t ) v ); }
    static Dictionary::Value toValue( int16_t v )             { return Dictionary::Value( ( int32_t ) v ); }
    static Dictionary::Value toValue( uint16_t v )            { return Dictionary::Value( ( uint32_t ) v ); }
    static Dictionary::Value toValue( int32_t v )             { return Dictionary::Value( v ); }
    static Dictionary::Value toValue( uint32_t v )            { return Dictionary::Value( v ); }
    static Dictionary::Value toValue( int64_t v )             { return Dictionary::Value( v ); }
    static Dictionary::Value toValue( uint64_t v )            { return Dictionary::Value( v ); }
    static Dictionary::Value toValue( double v )              { return Dictionary::Value( v ); }
    static Dictionary::Value toValue( const std::string & v ) { return Dictionary::Value( v ); }
    static Dictionary::Value toValue( const GenericValue & v ) { return Dictionary::deepcopy( v._data ); }

    Dictionary::Value toValue( const StructPtr & v )
    {
        if( !v )
            return Dictionary::Value();
        return Dictionary::Value( toDictionary( v.get() ) );
    }

    template<typename StorageT>
    Dictionary::Value toValue( const std::vector<StorageT> & v, const RecastArrayType & type )
    {
        //bool arrays are held as uint8_t
        bool isBool = type.elemType() -> type() == RecastType::Type::BOOL;

        Dictionary::Vector out;
        out.reserve( v.size() );
        for( auto & elem : v )
        {
            if constexpr( std::is_same_v<StorageT, uint8_t> )
            {
                if( isBool )
                {
                    out.emplace_back( Dictionary::Value( bool( elem ) ) );
                    continue;
                }
            }
            out.emplace_back( toValue( elem ) );
        }
        return Dictionary::Value( std::move( out ) );
    }

    class CircularRefCheck
    {
    public:
        CircularRefCheck( std::unordered_set<const void *> & ptrsVisited, const Struct * ptr ) : m_ptrsVisited( ptrsVisited ), m_ptr( ptr )
        {
            auto [_, inserted] = m_ptrsVisited.insert( m_ptr );
            if( !inserted )
                RECAST_THROW( CyclicGraph, "Struct of type " << ptr -> meta() -> name() << " is reachable from itself" );
        }

        ~CircularRefCheck() { m_ptrsVisited.erase( m_ptr ); }

    private:
        std::unordered_set<const void *> & m_ptrsVisited;
        const void * m_ptr;
    };

    std::unordered_set<const void *> m_ptrsVisited;
};

DictionaryPtr StructToDictionaryHelper::toDictionary( const Struct * s )
{
    CircularRefCheck checker( m_ptrsVisited, s );

    auto out = std::make_shared<Dictionary>();
    const StructMeta * meta = s -> meta();
    for( auto & field : meta -> fields() )
    {
        if( !field -> isSet( s ) )
            continue;

        Dictionary::Value value = switchRecastType( field -> type(), [ this, &field, s ]( auto tag )
            {
                using CType = typename decltype( tag )::type;
                if constexpr( IsArrayStorage<CType>::value )
                    return toValue( field -> template value<CType>( s ), static_cast<const RecastArrayType &>( *field -> type() ) );
                else
                    return toValue( field -> template value<CType>( s ) );
            } );

        out -> update( field -> fieldname(), std::move( value ) );
    }
    return out;
}

}

DictionaryPtr structToDictionary( const Struct * s )
{
    RECAST_TRUE_OR_THROW( s != nullptr, InvalidArgument, "structToDictionary called with a null struct" );
    return StructToDictionaryHelper().toDictionary( s );
}

}
