#include <recast/engine/RecastType.h>
#include <recast/engine/Struct.h>
#include <array>
#include <mutex>
#include <unordered_map>

namespace recast
{

INIT_RECAST_ENUM( RecastType::Type,
           "UNKNOWN",
           "BOOL",
           "INT8",
           "UINT8",
           "INT16",
           "UINT16",
           "INT32",
           "UINT32",
           "INT64",
           "UINT64",
           "DOUBLE",
           "STRING",
           "STRUCT",
           "ARRAY",
           "GENERIC"
    );

const RecastTypePtr & RecastType::primitive( Type t )
{
    static const std::array<RecastTypePtr, Type::numTypes()> s_types = []()
    {
        std::array<RecastTypePtr, Type::numTypes()> types;
        for( size_t i = Type::BOOL; i <= Type::STRING; ++i )
            types[ i ] = std::make_shared<const RecastType>( Type( Type::EnumV( i ) ) );
        types[ Type::GENERIC ] = std::make_shared<const RecastType>( Type( Type::GENERIC ) );
        return types;
    }();

    if( !s_types[ t ] )
        RECAST_THROW( TypeError, t << " is not a primitive type" );
    return s_types[ t ];
}

bool RecastType::isSameType( const RecastType & rhs ) const
{
    if( this == &rhs )
        return true;
    if( m_type != rhs.m_type )
        return false;

    if( m_type == Type::STRUCT )
        return static_cast<const RecastStructType &>( *this ).meta() == static_cast<const RecastStructType &>( rhs ).meta();
    if( m_type == Type::ARRAY )
        return static_cast<const RecastArrayType &>( *this ).elemType() -> isSameType( *static_cast<const RecastArrayType &>( rhs ).elemType() );
    return true;
}

std::string RecastType::typeName() const
{
    if( m_type == Type::STRUCT )
        return static_cast<const RecastStructType &>( *this ).meta() -> name();
    if( m_type == Type::ARRAY )
        return "[" + static_cast<const RecastArrayType &>( *this ).elemType() -> typeName() + "]";
    return m_type.asString();
}

const RecastTypePtr & RecastArrayType::create( const RecastTypePtr & elemType )
{
    static std::mutex s_mutex;
    static std::unordered_map<const RecastType *, RecastTypePtr> s_cache;

    std::lock_guard<std::mutex> guard( s_mutex );
    auto & entry = s_cache[ elemType.get() ];
    if( !entry )
        entry = std::make_shared<const RecastArrayType>( elemType );
    return entry;
}

}
