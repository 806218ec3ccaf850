#include <recast/core/Platform.h>
#include <recast/engine/Struct.h>
#include <recast/engine/TypeSwitch.h>
#include <algorithm>
#include <cstring>

namespace recast
{

namespace
{

template<typename T>
struct ScopedIncrement
{
    ScopedIncrement( T & v ) : m_v{ v } { ++m_v; }
    ~ScopedIncrement() { --m_v; }

private:
    ScopedIncrement() = delete;
    T & m_v;
};

constexpr size_t MAX_DEEPCOPY_DEPTH = 1000;

size_t alignUp( size_t offset, size_t alignment )
{
    return ( offset + alignment - 1 ) / alignment * alignment;
}

}

StructPtr deepcopyValue( const StructPtr & v )
{
    return v ? v -> deepcopy() : StructPtr();
}

GenericValue deepcopyValue( const GenericValue & v )
{
    return GenericValue( Dictionary::deepcopy( v._data ) );
}

StructField::StructField( RecastTypePtr type, const std::string & fieldname, size_t size, size_t alignment ) :
    m_fieldname( fieldname ),
    m_type( std::move( type ) ),
    m_size( size ),
    m_alignment( alignment ),
    m_offset( 0 ),
    m_maskOffset( 0 ),
    m_maskBit( 0 ),
    m_placed( false )
{
}

StructFieldPtr makeStructField( const RecastTypePtr & type, const std::string & fieldname )
{
    if( fieldname.empty() )
        RECAST_THROW( ValueError, "Struct field names must be non-empty" );

    RECAST_TRUE_OR_THROW( type != nullptr, ValueError, "Struct field " << fieldname << " has no type" );

    if( type -> type() == RecastType::Type::STRUCT )
        RECAST_TRUE_OR_THROW( static_cast<const RecastStructType &>( *type ).meta() != nullptr, ValueError,
                              "Struct field " << fieldname << " has no struct type" );

    return switchRecastType( type, [ &type, &fieldname ]( auto tag ) -> StructFieldPtr
        {
            using CType = typename decltype( tag )::type;
            return std::make_shared<TypedStructField<CType>>( type, fieldname );
        } );
}

StructMeta::StructMeta( const std::string & name, const Fields & fields, StructMetaPtr base,
                        const Dictionary & staticFields ) : m_name( name ),
                                                            m_base( std::move( base ) ),
                                                            m_staticFields( staticFields ),
                                                            m_size( 0 )
{
    if( m_name.empty() )
        RECAST_THROW( ValueError, "Struct types must have a non-empty name" );

    if( fields.empty() && !m_base )
        RECAST_THROW( TypeError, "Struct types must define at least 1 field" );

    if( m_base )
    {
        m_fields     = m_base -> m_fields;
        m_fieldNames = m_base -> m_fieldNames;
        m_fieldMap   = m_base -> m_fieldMap;

        //static fields are inherited unless redefined
        auto & baseStatics = m_base -> m_staticFields;
        for( auto it = baseStatics.begin(); it != baseStatics.end(); ++it )
            m_staticFields.insert( it.key(), it.getUntypedValue() );
    }

    for( auto & field : fields )
    {
        RECAST_TRUE_OR_THROW( field != nullptr, ValueError, "Struct " << m_name << " has a null field" );
        RECAST_TRUE_OR_THROW( !field -> m_placed, ValueError,
                              "Struct " << m_name << " field " << field -> fieldname() << " already belongs to another struct type" );

        if( !m_fieldMap.emplace( field -> fieldname(), field ).second )
            RECAST_THROW( ValueError, "Struct " << m_name << " attempted to add existing field " << field -> fieldname() );

        m_fields.emplace_back( field );
        m_fieldNames.emplace_back( field -> fieldname() );
    }

    for( auto it = m_staticFields.begin(); it != m_staticFields.end(); ++it )
    {
        if( m_fieldMap.find( it.key() ) != m_fieldMap.end() )
            RECAST_THROW( ValueError, "Struct " << m_name << " static field " << it.key() << " collides with an instance field" );
    }

    std::vector<StructField *> byAlignment;
    byAlignment.reserve( fields.size() );
    for( auto & field : fields )
        byAlignment.emplace_back( field.get() );

    std::stable_sort( byAlignment.begin(), byAlignment.end(),
                      []( const StructField * a, const StructField * b ) { return a -> alignment() > b -> alignment(); } );

    size_t offset = m_base ? m_base -> size() : 0;
    for( auto * field : byAlignment )
    {
        offset = alignUp( offset, field -> alignment() );
        field -> m_offset = offset;
        offset += field -> size();
    }

    size_t maskOffset = offset;
    for( size_t idx = 0; idx < fields.size(); ++idx )
    {
        auto & field = fields[ idx ];
        field -> m_maskOffset = maskOffset + idx / 8;
        field -> m_maskBit    = uint8_t( 1u << ( idx % 8 ) );
        field -> m_placed     = true;
    }

    m_size = maskOffset + ( fields.size() + 7 ) / 8;
}

StructMeta::~StructMeta()
{
    m_default.reset();
}

const StructFieldPtr & StructMeta::field( const std::string & name ) const
{
    static const StructFieldPtr s_empty;

    auto it = m_fieldMap.find( name );
    return it == m_fieldMap.end() ? s_empty : it -> second;
}

void StructMeta::setDefault( StructPtr instance )
{
    if( instance && instance -> meta() != this )
        RECAST_THROW( TypeError, "Struct " << m_name << " default instance has mismatched type " << instance -> meta() -> name() );

    m_default = std::move( instance );
}

StructPtr StructMeta::createUninitialized() const
{
    auto self = shared_from_this();

    void * mem = ::operator new( sizeof( Struct ) + m_size );
    Struct * s = new( mem ) Struct( std::move( self ) );
    memset( s -> data(), 0, m_size );

    for( auto & field : m_fields )
        field -> construct( s );

    return StructPtr( s );
}

StructPtr StructMeta::create() const
{
    auto s = createUninitialized();
    if( m_default )
        copyFields( m_default.get(), s.get(), true );
    return s;
}

void StructMeta::copyFields( const Struct * src, Struct * dest, bool deep ) const
{
    for( auto & field : m_fields )
        field -> copyValue( src, dest, deep );
}

void StructMeta::destroy( Struct * s ) const
{
    for( auto & field : m_fields )
        field -> destruct( s );

    s -> ~Struct();
    ::operator delete( s );
}

bool StructMeta::isDerivedType( const StructMeta * derived, const StructMeta * base )
{
    for( const StructMeta * m = derived; m; m = m -> m_base.get() )
    {
        if( m == base )
            return true;
    }
    return false;
}

bool Struct::allFieldsSet() const
{
    for( auto & field : meta() -> fields() )
    {
        if( !field -> isSet( this ) )
            return false;
    }
    return true;
}

void Struct::clear()
{
    for( auto & field : meta() -> fields() )
        field -> clearValue( this );
}

StructPtr Struct::deepcopy() const
{
    static thread_local size_t s_depth = 0;
    ScopedIncrement guard( s_depth );

    if( unlikely( s_depth > MAX_DEEPCOPY_DEPTH ) )
        RECAST_THROW( RecursionError,
                      "Exceeded max recursion depth of " << MAX_DEEPCOPY_DEPTH << " in " << meta() -> name() << "::deepcopy(), cannot copy cyclic data structure" );

    auto out = meta() -> createUninitialized();
    meta() -> copyFields( this, out.get(), true );
    return out;
}

void Struct::decref()
{
    if( --m_refcount > 0 )
        return;

    //the instance holds the last reference to its meta in some cases
    auto meta = m_meta;
    meta -> destroy( this );
}

}
