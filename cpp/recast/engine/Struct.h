#ifndef _IN_RECAST_ENGINE_STRUCT_H
#define _IN_RECAST_ENGINE_STRUCT_H

#include <recast/engine/Dictionary.h>
#include <recast/engine/RecastType.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace recast
{

class Struct;
class StructMeta;
using StructMetaPtr = std::shared_ptr<StructMeta>;

//Owning handle to a Struct instance.  Instances carry their own reference count, copies share the instance
class StructPtr
{
public:
    StructPtr() : m_obj( nullptr ) {}
    //adopts the single reference a new instance starts with
    explicit StructPtr( Struct * s ) : m_obj( s ) {}
    StructPtr( const StructPtr & rhs );
    StructPtr( StructPtr && rhs ) noexcept : m_obj( rhs.m_obj ) { rhs.m_obj = nullptr; }
    ~StructPtr() { reset(); }

    StructPtr & operator=( StructPtr rhs ) noexcept
    {
        std::swap( m_obj, rhs.m_obj );
        return *this;
    }

    Struct * get() const           { return m_obj; }
    Struct * operator->() const    { return m_obj; }
    Struct & operator*() const     { return *m_obj; }
    explicit operator bool() const { return m_obj != nullptr; }

    void reset();

private:
    Struct * m_obj;
};

StructPtr deepcopyValue( const StructPtr & v );
GenericValue deepcopyValue( const GenericValue & v );

template<typename T>
T deepcopyValue( const T & v )
{
    return v;
}

template<typename T>
std::vector<T> deepcopyValue( const std::vector<T> & v )
{
    if constexpr( std::is_arithmetic_v<T> || std::is_same_v<T, std::string> )
        return v;
    else
    {
        std::vector<T> out;
        out.reserve( v.size() );
        for( auto & elem : v )
            out.emplace_back( deepcopyValue( elem ) );
        return out;
    }
}

//A named slot in a struct's storage.  Each field owns its offset and its bit in the set/unset mask
class StructField
{
public:
    virtual ~StructField() {}

    const std::string & fieldname() const { return m_fieldname; }
    const RecastTypePtr & type() const    { return m_type; }
    size_t size() const                   { return m_size; }
    size_t alignment() const              { return m_alignment; }
    size_t offset() const                 { return m_offset; }

    bool isSet( const Struct * s ) const  { return ( *maskByte( s ) & m_maskBit ) != 0; }

    //T must be the field's storage type, as handed out by switchRecastType
    template<typename T>
    const T & value( const Struct * s ) const;

    template<typename T>
    void setValue( Struct * s, T v ) const;

    void clearValue( Struct * s ) const
    {
        reset( s );
        *maskByte( s ) &= uint8_t( ~m_maskBit );
    }

protected:
    StructField( RecastTypePtr type, const std::string & fieldname, size_t size, size_t alignment );

    void * slot( Struct * s ) const;
    const void * slot( const Struct * s ) const;

    void markSet( Struct * s ) const { *maskByte( s ) |= m_maskBit; }

private:
    friend class StructMeta;

    virtual void construct( Struct * s ) const = 0;
    virtual void destruct( Struct * s ) const = 0;
    virtual void reset( Struct * s ) const = 0;
    //copies the value and the set bit
    virtual void copyValue( const Struct * src, Struct * dest, bool deep ) const = 0;

    uint8_t * maskByte( Struct * s ) const;
    const uint8_t * maskByte( const Struct * s ) const;

    std::string   m_fieldname;
    RecastTypePtr m_type;
    size_t        m_size;
    size_t        m_alignment;
    size_t        m_offset;
    size_t        m_maskOffset;
    uint8_t       m_maskBit;
    bool          m_placed;
};

using StructFieldPtr = std::shared_ptr<StructField>;

template<typename T>
class TypedStructField final : public StructField
{
public:
    TypedStructField( RecastTypePtr type, const std::string & fieldname ) :
        StructField( std::move( type ), fieldname, sizeof( T ), alignof( T ) )
    {}

    const T & get( const Struct * s ) const { return *static_cast<const T *>( slot( s ) ); }
    T & get( Struct * s ) const             { return *static_cast<T *>( slot( s ) ); }

    void set( Struct * s, T v ) const
    {
        get( s ) = std::move( v );
        markSet( s );
    }

private:
    void construct( Struct * s ) const override { new( slot( s ) ) T(); }
    void destruct( Struct * s ) const override  { get( s ).~T(); }
    void reset( Struct * s ) const override     { get( s ) = T(); }

    void copyValue( const Struct * src, Struct * dest, bool deep ) const override
    {
        if( !isSet( src ) )
        {
            clearValue( dest );
            return;
        }

        get( dest ) = deep ? deepcopyValue( get( src ) ) : get( src );
        markSet( dest );
    }
};

//throws ValueError for an empty name, UnsupportedSwitchType for arrays of arrays
StructFieldPtr makeStructField( const RecastTypePtr & type, const std::string & fieldname );

/*
Runtime struct type.

Instance storage is laid out level by level: the base type's storage comes first and is untouched by derived
types, so a base type's fields address a derived instance correctly.  Each level places its own fields by
decreasing alignment and follows them with one mask byte per 8 fields.
*/
class StructMeta : public std::enable_shared_from_this<StructMeta>
{
public:
    using Fields     = std::vector<StructFieldPtr>;
    using FieldNames = std::vector<std::string>;

    //A field object can belong to a single type.  staticFields are type-level constants and never part of an instance
    StructMeta( const std::string & name, const Fields & fields, StructMetaPtr base = nullptr,
                const Dictionary & staticFields = Dictionary() );
    ~StructMeta();

    const std::string & name() const   { return m_name; }
    const StructMetaPtr & base() const { return m_base; }
    size_t size() const                { return m_size; }

    //base fields first, then this type's in declaration order
    const Fields & fields() const         { return m_fields; }
    const FieldNames & fieldNames() const { return m_fieldNames; }

    //null if not declared
    const StructFieldPtr & field( const std::string & name ) const;

    const Dictionary & staticFields() const              { return m_staticFields; }
    bool isStaticField( const std::string & name ) const { return m_staticFields.exists( name ); }

    void setDefault( StructPtr instance );
    const StructPtr & defaultInstance() const { return m_default; }

    //constructor path, the default instance is deep-copied in
    StructPtr create() const;
    //constructor bypass, every field unset
    StructPtr createUninitialized() const;

    static bool isDerivedType( const StructMeta * derived, const StructMeta * base );

private:
    friend class Struct;

    void copyFields( const Struct * src, Struct * dest, bool deep ) const;
    void destroy( Struct * s ) const;

    std::string                                     m_name;
    StructMetaPtr                                   m_base;
    Fields                                          m_fields;
    FieldNames                                      m_fieldNames;
    std::unordered_map<std::string, StructFieldPtr> m_fieldMap;
    Dictionary                                      m_staticFields;
    StructPtr                                       m_default;
    size_t                                          m_size;
};

//Header of an instance, the meta's storage follows it in the same allocation
class alignas( std::max_align_t ) Struct
{
public:
    const StructMeta * meta() const                           { return m_meta.get(); }
    const std::shared_ptr<const StructMeta> & metaPtr() const { return m_meta; }
    size_t refcount() const                                   { return m_refcount; }

    bool allFieldsSet() const;
    void clear();

    //nested structs, arrays and generic values are cloned
    StructPtr deepcopy() const;

    std::byte * data()             { return reinterpret_cast<std::byte *>( this + 1 ); }
    const std::byte * data() const { return reinterpret_cast<const std::byte *>( this + 1 ); }

private:
    friend class StructMeta;
    friend class StructPtr;

    Struct( std::shared_ptr<const StructMeta> meta ) : m_refcount( 1 ), m_meta( std::move( meta ) ) {}
    ~Struct() {}

    void incref() { ++m_refcount; }
    void decref();

    size_t                            m_refcount;
    std::shared_ptr<const StructMeta> m_meta;
};

inline StructPtr::StructPtr( const StructPtr & rhs ) : m_obj( rhs.m_obj )
{
    if( m_obj )
        m_obj -> incref();
}

inline void StructPtr::reset()
{
    Struct * obj = m_obj;
    m_obj = nullptr;
    if( obj )
        obj -> decref();
}

inline void * StructField::slot( Struct * s ) const             { return s -> data() + m_offset; }
inline const void * StructField::slot( const Struct * s ) const { return s -> data() + m_offset; }

inline uint8_t * StructField::maskByte( Struct * s ) const             { return reinterpret_cast<uint8_t *>( s -> data() + m_maskOffset ); }
inline const uint8_t * StructField::maskByte( const Struct * s ) const { return reinterpret_cast<const uint8_t *>( s -> data() + m_maskOffset ); }

template<typename T>
inline const T & StructField::value( const Struct * s ) const
{
    return static_cast<const TypedStructField<T> *>( this ) -> get( s );
}

template<typename T>
inline void StructField::setValue( Struct * s, T v ) const
{
    static_cast<const TypedStructField<T> *>( this ) -> set( s, std::move( v ) );
}

}

#endif
