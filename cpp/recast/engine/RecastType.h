#ifndef _IN_RECAST_ENGINE_RECASTTYPE_H
#define _IN_RECAST_ENGINE_RECASTTYPE_H

#include <recast/core/Enum.h>
#include <recast/engine/Dictionary.h>
#include <cstdint>
#include <memory>
#include <string>

namespace recast
{

//Opaque field payload for fields whose declared type cannot be resolved ( ie a type union ).
//The raw source value is stored and never recursed into
using GenericValue = Dictionary::Data;

class StructMeta;

struct RecastTypeTraits
{
    enum _enum : uint8_t
    {
        UNKNOWN,
        BOOL,
        INT8,
        UINT8,
        INT16,
        UINT16,
        INT32,
        UINT32,
        INT64,
        UINT64,
        DOUBLE,
        STRING,
        STRUCT,
        ARRAY,
        GENERIC,

        NUM_TYPES
    };
};

//Declared type of a struct field.  Primitive types are shared singletons, STRUCT and ARRAY carry their
//nested meta / element type in the subclasses below
class RecastType
{
public:
    using Type = Enum<RecastTypeTraits>;
    using Ptr  = std::shared_ptr<const RecastType>;

    explicit RecastType( Type t ) : m_type( t ) {}
    virtual ~RecastType() {}

    Type type() const { return m_type; }

    //BOOL through STRING, plus GENERIC.  throws TypeError for STRUCT and ARRAY
    static const Ptr & primitive( Type t );

    static const Ptr & BOOL()    { return primitive( Type::BOOL ); }
    static const Ptr & INT8()    { return primitive( Type::INT8 ); }
    static const Ptr & UINT8()   { return primitive( Type::UINT8 ); }
    static const Ptr & INT16()   { return primitive( Type::INT16 ); }
    static const Ptr & UINT16()  { return primitive( Type::UINT16 ); }
    static const Ptr & INT32()   { return primitive( Type::INT32 ); }
    static const Ptr & UINT32()  { return primitive( Type::UINT32 ); }
    static const Ptr & INT64()   { return primitive( Type::INT64 ); }
    static const Ptr & UINT64()  { return primitive( Type::UINT64 ); }
    static const Ptr & DOUBLE()  { return primitive( Type::DOUBLE ); }
    static const Ptr & STRING()  { return primitive( Type::STRING ); }
    static const Ptr & GENERIC() { return primitive( Type::GENERIC ); }

    //structural equality, nested struct types compare by meta identity
    bool isSameType( const RecastType & rhs ) const;

    //"INT32", the struct name, or "[elem]" for arrays
    std::string typeName() const;

private:
    Type m_type;
};

using RecastTypePtr = RecastType::Ptr;

class RecastStructType : public RecastType
{
public:
    RecastStructType( const std::shared_ptr<StructMeta> & meta ) : RecastType( Type::STRUCT ), m_meta( meta )
    {}

    const std::shared_ptr<StructMeta> & meta() const { return m_meta; }

private:
    std::shared_ptr<StructMeta> m_meta;
};

class RecastArrayType : public RecastType
{
public:
    RecastArrayType( RecastTypePtr elemType ) : RecastType( Type::ARRAY ), m_elemType( std::move( elemType ) )
    {}

    const RecastTypePtr & elemType() const { return m_elemType; }

    //one shared instance per element type
    static const RecastTypePtr & create( const RecastTypePtr & elemType );

private:
    RecastTypePtr m_elemType;
};

}

#endif
