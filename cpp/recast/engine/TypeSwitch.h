#ifndef _IN_RECAST_ENGINE_TYPESWITCH_H
#define _IN_RECAST_ENGINE_TYPESWITCH_H

#include <recast/core/Exception.h>
#include <recast/engine/RecastType.h>
#include <recast/engine/Struct.h>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace recast
{

RECAST_DECLARE_EXCEPTION( UnsupportedSwitchType, TypeError )

template<typename T>
struct TypeTag
{
    using type = T;
};

//storage of an ARRAY field, bool elements are held as uint8_t to avoid vector<bool>
template<typename ElemT>
struct ArrayStorage
{
    using type = std::vector<ElemT>;
};

template<>
struct ArrayStorage<bool>
{
    using type = std::vector<uint8_t>;
};

template<typename T>
struct IsArrayStorage : std::false_type {};

template<typename ElemT>
struct IsArrayStorage<std::vector<ElemT>> : std::true_type {};

namespace detail
{

template<typename T>
struct Scalar
{
    using type = T;
};

template<typename T>
struct ArrayOf
{
    using type = typename ArrayStorage<T>::type;
};

template<template<typename> class Wrap, typename F>
auto dispatchElement( const RecastType & type, F && f )
{
    switch( type.type() )
    {
        case RecastType::Type::BOOL:    return f( TypeTag<typename Wrap<bool>::type>() );
        case RecastType::Type::INT8:    return f( TypeTag<typename Wrap<int8_t>::type>() );
        case RecastType::Type::UINT8:   return f( TypeTag<typename Wrap<uint8_t>::type>() );
        case RecastType::Type::INT16:   return f( TypeTag<typename Wrap<int16_t>::type>() );
        case RecastType::Type::UINT16:  return f( TypeTag<typename Wrap<uint16_t>::type>() );
        case RecastType::Type::INT32:   return f( TypeTag<typename Wrap<int32_t>::type>() );
        case RecastType::Type::UINT32:  return f( TypeTag<typename Wrap<uint32_t>::type>() );
        case RecastType::Type::INT64:   return f( TypeTag<typename Wrap<int64_t>::type>() );
        case RecastType::Type::UINT64:  return f( TypeTag<typename Wrap<uint64_t>::type>() );
        case RecastType::Type::DOUBLE:  return f( TypeTag<typename Wrap<double>::type>() );
        case RecastType::Type::STRING:  return f( TypeTag<typename Wrap<std::string>::type>() );
        case RecastType::Type::STRUCT:  return f( TypeTag<typename Wrap<StructPtr>::type>() );
        case RecastType::Type::GENERIC: return f( TypeTag<typename Wrap<GenericValue>::type>() );
        default:
            break;
    }
    RECAST_THROW( UnsupportedSwitchType, "Unsupported type " << type.typeName() );
}

}

//Invokes f with a TypeTag whose ::type is the C storage of a field of the given type.
//Arrays of arrays throw UnsupportedSwitchType
template<typename F>
auto switchRecastType( const RecastType & type, F && f )
{
    if( type.type() == RecastType::Type::ARRAY )
        return detail::dispatchElement<detail::ArrayOf>( *static_cast<const RecastArrayType &>( type ).elemType(), f );
    return detail::dispatchElement<detail::Scalar>( type, f );
}

template<typename F>
auto switchRecastType( const RecastTypePtr & type, F && f )
{
    return switchRecastType( *type, std::forward<F>( f ) );
}

}

#endif
