#include <recast/cast/StructSerializer.h>
#include <recast/cast/StructRecord.pb.h>
#include <recast/engine/TypeSwitch.h>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/io/coded_stream.h>
#include <algorithm>
#include <limits>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace proto = google::protobuf;

namespace recast
{

namespace
{

constexpr size_t MAX_DEPTH = Dictionary::MAX_DEPTH;

//each struct level nests FieldValue > StructRecord > StructBody > Field
constexpr int PARSE_RECURSION_LIMIT = 4 * int( MAX_DEPTH ) + 64;

pb::FieldValue::KindCase kindFor( RecastType::Type type )
{
    switch( type )
    {
        case RecastType::Type::BOOL:    return pb::FieldValue::kBoolValue;
        case RecastType::Type::INT8:    return pb::FieldValue::kInt8Value;
        case RecastType::Type::UINT8:   return pb::FieldValue::kUint8Value;
        case RecastType::Type::INT16:   return pb::FieldValue::kInt16Value;
        case RecastType::Type::UINT16:  return pb::FieldValue::kUint16Value;
        case RecastType::Type::INT32:   return pb::FieldValue::kInt32Value;
        case RecastType::Type::UINT32:  return pb::FieldValue::kUint32Value;
        case RecastType::Type::INT64:   return pb::FieldValue::kInt64Value;
        case RecastType::Type::UINT64:  return pb::FieldValue::kUint64Value;
        case RecastType::Type::DOUBLE:  return pb::FieldValue::kDoubleValue;
        case RecastType::Type::STRING:  return pb::FieldValue::kStringValue;
        case RecastType::Type::STRUCT:  return pb::FieldValue::kStructValue;
        case RecastType::Type::ARRAY:   return pb::FieldValue::kArrayValue;
        case RecastType::Type::GENERIC: return pb::FieldValue::kGenericValue;
        default:
            RECAST_THROW( TypeError, "No serialized kind for type " << type );
    }
}

bool parseMessage( const std::string & bytes, proto::MessageLite & msg )
{
    if( bytes.size() > size_t( std::numeric_limits<int>::max() ) )
        return false;

    proto::io::CodedInputStream input( reinterpret_cast<const uint8_t *>( bytes.data() ), int( bytes.size() ) );
    input.SetRecursionLimit( PARSE_RECURSION_LIMIT );
    return msg.ParseFromCodedStream( &input ) && input.ConsumedEntireMessage();
}

proto::Any parseEnvelope( const std::string & bytes )
{
    proto::Any any;
    if( !parseMessage( bytes, any ) )
        RECAST_THROW( RelabelFailed, "Serialized struct is not a valid record" );
    return any;
}

std::string typeNameFromUrl( const std::string & url )
{
    static const std::string s_prefix( StructSerializer::TYPE_URL_PREFIX );

    if( url.size() <= s_prefix.size() || url.compare( 0, s_prefix.size(), s_prefix ) != 0 )
        RECAST_THROW( RelabelFailed, "Serialized struct has unrecognized type url \"" << url << "\"" );
    return url.substr( s_prefix.size() );
}

class StructWriter
{
public:
    void writeBody( const Struct * s, pb::StructBody & body );

private:
    template<typename T>
    void writeValue( const T & v, const RecastType & type, pb::FieldValue & out );

    void writeGeneric( const Dictionary::Value & value, pb::GenericValue & out, size_t depth );

    class CircularRefCheck
    {
    public:
        CircularRefCheck( std::unordered_set<const Struct *> & visited, const Struct * s ) : m_visited( visited ), m_ptr( s )
        {
            if( !m_visited.insert( s ).second )
                RECAST_THROW( CyclicGraph, "Struct of type " << s -> meta() -> name() << " is reachable from itself, cannot serialize" );
        }

        ~CircularRefCheck() { m_visited.erase( m_ptr ); }

    private:
        std::unordered_set<const Struct *> & m_visited;
        const Struct * m_ptr;
    };

    std::unordered_set<const Struct *> m_visited;
};

void StructWriter::writeBody( const Struct * s, pb::StructBody & body )
{
    CircularRefCheck checker( m_visited, s );
    if( m_visited.size() > MAX_DEPTH )
        RECAST_THROW( RecursionError, "Exceeded max nesting depth of " << MAX_DEPTH << " serializing " << s -> meta() -> name() );

    for( auto & field : s -> meta() -> fields() )
    {
        if( !field -> isSet( s ) )
            continue;

        auto * out = body.add_fields();
        out -> set_name( field -> fieldname() );
        switchRecastType( field -> type(), [ this, s, &field, out ]( auto tag )
            {
                using CType = typename decltype( tag )::type;
                writeValue( field -> template value<CType>( s ), *field -> type(), *out -> mutable_value() );
            } );
    }
}

template<typename T>
void StructWriter::writeValue( const T & v, const RecastType & type, pb::FieldValue & out )
{
    if constexpr( std::is_same_v<T, std::string> )
        out.set_string_value( v );
    else if constexpr( std::is_same_v<T, StructPtr> )
    {
        if( !v )
        {
            out.set_null_struct( true );
            return;
        }

        auto * record = out.mutable_struct_value();
        record -> set_type_name( v -> meta() -> name() );
        writeBody( v.get(), *record -> mutable_body() );
    }
    else if constexpr( std::is_same_v<T, GenericValue> )
        writeGeneric( v._data, *out.mutable_generic_value(), 0 );
    else if constexpr( std::is_same_v<T, bool> )     out.set_bool_value( v );
    else if constexpr( std::is_same_v<T, int8_t> )   out.set_int8_value( v );
    else if constexpr( std::is_same_v<T, uint8_t> )  out.set_uint8_value( v );
    else if constexpr( std::is_same_v<T, int16_t> )  out.set_int16_value( v );
    else if constexpr( std::is_same_v<T, uint16_t> ) out.set_uint16_value( v );
    else if constexpr( std::is_same_v<T, int32_t> )  out.set_int32_value( v );
    else if constexpr( std::is_same_v<T, uint32_t> ) out.set_uint32_value( v );
    else if constexpr( std::is_same_v<T, int64_t> )  out.set_int64_value( v );
    else if constexpr( std::is_same_v<T, uint64_t> ) out.set_uint64_value( v );
    else if constexpr( std::is_same_v<T, double> )   out.set_double_value( v );
    else
    {
        using StorageT = typename T::value_type;
        auto & elemType = *static_cast<const RecastArrayType &>( type ).elemType();

        auto * array = out.mutable_array_value();
        array -> mutable_elements() -> Reserve( int( std::min<size_t>( v.size(), std::numeric_limits<int>::max() ) ) );
        for( auto & elem : v )
        {
            auto * elemOut = array -> add_elements();
            if constexpr( std::is_same_v<StorageT, uint8_t> )
            {
                //bool arrays are held as uint8_t
                if( elemType.type() == RecastType::Type::BOOL )
                {
                    elemOut -> set_bool_value( elem != 0 );
                    continue;
                }
            }
            writeValue( elem, elemType, *elemOut );
        }
    }
}

void StructWriter::writeGeneric( const Dictionary::Value & value, pb::GenericValue & out, size_t depth )
{
    if( depth > MAX_DEPTH )
        RECAST_THROW( RecursionError, "Exceeded max nesting depth of " << MAX_DEPTH << " serializing generic value" );

    std::visit( [ this, &out, depth ]( auto && arg )
        {
            using T = std::decay_t<decltype( arg )>;
            if constexpr( std::is_same_v<T, std::monostate> )
                out.set_none( true );
            else if constexpr( std::is_same_v<T, bool> )
                out.set_bool_value( arg );
            else if constexpr( std::is_same_v<T, int32_t> )
                out.set_int32_value( arg );
            else if constexpr( std::is_same_v<T, uint32_t> )
                out.set_uint32_value( arg );
            else if constexpr( std::is_same_v<T, int64_t> )
                out.set_int64_value( arg );
            else if constexpr( std::is_same_v<T, uint64_t> )
                out.set_uint64_value( arg );
            else if constexpr( std::is_same_v<T, double> )
                out.set_double_value( arg );
            else if constexpr( std::is_same_v<T, std::string> )
                out.set_string_value( arg );
            else if constexpr( std::is_same_v<T, DictionaryPtr> )
            {
                if( !arg )
                {
                    out.set_none( true );
                    return;
                }

                auto * dict = out.mutable_dict_value();
                for( auto it = arg -> begin(); it != arg -> end(); ++it )
                {
                    auto * entry = dict -> add_entries();
                    entry -> set_key( it.key() );
                    writeGeneric( it.getUntypedValue(), *entry -> mutable_value(), depth + 1 );
                }
            }
            else
            {
                auto * list = out.mutable_list_value();
                for( auto & elem : arg )
                    writeGeneric( elem._data, *list -> add_values(), depth + 1 );
            }
        }, value );
}

class StructReader
{
public:
    StructReader( const AllowedTypes & allowedTypes, const StructMetaRegistry & registry ) :
        m_allowedTypes( allowedTypes ), m_registry( registry )
    {}

    StructPtr readObject( const std::string & typeName, const pb::StructBody & body, size_t depth );

private:
    template<typename T>
    T readValue( const pb::FieldValue & value, const RecastType & type, const std::string & fieldName, size_t depth );

    template<typename T, typename WireT>
    static T narrow( WireT v, const RecastType & type, const std::string & fieldName )
    {
        if( !std::in_range<T>( v ) )
            RECAST_THROW( RelabelFailed, "Serialized value " << v << " for \"" << fieldName << "\" is out of range for " << type.typeName() );
        return T( v );
    }

    static void expectKind( const pb::FieldValue & value, const RecastType & type, const std::string & fieldName )
    {
        auto kind = value.kind_case();
        if( type.type() == RecastType::Type::STRUCT && kind == pb::FieldValue::kNullStruct )
            return;
        if( kind != kindFor( type.type() ) )
            RECAST_THROW( RelabelFailed, "Serialized value for \"" << fieldName << "\" does not hold a " << type.typeName() );
    }

    Dictionary::Value readGeneric( const pb::GenericValue & value, size_t depth );

    const AllowedTypes &       m_allowedTypes;
    const StructMetaRegistry & m_registry;
};

StructPtr StructReader::readObject( const std::string & typeName, const pb::StructBody & body, size_t depth )
{
    if( depth > MAX_DEPTH )
        RECAST_THROW( RelabelFailed, "Serialized struct exceeds max nesting depth of " << MAX_DEPTH );

    //checked before the name is resolved or anything is instantiated
    if( !m_allowedTypes.allows( typeName ) )
        RECAST_THROW( RelabelFailed, "Serialized type \"" << typeName << "\" is not an allowed type" );

    auto meta = m_registry.lookup( typeName );
    if( !meta )
        RECAST_THROW( RelabelFailed, "Serialized type \"" << typeName << "\" is not registered" );

    StructPtr out = meta -> createUninitialized();
    for( auto & entry : body.fields() )
    {
        const std::string & name = entry.name();
        auto & field = meta -> field( name );
        if( !field )
            RECAST_THROW( RelabelFailed, "Type " << typeName << " does not declare serialized field \"" << name << "\"" );
        if( field -> isSet( out.get() ) )
            RECAST_THROW( RelabelFailed, "Serialized field \"" << name << "\" of " << typeName << " appears more than once" );

        switchRecastType( field -> type(), [ this, &entry, &out, &field, &name, depth ]( auto tag )
            {
                using CType = typename decltype( tag )::type;
                field -> setValue<CType>( out.get(), readValue<CType>( entry.value(), *field -> type(), name, depth ) );
            } );
    }
    return out;
}

template<typename T>
T StructReader::readValue( const pb::FieldValue & value, const RecastType & type, const std::string & fieldName, size_t depth )
{
    expectKind( value, type, fieldName );

    if constexpr( std::is_same_v<T, std::string> )
        return value.string_value();
    else if constexpr( std::is_same_v<T, StructPtr> )
    {
        if( value.kind_case() == pb::FieldValue::kNullStruct )
            return StructPtr();

        auto & record = value.struct_value();
        return readObject( record.type_name(), record.body(), depth + 1 );
    }
    else if constexpr( std::is_same_v<T, GenericValue> )
        return GenericValue( readGeneric( value.generic_value(), depth + 1 ) );
    else if constexpr( std::is_same_v<T, bool> )     return value.bool_value();
    else if constexpr( std::is_same_v<T, int8_t> )   return narrow<int8_t>( value.int8_value(), type, fieldName );
    else if constexpr( std::is_same_v<T, uint8_t> )  return narrow<uint8_t>( value.uint8_value(), type, fieldName );
    else if constexpr( std::is_same_v<T, int16_t> )  return narrow<int16_t>( value.int16_value(), type, fieldName );
    else if constexpr( std::is_same_v<T, uint16_t> ) return narrow<uint16_t>( value.uint16_value(), type, fieldName );
    else if constexpr( std::is_same_v<T, int32_t> )  return value.int32_value();
    else if constexpr( std::is_same_v<T, uint32_t> ) return value.uint32_value();
    else if constexpr( std::is_same_v<T, int64_t> )  return value.int64_value();
    else if constexpr( std::is_same_v<T, uint64_t> ) return value.uint64_value();
    else if constexpr( std::is_same_v<T, double> )   return value.double_value();
    else
    {
        using StorageT = typename T::value_type;
        auto & elemType = *static_cast<const RecastArrayType &>( type ).elemType();
        auto & elements = value.array_value().elements();

        T out;
        out.reserve( elements.size() );
        for( auto & elem : elements )
        {
            if constexpr( std::is_same_v<StorageT, uint8_t> )
            {
                if( elemType.type() == RecastType::Type::BOOL )
                {
                    expectKind( elem, elemType, fieldName );
                    out.emplace_back( elem.bool_value() );
                    continue;
                }
            }
            out.emplace_back( readValue<StorageT>( elem, elemType, fieldName, depth ) );
        }
        return out;
    }
}

Dictionary::Value StructReader::readGeneric( const pb::GenericValue & value, size_t depth )
{
    if( depth > MAX_DEPTH )
        RECAST_THROW( RelabelFailed, "Serialized generic value exceeds max nesting depth of " << MAX_DEPTH );

    switch( value.kind_case() )
    {
        case pb::GenericValue::kNone:        return Dictionary::Value();
        case pb::GenericValue::kBoolValue:   return Dictionary::Value( value.bool_value() );
        case pb::GenericValue::kInt32Value:  return Dictionary::Value( value.int32_value() );
        case pb::GenericValue::kUint32Value: return Dictionary::Value( value.uint32_value() );
        case pb::GenericValue::kInt64Value:  return Dictionary::Value( value.int64_value() );
        case pb::GenericValue::kUint64Value: return Dictionary::Value( value.uint64_value() );
        case pb::GenericValue::kDoubleValue: return Dictionary::Value( value.double_value() );
        case pb::GenericValue::kStringValue: return Dictionary::Value( value.string_value() );
        case pb::GenericValue::kListValue:
        {
            Dictionary::Vector out;
            out.reserve( value.list_value().values_size() );
            for( auto & elem : value.list_value().values() )
                out.emplace_back( readGeneric( elem, depth + 1 ) );
            return Dictionary::Value( std::move( out ) );
        }
        case pb::GenericValue::kDictValue:
        {
            auto out = std::make_shared<Dictionary>();
            for( auto & entry : value.dict_value().entries() )
            {
                if( !out -> insert( entry.key(), readGeneric( entry.value(), depth + 1 ) ) )
                    RECAST_THROW( RelabelFailed, "Serialized generic dictionary repeats key \"" << entry.key() << "\"" );
            }
            return Dictionary::Value( out );
        }
        default:
            RECAST_THROW( RelabelFailed, "Serialized generic value has no kind set" );
    }
}

}

std::string StructSerializer::serialize( const Struct * s )
{
    RECAST_TRUE_OR_THROW( s != nullptr, InvalidArgument, "StructSerializer::serialize called with a null struct" );

    pb::StructBody body;
    StructWriter().writeBody( s, body );

    proto::Any any;
    any.set_type_url( TYPE_URL_PREFIX + s -> meta() -> name() );
    if( !body.SerializeToString( any.mutable_value() ) )
        RECAST_THROW( RuntimeException, "Failed to serialize struct of type " << s -> meta() -> name() );
    return any.SerializeAsString();
}

StructPtr StructSerializer::deserialize( const std::string & bytes, const AllowedTypes & allowedTypes, const StructMetaRegistry & registry )
{
    auto any = parseEnvelope( bytes );
    std::string typeName = typeNameFromUrl( any.type_url() );

    pb::StructBody body;
    if( !parseMessage( any.value(), body ) )
        RECAST_THROW( RelabelFailed, "Serialized body of " << typeName << " is malformed" );

    return StructReader( allowedTypes, registry ).readObject( typeName, body, 0 );
}

std::string StructSerializer::topLevelTypeName( const std::string & bytes )
{
    return typeNameFromUrl( parseEnvelope( bytes ).type_url() );
}

std::string StructSerializer::relabel( const std::string & bytes, const std::string & typeName )
{
    if( typeName.empty() )
        RECAST_THROW( RelabelFailed, "Cannot relabel serialized struct to an empty type name" );

    auto any = parseEnvelope( bytes );
    typeNameFromUrl( any.type_url() );
    any.set_type_url( TYPE_URL_PREFIX + typeName );
    return any.SerializeAsString();
}

}
