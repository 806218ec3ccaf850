#include <recast/adapters/json/JSONDictionaryConverter.h>
#include <rapidjson/error/en.h>

namespace recast::adapters::json
{

JSONDictionaryConverter::JSONDictionaryConverter( const Dictionary & properties )
{
    m_allowNanInf = properties.get<bool>( "allow_nan_inf", true );
}

DictionaryPtr JSONDictionaryConverter::asDictionary( const void * bytes, size_t size ) const
{
    const char * rawmsg = ( const char * ) bytes;

    rapidjson::Document document;
    rapidjson::ParseResult ok = m_allowNanInf ? document.Parse<rapidjson::kParseNanAndInfFlag>( rawmsg, size )
                                              : document.Parse( rawmsg, size );
    if( !ok )
        RECAST_THROW( ValueError, "Failed to parse message as JSON: " << rapidjson::GetParseError_En( ok.Code() ) << " on msg: " << std::string( rawmsg, size ) );

    if( !document.IsObject() )
        RECAST_THROW( TypeError, "JSON message must be an object to convert to a Dictionary" );

    return convertObject( document );
}

DictionaryPtr JSONDictionaryConverter::convertObject( const rapidjson::Value & jValue ) const
{
    auto out = std::make_shared<Dictionary>();
    for( auto jit = jValue.MemberBegin(); jit != jValue.MemberEnd(); ++jit )
    {
        std::string name( jit -> name.GetString(), jit -> name.GetStringLength() );
        if( !out -> insert( name, convertValue( name.c_str(), jit -> value ) ) )
            RECAST_THROW( ValueError, "JSON object has duplicate key \"" << name << "\"" );
    }
    return out;
}

Dictionary::Value JSONDictionaryConverter::convertValue( const char * fieldname, const rapidjson::Value & jValue ) const
{
    if( jValue.IsNull() )
        return Dictionary::Value();
    if( jValue.IsBool() )
        return Dictionary::Value( jValue.GetBool() );
    if( jValue.IsInt() )
        return Dictionary::Value( ( int32_t ) jValue.GetInt() );
    if( jValue.IsUint() )
        return Dictionary::Value( ( uint32_t ) jValue.GetUint() );
    if( jValue.IsInt64() )
        return Dictionary::Value( ( int64_t ) jValue.GetInt64() );
    if( jValue.IsUint64() )
        return Dictionary::Value( ( uint64_t ) jValue.GetUint64() );
    if( jValue.IsNumber() )
        return Dictionary::Value( jValue.GetDouble() );
    if( jValue.IsString() )
        return Dictionary::Value( std::string( jValue.GetString(), jValue.GetStringLength() ) );
    if( jValue.IsObject() )
        return Dictionary::Value( convertObject( jValue ) );
    if( jValue.IsArray() )
    {
        Dictionary::Vector out;
        out.reserve( jValue.Size() );
        for( auto & elem : jValue.GetArray() )
            out.emplace_back( convertValue( fieldname, elem ) );
        return Dictionary::Value( std::move( out ) );
    }

    RECAST_THROW( TypeError, "Unsupported JSON value type for field " << fieldname );
}

}
