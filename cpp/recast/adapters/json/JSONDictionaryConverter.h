#ifndef _IN_RECAST_ADAPTERS_JSON_JSONDICTIONARYCONVERTER_H
#define _IN_RECAST_ADAPTERS_JSON_JSONDICTIONARYCONVERTER_H

#include <recast/engine/Dictionary.h>
#include <rapidjson/document.h>
#include <string>

namespace recast::adapters::json
{

//Parses JSON text into a source Dictionary.  Objects become nested dictionaries, arrays become vectors,
//integers take the narrowest of int32 / uint32 / int64 / uint64 that holds them and null becomes none.
//Properties:
//    allow_nan_inf - bool, accept NaN / Infinity literals, default true
class JSONDictionaryConverter
{
public:
    JSONDictionaryConverter( const Dictionary & properties = Dictionary() );

    DictionaryPtr asDictionary( const void * bytes, size_t size ) const;
    DictionaryPtr asDictionary( const std::string & text ) const { return asDictionary( text.data(), text.size() ); }

private:
    DictionaryPtr convertObject( const rapidjson::Value & jValue ) const;
    Dictionary::Value convertValue( const char * fieldname, const rapidjson::Value & jValue ) const;

    bool m_allowNanInf;
};

}

#endif
