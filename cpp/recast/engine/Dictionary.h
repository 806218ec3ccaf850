#ifndef _IN_RECAST_ENGINE_DICTIONARY_H
#define _IN_RECAST_ENGINE_DICTIONARY_H

#include <recast/core/Exception.h>
#include <recast/core/System.h>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace recast
{

class Dictionary;
using DictionaryPtr = std::shared_ptr<Dictionary>;

//Insertion-ordered, loosely typed record.  This is the source side of every cast: decoded JSON documents,
//generic records and coerced struct instances all arrive as a Dictionary.
//Nested dictionaries are held by DictionaryPtr, copying a Dictionary shares them ( see deepcopy ).
class Dictionary
{
public:
    struct Data;
    using Vector = std::vector<Data>;
    using Value  = std::variant<std::monostate,bool,int32_t,uint32_t,int64_t,uint64_t,double,std::string,DictionaryPtr,Vector>;

    struct Data
    {
        Data() {}
        Data( Value data ) : _data( std::move( data ) ) {}

        //nested dictionaries compare by value
        bool operator==( const Data & other ) const;
        bool operator!=( const Data & other ) const { return !( *this == other ); }

        Value _data;
    };

    //nesting bound for deepcopy, a cyclic value exceeds it
    static constexpr size_t MAX_DEPTH = 1000;

    //returns false if key already exists
    template<typename T>
    bool insert( const std::string & key, T value ) { return put( key, Value( std::move( value ) ), false ); }

    bool insert( const std::string & key, const char * value ) { return insert( key, std::string( value ) ); }

    //insert or replace in place, returns true if it replaced a value
    template<typename T>
    bool update( const std::string & key, T value ) { return !put( key, Value( std::move( value ) ), true ); }

    bool update( const std::string & key, const char * value ) { return update( key, std::string( value ) ); }

    bool operator==( const Dictionary & rhs ) const;
    bool operator!=( const Dictionary & rhs ) const { return !( *this == rhs ); }

    //strings come back by reference, everything else by value
    template<typename T>
    using ReturnType = std::conditional_t<std::is_same_v<T, std::string>, const std::string &, T>;

    //throws KeyError if missing
    template<typename T>
    ReturnType<T> get( const std::string & key ) const { return extractValue<T>( key, getUntypedValue( key ) ); }

    template<typename T>
    ReturnType<T> get( const std::string & key, const T & default_ ) const
    {
        const Value * v = find( key );
        return v ? extractValue<T>( key, *v ) : default_;
    }

    template<typename T>
    bool tryGet( const std::string & key, T & target ) const
    {
        const Value * v = find( key );
        if( v )
            target = extractValue<T>( key, *v );
        return v != nullptr;
    }

    const Value & getUntypedValue( const std::string & key ) const;

    bool exists( const std::string & key ) const { return m_index.find( key ) != m_index.end(); }

    //Reads value as T.  Integers widen to double and to integer types at least as wide as the held one,
    //anything else is a TypeError.  Widening that cannot represent the held value is a RangeError
    template<typename T>
    static ReturnType<T> extractValue( const std::string & key, const Value & value );

    static const char * valueTypeName( const Value & value );

    //copy with every nested dictionary and vector cloned, throws RecursionError past MAX_DEPTH
    static Value deepcopy( const Value & value );
    DictionaryPtr deepcopy() const;

private:
    using Entries = std::vector<std::pair<std::string, Data>>;

public:
    class const_iterator
    {
    public:
        const_iterator( Entries::const_iterator it ) : m_it( it ) {}

        const_iterator & operator++() { ++m_it; return *this; }
        bool operator==( const const_iterator & rhs ) const { return m_it == rhs.m_it; }
        bool operator!=( const const_iterator & rhs ) const { return m_it != rhs.m_it; }

        const std::string & key() const { return m_it -> first; }

        template<typename T>
        ReturnType<T> value() const { return Dictionary::extractValue<T>( m_it -> first, m_it -> second._data ); }

        const Value & getUntypedValue() const { return m_it -> second._data; }

        //exact alternative check, int32 held is not an int64
        template<typename T>
        bool hasValue() const { return std::holds_alternative<T>( m_it -> second._data ); }

    private:
        Entries::const_iterator m_it;
    };

    const_iterator begin() const { return const_iterator( m_entries.begin() ); }
    const_iterator end() const   { return const_iterator( m_entries.end() ); }

    size_t size() const  { return m_entries.size(); }
    bool   empty() const { return m_entries.empty(); }

private:
    bool put( const std::string & key, Value value, bool replace );
    const Value * find( const std::string & key ) const;

    static Value deepcopy( const Value & value, size_t depth );
    static DictionaryPtr cloneEntries( const Dictionary & source, size_t depth );
    static bool valuesEqual( const Value & lhs, const Value & rhs );

    template<typename To, typename From>
    static ReturnType<To> convert( const std::string & key, const Value & value, const From & held );

    template<typename T>
    static constexpr bool isInteger = std::is_integral_v<T> && !std::is_same_v<T, bool>;

    std::unordered_map<std::string, size_t> m_index;
    Entries                                 m_entries;
};

template<typename To, typename From>
inline Dictionary::ReturnType<To> Dictionary::convert( const std::string & key, const Value & value, const From & held )
{
    if constexpr( std::is_same_v<To, double> && isInteger<From> )
        return static_cast<double>( held );
    else if constexpr( isInteger<To> && isInteger<From> && sizeof( To ) >= sizeof( From ) )
    {
        if( !std::in_range<To>( held ) )
            RECAST_THROW( RangeError, "Dictionary value for " << cpp_type_name<From>() << " ( " << held << " ) on key \"" << key
                          << "\" is out of range for " << cpp_type_name<To>() << " cast" );
        return static_cast<To>( held );
    }
    else
        RECAST_THROW( TypeError, "Dictionary type-mismatch on key \"" << key << "\".  Expected type \"" << cpp_type_name<To>()
                      << "\" got type: \"" << valueTypeName( value ) << "\"" );
}

template<typename T>
inline Dictionary::ReturnType<T> Dictionary::extractValue( const std::string & key, const Value & value )
{
    if( auto * exact = std::get_if<T>( &value ) )
        return *exact;

    return std::visit( [ &key, &value ]( auto && held ) -> ReturnType<T>
        {
            return convert<T>( key, value, held );
        }, value );
}

}

#endif
