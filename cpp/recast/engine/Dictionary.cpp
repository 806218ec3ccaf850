#include <recast/engine/Dictionary.h>

namespace recast
{

//returns true if key was new
bool Dictionary::put( const std::string & key, Value value, bool replace )
{
    auto [ it, inserted ] = m_index.emplace( key, m_entries.size() );
    if( inserted )
    {
        m_entries.emplace_back( key, Data( std::move( value ) ) );
        return true;
    }

    if( replace )
        m_entries[ it -> second ].second = Data( std::move( value ) );
    return false;
}

const Dictionary::Value * Dictionary::find( const std::string & key ) const
{
    auto it = m_index.find( key );
    return it == m_index.end() ? nullptr : &m_entries[ it -> second ].second._data;
}

const Dictionary::Value & Dictionary::getUntypedValue( const std::string & key ) const
{
    const Value * v = find( key );
    if( !v )
        RECAST_THROW( KeyError, "Dictionary missing key \"" << key << "\"" );
    return *v;
}

bool Dictionary::valuesEqual( const Value & lhs, const Value & rhs )
{
    auto * lhsDict = std::get_if<DictionaryPtr>( &lhs );
    auto * rhsDict = std::get_if<DictionaryPtr>( &rhs );
    if( lhsDict && rhsDict && *lhsDict && *rhsDict )
        return **lhsDict == **rhsDict;
    return lhs == rhs;
}

bool Dictionary::Data::operator==( const Data & other ) const
{
    return valuesEqual( _data, other._data );
}

//key order does not take part in equality
bool Dictionary::operator==( const Dictionary & rhs ) const
{
    if( size() != rhs.size() )
        return false;

    for( auto & [ key, data ] : m_entries )
    {
        const Value * other = rhs.find( key );
        if( !other || !valuesEqual( data._data, *other ) )
            return false;
    }
    return true;
}

const char * Dictionary::valueTypeName( const Value & value )
{
    return std::visit( []( auto && held ) -> const char *
        {
            using T = std::decay_t<decltype( held )>;
            if constexpr( std::is_same_v<T, std::monostate> )     return "none";
            else if constexpr( std::is_same_v<T, bool> )          return "bool";
            else if constexpr( std::is_same_v<T, int32_t> )       return "int32_t";
            else if constexpr( std::is_same_v<T, uint32_t> )      return "uint32_t";
            else if constexpr( std::is_same_v<T, int64_t> )       return "int64_t";
            else if constexpr( std::is_same_v<T, uint64_t> )      return "uint64_t";
            else if constexpr( std::is_same_v<T, double> )        return "double";
            else if constexpr( std::is_same_v<T, std::string> )   return "string";
            else if constexpr( std::is_same_v<T, DictionaryPtr> ) return "Dictionary";
            else                                                  return "vector";
        }, value );
}

Dictionary::Value Dictionary::deepcopy( const Value & value )
{
    return deepcopy( value, 0 );
}

DictionaryPtr Dictionary::deepcopy() const
{
    return cloneEntries( *this, 0 );
}

DictionaryPtr Dictionary::cloneEntries( const Dictionary & source, size_t depth )
{
    auto out = std::make_shared<Dictionary>();
    out -> m_index = source.m_index;
    out -> m_entries.reserve( source.size() );
    for( auto & [ key, data ] : source.m_entries )
        out -> m_entries.emplace_back( key, Data( deepcopy( data._data, depth + 1 ) ) );
    return out;
}

Dictionary::Value Dictionary::deepcopy( const Value & value, size_t depth )
{
    if( depth > MAX_DEPTH )
        RECAST_THROW( RecursionError, "Exceeded max nesting depth of " << MAX_DEPTH << " copying a dictionary value, it may be cyclic" );

    if( auto * dict = std::get_if<DictionaryPtr>( &value ); dict && *dict )
        return Value( cloneEntries( **dict, depth ) );

    if( auto * vec = std::get_if<Vector>( &value ) )
    {
        Vector out;
        out.reserve( vec -> size() );
        for( auto & elem : *vec )
            out.emplace_back( deepcopy( elem._data, depth + 1 ) );
        return Value( std::move( out ) );
    }

    return value;
}

}
